#pragma once

#include "datatypes.hpp"
#include <string>

namespace core {
namespace utils {

    // Epoch milliseconds -> ISO 8601 UTC, e.g. "2025-01-01T00:00:00.000Z"
    std::string timestampToString(Timestamp ts);

    // ISO 8601 -> epoch milliseconds. Accepts optional fractional seconds and
    // either 'Z' or a +HH:MM / -HH:MM offset.
    Timestamp stringToTimestamp(const std::string& iso_string);

    // Fixed-point rendering used by the output writers
    std::string formatFixed(double value, int precision);

    // Throws NonFiniteInputException for NaN/inf closes
    void requireFinite(double close, Timestamp ts);

} // namespace utils
} // namespace core
