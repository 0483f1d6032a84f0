#pragma once

#include "datatypes.hpp"
#include <vector>

// Thin adapter over the TA-Lib C API. The engine never depends on it for its
// own results; it exists to cross-check them against the reference library.
namespace indicators {
namespace talib {

// TA_Initialize / TA_Shutdown for the lifetime of the object
class Session {
public:
    Session();
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;
};

// TA-Lib results re-aligned to the full input length (Undefined before the lookback).
// Throws core::IndicatorCalculationException when TA-Lib reports an error.
core::AlignedSeries<double> sma(const std::vector<double>& closes, int period);
core::AlignedSeries<double> ema(const std::vector<double>& closes, int period);
core::AlignedSeries<core::BandValue> bollinger(const std::vector<double>& closes, int period, double multiplier);
// Note: TA-Lib reads 0 where both averages are zero; the engine reads 50.
core::AlignedSeries<double> rsi(const std::vector<double>& closes, int period);

// Largest absolute difference over indices defined in both series.
// Throws std::invalid_argument when lengths or definedness differ.
double maxAbsDifference(const core::AlignedSeries<double>& lhs, const core::AlignedSeries<double>& rhs);
double maxAbsDifference(const core::AlignedSeries<core::BandValue>& lhs,
                        const core::AlignedSeries<core::BandValue>& rhs);

} // namespace talib
} // namespace indicators
