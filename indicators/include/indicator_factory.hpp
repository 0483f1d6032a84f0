#pragma once

#include "datatypes.hpp"
#include <string>
#include <variant>

namespace indicators {

enum class IndicatorType {
    Sma,
    Ema,
    Bollinger,
    Rsi
};

// One configured indicator instance, e.g. "BB(20,2)"
struct IndicatorSpec {
    IndicatorType type = IndicatorType::Sma;
    int period = 0;
    double multiplier = 2.0; // Bollinger Bands only

    // Canonical name: "SMA(20)", "EMA(20)", "BB(20,2)", "RSI(14)"
    std::string toString() const;

    // Lower-case file stem: "sma-20", "bb-20-2.5"
    std::string fileStem() const;

    bool operator==(const IndicatorSpec& other) const {
        return type == other.type && period == other.period && multiplier == other.multiplier;
    }
};

// Parses "SMA(20)", "ema(9)", "BB(20)", "BB(20, 2.5)", "RSI(14)".
// Throws ConfigException for unknown names or malformed strings,
// InvalidPeriodException / InvalidMultiplierException for bad parameters.
IndicatorSpec parseIndicatorSpec(const std::string& spec_str);

struct IndicatorResult {
    IndicatorSpec spec;
    std::string name;  // Name reported by the indicator instance
    int lookback = 0;
    std::variant<core::AlignedSeries<double>, core::AlignedSeries<core::BandValue>> values;

    bool isBand() const {
        return std::holds_alternative<core::AlignedSeries<core::BandValue>>(values);
    }
};

// Creates the indicator described by `spec` and runs it over the whole input
IndicatorResult computeIndicator(const IndicatorSpec& spec,
                                 const core::TimeSeries<core::Observation>& input);

} // namespace indicators
