#pragma once

#include <cstdint>
#include <optional> // Undefined indicator values
#include <string>
#include <vector>

namespace core {

    // Bar open time in epoch milliseconds (or a plain sequence number).
    // Only used as an ordering key by the indicator engine.
    using Timestamp = std::int64_t;

    // Full kline as produced by the ingestion side (CSV, SQLite, REST)
    struct Candle {
        Timestamp timestamp = 0;
        double open = 0.0;
        double high = 0.0;
        double low = 0.0;
        double close = 0.0;
        double volume = 0.0; // Crypto volumes are fractional

        bool operator<(const Candle& other) const {
            return timestamp < other.timestamp;
        }
    };

    // The only input shape the indicator engine consumes
    struct Observation {
        Timestamp timestamp = 0;
        double close = 0.0;
    };

    // Bollinger Bands output triple. lower <= middle <= upper.
    struct BandValue {
        double upper = 0.0;
        double middle = 0.0;
        double lower = 0.0;

        double width() const { return upper - lower; }

        bool operator==(const BandValue& other) const {
            return upper == other.upper && middle == other.middle && lower == other.lower;
        }
        bool operator!=(const BandValue& other) const { return !(*this == other); }
    };

    template<typename T>
    using TimeSeries = std::vector<T>;

    // std::nullopt marks an Undefined (warm-up) value
    template<typename T>
    using IndicatorValue = std::optional<T>;

    // Same length as the input, index i corresponds to input index i
    template<typename T>
    using AlignedSeries = TimeSeries<IndicatorValue<T>>;

    // Projects the close price out of each candle, keeping order and timestamps.
    TimeSeries<Observation> toObservations(const TimeSeries<Candle>& candles);

    // Wraps plain closes as observations with sequence-number timestamps 0..N-1.
    TimeSeries<Observation> toObservations(const std::vector<double>& closes);

} // namespace core
