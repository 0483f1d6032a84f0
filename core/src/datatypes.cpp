#include "datatypes.hpp"

namespace core {

    TimeSeries<Observation> toObservations(const TimeSeries<Candle>& candles) {
        TimeSeries<Observation> observations;
        observations.reserve(candles.size());
        for (const auto& candle : candles) {
            observations.push_back(Observation{candle.timestamp, candle.close});
        }
        return observations;
    }

    TimeSeries<Observation> toObservations(const std::vector<double>& closes) {
        TimeSeries<Observation> observations;
        observations.reserve(closes.size());
        Timestamp sequence = 0;
        for (double close : closes) {
            observations.push_back(Observation{sequence++, close});
        }
        return observations;
    }

} // namespace core
