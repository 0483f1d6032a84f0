#include "indicators.hpp"
#include "exceptions.hpp"
#include <spdlog/fmt/fmt.h>

namespace indicators {

int validatePeriod(int period, const std::string& indicator_name) {
    if (period < 1) {
        throw core::InvalidPeriodException(
            fmt::format("{} period must be >= 1, got {}.", indicator_name, period));
    }
    return period;
}

bool BarSequencer::isNewBar(const core::Observation& observation) const {
    if (!last_timestamp_) {
        return true;
    }
    if (observation.timestamp < *last_timestamp_) {
        throw core::OutOfOrderObservationException(fmt::format(
            "Observation timestamp {} is earlier than the previous timestamp {}.",
            observation.timestamp, *last_timestamp_));
    }
    return observation.timestamp > *last_timestamp_;
}

void BarSequencer::commit(const core::Observation& observation) {
    if (!last_timestamp_ || observation.timestamp > *last_timestamp_) {
        ++bar_count_;
    }
    last_timestamp_ = observation.timestamp;
}

void BarSequencer::reset() {
    last_timestamp_.reset();
    bar_count_ = 0;
}

} // namespace indicators
