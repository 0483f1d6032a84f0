#include "sma_indicator.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>

namespace indicators {

SmaIndicator::SmaIndicator(int period)
    : period_(period), lookback_(0), window_(validatePeriod(period, "SMA"))
{
    lookback_ = period_ - 1;
    name_ = fmt::format("SMA({})", period_);
    core::logging::getLogger()->debug("SmaIndicator created: Name='{}', Period={}, Lookback={}", name_, period_, lookback_);
}

std::string SmaIndicator::getName() const {
    return name_;
}

int SmaIndicator::getLookback() const {
    return lookback_;
}

core::IndicatorValue<double> SmaIndicator::update(const core::Observation& observation) {
    core::utils::requireFinite(observation.close, observation.timestamp);
    const bool new_bar = bars_.isNewBar(observation);

    if (new_bar) {
        window_.push(observation.close);
    } else {
        window_.replaceLast(observation.close);
    }
    bars_.commit(observation);

    current_ = window_.mean();
    return current_;
}

core::IndicatorValue<double> SmaIndicator::value() const {
    return current_;
}

void SmaIndicator::reset() {
    window_.clear();
    bars_.reset();
    current_.reset();
}

core::AlignedSeries<double> computeSma(const core::TimeSeries<core::Observation>& input, int period) {
    SmaIndicator sma(period);
    sma.calculate(input);
    return sma.getResult();
}

core::AlignedSeries<double> computeSma(const std::vector<double>& closes, int period) {
    return computeSma(core::toObservations(closes), period);
}

} // namespace indicators
