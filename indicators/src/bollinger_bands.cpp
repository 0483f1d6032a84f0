#include "bollinger_bands.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <cmath>

namespace indicators {

double validateMultiplier(double multiplier) {
    if (!std::isfinite(multiplier) || multiplier <= 0.0) {
        throw core::InvalidMultiplierException(
            fmt::format("Bollinger Bands multiplier must be a finite value > 0, got {}.", multiplier));
    }
    return multiplier;
}

BollingerBands::BollingerBands(int period, double multiplier)
    : period_(validatePeriod(period, "Bollinger Bands")),
      multiplier_(validateMultiplier(multiplier)),
      window_(period_, true)
{
    name_ = fmt::format("BB({},{:g})", period_, multiplier_);
    core::logging::getLogger()->debug("BollingerBands created: Name='{}', Period={}, Multiplier={}, Lookback={}",
                                      name_, period_, multiplier_, getLookback());
}

std::string BollingerBands::getName() const {
    return name_;
}

int BollingerBands::getLookback() const {
    return period_ - 1;
}

core::IndicatorValue<core::BandValue> BollingerBands::update(const core::Observation& observation) {
    core::utils::requireFinite(observation.close, observation.timestamp);
    const bool new_bar = bars_.isNewBar(observation);

    if (new_bar) {
        window_.push(observation.close);
    } else {
        window_.replaceLast(observation.close);
    }
    bars_.commit(observation);

    const auto stats = window_.stats();
    if (!stats) {
        current_.reset();
        return current_;
    }

    const double offset = multiplier_ * std::sqrt(stats->variance);
    current_ = core::BandValue{stats->mean + offset, stats->mean, stats->mean - offset};
    return current_;
}

core::IndicatorValue<core::BandValue> BollingerBands::value() const {
    return current_;
}

void BollingerBands::reset() {
    window_.clear();
    bars_.reset();
    current_.reset();
}

core::AlignedSeries<core::BandValue> computeBollinger(const core::TimeSeries<core::Observation>& input, int period,
                                                      double multiplier) {
    BollingerBands bb(period, multiplier);
    bb.calculate(input);
    return bb.getResult();
}

core::AlignedSeries<core::BandValue> computeBollinger(const std::vector<double>& closes, int period,
                                                      double multiplier) {
    return computeBollinger(core::toObservations(closes), period, multiplier);
}

} // namespace indicators
