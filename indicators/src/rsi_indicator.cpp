#include "rsi_indicator.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>

namespace indicators {

RsiIndicator::RsiIndicator(int period)
    : period_(period), lookback_(0), smoother_(validatePeriod(period, "RSI"), SmoothingKind::Wilder)
{
    // One extra close is needed before the first change exists
    lookback_ = period_;
    name_ = fmt::format("RSI({})", period_);
    core::logging::getLogger()->debug("RsiIndicator created: Name='{}', Period={}, Lookback={}", name_, period_, lookback_);
}

std::string RsiIndicator::getName() const {
    return name_;
}

int RsiIndicator::getLookback() const {
    return lookback_;
}

RsiState RsiIndicator::step(const RsiState& state, double close) const {
    RsiState next = state;
    if (state.last_close) {
        const double delta = close - *state.last_close;
        next.gain = smoother_.step(state.gain, std::max(delta, 0.0));
        next.loss = smoother_.step(state.loss, std::max(-delta, 0.0));
    }
    next.last_close = close;
    return next;
}

double RsiIndicator::rsiFromAverages(double avg_gain, double avg_loss) {
    if (avg_loss == 0.0) {
        return avg_gain == 0.0 ? 50.0 : 100.0;
    }
    const double rs = avg_gain / avg_loss;
    return 100.0 - 100.0 / (1.0 + rs);
}

core::IndicatorValue<double> RsiIndicator::update(const core::Observation& observation) {
    core::utils::requireFinite(observation.close, observation.timestamp);
    const bool new_bar = bars_.isNewBar(observation);

    if (new_bar) {
        committed_ = working_;
    }
    working_ = step(committed_, observation.close);
    bars_.commit(observation);

    const auto avg_gain = smoother_.output(working_.gain);
    const auto avg_loss = smoother_.output(working_.loss);
    if (avg_gain && avg_loss) {
        current_ = rsiFromAverages(*avg_gain, *avg_loss);
    } else {
        current_.reset();
    }
    return current_;
}

core::IndicatorValue<double> RsiIndicator::value() const {
    return current_;
}

core::IndicatorValue<double> RsiIndicator::averageGain() const {
    return smoother_.output(working_.gain);
}

core::IndicatorValue<double> RsiIndicator::averageLoss() const {
    return smoother_.output(working_.loss);
}

void RsiIndicator::reset() {
    committed_ = RsiState{};
    working_ = RsiState{};
    bars_.reset();
    current_.reset();
}

core::AlignedSeries<double> computeRsi(const core::TimeSeries<core::Observation>& input, int period) {
    RsiIndicator rsi(period);
    rsi.calculate(input);
    return rsi.getResult();
}

core::AlignedSeries<double> computeRsi(const std::vector<double>& closes, int period) {
    return computeRsi(core::toObservations(closes), period);
}

} // namespace indicators
