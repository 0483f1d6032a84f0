#include "ema_indicator.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>

namespace indicators {

EmaIndicator::EmaIndicator(int period, bool enforce_convergence)
    : period_(period),
      enforce_convergence_(enforce_convergence),
      required_bars_(0),
      smoother_(validatePeriod(period, "EMA"), SmoothingKind::Ema)
{
    required_bars_ = enforce_convergence_
        ? 3 * (static_cast<long long>(period_) + 1)
        : static_cast<long long>(period_);
    name_ = fmt::format("EMA({})", period_);
    core::logging::getLogger()->debug("EmaIndicator created: Name='{}', Period={}, Alpha={}, Lookback={}, EnforceConvergence={}",
                                      name_, period_, smoother_.getAlpha(), getLookback(), enforce_convergence_);
}

std::string EmaIndicator::getName() const {
    return name_;
}

int EmaIndicator::getLookback() const {
    return static_cast<int>(required_bars_ - 1);
}

core::IndicatorValue<double> EmaIndicator::update(const core::Observation& observation) {
    core::utils::requireFinite(observation.close, observation.timestamp);
    const bool new_bar = bars_.isNewBar(observation);

    if (new_bar) {
        committed_ = working_;
    }
    working_ = smoother_.step(committed_, observation.close);
    bars_.commit(observation);

    if (bars_.barCount() >= required_bars_) {
        current_ = smoother_.output(working_);
    } else {
        current_.reset();
    }
    return current_;
}

core::IndicatorValue<double> EmaIndicator::value() const {
    return current_;
}

void EmaIndicator::reset() {
    committed_ = SmootherState{};
    working_ = SmootherState{};
    bars_.reset();
    current_.reset();
}

core::AlignedSeries<double> computeEma(const core::TimeSeries<core::Observation>& input, int period,
                                       bool enforce_convergence) {
    EmaIndicator ema(period, enforce_convergence);
    ema.calculate(input);
    return ema.getResult();
}

core::AlignedSeries<double> computeEma(const std::vector<double>& closes, int period,
                                       bool enforce_convergence) {
    return computeEma(core::toObservations(closes), period, enforce_convergence);
}

} // namespace indicators
