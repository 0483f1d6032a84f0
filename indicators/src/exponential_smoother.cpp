#include "exponential_smoother.hpp"
#include "indicators.hpp" // validatePeriod
#include "utils.hpp"

namespace indicators {

ExponentialSmoother::ExponentialSmoother(int period, SmoothingKind kind)
    : period_(period), kind_(kind), alpha_(0.0)
{
    validatePeriod(period_, "Exponential smoother");
    alpha_ = (kind_ == SmoothingKind::Ema)
        ? 2.0 / (static_cast<double>(period_) + 1.0)
        : 1.0 / static_cast<double>(period_);
}

SmootherState ExponentialSmoother::step(const SmootherState& state, double input) const {
    SmootherState next = state;

    if (next.seen < period_) {
        next.seed_sum += input;
        ++next.seen;
        if (next.seen == period_) {
            next.value = next.seed_sum / static_cast<double>(period_);
        }
        return next;
    }

    if (kind_ == SmoothingKind::Ema) {
        next.value = alpha_ * input + (1.0 - alpha_) * state.value;
    } else {
        next.value = (state.value * static_cast<double>(period_ - 1) + input) / static_cast<double>(period_);
    }
    return next;
}

core::IndicatorValue<double> ExponentialSmoother::output(const SmootherState& state) const {
    if (state.seen < period_) {
        return std::nullopt;
    }
    return state.value;
}

core::AlignedSeries<double> ExponentialSmoother::smooth(const std::vector<double>& values) const {
    core::AlignedSeries<double> series;
    series.reserve(values.size());
    SmootherState state;
    for (std::size_t i = 0; i < values.size(); ++i) {
        core::utils::requireFinite(values[i], static_cast<core::Timestamp>(i));
        state = step(state, values[i]);
        series.push_back(output(state));
    }
    return series;
}

} // namespace indicators
