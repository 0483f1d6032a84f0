#pragma once

#include "datatypes.hpp"
#include <vector>

namespace indicators {

enum class SmoothingKind {
    Ema,    // alpha = 2/(P+1): alpha*x + (1-alpha)*prev
    Wilder  // alpha = 1/P:     (prev*(P-1) + x)/P
};

// Everything a smoother carries between steps. Until `seen` reaches the
// period, `seed_sum` accumulates the inputs; afterwards `value` is the
// previous output.
struct SmootherState {
    int seen = 0;
    double seed_sum = 0.0;
    double value = 0.0;
};

// Recursive smoothing seeded with the plain mean of the first `period` inputs.
// step() is pure so the same state can be re-stepped for a same-bar update.
class ExponentialSmoother {
public:
    ExponentialSmoother(int period, SmoothingKind kind);

    SmootherState step(const SmootherState& state, double input) const;

    // Undefined until `period` inputs have been seen
    core::IndicatorValue<double> output(const SmootherState& state) const;

    int getPeriod() const { return period_; }
    SmoothingKind getKind() const { return kind_; }
    double getAlpha() const { return alpha_; }

    // Batch form: index i < period-1 is Undefined, index period-1 is the seed
    core::AlignedSeries<double> smooth(const std::vector<double>& values) const;

private:
    int period_;
    SmoothingKind kind_;
    double alpha_;
};

} // namespace indicators
