#pragma once

#include "indicators.hpp"
#include "exponential_smoother.hpp"
#include <string>
#include <vector>

namespace indicators {

// EMA seeded with the SMA of the first `period` closes, alpha = 2/(period+1).
//
// With enforce_convergence the output stays Undefined until 3*(period+1) bars
// have been seen, hiding the part of the series still dominated by the seed.
// The recursion itself is identical in both modes.
class EmaIndicator : public IIndicator<double> {
public:
    explicit EmaIndicator(int period, bool enforce_convergence = false);

    ~EmaIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    core::IndicatorValue<double> update(const core::Observation& observation) override;
    core::IndicatorValue<double> value() const override;
    void reset() override;

    int getPeriod() const { return period_; }
    bool enforcesConvergence() const { return enforce_convergence_; }
    long long requiredBars() const { return required_bars_; }

private:
    const int period_;
    const bool enforce_convergence_;
    long long required_bars_;
    std::string name_;
    ExponentialSmoother smoother_;
    SmootherState committed_; // State at the end of the previous bar
    SmootherState working_;   // committed_ stepped with the current bar's close
    BarSequencer bars_;
    core::IndicatorValue<double> current_;
};

core::AlignedSeries<double> computeEma(const core::TimeSeries<core::Observation>& input, int period,
                                       bool enforce_convergence = false);
core::AlignedSeries<double> computeEma(const std::vector<double>& closes, int period,
                                       bool enforce_convergence = false);

} // namespace indicators
