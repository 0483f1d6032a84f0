#pragma once

#include "indicators.hpp" // Base interface
#include "rolling_window.hpp"
#include <string>
#include <vector>

namespace indicators {

class SmaIndicator : public IIndicator<double> {
public:
    // Constructor: Requires the period for the SMA. Throws InvalidPeriodException.
    explicit SmaIndicator(int period);

    ~SmaIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    core::IndicatorValue<double> update(const core::Observation& observation) override;
    core::IndicatorValue<double> value() const override;
    void reset() override;

    int getPeriod() const { return period_; }

private:
    const int period_;          // SMA period (e.g., 20, 200)
    int lookback_;              // First defined bar index: period - 1
    std::string name_;          // Indicator name (e.g., "SMA(20)")
    RollingWindow window_;      // Last `period` closes
    BarSequencer bars_;
    core::IndicatorValue<double> current_;
};

// Batch forms. Output is aligned with the input.
core::AlignedSeries<double> computeSma(const core::TimeSeries<core::Observation>& input, int period);
core::AlignedSeries<double> computeSma(const std::vector<double>& closes, int period);

} // namespace indicators
