#pragma once

#include "indicators.hpp"
#include "exponential_smoother.hpp"
#include <optional>
#include <string>
#include <vector>

namespace indicators {

// Carried between bars: the previous close plus the two Wilder averages
struct RsiState {
    std::optional<double> last_close;
    SmootherState gain;
    SmootherState loss;
};

// RSI with Wilder's smoothing. The first defined value is at bar index
// `period`, seeded by the plain means of the first `period` gains and losses.
// A window with no movement at all reads 50.
class RsiIndicator : public IIndicator<double> {
public:
    explicit RsiIndicator(int period);

    ~RsiIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    core::IndicatorValue<double> update(const core::Observation& observation) override;
    core::IndicatorValue<double> value() const override;
    void reset() override;

    int getPeriod() const { return period_; }

    // Current Wilder averages, Undefined during warm-up
    core::IndicatorValue<double> averageGain() const;
    core::IndicatorValue<double> averageLoss() const;

    static double rsiFromAverages(double avg_gain, double avg_loss);

private:
    RsiState step(const RsiState& state, double close) const;

    const int period_;
    int lookback_;
    std::string name_;
    ExponentialSmoother smoother_; // Shared by the gain and loss series
    RsiState committed_;
    RsiState working_;
    BarSequencer bars_;
    core::IndicatorValue<double> current_;
};

core::AlignedSeries<double> computeRsi(const core::TimeSeries<core::Observation>& input, int period);
core::AlignedSeries<double> computeRsi(const std::vector<double>& closes, int period);

} // namespace indicators
