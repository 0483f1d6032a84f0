#pragma once

#include "indicators.hpp"
#include "rolling_window.hpp"
#include <string>
#include <vector>

namespace indicators {

// Middle band is the SMA, bands are mean +/- multiplier * population std dev.
// A flat window yields upper == middle == lower.
class BollingerBands : public IIndicator<core::BandValue> {
public:
    static constexpr double kDefaultMultiplier = 2.0;

    // Throws InvalidPeriodException / InvalidMultiplierException (multiplier must be finite and > 0)
    explicit BollingerBands(int period, double multiplier = kDefaultMultiplier);

    ~BollingerBands() override = default;

    std::string getName() const override;
    int getLookback() const override;
    core::IndicatorValue<core::BandValue> update(const core::Observation& observation) override;
    core::IndicatorValue<core::BandValue> value() const override;
    void reset() override;

    int getPeriod() const { return period_; }
    double getMultiplier() const { return multiplier_; }

private:
    const int period_;
    const double multiplier_;
    std::string name_;
    RollingWindow window_; // Variance mode
    BarSequencer bars_;
    core::IndicatorValue<core::BandValue> current_;
};

// Throws core::InvalidMultiplierException unless multiplier is finite and > 0
double validateMultiplier(double multiplier);

core::AlignedSeries<core::BandValue> computeBollinger(const core::TimeSeries<core::Observation>& input, int period,
                                                      double multiplier = BollingerBands::kDefaultMultiplier);
core::AlignedSeries<core::BandValue> computeBollinger(const std::vector<double>& closes, int period,
                                                      double multiplier = BollingerBands::kDefaultMultiplier);

} // namespace indicators
