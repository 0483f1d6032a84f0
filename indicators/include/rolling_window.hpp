#pragma once

#include "datatypes.hpp"
#include <cstddef>
#include <optional>
#include <vector>

namespace indicators {

struct WindowStats {
    double mean = 0.0;
    double variance = 0.0; // Population variance: divided by the window size
};

// Fixed-size window over the most recent values. Appends are O(1); mean and
// variance rescan the window, offset by its oldest value, so a window of equal
// values reads exactly that value with zero variance.
class RollingWindow {
public:
    explicit RollingWindow(int period, bool track_variance = false);

    // Appends a value, evicting the oldest one once the window is full
    void push(double value);

    // Overwrites the most recently pushed value (same-bar update)
    void replaceLast(double value);

    bool isReady() const { return count_ == buffer_.size(); }
    bool empty() const { return count_ == 0; }
    std::size_t size() const { return count_; }
    int getPeriod() const { return period_; }

    std::optional<double> mean() const;
    std::optional<double> populationVariance() const;
    std::optional<WindowStats> stats() const;

    void clear();

private:
    int period_;
    bool track_variance_;
    std::vector<double> buffer_;
    std::size_t head_ = 0;  // Oldest element once full
    std::size_t tail_ = 0;  // Newest element
    std::size_t count_ = 0;

    double windowMean() const;
};

// Batch helpers, index i < period-1 is Undefined
core::AlignedSeries<double> rollingMean(const std::vector<double>& values, int period);
core::AlignedSeries<WindowStats> rollingStats(const std::vector<double>& values, int period);

} // namespace indicators
