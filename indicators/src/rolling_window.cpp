#include "rolling_window.hpp"
#include "indicators.hpp" // validatePeriod
#include "utils.hpp"
#include <algorithm>
#include <stdexcept>

namespace indicators {

RollingWindow::RollingWindow(int period, bool track_variance)
    : period_(period), track_variance_(track_variance)
{
    validatePeriod(period_, "Rolling window");
    buffer_.assign(static_cast<std::size_t>(period_), 0.0);
}

void RollingWindow::push(double value) {
    if (isReady()) {
        buffer_[head_] = value;
        tail_ = head_;
        head_ = (head_ + 1) % buffer_.size();
    } else {
        buffer_[count_] = value;
        tail_ = count_;
        ++count_;
    }
}

void RollingWindow::replaceLast(double value) {
    if (empty()) {
        throw std::logic_error("RollingWindow::replaceLast called on an empty window.");
    }
    buffer_[tail_] = value;
}

double RollingWindow::windowMean() const {
    const double pivot = buffer_[head_];
    double offset_sum = 0.0;
    for (double value : buffer_) {
        offset_sum += value - pivot;
    }
    return pivot + offset_sum / static_cast<double>(period_);
}

std::optional<double> RollingWindow::mean() const {
    if (!isReady()) {
        return std::nullopt;
    }
    return windowMean();
}

std::optional<double> RollingWindow::populationVariance() const {
    if (!track_variance_) {
        throw std::logic_error("RollingWindow was constructed without variance tracking.");
    }
    if (!isReady()) {
        return std::nullopt;
    }
    return stats()->variance;
}

std::optional<WindowStats> RollingWindow::stats() const {
    if (!isReady()) {
        return std::nullopt;
    }
    const double mean = windowMean();
    double squared_deviations = 0.0;
    for (double value : buffer_) {
        squared_deviations += (value - mean) * (value - mean);
    }
    return WindowStats{mean, squared_deviations / static_cast<double>(period_)};
}

void RollingWindow::clear() {
    std::fill(buffer_.begin(), buffer_.end(), 0.0);
    head_ = 0;
    tail_ = 0;
    count_ = 0;
}

core::AlignedSeries<double> rollingMean(const std::vector<double>& values, int period) {
    RollingWindow window(period);
    core::AlignedSeries<double> series;
    series.reserve(values.size());
    for (std::size_t i = 0; i < values.size(); ++i) {
        core::utils::requireFinite(values[i], static_cast<core::Timestamp>(i));
        window.push(values[i]);
        series.push_back(window.mean());
    }
    return series;
}

core::AlignedSeries<WindowStats> rollingStats(const std::vector<double>& values, int period) {
    RollingWindow window(period, true);
    core::AlignedSeries<WindowStats> series;
    series.reserve(values.size());
    for (std::size_t i = 0; i < values.size(); ++i) {
        core::utils::requireFinite(values[i], static_cast<core::Timestamp>(i));
        window.push(values[i]);
        series.push_back(window.stats());
    }
    return series;
}

} // namespace indicators
