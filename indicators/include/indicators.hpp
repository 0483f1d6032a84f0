#pragma once

#include "datatypes.hpp" // Observation, AlignedSeries
#include "logging.hpp"
#include <optional>
#include <string>
#include <utility>

namespace indicators {

// Returns period unchanged, throws core::InvalidPeriodException unless period >= 1
int validatePeriod(int period, const std::string& indicator_name);

// Decides whether an observation opens a new bar or updates the current one.
// Equal timestamps update the current bar, a lower timestamp is an error.
class BarSequencer {
public:
    // Validates without changing state. Returns true for a new bar.
    // Throws core::OutOfOrderObservationException on a decreasing timestamp.
    bool isNewBar(const core::Observation& observation) const;

    void commit(const core::Observation& observation);
    void reset();

    // Number of distinct bars committed so far
    long long barCount() const { return bar_count_; }

private:
    std::optional<core::Timestamp> last_timestamp_;
    long long bar_count_ = 0;
};

// Streaming indicator. The object is the caller-owned state: feed it one
// observation at a time with update(), or a whole history with calculate().
// Not internally synchronized.
template<typename Output>
class IIndicator {
public:
    virtual ~IIndicator() = default;

    // Get the name of the indicator (e.g., "SMA(20)", "BB(20,2)")
    virtual std::string getName() const = 0;

    // Index (in bars) of the first defined output. Every earlier output is Undefined.
    virtual int getLookback() const = 0;

    // Ingests one observation and returns the value for the current bar.
    // An observation with the same timestamp as the previous one replaces that bar.
    // On error the indicator keeps the state it had before the call.
    virtual core::IndicatorValue<Output> update(const core::Observation& observation) = 0;

    // Last value returned by update(), no state change
    virtual core::IndicatorValue<Output> value() const = 0;

    // Back to the freshly constructed state
    virtual void reset() = 0;

    // Batch form: resets, then folds update() over the whole input.
    // Stores an aligned series (same length as input). Nothing is stored on error.
    void calculate(const core::TimeSeries<core::Observation>& input) {
        auto logger = core::logging::getLogger();
        logger->trace("Calculating {} over {} observations...", getName(), input.size());

        results_.clear();
        reset();

        core::AlignedSeries<Output> series;
        series.reserve(input.size());
        for (const auto& observation : input) {
            series.push_back(update(observation));
        }
        results_ = std::move(series);

        logger->trace("Successfully calculated {} aligned values for {}", results_.size(), getName());
    }

    const core::AlignedSeries<Output>& getResult() const {
        return results_;
    }

private:
    core::AlignedSeries<Output> results_;
};

} // namespace indicators
