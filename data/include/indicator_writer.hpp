#pragma once

#include "datatypes.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace data {

    // Writes "open_time,expected" rows for every defined value of series.
    // timestamps[i] is paired with series[i]; Undefined entries are skipped.
    // Throws std::invalid_argument when the lengths differ.
    void writeScalarSeries(std::ostream& out,
                           const std::vector<core::Timestamp>& timestamps,
                           const core::AlignedSeries<double>& series,
                           int precision);

    // Writes "open_time,upper,middle,lower" rows, same rules as writeScalarSeries
    void writeBandSeries(std::ostream& out,
                         const std::vector<core::Timestamp>& timestamps,
                         const core::AlignedSeries<core::BandValue>& series,
                         int precision);

    // File forms, creating/truncating path. Throw core::IndicatorEngineException if the file can't be written.
    void writeScalarSeries(const std::string& path,
                           const std::vector<core::Timestamp>& timestamps,
                           const core::AlignedSeries<double>& series,
                           int precision);

    void writeBandSeries(const std::string& path,
                         const std::vector<core::Timestamp>& timestamps,
                         const core::AlignedSeries<core::BandValue>& series,
                         int precision);

} // namespace data
