#pragma once

#include "datatypes.hpp"
#include <istream>
#include <string>

namespace data {

    // Reads Binance kline CSV exports. Two layouts are accepted:
    //  - raw export, no header, >= 6 columns:
    //    open_time,open,high,low,close,volume[,close_time,...]
    //  - a header line starting with "open_time" followed by rows in the same order.
    // Throws core::DataLoadException on unreadable files or malformed rows (line number in message).
    core::TimeSeries<core::Candle> readKlineCsv(const std::string& path);

    // Same as readKlineCsv, reading from an already opened stream. source_name is used in messages.
    core::TimeSeries<core::Candle> readKlineCsv(std::istream& input, const std::string& source_name);

} // namespace data
