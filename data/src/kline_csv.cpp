#include "kline_csv.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace data {

    namespace {

        constexpr std::size_t kMinColumns = 6;

        std::vector<std::string> splitLine(const std::string& line) {
            std::vector<std::string> fields;
            std::stringstream ss(line);
            std::string field;
            while (std::getline(ss, field, ',')) {
                // Windows exports leave a trailing '\r' on the last field
                if (!field.empty() && field.back() == '\r') {
                    field.pop_back();
                }
                fields.push_back(field);
            }
            return fields;
        }

        bool isHeader(const std::vector<std::string>& fields) {
            return !fields.empty() && fields[0] == "open_time";
        }

        double parseDouble(const std::string& text, const char* column, std::size_t line_no,
                           const std::string& source_name) {
            std::size_t consumed = 0;
            double value = 0.0;
            try {
                value = std::stod(text, &consumed);
            } catch (const std::logic_error&) {
                consumed = 0;
            }
            if (consumed == 0 || consumed != text.size()) {
                throw core::DataLoadException(fmt::format("{}:{}: invalid {} value '{}'",
                                                          source_name, line_no, column, text));
            }
            return value;
        }

        core::Timestamp parseTimestamp(const std::string& text, std::size_t line_no,
                                       const std::string& source_name) {
            std::size_t consumed = 0;
            long long value = 0;
            try {
                value = std::stoll(text, &consumed);
            } catch (const std::logic_error&) {
                consumed = 0;
            }
            if (consumed == 0 || consumed != text.size()) {
                throw core::DataLoadException(fmt::format("{}:{}: invalid open_time value '{}'",
                                                          source_name, line_no, text));
            }
            return static_cast<core::Timestamp>(value);
        }

    } // namespace

    core::TimeSeries<core::Candle> readKlineCsv(std::istream& input, const std::string& source_name) {
        core::TimeSeries<core::Candle> candles;
        std::string line;
        std::size_t line_no = 0;

        while (std::getline(input, line)) {
            ++line_no;
            if (line.empty() || line == "\r") {
                continue;
            }
            const auto fields = splitLine(line);
            if (line_no == 1 && isHeader(fields)) {
                continue;
            }
            if (fields.size() < kMinColumns) {
                throw core::DataLoadException(fmt::format("{}:{}: expected at least {} columns, got {}",
                                                          source_name, line_no, kMinColumns, fields.size()));
            }

            core::Candle candle;
            candle.timestamp = parseTimestamp(fields[0], line_no, source_name);
            candle.open = parseDouble(fields[1], "open", line_no, source_name);
            candle.high = parseDouble(fields[2], "high", line_no, source_name);
            candle.low = parseDouble(fields[3], "low", line_no, source_name);
            candle.close = parseDouble(fields[4], "close", line_no, source_name);
            candle.volume = parseDouble(fields[5], "volume", line_no, source_name);
            candles.push_back(candle);
        }

        core::logging::getLogger()->debug("Read {} klines from {}", candles.size(), source_name);
        return candles;
    }

    core::TimeSeries<core::Candle> readKlineCsv(const std::string& path) {
        std::ifstream ifs(path);
        if (!ifs.is_open()) {
            throw core::DataLoadException(fmt::format("Failed to open kline CSV file: {}", path));
        }
        core::logging::getLogger()->info("Loading klines from {}", path);
        return readKlineCsv(ifs, path);
    }

} // namespace data
