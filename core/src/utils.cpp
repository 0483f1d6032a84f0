#include "utils.hpp"
#include "exceptions.hpp"
#include <spdlog/fmt/fmt.h>
#include <iomanip>    // For std::put_time, std::get_time
#include <sstream>    // For string streams
#include <string>
#include <cmath>      // For std::pow, std::isfinite
#include <cctype>     // For std::isdigit
#include <ctime>

namespace core {
namespace utils {

    Timestamp stringToTimestamp(const std::string& iso_string) {
        std::tm tm = {};
        std::istringstream ss(iso_string);

        // 1. Parse main date/time part up to seconds
        ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        if (ss.fail()) {
            throw std::runtime_error("Failed to parse timestamp (date/time part): " + iso_string);
        }

        // 2. Optional fractional seconds, truncated to milliseconds
        Timestamp millis = 0;
        if (ss.peek() == '.') {
            ss.ignore(); // consume '.'
            std::string digits;
            while (std::isdigit(ss.peek())) {
                digits += static_cast<char>(ss.get());
            }
            if (digits.empty()) {
                throw std::runtime_error("Failed to parse timestamp (empty fraction): " + iso_string);
            }
            digits.resize(3, '0');
            millis = std::stoll(digits);
        }

        // 3. Timezone: 'Z' or +HH:MM / -HH:MM
        Timestamp offset_ms = 0;
        char sign_or_z = 0;
        if (!(ss >> sign_or_z)) {
            throw std::runtime_error("Timestamp missing timezone offset/indicator: " + iso_string);
        }
        if (sign_or_z == '+' || sign_or_z == '-') {
            int offset_h = 0;
            int offset_m = 0;
            char colon = ' ';
            if (!(ss >> std::setw(2) >> offset_h >> colon >> std::setw(2) >> offset_m) || colon != ':') {
                throw std::runtime_error("Failed to parse timestamp (timezone offset HH:MM): " + iso_string);
            }
            offset_ms = (static_cast<Timestamp>(offset_h) * 3600 + offset_m * 60) * 1000;
            if (sign_or_z == '-') {
                offset_ms = -offset_ms;
            }
        } else if (sign_or_z != 'Z') {
            throw std::runtime_error("Invalid timezone indicator '" + std::string(1, sign_or_z) + "' in timestamp: " + iso_string);
        }

        // 4. timegm interprets struct tm as UTC
        #ifdef _WIN32
            time_t tt = _mkgmtime(&tm);
        #else
            time_t tt = timegm(&tm);
        #endif
        if (tt == static_cast<time_t>(-1)) {
            throw std::runtime_error("Failed to convert parsed date/time to UTC epoch seconds: " + iso_string);
        }

        // Local time minus its offset gives UTC
        return static_cast<Timestamp>(tt) * 1000 + millis - offset_ms;
    }

    std::string timestampToString(Timestamp ts) {
        // Floor division so pre-epoch values keep a positive millisecond part
        Timestamp seconds = ts / 1000;
        Timestamp millis = ts % 1000;
        if (millis < 0) {
            millis += 1000;
            seconds -= 1;
        }

        time_t tt = static_cast<time_t>(seconds);
        std::tm time_tm;
        #ifdef _WIN32
            gmtime_s(&time_tm, &tt);
        #else
            gmtime_r(&tt, &time_tm);
        #endif

        std::ostringstream oss;
        oss << std::put_time(&time_tm, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << millis << 'Z';
        return oss.str();
    }

    std::string formatFixed(double value, int precision) {
        return fmt::format("{:.{}f}", value, precision);
    }

    void requireFinite(double close, Timestamp ts) {
        if (!std::isfinite(close)) {
            throw NonFiniteInputException(fmt::format(
                "Non-finite close price {} at timestamp {}", close, ts));
        }
    }

} // namespace utils
} // namespace core
