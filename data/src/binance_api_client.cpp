#include "binance_api_client.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include "utils.hpp"
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>

#include <stdexcept>

namespace data {

namespace {

    // Binance sends prices and volumes as decimal strings, older mirrors as numbers
    double readDecimal(const nlohmann::json& field, std::size_t row, const char* column) {
        if (field.is_number()) {
            return field.get<double>();
        }
        if (field.is_string()) {
            const std::string text = field.get<std::string>();
            std::size_t consumed = 0;
            double value = 0.0;
            try {
                value = std::stod(text, &consumed);
            } catch (const std::logic_error&) {
                consumed = 0;
            }
            if (consumed != 0 && consumed == text.size()) {
                return value;
            }
        }
        throw core::ApiRequestException(fmt::format("Kline row {}: invalid {} field: {}", row, column, field.dump()));
    }

} // namespace

BinanceApiClient::BinanceApiClient(const std::string& base_url, int timeout_ms)
    : base_url_(base_url),
      timeout_ms_(timeout_ms)
{
    core::logging::getLogger()->debug("BinanceApiClient created for {}.", base_url_);
}

core::TimeSeries<core::Candle> BinanceApiClient::parseKlinesPayload(const std::string& body)
{
    nlohmann::json json_response;
    try {
        json_response = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        throw core::ApiRequestException(fmt::format("Failed to parse JSON response from Binance: {}", e.what()));
    }

    if (json_response.is_object()) {
        // Fields are echoed as JSON text, whatever their type
        const auto code = json_response.find("code");
        const auto msg = json_response.find("msg");
        throw core::ApiRequestException(fmt::format(
            "Binance API error: code={}, msg='{}'",
            code != json_response.end() ? code->dump() : std::string("unknown"),
            msg == json_response.end() ? std::string("Unknown API error message")
                : msg->is_string() ? msg->get<std::string>() : msg->dump()));
    }
    if (!json_response.is_array()) {
        throw core::ApiRequestException("Unexpected JSON structure: kline payload is not an array.");
    }

    core::TimeSeries<core::Candle> candles;
    candles.reserve(json_response.size());
    for (std::size_t i = 0; i < json_response.size(); ++i) {
        const auto& row = json_response[i];
        if (!row.is_array() || row.size() < 6) {
            throw core::ApiRequestException(fmt::format("Kline row {} has an invalid format: {}", i, row.dump()));
        }
        if (!row[0].is_number_integer()) {
            throw core::ApiRequestException(fmt::format("Kline row {}: open_time is not an integer", i));
        }

        core::Candle candle;
        candle.timestamp = row[0].get<core::Timestamp>();
        candle.open = readDecimal(row[1], i, "open");
        candle.high = readDecimal(row[2], i, "high");
        candle.low = readDecimal(row[3], i, "low");
        candle.close = readDecimal(row[4], i, "close");
        candle.volume = readDecimal(row[5], i, "volume");
        candles.push_back(candle);
    }
    return candles;
}

core::TimeSeries<core::Candle> BinanceApiClient::getKlines(
    const std::string& symbol,
    const std::string& interval,
    core::Timestamp start_time,
    std::optional<core::Timestamp> end_time,
    int limit)
{
    auto logger = core::logging::getLogger();
    if (limit < 1 || limit > kMaxLimit) {
        throw std::invalid_argument(fmt::format("Kline limit must be within [1, {}], got {}", kMaxLimit, limit));
    }

    logger->info("Fetching {} {} klines from {}{}", symbol, interval,
                 core::utils::timestampToString(start_time),
                 end_time ? " to " + core::utils::timestampToString(*end_time) : std::string());

    core::TimeSeries<core::Candle> candles;
    core::Timestamp cursor = start_time;
    while (!end_time || cursor <= *end_time) {
        const std::string body = performGetRequest("/api/v3/klines", symbol, interval, cursor, end_time, limit);
        auto page = parseKlinesPayload(body);
        logger->debug("Received {} klines starting at {}", page.size(), cursor);

        if (page.empty()) {
            break;
        }
        const core::Timestamp last_open_time = page.back().timestamp;
        if (last_open_time < cursor) {
            throw core::ApiRequestException(fmt::format(
                "Binance returned klines older than the requested start ({} < {})", last_open_time, cursor));
        }
        candles.insert(candles.end(), page.begin(), page.end());

        if (static_cast<int>(page.size()) < limit) {
            break;
        }
        cursor = last_open_time + 1;
    }

    logger->info("Fetched {} klines for {} ({}).", candles.size(), symbol, interval);
    return candles;
}

std::string BinanceApiClient::performGetRequest(const std::string& endpoint,
                                                const std::string& symbol,
                                                const std::string& interval,
                                                core::Timestamp start_time,
                                                std::optional<core::Timestamp> end_time,
                                                int limit) const
{
    auto logger = core::logging::getLogger();
    const std::string full_url = base_url_ + endpoint;

    cpr::Parameters parameters{
        {"symbol", symbol},
        {"interval", interval},
        {"startTime", std::to_string(start_time)},
        {"limit", std::to_string(limit)}
    };
    if (end_time) {
        parameters.Add({"endTime", std::to_string(*end_time)});
    }

    logger->debug("Requesting Binance URL: {}", full_url);
    cpr::Response response = cpr::Get(cpr::Url{full_url},
                                      parameters,
                                      cpr::Header{{"Accept", "application/json"}},
                                      cpr::Timeout{timeout_ms_});

    logger->debug("Binance API Response Status: {}, Body size: {}", response.status_code, response.text.length());

    if (response.error) {
        throw core::ApiRequestException(fmt::format("Binance API request failed (CPR error): Code={}, Message='{}'",
                                                    static_cast<int>(response.error.code), response.error.message));
    }
    if (response.status_code != 200) {
        if (response.status_code == 429 || response.status_code == 418) {
            logger->critical("Binance API rate limit hit (status {}).", response.status_code);
        }
        throw core::ApiRequestException(fmt::format("Binance API request failed: Status Code={}, Body='{}'",
                                                    response.status_code, response.text.substr(0, 500)));
    }
    return response.text;
}

} // namespace data
