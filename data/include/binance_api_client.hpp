#pragma once

#include <string>
#include <optional>
#include "datatypes.hpp" // For TimeSeries, Candle

namespace data {

class BinanceApiClient {
public:
    static constexpr int kMaxLimit = 1000; // Binance cap per /api/v3/klines call

    explicit BinanceApiClient(const std::string& base_url = "https://api.binance.com",
                              int timeout_ms = 15000);

    // Klines with open_time in [start_time, end_time], ascending. Pages through the
    // endpoint (limit rows per request) until end_time, or until a short page when
    // end_time is not set. Throws core::ApiRequestException on HTTP or payload errors.
    core::TimeSeries<core::Candle> getKlines(
        const std::string& symbol,
        const std::string& interval,
        core::Timestamp start_time,
        std::optional<core::Timestamp> end_time = std::nullopt,
        int limit = kMaxLimit);

    // Decodes a /api/v3/klines response body:
    // [[open_time, "open", "high", "low", "close", "volume", close_time, ...], ...]
    // A Binance error object ({"code":..,"msg":..}) or a malformed row throws core::ApiRequestException.
    static core::TimeSeries<core::Candle> parseKlinesPayload(const std::string& body);

    const std::string& getBaseUrl() const { return base_url_; }

private:
    std::string base_url_;
    int timeout_ms_;

    // Single GET, returns the body of a 200 response
    std::string performGetRequest(const std::string& endpoint,
                                  const std::string& symbol,
                                  const std::string& interval,
                                  core::Timestamp start_time,
                                  std::optional<core::Timestamp> end_time,
                                  int limit) const;
};

} // namespace data
