#include <gtest/gtest.h>
#include "binance_api_client.hpp"
#include "exceptions.hpp"
#include <stdexcept>

using data::BinanceApiClient;

TEST(BinanceApiClientTest, ParsesKlinePayload) {
    const std::string body = R"([
        [1499040000000, "0.01634790", "0.80000000", "0.01575800", "0.01577100", "148976.11427815",
         1499644799999, "2434.19055334", 308, "1756.87402397", "28.46694368", "0"],
        [1499644800000, "0.01577100", "0.01600000", "0.01500000", "0.01590000", "1000.5",
         1500249599999, "15.9", 12, "500.0", "7.9", "0"]
    ])";
    const auto candles = BinanceApiClient::parseKlinesPayload(body);
    ASSERT_EQ(candles.size(), 2u);
    EXPECT_EQ(candles[0].timestamp, 1499040000000LL);
    EXPECT_DOUBLE_EQ(candles[0].open, 0.01634790);
    EXPECT_DOUBLE_EQ(candles[0].high, 0.8);
    EXPECT_DOUBLE_EQ(candles[0].close, 0.01577100);
    EXPECT_DOUBLE_EQ(candles[1].volume, 1000.5);
}

TEST(BinanceApiClientTest, AcceptsNumericFields) {
    const auto candles = BinanceApiClient::parseKlinesPayload("[[1, 1.5, 2, 1, 1.75, 10]]");
    ASSERT_EQ(candles.size(), 1u);
    EXPECT_DOUBLE_EQ(candles[0].close, 1.75);
}

TEST(BinanceApiClientTest, EmptyArrayIsNoData) {
    EXPECT_TRUE(BinanceApiClient::parseKlinesPayload("[]").empty());
}

TEST(BinanceApiClientTest, ErrorObjectThrows) {
    try {
        BinanceApiClient::parseKlinesPayload(R"({"code": -1121, "msg": "Invalid symbol."})");
        FAIL() << "Expected ApiRequestException";
    } catch (const core::ApiRequestException& e) {
        EXPECT_NE(std::string(e.what()).find("Invalid symbol."), std::string::npos);
    }
}

TEST(BinanceApiClientTest, ErrorObjectWithUnexpectedFieldTypesThrows) {
    try {
        BinanceApiClient::parseKlinesPayload(R"({"code": "-1003", "msg": {"detail": "Too many requests"}})");
        FAIL() << "Expected ApiRequestException";
    } catch (const core::ApiRequestException& e) {
        const std::string what = e.what();
        EXPECT_NE(what.find("-1003"), std::string::npos);
        EXPECT_NE(what.find("Too many requests"), std::string::npos);
    }
    EXPECT_THROW(BinanceApiClient::parseKlinesPayload(R"({"code": 1.5})"), core::ApiRequestException);
    EXPECT_THROW(BinanceApiClient::parseKlinesPayload(R"({})"), core::ApiRequestException);
}

TEST(BinanceApiClientTest, MalformedPayloadsThrow) {
    EXPECT_THROW(BinanceApiClient::parseKlinesPayload("not json"), core::ApiRequestException);
    EXPECT_THROW(BinanceApiClient::parseKlinesPayload("42"), core::ApiRequestException);
    EXPECT_THROW(BinanceApiClient::parseKlinesPayload("[[1, \"1\", \"2\"]]"), core::ApiRequestException);
    EXPECT_THROW(BinanceApiClient::parseKlinesPayload("[[\"t\", \"1\", \"2\", \"0\", \"1\", \"5\"]]"),
                 core::ApiRequestException);
    EXPECT_THROW(BinanceApiClient::parseKlinesPayload("[[1, \"1\", \"2\", \"0\", \"x1\", \"5\"]]"),
                 core::ApiRequestException);
}

TEST(BinanceApiClientTest, RejectsLimitOutsideBinanceRange) {
    BinanceApiClient client("http://127.0.0.1:9");
    EXPECT_EQ(client.getBaseUrl(), "http://127.0.0.1:9");
    EXPECT_THROW(client.getKlines("BTCUSDT", "1h", 0, std::nullopt, 0), std::invalid_argument);
    EXPECT_THROW(client.getKlines("BTCUSDT", "1h", 0, std::nullopt, 1001), std::invalid_argument);
}
