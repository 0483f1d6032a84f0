#include <gtest/gtest.h>
#include "run_config.hpp"
#include "exceptions.hpp"
#include <cstdio>
#include <fstream>

using core::RunConfig;
using core::json;

TEST(RunConfigTest, CsvInputWithDefaults) {
    const auto config = RunConfig::fromJson(json::parse(R"json({
        "input": {"type": "csv", "path": "klines.csv"},
        "indicators": ["SMA(20)", "RSI(14)"]
    })json"));
    EXPECT_EQ(config.input.type, core::InputType::Csv);
    EXPECT_EQ(config.input.path, "klines.csv");
    EXPECT_FALSE(config.input.start_time.has_value());
    ASSERT_EQ(config.indicators.size(), 2u);
    EXPECT_EQ(config.indicators[1], "RSI(14)");
    EXPECT_EQ(config.output_dir, "output");
    EXPECT_EQ(config.precision, 10);
    EXPECT_FALSE(config.verify_with_talib);
    EXPECT_EQ(config.log_level, "info");
}

TEST(RunConfigTest, BinanceInputWithOverrides) {
    const auto config = RunConfig::fromJson(json::parse(R"json({
        "input": {"type": "Binance", "symbol": "BTCUSDT", "interval": "1h",
                  "start_time": 1704067200000, "end_time": 1706745599999},
        "indicators": ["BB(20,2)"],
        "output_dir": "out", "precision": 6, "verify_with_talib": true, "log_level": "debug"
    })json"));
    EXPECT_EQ(config.input.type, core::InputType::Binance);
    EXPECT_EQ(config.input.symbol, "BTCUSDT");
    EXPECT_EQ(*config.input.start_time, 1704067200000LL);
    EXPECT_EQ(*config.input.end_time, 1706745599999LL);
    EXPECT_EQ(config.output_dir, "out");
    EXPECT_EQ(config.precision, 6);
    EXPECT_TRUE(config.verify_with_talib);
}

TEST(RunConfigTest, SqliteInputRequiresSymbolAndInterval) {
    EXPECT_THROW(RunConfig::fromJson(json::parse(R"json({
        "input": {"type": "sqlite", "path": "klines.db", "symbol": "ETHUSDT"},
        "indicators": ["SMA(5)"]
    })json")), core::ConfigException);
}

TEST(RunConfigTest, RejectsInvalidConfigs) {
    // Missing input
    EXPECT_THROW(RunConfig::fromJson(json::parse(R"json({"indicators": ["SMA(5)"]})json")), core::ConfigException);
    // Unknown input type
    EXPECT_THROW(RunConfig::fromJson(json::parse(R"json({
        "input": {"type": "parquet", "path": "x"}, "indicators": ["SMA(5)"]})json")), core::ConfigException);
    // Empty indicator list
    EXPECT_THROW(RunConfig::fromJson(json::parse(R"json({
        "input": {"type": "csv", "path": "x"}, "indicators": []})json")), core::ConfigException);
    // Non-string indicator
    EXPECT_THROW(RunConfig::fromJson(json::parse(R"json({
        "input": {"type": "csv", "path": "x"}, "indicators": [20]})json")), core::ConfigException);
    // Binance without start_time
    EXPECT_THROW(RunConfig::fromJson(json::parse(R"json({
        "input": {"type": "binance", "symbol": "BTCUSDT", "interval": "1m"}, "indicators": ["SMA(5)"]})json")),
        core::ConfigException);
    // end before start
    EXPECT_THROW(RunConfig::fromJson(json::parse(R"json({
        "input": {"type": "csv", "path": "x", "start_time": 10, "end_time": 5}, "indicators": ["SMA(5)"]})json")),
        core::ConfigException);
    // Precision out of range
    EXPECT_THROW(RunConfig::fromJson(json::parse(R"json({
        "input": {"type": "csv", "path": "x"}, "indicators": ["SMA(5)"], "precision": 40})json")),
        core::ConfigException);
    // Ill-typed optional field
    EXPECT_THROW(RunConfig::fromJson(json::parse(R"json({
        "input": {"type": "csv", "path": "x"}, "indicators": ["SMA(5)"], "precision": "high"})json")),
        core::ConfigException);
}

TEST(RunConfigTest, LoadFromFile) {
    const std::string path = "run_config_test_tmp.json";
    {
        std::ofstream ofs(path);
        ofs << R"json({"input": {"type": "csv", "path": "k.csv"}, "indicators": ["EMA(9)"]})json";
    }
    const auto config = core::loadRunConfig(path);
    EXPECT_EQ(config.indicators.front(), "EMA(9)");
    std::remove(path.c_str());
}

TEST(RunConfigTest, LoadFromFileReportsMissingAndBrokenFiles) {
    EXPECT_THROW(core::loadRunConfig("does/not/exist.json"), core::ConfigException);

    const std::string path = "run_config_broken_tmp.json";
    {
        std::ofstream ofs(path);
        ofs << "{ not json";
    }
    EXPECT_THROW(core::loadRunConfig(path), core::ConfigException);
    std::remove(path.c_str());
}

TEST(RunConfigTest, InputTypeNames) {
    EXPECT_EQ(core::inputTypeFromString("SQLite"), core::InputType::Sqlite);
    EXPECT_EQ(core::toString(core::InputType::Binance), "binance");
    EXPECT_THROW(core::inputTypeFromString("ftp"), core::ConfigException);
}
