#pragma once

#include "datatypes.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace core {

    using json = nlohmann::json;

    enum class InputType {
        Csv,     // Binance kline CSV file
        Sqlite,  // Kline table in a SQLite database
        Binance  // Binance REST /api/v3/klines
    };

    struct InputConfig {
        InputType type = InputType::Csv;
        std::string path;      // CSV file or SQLite database
        std::string symbol;    // e.g. "BTCUSDT"
        std::string interval;  // e.g. "1h"
        std::optional<Timestamp> start_time;
        std::optional<Timestamp> end_time;
    };

    struct RunConfig {
        InputConfig input;
        std::vector<std::string> indicators; // e.g. "SMA(20)", "BB(20,2)"
        std::string output_dir = "output";
        int precision = 10;
        bool verify_with_talib = false;
        std::string log_level = "info";

        // Throws ConfigException on missing or ill-typed fields
        static RunConfig fromJson(const json& config);
    };

    // Reads and validates a run configuration file
    RunConfig loadRunConfig(const std::string& path);

    InputType inputTypeFromString(const std::string& type_str);
    std::string toString(InputType type);

} // namespace core
