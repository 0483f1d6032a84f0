#include "run_config.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cctype>
#include <fstream>

namespace core {

    namespace {

        std::string requireString(const json& obj, const char* key, const char* context) {
            if (!obj.contains(key) || !obj[key].is_string()) {
                throw ConfigException(fmt::format("{} requires '{}' (string).", context, key));
            }
            return obj[key].get<std::string>();
        }

        std::optional<Timestamp> optionalTimestamp(const json& obj, const char* key) {
            if (!obj.contains(key) || obj[key].is_null()) {
                return std::nullopt;
            }
            if (!obj[key].is_number_integer()) {
                throw ConfigException(fmt::format("'input.{}' must be an integer (epoch milliseconds).", key));
            }
            return obj[key].get<Timestamp>();
        }

        InputConfig parseInput(const json& input) {
            if (!input.is_object()) {
                throw ConfigException("'input' must be an object.");
            }
            InputConfig result;
            result.type = inputTypeFromString(requireString(input, "type", "'input'"));
            result.start_time = optionalTimestamp(input, "start_time");
            result.end_time = optionalTimestamp(input, "end_time");

            switch (result.type) {
                case InputType::Csv:
                    result.path = requireString(input, "path", "CSV input");
                    break;
                case InputType::Sqlite:
                    result.path = requireString(input, "path", "SQLite input");
                    result.symbol = requireString(input, "symbol", "SQLite input");
                    result.interval = requireString(input, "interval", "SQLite input");
                    break;
                case InputType::Binance:
                    result.symbol = requireString(input, "symbol", "Binance input");
                    result.interval = requireString(input, "interval", "Binance input");
                    if (!result.start_time) {
                        throw ConfigException("Binance input requires 'start_time'.");
                    }
                    break;
            }

            if (result.start_time && result.end_time && *result.end_time < *result.start_time) {
                throw ConfigException(fmt::format("'input.end_time' ({}) is before 'input.start_time' ({}).",
                                                  *result.end_time, *result.start_time));
            }
            return result;
        }

    } // namespace

    InputType inputTypeFromString(const std::string& type_str) {
        std::string lower_str = type_str;
        std::transform(lower_str.begin(), lower_str.end(), lower_str.begin(),
            [](unsigned char c){ return std::tolower(c); });
        if (lower_str == "csv") return InputType::Csv;
        if (lower_str == "sqlite") return InputType::Sqlite;
        if (lower_str == "binance") return InputType::Binance;
        throw ConfigException("Unknown input type: " + type_str);
    }

    std::string toString(InputType type) {
        switch (type) {
            case InputType::Csv: return "csv";
            case InputType::Sqlite: return "sqlite";
            case InputType::Binance: return "binance";
        }
        return "unknown";
    }

    RunConfig RunConfig::fromJson(const json& config) {
        if (!config.is_object()) {
            throw ConfigException("Run config must be a JSON object.");
        }
        if (!config.contains("input")) {
            throw ConfigException("Run config requires 'input'.");
        }

        RunConfig result;
        try {
            result.input = parseInput(config["input"]);

            if (!config.contains("indicators") || !config["indicators"].is_array() || config["indicators"].empty()) {
                throw ConfigException("Run config requires 'indicators' (non-empty array of strings).");
            }
            for (const auto& entry : config["indicators"]) {
                if (!entry.is_string()) {
                    throw ConfigException("Every entry of 'indicators' must be a string, e.g. \"SMA(20)\".");
                }
                result.indicators.push_back(entry.get<std::string>());
            }

            result.output_dir = config.value("output_dir", result.output_dir);
            result.precision = config.value("precision", result.precision);
            result.verify_with_talib = config.value("verify_with_talib", result.verify_with_talib);
            result.log_level = config.value("log_level", result.log_level);
        } catch (const json::exception& e) {
            throw ConfigException(fmt::format("Invalid JSON structure in run config: {}", e.what()));
        }

        if (result.precision < 0 || result.precision > 17) {
            throw ConfigException(fmt::format("'precision' must be within [0, 17], got {}.", result.precision));
        }
        if (result.output_dir.empty()) {
            throw ConfigException("'output_dir' must not be empty.");
        }
        return result;
    }

    RunConfig loadRunConfig(const std::string& path) {
        std::ifstream ifs(path);
        if (!ifs.is_open()) {
            throw ConfigException(fmt::format("Failed to open run config file: {}", path));
        }

        json config;
        try {
            config = json::parse(ifs);
        } catch (const json::parse_error& e) {
            throw ConfigException(fmt::format("Failed to parse run config '{}': {}", path, e.what()));
        }

        RunConfig result = RunConfig::fromJson(config);
        logging::getLogger()->debug("Run config loaded from {}: input={}, {} indicator(s), output_dir={}",
                                    path, toString(result.input.type), result.indicators.size(), result.output_dir);
        return result;
    }

} // namespace core
