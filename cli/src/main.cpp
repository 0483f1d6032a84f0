// cli/src/main.cpp

// Standard includes
#include <iostream>
#include <string>
#include <vector>
#include <exception>
#include <filesystem>  // For output_dir creation
#include <cstdlib>     // For std::getenv
#include <limits>
#include <memory>
#include <variant>

// Project includes
#include "logging.hpp"
#include "exceptions.hpp"
#include "datatypes.hpp"
#include "utils.hpp"
#include "run_config.hpp"
#include "indicator_factory.hpp"
#include "talib_reference.hpp"
#include "kline_csv.hpp"
#include "indicator_writer.hpp"
#include "database_manager.hpp"
#include "binance_api_client.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/sink.h>

namespace {

    // Above this the engine and TA-Lib are reported as diverging
    constexpr double kVerifyTolerance = 1e-6;

    core::TimeSeries<core::Candle> loadCandles(const core::InputConfig& input) {
        switch (input.type) {
            case core::InputType::Csv:
                return data::readKlineCsv(input.path);

            case core::InputType::Sqlite: {
                // Input databases are never created or migrated here
                data::DatabaseManager db_manager(input.path);
                if (!db_manager.connect(true)) {
                    throw core::DatabaseException("Failed to open SQLite database: " + input.path);
                }
                auto candles = db_manager.queryCandles(
                    input.symbol, input.interval,
                    input.start_time.value_or(std::numeric_limits<core::Timestamp>::min()),
                    input.end_time.value_or(std::numeric_limits<core::Timestamp>::max()));
                db_manager.disconnect();
                return candles;
            }

            case core::InputType::Binance: {
                data::BinanceApiClient client;
                return client.getKlines(input.symbol, input.interval, *input.start_time, input.end_time);
            }
        }
        throw core::ConfigException("Unsupported input type: " + core::toString(input.type));
    }

    // Runs the matching TA-Lib function and logs the largest deviation from the engine
    void verifyWithTalib(const indicators::IndicatorResult& result, const std::vector<double>& closes) {
        auto logger = core::logging::getLogger();
        const auto& spec = result.spec;
        if (spec.period < 2 && spec.type != indicators::IndicatorType::Sma) {
            logger->warn("Skipping TA-Lib check for {}: TA-Lib requires a period >= 2.", result.name);
            return;
        }

        double max_diff = 0.0;
        switch (spec.type) {
            case indicators::IndicatorType::Sma:
                max_diff = indicators::talib::maxAbsDifference(
                    std::get<core::AlignedSeries<double>>(result.values),
                    indicators::talib::sma(closes, spec.period));
                break;
            case indicators::IndicatorType::Ema:
                max_diff = indicators::talib::maxAbsDifference(
                    std::get<core::AlignedSeries<double>>(result.values),
                    indicators::talib::ema(closes, spec.period));
                break;
            case indicators::IndicatorType::Bollinger:
                max_diff = indicators::talib::maxAbsDifference(
                    std::get<core::AlignedSeries<core::BandValue>>(result.values),
                    indicators::talib::bollinger(closes, spec.period, spec.multiplier));
                break;
            case indicators::IndicatorType::Rsi:
                max_diff = indicators::talib::maxAbsDifference(
                    std::get<core::AlignedSeries<double>>(result.values),
                    indicators::talib::rsi(closes, spec.period));
                break;
        }

        if (max_diff > kVerifyTolerance) {
            // Flat RSI windows read 50 here and 0 in TA-Lib
            logger->warn("{} deviates from TA-Lib: max |diff| = {:.3e}", result.name, max_diff);
        } else {
            logger->info("{} matches TA-Lib: max |diff| = {:.3e}", result.name, max_diff);
        }
    }

} // namespace

int main(int argc, char* argv[]) {
    std::shared_ptr<spdlog::logger> logger = nullptr;

    try {
        core::logging::initialize("ta_engine_cli", spdlog::level::info, spdlog::level::debug);
        logger = core::logging::getLogger();

        if (argc != 2) {
            std::cerr << "Usage: " << argv[0] << " <run_config.json>" << std::endl;
            logger->error("Expected exactly one argument (run config path), got {}.", argc - 1);
            return 1;
        }

        // --- Load Run Config ---
        const core::RunConfig config = core::loadRunConfig(argv[1]);
        if (!std::getenv("SPDLOG_LEVEL")) {
            const auto level = core::logging::level_from_string(config.log_level);
            logger->sinks().front()->set_level(level); // Console sink
            if (level < logger->level()) {
                logger->set_level(level);
            }
        }
        logger->info("Indicator engine starting with {} indicator(s).", config.indicators.size());

        std::vector<indicators::IndicatorSpec> specs;
        for (const auto& spec_str : config.indicators) {
            specs.push_back(indicators::parseIndicatorSpec(spec_str));
        }

        // --- Load Market Data ---
        const auto candles = loadCandles(config.input);
        if (candles.empty()) {
            logger->warn("Input produced no klines, every indicator output will be empty.");
        } else {
            logger->info("Loaded {} klines ({} .. {}).", candles.size(),
                         core::utils::timestampToString(candles.front().timestamp),
                         core::utils::timestampToString(candles.back().timestamp));
        }

        const auto observations = core::toObservations(candles);
        std::vector<core::Timestamp> timestamps;
        std::vector<double> closes;
        timestamps.reserve(observations.size());
        closes.reserve(observations.size());
        for (const auto& observation : observations) {
            timestamps.push_back(observation.timestamp);
            closes.push_back(observation.close);
        }

        // --- Compute & Write ---
        std::filesystem::create_directories(config.output_dir);

        std::unique_ptr<indicators::talib::Session> talib_session;
        if (config.verify_with_talib) {
            talib_session = std::make_unique<indicators::talib::Session>();
        }

        for (const auto& spec : specs) {
            const auto result = indicators::computeIndicator(spec, observations);
            const std::string out_path =
                (std::filesystem::path(config.output_dir) / (spec.fileStem() + ".csv")).string();

            if (result.isBand()) {
                data::writeBandSeries(out_path, timestamps,
                                      std::get<core::AlignedSeries<core::BandValue>>(result.values),
                                      config.precision);
            } else {
                data::writeScalarSeries(out_path, timestamps,
                                        std::get<core::AlignedSeries<double>>(result.values),
                                        config.precision);
            }
            logger->info("{} (lookback {}) written to {}", result.name, result.lookback, out_path);

            if (talib_session) {
                verifyWithTalib(result, closes);
            }
        }

        logger->info("Indicator engine finished.");

    } catch (const core::IndicatorEngineException& ex) {
        std::cerr << "Engine Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Engine Error: {}", ex.what());
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Standard Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Standard Error: {}", ex.what());
        return 1;
    }

    return 0;
}
