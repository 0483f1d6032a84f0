#include "logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace core {
namespace logging {

    static std::shared_ptr<spdlog::logger> global_logger;

    namespace {

        const char* kLoggerName = "IndicatorEngine";
        const char* kLogDirectory = "logs";
        const char* kUtcPattern = "[%Y-%m-%d %H:%M:%S.%e%z] [%^%l%$] [%n] %v";
        constexpr std::size_t kMaxFileSize = 10 * 1024 * 1024;
        constexpr std::size_t kMaxFiles = 5;

        void installLogger(std::vector<spdlog::sink_ptr> sinks, spdlog::level::level_enum level) {
            // Re-initialization replaces the previous logger
            spdlog::drop(kLoggerName);
            global_logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
            global_logger->set_level(level);
            spdlog::register_logger(global_logger);
            spdlog::set_default_logger(global_logger);
            spdlog::set_level(level);
            spdlog::flush_on(spdlog::level::err);
        }

        std::optional<spdlog::level::level_enum> levelFromEnvironment() {
            const char* env_level = std::getenv("SPDLOG_LEVEL");
            if (!env_level) {
                return std::nullopt;
            }
            std::cout << "[Logging] SPDLOG_LEVEL overrides configured levels: " << env_level << std::endl;
            return level_from_string(env_level);
        }

        // Falls back to the working directory when logs/ can't be created
        std::string prepareLogDirectory() {
            std::error_code ec;
            std::filesystem::create_directories(kLogDirectory, ec);
            if (ec) {
                std::cerr << "[Logging] Cannot create log directory '" << kLogDirectory << "': "
                          << ec.message() << ". Using current directory." << std::endl;
                return ".";
            }
            return kLogDirectory;
        }

        // <dir>/<base>_YYYYMMDD_HHMMSSZ.log
        std::string utcLogFilePath(const std::string& directory, const std::string& base_name) {
            const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            std::tm utc_tm{};
            #ifdef _WIN32
                gmtime_s(&utc_tm, &now);
            #else
                gmtime_r(&now, &utc_tm);
            #endif
            std::ostringstream oss;
            oss << directory << '/' << base_name << '_' << std::put_time(&utc_tm, "%Y%m%d_%H%M%SZ") << ".log";
            return oss.str();
        }

    } // namespace

    void initialize(const std::string& base_log_filename,
                    spdlog::level::level_enum console_level,
                    spdlog::level::level_enum file_level)
    {
        if (const auto env_level = levelFromEnvironment()) {
            console_level = *env_level;
            file_level = *env_level;
        }

        try {
            const std::string log_file_path = utcLogFilePath(prepareLogDirectory(), base_log_filename);

            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(console_level);
            console_sink->set_pattern(kUtcPattern);

            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file_path, kMaxFileSize, kMaxFiles, true);
            file_sink->set_level(file_level);
            file_sink->set_pattern(kUtcPattern);

            installLogger({console_sink, file_sink}, std::min(console_level, file_level));

            #ifdef NDEBUG
                const char* build_type = "Release";
            #else
                const char* build_type = "Debug";
            #endif
            global_logger->info("Logging initialized ({} build). Console: {}, File: {} -> {} (UTC)",
                                build_type,
                                spdlog::level::to_string_view(console_level),
                                spdlog::level::to_string_view(file_level),
                                log_file_path);

        } catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "Log initialization failed: " << ex.what() << ". Falling back to console logging." << std::endl;
            initializeConsole(console_level);
        }
    }

    void initializeConsole(spdlog::level::level_enum console_level) {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(console_level);
        console_sink->set_pattern(kUtcPattern);
        installLogger({console_sink}, console_level);
    }

    std::shared_ptr<spdlog::logger>& getLogger() {
        if (!global_logger) {
            throw std::runtime_error("Logger used before core::logging::initialize() or initializeConsole().");
        }
        return global_logger;
    }

    spdlog::level::level_enum level_from_string(const std::string& level_str) {
        std::string name = level_str;
        std::transform(name.begin(), name.end(), name.begin(),
            [](unsigned char c){ return std::tolower(c); });

        if (name == "warning") name = "warn";
        if (name == "error") name = "err";
        if (name == "crit") name = "critical";

        const auto level = spdlog::level::from_str(name);
        // from_str maps unknown names to off
        if (level == spdlog::level::off && name != "off") {
            std::cerr << "[Logging] Unknown log level '" << level_str << "', using 'info'." << std::endl;
            return spdlog::level::info;
        }
        return level;
    }

} // namespace logging
} // namespace core
