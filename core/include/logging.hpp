#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>
#include <memory>
#include <string>

namespace core {
namespace logging {

    // Call this once at the beginning of the application (e.g., in main())
    void initialize(const std::string& log_file_path = "ta_engine",
                    spdlog::level::level_enum console_level = spdlog::level::info,
                    spdlog::level::level_enum file_level = spdlog::level::debug);

    // Console-only logger, no files touched (used by the test runner)
    void initializeConsole(spdlog::level::level_enum console_level = spdlog::level::warn);

    // Get the globally configured logger
    std::shared_ptr<spdlog::logger>& getLogger();

    // Helper function to set log level from string (useful for env vars/config)
    spdlog::level::level_enum level_from_string(const std::string& level_str);

} // namespace logging
} // namespace core
