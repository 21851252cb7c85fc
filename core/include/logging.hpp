#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>
#include <memory>
#include <string>

namespace core {
namespace logging {

    struct LoggingOptions {
        std::string base_file_name = "breakout_sentinel";
        std::string directory = "logs";
        spdlog::level::level_enum console_level = spdlog::level::info;
        spdlog::level::level_enum file_level = spdlog::level::debug;
        bool file_enabled = true;                    // Tests run console-only
        std::size_t max_file_bytes = 1024 * 1024 * 10;
        std::size_t max_files = 5;
    };

    // Call this once at the beginning of your application (e.g., in main())
    void initialize(const LoggingOptions& options = LoggingOptions{});

    // Get the globally configured logger
    std::shared_ptr<spdlog::logger>& getLogger();

    // Creates (or returns the registered) logger writing plain lines into
    // <directory>/<base_file_name>_YYYY-MM-DD.log, rotated at midnight.
    std::shared_ptr<spdlog::logger> createDailyLogger(const std::string& logger_name,
                                                      const std::string& directory,
                                                      const std::string& base_file_name);

    // Helper function to set log level from string (useful for env vars/args)
    spdlog::level::level_enum level_from_string(const std::string& level_str);

} // namespace logging
} // namespace core
