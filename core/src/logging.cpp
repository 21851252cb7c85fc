#include "logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <vector>
#include <memory>
#include <iostream>
#include <cstdlib>
#include <chrono>       // For timestamp in filename
#include <sstream>      // For formatting filename
#include <iomanip>      // For std::put_time
#include <filesystem>   // For creating directory (C++17)
#include <algorithm>    // For std::min, std::transform
#include <cctype>       // For std::tolower

namespace core {
namespace logging {

    static std::shared_ptr<spdlog::logger> global_logger;

    namespace {

        // Returns the directory actually usable for log files ("." on failure)
        std::string ensureDirectory(const std::string& log_dir) {
            try {
                if (!std::filesystem::exists(log_dir)) {
                    std::filesystem::create_directories(log_dir);
                    std::cout << "[Logging] Created log directory: " << log_dir << std::endl;
                }
                return log_dir;
            } catch (const std::filesystem::filesystem_error& fs_err) {
                std::cerr << "[Logging] Error creating log directory '" << log_dir << "': " << fs_err.what() << std::endl;
                return ".";
            }
        }

        std::string timestampedFileName(const std::string& base_name) {
            auto now = std::chrono::system_clock::now();
            auto itt = std::chrono::system_clock::to_time_t(now);
            std::tm utc_tm;
            gmtime_r(&itt, &utc_tm);

            std::ostringstream filename_oss;
            filename_oss << base_name << "_" << std::put_time(&utc_tm, "%Y%m%d_%H%M%SZ") << ".log";
            return filename_oss.str();
        }

    } // end anonymous namespace

    void initialize(const LoggingOptions& requested)
    {
        LoggingOptions options = requested;

        // --- Check Environment Variable for Override ---
        const char* env_level_cstr = std::getenv("SPDLOG_LEVEL");
        if (env_level_cstr) {
            std::string env_level_str(env_level_cstr);
            spdlog::level::level_enum env_level = level_from_string(env_level_str);
            options.console_level = env_level;
            options.file_level = env_level;
            std::cout << "[Logging] Overriding log level from SPDLOG_LEVEL environment variable to: "
                      << env_level_str << std::endl;
        }

        // --- UTC Log Pattern ---
        const std::string utc_pattern = "[%Y-%m-%d %H:%M:%S.%e%z] [%^%l%$] [%n] %v";

        std::vector<spdlog::sink_ptr> sinks;
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(options.console_level);
        console_sink->set_pattern(utc_pattern);
        sinks.push_back(console_sink);

        spdlog::level::level_enum effective_level = options.console_level;
        if (options.file_enabled) {
            try {
                std::string log_dir = ensureDirectory(options.directory);
                std::string log_file_path = log_dir + "/" + timestampedFileName(options.base_file_name);
                std::cout << "[Logging] Log file path: " << log_file_path << std::endl;

                auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    log_file_path, options.max_file_bytes, options.max_files, true);
                file_sink->set_level(options.file_level);
                file_sink->set_pattern(utc_pattern);
                sinks.push_back(file_sink);
                effective_level = std::min(options.console_level, options.file_level);
            } catch (const spdlog::spdlog_ex& ex) {
                // Console logging still works; the bot must not refuse to start over a log file
                std::cerr << "[Logging] File sink disabled: " << ex.what() << std::endl;
            }
        }

        // --- Create Logger ---
        if (global_logger) {
            spdlog::drop(global_logger->name());
        }
        global_logger = std::make_shared<spdlog::logger>("sentinel", sinks.begin(), sinks.end());
        global_logger->set_level(effective_level);
        spdlog::register_logger(global_logger);
        spdlog::set_default_logger(global_logger);
        spdlog::flush_on(spdlog::level::err);

        #ifdef NDEBUG
            const char* build_type_str = "Release";
        #else
            const char* build_type_str = "Debug";
        #endif

        getLogger()->info("Logging initialized (Build Type: {}). Console: {}, File: {} (UTC)",
                          build_type_str,
                          spdlog::level::to_string_view(options.console_level),
                          options.file_enabled ? spdlog::level::to_string_view(options.file_level)
                                               : spdlog::string_view_t("disabled"));
    }

    std::shared_ptr<spdlog::logger>& getLogger() {
        if (!global_logger) {
             throw std::runtime_error("Logger accessed before initialization. Call core::logging::initialize() first.");
        }
        return global_logger;
    }

    std::shared_ptr<spdlog::logger> createDailyLogger(const std::string& logger_name,
                                                      const std::string& directory,
                                                      const std::string& base_file_name)
    {
        if (auto existing = spdlog::get(logger_name)) {
            return existing;
        }
        std::string log_dir = ensureDirectory(directory);
        // daily_file_sink appends _YYYY-MM-DD before the extension
        auto daily_sink = std::make_shared<spdlog::sinks::daily_file_sink_mt>(
            log_dir + "/" + base_file_name + ".log", 0, 0);
        auto daily_logger = std::make_shared<spdlog::logger>(logger_name, daily_sink);
        daily_logger->set_pattern("%v");
        daily_logger->set_level(spdlog::level::info);
        daily_logger->flush_on(spdlog::level::info);
        spdlog::register_logger(daily_logger);
        return daily_logger;
    }

    spdlog::level::level_enum level_from_string(const std::string& level_str) {
        std::string lower_str = level_str;
        std::transform(lower_str.begin(), lower_str.end(), lower_str.begin(),
            [](unsigned char c){ return std::tolower(c); });
        if (lower_str == "trace") return spdlog::level::trace;
        if (lower_str == "debug") return spdlog::level::debug;
        if (lower_str == "info") return spdlog::level::info;
        if (lower_str == "warn" || lower_str == "warning") return spdlog::level::warn;
        if (lower_str == "error" || lower_str == "err") return spdlog::level::err;
        if (lower_str == "critical" || lower_str == "crit") return spdlog::level::critical;
        if (lower_str == "off") return spdlog::level::off;
        std::cerr << "[Logging] Unrecognized log level string: '" << level_str << "'. Defaulting to 'info'." << std::endl;
        return spdlog::level::info;
    }

} // namespace logging
} // namespace core
