#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace footfall {

/**
 * @brief Log severity levels
 */
enum class LogLevel : int {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    CRITICAL = 5,
    OFF = 6
};

/**
 * @brief Parse a level name ("debug", "warn", ...), case-insensitive
 *
 * Unknown names map to INFO.
 */
LogLevel parse_log_level(const std::string& name);

/**
 * @brief Logger class wrapping spdlog
 *
 * One async logger per component module, all sharing the same sinks:
 * a colour console sink and an optional rotating file sink.
 */
class Logger {
public:
    /**
     * @brief Initialize the logging system
     *
     * Only the first call has an effect.
     *
     * @param log_file Path to log file (empty disables the file sink)
     * @param console_level Minimum level for console output
     * @param file_level Minimum level for file output
     * @return true if initialization successful
     */
    static bool init(const std::string& log_file = "",
                     LogLevel console_level = LogLevel::INFO,
                     LogLevel file_level = LogLevel::DEBUG);

    /**
     * @brief Shutdown the logging system
     *
     * Flushes all pending messages.
     */
    static void shutdown();

    /**
     * @brief Flush all pending log messages
     */
    static void flush();

    /**
     * @brief Get or create a logger for a module
     *
     * Falls back to the spdlog default logger when init() was never
     * called, so components stay usable from unit tests.
     */
    static std::shared_ptr<spdlog::logger> get(const std::string& module);
};

// ============================================================================
// Logging Macros
// ============================================================================

#define FOOTFALL_LOG_TRACE(module, ...) \
    if (auto _log = ::footfall::Logger::get(module)) _log->trace(__VA_ARGS__)

#define FOOTFALL_LOG_DEBUG(module, ...) \
    if (auto _log = ::footfall::Logger::get(module)) _log->debug(__VA_ARGS__)

#define FOOTFALL_LOG_INFO(module, ...) \
    if (auto _log = ::footfall::Logger::get(module)) _log->info(__VA_ARGS__)

#define FOOTFALL_LOG_WARN(module, ...) \
    if (auto _log = ::footfall::Logger::get(module)) _log->warn(__VA_ARGS__)

#define FOOTFALL_LOG_ERROR(module, ...) \
    if (auto _log = ::footfall::Logger::get(module)) _log->error(__VA_ARGS__)

// Shorthand with default module
#define LOG_INFO(...)  FOOTFALL_LOG_INFO("footfall", __VA_ARGS__)
#define LOG_WARN(...)  FOOTFALL_LOG_WARN("footfall", __VA_ARGS__)
#define LOG_ERROR(...) FOOTFALL_LOG_ERROR("footfall", __VA_ARGS__)

}  // namespace footfall
