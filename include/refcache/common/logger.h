// =============================================================================
// refcache - Logger Module
// =============================================================================
// Low-latency asynchronous logging using the Quill library.
//
// One process-wide logger with a stderr console sink and an optional file
// sink. Standard output is left to command results (JSON, tables).
//
// Usage:
//   refcache::log::init(refcache::log::configFromVerbosity(1, false, "cache.log"));
//   REFCACHE_LOG_INFO("published {} genomes", count);
// =============================================================================

#ifndef REFCACHE_COMMON_LOGGER_H
#define REFCACHE_COMMON_LOGGER_H

#include <string>
#include <string_view>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace refcache::log {

// =============================================================================
// Log Level Enumeration
// =============================================================================

/// @brief Log level enumeration matching Quill's log levels.
enum class Level {
    kTrace = 0,
    kDebug,
    kInfo,
    kWarning,
    kError,
    kCritical
};

// =============================================================================
// Logger Configuration
// =============================================================================

/// @brief Configuration options for logger initialization.
struct Config {
    /// @brief Log file path. Empty string disables file logging.
    std::string logFile;

    /// @brief Minimum log level to output.
    Level level = Level::kInfo;

    /// @brief Enable console output.
    bool enableConsole = true;

    /// @brief Append to an existing log file instead of truncating it.
    /// @note Catalog passes in watch mode share one log across runs.
    bool appendToFile = true;

    /// @brief Logger name for identification.
    std::string loggerName = "refcache";
};

/// @brief Build a logger configuration from CLI verbosity flags.
/// @param verbosity Number of -v flags (0 = info, 1 = debug, 2+ = trace).
/// @param quiet Only errors are logged when set; wins over verbosity.
/// @param logFile Optional log file path.
[[nodiscard]] Config configFromVerbosity(int verbosity, bool quiet, std::string_view logFile);

// =============================================================================
// Logger Initialization and Access
// =============================================================================

/// @brief Initialize the global logger with the specified configuration.
/// @note Called once from main(); later calls are ignored.
void init(const Config& config);

/// @brief Initialize the global logger with default settings.
/// @param logFile Path to log file. Empty string disables file logging.
/// @param level Minimum log level to output.
void init(std::string_view logFile = "", Level level = Level::kInfo);

/// @brief Get the global logger instance.
/// @note Lazily initializes a console logger at info level when init() was
///       never called (library use from tests or collaborators).
[[nodiscard]] quill::Logger* logger();

/// @brief Check if the logger has been initialized.
[[nodiscard]] bool isInitialized() noexcept;

/// @brief Flush all pending log messages.
void flush();

/// @brief Flush and stop the logging backend.
void shutdown();

// =============================================================================
// Level Conversion Utilities
// =============================================================================

/// @brief Convert refcache::log::Level to Quill's LogLevel.
[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

/// @brief Convert string to log level (case-insensitive, defaults to kInfo).
[[nodiscard]] Level levelFromString(std::string_view levelStr) noexcept;

/// @brief Convert log level to string.
[[nodiscard]] std::string_view levelToString(Level level) noexcept;

}  // namespace refcache::log

// =============================================================================
// Convenience Macros
// =============================================================================

#define REFCACHE_LOG_TRACE(fmt, ...) \
    LOG_TRACE_L1(refcache::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define REFCACHE_LOG_DEBUG(fmt, ...) \
    LOG_DEBUG(refcache::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define REFCACHE_LOG_INFO(fmt, ...) \
    LOG_INFO(refcache::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define REFCACHE_LOG_WARNING(fmt, ...) \
    LOG_WARNING(refcache::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define REFCACHE_LOG_ERROR(fmt, ...) \
    LOG_ERROR(refcache::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define REFCACHE_LOG_CRITICAL(fmt, ...) \
    LOG_CRITICAL(refcache::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // REFCACHE_COMMON_LOGGER_H
