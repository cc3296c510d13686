// =============================================================================
// pzkit - Logger Module
// =============================================================================
// Low-latency asynchronous logging using Quill library.
//
// This module provides a global logger instance with support for:
// - Multiple log levels (trace, debug, info, warning, error, critical)
// - Console and file output
// - Thread-safe logging (Quill is inherently thread-safe)
//
// Library code logs through the PZK_LOG_* macros, which are no-ops until
// init() has been called by the embedding application.
//
// Usage:
//   pzk::log::Config config;
//   config.logFile = "pzk.log";
//   pzk::log::init(config);
//   PZK_LOG_INFO("Message with {} args", 42);
// =============================================================================

#ifndef PZK_COMMON_LOGGER_H
#define PZK_COMMON_LOGGER_H

#include <string>
#include <string_view>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace pzk::log {

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

    /// @brief Enable console (stdout) output.
    bool enableConsole = true;

    /// @brief Logger name for identification.
    std::string loggerName = "pzk";
};

// =============================================================================
// Logger Initialization and Access
// =============================================================================

/// @brief Initialize the global logger with the specified configuration.
/// @note Call once at application startup; repeated calls are ignored.
void init(const Config& config);

/// @brief Get the global logger instance.
/// @return Pointer to the global Quill logger, nullptr before init().
[[nodiscard]] quill::Logger* logger() noexcept;

/// @brief Check if the logger has been initialized.
[[nodiscard]] bool isInitialized() noexcept;

/// @brief Whether initialized logging writes to the console.
[[nodiscard]] bool consoleEnabled() noexcept;

/// @brief Flush all pending log messages.
/// @note Blocks until all messages are written.
void flush();

/// @brief Shutdown the logging system.
/// @note Flushes all pending messages and stops the backend thread.
void shutdown();

// =============================================================================
// Level Conversion Utilities
// =============================================================================

/// @brief Convert pzk::log::Level to Quill's LogLevel.
[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

/// @brief Convert string to log level.
/// @param levelStr String representation (case-insensitive).
/// @return Corresponding log level, defaults to kInfo for unknown strings.
[[nodiscard]] Level levelFromString(std::string_view levelStr) noexcept;

/// @brief Convert log level to string.
[[nodiscard]] std::string_view levelToString(Level level) noexcept;

}  // namespace pzk::log

// =============================================================================
// Convenience Macros
// =============================================================================
// These macros forward to Quill with automatic source location information
// and skip the call entirely while no logger is installed.

#define PZK_LOG_IMPL(quillMacro, fmt, ...)                                   \
    do {                                                                     \
        if (quill::Logger* pzkLogger = pzk::log::logger(); pzkLogger) {      \
            quillMacro(pzkLogger, fmt __VA_OPT__(, ) __VA_ARGS__);           \
        }                                                                    \
    } while (false)

/// @brief Log a trace message.
#define PZK_LOG_TRACE(fmt, ...) PZK_LOG_IMPL(LOG_TRACE_L1, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a debug message.
#define PZK_LOG_DEBUG(fmt, ...) PZK_LOG_IMPL(LOG_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an info message.
#define PZK_LOG_INFO(fmt, ...) PZK_LOG_IMPL(LOG_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a warning message.
#define PZK_LOG_WARNING(fmt, ...) PZK_LOG_IMPL(LOG_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an error message.
#define PZK_LOG_ERROR(fmt, ...) PZK_LOG_IMPL(LOG_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a critical message.
#define PZK_LOG_CRITICAL(fmt, ...) PZK_LOG_IMPL(LOG_CRITICAL, fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // PZK_COMMON_LOGGER_H
