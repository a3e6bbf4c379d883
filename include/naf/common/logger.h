// =============================================================================
// naf-codec - Logger Module
// =============================================================================
// Asynchronous logging using the Quill library.
//
// The library never initializes logging on its own: until the embedding
// application calls init(), logger() returns nullptr and the NAF_LOG_*
// macros are no-ops. This keeps the adapter usable inside a host runtime
// that owns stderr.
//
// Usage:
//   naf::log::init("naf.log", naf::log::Level::kDebug);
//   NAF_LOG_DEBUG("opened source: {}", path);
// =============================================================================

#ifndef NAF_COMMON_LOGGER_H
#define NAF_COMMON_LOGGER_H

#include <string>
#include <string_view>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace naf::log {

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
    Level level = Level::kWarning;

    /// @brief Enable console (stderr) output.
    bool enableConsole = true;

    /// @brief Logger name for identification.
    std::string loggerName = "naf";
};

// =============================================================================
// Logger Initialization and Access
// =============================================================================

/// @brief Initialize the global logger with the specified configuration.
/// @note Subsequent calls are ignored until shutdown().
void init(const Config& config);

/// @brief Initialize the global logger with a log file and level.
void init(std::string_view logFile = "", Level level = Level::kWarning);

/// @brief Get the global logger instance.
/// @return Pointer to the global Quill logger, nullptr before init().
[[nodiscard]] quill::Logger* logger() noexcept;

/// @brief Check if the logger has been initialized.
[[nodiscard]] bool isInitialized() noexcept;

/// @brief Flush all pending log messages.
void flush();

/// @brief Flush and stop the logging backend.
void shutdown();

// =============================================================================
// Level Conversion Utilities
// =============================================================================

/// @brief Convert naf::log::Level to Quill's LogLevel.
[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

/// @brief Convert string to log level (case-insensitive).
/// @return Corresponding log level, kWarning for unknown strings.
[[nodiscard]] Level levelFromString(std::string_view levelStr) noexcept;

/// @brief Convert log level to string.
[[nodiscard]] std::string_view levelToString(Level level) noexcept;

}  // namespace naf::log

// =============================================================================
// Convenience Macros
// =============================================================================
// The logger pointer is checked first so that library code can log
// unconditionally whether or not the application set up logging.

#define NAF_LOG_IMPL(macro, fmt, ...)                                  \
    do {                                                               \
        if (quill::Logger* nafLogger_ = naf::log::logger()) {          \
            macro(nafLogger_, fmt __VA_OPT__(, ) __VA_ARGS__);         \
        }                                                              \
    } while (false)

/// @brief Log a trace message.
#define NAF_LOG_TRACE(fmt, ...) NAF_LOG_IMPL(LOG_TRACE_L1, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a debug message.
#define NAF_LOG_DEBUG(fmt, ...) NAF_LOG_IMPL(LOG_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an info message.
#define NAF_LOG_INFO(fmt, ...) NAF_LOG_IMPL(LOG_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a warning message.
#define NAF_LOG_WARNING(fmt, ...) NAF_LOG_IMPL(LOG_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an error message.
#define NAF_LOG_ERROR(fmt, ...) NAF_LOG_IMPL(LOG_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // NAF_COMMON_LOGGER_H
