#ifndef LOGGER_H
#define LOGGER_H

#include <string>
#include <functional>

// Log level enumeration for conditional logging
enum class LogLevel {
    DEBUG = 0,     // Every message (most verbose)
    INFO = 1,      // Important events
    WARNING = 2,   // Problems only
    ERROR = 3,     // Errors only
    NONE = 4,      // Disable all logging
};

// Tag prepended to every line, e.g. "[liteupload] ..."
void setInstanceTag(const std::string& tag);

void nativeLog(LogLevel level, const std::string& message);

// Route formatted log lines to a callback instead of stderr (CLI, tests).
// Passing nullptr restores stderr output.
void setLogCallback(std::function<void(const std::string&)> callback);

// Default: INFO (skips debug messages)
void set_log_level(LogLevel level);
LogLevel get_log_level();

// Parses "debug" / "info" / "warning" / "error" / "none". Unknown values map to INFO.
LogLevel log_level_from_string(const std::string& name);

// Async logging: messages go to a queue drained by a background thread.
// disable_async_logging() flushes what is left before returning.
void enable_async_logging();
void disable_async_logging();
bool is_async_logging_enabled();

#define LOG_DEBUG(msg) if (get_log_level() <= LogLevel::DEBUG) nativeLog(LogLevel::DEBUG, msg)
#define LOG_INFO(msg)  if (get_log_level() <= LogLevel::INFO) nativeLog(LogLevel::INFO, msg)
#define LOG_WARN(msg)  if (get_log_level() <= LogLevel::WARNING) nativeLog(LogLevel::WARNING, msg)
#define LOG_ERROR(msg) if (get_log_level() <= LogLevel::ERROR) nativeLog(LogLevel::ERROR, msg)

#endif // LOGGER_H
