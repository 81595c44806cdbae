#pragma once

#include <cstdint>
#include <fstream>
#include <mutex>
#include <sstream>
#include <string>

namespace mcpbridge {

enum class LogLevel : uint8_t {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    OFF = 5
};

// Parses "trace", "debug", "info", "warn", "error" or "off" (case-insensitive).
// Throws std::invalid_argument for anything else.
LogLevel parse_log_level(const std::string& name);

// Process-wide logger. Lines go to stderr and, when configured, are appended
// to a log file.
class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    LogLevel level() const;
    bool enabled(LogLevel level) const;

    // Empty path stops file logging
    void set_log_file(const std::string& path);
    void set_console(bool enable);

    void log(LogLevel level, const std::string& component, const std::string& message);

private:
    Logger() = default;

    std::string format_entry(LogLevel level, const std::string& component, const std::string& message) const;

    mutable std::mutex mutex_;
    LogLevel level_ = LogLevel::INFO;
    bool console_ = true;
    std::ofstream file_;
};

} // namespace mcpbridge

#define MCPBRIDGE_LOG(level, component, expr)                                         \
    do {                                                                              \
        if (::mcpbridge::Logger::instance().enabled(level)) {                         \
            std::ostringstream mcpbridge_log_stream_;                                 \
            mcpbridge_log_stream_ << expr;                                            \
            ::mcpbridge::Logger::instance().log(level, component, mcpbridge_log_stream_.str()); \
        }                                                                             \
    } while (0)

#define MCPBRIDGE_LOG_TRACE(component, expr) MCPBRIDGE_LOG(::mcpbridge::LogLevel::TRACE, component, expr)
#define MCPBRIDGE_LOG_DEBUG(component, expr) MCPBRIDGE_LOG(::mcpbridge::LogLevel::DEBUG, component, expr)
#define MCPBRIDGE_LOG_INFO(component, expr)  MCPBRIDGE_LOG(::mcpbridge::LogLevel::INFO, component, expr)
#define MCPBRIDGE_LOG_WARN(component, expr)  MCPBRIDGE_LOG(::mcpbridge::LogLevel::WARN, component, expr)
#define MCPBRIDGE_LOG_ERROR(component, expr) MCPBRIDGE_LOG(::mcpbridge::LogLevel::ERROR, component, expr)
