#include <mcpbridge/log.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace mcpbridge {

namespace {

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::OFF:   return "OFF";
    }
    return "UNKNOWN";
}

} // namespace

LogLevel parse_log_level(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace") return LogLevel::TRACE;
    if (lowered == "debug") return LogLevel::DEBUG;
    if (lowered == "info") return LogLevel::INFO;
    if (lowered == "warn" || lowered == "warning") return LogLevel::WARN;
    if (lowered == "error") return LogLevel::ERROR;
    if (lowered == "off") return LogLevel::OFF;
    throw std::invalid_argument("Unknown log level: " + name);
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

bool Logger::enabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level != LogLevel::OFF && level >= level_;
}

void Logger::set_log_file(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (file_.is_open()) {
        file_.close();
    }
    if (path.empty()) {
        return;
    }

    file_.open(path, std::ios::app);
    if (!file_.is_open()) {
        std::cerr << "[mcp-bridge] Failed to open log file: " << path << std::endl;
    }
}

void Logger::set_console(bool enable) {
    std::lock_guard<std::mutex> lock(mutex_);
    console_ = enable;
}

void Logger::log(LogLevel level, const std::string& component, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level == LogLevel::OFF || level < level_) {
        return;
    }

    std::string entry = format_entry(level, component, message);
    if (console_) {
        std::cerr << entry << std::endl;
    }
    if (file_.is_open()) {
        file_ << entry << std::endl;
    }
}

std::string Logger::format_entry(LogLevel level, const std::string& component,
                                 const std::string& message) const {
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm local_time{};
    localtime_r(&seconds, &local_time);

    std::ostringstream out;
    out << "[" << std::put_time(&local_time, "%Y-%m-%d %H:%M:%S")
        << "." << std::setfill('0') << std::setw(3) << millis << "] "
        << "[" << level_name(level) << "] "
        << "[" << component << "] " << message;
    return out.str();
}

} // namespace mcpbridge
