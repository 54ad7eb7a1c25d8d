#pragma once

#include <string>
#include <mutex>
#include <sstream>

namespace neurax {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

// Process-wide logger. Lines look like:
//   [2026-10-19 18:11:02] INFO [Session] abc123: channel open
// Warnings and errors go to stderr, everything else to stdout.
class Logger {
public:
    static Logger& instance() {
        static Logger instance;
        return instance;
    }

    void log(LogLevel level, const std::string& component, const std::string& message);

    void set_level(LogLevel level);
    LogLevel level() const;

    // Parse "debug", "info", "warning"/"warn", "error"; false if unknown
    static bool parse_level(const std::string& text, LogLevel& out);

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static const char* level_name(LogLevel level);

    mutable std::mutex mutex_;
    LogLevel level_ = LogLevel::INFO;
};

// Stream-style helper so call sites read like the rest of the codebase:
//   LOG_INFO("Relay") << "connected to " << endpoint;
class LogLine {
public:
    LogLine(LogLevel level, const char* component)
        : level_(level), component_(component) {}
    ~LogLine() { Logger::instance().log(level_, component_, stream_.str()); }

    template <typename T>
    LogLine& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

private:
    LogLevel level_;
    const char* component_;
    std::ostringstream stream_;
};

} // namespace neurax

#define NEURAX_LOG(level, component) ::neurax::LogLine(level, component)
#define LOG_DEBUG(component) NEURAX_LOG(::neurax::LogLevel::DEBUG, component)
#define LOG_INFO(component) NEURAX_LOG(::neurax::LogLevel::INFO, component)
#define LOG_WARN(component) NEURAX_LOG(::neurax::LogLevel::WARNING, component)
#define LOG_ERROR(component) NEURAX_LOG(::neurax::LogLevel::ERROR, component)
