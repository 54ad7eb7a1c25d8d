#include "logger.h"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <algorithm>
#include <cctype>

namespace neurax {

const char* Logger::level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "INFO";
}

void Logger::log(LogLevel level, const std::string& component, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < level_) {
        return;
    }

    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf{};
    localtime_r(&now, &tm_buf);

    std::ostream& out = (level >= LogLevel::WARNING) ? std::cerr : std::cout;
    out << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << "] "
        << level_name(level) << " [" << component << "] " << message << std::endl;
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

bool Logger::parse_level(const std::string& text, LogLevel& out) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "debug") {
        out = LogLevel::DEBUG;
    } else if (lower == "info") {
        out = LogLevel::INFO;
    } else if (lower == "warning" || lower == "warn") {
        out = LogLevel::WARNING;
    } else if (lower == "error") {
        out = LogLevel::ERROR;
    } else {
        return false;
    }
    return true;
}

} // namespace neurax
