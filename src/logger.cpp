#include "logger.hpp"
#include <iostream>
#include <sstream>
#include <chrono>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include <ctime>
#include <stdexcept>

namespace portguard {

// Initialize static member
LogLevel Logger::current_level_ = LogLevel::Info;

void Logger::log(LogLevel level, const std::string& component, const std::string& message) {
    if (level == LogLevel::None || level > current_level_) {
        return;
    }

    // Get current timestamp
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);

    std::ostringstream timestamp;
    timestamp << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
    timestamp << '.' << std::setfill('0') << std::setw(3) << ms.count();

    // Level prefix
    std::string level_str;
    std::ostream* output_stream = &std::cout;

    switch (level) {
        case LogLevel::Error:
            level_str = "ERROR";
            output_stream = &std::cerr;
            break;
        case LogLevel::Warning:
            level_str = "WARN ";
            output_stream = &std::cerr;
            break;
        case LogLevel::Info:
            level_str = "INFO ";
            break;
        case LogLevel::Debug:
            level_str = "DEBUG";
            break;
        case LogLevel::None:
            return;
    }

    *output_stream << "[" << timestamp.str() << "] [" << level_str << "] " << component << ": "
                   << message << std::endl;
}

void Logger::error(const std::string& component, const std::string& message) {
    log(LogLevel::Error, component, message);
}

void Logger::warning(const std::string& component, const std::string& message) {
    log(LogLevel::Warning, component, message);
}

void Logger::info(const std::string& component, const std::string& message) {
    log(LogLevel::Info, component, message);
}

void Logger::debug(const std::string& component, const std::string& message) {
    log(LogLevel::Debug, component, message);
}

void Logger::setLevel(LogLevel level) {
    LogLevel old_level = current_level_;
    current_level_ = level;

    log(LogLevel::Debug, "Logger", "Log level changed from " + levelToString(old_level) +
                                   " to " + levelToString(level));
}

LogLevel Logger::getLevel() {
    return current_level_;
}

LogLevel Logger::parseLevel(const std::string& name) {
    std::string value = name;
    std::transform(value.begin(), value.end(), value.begin(), ::tolower);

    if (value == "none") return LogLevel::None;
    if (value == "error") return LogLevel::Error;
    if (value == "warning" || value == "warn") return LogLevel::Warning;
    if (value == "info") return LogLevel::Info;
    if (value == "debug") return LogLevel::Debug;

    throw std::invalid_argument("Unknown log level: " + name);
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Error:
            return "ERROR";
        case LogLevel::Warning:
            return "WARNING";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::None:
            return "NONE";
        default:
            return "UNKNOWN";
    }
}

} // namespace portguard
