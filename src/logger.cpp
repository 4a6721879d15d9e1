#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace webblock {

// Initialize static member
LogLevel Logger::current_level_ = LogLevel::Info;

void Logger::setLevel(LogLevel level) {
    current_level_ = level;
}

LogLevel Logger::getLevel() {
    return current_level_;
}

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

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Error:
            return "error";
        case LogLevel::Warning:
            return "warning";
        case LogLevel::Info:
            return "info";
        case LogLevel::Debug:
            return "debug";
        case LogLevel::None:
            return "none";
        default:
            return "unknown";
    }
}

LogLevel Logger::levelFromString(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "none") return LogLevel::None;
    if (lower == "error") return LogLevel::Error;
    if (lower == "warning" || lower == "warn") return LogLevel::Warning;
    if (lower == "info") return LogLevel::Info;
    if (lower == "debug") return LogLevel::Debug;

    throw std::invalid_argument("Unknown log level: " + name);
}

} // namespace webblock
