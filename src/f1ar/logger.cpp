#include "f1ar/logger.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace f1ar {

LogLevel Logger::min_level_ = LogLevel::Info;

namespace {

const char* level_label(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
    }
    return "INFO";
}

} // namespace

void Logger::set_min_level(LogLevel level) {
    min_level_ = level;
}

std::ostream& Logger::stream_for(LogLevel level) {
    // Warn and Error go to stderr.
    return level >= LogLevel::Warn ? std::cerr : std::cout;
}

void Logger::log(LogLevel level, const std::string& message) {
    if (level < min_level_) {
        return;
    }

    static std::mutex mutex;
    std::lock_guard<std::mutex> lock(mutex);
    stream_for(level) << "[" << level_label(level) << "] " << message << std::endl;
}

LogLevel parse_log_level(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (lower == "debug") {
        return LogLevel::Debug;
    }
    if (lower == "info") {
        return LogLevel::Info;
    }
    if (lower == "warn" || lower == "warning") {
        return LogLevel::Warn;
    }
    if (lower == "error") {
        return LogLevel::Error;
    }
    throw std::runtime_error("Unknown log level: " + value);
}

} // namespace f1ar
