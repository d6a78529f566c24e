#pragma once
// Pipeline logging: progress to stdout, warnings and errors to stderr.

#include <iosfwd>
#include <string>

namespace f1ar {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

class Logger {
public:
    static void log(LogLevel level, const std::string& message);
    static void set_min_level(LogLevel level);

private:
    static std::ostream& stream_for(LogLevel level);

    static LogLevel min_level_;
};

// Accepts debug, info, warn or error in any case.
// Throws std::runtime_error for anything else.
LogLevel parse_log_level(const std::string& value);

} // namespace f1ar
