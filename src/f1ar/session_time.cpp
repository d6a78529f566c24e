#include "f1ar/session_time.hpp"

#include <cctype>
#include <limits>
#include <stdexcept>

namespace f1ar {
namespace {

constexpr std::int64_t kNanosPerSecond = 1000000000;

std::string trim(const std::string& value) {
    const auto start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

bool is_integer_text(const std::string& value) {
    if (value.empty()) {
        return false;
    }
    std::size_t i = (value[0] == '-' || value[0] == '+') ? 1 : 0;
    if (i == value.size()) {
        return false;
    }
    for (; i < value.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(value[i]))) {
            return false;
        }
    }
    return true;
}

// Largest whole-second magnitude whose nanosecond count, plus a fraction, fits in int64.
constexpr std::int64_t kMaxSeconds = std::numeric_limits<std::int64_t>::max() / kNanosPerSecond - 1;

std::int64_t to_int64(const std::string& value, const std::string& original) {
    try {
        return std::stoll(value);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("Session time out of range: " + original);
    }
}

std::int64_t parse_digits(const std::string& value, const std::string& original) {
    if (value.empty()) {
        throw std::invalid_argument("Malformed session time: " + original);
    }
    for (const char ch : value) {
        if (!std::isdigit(static_cast<unsigned char>(ch))) {
            throw std::invalid_argument("Malformed session time: " + original);
        }
    }
    return to_int64(value, original);
}

// total * factor + value for non-negative operands, bounded by kMaxSeconds.
std::int64_t accumulate_seconds(std::int64_t total,
                                std::int64_t factor,
                                std::int64_t value,
                                const std::string& original) {
    if (value > kMaxSeconds || total > (kMaxSeconds - value) / factor) {
        throw std::invalid_argument("Session time out of range: " + original);
    }
    return total * factor + value;
}

// "[-]HH:MM:SS[.f]" as non-negative nanoseconds; the sign is left to the caller.
std::int64_t parse_clock_nanos(const std::string& clock, const std::string& text) {
    const auto first_colon = clock.find(':');
    const auto second_colon =
        first_colon == std::string::npos ? std::string::npos : clock.find(':', first_colon + 1);
    if (second_colon == std::string::npos) {
        throw std::invalid_argument("Malformed session time: " + text);
    }

    const std::int64_t hours = parse_digits(clock.substr(0, first_colon), text);
    const std::int64_t minutes =
        parse_digits(clock.substr(first_colon + 1, second_colon - first_colon - 1), text);

    std::string seconds_text = clock.substr(second_colon + 1);
    std::string fraction_text;
    const auto dot = seconds_text.find('.');
    if (dot != std::string::npos) {
        fraction_text = seconds_text.substr(dot + 1);
        seconds_text = seconds_text.substr(0, dot);
    }
    const std::int64_t seconds = parse_digits(seconds_text, text);

    std::int64_t fraction_nanos = 0;
    if (!fraction_text.empty()) {
        if (fraction_text.size() > 9) {
            fraction_text = fraction_text.substr(0, 9);
        }
        fraction_text.append(9 - fraction_text.size(), '0');
        fraction_nanos = parse_digits(fraction_text, text);
    }

    std::int64_t total_seconds = accumulate_seconds(hours, 60, minutes, text);
    total_seconds = accumulate_seconds(total_seconds, 60, seconds, text);
    return total_seconds * kNanosPerSecond + fraction_nanos;
}

// Accepts "[-]HH:MM:SS[.f]" and "[-]D days [+]HH:MM:SS[.f]". With a day part the
// sign belongs to the days only and the clock part is added, so
// "-1 days +23:59:59.5" is -0.5 s.
StructuredDuration parse_clock_text(const std::string& text) {
    const auto days_pos = text.find("day");
    if (days_pos == std::string::npos) {
        std::string clock = text;
        bool negative = false;
        if (!clock.empty() && clock[0] == '-') {
            negative = true;
            clock = trim(clock.substr(1));
        }
        const std::int64_t nanos = parse_clock_nanos(clock, text);
        return StructuredDuration(negative ? -nanos : nanos);
    }

    std::string days_text = trim(text.substr(0, days_pos));
    bool negative_days = false;
    if (!days_text.empty() && days_text[0] == '-') {
        negative_days = true;
        days_text = trim(days_text.substr(1));
    }
    const std::int64_t day_seconds = accumulate_seconds(parse_digits(days_text, text), 86400, 0, text);

    const auto after = text.find_first_of(' ', days_pos);
    std::string clock = (after == std::string::npos) ? "" : trim(text.substr(after));
    if (!clock.empty() && clock[0] == '+') {
        clock = trim(clock.substr(1));
    }
    const std::int64_t clock_nanos = parse_clock_nanos(clock, text);

    // Both parts are within kMaxSeconds, so the signed sum cannot overflow.
    const std::int64_t clock_seconds = clock_nanos / kNanosPerSecond;
    const std::int64_t total_seconds = (negative_days ? -day_seconds : day_seconds) + clock_seconds;
    if (total_seconds > kMaxSeconds || total_seconds < -kMaxSeconds) {
        throw std::invalid_argument("Session time out of range: " + text);
    }
    return StructuredDuration(total_seconds * kNanosPerSecond + clock_nanos % kNanosPerSecond);
}

} // namespace

double to_seconds(const SessionDuration& duration) {
    std::int64_t count = 0;
    std::int64_t ticks_per_second = kNanosPerSecond;

    if (const auto* structured = std::get_if<StructuredDuration>(&duration)) {
        count = structured->count();
    } else {
        const auto& raw = std::get<RawDuration>(duration);
        if (raw.ticks_per_second <= 0) {
            throw std::invalid_argument("RawDuration tick rate must be positive.");
        }
        count = raw.count;
        ticks_per_second = raw.ticks_per_second;
    }

    return static_cast<double>(count) / static_cast<double>(ticks_per_second);
}

SessionDuration parse_session_duration(const std::string& text) {
    const auto trimmed = trim(text);
    if (trimmed.empty()) {
        throw std::invalid_argument("Empty session time.");
    }
    if (is_integer_text(trimmed)) {
        return RawDuration{to_int64(trimmed, text), kNanosPerSecond};
    }
    return parse_clock_text(trimmed);
}

} // namespace f1ar
