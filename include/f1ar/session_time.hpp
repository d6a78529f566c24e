#pragma once
// Session-relative timestamps and their conversion to seconds.

#include <chrono>
#include <cstdint>
#include <string>
#include <variant>

namespace f1ar {

// Duration carried as a structured chrono value.
using StructuredDuration = std::chrono::nanoseconds;

// Duration carried as a bare integer tick count.
struct RawDuration {
    std::int64_t count = 0;
    std::int64_t ticks_per_second = 1000000000;
};

using SessionDuration = std::variant<StructuredDuration, RawDuration>;

// Equal durations reduce to bit-identical seconds whichever alternative holds them.
// Throws std::invalid_argument if a RawDuration has a non-positive tick rate.
double to_seconds(const SessionDuration& duration);

// Parses one SessionTime cell. A bare integer is a RawDuration in nanoseconds;
// "[-]HH:MM:SS[.fffffffff]" or "[-]D days [+]HH:MM:SS[.fffffffff]" is a
// StructuredDuration; a negative day count is offset by the positive clock part.
// Throws std::invalid_argument on malformed text or a value that does not fit
// in int64 nanoseconds.
SessionDuration parse_session_duration(const std::string& text);

} // namespace f1ar
