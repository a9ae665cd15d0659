#pragma once
#include <cstdint>

namespace frontier {

// Simulation clock: milliseconds. The core never reads a wall clock; callers
// pass `now` into every time-dependent operation.
using TimestampMs = std::int64_t;
using DurationMs  = std::int64_t;

inline constexpr DurationMs kSecondMs = 1000;
inline constexpr DurationMs kMinuteMs = 60 * kSecondMs;
inline constexpr DurationMs kHourMs   = 60 * kMinuteMs;
inline constexpr DurationMs kDayMs    = 24 * kHourMs;

} // namespace frontier
