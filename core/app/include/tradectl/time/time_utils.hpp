#pragma once

#include <cstdint>

namespace tradectl {

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
//
// @brief  Free functions converting between the minute-denominated durations
//         used in configuration and the millisecond timestamps returned by
//         ITimeProvider::now_ms().
//
// Inline because they are one-liners; stateless and safe from any context.
// -----------------------------------------------------------------------------

constexpr std::int64_t kMillisPerMinute = 60 * 1000;
constexpr std::int64_t kMillisPerDay = 24 * 60 * kMillisPerMinute;

// Converts a (possibly fractional) number of minutes to milliseconds.
inline std::int64_t minutes_to_ms(double minutes) {
  return static_cast<std::int64_t>(minutes * static_cast<double>(kMillisPerMinute));
}

// Elapsed time between two epoch-ms timestamps, in minutes.
inline double minutes_between(std::int64_t from_ms, std::int64_t to_ms) {
  return static_cast<double>(to_ms - from_ms) /
         static_cast<double>(kMillisPerMinute);
}

// UTC day number of an epoch-ms timestamp; used to detect day rollover.
inline std::int64_t day_index(std::int64_t epoch_ms) {
  return epoch_ms / kMillisPerDay;
}

}  // namespace tradectl
