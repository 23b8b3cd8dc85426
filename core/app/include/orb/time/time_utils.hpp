#pragma once

#include "orb/events/event_types.hpp"

#include <chrono>
#include <cstdint>

namespace orb {

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
//
// @brief  Bridges the event Timestamp (system_clock::time_point) and the
//         int64_t epoch milliseconds used by the decision core.
//
// @details
// Events carry a Timestamp so subscribers can format or order them with
// <chrono>; the clock gate, capture window and exit triggers compare plain
// millisecond integers. Everything here is a stateless inline conversion.
// -----------------------------------------------------------------------------

constexpr std::int64_t kMsPerSecond = 1000;
constexpr std::int64_t kMsPerMinute = 60 * kMsPerSecond;
constexpr std::int64_t kMsPerDay = 24 * 60 * kMsPerMinute;

inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

inline std::int64_t minutes_to_ms(double minutes) {
  return static_cast<std::int64_t>(minutes * static_cast<double>(kMsPerMinute));
}

// Elapsed minutes between two epoch-ms instants (fractional).
inline double elapsed_minutes(std::int64_t from_ms, std::int64_t to_ms) {
  return static_cast<double>(to_ms - from_ms) /
         static_cast<double>(kMsPerMinute);
}

}  // namespace orb
