#pragma once

#include "orb/domain/session_config.hpp"

#include <cstdint>
#include <string>

namespace orb {

// -----------------------------------------------------------------------------
// ClockGate
// -----------------------------------------------------------------------------
//
// @brief  Answers the session's time questions: has the opening-range capture
//         window closed, has the hard force-close time been reached, and is
//         a given instant on a trading day at all.
//
// @details
// A ClockGate is immutable: it holds the SessionConfig and the epoch-ms
// instant the session opened, and every query is a pure function of the
// `now_ms` passed in. It never reads a clock itself; callers pass the value
// of their injected ITimeProvider, which is what makes the gate testable
// with a simulated clock.
//
// Local calendar arithmetic (weekday, "YYYY-MM-DD" holidays, "HH:MM" times)
// uses the fixed SessionConfig::utc_offset_minutes. Exchanges served by this
// engine do not observe daylight saving.
//
// Thread model:
//   Shared by const reference between the worker threads; safe because it
//   has no mutable state.
// -----------------------------------------------------------------------------
class ClockGate {
 public:
  ClockGate(domain::SessionConfig config, std::int64_t session_open_ms);

  // True once capture_minutes have elapsed since the session open.
  bool isCaptureWindowClosed(std::int64_t now_ms) const;

  // True at or after the configured force-close time of the session day.
  bool isSessionForceClose(std::int64_t now_ms) const;

  // False on Saturdays, Sundays and configured holidays (local calendar).
  bool isTradingDay(std::int64_t now_ms) const;

  std::int64_t sessionOpenMs() const { return session_open_ms_; }
  std::int64_t captureEndMs() const { return capture_end_ms_; }
  std::int64_t forceCloseMs() const { return force_close_ms_; }
  const domain::SessionConfig& config() const { return config_; }

  // -------------------------------------------------------------------------
  // sessionOpenFor()
  // -------------------------------------------------------------------------
  // @brief  Epoch ms of market_open on the local calendar day containing
  //         `any_ms_in_day`.
  //
  // @details
  // Used by main() and the replay driver to derive the session-open instant
  // from the first tick or from the wall clock.
  // -------------------------------------------------------------------------
  static std::int64_t sessionOpenFor(const domain::SessionConfig& config,
                                     std::int64_t any_ms_in_day);

  // Local calendar date of `ms` as "YYYY-MM-DD".
  static std::string localDate(const domain::SessionConfig& config,
                               std::int64_t ms);

  // 0 = Sunday ... 6 = Saturday, local calendar.
  static int localWeekday(const domain::SessionConfig& config,
                          std::int64_t ms);

 private:
  domain::SessionConfig config_;
  std::int64_t session_open_ms_;
  std::int64_t capture_end_ms_;
  std::int64_t force_close_ms_;
};

}  // namespace orb
