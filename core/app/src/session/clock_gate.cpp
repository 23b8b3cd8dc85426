#include "orb/session/clock_gate.hpp"

#include "orb/time/time_utils.hpp"

#include <algorithm>
#include <cstdio>
#include <utility>

namespace orb {

namespace {

std::int64_t floorDiv(std::int64_t a, std::int64_t b) {
  std::int64_t q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) {
    --q;
  }
  return q;
}

std::int64_t localDayIndex(const domain::SessionConfig& config,
                           std::int64_t ms) {
  const std::int64_t local_ms =
      ms + static_cast<std::int64_t>(config.utc_offset_minutes) * kMsPerMinute;
  return floorDiv(local_ms, kMsPerDay);
}

// Days since 1970-01-01 to proleptic Gregorian year/month/day
// (H. Hinnant's civil_from_days).
void civilFromDays(std::int64_t z, int& year, unsigned& month, unsigned& day) {
  z += 719468;
  const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const auto doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const std::int64_t y = static_cast<std::int64_t>(yoe) + era * 400;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  day = doy - (153 * mp + 2) / 5 + 1;
  month = mp < 10 ? mp + 3 : mp - 9;
  year = static_cast<int>(y + (month <= 2 ? 1 : 0));
}

}  // namespace

ClockGate::ClockGate(domain::SessionConfig config,
                     std::int64_t session_open_ms)
    : config_(std::move(config)),
      session_open_ms_(session_open_ms),
      capture_end_ms_(session_open_ms +
                      static_cast<std::int64_t>(config_.capture_minutes) *
                          kMsPerMinute),
      force_close_ms_(session_open_ms +
                      static_cast<std::int64_t>(config_.force_close_minute -
                                                config_.market_open_minute) *
                          kMsPerMinute) {}

bool ClockGate::isCaptureWindowClosed(std::int64_t now_ms) const {
  return now_ms >= capture_end_ms_;
}

bool ClockGate::isSessionForceClose(std::int64_t now_ms) const {
  return now_ms >= force_close_ms_;
}

bool ClockGate::isTradingDay(std::int64_t now_ms) const {
  const int weekday = localWeekday(config_, now_ms);
  if (weekday == 0 || weekday == 6) {
    return false;
  }
  const std::string date = localDate(config_, now_ms);
  return std::find(config_.holidays.begin(), config_.holidays.end(), date) ==
         config_.holidays.end();
}

std::int64_t ClockGate::sessionOpenFor(const domain::SessionConfig& config,
                                       std::int64_t any_ms_in_day) {
  const std::int64_t local_midnight =
      localDayIndex(config, any_ms_in_day) * kMsPerDay;
  const std::int64_t open_local =
      local_midnight +
      static_cast<std::int64_t>(config.market_open_minute) * kMsPerMinute;
  return open_local -
         static_cast<std::int64_t>(config.utc_offset_minutes) * kMsPerMinute;
}

std::string ClockGate::localDate(const domain::SessionConfig& config,
                                 std::int64_t ms) {
  int year = 0;
  unsigned month = 0;
  unsigned day = 0;
  civilFromDays(localDayIndex(config, ms), year, month, day);

  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", year, month, day);
  return std::string(buf);
}

int ClockGate::localWeekday(const domain::SessionConfig& config,
                            std::int64_t ms) {
  // 1970-01-01 was a Thursday.
  const std::int64_t days = localDayIndex(config, ms);
  const std::int64_t wd = (days + 4) % 7;
  return static_cast<int>(wd < 0 ? wd + 7 : wd);
}

}  // namespace orb
