#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace orb {
namespace domain {

// -----------------------------------------------------------------------------
// SessionConfig: exchange calendar and clock-gate parameters
// -----------------------------------------------------------------------------
// Times of day are minutes after local midnight; local time is UTC shifted
// by utc_offset_minutes (330 for IST).
// -----------------------------------------------------------------------------
struct SessionConfig {
  int utc_offset_minutes{330};
  int market_open_minute{9 * 60 + 15};
  int capture_minutes{5};
  int force_close_minute{15 * 60 + 15};
  int candle_minutes{5};
  std::int64_t timer_interval_ms{2000};
  std::vector<std::string> holidays;   // "YYYY-MM-DD", local calendar
};

}  // namespace domain
}  // namespace orb
