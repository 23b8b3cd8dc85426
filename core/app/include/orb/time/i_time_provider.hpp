#pragma once

#include <cstdint>

namespace orb {

// -----------------------------------------------------------------------------
// ITimeProvider: injectable session clock
// -----------------------------------------------------------------------------
//
// @brief  Abstract source of "now" for every time-gated component (clock
//         gate, candle capture, holding-period and ladder triggers, the
//         periodic timer).
//
// @details
// No component in the decision core reads std::chrono::system_clock
// directly. Live runs inject LiveTimeProvider; replays and tests inject
// SimulationTimeProvider and move time forward explicitly, so a 120-minute
// holding period is exercised without waiting 120 minutes.
//
// Time is int64_t epoch milliseconds because every tick carries that
// representation on the wire.
//
// Thread-safety contract:
//   Implementations must tolerate concurrent now_ms() calls from every
//   instrument worker plus the timer thread.
//
// Ownership:
//   Borrowed by const reference. The provider must outlive its readers.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Current time as milliseconds since the Unix epoch (UTC).
  //
  // @return 0 for a simulation clock that has not been advanced yet.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace orb
