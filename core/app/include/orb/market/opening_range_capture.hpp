#pragma once

#include "orb/domain/candle.hpp"
#include "orb/session/clock_gate.hpp"

#include <cstdint>
#include <string>

namespace orb {

// -----------------------------------------------------------------------------
// OpeningRangeCapture
// -----------------------------------------------------------------------------
//
// @brief  Builds the one opening candle of an instrument's session from its
//         first capture_minutes of ticks, then freezes it.
//
// @details
// Lifecycle: Capturing -> Captured (or Failed). Both end states are inert;
// further ticks are ignored.
//
//   - Ticks stamped before the session open are ignored.
//   - While the gate reports the window open, a tick updates open (first
//     tick only), high, low, close and cumulative volume.
//   - The first tick stamped at or after the window end freezes the candle
//     and is NOT part of it. onTick() returns true for that tick so the
//     caller can hand it straight on to the breakout logic.
//   - onClock() freezes on a timer tick once the window has closed, so a
//     quiet instrument still finishes its capture.
//   - freezeNow() is the explicit close trigger and ignores the gate.
//
// Freezing with zero ticks received moves to Failed and throws
// InsufficientDataError; the caller disables the instrument for the session.
//
// Thread model: single writer, the instrument's worker thread.
// -----------------------------------------------------------------------------
class OpeningRangeCapture {
 public:
  enum class State { Capturing, Captured, Failed };

  OpeningRangeCapture(std::string instrument, const ClockGate& gate);

  // @return true if this tick closed the window and froze the candle.
  // @throws InsufficientDataError if the window closed with zero ticks.
  bool onTick(double price, double volume, std::int64_t timestamp_ms);

  // @return true if the candle was frozen by this call.
  // @throws InsufficientDataError as for onTick().
  bool onClock(std::int64_t now_ms);

  // @throws InsufficientDataError if no tick was received.
  void freezeNow(std::int64_t now_ms);

  State state() const { return state_; }
  bool isCaptured() const { return state_ == State::Captured; }
  std::size_t tickCount() const { return candle_.tick_count; }

  // @throws PreconditionError unless the candle has been captured.
  const domain::Candle& candle() const;

 private:
  void freeze(std::int64_t end_ms);

  const ClockGate& gate_;
  domain::Candle candle_;
  State state_{State::Capturing};
};

}  // namespace orb
