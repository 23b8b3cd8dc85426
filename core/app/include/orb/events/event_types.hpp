#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace orb {

// -----------------------------------------------------------------------------
// Timestamp
// -----------------------------------------------------------------------------
// Wall-clock (or simulated) time attached to every event. The decision core
// works in epoch milliseconds; see time_utils.hpp for the conversions.
// -----------------------------------------------------------------------------
using Timestamp = std::chrono::system_clock::time_point;

// -----------------------------------------------------------------------------
// MarketDataEvent
// -----------------------------------------------------------------------------
// One observation of an instrument's underlying price. Produced by the
// MarketDataGateway (or a replay/test driver) and routed to the worker loop
// that owns the instrument.
// -----------------------------------------------------------------------------
struct MarketDataEvent {
  std::string symbol;            // Instrument identifier (e.g. "NIFTY")
  double price{0.0};             // Last traded price
  double volume{0.0};            // Traded volume associated with the tick
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// TimerEvent
// -----------------------------------------------------------------------------
// Periodic wake-up pushed into every worker loop by the TimerThread. Drives
// the time-based transitions (capture window close, maximum holding time,
// force close) even when an instrument stops ticking.
// -----------------------------------------------------------------------------
struct TimerEvent {
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// Operator request to close every open position and take no new entries.
struct FlattenEvent {
  std::string reason;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// Session end: close what is open with SESSION_END and stop trading.
struct SessionCloseEvent {
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// RiskRejectEvent
// -----------------------------------------------------------------------------
// An entry the strategy wanted but the DailyRiskGovernor refused. The
// instrument stays flat; monitoring sees why.
// -----------------------------------------------------------------------------
enum class RejectReason {
  LimitBreached,
};

inline const char* toString(RejectReason r) {
  switch (r) {
    case RejectReason::LimitBreached: return "LIMIT_BREACHED";
  }
  return "UNKNOWN";
}

struct RiskRejectEvent {
  std::string instrument;
  RejectReason reason{RejectReason::LimitBreached};
  std::string detail;            // e.g. "max trades per day reached"
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace orb
