#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace orb {
namespace domain {

// Long call profits when the underlying rises; long put when it falls.
// Every price comparison in the exit policy goes through directionSign().
enum class Direction {
  LongCall,
  LongPut,
};

enum class PositionStatus {
  AwaitingEntry,
  Open,
  Closed,  // terminal
};

enum class ExitReason {
  None,
  StopLoss,
  Target,
  TimeExit,
  LadderStep,   // partial exit only
  LadderFinal,  // ladder step that consumed the whole remainder
  SessionEnd,
  Manual,
};

inline double directionSign(Direction d) {
  return d == Direction::LongCall ? 1.0 : -1.0;
}

inline const char* toString(Direction d) {
  switch (d) {
    case Direction::LongCall: return "LONG_CALL";
    case Direction::LongPut:  return "LONG_PUT";
  }
  return "UNKNOWN";
}

inline const char* toString(PositionStatus s) {
  switch (s) {
    case PositionStatus::AwaitingEntry: return "AWAITING_ENTRY";
    case PositionStatus::Open:          return "OPEN";
    case PositionStatus::Closed:        return "CLOSED";
  }
  return "UNKNOWN";
}

inline const char* toString(ExitReason r) {
  switch (r) {
    case ExitReason::None:        return "NONE";
    case ExitReason::StopLoss:    return "STOP_LOSS";
    case ExitReason::Target:      return "TARGET";
    case ExitReason::TimeExit:    return "TIME_EXIT";
    case ExitReason::LadderStep:  return "LADDER_STEP";
    case ExitReason::LadderFinal: return "LADDER_FINAL";
    case ExitReason::SessionEnd:  return "SESSION_END";
    case ExitReason::Manual:      return "MANUAL";
  }
  return "UNKNOWN";
}

// -----------------------------------------------------------------------------
// Position: one trade from entry to terminal close
// -----------------------------------------------------------------------------
//
// @details
// Mutated only by PositionStateMachine on its instrument's worker thread.
// Everything else sees copies: TradeLifecycleEvent snapshots and the
// archived closed positions.
//
// Invariants upheld by the state machine:
//   0 <= remaining_quantity <= original_quantity, non-increasing, and 0
//   exactly when status == Closed.
//   stop_loss_price only tightens once trailing_active is set.
//   next_ladder_index only increases.
//
// max_favorable_pnl / max_adverse_pnl are the best and worst unrealized
// P&L (points x remaining quantity) observed while open.
// -----------------------------------------------------------------------------
struct Position {
  std::string instrument;
  Direction direction{Direction::LongCall};
  double entry_price{0.0};
  std::int64_t entry_time_ms{0};
  std::int64_t original_quantity{0};
  std::int64_t remaining_quantity{0};
  double realized_pnl{0.0};
  double stop_loss_price{0.0};
  double target_price{0.0};
  bool trailing_active{false};
  std::size_t next_ladder_index{0};
  PositionStatus status{PositionStatus::AwaitingEntry};
  double strike_hint{0.0};

  ExitReason exit_reason{ExitReason::None};
  double exit_price{0.0};
  std::int64_t exit_time_ms{0};

  double max_favorable_pnl{0.0};
  double max_adverse_pnl{0.0};
};

}  // namespace domain
}  // namespace orb
