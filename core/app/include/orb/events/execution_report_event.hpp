#pragma once

#include "orb/events/event_types.hpp"

#include <cstdint>
#include <string>

namespace orb {

enum class ExecutionStatus {
  Accepted,
  Filled,
  Rejected,
};

inline const char* toString(ExecutionStatus s) {
  switch (s) {
    case ExecutionStatus::Accepted: return "ACCEPTED";
    case ExecutionStatus::Filled:   return "FILLED";
    case ExecutionStatus::Rejected: return "REJECTED";
  }
  return "UNKNOWN";
}

// -----------------------------------------------------------------------------
// ExecutionReportEvent
// -----------------------------------------------------------------------------
// Outcome reported by the execution layer for one OrderIntentEvent. Reports
// are audit output; the position state machine has already applied the
// intent at its price hint.
// -----------------------------------------------------------------------------
struct ExecutionReportEvent {
  std::uint64_t intent_id{0};
  std::string instrument;
  std::int64_t filled_quantity{0};
  double fill_price{0.0};
  ExecutionStatus status{ExecutionStatus::Accepted};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace orb
