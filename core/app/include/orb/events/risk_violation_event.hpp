#pragma once

#include "orb/events/event_types.hpp"

#include <cstdint>
#include <string>

namespace orb {

// -----------------------------------------------------------------------------
// RiskViolationEvent: the daily loss floor has been reached
// -----------------------------------------------------------------------------
//
// @details
// Published once, by the PositionStateMachine whose close pushed session
// realized P&L to or below DailyRiskLimits::max_daily_loss. From that point
// the governor refuses every new entry; open positions elsewhere keep being
// managed to their own exits.
//
//   instrument:    The instrument whose close tripped the floor.
//   current_value: Session realized P&L after that close.
//   limit_value:   The configured floor.
// -----------------------------------------------------------------------------
struct RiskViolationEvent {
  std::string instrument;
  std::string reason;
  double current_value{0.0};
  double limit_value{0.0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace orb
