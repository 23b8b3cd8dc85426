#pragma once

#include "orb/domain/position.hpp"
#include "orb/events/event_types.hpp"

#include <cstdint>
#include <string>

namespace orb {

// What an intent asks the execution layer to do.
enum class IntentAction {
  Enter,
  PartialExit,
  FullExit,
};

inline const char* toString(IntentAction a) {
  switch (a) {
    case IntentAction::Enter:       return "ENTER";
    case IntentAction::PartialExit: return "PARTIAL_EXIT";
    case IntentAction::FullExit:    return "FULL_EXIT";
  }
  return "UNKNOWN";
}

// -----------------------------------------------------------------------------
// OrderIntentEvent
// -----------------------------------------------------------------------------
//
// @brief  An instruction emitted by the PositionStateMachine: enter, exit part
//         of, or exit all of a position.
//
// @details
// The decision core never talks to a broker. It emits intents and assumes
// they fill at price_hint; what happens downstream (paper fill, live
// routing) is the execution layer's concern and is reported back through
// ExecutionReportEvent for auditing only.
//
// strike_hint is the at-the-money strike suggested for option selection at
// entry time; zero on exit intents.
//
// Thread model:
//   Created on the instrument's worker loop, forwarded by value to the
//   order-routing and audit loops.
// -----------------------------------------------------------------------------
struct OrderIntentEvent {
  std::uint64_t intent_id{0};
  std::string instrument;
  IntentAction action{IntentAction::Enter};
  domain::Direction direction{domain::Direction::LongCall};
  std::int64_t quantity{0};
  double price_hint{0.0};
  double strike_hint{0.0};
  domain::ExitReason reason{domain::ExitReason::None};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace orb
