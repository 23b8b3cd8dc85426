#pragma once

#include "orb/events/event_types.hpp"
#include "orb/events/execution_report_event.hpp"
#include "orb/events/order_intent_event.hpp"
#include "orb/events/risk_violation_event.hpp"
#include "orb/events/trade_lifecycle_event.hpp"

#include <variant>

namespace orb {

// -----------------------------------------------------------------------------
// Event
// -----------------------------------------------------------------------------
// The single envelope carried by every EventBus and EventLoopThread queue.
// Adding a kind means adding it here and to event_json.cpp.
// -----------------------------------------------------------------------------
using Event = std::variant<
    MarketDataEvent,
    TimerEvent,
    FlattenEvent,
    SessionCloseEvent,
    RiskRejectEvent,
    OrderIntentEvent,
    TradeLifecycleEvent,
    ExecutionReportEvent,
    RiskViolationEvent>;

}  // namespace orb
