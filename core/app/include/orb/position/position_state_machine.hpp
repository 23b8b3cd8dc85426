#pragma once

#include "orb/concurrent/intent_id_generator.hpp"
#include "orb/domain/position.hpp"
#include "orb/eventbus/event_bus.hpp"
#include "orb/events/order_intent_event.hpp"
#include "orb/position/exit_policy.hpp"
#include "orb/risk/daily_risk_governor.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace orb {

// -----------------------------------------------------------------------------
// PositionStateMachine
// -----------------------------------------------------------------------------
//
// @brief  Owns the one live trade of an instrument and drives it
//         AWAITING_ENTRY -> OPEN -> (partial exits)* -> CLOSED.
//
// @details
// Entry:
//   tryEnter() asks the DailyRiskGovernor for a slot. Refused: a
//   RiskRejectEvent is published, nothing else changes and no Position
//   exists. Granted: the Position opens at the triggering price with the
//   ExitPolicy's initial stop and target, and an ENTER intent plus an
//   OPENED lifecycle event are published.
//
// Updates:
//   onTick() and onTimer() record excursions, consult ExitPolicy::evaluate()
//   and apply at most one exit, then apply the trailing update. onTimer()
//   re-evaluates at the last seen price so time exits fire without ticks.
//
// Exits:
//   Each partial exit publishes a PARTIAL_EXIT intent and a
//   PARTIALLY_CLOSED lifecycle event; the terminal close publishes a
//   FULL_EXIT intent and a CLOSED event, and reports the trade's total
//   realized P&L to the governor (partials included). If that close breaches
//   the daily loss floor a RiskViolationEvent is published too.
//
//   forceClose() closes whatever remains with the given reason, ignoring
//   trigger priority (operator flatten, session end).
//
// Everything is published on the EventBus passed in, i.e. on the worker's
// own loop. The state machine never blocks on what subscribers do with it.
//
// Thread model: single writer, the instrument's worker thread.
// -----------------------------------------------------------------------------
class PositionStateMachine {
 public:
  PositionStateMachine(std::string instrument, const ExitPolicy& policy,
                       EventBus& bus, DailyRiskGovernor& governor,
                       IntentIdGenerator& id_gen);

  PositionStateMachine(const PositionStateMachine&) = delete;
  PositionStateMachine& operator=(const PositionStateMachine&) = delete;

  // @return true if the position opened.
  // @throws PreconditionError if a position is already held or quantity <= 0.
  bool tryEnter(domain::Direction direction, double price,
                std::int64_t timestamp_ms, std::int64_t quantity, double atr,
                double strike_hint = 0.0);

  // @return true if this update closed the position.
  bool onTick(double price, std::int64_t now_ms);
  bool onTimer(std::int64_t now_ms);

  // @return true if a position was open and is now closed.
  bool forceClose(domain::ExitReason reason, std::int64_t now_ms);

  // Hands out the closed position and returns to AWAITING_ENTRY.
  // @throws PreconditionError while a position is open.
  std::optional<domain::Position> reset();

  domain::PositionStatus status() const;
  bool isOpen() const { return status() == domain::PositionStatus::Open; }
  const std::optional<domain::Position>& position() const { return position_; }
  const std::string& instrument() const { return instrument_; }

 private:
  bool process(double price, std::int64_t now_ms);
  void trackExcursion(double price);
  void applyPartialExit(std::int64_t quantity, double price,
                        std::int64_t now_ms, std::size_t ladder_index);
  void applyFullExit(domain::ExitReason reason, double price,
                     std::int64_t now_ms);
  void publishIntent(IntentAction action, std::int64_t quantity, double price,
                     domain::ExitReason reason, std::int64_t now_ms);
  void publishLifecycle(LifecycleKind kind, std::int64_t quantity,
                        double price, double pnl_delta, std::int64_t now_ms);

  std::string instrument_;
  const ExitPolicy& policy_;
  EventBus& bus_;
  DailyRiskGovernor& governor_;
  IntentIdGenerator& id_gen_;

  std::optional<domain::Position> position_;
  double last_price_{0.0};
  std::uint64_t sequence_{0};
};

}  // namespace orb
