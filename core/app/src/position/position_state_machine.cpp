#include "orb/position/position_state_machine.hpp"

#include "orb/domain/errors.hpp"
#include "orb/events/event_types.hpp"
#include "orb/events/risk_violation_event.hpp"
#include "orb/events/trade_lifecycle_event.hpp"
#include "orb/time/time_utils.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

namespace orb {

using domain::ExitReason;
using domain::PositionStatus;

PositionStateMachine::PositionStateMachine(std::string instrument,
                                           const ExitPolicy& policy,
                                           EventBus& bus,
                                           DailyRiskGovernor& governor,
                                           IntentIdGenerator& id_gen)
    : instrument_(std::move(instrument)),
      policy_(policy),
      bus_(bus),
      governor_(governor),
      id_gen_(id_gen) {}

PositionStatus PositionStateMachine::status() const {
  return position_ ? position_->status : PositionStatus::AwaitingEntry;
}

bool PositionStateMachine::tryEnter(domain::Direction direction, double price,
                                    std::int64_t timestamp_ms,
                                    std::int64_t quantity, double atr,
                                    double strike_hint) {
  if (position_) {
    throw PreconditionError("entry requested for " + instrument_ +
                            " while a position is already held");
  }
  if (quantity <= 0) {
    throw PreconditionError("entry quantity for " + instrument_ +
                            " must be positive");
  }

  std::string reason;
  if (!governor_.tryOpenTrade(&reason)) {
    RiskRejectEvent reject;
    reject.instrument = instrument_;
    reject.reason = RejectReason::LimitBreached;
    reject.detail = reason;
    reject.timestamp = ms_to_timestamp(timestamp_ms);
    reject.sequence_id = ++sequence_;
    bus_.publish(reject);

    std::cerr << "[PositionStateMachine] " << instrument_
              << ": entry rejected, " << toString(reject.reason) << " ("
              << reason << ")\n";
    return false;
  }

  const double stop_distance = policy_.initialStopDistance(atr);

  domain::Position pos;
  pos.instrument = instrument_;
  pos.direction = direction;
  pos.entry_price = price;
  pos.entry_time_ms = timestamp_ms;
  pos.original_quantity = quantity;
  pos.remaining_quantity = quantity;
  pos.stop_loss_price = policy_.initialStop(direction, price, stop_distance);
  pos.target_price = policy_.initialTarget(direction, price, stop_distance);
  pos.status = PositionStatus::Open;
  pos.strike_hint = strike_hint;
  position_ = pos;
  last_price_ = price;

  std::cout << "[PositionStateMachine] " << instrument_ << ": ENTER "
            << domain::toString(direction) << " qty=" << quantity
            << " @ " << price << " stop=" << pos.stop_loss_price
            << " target=" << pos.target_price << "\n";

  publishIntent(IntentAction::Enter, quantity, price, ExitReason::None,
                timestamp_ms);
  publishLifecycle(LifecycleKind::Opened, quantity, price, 0.0, timestamp_ms);
  return true;
}

bool PositionStateMachine::onTick(double price, std::int64_t now_ms) {
  return process(price, now_ms);
}

bool PositionStateMachine::onTimer(std::int64_t now_ms) {
  if (!isOpen()) {
    return false;
  }
  return process(last_price_, now_ms);
}

bool PositionStateMachine::forceClose(ExitReason reason,
                                      std::int64_t now_ms) {
  if (!isOpen()) {
    return false;
  }
  applyFullExit(reason, last_price_, now_ms);
  return true;
}

std::optional<domain::Position> PositionStateMachine::reset() {
  if (isOpen()) {
    throw PreconditionError("reset requested for " + instrument_ +
                            " while its position is open");
  }
  std::optional<domain::Position> closed = std::move(position_);
  position_.reset();
  return closed;
}

bool PositionStateMachine::process(double price, std::int64_t now_ms) {
  if (!isOpen()) {
    return false;
  }
  last_price_ = price;
  trackExcursion(price);

  const ExitDecision decision = policy_.evaluate(*position_, price, now_ms);
  switch (decision.action) {
    case ExitDecision::Action::FullExit:
      if (decision.reason == ExitReason::LadderFinal) {
        position_->next_ladder_index = decision.ladder_index + 1;
      }
      applyFullExit(decision.reason, price, now_ms);
      return true;
    case ExitDecision::Action::PartialExit:
      applyPartialExit(decision.quantity, price, now_ms,
                       decision.ladder_index);
      break;
    case ExitDecision::Action::ConsumeStep:
      position_->next_ladder_index = decision.ladder_index + 1;
      std::cout << "[PositionStateMachine] " << instrument_ << ": ladder step "
                << decision.ladder_index
                << " rounds to zero units, consumed\n";
      break;
    case ExitDecision::Action::Hold:
      break;
  }

  const bool was_trailing = position_->trailing_active;
  if (policy_.updateTrailing(*position_, price) && !was_trailing &&
      position_->trailing_active) {
    std::cout << "[PositionStateMachine] " << instrument_
              << ": trailing active, stop=" << position_->stop_loss_price
              << "\n";
  }
  return false;
}

void PositionStateMachine::trackExcursion(double price) {
  domain::Position& pos = *position_;
  const double unrealized = domain::directionSign(pos.direction) *
                            (price - pos.entry_price) *
                            static_cast<double>(pos.remaining_quantity);
  pos.max_favorable_pnl = std::max(pos.max_favorable_pnl, unrealized);
  pos.max_adverse_pnl = std::min(pos.max_adverse_pnl, unrealized);
}

void PositionStateMachine::applyPartialExit(std::int64_t quantity,
                                            double price, std::int64_t now_ms,
                                            std::size_t ladder_index) {
  domain::Position& pos = *position_;
  const double pnl = domain::directionSign(pos.direction) *
                     (price - pos.entry_price) *
                     static_cast<double>(quantity);
  pos.remaining_quantity -= quantity;
  pos.realized_pnl += pnl;
  pos.next_ladder_index = ladder_index + 1;

  std::cout << "[PositionStateMachine] " << instrument_ << ": PARTIAL_EXIT "
            << "step=" << ladder_index << " qty=" << quantity << " @ "
            << price << " remaining=" << pos.remaining_quantity << "\n";

  publishIntent(IntentAction::PartialExit, quantity, price,
                ExitReason::LadderStep, now_ms);
  publishLifecycle(LifecycleKind::PartiallyClosed, quantity, price, pnl,
                   now_ms);
}

void PositionStateMachine::applyFullExit(ExitReason reason, double price,
                                         std::int64_t now_ms) {
  domain::Position& pos = *position_;
  const std::int64_t quantity = pos.remaining_quantity;
  const double pnl = domain::directionSign(pos.direction) *
                     (price - pos.entry_price) *
                     static_cast<double>(quantity);
  pos.remaining_quantity = 0;
  pos.realized_pnl += pnl;
  pos.status = PositionStatus::Closed;
  pos.exit_reason = reason;
  pos.exit_price = price;
  pos.exit_time_ms = now_ms;

  std::cout << "[PositionStateMachine] " << instrument_ << ": FULL_EXIT "
            << domain::toString(reason) << " qty=" << quantity << " @ "
            << price << " pnl=" << pos.realized_pnl << "\n";

  publishIntent(IntentAction::FullExit, quantity, price, reason, now_ms);
  publishLifecycle(LifecycleKind::Closed, quantity, price, pnl, now_ms);

  if (governor_.recordTradeClosed(pos.realized_pnl)) {
    const DailyRiskState state = governor_.snapshot();
    RiskViolationEvent violation;
    violation.instrument = instrument_;
    violation.reason = "Max Daily Loss Reached";
    violation.current_value = state.realized_pnl;
    violation.limit_value = governor_.limits().max_daily_loss;
    violation.timestamp = ms_to_timestamp(now_ms);
    violation.sequence_id = ++sequence_;
    bus_.publish(violation);
  }
}

void PositionStateMachine::publishIntent(IntentAction action,
                                         std::int64_t quantity, double price,
                                         ExitReason reason,
                                         std::int64_t now_ms) {
  OrderIntentEvent intent;
  intent.intent_id = id_gen_.next_id();
  intent.instrument = instrument_;
  intent.action = action;
  intent.direction = position_->direction;
  intent.quantity = quantity;
  intent.price_hint = price;
  intent.strike_hint =
      action == IntentAction::Enter ? position_->strike_hint : 0.0;
  intent.reason = reason;
  intent.timestamp = ms_to_timestamp(now_ms);
  intent.sequence_id = ++sequence_;
  bus_.publish(intent);
}

void PositionStateMachine::publishLifecycle(LifecycleKind kind,
                                            std::int64_t quantity,
                                            double price, double pnl_delta,
                                            std::int64_t now_ms) {
  TradeLifecycleEvent event;
  event.kind = kind;
  event.position = *position_;
  event.quantity = quantity;
  event.price = price;
  event.pnl_delta = pnl_delta;
  event.timestamp = ms_to_timestamp(now_ms);
  event.sequence_id = ++sequence_;
  bus_.publish(event);
}

}  // namespace orb
