#include "orb/position/exit_policy.hpp"

#include "orb/time/time_utils.hpp"

#include <cmath>
#include <utility>

namespace orb {

using domain::ExitReason;

ExitPolicy::ExitPolicy(domain::RiskConfig risk, domain::ExitLadder ladder)
    : risk_(std::move(risk)), ladder_(std::move(ladder)) {}

double ExitPolicy::initialStopDistance(double atr) const {
  if (risk_.use_atr_stop && atr > 0.0) {
    return atr * risk_.atr_multiplier;
  }
  return risk_.stop_loss_points;
}

double ExitPolicy::initialStop(domain::Direction direction, double entry,
                               double stop_distance) const {
  return entry - domain::directionSign(direction) * stop_distance;
}

double ExitPolicy::initialTarget(domain::Direction direction, double entry,
                                 double stop_distance) const {
  const double distance =
      risk_.target_points > 0.0 ? risk_.target_points : 2.0 * stop_distance;
  return entry + domain::directionSign(direction) * distance;
}

double ExitPolicy::profitPercent(const domain::Position& position,
                                 double price) {
  if (position.entry_price == 0.0) {
    return 0.0;
  }
  return domain::directionSign(position.direction) *
         (price - position.entry_price) / position.entry_price * 100.0;
}

bool ExitPolicy::ladderBlocksTarget(const domain::Position& position) const {
  if (!ladder_.enabled) {
    return false;
  }
  const double target_pct = profitPercent(position, position.target_price);
  for (std::size_t i = position.next_ladder_index; i < ladder_.steps.size();
       ++i) {
    if (ladder_.steps[i].min_profit_percentage > target_pct) {
      return true;
    }
  }
  return false;
}

ExitDecision ExitPolicy::evaluate(const domain::Position& position,
                                  double price, std::int64_t now_ms) const {
  ExitDecision decision;
  if (position.status != domain::PositionStatus::Open) {
    return decision;
  }

  const double sign = domain::directionSign(position.direction);

  if (sign * (price - position.stop_loss_price) <= 0.0) {
    decision.action = ExitDecision::Action::FullExit;
    decision.reason = ExitReason::StopLoss;
    decision.quantity = position.remaining_quantity;
    return decision;
  }

  if (sign * (price - position.target_price) >= 0.0 &&
      !ladderBlocksTarget(position)) {
    decision.action = ExitDecision::Action::FullExit;
    decision.reason = ExitReason::Target;
    decision.quantity = position.remaining_quantity;
    return decision;
  }

  const double elapsed = elapsed_minutes(position.entry_time_ms, now_ms);
  if (risk_.max_holding_minutes > 0.0 &&
      elapsed >= risk_.max_holding_minutes) {
    decision.action = ExitDecision::Action::FullExit;
    decision.reason = ExitReason::TimeExit;
    decision.quantity = position.remaining_quantity;
    return decision;
  }

  if (ladder_.enabled && position.next_ladder_index < ladder_.steps.size()) {
    const auto& step = ladder_.steps[position.next_ladder_index];
    if (elapsed >= step.time_minutes &&
        profitPercent(position, price) >= step.min_profit_percentage) {
      const auto qty = static_cast<std::int64_t>(
          std::floor(static_cast<double>(position.remaining_quantity) *
                     step.exit_percentage / 100.0));
      decision.ladder_index = position.next_ladder_index;
      if (qty >= position.remaining_quantity) {
        decision.action = ExitDecision::Action::FullExit;
        decision.reason = ExitReason::LadderFinal;
        decision.quantity = position.remaining_quantity;
      } else if (qty <= 0) {
        decision.action = ExitDecision::Action::ConsumeStep;
        decision.reason = ExitReason::LadderStep;
      } else {
        decision.action = ExitDecision::Action::PartialExit;
        decision.reason = ExitReason::LadderStep;
        decision.quantity = qty;
      }
      return decision;
    }
  }

  return decision;
}

bool ExitPolicy::updateTrailing(domain::Position& position,
                                double price) const {
  if (!risk_.trailing_enabled ||
      position.status != domain::PositionStatus::Open) {
    return false;
  }

  const double sign = domain::directionSign(position.direction);
  const double profit = sign * (price - position.entry_price);
  bool changed = false;

  if (!position.trailing_active) {
    const double target_distance =
        std::abs(position.target_price - position.entry_price);
    if (profit > 0.0 &&
        profit >= risk_.trailing_activation_fraction * target_distance) {
      position.trailing_active = true;
      changed = true;
    }
  }

  if (position.trailing_active && profit > 0.0) {
    const double candidate =
        price - risk_.trailing_trail_fraction * (price - position.entry_price);
    if (sign * (candidate - position.stop_loss_price) > 0.0) {
      position.stop_loss_price = candidate;
      changed = true;
    }
  }
  return changed;
}

}  // namespace orb
