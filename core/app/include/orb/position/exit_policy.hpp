#pragma once

#include "orb/domain/position.hpp"
#include "orb/domain/risk_config.hpp"

#include <cstddef>
#include <cstdint>

namespace orb {

struct ExitDecision {
  enum class Action {
    Hold,
    PartialExit,
    FullExit,
    ConsumeStep,  // ladder step due but rounds to zero units
  };

  Action action{Action::Hold};
  domain::ExitReason reason{domain::ExitReason::None};
  std::int64_t quantity{0};
  std::size_t ladder_index{0};
};

// -----------------------------------------------------------------------------
// ExitPolicy
// -----------------------------------------------------------------------------
//
// @brief  The set of exit rules consulted by the PositionStateMachine: initial
//         stop and target, the prioritized exit triggers, and the trailing
//         stop update.
//
// @details
// Trigger priority on every tick or timer update (first match wins):
//   1. stop loss     price at or beyond stop_loss_price        -> FULL
//   2. target        price at or beyond target_price, unless an
//                    unconsumed ladder step gates on a higher
//                    profit percentage than the target's        -> FULL
//   3. max holding   elapsed >= max_holding_minutes             -> FULL
//   4. ladder step   next unconsumed step: elapsed >= its time
//                    and profit % >= its gate                   -> PARTIAL
//
// Only the next unconsumed ladder step is ever evaluated, so steps fire in
// order, at most one per evaluation. Its quantity is
// floor(remaining * exit_percentage / 100); a quantity covering the whole
// remainder becomes a FULL exit with reason LadderFinal.
//
// Profit percentage is direction-signed: (price - entry) / entry * 100,
// negated for long puts.
//
// updateTrailing() is separate and is applied by the state machine AFTER
// the triggers, so a stop it tightens is first tested on the next update.
//
// Stateless apart from its immutable configuration.
// -----------------------------------------------------------------------------
class ExitPolicy {
 public:
  ExitPolicy(domain::RiskConfig risk, domain::ExitLadder ladder);

  // ATR x multiplier when configured and ATR is positive, else fixed points.
  double initialStopDistance(double atr) const;

  double initialStop(domain::Direction direction, double entry,
                     double stop_distance) const;

  // target_points when set, else twice the stop distance.
  double initialTarget(domain::Direction direction, double entry,
                       double stop_distance) const;

  ExitDecision evaluate(const domain::Position& position, double price,
                        std::int64_t now_ms) const;

  // @return true if the stop moved or trailing was armed.
  bool updateTrailing(domain::Position& position, double price) const;

  static double profitPercent(const domain::Position& position, double price);

  const domain::RiskConfig& risk() const { return risk_; }
  const domain::ExitLadder& ladder() const { return ladder_; }

 private:
  bool ladderBlocksTarget(const domain::Position& position) const;

  domain::RiskConfig risk_;
  domain::ExitLadder ladder_;
};

}  // namespace orb
