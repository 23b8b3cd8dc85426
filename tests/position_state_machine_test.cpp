// =============================================================================
// position_state_machine_test.cpp
// =============================================================================
// Unit tests for orb::PositionStateMachine.
//
// Validates:
//   - Entry publishes ENTER + OPENED and takes a governor slot
//   - Governor refusal publishes a RiskRejectEvent and opens nothing
//   - Ladder partial exits keep remaining = original - sum(exited)
//   - Stop priority, timer-driven time exit, forced close
//   - Loss-floor breach publishes a RiskViolationEvent
//
// Design note: events are published synchronously on a bare EventBus, so
// every assertion runs on the test thread with no waiting.
// =============================================================================

#include "orb/domain/errors.hpp"
#include "orb/events/event.hpp"
#include "orb/position/position_state_machine.hpp"
#include "orb/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <vector>

using orb::IntentAction;
using orb::LifecycleKind;
using orb::domain::Direction;
using orb::domain::ExitReason;
using orb::domain::PositionStatus;

namespace {

constexpr std::int64_t kEntry = 1792036800000;

std::int64_t at(double minutes) { return kEntry + orb::minutes_to_ms(minutes); }

orb::domain::RiskConfig fixedRisk() {
  orb::domain::RiskConfig risk;
  risk.stop_loss_points = 30.0;
  risk.max_holding_minutes = 120.0;
  risk.trailing_enabled = false;
  return risk;
}

orb::domain::ExitLadder twoStepLadder() {
  orb::domain::ExitLadder ladder;
  ladder.enabled = true;
  ladder.steps = {{30.0, 1.0, 30.0}, {60.0, 1.0, 50.0}};
  return ladder;
}

}  // namespace

class PositionStateMachineTest : public ::testing::Test {
 protected:
  PositionStateMachineTest() {
    bus.subscribe<orb::OrderIntentEvent>(
        [this](const orb::OrderIntentEvent& e) { intents.push_back(e); });
    bus.subscribe<orb::TradeLifecycleEvent>(
        [this](const orb::TradeLifecycleEvent& e) { lifecycle.push_back(e); });
    bus.subscribe<orb::RiskRejectEvent>(
        [this](const orb::RiskRejectEvent& e) { rejects.push_back(e); });
    bus.subscribe<orb::RiskViolationEvent>(
        [this](const orb::RiskViolationEvent& e) { violations.push_back(e); });
  }

  static orb::domain::DailyRiskLimits limits(int trades, double floor) {
    orb::domain::DailyRiskLimits l;
    l.max_trades_per_day = trades;
    l.max_daily_loss = floor;
    return l;
  }

  orb::EventBus bus;
  orb::IntentIdGenerator ids;
  orb::DailyRiskGovernor governor{limits(3, -100000)};
  orb::ExitPolicy policy{fixedRisk(), twoStepLadder()};
  orb::PositionStateMachine psm{"NIFTY", policy, bus, governor, ids};

  std::vector<orb::OrderIntentEvent> intents;
  std::vector<orb::TradeLifecycleEvent> lifecycle;
  std::vector<orb::RiskRejectEvent> rejects;
  std::vector<orb::RiskViolationEvent> violations;
};

// -----------------------------------------------------------------------------
// 1. Entry opens a position with policy-derived stop and target.
// -----------------------------------------------------------------------------
TEST_F(PositionStateMachineTest, EntryPublishesIntentAndLifecycle) {
  ASSERT_TRUE(psm.tryEnter(Direction::LongCall, 100.0, kEntry, 10, 0.0,
                           19500.0));

  ASSERT_TRUE(psm.isOpen());
  const auto& pos = *psm.position();
  EXPECT_DOUBLE_EQ(pos.stop_loss_price, 70.0);
  EXPECT_DOUBLE_EQ(pos.target_price, 160.0);
  EXPECT_EQ(pos.remaining_quantity, 10);

  ASSERT_EQ(intents.size(), 1u);
  EXPECT_EQ(intents[0].action, IntentAction::Enter);
  EXPECT_EQ(intents[0].quantity, 10);
  EXPECT_DOUBLE_EQ(intents[0].price_hint, 100.0);
  EXPECT_DOUBLE_EQ(intents[0].strike_hint, 19500.0);
  EXPECT_EQ(intents[0].intent_id, 1u);

  ASSERT_EQ(lifecycle.size(), 1u);
  EXPECT_EQ(lifecycle[0].kind, LifecycleKind::Opened);
  EXPECT_EQ(governor.snapshot().trade_count, 1);
}

// -----------------------------------------------------------------------------
// 2. A governor refusal leaves no trace but the reject event.
// Why: with max_trades_per_day = 2 the third breakout of the day must not
//      trade, and the operator needs to see why.
// -----------------------------------------------------------------------------
TEST_F(PositionStateMachineTest, GovernorRefusalPublishesReject) {
  orb::DailyRiskGovernor tight(limits(2, -100000));
  orb::PositionStateMachine sm("NIFTY", policy, bus, tight, ids);

  for (int i = 0; i < 2; ++i) {
    ASSERT_TRUE(sm.tryEnter(Direction::LongCall, 100.0, kEntry, 10, 0.0));
    ASSERT_TRUE(sm.forceClose(ExitReason::Manual, kEntry + 1000));
    ASSERT_TRUE(sm.reset().has_value());
  }

  EXPECT_FALSE(sm.tryEnter(Direction::LongPut, 95.0, kEntry + 2000, 10, 0.0));
  EXPECT_EQ(sm.status(), PositionStatus::AwaitingEntry);
  EXPECT_FALSE(sm.position().has_value());

  ASSERT_EQ(rejects.size(), 1u);
  EXPECT_EQ(rejects[0].reason, orb::RejectReason::LimitBreached);
  EXPECT_EQ(rejects[0].detail, "max trades per day reached");
  EXPECT_EQ(tight.snapshot().trade_count, 2);
}

// -----------------------------------------------------------------------------
// 3. Ladder partials shrink the remainder step by step.
// -----------------------------------------------------------------------------
TEST_F(PositionStateMachineTest, LadderPartialsPreserveQuantityInvariant) {
  ASSERT_TRUE(psm.tryEnter(Direction::LongCall, 100.0, kEntry, 10, 0.0));

  EXPECT_FALSE(psm.onTick(102.0, at(30)));  // 30% of 10 -> 3
  EXPECT_EQ(psm.position()->remaining_quantity, 7);
  EXPECT_EQ(psm.position()->next_ladder_index, 1u);

  EXPECT_FALSE(psm.onTick(103.0, at(60)));  // 50% of 7 -> 3
  EXPECT_EQ(psm.position()->remaining_quantity, 4);

  EXPECT_TRUE(psm.onTick(70.0, at(61)));  // stop takes the rest
  const auto& pos = *psm.position();
  EXPECT_EQ(pos.status, PositionStatus::Closed);
  EXPECT_EQ(pos.exit_reason, ExitReason::StopLoss);
  EXPECT_EQ(pos.remaining_quantity, 0);

  std::int64_t exited = 0;
  for (const auto& intent : intents) {
    if (intent.action != IntentAction::Enter) {
      exited += intent.quantity;
    }
  }
  EXPECT_EQ(exited, pos.original_quantity);

  // 3 x 2 + 3 x 3 - 4 x 30
  EXPECT_DOUBLE_EQ(pos.realized_pnl, 6.0 + 9.0 - 120.0);
  EXPECT_DOUBLE_EQ(governor.snapshot().realized_pnl, pos.realized_pnl);

  ASSERT_EQ(lifecycle.size(), 4u);
  EXPECT_EQ(lifecycle[1].kind, LifecycleKind::PartiallyClosed);
  EXPECT_EQ(lifecycle[3].kind, LifecycleKind::Closed);
}

// -----------------------------------------------------------------------------
// 4. A due ladder step never pre-empts the stop.
// -----------------------------------------------------------------------------
TEST_F(PositionStateMachineTest, StopBeatsDueLadderStep) {
  orb::domain::ExitLadder lossy;
  lossy.enabled = true;
  lossy.steps = {{30.0, -90.0, 50.0}};
  orb::ExitPolicy lossy_policy(fixedRisk(), lossy);
  orb::PositionStateMachine sm("NIFTY", lossy_policy, bus, governor, ids);

  ASSERT_TRUE(sm.tryEnter(Direction::LongCall, 100.0, kEntry, 10, 0.0));
  EXPECT_TRUE(sm.onTick(65.0, at(31)));
  EXPECT_EQ(sm.position()->exit_reason, ExitReason::StopLoss);
  EXPECT_EQ(intents.back().quantity, 10);
}

// -----------------------------------------------------------------------------
// 5. Timer ticks drive the max-holding exit at the last seen price.
// Why: a quiet market must not keep a position open past its holding limit.
// -----------------------------------------------------------------------------
TEST_F(PositionStateMachineTest, TimerClosesFlatPositionAtMaxHolding) {
  ASSERT_TRUE(psm.tryEnter(Direction::LongCall, 100.0, kEntry, 10, 0.0));
  EXPECT_FALSE(psm.onTick(100.0, at(1)));
  EXPECT_FALSE(psm.onTimer(at(119)));
  EXPECT_TRUE(psm.onTimer(at(120)));

  const auto& pos = *psm.position();
  EXPECT_EQ(pos.exit_reason, ExitReason::TimeExit);
  EXPECT_DOUBLE_EQ(pos.exit_price, 100.0);
  EXPECT_DOUBLE_EQ(pos.realized_pnl, 0.0);
  EXPECT_EQ(intents.back().action, IntentAction::FullExit);
  EXPECT_EQ(intents.back().reason, ExitReason::TimeExit);
}

TEST_F(PositionStateMachineTest, ForceCloseUsesLastPrice) {
  ASSERT_TRUE(psm.tryEnter(Direction::LongPut, 100.0, kEntry, 10, 0.0));
  psm.onTick(96.0, at(5));

  EXPECT_TRUE(psm.forceClose(ExitReason::SessionEnd, at(6)));
  EXPECT_EQ(psm.position()->exit_reason, ExitReason::SessionEnd);
  EXPECT_DOUBLE_EQ(psm.position()->realized_pnl, 40.0);

  EXPECT_FALSE(psm.forceClose(ExitReason::Manual, at(7)));
}

TEST_F(PositionStateMachineTest, ExcursionsAreTracked) {
  ASSERT_TRUE(psm.tryEnter(Direction::LongCall, 100.0, kEntry, 10, 0.0));
  psm.onTick(95.0, at(1));
  psm.onTick(110.0, at(2));
  psm.onTick(104.0, at(3));
  EXPECT_DOUBLE_EQ(psm.position()->max_adverse_pnl, -50.0);
  EXPECT_DOUBLE_EQ(psm.position()->max_favorable_pnl, 100.0);
}

TEST_F(PositionStateMachineTest, LossFloorBreachPublishesViolation) {
  orb::DailyRiskGovernor strict(limits(5, -100));
  orb::PositionStateMachine sm("NIFTY", policy, bus, strict, ids);

  ASSERT_TRUE(sm.tryEnter(Direction::LongCall, 100.0, kEntry, 10, 0.0));
  ASSERT_TRUE(sm.onTick(70.0, at(1)));

  ASSERT_EQ(violations.size(), 1u);
  EXPECT_EQ(violations[0].reason, "Max Daily Loss Reached");
  EXPECT_DOUBLE_EQ(violations[0].current_value, -300.0);
  EXPECT_DOUBLE_EQ(violations[0].limit_value, -100.0);
  EXPECT_FALSE(strict.canOpenNewTrade());
}

TEST_F(PositionStateMachineTest, PreconditionsAreEnforced) {
  EXPECT_THROW(psm.tryEnter(Direction::LongCall, 100.0, kEntry, 0, 0.0),
               orb::PreconditionError);

  ASSERT_TRUE(psm.tryEnter(Direction::LongCall, 100.0, kEntry, 10, 0.0));
  EXPECT_THROW(psm.tryEnter(Direction::LongCall, 101.0, kEntry, 10, 0.0),
               orb::PreconditionError);
  EXPECT_THROW(psm.reset(), orb::PreconditionError);
}

TEST_F(PositionStateMachineTest, UpdatesWithoutPositionAreIgnored) {
  EXPECT_FALSE(psm.onTick(100.0, kEntry));
  EXPECT_FALSE(psm.onTimer(kEntry));
  EXPECT_FALSE(psm.forceClose(ExitReason::Manual, kEntry));
  EXPECT_TRUE(intents.empty());
}
