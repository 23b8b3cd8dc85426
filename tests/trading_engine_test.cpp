// =============================================================================
// trading_engine_test.cpp
// =============================================================================
// Tests for orb::TradingEngine with networking disabled (empty endpoints).
//
// Validates:
//   - Lifecycle: idempotent start()/stop(), destructor joins everything
//   - Non-trading days arm no instrument
//   - Ticks pushed into the engine produce an ENTER intent on the audit bus
//     and a FILLED report on the order routing bus
//   - Operator commands: PING, STATUS, FLATTEN, unknown
//   - Replay mode opens the session from the first tick's date
//
// Design: each test owns its engine and simulated clock. Cross-thread results
// are awaited with promise/future or a bounded poll, never a bare sleep.
// =============================================================================

#include "orb/engine/trading_engine.hpp"
#include "orb/time/simulation_time_provider.hpp"
#include "orb/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <thread>

namespace {

constexpr std::int64_t kOpen = 1792035900000;      // Thu 2026-10-15 09:15 IST
constexpr std::int64_t kSaturday = 1792208700000;  // Sat 2026-10-17 09:15 IST
constexpr std::int64_t kHoliday = 1790912700000;   // Fri 2026-10-02 09:15 IST

orb::EngineConfig testConfig() {
  orb::EngineConfig cfg;
  cfg.session.holidays = {"2026-10-02"};
  cfg.session.timer_interval_ms = 10;
  cfg.risk.trailing_enabled = false;
  cfg.filters.volume.enabled = false;
  cfg.filters.momentum.enabled = false;
  cfg.filters.premium_cap.enabled = false;

  orb::domain::Instrument nifty;
  nifty.id = "NIFTY";
  nifty.step_size = 50.0;
  nifty.quantity = 75;
  cfg.instruments.push_back(nifty);

  cfg.network.market_data_endpoint.clear();
  cfg.network.ipc_cmd_endpoint.clear();
  cfg.network.ipc_pub_endpoint.clear();
  return cfg;
}

orb::MarketDataEvent tick(const std::string& symbol, double price,
                          std::int64_t ts_ms) {
  orb::MarketDataEvent md;
  md.symbol = symbol;
  md.price = price;
  md.volume = 100.0;
  md.timestamp = orb::ms_to_timestamp(ts_ms);
  return md;
}

// Polls `predicate` until it holds or two seconds pass.
bool eventually(const std::function<bool()>& predicate) {
  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::seconds(2);
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return predicate();
}

}  // namespace

class TradingEngineTest : public ::testing::Test {
 protected:
  // Opening range 100..105 on NIFTY, closed by a tick at 106.
  void captureRange(orb::TradingEngine& engine) {
    engine.pushMarketData(tick("NIFTY", 102.0, kOpen + 1000));
    engine.pushMarketData(tick("NIFTY", 105.0, kOpen + 60000));
    engine.pushMarketData(tick("NIFTY", 100.0, kOpen + 120000));
    engine.pushMarketData(tick("NIFTY", 106.0, kOpen + 5 * 60000 + 1000));
  }

  static nlohmann::json status(orb::TradingEngine& engine) {
    return nlohmann::json::parse(engine.executeCommand("STATUS"));
  }

  orb::SimulationTimeProvider sim_clock{kOpen};
};

// -----------------------------------------------------------------------------
// 1. Lifecycle.
// -----------------------------------------------------------------------------
TEST_F(TradingEngineTest, IdempotentStartAndStop) {
  orb::TradingEngine engine(testConfig(), sim_clock);
  EXPECT_NO_FATAL_FAILURE(engine.stop());

  engine.start();
  EXPECT_NO_FATAL_FAILURE(engine.start());
  EXPECT_NO_FATAL_FAILURE(engine.stop());
  EXPECT_NO_FATAL_FAILURE(engine.stop());
}

TEST_F(TradingEngineTest, DestructorStopsThreadsWithOpenSession) {
  {
    orb::TradingEngine engine(testConfig(), sim_clock);
    engine.start();
    ASSERT_TRUE(engine.startSession(kOpen));
    captureRange(engine);
  }
  SUCCEED();
}

// -----------------------------------------------------------------------------
// 2. Calendar gating.
// Why: weekends and exchange holidays must never arm an instrument.
// -----------------------------------------------------------------------------
TEST_F(TradingEngineTest, NonTradingDaysArmNothing) {
  orb::TradingEngine engine(testConfig(), sim_clock);
  EXPECT_FALSE(engine.startSession(kSaturday));
  EXPECT_FALSE(engine.sessionActive());
  EXPECT_FALSE(engine.startSession(kHoliday));
  EXPECT_FALSE(engine.governorState().has_value());

  EXPECT_TRUE(engine.startSession(kOpen));
  EXPECT_TRUE(engine.sessionActive());
  EXPECT_EQ(engine.snapshots().size(), 1u);
}

TEST_F(TradingEngineTest, DisabledInstrumentGetsNoWorker) {
  auto cfg = testConfig();
  cfg.instruments[0].enabled = false;
  orb::TradingEngine engine(cfg, sim_clock);
  ASSERT_TRUE(engine.startSession(kOpen));
  EXPECT_TRUE(engine.snapshots().empty());
}

// -----------------------------------------------------------------------------
// 3. End to end: breakout -> ENTER intent -> paper fill.
// -----------------------------------------------------------------------------
TEST_F(TradingEngineTest, BreakoutProducesIntentAndFill) {
  orb::TradingEngine engine(testConfig(), sim_clock);

  std::promise<orb::OrderIntentEvent> intent_promise;
  auto intent_future = intent_promise.get_future();
  std::atomic<bool> intent_seen{false};
  engine.auditEventBus().subscribe<orb::OrderIntentEvent>(
      [&](const orb::OrderIntentEvent& e) {
        if (!intent_seen.exchange(true)) {
          intent_promise.set_value(e);
        }
      });

  std::promise<orb::ExecutionReportEvent> fill_promise;
  auto fill_future = fill_promise.get_future();
  std::atomic<bool> fill_seen{false};
  engine.orderRoutingEventBus().subscribe<orb::ExecutionReportEvent>(
      [&](const orb::ExecutionReportEvent& e) {
        if (e.status == orb::ExecutionStatus::Filled &&
            !fill_seen.exchange(true)) {
          fill_promise.set_value(e);
        }
      });

  engine.start();
  ASSERT_TRUE(engine.startSession(kOpen));
  captureRange(engine);
  engine.pushMarketData(tick("NIFTY", 108.0, kOpen + 6 * 60000));

  ASSERT_EQ(intent_future.wait_for(std::chrono::seconds(2)),
            std::future_status::ready)
      << "no ENTER intent reached the audit loop";
  const auto intent = intent_future.get();
  EXPECT_EQ(intent.action, orb::IntentAction::Enter);
  EXPECT_EQ(intent.instrument, "NIFTY");
  EXPECT_EQ(intent.direction, orb::domain::Direction::LongCall);
  EXPECT_EQ(intent.quantity, 75);

  ASSERT_EQ(fill_future.wait_for(std::chrono::seconds(2)),
            std::future_status::ready)
      << "no FILLED report from the paper execution engine";
  const auto fill = fill_future.get();
  EXPECT_EQ(fill.intent_id, intent.intent_id);
  EXPECT_EQ(fill.filled_quantity, 75);
  EXPECT_DOUBLE_EQ(fill.fill_price, 108.0);

  EXPECT_TRUE(eventually([&] {
    return status(engine)["instruments"][0]["phase"] == "IN_POSITION";
  }));
  const auto gov = engine.governorState();
  ASSERT_TRUE(gov.has_value());
  EXPECT_EQ(gov->trade_count, 1);

  engine.stop();
}

TEST_F(TradingEngineTest, UnknownSymbolIsDropped) {
  orb::TradingEngine engine(testConfig(), sim_clock);
  engine.start();
  ASSERT_TRUE(engine.startSession(kOpen));
  EXPECT_NO_FATAL_FAILURE(
      engine.pushMarketData(tick("FINNIFTY", 21000.0, kOpen + 1000)));

  const auto s = status(engine);
  EXPECT_EQ(s["instruments"].size(), 1u);
  engine.stop();
}

// -----------------------------------------------------------------------------
// 4. Operator commands.
// -----------------------------------------------------------------------------
TEST_F(TradingEngineTest, PingAndUnknownCommand) {
  orb::TradingEngine engine(testConfig(), sim_clock);

  const auto ping = nlohmann::json::parse(engine.executeCommand("PING"));
  EXPECT_EQ(ping["status"], "ok");
  EXPECT_EQ(ping["response"], "PONG");

  const auto bad = nlohmann::json::parse(engine.executeCommand("BUY 100"));
  EXPECT_EQ(bad["status"], "error");
  EXPECT_EQ(bad["response"], "Unknown command: BUY 100");
}

TEST_F(TradingEngineTest, StatusWithoutSession) {
  orb::TradingEngine engine(testConfig(), sim_clock);
  const auto s = status(engine);
  EXPECT_EQ(s["status"], "ok");
  EXPECT_FALSE(s["session_active"].get<bool>());
  EXPECT_FALSE(s.contains("governor"));
  EXPECT_TRUE(s["instruments"].empty());
  EXPECT_EQ(s["now_ms"].get<std::int64_t>(), kOpen);
}

// Why: FLATTEN is the operator's kill switch; it must close what is open
//      and stop any further entries for the rest of the session.
TEST_F(TradingEngineTest, FlattenClosesOpenPositionAndHalts) {
  orb::TradingEngine engine(testConfig(), sim_clock);

  std::promise<orb::TradeLifecycleEvent> closed_promise;
  auto closed_future = closed_promise.get_future();
  std::atomic<bool> closed_seen{false};
  engine.auditEventBus().subscribe<orb::TradeLifecycleEvent>(
      [&](const orb::TradeLifecycleEvent& e) {
        if (e.kind == orb::LifecycleKind::Closed &&
            !closed_seen.exchange(true)) {
          closed_promise.set_value(e);
        }
      });

  engine.start();
  ASSERT_TRUE(engine.startSession(kOpen));
  captureRange(engine);
  engine.pushMarketData(tick("NIFTY", 108.0, kOpen + 6 * 60000));
  engine.pushMarketData(tick("NIFTY", 111.0, kOpen + 7 * 60000));
  ASSERT_TRUE(eventually([&] {
    const auto gov = engine.governorState();
    return gov && gov->open_trades == 1;
  }));

  sim_clock.advance_time(kOpen + 8 * 60000);
  const auto reply = nlohmann::json::parse(engine.executeCommand("FLATTEN"));
  EXPECT_EQ(reply["status"], "ok");

  ASSERT_EQ(closed_future.wait_for(std::chrono::seconds(2)),
            std::future_status::ready);
  const auto closed = closed_future.get();
  EXPECT_EQ(closed.position.exit_reason, orb::domain::ExitReason::Manual);
  EXPECT_DOUBLE_EQ(closed.position.exit_price, 111.0);
  EXPECT_DOUBLE_EQ(closed.position.realized_pnl, 3.0 * 75);

  const auto gov = engine.governorState();
  ASSERT_TRUE(gov.has_value());
  EXPECT_TRUE(gov->halted);
  EXPECT_TRUE(eventually([&] {
    return status(engine)["instruments"][0]["phase"] == "DONE";
  }));

  engine.stop();
}

TEST_F(TradingEngineTest, CloseSessionCommandEndsTrading) {
  orb::TradingEngine engine(testConfig(), sim_clock);
  engine.start();
  ASSERT_TRUE(engine.startSession(kOpen));
  captureRange(engine);

  const auto reply =
      nlohmann::json::parse(engine.executeCommand("CLOSE_SESSION"));
  EXPECT_EQ(reply["response"], "Session close requested");
  EXPECT_TRUE(eventually([&] {
    return status(engine)["instruments"][0]["phase"] == "DONE";
  }));
  engine.stop();
}

// -----------------------------------------------------------------------------
// 5. Replay mode opens the session from tick timestamps.
// -----------------------------------------------------------------------------
TEST_F(TradingEngineTest, ReplayOpensSessionFromFirstTick) {
  orb::SimulationTimeProvider replay_clock;
  orb::TradingEngine engine(testConfig(), replay_clock, &replay_clock);
  engine.start();
  EXPECT_FALSE(engine.sessionActive());

  engine.pushMarketData(tick("NIFTY", 102.0, kOpen + 1000));
  EXPECT_TRUE(engine.sessionActive());

  // A weekend tick does not arm anything.
  engine.pushMarketData(tick("NIFTY", 102.0, kSaturday + 1000));
  EXPECT_FALSE(engine.sessionActive());

  engine.stop();
}
