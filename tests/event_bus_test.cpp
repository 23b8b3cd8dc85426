// =============================================================================
// event_bus_test.cpp
// =============================================================================
// Unit tests for orb::EventBus.
//
// Validates:
//   - Generic subscription sees every event kind of the envelope
//   - Typed subscription sees only its own kind
//   - Unsubscribe stops delivery; unknown ids are harmless
//   - A subscriber may publish from inside its callback (the state machine
//     publishes intents while handling a tick)
//   - Payloads survive the variant dispatch untouched
//
// Design note: single-threaded; cross-thread delivery is covered by
// event_loop_thread_test.cpp and trading_engine_test.cpp.
// =============================================================================

#include "orb/eventbus/event_bus.hpp"
#include "orb/events/event.hpp"
#include "orb/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

class EventBusTest : public ::testing::Test {
 protected:
  orb::EventBus bus;

  static orb::MarketDataEvent tick(const std::string& symbol, double price,
                                   double volume = 1.0) {
    orb::MarketDataEvent e;
    e.symbol = symbol;
    e.price = price;
    e.volume = volume;
    return e;
  }

  static orb::OrderIntentEvent enterIntent(const std::string& instrument) {
    orb::OrderIntentEvent e;
    e.instrument = instrument;
    e.action = orb::IntentAction::Enter;
    e.quantity = 75;
    return e;
  }
};

// -----------------------------------------------------------------------------
// 1. A generic subscriber is invoked for every kind.
// Why: the audit bridge and telemetry forwarder subscribe generically.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, GenericSubscriberReceivesEveryKind) {
  std::vector<std::size_t> kinds;
  bus.subscribe([&kinds](const orb::Event& e) { kinds.push_back(e.index()); });

  bus.publish(tick("NIFTY", 19500.0));
  bus.publish(orb::TimerEvent{});
  bus.publish(orb::FlattenEvent{"operator", {}, 0});
  bus.publish(enterIntent("NIFTY"));
  bus.publish(orb::RiskViolationEvent{});

  ASSERT_EQ(kinds.size(), 5u);
  EXPECT_EQ(kinds[0], 0u);
  EXPECT_EQ(kinds[1], 1u);
  EXPECT_EQ(kinds[3], 5u);
}

// -----------------------------------------------------------------------------
// 2. A typed subscriber fires only for its kind.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberFiltersByKind) {
  int ticks = 0;
  int intents = 0;
  bus.subscribe<orb::MarketDataEvent>(
      [&ticks](const orb::MarketDataEvent&) { ++ticks; });
  bus.subscribe<orb::OrderIntentEvent>(
      [&intents](const orb::OrderIntentEvent&) { ++intents; });

  bus.publish(tick("NIFTY", 19500.0));
  bus.publish(tick("BANKNIFTY", 44100.0));
  bus.publish(enterIntent("NIFTY"));
  bus.publish(orb::SessionCloseEvent{});

  EXPECT_EQ(ticks, 2);
  EXPECT_EQ(intents, 1);
}

TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
  int count = 0;
  auto id = bus.subscribe<orb::TimerEvent>(
      [&count](const orb::TimerEvent&) { ++count; });
  EXPECT_EQ(bus.subscriberCount(), 1u);

  bus.publish(orb::TimerEvent{});
  bus.unsubscribe(id);
  bus.publish(orb::TimerEvent{});

  EXPECT_EQ(count, 1);
  EXPECT_EQ(bus.subscriberCount(), 0u);
}

TEST_F(EventBusTest, UnknownIdAndEmptyBusAreHarmless) {
  EXPECT_NO_FATAL_FAILURE(bus.unsubscribe(4242));
  EXPECT_NO_FATAL_FAILURE(bus.publish(tick("NIFTY", 1.0)));
}

// -----------------------------------------------------------------------------
// 3. Publishing from inside a callback must not deadlock.
// Why: the state machine runs inside a MarketDataEvent callback and publishes
//      OrderIntentEvent and TradeLifecycleEvent on the same bus.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, SubscriberCanPublishInsideCallback) {
  std::vector<std::string> routed;
  bus.subscribe<orb::OrderIntentEvent>(
      [&routed](const orb::OrderIntentEvent& e) {
        routed.push_back(e.instrument);
      });
  bus.subscribe<orb::MarketDataEvent>([this](const orb::MarketDataEvent& md) {
    if (md.price > 19520.0) {
      bus.publish(enterIntent(md.symbol));
    }
  });

  bus.publish(tick("NIFTY", 19510.0));
  bus.publish(tick("NIFTY", 19525.0));

  ASSERT_EQ(routed.size(), 1u);
  EXPECT_EQ(routed[0], "NIFTY");
}

// -----------------------------------------------------------------------------
// 4. Subscribers see the exact payload that was published.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, PayloadSurvivesDispatch) {
  orb::TradeLifecycleEvent received;
  bus.subscribe<orb::TradeLifecycleEvent>(
      [&received](const orb::TradeLifecycleEvent& e) { received = e; });

  orb::TradeLifecycleEvent sent;
  sent.kind = orb::LifecycleKind::PartiallyClosed;
  sent.position.instrument = "BANKNIFTY";
  sent.position.remaining_quantity = 21;
  sent.quantity = 9;
  sent.price = 44180.5;
  sent.pnl_delta = 720.0;
  sent.timestamp = orb::ms_to_timestamp(1792037700000);
  bus.publish(sent);

  EXPECT_EQ(received.kind, orb::LifecycleKind::PartiallyClosed);
  EXPECT_EQ(received.position.instrument, "BANKNIFTY");
  EXPECT_EQ(received.position.remaining_quantity, 21);
  EXPECT_EQ(received.quantity, 9);
  EXPECT_DOUBLE_EQ(received.price, 44180.5);
  EXPECT_DOUBLE_EQ(received.pnl_delta, 720.0);
  EXPECT_EQ(orb::timestamp_to_ms(received.timestamp), 1792037700000);
}
