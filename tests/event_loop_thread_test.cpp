// =============================================================================
// event_loop_thread_test.cpp
// =============================================================================
// Unit tests for orb::EventLoopThread and orb::TimerThread.
//
// Validates:
//   - Events pushed from the test thread are dispatched on the loop thread
//   - stop() drains whatever is still queued
//   - A throwing subscriber does not kill the loop
//   - The timer thread reports the injected clock's time
// =============================================================================

#include "orb/concurrent/event_loop_thread.hpp"
#include "orb/concurrent/timer_thread.hpp"
#include "orb/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>

namespace {

orb::MarketDataEvent tick(double price) {
  orb::MarketDataEvent e;
  e.symbol = "NIFTY";
  e.price = price;
  return e;
}

}  // namespace

TEST(EventLoopThreadTest, DispatchesOnLoopThread) {
  orb::EventLoopThread loop("worker:NIFTY");
  std::promise<std::thread::id> seen_on;
  auto future = seen_on.get_future();

  loop.eventBus().subscribe<orb::MarketDataEvent>(
      [&seen_on](const orb::MarketDataEvent&) {
        seen_on.set_value(std::this_thread::get_id());
      });
  loop.start();
  EXPECT_TRUE(loop.isRunning());
  loop.push(tick(19500.0));

  ASSERT_EQ(future.wait_for(std::chrono::seconds(2)),
            std::future_status::ready);
  EXPECT_NE(future.get(), std::this_thread::get_id());
  loop.stop();
  EXPECT_FALSE(loop.isRunning());
  EXPECT_EQ(loop.name(), "worker:NIFTY");
}

// -----------------------------------------------------------------------------
// Why: a SessionCloseEvent pushed just before shutdown must still reach the
//      strategy so open positions are closed.
// -----------------------------------------------------------------------------
TEST(EventLoopThreadTest, StopDrainsQueuedEvents) {
  orb::EventLoopThread loop;
  std::atomic<int> delivered{0};
  std::promise<void> release;
  auto gate = release.get_future().share();

  loop.eventBus().subscribe<orb::MarketDataEvent>(
      [&delivered, gate](const orb::MarketDataEvent&) {
        gate.wait();
        delivered.fetch_add(1);
      });
  loop.eventBus().subscribe<orb::SessionCloseEvent>(
      [&delivered](const orb::SessionCloseEvent&) { delivered.fetch_add(1); });

  loop.start();
  for (int i = 0; i < 10; ++i) {
    loop.push(tick(100.0 + i));
  }
  loop.push(orb::SessionCloseEvent{});

  std::thread stopper([&loop] { loop.stop(); });
  release.set_value();
  stopper.join();

  EXPECT_EQ(delivered.load(), 11);
  EXPECT_EQ(loop.pending(), 0u);
}

TEST(EventLoopThreadTest, ThrowingSubscriberDoesNotKillLoop) {
  orb::EventLoopThread loop;
  std::promise<double> second;
  auto future = second.get_future();

  loop.eventBus().subscribe<orb::MarketDataEvent>(
      [&second](const orb::MarketDataEvent& e) {
        if (e.price < 0.0) {
          throw std::runtime_error("negative price");
        }
        second.set_value(e.price);
      });
  loop.start();
  loop.push(tick(-1.0));
  loop.push(tick(19501.0));

  ASSERT_EQ(future.wait_for(std::chrono::seconds(2)),
            std::future_status::ready);
  EXPECT_DOUBLE_EQ(future.get(), 19501.0);
  loop.stop();
}

TEST(TimerThreadTest, ReportsInjectedClockTime) {
  orb::SimulationTimeProvider clock(1792035900000);
  std::promise<std::int64_t> first;
  auto future = first.get_future();
  std::atomic<bool> fired{false};

  orb::TimerThread timer(clock, std::chrono::milliseconds(5),
                         [&](std::int64_t now_ms) {
                           if (!fired.exchange(true)) {
                             first.set_value(now_ms);
                           }
                         });
  timer.start();

  ASSERT_EQ(future.wait_for(std::chrono::seconds(2)),
            std::future_status::ready);
  EXPECT_EQ(future.get(), 1792035900000);
  timer.stop();
}
