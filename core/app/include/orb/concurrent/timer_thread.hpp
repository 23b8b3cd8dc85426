#pragma once

#include "orb/time/i_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace orb {

// -----------------------------------------------------------------------------
// TimerThread
// -----------------------------------------------------------------------------
// Responsibility: Calls a callback every `interval` of real time, passing the
// engine clock's now_ms(). TradingEngine uses it to push TimerEvents into
// every instrument worker so time-based exits fire without ticks.
//
// The wait is a condition-variable wait_for, so stop() returns promptly
// regardless of the interval.
// -----------------------------------------------------------------------------
class TimerThread {
 public:
  using Callback = std::function<void(std::int64_t now_ms)>;

  TimerThread(const ITimeProvider& clock, std::chrono::milliseconds interval,
              Callback callback);

  ~TimerThread();

  TimerThread(const TimerThread&) = delete;
  TimerThread& operator=(const TimerThread&) = delete;
  TimerThread(TimerThread&&) = delete;
  TimerThread& operator=(TimerThread&&) = delete;

  void start();
  void stop();

 private:
  void run();

  const ITimeProvider& clock_;
  std::chrono::milliseconds interval_;
  Callback callback_;

  std::atomic<bool> running_{false};
  std::mutex mutex_;
  std::condition_variable cv_;
  std::thread thread_;
};

}  // namespace orb
