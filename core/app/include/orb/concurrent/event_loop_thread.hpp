#pragma once

#include "orb/concurrent/thread_safe_queue.hpp"
#include "orb/eventbus/event_bus.hpp"
#include "orb/events/event.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace orb {

// -----------------------------------------------------------------------------
// EventLoopThread
// -----------------------------------------------------------------------------
// Responsibility: Owns one worker thread that drains a ThreadSafeQueue<Event>
// and publishes each event on its own EventBus. Every subscriber of that bus
// therefore runs on this single thread, which is what lets an instrument's
// strategy and state machine hold plain, unsynchronized state.
//
// Lifecycle: construct, subscribe to eventBus(), start(), push() from any
// thread, stop(). stop() publishes whatever is still queued before joining
// so that a final SessionCloseEvent or intent is never lost.
//
// A subscriber that throws std::exception is logged with the loop's name and
// the loop carries on with the next event.
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  explicit EventLoopThread(std::string name = "event_loop");

  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  // Idempotent.
  void start();

  // Drains the queue, then joins. Idempotent.
  void stop();

  void push(Event event) { queue_.push(std::move(event)); }

  EventBus& eventBus() { return bus_; }
  const EventBus& eventBus() const { return bus_; }

  const std::string& name() const { return name_; }

  bool isRunning() const { return running_.load(); }

  std::size_t pending() const { return queue_.size(); }

 private:
  void run();
  void dispatch(const Event& event);

  std::string name_;
  ThreadSafeQueue<Event> queue_;
  EventBus bus_;
  std::atomic<bool> running_{false};
  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;
  std::thread thread_;
};

}  // namespace orb
