#include "orb/concurrent/event_loop_thread.hpp"

#include <chrono>
#include <exception>
#include <iostream>

namespace orb {

namespace {

// Idle wait between queue polls; bounds how long stop() takes to be noticed.
constexpr auto kIdleWaitTimeout = std::chrono::milliseconds(10);

}  // namespace

EventLoopThread::EventLoopThread(std::string name) : name_(std::move(name)) {}

EventLoopThread::~EventLoopThread() { stop(); }

void EventLoopThread::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

void EventLoopThread::stop() {
  if (!thread_.joinable()) {
    return;
  }
  running_.store(false);
  stop_cv_.notify_all();
  thread_.join();
}

void EventLoopThread::dispatch(const Event& event) {
  try {
    bus_.publish(event);
  } catch (const std::exception& e) {
    std::cerr << "[" << name_ << "] subscriber failed: " << e.what() << "\n";
  }
}

void EventLoopThread::run() {
  while (running_.load()) {
    std::optional<Event> event = queue_.try_pop();
    if (event) {
      dispatch(*event);
      continue;
    }

    std::unique_lock lock(stop_mutex_);
    stop_cv_.wait_for(lock, kIdleWaitTimeout,
                      [this] { return !running_.load(); });
  }

  // Final drain, still on the loop thread.
  while (auto event = queue_.try_pop()) {
    dispatch(*event);
  }
}

}  // namespace orb
