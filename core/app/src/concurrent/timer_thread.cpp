#include "orb/concurrent/timer_thread.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace orb {

TimerThread::TimerThread(const ITimeProvider& clock,
                         std::chrono::milliseconds interval, Callback callback)
    : clock_(clock), interval_(interval), callback_(std::move(callback)) {}

TimerThread::~TimerThread() { stop(); }

void TimerThread::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
  std::cout << "[TimerThread] started, interval=" << interval_.count()
            << "ms\n";
}

void TimerThread::stop() {
  if (!thread_.joinable()) {
    return;
  }
  running_.store(false);
  cv_.notify_all();
  thread_.join();
  std::cout << "[TimerThread] stopped.\n";
}

void TimerThread::run() {
  std::unique_lock lock(mutex_);
  while (running_.load()) {
    if (cv_.wait_for(lock, interval_, [this] { return !running_.load(); })) {
      break;
    }

    lock.unlock();
    try {
      callback_(clock_.now_ms());
    } catch (const std::exception& e) {
      std::cerr << "[TimerThread] callback failed: " << e.what() << "\n";
    }
    lock.lock();
  }
}

}  // namespace orb
