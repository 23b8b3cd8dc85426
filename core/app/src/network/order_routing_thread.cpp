#include "orb/network/order_routing_thread.hpp"

#include "orb/execution/paper_execution_engine.hpp"

#include <iostream>
#include <utility>

namespace orb {

OrderRoutingThread::OrderRoutingThread(const ITimeProvider& time_provider)
    : time_provider_(time_provider) {}

OrderRoutingThread::~OrderRoutingThread() { stop(); }

void OrderRoutingThread::start() {
  if (running_) {
    return;
  }

  // Subscribe before the loop runs so no intent is published unobserved.
  execution_engine_ =
      std::make_unique<PaperExecutionEngine>(loop_.eventBus(), time_provider_);
  loop_.start();
  running_ = true;

  std::cout << "[OrderRoutingThread] started (PaperExecution).\n";
}

void OrderRoutingThread::stop() {
  if (!running_) {
    return;
  }

  loop_.stop();
  execution_engine_.reset();
  running_ = false;

  std::cout << "[OrderRoutingThread] stopped.\n";
}

void OrderRoutingThread::push(Event event) { loop_.push(std::move(event)); }

EventBus& OrderRoutingThread::eventBus() { return loop_.eventBus(); }

}  // namespace orb
