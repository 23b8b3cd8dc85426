#pragma once

#include "orb/concurrent/event_loop_thread.hpp"
#include "orb/execution/i_execution_engine.hpp"
#include "orb/time/i_time_provider.hpp"

#include <memory>

namespace orb {

// -----------------------------------------------------------------------------
// OrderRoutingThread
// -----------------------------------------------------------------------------
// Dedicated event loop hosting the execution collaborator. Instrument
// workers push OrderIntentEvents here and move on; a slow execution engine
// therefore never stalls tick processing.
// -----------------------------------------------------------------------------
class OrderRoutingThread {
 public:
  explicit OrderRoutingThread(const ITimeProvider& time_provider);

  ~OrderRoutingThread();

  OrderRoutingThread(const OrderRoutingThread&) = delete;
  OrderRoutingThread& operator=(const OrderRoutingThread&) = delete;
  OrderRoutingThread(OrderRoutingThread&&) = delete;
  OrderRoutingThread& operator=(OrderRoutingThread&&) = delete;

  void start();

  // Drains pending intents before returning.
  void stop();

  void push(Event event);

  EventBus& eventBus();

 private:
  const ITimeProvider& time_provider_;
  EventLoopThread loop_{"order_routing"};
  std::unique_ptr<IExecutionEngine> execution_engine_;
  bool running_{false};
};

}  // namespace orb
