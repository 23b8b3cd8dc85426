#pragma once

#include "orb/eventbus/event_bus.hpp"
#include "orb/events/order_intent_event.hpp"
#include "orb/execution/i_execution_engine.hpp"
#include "orb/time/i_time_provider.hpp"

#include <cstdint>

namespace orb {

// -----------------------------------------------------------------------------
// PaperExecutionEngine
// -----------------------------------------------------------------------------
// Acknowledges every intent with an Accepted report, then fills it in full
// at its price hint, stamped with the injected clock. Nothing is fed back
// into the decision core.
// -----------------------------------------------------------------------------
class PaperExecutionEngine final : public IExecutionEngine {
 public:
  PaperExecutionEngine(EventBus& bus, const ITimeProvider& time_provider);

  ~PaperExecutionEngine() override;

  PaperExecutionEngine(const PaperExecutionEngine&) = delete;
  PaperExecutionEngine& operator=(const PaperExecutionEngine&) = delete;
  PaperExecutionEngine(PaperExecutionEngine&&) = delete;
  PaperExecutionEngine& operator=(PaperExecutionEngine&&) = delete;

  std::uint64_t filledCount() const { return filled_; }

 private:
  void onIntent(const OrderIntentEvent& event);

  EventBus& bus_;
  const ITimeProvider& time_provider_;
  EventBus::SubscriptionId subscription_id_{0};
  std::uint64_t filled_{0};
};

}  // namespace orb
