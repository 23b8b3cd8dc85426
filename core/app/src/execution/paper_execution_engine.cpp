#include "orb/execution/paper_execution_engine.hpp"

#include "orb/events/execution_report_event.hpp"
#include "orb/time/time_utils.hpp"

#include <iostream>

namespace orb {

PaperExecutionEngine::PaperExecutionEngine(EventBus& bus,
                                           const ITimeProvider& time_provider)
    : bus_(bus), time_provider_(time_provider) {
  subscription_id_ = bus_.subscribe<OrderIntentEvent>(
      [this](const OrderIntentEvent& e) { onIntent(e); });
}

PaperExecutionEngine::~PaperExecutionEngine() {
  bus_.unsubscribe(subscription_id_);
}

void PaperExecutionEngine::onIntent(const OrderIntentEvent& event) {
  const auto ts = ms_to_timestamp(time_provider_.now_ms());

  ExecutionReportEvent ack;
  ack.intent_id = event.intent_id;
  ack.instrument = event.instrument;
  ack.status = ExecutionStatus::Accepted;
  ack.timestamp = ts;
  ack.sequence_id = event.sequence_id;
  bus_.publish(ack);

  ExecutionReportEvent fill = ack;
  fill.status = ExecutionStatus::Filled;
  fill.filled_quantity = event.quantity;
  fill.fill_price = event.price_hint;
  bus_.publish(fill);
  ++filled_;

  std::cout << "[PaperExecution] " << toString(event.action) << " "
            << event.instrument << " qty=" << event.quantity << " @ "
            << event.price_hint;
  if (event.action == IntentAction::Enter) {
    std::cout << " strike=" << event.strike_hint;
  }
  std::cout << " (intent " << event.intent_id << ")\n";
}

}  // namespace orb
