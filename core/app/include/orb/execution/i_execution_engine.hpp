#pragma once

namespace orb {

// -----------------------------------------------------------------------------
// IExecutionEngine: seam for the order-execution collaborator
// -----------------------------------------------------------------------------
//
// @details
// An execution engine subscribes to OrderIntentEvent on the order-routing
// loop's EventBus in its constructor and reports outcomes as
// ExecutionReportEvent on the same bus. The bus is its only entry point, so
// the interface needs nothing beyond a virtual destructor; it lets
// OrderRoutingThread hold a unique_ptr and swap the paper engine for a
// broker adapter without touching orchestration code.
// -----------------------------------------------------------------------------
class IExecutionEngine {
 public:
  virtual ~IExecutionEngine() = default;
};

}  // namespace orb
