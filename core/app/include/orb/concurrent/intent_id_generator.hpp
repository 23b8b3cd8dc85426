#pragma once

#include <atomic>
#include <cstdint>

namespace orb {

// -----------------------------------------------------------------------------
// IntentIdGenerator: process-wide unique id source for OrderIntentEvents
// -----------------------------------------------------------------------------
//
// @details
// Owned by TradingEngine and injected by reference into every
// PositionStateMachine. Several instrument workers draw ids concurrently, so
// the counter is atomic; relaxed ordering suffices because only uniqueness
// is required. Ids start at 1 (0 means "unset").
// -----------------------------------------------------------------------------
class IntentIdGenerator {
 public:
  IntentIdGenerator() = default;

  IntentIdGenerator(const IntentIdGenerator&) = delete;
  IntentIdGenerator& operator=(const IntentIdGenerator&) = delete;
  IntentIdGenerator(IntentIdGenerator&&) = delete;
  IntentIdGenerator& operator=(IntentIdGenerator&&) = delete;

  std::uint64_t next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

 private:
  std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace orb
