#pragma once

#include "orb/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace orb {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: replay / test clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose value is set by whoever drives the replay:
//         the MarketDataGateway (one advance per decoded tick) or a test.
//
// @details
// The gateway advances the clock BEFORE enqueueing the tick, so a worker
// that reads now_ms() while handling the tick sees the tick's own time.
// Monotonicity is the caller's responsibility; tests occasionally rewind
// on purpose.
//
// Storage is a single std::atomic<int64_t>: one writer (gateway or test
// thread), many readers (instrument workers, timer thread).
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;

  // Starts the clock at a given instant (e.g. session open in a test).
  explicit SimulationTimeProvider(std::int64_t start_ms);

  std::int64_t now_ms() const override;

  // Sets the clock to new_time_ms.
  void advance_time(std::int64_t new_time_ms);

  // Moves the clock forward by delta_ms. Convenience for tests that think
  // in elapsed time rather than absolute timestamps.
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace orb
