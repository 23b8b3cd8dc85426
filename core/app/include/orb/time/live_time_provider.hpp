#pragma once

#include "orb/time/i_time_provider.hpp"

namespace orb {

// -----------------------------------------------------------------------------
// LiveTimeProvider: wall-clock ITimeProvider
// -----------------------------------------------------------------------------
// Delegates to std::chrono::system_clock. Used by main() when the engine runs
// against a live tick feed; replays use SimulationTimeProvider instead.
// Stateless, so safe to read from any thread.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace orb
