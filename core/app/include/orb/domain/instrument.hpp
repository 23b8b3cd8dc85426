#pragma once

#include <cmath>
#include <cstdint>
#include <string>

namespace orb {
namespace domain {

// -----------------------------------------------------------------------------
// Instrument: one tradable underlying (e.g. NIFTY, BANKNIFTY)
// -----------------------------------------------------------------------------
// Loaded once from configuration and never mutated. step_size is the option
// strike spacing used to pick the at-the-money contract for an entry.
// -----------------------------------------------------------------------------
struct Instrument {
  std::string id;               // Symbol on the tick stream
  double step_size{50.0};       // Strike spacing
  bool enabled{true};           // Disabled instruments get no worker
  std::int64_t quantity{0};     // Units per entry (lots x lot size)
  int max_entries{1};           // Entries allowed per session
};

// Nearest strike to spot on the instrument's strike grid. A non-positive
// step size returns spot unchanged.
inline double atmStrike(double spot, double step_size) {
  if (step_size <= 0.0) {
    return spot;
  }
  return std::round(spot / step_size) * step_size;
}

}  // namespace domain
}  // namespace orb
