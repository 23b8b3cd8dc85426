#pragma once

#include <cstddef>

namespace orb {
namespace domain {

// Parameters of the optional entry confirmations. A disabled filter is
// vacuously true.
struct VolumeFilterConfig {
  bool enabled{true};
  double multiple{1.2};        // current >= multiple x trailing average
  std::size_t window{20};      // trailing ticks averaged
};

struct MomentumFilterConfig {
  bool enabled{true};
  std::size_t ticks{3};        // including the triggering tick
  double tolerance{0.0};       // largest counter-move allowed, in points
};

struct PremiumCapFilterConfig {
  bool enabled{false};
  double max_percentage{5.0};  // max distance beyond the level, percent
};

struct FilterConfig {
  VolumeFilterConfig volume;
  MomentumFilterConfig momentum;
  PremiumCapFilterConfig premium_cap;
};

}  // namespace domain
}  // namespace orb
