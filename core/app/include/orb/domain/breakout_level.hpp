#pragma once

#include "orb/domain/candle.hpp"

#include <string>

namespace orb {
namespace domain {

// Upper/lower breakout thresholds derived from a captured opening candle.
// Immutable once computed; the candle it came from is kept for audit.
struct BreakoutLevel {
  std::string instrument;
  double upper{0.0};
  double lower{0.0};
  double buffer{0.0};
  Candle source;
};

}  // namespace domain
}  // namespace orb
