#pragma once

#include <vector>

namespace orb {
namespace domain {

// -----------------------------------------------------------------------------
// RiskConfig: per-position stop, target, holding and trailing parameters
// -----------------------------------------------------------------------------
// All distances are in price points of the instrument's tick stream.
// Fractions are in [0, 1].
// -----------------------------------------------------------------------------
struct RiskConfig {
  double stop_loss_points{30.0};

  /// Fixed target distance. Zero derives the target from the stop distance
  /// at a 2:1 reward-to-risk ratio.
  double target_points{0.0};

  double breakout_buffer{2.0};

  bool use_atr_stop{false};
  double atr_multiplier{0.5};
  int atr_period{14};

  /// ATR reported while fewer than atr_period candles have been seen. Zero
  /// makes an ATR-configured stop fall back to stop_loss_points.
  double atr_fallback{0.0};

  double max_holding_minutes{120.0};

  bool trailing_enabled{true};

  /// Trailing arms once unrealized profit reaches this fraction of the
  /// target distance.
  double trailing_activation_fraction{0.5};

  /// Once armed, the stop trails the price by this fraction of the current
  /// profit: stop = price - trail_fraction * (price - entry).
  double trailing_trail_fraction{0.5};
};

// One rung of the scheduled partial-exit ladder.
struct LadderStep {
  double time_minutes{0.0};            // Elapsed since entry
  double min_profit_percentage{0.0};   // Unrealized profit gate, percent
  double exit_percentage{0.0};         // Of the CURRENT remaining quantity
};

// Steps are sorted by strictly ascending time_minutes (validated on load).
struct ExitLadder {
  bool enabled{false};
  std::vector<LadderStep> steps;
};

}  // namespace domain
}  // namespace orb
