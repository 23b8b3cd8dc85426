#pragma once

namespace orb {
namespace domain {

// -----------------------------------------------------------------------------
// DailyRiskLimits: session-wide hard limits enforced by DailyRiskGovernor
// -----------------------------------------------------------------------------
//
// @brief  Caps on how many trades may be opened and how much may be lost in
//         one session, across every instrument.
//
// @details
// Sign convention:
//   max_daily_loss is a NEGATIVE number: the realized-P&L floor. A new entry
//   is allowed only while realized P&L is strictly above it. Reaching the
//   floor closes the gate for the rest of the session.
//
// Copied by value into the governor at session start; immutable afterwards.
// -----------------------------------------------------------------------------
struct DailyRiskLimits {
  /// Maximum entries accepted per session, all instruments combined.
  int max_trades_per_day{3};

  /// Realized P&L floor (negative). Entries stop once P&L <= this value.
  double max_daily_loss{-5000.0};
};

}  // namespace domain
}  // namespace orb
