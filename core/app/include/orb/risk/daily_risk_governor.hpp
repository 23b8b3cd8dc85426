#pragma once

#include "orb/domain/risk_limits.hpp"

#include <mutex>
#include <string>

namespace orb {

// Session counters exposed to STATUS and tests.
struct DailyRiskState {
  double realized_pnl{0.0};
  int trade_count{0};
  int open_trades{0};
  bool loss_limit_breached{false};
  bool halted{false};
};

// -----------------------------------------------------------------------------
// DailyRiskGovernor
// -----------------------------------------------------------------------------
//
// @brief  The one piece of state shared by every instrument worker: the
//         session's trade count and realized P&L, and the gate they drive.
//
// @details
// canOpenNewTrade() = trade_count < max_trades_per_day
//                     AND realized_pnl > max_daily_loss
//                     AND not halted.
//
// Once the loss floor is reached, or haltTrading() is called, the gate stays
// shut for the rest of the session. A new session constructs a new governor.
//
// tryOpenTrade() performs the check and the increment under one lock, so
// two workers racing for the last slot cannot both get it. Workers call it
// rather than the canOpenNewTrade() / recordTradeOpened() pair.
//
// Thread model:
//   Owned by TradingEngine, shared by reference. Every member is guarded by
//   mutex_; no method calls out while holding it.
// -----------------------------------------------------------------------------
class DailyRiskGovernor {
 public:
  explicit DailyRiskGovernor(const domain::DailyRiskLimits& limits);

  DailyRiskGovernor(const DailyRiskGovernor&) = delete;
  DailyRiskGovernor& operator=(const DailyRiskGovernor&) = delete;

  bool canOpenNewTrade() const;

  void recordTradeOpened();

  // -------------------------------------------------------------------------
  // tryOpenTrade()
  // -------------------------------------------------------------------------
  // @return true and counts the trade if the gate is open; false otherwise,
  //         with the reason written to `reason` when non-null.
  // -------------------------------------------------------------------------
  bool tryOpenTrade(std::string* reason = nullptr);

  // -------------------------------------------------------------------------
  // recordTradeClosed()
  // -------------------------------------------------------------------------
  // @brief  Adds a trade's total realized P&L at its terminal close.
  //
  // @return true exactly once: on the close that first pushes session P&L
  //         to or below the floor. The caller publishes the violation.
  // -------------------------------------------------------------------------
  bool recordTradeClosed(double realized_pnl);

  // Manual kill switch (operator FLATTEN, session close).
  void haltTrading();

  DailyRiskState snapshot() const;

  const domain::DailyRiskLimits& limits() const { return limits_; }

 private:
  bool gateOpenLocked(std::string* reason) const;

  const domain::DailyRiskLimits limits_;
  mutable std::mutex mutex_;
  DailyRiskState state_;
};

}  // namespace orb
