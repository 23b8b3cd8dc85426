#include "orb/risk/daily_risk_governor.hpp"

#include <iostream>

namespace orb {

DailyRiskGovernor::DailyRiskGovernor(const domain::DailyRiskLimits& limits)
    : limits_(limits) {}

bool DailyRiskGovernor::gateOpenLocked(std::string* reason) const {
  if (state_.halted) {
    if (reason) *reason = "trading halted";
    return false;
  }
  if (state_.loss_limit_breached ||
      state_.realized_pnl <= limits_.max_daily_loss) {
    if (reason) *reason = "max daily loss reached";
    return false;
  }
  if (state_.trade_count >= limits_.max_trades_per_day) {
    if (reason) *reason = "max trades per day reached";
    return false;
  }
  return true;
}

bool DailyRiskGovernor::canOpenNewTrade() const {
  std::lock_guard lock(mutex_);
  return gateOpenLocked(nullptr);
}

void DailyRiskGovernor::recordTradeOpened() {
  std::lock_guard lock(mutex_);
  ++state_.trade_count;
  ++state_.open_trades;
}

bool DailyRiskGovernor::tryOpenTrade(std::string* reason) {
  std::lock_guard lock(mutex_);
  if (!gateOpenLocked(reason)) {
    return false;
  }
  ++state_.trade_count;
  ++state_.open_trades;
  return true;
}

bool DailyRiskGovernor::recordTradeClosed(double realized_pnl) {
  bool newly_breached = false;
  double pnl = 0.0;
  {
    std::lock_guard lock(mutex_);
    state_.realized_pnl += realized_pnl;
    if (state_.open_trades > 0) {
      --state_.open_trades;
    }
    if (!state_.loss_limit_breached &&
        state_.realized_pnl <= limits_.max_daily_loss) {
      state_.loss_limit_breached = true;
      newly_breached = true;
    }
    pnl = state_.realized_pnl;
  }

  if (newly_breached) {
    std::cerr << "[DailyRiskGovernor] CRITICAL: realized P&L " << pnl
              << " reached floor " << limits_.max_daily_loss
              << ". No new entries this session.\n";
  }
  return newly_breached;
}

void DailyRiskGovernor::haltTrading() {
  std::lock_guard lock(mutex_);
  state_.halted = true;
}

DailyRiskState DailyRiskGovernor::snapshot() const {
  std::lock_guard lock(mutex_);
  return state_;
}

}  // namespace orb
