#pragma once

#include "orb/concurrent/intent_id_generator.hpp"
#include "orb/domain/breakout_level.hpp"
#include "orb/domain/filter_config.hpp"
#include "orb/domain/instrument.hpp"
#include "orb/domain/position.hpp"
#include "orb/eventbus/event_bus.hpp"
#include "orb/events/event_types.hpp"
#include "orb/market/candle_aggregator.hpp"
#include "orb/market/opening_range_capture.hpp"
#include "orb/market/volatility_estimator.hpp"
#include "orb/position/exit_policy.hpp"
#include "orb/position/position_state_machine.hpp"
#include "orb/risk/daily_risk_governor.hpp"
#include "orb/session/clock_gate.hpp"
#include "orb/signal/entry_filter_engine.hpp"

#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace orb {

enum class StrategyPhase {
  Capturing,   // building the opening candle
  Armed,       // levels known, waiting for a confirmed breakout
  InPosition,  // a position is open
  Done,        // no further entries this session
  Disabled,    // opening range could not be captured
  Halted,      // sequencing bug detected; instrument frozen
};

inline const char* toString(StrategyPhase p) {
  switch (p) {
    case StrategyPhase::Capturing:  return "CAPTURING";
    case StrategyPhase::Armed:      return "ARMED";
    case StrategyPhase::InPosition: return "IN_POSITION";
    case StrategyPhase::Done:       return "DONE";
    case StrategyPhase::Disabled:   return "DISABLED";
    case StrategyPhase::Halted:     return "HALTED";
  }
  return "UNKNOWN";
}

// Read-only view published after every event for STATUS requests.
struct StrategySnapshot {
  std::string instrument;
  StrategyPhase phase{StrategyPhase::Capturing};
  std::optional<domain::BreakoutLevel> level;
  double atr{0.0};
  int entries_taken{0};
  bool entries_blocked{false};
  std::optional<domain::Position> open_position;
  std::size_t closed_trades{0};
  double realized_pnl{0.0};
};

// -----------------------------------------------------------------------------
// BreakoutStrategy
// -----------------------------------------------------------------------------
//
// @brief  The complete opening-range breakout pipeline for one instrument:
//         capture -> levels -> filtered entry -> managed position.
//
// @details
// Subscribes on the instrument worker's EventBus to:
//   MarketDataEvent    (own symbol only) capture, ATR candles, entries, exits
//   TimerEvent         capture close, ATR flush, time exits, force close
//   FlattenEvent       close with MANUAL, no further entries
//   SessionCloseEvent  close with SESSION_END, no further entries
//
// The tick that closes the capture window is not part of the opening candle;
// it is evaluated against the fresh breakout levels straight away.
//
// The entry filters see the ticks received after the capture window, oldest
// first, excluding the tick being evaluated.
//
// Failure isolation:
//   InsufficientDataError  -> Disabled (empty opening range)
//   PreconditionError      -> Halted   (lifecycle contract broken)
// Both are logged to std::cerr and leave every other instrument untouched.
//
// Entries: at most Instrument::max_entries per session. After a governor
// rejection the strategy stops asking for the rest of the session.
//
// Thread model:
//   Every handler runs on the worker loop thread. snapshot() is the only
//   method safe to call from other threads.
// -----------------------------------------------------------------------------
class BreakoutStrategy {
 public:
  BreakoutStrategy(domain::Instrument instrument, const ClockGate& gate,
                   const ExitPolicy& policy,
                   const domain::FilterConfig& filters, EventBus& bus,
                   DailyRiskGovernor& governor, IntentIdGenerator& id_gen);

  ~BreakoutStrategy();

  BreakoutStrategy(const BreakoutStrategy&) = delete;
  BreakoutStrategy& operator=(const BreakoutStrategy&) = delete;
  BreakoutStrategy(BreakoutStrategy&&) = delete;
  BreakoutStrategy& operator=(BreakoutStrategy&&) = delete;

  StrategySnapshot snapshot() const;

  // Worker-thread accessors.
  StrategyPhase phase() const { return phase_; }
  const std::optional<domain::BreakoutLevel>& level() const { return level_; }
  double currentATR() const { return atr_.currentATR(); }
  const std::vector<domain::Position>& closedPositions() const {
    return closed_;
  }
  const PositionStateMachine& stateMachine() const { return psm_; }
  const domain::Instrument& instrument() const { return instrument_; }

 private:
  void onMarketData(const MarketDataEvent& event);
  void onTimer(const TimerEvent& event);
  void onFlatten(const FlattenEvent& event);
  void onSessionClose(const SessionCloseEvent& event);

  void handleTick(double price, double volume, std::int64_t ts_ms);
  void handleTimer(std::int64_t now_ms);
  void closeForSession(domain::ExitReason reason, std::int64_t now_ms);

  void onCaptured();
  void considerEntry(const TickSample& sample);
  void onPositionClosed();
  void pushHistory(const TickSample& sample);
  bool isInert() const;

  void guarded(const char* what, const std::function<void()>& fn);
  void refreshSnapshot();

  domain::Instrument instrument_;
  const ClockGate& gate_;
  const ExitPolicy& policy_;
  EventBus& bus_;

  OpeningRangeCapture capture_;
  VolatilityEstimator atr_;
  EntryFilterEngine filters_;
  PositionStateMachine psm_;
  std::optional<CandleAggregator> aggregator_;

  StrategyPhase phase_{StrategyPhase::Capturing};
  std::optional<domain::BreakoutLevel> level_;
  std::deque<TickSample> history_;
  std::size_t history_limit_;
  std::vector<domain::Position> closed_;
  int entries_taken_{0};
  bool entries_blocked_{false};

  mutable std::shared_mutex snapshot_mutex_;
  StrategySnapshot snapshot_;

  std::vector<EventBus::SubscriptionId> subscriptions_;
};

}  // namespace orb
