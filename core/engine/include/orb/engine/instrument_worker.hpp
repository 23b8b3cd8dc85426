#pragma once

#include "orb/concurrent/event_loop_thread.hpp"
#include "orb/concurrent/intent_id_generator.hpp"
#include "orb/domain/filter_config.hpp"
#include "orb/domain/instrument.hpp"
#include "orb/position/exit_policy.hpp"
#include "orb/risk/daily_risk_governor.hpp"
#include "orb/session/clock_gate.hpp"
#include "orb/strategy/breakout_strategy.hpp"

#include <memory>
#include <string>

namespace orb {

// -----------------------------------------------------------------------------
// InstrumentWorker
// -----------------------------------------------------------------------------
// One event loop thread per instrument, hosting that instrument's
// BreakoutStrategy. Ticks, timer ticks and session signals for the
// instrument all go through push(), so the strategy has a single writer and
// processes them in arrival order.
//
// The strategy subscribes in the constructor; callers add their bridges on
// eventBus() before start(). stop() drains the queue, then the strategy is
// destroyed while no thread can call into it.
// -----------------------------------------------------------------------------
class InstrumentWorker {
 public:
  InstrumentWorker(const domain::Instrument& instrument, const ClockGate& gate,
                   const ExitPolicy& policy,
                   const domain::FilterConfig& filters,
                   DailyRiskGovernor& governor, IntentIdGenerator& id_gen);

  ~InstrumentWorker();

  InstrumentWorker(const InstrumentWorker&) = delete;
  InstrumentWorker& operator=(const InstrumentWorker&) = delete;
  InstrumentWorker(InstrumentWorker&&) = delete;
  InstrumentWorker& operator=(InstrumentWorker&&) = delete;

  void start();
  void stop();

  void push(Event event) { loop_.push(std::move(event)); }

  EventBus& eventBus() { return loop_.eventBus(); }

  StrategySnapshot snapshot() const;

  const std::string& instrument() const { return instrument_; }

 private:
  std::string instrument_;
  EventLoopThread loop_;
  std::unique_ptr<BreakoutStrategy> strategy_;
};

}  // namespace orb
