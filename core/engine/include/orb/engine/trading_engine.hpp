#pragma once

#include "orb/concurrent/event_loop_thread.hpp"
#include "orb/concurrent/intent_id_generator.hpp"
#include "orb/concurrent/timer_thread.hpp"
#include "orb/config/engine_config.hpp"
#include "orb/engine/instrument_worker.hpp"
#include "orb/network/ipc_server.hpp"
#include "orb/network/market_data_thread.hpp"
#include "orb/network/order_routing_thread.hpp"
#include "orb/position/exit_policy.hpp"
#include "orb/risk/daily_risk_governor.hpp"
#include "orb/session/clock_gate.hpp"
#include "orb/time/i_time_provider.hpp"
#include "orb/time/simulation_time_provider.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace orb {

// -----------------------------------------------------------------------------
// TradingEngine
// -----------------------------------------------------------------------------
//
// @brief  Owns every thread and component and wires them together.
//
// @details
// Threads:
//   worker:<id>     one per enabled instrument, created by startSession()
//   audit           receives every intent, lifecycle, reject, violation and
//                   execution report; forwards them to IPC telemetry
//   order_routing   PaperExecutionEngine
//   timer           pushes TimerEvent into every worker
//   market_data     ZeroMQ tick ingress (if an endpoint is configured)
//   ipc             ZeroMQ command / telemetry (if endpoints are configured)
//
// Flow:
//   tick -> pushMarketData() -> worker:<symbol> -> BreakoutStrategy
//        -> OrderIntentEvent -> order_routing (+ audit)
//        -> TradeLifecycleEvent / RiskRejectEvent / RiskViolationEvent -> audit
//   order_routing ExecutionReportEvent -> audit
//   audit -> IpcServer PUB
//
// Session lifecycle:
//   startSession(open_ms) builds the ClockGate, a fresh DailyRiskGovernor
//   and one worker per enabled instrument; on a weekend or holiday it logs
//   and arms nothing. forceCloseSession() sends SESSION_END to every worker.
//   In replay mode the session is started from the first tick's date, and
//   rolled over when a tick of a later day arrives.
//
// Every worker-to-collaborator hand-off is a queue push; no worker ever
// waits on execution, audit or IPC.
// -----------------------------------------------------------------------------
class TradingEngine {
 public:
  TradingEngine(EngineConfig config, const ITimeProvider& clock,
                SimulationTimeProvider* replay_clock = nullptr);

  ~TradingEngine();

  TradingEngine(const TradingEngine&) = delete;
  TradingEngine& operator=(const TradingEngine&) = delete;
  TradingEngine(TradingEngine&&) = delete;
  TradingEngine& operator=(TradingEngine&&) = delete;

  void start();

  void stop();

  // @return false on a non-trading day (no worker is armed).
  bool startSession(std::int64_t session_open_ms);

  void forceCloseSession();

  // Operator "flatten all": MANUAL close everywhere, no further entries.
  void flattenAll(const std::string& reason);

  // Routes to the instrument's worker; unknown symbols are dropped.
  void pushMarketData(MarketDataEvent event);

  // MarketDataEvent is routed; every other event is broadcast to workers.
  void pushEvent(Event event);

  // PING | STATUS | FLATTEN | CLOSE_SESSION -> JSON reply.
  std::string executeCommand(const std::string& cmd);

  EventBus& auditEventBus();
  EventBus& orderRoutingEventBus();

  bool sessionActive() const;
  std::optional<DailyRiskState> governorState() const;
  std::vector<StrategySnapshot> snapshots() const;

 private:
  struct Session {
    std::unique_ptr<ClockGate> gate;
    std::unique_ptr<DailyRiskGovernor> governor;
    std::vector<std::unique_ptr<InstrumentWorker>> workers;
    std::map<std::string, InstrumentWorker*> by_symbol;
  };

  void wireWorker(InstrumentWorker& worker);
  void broadcast(const Event& event);
  void endSessionLocked();
  void maybeRollSession(std::int64_t tick_ms);

  const EngineConfig config_;
  const ITimeProvider& clock_;
  SimulationTimeProvider* replay_clock_;

  IntentIdGenerator intent_ids_;
  ExitPolicy exit_policy_;

  EventLoopThread audit_loop_{"audit"};
  std::unique_ptr<OrderRoutingThread> order_routing_thread_;
  std::unique_ptr<TimerThread> timer_thread_;
  std::unique_ptr<MarketDataThread> market_data_thread_;
  std::unique_ptr<IpcServer> ipc_server_;

  mutable std::shared_mutex session_mutex_;
  std::optional<Session> session_;
  std::atomic<std::int64_t> last_session_open_ms_{0};

  std::optional<EventBus::SubscriptionId> telemetry_sub_id_;
  std::atomic<bool> running_{false};
};

}  // namespace orb
