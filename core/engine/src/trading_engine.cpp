#include "orb/engine/trading_engine.hpp"

#include "orb/events/event_json.hpp"
#include "orb/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <iostream>
#include <mutex>
#include <utility>

namespace orb {

TradingEngine::TradingEngine(EngineConfig config, const ITimeProvider& clock,
                             SimulationTimeProvider* replay_clock)
    : config_(std::move(config)),
      clock_(clock),
      replay_clock_(replay_clock),
      exit_policy_(config_.risk, config_.ladder) {
  order_routing_thread_ = std::make_unique<OrderRoutingThread>(clock_);
  order_routing_thread_->eventBus().subscribe<ExecutionReportEvent>(
      [this](const ExecutionReportEvent& e) { audit_loop_.push(e); });
}

TradingEngine::~TradingEngine() { stop(); }

// -----------------------------------------------------------------------------
// start(): collaborators first, then ingress
// -----------------------------------------------------------------------------
void TradingEngine::start() {
  if (running_) {
    return;
  }

  const NetworkConfig& net = config_.network;
  if (!net.ipc_cmd_endpoint.empty() && !net.ipc_pub_endpoint.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        net.ipc_cmd_endpoint, net.ipc_pub_endpoint);
    telemetry_sub_id_ = audit_loop_.eventBus().subscribe(
        [this](const Event& e) { ipc_server_->pushTelemetry(e); });
    ipc_server_->start();
  }

  audit_loop_.start();
  order_routing_thread_->start();
  running_ = true;

  {
    std::shared_lock lock(session_mutex_);
    if (session_) {
      for (auto& worker : session_->workers) {
        worker->start();
      }
    }
  }

  timer_thread_ = std::make_unique<TimerThread>(
      clock_, std::chrono::milliseconds(config_.session.timer_interval_ms),
      [this](std::int64_t now_ms) {
        TimerEvent tick;
        tick.timestamp = ms_to_timestamp(now_ms);
        broadcast(tick);
      });
  timer_thread_->start();

  if (!net.market_data_endpoint.empty()) {
    market_data_thread_ = std::make_unique<MarketDataThread>(
        replay_clock_,
        [this](Event event) { pushEvent(std::move(event)); },
        net.market_data_endpoint);
    market_data_thread_->start();
  }

  std::cout << "[TradingEngine] started. Threads: audit, order_routing, timer"
            << (market_data_thread_ ? ", market_data" : "")
            << (ipc_server_ ? ", ipc" : "") << ".\n";
}

// -----------------------------------------------------------------------------
// stop(): ingress first, then each stage drains into the next
// -----------------------------------------------------------------------------
void TradingEngine::stop() {
  if (!running_) {
    return;
  }

  market_data_thread_.reset();
  timer_thread_.reset();

  {
    std::unique_lock lock(session_mutex_);
    endSessionLocked();
  }

  order_routing_thread_->stop();
  audit_loop_.stop();
  if (telemetry_sub_id_) {
    audit_loop_.eventBus().unsubscribe(*telemetry_sub_id_);
    telemetry_sub_id_.reset();
  }
  ipc_server_.reset();

  running_ = false;

  std::cout << "[TradingEngine] stopped. All threads joined.\n";
}

// -----------------------------------------------------------------------------
// Session lifecycle
// -----------------------------------------------------------------------------
bool TradingEngine::startSession(std::int64_t session_open_ms) {
  std::unique_lock lock(session_mutex_);
  endSessionLocked();

  auto gate = std::make_unique<ClockGate>(config_.session, session_open_ms);
  const std::string date = ClockGate::localDate(config_.session,
                                                session_open_ms);
  if (!gate->isTradingDay(session_open_ms)) {
    std::cout << "[TradingEngine] " << date
              << " is not a trading day. No instrument armed.\n";
    return false;
  }

  Session session;
  session.gate = std::move(gate);
  session.governor = std::make_unique<DailyRiskGovernor>(config_.governor);

  for (const auto& instrument : config_.instruments) {
    if (!instrument.enabled) {
      std::cout << "[TradingEngine] " << instrument.id
                << " disabled in configuration.\n";
      continue;
    }
    auto worker = std::make_unique<InstrumentWorker>(
        instrument, *session.gate, exit_policy_, config_.filters,
        *session.governor, intent_ids_);
    wireWorker(*worker);
    session.by_symbol[instrument.id] = worker.get();
    session.workers.push_back(std::move(worker));
  }

  if (running_) {
    for (auto& worker : session.workers) {
      worker->start();
    }
  }

  std::cout << "[TradingEngine] session " << date << " opened with "
            << session.workers.size() << " instrument(s).\n";
  session_ = std::move(session);
  return true;
}

void TradingEngine::forceCloseSession() {
  SessionCloseEvent close;
  close.timestamp = ms_to_timestamp(clock_.now_ms());

  std::shared_lock lock(session_mutex_);
  if (!session_) {
    return;
  }
  session_->governor->haltTrading();
  for (auto& worker : session_->workers) {
    worker->push(close);
  }
  std::cout << "[TradingEngine] session close requested.\n";
}

void TradingEngine::flattenAll(const std::string& reason) {
  FlattenEvent flatten;
  flatten.reason = reason;
  flatten.timestamp = ms_to_timestamp(clock_.now_ms());

  std::shared_lock lock(session_mutex_);
  if (!session_) {
    return;
  }
  session_->governor->haltTrading();
  for (auto& worker : session_->workers) {
    worker->push(flatten);
  }
  std::cerr << "[TradingEngine] FLATTEN ALL: " << reason << "\n";
}

void TradingEngine::endSessionLocked() {
  if (!session_) {
    return;
  }

  SessionCloseEvent close;
  close.timestamp = ms_to_timestamp(clock_.now_ms());
  for (auto& worker : session_->workers) {
    worker->push(close);
  }
  // Workers drain (including the close) before they are destroyed.
  for (auto& worker : session_->workers) {
    worker->stop();
  }

  const DailyRiskState state = session_->governor->snapshot();
  std::cout << "[TradingEngine] session ended. trades=" << state.trade_count
            << " realized_pnl=" << state.realized_pnl << "\n";
  session_.reset();
}

void TradingEngine::maybeRollSession(std::int64_t tick_ms) {
  const std::int64_t open_ms =
      ClockGate::sessionOpenFor(config_.session, tick_ms);
  {
    std::shared_lock lock(session_mutex_);
    if (session_ && session_->gate->sessionOpenMs() >= open_ms) {
      return;
    }
    if (!session_ && last_session_open_ms_ == open_ms) {
      return;
    }
  }
  last_session_open_ms_ = open_ms;
  startSession(open_ms);
}

// -----------------------------------------------------------------------------
// Wiring
// -----------------------------------------------------------------------------
void TradingEngine::wireWorker(InstrumentWorker& worker) {
  EventBus& bus = worker.eventBus();
  bus.subscribe<OrderIntentEvent>([this](const OrderIntentEvent& e) {
    order_routing_thread_->push(e);
    audit_loop_.push(e);
  });
  bus.subscribe<TradeLifecycleEvent>(
      [this](const TradeLifecycleEvent& e) { audit_loop_.push(e); });
  bus.subscribe<RiskRejectEvent>(
      [this](const RiskRejectEvent& e) { audit_loop_.push(e); });
  bus.subscribe<RiskViolationEvent>(
      [this](const RiskViolationEvent& e) { audit_loop_.push(e); });
}

void TradingEngine::broadcast(const Event& event) {
  std::shared_lock lock(session_mutex_);
  if (!session_) {
    return;
  }
  for (auto& worker : session_->workers) {
    worker->push(event);
  }
}

void TradingEngine::pushMarketData(MarketDataEvent event) {
  if (replay_clock_ != nullptr) {
    maybeRollSession(timestamp_to_ms(event.timestamp));
  }

  std::shared_lock lock(session_mutex_);
  if (!session_) {
    return;
  }
  auto it = session_->by_symbol.find(event.symbol);
  if (it == session_->by_symbol.end()) {
    return;
  }
  it->second->push(std::move(event));
}

void TradingEngine::pushEvent(Event event) {
  if (auto* md = std::get_if<MarketDataEvent>(&event)) {
    pushMarketData(std::move(*md));
    return;
  }
  broadcast(event);
}

// -----------------------------------------------------------------------------
// executeCommand(): operator commands from the IPC thread
// -----------------------------------------------------------------------------
std::string TradingEngine::executeCommand(const std::string& cmd) {
  nlohmann::json response;

  if (cmd == "PING") {
    response["status"] = "ok";
    response["response"] = "PONG";
  } else if (cmd == "STATUS") {
    response["status"] = "ok";
    response["session_active"] = sessionActive();
    response["now_ms"] = clock_.now_ms();

    if (auto gov = governorState()) {
      nlohmann::json g;
      g["realized_pnl"] = gov->realized_pnl;
      g["trade_count"] = gov->trade_count;
      g["open_trades"] = gov->open_trades;
      g["loss_limit_breached"] = gov->loss_limit_breached;
      g["halted"] = gov->halted;
      g["max_trades_per_day"] = config_.governor.max_trades_per_day;
      g["max_daily_loss"] = config_.governor.max_daily_loss;
      response["governor"] = std::move(g);
    }

    nlohmann::json instruments = nlohmann::json::array();
    for (const auto& snap : snapshots()) {
      nlohmann::json s;
      s["instrument"] = snap.instrument;
      s["phase"] = toString(snap.phase);
      s["atr"] = snap.atr;
      s["entries_taken"] = snap.entries_taken;
      s["entries_blocked"] = snap.entries_blocked;
      s["closed_trades"] = snap.closed_trades;
      s["realized_pnl"] = snap.realized_pnl;
      if (snap.level) {
        s["upper"] = snap.level->upper;
        s["lower"] = snap.level->lower;
      }
      if (snap.open_position) {
        s["position"] = positionToJson(*snap.open_position);
      }
      instruments.push_back(std::move(s));
    }
    response["instruments"] = std::move(instruments);
  } else if (cmd == "FLATTEN") {
    flattenAll("operator command");
    response["status"] = "ok";
    response["response"] = "Flatten requested";
  } else if (cmd == "CLOSE_SESSION") {
    forceCloseSession();
    response["status"] = "ok";
    response["response"] = "Session close requested";
  } else {
    response["status"] = "error";
    response["response"] = "Unknown command: " + cmd;
  }

  return response.dump();
}

// -----------------------------------------------------------------------------
// Accessors
// -----------------------------------------------------------------------------
EventBus& TradingEngine::auditEventBus() { return audit_loop_.eventBus(); }

EventBus& TradingEngine::orderRoutingEventBus() {
  return order_routing_thread_->eventBus();
}

bool TradingEngine::sessionActive() const {
  std::shared_lock lock(session_mutex_);
  return session_.has_value();
}

std::optional<DailyRiskState> TradingEngine::governorState() const {
  std::shared_lock lock(session_mutex_);
  if (!session_) {
    return std::nullopt;
  }
  return session_->governor->snapshot();
}

std::vector<StrategySnapshot> TradingEngine::snapshots() const {
  std::shared_lock lock(session_mutex_);
  std::vector<StrategySnapshot> result;
  if (!session_) {
    return result;
  }
  result.reserve(session_->workers.size());
  for (const auto& worker : session_->workers) {
    result.push_back(worker->snapshot());
  }
  return result;
}

}  // namespace orb
