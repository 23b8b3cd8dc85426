#include "orb/strategy/breakout_strategy.hpp"

#include "orb/domain/errors.hpp"
#include "orb/signal/breakout_calculator.hpp"
#include "orb/time/time_utils.hpp"

#include <algorithm>
#include <iostream>
#include <mutex>
#include <utility>

namespace orb {

BreakoutStrategy::BreakoutStrategy(domain::Instrument instrument,
                                   const ClockGate& gate,
                                   const ExitPolicy& policy,
                                   const domain::FilterConfig& filters,
                                   EventBus& bus, DailyRiskGovernor& governor,
                                   IntentIdGenerator& id_gen)
    : instrument_(std::move(instrument)),
      gate_(gate),
      policy_(policy),
      bus_(bus),
      capture_(instrument_.id, gate_),
      atr_(static_cast<std::size_t>(std::max(1, policy.risk().atr_period)),
           policy.risk().atr_fallback),
      filters_(filters),
      psm_(instrument_.id, policy_, bus_, governor, id_gen),
      history_limit_(std::max<std::size_t>(filters_.requiredHistory(), 1)) {
  snapshot_.instrument = instrument_.id;
  snapshot_.atr = atr_.currentATR();

  subscriptions_.push_back(bus_.subscribe<MarketDataEvent>(
      [this](const MarketDataEvent& e) { onMarketData(e); }));
  subscriptions_.push_back(bus_.subscribe<TimerEvent>(
      [this](const TimerEvent& e) { onTimer(e); }));
  subscriptions_.push_back(bus_.subscribe<FlattenEvent>(
      [this](const FlattenEvent& e) { onFlatten(e); }));
  subscriptions_.push_back(bus_.subscribe<SessionCloseEvent>(
      [this](const SessionCloseEvent& e) { onSessionClose(e); }));
}

BreakoutStrategy::~BreakoutStrategy() {
  for (auto id : subscriptions_) {
    bus_.unsubscribe(id);
  }
}

StrategySnapshot BreakoutStrategy::snapshot() const {
  std::shared_lock lock(snapshot_mutex_);
  return snapshot_;
}

// -----------------------------------------------------------------------------
// Event handlers
// -----------------------------------------------------------------------------

void BreakoutStrategy::onMarketData(const MarketDataEvent& event) {
  if (event.symbol != instrument_.id) {
    return;
  }
  guarded("tick", [&] {
    handleTick(event.price, event.volume, timestamp_to_ms(event.timestamp));
  });
}

void BreakoutStrategy::onTimer(const TimerEvent& event) {
  guarded("timer", [&] { handleTimer(timestamp_to_ms(event.timestamp)); });
}

void BreakoutStrategy::onFlatten(const FlattenEvent& event) {
  guarded("flatten", [&] {
    std::cerr << "[BreakoutStrategy] " << instrument_.id
              << ": flatten requested (" << event.reason << ")\n";
    closeForSession(domain::ExitReason::Manual,
                    timestamp_to_ms(event.timestamp));
  });
}

void BreakoutStrategy::onSessionClose(const SessionCloseEvent& event) {
  guarded("session close", [&] {
    const std::int64_t now_ms = timestamp_to_ms(event.timestamp);
    // A close inside the capture window freezes the partial range; with no
    // ticks at all the instrument ends up Disabled instead.
    if (phase_ == StrategyPhase::Capturing) {
      capture_.freezeNow(now_ms);
      onCaptured();
    }
    closeForSession(domain::ExitReason::SessionEnd, now_ms);
  });
}

// -----------------------------------------------------------------------------
// Pipeline
// -----------------------------------------------------------------------------

void BreakoutStrategy::handleTick(double price, double volume,
                                  std::int64_t ts_ms) {
  if (isInert()) {
    return;
  }

  if (phase_ != StrategyPhase::Done && gate_.isSessionForceClose(ts_ms)) {
    closeForSession(domain::ExitReason::SessionEnd, ts_ms);
    return;
  }

  const TickSample sample{price, volume, ts_ms};

  if (phase_ == StrategyPhase::Capturing) {
    if (!capture_.onTick(price, volume, ts_ms)) {
      pushHistory(sample);
      return;
    }
    onCaptured();
  }

  if (aggregator_) {
    if (auto candle = aggregator_->onTick(price, volume, ts_ms)) {
      atr_.addCandle(*candle);
    }
  }

  if (phase_ == StrategyPhase::InPosition) {
    if (psm_.onTick(price, ts_ms)) {
      onPositionClosed();
    }
  } else if (phase_ == StrategyPhase::Armed) {
    considerEntry(sample);
  }

  pushHistory(sample);
}

void BreakoutStrategy::handleTimer(std::int64_t now_ms) {
  if (isInert()) {
    return;
  }

  if (phase_ == StrategyPhase::Capturing) {
    if (!capture_.onClock(now_ms)) {
      return;
    }
    onCaptured();
  }

  if (phase_ != StrategyPhase::Done && gate_.isSessionForceClose(now_ms)) {
    closeForSession(domain::ExitReason::SessionEnd, now_ms);
    return;
  }

  if (aggregator_) {
    if (auto candle = aggregator_->flush(now_ms)) {
      atr_.addCandle(*candle);
    }
  }

  if (phase_ == StrategyPhase::InPosition && psm_.onTimer(now_ms)) {
    onPositionClosed();
  }
}

void BreakoutStrategy::closeForSession(domain::ExitReason reason,
                                       std::int64_t now_ms) {
  if (phase_ == StrategyPhase::Disabled || phase_ == StrategyPhase::Halted) {
    return;
  }
  if (psm_.forceClose(reason, now_ms)) {
    if (auto closed = psm_.reset()) {
      closed_.push_back(std::move(*closed));
    }
  }
  entries_blocked_ = true;
  phase_ = StrategyPhase::Done;
}

void BreakoutStrategy::onCaptured() {
  const domain::Candle& candle = capture_.candle();
  level_ = computeBreakoutLevel(candle, policy_.risk().breakout_buffer);
  atr_.addCandle(candle);

  const auto width_ms =
      static_cast<std::int64_t>(std::max(1, gate_.config().candle_minutes)) *
      kMsPerMinute;
  aggregator_.emplace(instrument_.id, width_ms, gate_.captureEndMs());
  phase_ = StrategyPhase::Armed;

  std::cout << "[BreakoutStrategy] " << instrument_.id << ": opening range "
            << "H=" << candle.high << " L=" << candle.low << " ("
            << candle.tick_count << " ticks) -> upper=" << level_->upper
            << " lower=" << level_->lower << "\n";
}

void BreakoutStrategy::considerEntry(const TickSample& sample) {
  if (entries_blocked_ || entries_taken_ >= instrument_.max_entries) {
    return;
  }

  const EntryEvaluation eval = filters_.evaluate(*level_, sample, history_);
  if (eval.signal == EntrySignal::None) {
    if (eval.breakout != EntrySignal::None && eval.blocked_by != nullptr) {
      std::cout << "[BreakoutStrategy] " << instrument_.id << ": "
                << toString(eval.breakout) << " breakout at " << sample.price
                << " not confirmed by " << eval.blocked_by << "\n";
    }
    return;
  }

  const domain::Direction direction = eval.signal == EntrySignal::Call
                                          ? domain::Direction::LongCall
                                          : domain::Direction::LongPut;
  const double strike = domain::atmStrike(sample.price, instrument_.step_size);

  if (psm_.tryEnter(direction, sample.price, sample.timestamp_ms,
                    instrument_.quantity, atr_.currentATR(), strike)) {
    ++entries_taken_;
    phase_ = StrategyPhase::InPosition;
  } else {
    entries_blocked_ = true;
    phase_ = StrategyPhase::Done;
  }
}

void BreakoutStrategy::onPositionClosed() {
  if (auto closed = psm_.reset()) {
    closed_.push_back(std::move(*closed));
  }
  const bool more = !entries_blocked_ &&
                    entries_taken_ < instrument_.max_entries;
  phase_ = more ? StrategyPhase::Armed : StrategyPhase::Done;
}

// Opening-range ticks are kept too: they seed the volume and momentum
// windows for the first breakout after capture.
void BreakoutStrategy::pushHistory(const TickSample& sample) {
  history_.push_back(sample);
  while (history_.size() > history_limit_) {
    history_.pop_front();
  }
}

bool BreakoutStrategy::isInert() const {
  return phase_ == StrategyPhase::Disabled ||
         phase_ == StrategyPhase::Halted;
}

// -----------------------------------------------------------------------------
// guarded(): per-instrument failure isolation
// -----------------------------------------------------------------------------
void BreakoutStrategy::guarded(const char* what,
                               const std::function<void()>& fn) {
  try {
    fn();
  } catch (const InsufficientDataError& e) {
    phase_ = StrategyPhase::Disabled;
    std::cerr << "[BreakoutStrategy] " << instrument_.id
              << ": DISABLED for the session: " << e.what() << "\n";
  } catch (const PreconditionError& e) {
    phase_ = StrategyPhase::Halted;
    std::cerr << "[BreakoutStrategy] " << instrument_.id << ": HALTED on "
              << what << ": " << e.what() << "\n";
  }
  refreshSnapshot();
}

void BreakoutStrategy::refreshSnapshot() {
  StrategySnapshot snap;
  snap.instrument = instrument_.id;
  snap.phase = phase_;
  snap.level = level_;
  snap.atr = atr_.currentATR();
  snap.entries_taken = entries_taken_;
  snap.entries_blocked = entries_blocked_;
  if (psm_.isOpen()) {
    snap.open_position = psm_.position();
  }
  snap.closed_trades = closed_.size();
  for (const auto& p : closed_) {
    snap.realized_pnl += p.realized_pnl;
  }

  std::unique_lock lock(snapshot_mutex_);
  snapshot_ = std::move(snap);
}

}  // namespace orb
