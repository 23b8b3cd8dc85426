#include "orb/engine/instrument_worker.hpp"

namespace orb {

InstrumentWorker::InstrumentWorker(const domain::Instrument& instrument,
                                   const ClockGate& gate,
                                   const ExitPolicy& policy,
                                   const domain::FilterConfig& filters,
                                   DailyRiskGovernor& governor,
                                   IntentIdGenerator& id_gen)
    : instrument_(instrument.id), loop_("worker:" + instrument.id) {
  strategy_ = std::make_unique<BreakoutStrategy>(
      instrument, gate, policy, filters, loop_.eventBus(), governor, id_gen);
}

InstrumentWorker::~InstrumentWorker() {
  stop();
  strategy_.reset();
}

void InstrumentWorker::start() { loop_.start(); }

void InstrumentWorker::stop() { loop_.stop(); }

StrategySnapshot InstrumentWorker::snapshot() const {
  return strategy_->snapshot();
}

}  // namespace orb
