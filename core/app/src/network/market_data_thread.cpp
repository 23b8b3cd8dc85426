#include "orb/network/market_data_thread.hpp"

#include <iostream>
#include <utility>

namespace orb {

MarketDataThread::MarketDataThread(SimulationTimeProvider* replay_clock,
                                   EventSink event_sink, std::string endpoint)
    : replay_clock_(replay_clock),
      event_sink_(std::move(event_sink)),
      endpoint_(std::move(endpoint)) {}

MarketDataThread::~MarketDataThread() { stop(); }

void MarketDataThread::start() {
  if (thread_.joinable()) {
    return;
  }

  gateway_ =
      std::make_unique<MarketDataGateway>(replay_clock_, event_sink_, endpoint_);

  thread_ = std::thread([this] {
    std::cout << "[MarketDataThread] listening on " << endpoint_
              << (replay_clock_ ? " (replay)" : " (live)") << "\n";
    gateway_->run();
    std::cout << "[MarketDataThread] recv loop exited after "
              << gateway_->receivedCount() << " ticks.\n";
  });
}

void MarketDataThread::stop() {
  if (gateway_) {
    gateway_->stop();
  }
  if (thread_.joinable()) {
    thread_.join();
  }
  gateway_.reset();
}

}  // namespace orb
