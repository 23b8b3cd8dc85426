#pragma once

#include "orb/events/event.hpp"
#include "orb/gateway/market_data_gateway.hpp"
#include "orb/time/simulation_time_provider.hpp"

#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace orb {

// Owns the thread that runs MarketDataGateway::run(). The gateway (and its
// ZeroMQ socket) is created in start() so it lives on a single thread.
class MarketDataThread {
 public:
  using EventSink = std::function<void(Event)>;

  MarketDataThread(SimulationTimeProvider* replay_clock, EventSink event_sink,
                   std::string endpoint);

  ~MarketDataThread();

  MarketDataThread(const MarketDataThread&) = delete;
  MarketDataThread& operator=(const MarketDataThread&) = delete;
  MarketDataThread(MarketDataThread&&) = delete;
  MarketDataThread& operator=(MarketDataThread&&) = delete;

  void start();

  void stop();

 private:
  SimulationTimeProvider* replay_clock_;
  EventSink event_sink_;
  std::string endpoint_;

  std::unique_ptr<MarketDataGateway> gateway_;
  std::thread thread_;
};

}  // namespace orb
