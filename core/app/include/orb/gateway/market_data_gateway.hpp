#pragma once

#include "orb/events/event.hpp"
#include "orb/time/simulation_time_provider.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace orb {

// -----------------------------------------------------------------------------
// MarketDataGateway
// -----------------------------------------------------------------------------
//
// @brief  ZeroMQ SUB client that decodes JSON ticks into MarketDataEvents and
//         hands them to the engine's router.
//
// @details
// Wire format, one JSON object per message:
//   {"timestamp_ms": 1700000000000, "symbol": "NIFTY",
//    "price": 19500.5, "volume": 1200}
//
// In replay mode (`replay_clock` non-null) the simulation clock is advanced
// to the tick's timestamp BEFORE the event is handed on, so every component
// reading the clock agrees with the data. Live mode leaves the clock alone.
//
// Malformed payloads are logged and skipped.
//
// Thread model:
//   run() blocks on the calling thread (MarketDataThread) until stop(). The
//   receive timeout bounds how long stop() takes to be noticed.
// -----------------------------------------------------------------------------
class MarketDataGateway {
 public:
  using EventSink = std::function<void(Event)>;

  MarketDataGateway(SimulationTimeProvider* replay_clock, EventSink event_sink,
                    const std::string& endpoint);

  ~MarketDataGateway() = default;

  MarketDataGateway(const MarketDataGateway&) = delete;
  MarketDataGateway& operator=(const MarketDataGateway&) = delete;
  MarketDataGateway(MarketDataGateway&&) = delete;
  MarketDataGateway& operator=(MarketDataGateway&&) = delete;

  void run();

  void stop();

  // @return the decoded tick, or nullopt (logged) for a malformed payload.
  static std::optional<MarketDataEvent> decodeTick(const std::string& payload);

  std::uint64_t receivedCount() const { return received_.load(); }

 private:
  static constexpr int kRecvTimeoutMs = 100;

  SimulationTimeProvider* replay_clock_;
  EventSink event_sink_;

  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};

  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> received_{0};
};

}  // namespace orb
