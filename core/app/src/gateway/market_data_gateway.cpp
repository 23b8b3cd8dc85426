#include "orb/gateway/market_data_gateway.hpp"

#include "orb/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <utility>

namespace orb {

MarketDataGateway::MarketDataGateway(SimulationTimeProvider* replay_clock,
                                     EventSink event_sink,
                                     const std::string& endpoint)
    : replay_clock_(replay_clock), event_sink_(std::move(event_sink)) {
  socket_.set(zmq::sockopt::subscribe, "");
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
  socket_.connect(endpoint);
}

std::optional<MarketDataEvent> MarketDataGateway::decodeTick(
    const std::string& payload) {
  try {
    const auto json = nlohmann::json::parse(payload);

    MarketDataEvent md;
    md.symbol = json.at("symbol").get<std::string>();
    md.price = json.at("price").get<double>();
    md.volume = json.value("volume", 0.0);
    md.timestamp =
        ms_to_timestamp(json.at("timestamp_ms").get<std::int64_t>());
    md.sequence_id = json.value("sequence_id", std::uint64_t{0});
    return md;
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[MarketDataGateway] JSON parse error: " << e.what()
              << " (payload: " << payload << ")\n";
    return std::nullopt;
  }
}

void MarketDataGateway::run() {
  running_.store(true);

  while (running_.load()) {
    zmq::message_t msg;
    auto result = socket_.recv(msg, zmq::recv_flags::none);
    if (!result.has_value()) {
      continue;
    }

    auto md = decodeTick(msg.to_string());
    if (!md) {
      continue;
    }

    if (replay_clock_ != nullptr) {
      replay_clock_->advance_time(timestamp_to_ms(md->timestamp));
    }
    ++received_;
    event_sink_(std::move(*md));
  }
}

void MarketDataGateway::stop() { running_.store(false); }

}  // namespace orb
