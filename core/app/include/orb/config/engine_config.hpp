#pragma once

#include "orb/domain/filter_config.hpp"
#include "orb/domain/instrument.hpp"
#include "orb/domain/risk_config.hpp"
#include "orb/domain/risk_limits.hpp"
#include "orb/domain/session_config.hpp"

#include <string>
#include <vector>

namespace orb {

// Endpoints for the ZeroMQ collaborators. An empty string leaves that
// component unstarted (tests, embedded use).
struct NetworkConfig {
  std::string market_data_endpoint{"tcp://127.0.0.1:5555"};
  std::string ipc_cmd_endpoint{"tcp://127.0.0.1:5556"};
  std::string ipc_pub_endpoint{"tcp://127.0.0.1:5557"};
};

// -----------------------------------------------------------------------------
// EngineConfig: everything loaded once at startup
// -----------------------------------------------------------------------------
// Built by parseEngineConfig() / loadEngineConfig(); copied into the
// TradingEngine and immutable from then on.
// -----------------------------------------------------------------------------
struct EngineConfig {
  domain::SessionConfig session;
  domain::RiskConfig risk;
  domain::ExitLadder ladder;
  domain::FilterConfig filters;
  domain::DailyRiskLimits governor;
  std::vector<domain::Instrument> instruments;
  NetworkConfig network;
};

}  // namespace orb
