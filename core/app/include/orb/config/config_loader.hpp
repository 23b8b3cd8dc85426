#pragma once

#include "orb/config/engine_config.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace orb {

// -----------------------------------------------------------------------------
// Configuration loading
// -----------------------------------------------------------------------------
//
// @details
// Sections (all optional, defaults from the config structs):
//   session, risk, ladder, filters, governor, instruments, network.
//
// Validation (ConfigError naming the offending key):
//   - every value has the expected JSON type
//   - "HH:MM" times are well formed and force_close is after market_open
//   - capture_minutes, candle_minutes, atr_period, timer_interval_ms > 0
//   - ladder steps strictly ascending in time_minutes, exit_percentage in
//     (0, 100], min_profit_percentage >= 0
//   - governor.max_daily_loss < 0, max_trades_per_day > 0
//   - instrument ids non-empty and unique, quantity > 0 when enabled,
//     step_size > 0, max_entries >= 1
// -----------------------------------------------------------------------------

// @throws ConfigError
EngineConfig parseEngineConfig(const nlohmann::json& json);

// @throws ConfigError if the file cannot be read or parsed.
EngineConfig loadEngineConfig(const std::string& path);

// "HH:MM" -> minutes after midnight.
// @throws ConfigError naming `key` when malformed.
int parseTimeOfDay(const std::string& text, const std::string& key);

}  // namespace orb
