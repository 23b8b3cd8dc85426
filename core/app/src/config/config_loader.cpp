#include "orb/config/config_loader.hpp"

#include "orb/domain/errors.hpp"

#include <cstdio>
#include <fstream>
#include <set>
#include <string>

namespace orb {

namespace {

using nlohmann::json;

// Reads `obj[key]` into `out` when present; wrong types become ConfigError.
template <typename T>
void read(const json& obj, const char* section, const char* key, T& out) {
  if (!obj.contains(key)) {
    return;
  }
  try {
    out = obj.at(key).get<T>();
  } catch (const json::exception& e) {
    throw ConfigError(std::string(section) + "." + key + ": " + e.what());
  }
}

const json& section(const json& root, const char* name, const json& empty) {
  if (!root.contains(name)) {
    return empty;
  }
  const json& s = root.at(name);
  if (!s.is_object()) {
    throw ConfigError(std::string(name) + ": expected an object");
  }
  return s;
}

void require(bool ok, const std::string& message) {
  if (!ok) {
    throw ConfigError(message);
  }
}

// Tick-count settings are read signed so a negative value is caught here
// instead of wrapping to a huge std::size_t.
constexpr long long kMaxFilterTicks = 10000;

void readTickCount(const json& obj, const char* section, const char* key,
                   long long min, std::size_t& out) {
  if (!obj.contains(key)) {
    return;
  }
  long long value = 0;
  read(obj, section, key, value);
  require(value >= min && value <= kMaxFilterTicks,
          std::string(section) + "." + key + " must be in [" +
              std::to_string(min) + ", " + std::to_string(kMaxFilterTicks) +
              "]");
  out = static_cast<std::size_t>(value);
}

void parseSession(const json& s, domain::SessionConfig& out) {
  read(s, "session", "utc_offset_minutes", out.utc_offset_minutes);
  read(s, "session", "capture_minutes", out.capture_minutes);
  read(s, "session", "candle_minutes", out.candle_minutes);
  read(s, "session", "timer_interval_ms", out.timer_interval_ms);
  read(s, "session", "holidays", out.holidays);

  std::string text;
  if (s.contains("market_open")) {
    read(s, "session", "market_open", text);
    out.market_open_minute = parseTimeOfDay(text, "session.market_open");
  }
  if (s.contains("force_close")) {
    read(s, "session", "force_close", text);
    out.force_close_minute = parseTimeOfDay(text, "session.force_close");
  }

  require(out.capture_minutes > 0, "session.capture_minutes must be > 0");
  require(out.candle_minutes > 0, "session.candle_minutes must be > 0");
  require(out.timer_interval_ms > 0, "session.timer_interval_ms must be > 0");
  require(out.force_close_minute >
              out.market_open_minute + out.capture_minutes,
          "session.force_close must be after the capture window");
  for (const auto& day : out.holidays) {
    int y = 0, m = 0, d = 0;
    require(day.size() == 10 &&
                std::sscanf(day.c_str(), "%4d-%2d-%2d", &y, &m, &d) == 3 &&
                m >= 1 && m <= 12 && d >= 1 && d <= 31,
            "session.holidays: malformed date '" + day + "'");
  }
}

void parseRisk(const json& s, domain::RiskConfig& out) {
  read(s, "risk", "stop_loss_points", out.stop_loss_points);
  read(s, "risk", "target_points", out.target_points);
  read(s, "risk", "breakout_buffer", out.breakout_buffer);
  read(s, "risk", "use_atr_stop", out.use_atr_stop);
  read(s, "risk", "atr_multiplier", out.atr_multiplier);
  read(s, "risk", "atr_period", out.atr_period);
  read(s, "risk", "atr_fallback", out.atr_fallback);
  read(s, "risk", "max_holding_minutes", out.max_holding_minutes);
  read(s, "risk", "trailing_enabled", out.trailing_enabled);
  read(s, "risk", "trailing_activation_fraction",
       out.trailing_activation_fraction);
  read(s, "risk", "trailing_trail_fraction", out.trailing_trail_fraction);

  require(out.stop_loss_points > 0.0, "risk.stop_loss_points must be > 0");
  require(out.target_points >= 0.0, "risk.target_points must be >= 0");
  require(out.atr_period > 0, "risk.atr_period must be > 0");
  require(out.atr_multiplier > 0.0, "risk.atr_multiplier must be > 0");
  require(out.max_holding_minutes >= 0.0,
          "risk.max_holding_minutes must be >= 0");
  require(out.trailing_activation_fraction >= 0.0 &&
              out.trailing_activation_fraction <= 1.0,
          "risk.trailing_activation_fraction must be in [0, 1]");
  require(out.trailing_trail_fraction > 0.0 &&
              out.trailing_trail_fraction < 1.0,
          "risk.trailing_trail_fraction must be in (0, 1)");
}

void parseLadder(const json& s, domain::ExitLadder& out) {
  read(s, "ladder", "enabled", out.enabled);
  if (!s.contains("steps")) {
    return;
  }
  const json& steps = s.at("steps");
  require(steps.is_array(), "ladder.steps: expected an array");

  double prev_time = -1.0;
  for (const auto& item : steps) {
    require(item.is_object(), "ladder.steps: expected objects");
    domain::LadderStep step;
    read(item, "ladder.steps", "time_minutes", step.time_minutes);
    read(item, "ladder.steps", "min_profit_percentage",
         step.min_profit_percentage);
    read(item, "ladder.steps", "exit_percentage", step.exit_percentage);

    require(step.time_minutes > prev_time,
            "ladder.steps: time_minutes must be strictly ascending");
    require(step.exit_percentage > 0.0 && step.exit_percentage <= 100.0,
            "ladder.steps: exit_percentage must be in (0, 100]");
    require(step.min_profit_percentage >= 0.0,
            "ladder.steps: min_profit_percentage must be >= 0");
    prev_time = step.time_minutes;
    out.steps.push_back(step);
  }
}

void parseFilters(const json& s, domain::FilterConfig& out) {
  const json empty = json::object();
  const json& vol = section(s, "volume_confirmation", empty);
  read(vol, "filters.volume_confirmation", "enabled", out.volume.enabled);
  read(vol, "filters.volume_confirmation", "multiple", out.volume.multiple);
  readTickCount(vol, "filters.volume_confirmation", "window", 1,
                out.volume.window);

  const json& mom = section(s, "momentum_confirmation", empty);
  read(mom, "filters.momentum_confirmation", "enabled", out.momentum.enabled);
  readTickCount(mom, "filters.momentum_confirmation", "ticks", 2,
                out.momentum.ticks);
  read(mom, "filters.momentum_confirmation", "tolerance",
       out.momentum.tolerance);

  const json& cap = section(s, "entry_premium_cap", empty);
  read(cap, "filters.entry_premium_cap", "enabled", out.premium_cap.enabled);
  read(cap, "filters.entry_premium_cap", "max_percentage",
       out.premium_cap.max_percentage);

  require(out.volume.multiple > 0.0,
          "filters.volume_confirmation.multiple must be > 0");
  require(out.momentum.tolerance >= 0.0,
          "filters.momentum_confirmation.tolerance must be >= 0");
  require(out.premium_cap.max_percentage > 0.0,
          "filters.entry_premium_cap.max_percentage must be > 0");
}

void parseGovernor(const json& s, domain::DailyRiskLimits& out) {
  read(s, "governor", "max_trades_per_day", out.max_trades_per_day);
  read(s, "governor", "max_daily_loss", out.max_daily_loss);
  require(out.max_trades_per_day > 0,
          "governor.max_trades_per_day must be > 0");
  require(out.max_daily_loss < 0.0,
          "governor.max_daily_loss must be negative");
}

void parseInstruments(const json& root,
                      std::vector<domain::Instrument>& out) {
  if (!root.contains("instruments")) {
    return;
  }
  const json& list = root.at("instruments");
  require(list.is_array(), "instruments: expected an array");

  std::set<std::string> seen;
  for (const auto& item : list) {
    require(item.is_object(), "instruments: expected objects");
    domain::Instrument inst;
    read(item, "instruments", "id", inst.id);
    read(item, "instruments", "step_size", inst.step_size);
    read(item, "instruments", "enabled", inst.enabled);
    read(item, "instruments", "quantity", inst.quantity);
    read(item, "instruments", "max_entries", inst.max_entries);

    require(!inst.id.empty(), "instruments.id must be non-empty");
    require(seen.insert(inst.id).second,
            "instruments.id duplicated: " + inst.id);
    require(inst.step_size > 0.0,
            "instruments.step_size must be > 0 for " + inst.id);
    require(!inst.enabled || inst.quantity > 0,
            "instruments.quantity must be > 0 for " + inst.id);
    require(inst.max_entries >= 1,
            "instruments.max_entries must be >= 1 for " + inst.id);
    out.push_back(inst);
  }
}

void parseNetwork(const json& s, NetworkConfig& out) {
  read(s, "network", "market_data_endpoint", out.market_data_endpoint);
  read(s, "network", "ipc_cmd_endpoint", out.ipc_cmd_endpoint);
  read(s, "network", "ipc_pub_endpoint", out.ipc_pub_endpoint);
}

}  // namespace

int parseTimeOfDay(const std::string& text, const std::string& key) {
  int hh = -1;
  int mm = -1;
  char tail = '\0';
  if (text.size() != 5 || text[2] != ':' ||
      std::sscanf(text.c_str(), "%2d:%2d%c", &hh, &mm, &tail) != 2 ||
      hh < 0 || hh > 23 || mm < 0 || mm > 59) {
    throw ConfigError(key + ": expected \"HH:MM\", got \"" + text + "\"");
  }
  return hh * 60 + mm;
}

EngineConfig parseEngineConfig(const json& root) {
  if (!root.is_object()) {
    throw ConfigError("configuration root must be a JSON object");
  }

  const json empty = json::object();
  EngineConfig config;
  parseSession(section(root, "session", empty), config.session);
  parseRisk(section(root, "risk", empty), config.risk);
  parseLadder(section(root, "ladder", empty), config.ladder);
  parseFilters(section(root, "filters", empty), config.filters);
  parseGovernor(section(root, "governor", empty), config.governor);
  parseInstruments(root, config.instruments);
  parseNetwork(section(root, "network", empty), config.network);
  return config;
}

EngineConfig loadEngineConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open configuration file: " + path);
  }

  json root;
  try {
    in >> root;
  } catch (const json::exception& e) {
    throw ConfigError(path + ": " + e.what());
  }
  return parseEngineConfig(root);
}

}  // namespace orb
