#include "orb/events/event_json.hpp"

#include "orb/time/time_utils.hpp"

#include <type_traits>

namespace orb {

nlohmann::json positionToJson(const domain::Position& p) {
  nlohmann::json j;
  j["instrument"] = p.instrument;
  j["direction"] = domain::toString(p.direction);
  j["status"] = domain::toString(p.status);
  j["entry_price"] = p.entry_price;
  j["entry_time_ms"] = p.entry_time_ms;
  j["original_quantity"] = p.original_quantity;
  j["remaining_quantity"] = p.remaining_quantity;
  j["realized_pnl"] = p.realized_pnl;
  j["stop_loss_price"] = p.stop_loss_price;
  j["target_price"] = p.target_price;
  j["trailing_active"] = p.trailing_active;
  j["next_ladder_index"] = p.next_ladder_index;
  j["strike_hint"] = p.strike_hint;
  j["exit_reason"] = domain::toString(p.exit_reason);
  j["exit_price"] = p.exit_price;
  j["exit_time_ms"] = p.exit_time_ms;
  j["max_favorable_pnl"] = p.max_favorable_pnl;
  j["max_adverse_pnl"] = p.max_adverse_pnl;
  return j;
}

nlohmann::json eventToJson(const Event& event) {
  return std::visit(
      [](const auto& e) -> nlohmann::json {
        using T = std::decay_t<decltype(e)>;
        nlohmann::json j;
        j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
        j["sequence_id"] = e.sequence_id;

        if constexpr (std::is_same_v<T, MarketDataEvent>) {
          j["type"] = "market_data";
          j["symbol"] = e.symbol;
          j["price"] = e.price;
          j["volume"] = e.volume;
        } else if constexpr (std::is_same_v<T, TimerEvent>) {
          j["type"] = "timer";
        } else if constexpr (std::is_same_v<T, FlattenEvent>) {
          j["type"] = "flatten";
          j["reason"] = e.reason;
        } else if constexpr (std::is_same_v<T, SessionCloseEvent>) {
          j["type"] = "session_close";
        } else if constexpr (std::is_same_v<T, RiskRejectEvent>) {
          j["type"] = "risk_reject";
          j["instrument"] = e.instrument;
          j["reason"] = toString(e.reason);
          j["detail"] = e.detail;
        } else if constexpr (std::is_same_v<T, OrderIntentEvent>) {
          j["type"] = "order_intent";
          j["intent_id"] = e.intent_id;
          j["instrument"] = e.instrument;
          j["action"] = toString(e.action);
          j["direction"] = domain::toString(e.direction);
          j["quantity"] = e.quantity;
          j["price_hint"] = e.price_hint;
          j["strike_hint"] = e.strike_hint;
          j["reason"] = domain::toString(e.reason);
        } else if constexpr (std::is_same_v<T, TradeLifecycleEvent>) {
          j["type"] = "trade_lifecycle";
          j["kind"] = toString(e.kind);
          j["quantity"] = e.quantity;
          j["price"] = e.price;
          j["pnl_delta"] = e.pnl_delta;
          j["position"] = positionToJson(e.position);
        } else if constexpr (std::is_same_v<T, ExecutionReportEvent>) {
          j["type"] = "execution_report";
          j["intent_id"] = e.intent_id;
          j["instrument"] = e.instrument;
          j["status"] = toString(e.status);
          j["filled_quantity"] = e.filled_quantity;
          j["fill_price"] = e.fill_price;
        } else if constexpr (std::is_same_v<T, RiskViolationEvent>) {
          j["type"] = "risk_violation";
          j["instrument"] = e.instrument;
          j["reason"] = e.reason;
          j["current_value"] = e.current_value;
          j["limit_value"] = e.limit_value;
        }
        return j;
      },
      event);
}

}  // namespace orb
