// =============================================================================
// wire_format_test.cpp
// =============================================================================
// Tests for the JSON shapes crossing the process boundary: ticks decoded by
// the market data gateway and telemetry published by the IPC server.
// =============================================================================

#include "orb/events/event_json.hpp"
#include "orb/gateway/market_data_gateway.hpp"
#include "orb/network/ipc_server.hpp"
#include "orb/time/time_utils.hpp"

#include <gtest/gtest.h>

TEST(MarketDataDecodeTest, FullTick) {
  const auto md = orb::MarketDataGateway::decodeTick(
      R"({"symbol":"NIFTY","price":19512.5,"volume":300,)"
      R"("timestamp_ms":1792035960000,"sequence_id":42})");
  ASSERT_TRUE(md.has_value());
  EXPECT_EQ(md->symbol, "NIFTY");
  EXPECT_DOUBLE_EQ(md->price, 19512.5);
  EXPECT_DOUBLE_EQ(md->volume, 300.0);
  EXPECT_EQ(orb::timestamp_to_ms(md->timestamp), 1792035960000);
  EXPECT_EQ(md->sequence_id, 42u);
}

TEST(MarketDataDecodeTest, VolumeAndSequenceAreOptional) {
  const auto md = orb::MarketDataGateway::decodeTick(
      R"({"symbol":"BANKNIFTY","price":44100,"timestamp_ms":1792035960000})");
  ASSERT_TRUE(md.has_value());
  EXPECT_DOUBLE_EQ(md->volume, 0.0);
  EXPECT_EQ(md->sequence_id, 0u);
}

TEST(MarketDataDecodeTest, MalformedPayloadsAreDropped) {
  EXPECT_FALSE(orb::MarketDataGateway::decodeTick("not json").has_value());
  EXPECT_FALSE(orb::MarketDataGateway::decodeTick(
                   R"({"symbol":"NIFTY","price":1})")
                   .has_value());
  EXPECT_FALSE(orb::MarketDataGateway::decodeTick(
                   R"({"symbol":"NIFTY","price":"high","timestamp_ms":1})")
                   .has_value());
}

TEST(TelemetryFormatTest, TicksAndTimersAreNotPublished) {
  EXPECT_FALSE(
      orb::IpcServer::formatTelemetry(orb::MarketDataEvent{}, 1).has_value());
  EXPECT_FALSE(
      orb::IpcServer::formatTelemetry(orb::TimerEvent{}, 1).has_value());
}

TEST(TelemetryFormatTest, IntentCarriesActionAndReason) {
  orb::OrderIntentEvent intent;
  intent.intent_id = 7;
  intent.instrument = "NIFTY";
  intent.action = orb::IntentAction::FullExit;
  intent.direction = orb::domain::Direction::LongPut;
  intent.quantity = 75;
  intent.price_hint = 19480.0;
  intent.reason = orb::domain::ExitReason::StopLoss;
  intent.timestamp = orb::ms_to_timestamp(1792036800000);

  const auto payload = orb::IpcServer::formatTelemetry(intent, 12);
  ASSERT_TRUE(payload.has_value());
  const auto j = nlohmann::json::parse(*payload);
  EXPECT_EQ(j["type"], "order_intent");
  EXPECT_EQ(j["action"], "FULL_EXIT");
  EXPECT_EQ(j["direction"], "LONG_PUT");
  EXPECT_EQ(j["reason"], "STOP_LOSS");
  EXPECT_EQ(j["intent_id"].get<std::uint64_t>(), 7u);
  EXPECT_EQ(j["timestamp_ms"].get<std::int64_t>(), 1792036800000);
  EXPECT_EQ(j["publish_seq"].get<std::uint64_t>(), 12u);
}

TEST(CommandNormalizeTest, TrimsAndUpperCases) {
  EXPECT_EQ(orb::IpcServer::normalizeCommand("status\n"), "STATUS");
  EXPECT_EQ(orb::IpcServer::normalizeCommand("  Flatten \r\n"), "FLATTEN");
  EXPECT_EQ(orb::IpcServer::normalizeCommand("PING"), "PING");
  EXPECT_EQ(orb::IpcServer::normalizeCommand(" \t\n"), "");
}

TEST(TelemetryFormatTest, LifecycleEmbedsPosition) {
  orb::TradeLifecycleEvent event;
  event.kind = orb::LifecycleKind::Closed;
  event.position.instrument = "NIFTY";
  event.position.status = orb::domain::PositionStatus::Closed;
  event.position.exit_reason = orb::domain::ExitReason::TimeExit;
  event.position.original_quantity = 75;

  const auto j = orb::eventToJson(event);
  EXPECT_EQ(j["type"], "trade_lifecycle");
  EXPECT_EQ(j["kind"], "CLOSED");
  EXPECT_EQ(j["position"]["status"], "CLOSED");
  EXPECT_EQ(j["position"]["exit_reason"], "TIME_EXIT");
  EXPECT_EQ(j["position"]["original_quantity"].get<std::int64_t>(), 75);
}

TEST(TelemetryFormatTest, RejectCarriesDetail) {
  orb::RiskRejectEvent reject;
  reject.instrument = "BANKNIFTY";
  reject.detail = "max trades per day reached";
  const auto j = orb::eventToJson(reject);
  EXPECT_EQ(j["type"], "risk_reject");
  EXPECT_EQ(j["reason"], "LIMIT_BREACHED");
  EXPECT_EQ(j["detail"], "max trades per day reached");
}
