// =============================================================================
// ipc_server_test.cpp
// =============================================================================
// Unit tests for the IpcServer JSON formatters. The sockets are not opened;
// the formatters are what the PUB stream and the STATUS reply carry.
//
// Validates:
//   - Target updates and retirements carry both legs and the anchor
//   - Leg order reports carry status, fill and tag
//   - Non-telemetry events are not formatted
//   - STATUS reply shape
//   - An IpcServer that was never started stops cleanly
// =============================================================================

#include "arb/network/ipc_server.hpp"
#include "arb/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <gtest/gtest.h>

#include <string>

namespace {

arb::TargetSnapshot makeSnapshot() {
  arb::TargetSnapshot s;
  s.id = 3;
  s.opportunity_key = "AAPL#1";
  s.symbol1 = "AAPLx";
  s.symbol2 = "AAPL";
  s.target_quantity1 = 10.0;
  s.target_quantity2 = -10.0;
  s.filled_quantity1 = 4.0;
  s.filled_quantity2 = -4.0;
  s.direction = arb::domain::SpreadDirection::LongSpread;
  s.status = arb::domain::ExecutionStatus::PartiallyFilled;
  s.expected_spread_pct = 0.5;
  s.total_fee = 0.04;
  s.group_count = 1;
  s.created_ms = 1000;
  return s;
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. Target update: type, legs, null anchor; retirement changes the type.
// -----------------------------------------------------------------------------
TEST(IpcServerFormatTest, TargetUpdate) {
  arb::TargetUpdateEvent e;
  e.snapshot = makeSnapshot();
  e.timestamp = arb::ms_to_timestamp(2000);

  const auto j = nlohmann::json::parse(arb::IpcServer::formatTargetUpdate(e));
  EXPECT_EQ(j.at("type"), "target_update");
  EXPECT_EQ(j.at("target_id"), 3);
  EXPECT_EQ(j.at("opportunity"), "AAPL#1");
  EXPECT_EQ(j.at("direction"), "LONG_SPREAD");
  EXPECT_EQ(j.at("status"), "PartiallyFilled");
  ASSERT_EQ(j.at("legs").size(), 2u);
  EXPECT_EQ(j.at("legs")[0].at("symbol"), "AAPLx");
  EXPECT_DOUBLE_EQ(j.at("legs")[1].at("filled").get<double>(), -4.0);
  EXPECT_TRUE(j.at("anchor_ms").is_null());
  EXPECT_EQ(j.at("timestamp_ms"), 2000);

  e.retired = true;
  e.snapshot.anchor_ms = 1500;
  const auto r = nlohmann::json::parse(arb::IpcServer::formatTargetUpdate(e));
  EXPECT_EQ(r.at("type"), "target_retired");
  EXPECT_EQ(r.at("anchor_ms"), 1500);
}

// -----------------------------------------------------------------------------
// 2. Leg order report fields.
// -----------------------------------------------------------------------------
TEST(IpcServerFormatTest, LegOrder) {
  arb::LegOrderEvent e;
  e.order_id = 12;
  e.symbol = "AAPL";
  e.order_quantity = -10.0;
  e.status = arb::domain::LegOrderStatus::Filled;
  e.fill_quantity = -10.0;
  e.fill_price = 100.25;
  e.fee = 0.05;
  e.tag = "arb-target:3";
  e.timestamp = arb::ms_to_timestamp(2500);

  const auto text = arb::IpcServer::formatTelemetry(e);
  ASSERT_TRUE(text.has_value());
  const auto j = nlohmann::json::parse(*text);
  EXPECT_EQ(j.at("type"), "leg_order");
  EXPECT_EQ(j.at("order_id"), 12);
  EXPECT_EQ(j.at("status"), "Filled");
  EXPECT_DOUBLE_EQ(j.at("fill_price").get<double>(), 100.25);
  EXPECT_EQ(j.at("tag"), "arb-target:3");
  EXPECT_EQ(j.at("timestamp_ms"), 2500);
}

// -----------------------------------------------------------------------------
// 3. Only target updates and leg orders are telemetry.
// -----------------------------------------------------------------------------
TEST(IpcServerFormatTest, IgnoresOtherEvents) {
  EXPECT_FALSE(
      arb::IpcServer::formatTelemetry(arb::HeartbeatEvent{}).has_value());
  EXPECT_FALSE(
      arb::IpcServer::formatTelemetry(arb::MarketDataEvent{}).has_value());
  EXPECT_FALSE(
      arb::IpcServer::formatTelemetry(arb::OrderRequestEvent{}).has_value());
}

// -----------------------------------------------------------------------------
// 4. STATUS reply.
// -----------------------------------------------------------------------------
TEST(IpcServerFormatTest, Status) {
  const auto empty = nlohmann::json::parse(arb::IpcServer::formatStatus({}, false));
  EXPECT_EQ(empty.at("status"), "ok");
  EXPECT_EQ(empty.at("halted"), false);
  EXPECT_TRUE(empty.at("targets").empty());

  const auto j =
      nlohmann::json::parse(arb::IpcServer::formatStatus({makeSnapshot()}, true));
  EXPECT_EQ(j.at("halted"), true);
  ASSERT_EQ(j.at("targets").size(), 1u);
  EXPECT_EQ(j.at("targets")[0].at("target_id"), 3);
}

// -----------------------------------------------------------------------------
// 5. stop() on a server that never started is a no-op.
// -----------------------------------------------------------------------------
TEST(IpcServerLifecycleTest, StopWithoutStart) {
  arb::IpcServer server([](const std::string&) { return std::string{}; },
                        "inproc://cmd", "inproc://pub");
  EXPECT_FALSE(server.isRunning());
  server.stop();
  EXPECT_FALSE(server.isRunning());
}
