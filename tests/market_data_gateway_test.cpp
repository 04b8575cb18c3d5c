// =============================================================================
// market_data_gateway_test.cpp
// =============================================================================
// Unit tests for MarketDataGateway::decode(), the JSON tick decoder. The
// ZeroMQ recv loop itself is exercised by running the engine against a feed.
//
// Validates:
//   - Full tick with depth and session flag
//   - Optional fields default to 0 / empty / absent
//   - Malformed depth entries are skipped, not fatal
//   - Invalid JSON, missing required fields and wrong types are rejected
// =============================================================================

#include "arb/gateway/market_data_gateway.hpp"
#include "arb/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <string>

// -----------------------------------------------------------------------------
// 1. Every field of a full tick lands in the event.
// -----------------------------------------------------------------------------
TEST(MarketDataGatewayDecodeTest, FullTick) {
  const std::string payload = R"({
    "timestamp_ms": 1700000000123,
    "symbol": "AAPLx",
    "bid": 189.9, "ask": 190.1, "last": 190.0,
    "bids": [[189.9, 5], [189.8, 12.5]],
    "asks": [[190.1, 4]],
    "market_open": false
  })";

  const auto md = arb::MarketDataGateway::decode(payload);
  ASSERT_TRUE(md.has_value());
  EXPECT_EQ(md->symbol, "AAPLx");
  EXPECT_EQ(arb::timestamp_to_ms(md->timestamp), 1700000000123);
  EXPECT_DOUBLE_EQ(md->bid, 189.9);
  EXPECT_DOUBLE_EQ(md->ask, 190.1);
  EXPECT_DOUBLE_EQ(md->last, 190.0);
  ASSERT_EQ(md->bids.size(), 2u);
  EXPECT_DOUBLE_EQ(md->bids[1].price, 189.8);
  EXPECT_DOUBLE_EQ(md->bids[1].size, 12.5);
  ASSERT_EQ(md->asks.size(), 1u);
  ASSERT_TRUE(md->market_open.has_value());
  EXPECT_FALSE(*md->market_open);
}

// -----------------------------------------------------------------------------
// 2. Only timestamp_ms and symbol are required.
// -----------------------------------------------------------------------------
TEST(MarketDataGatewayDecodeTest, OptionalFieldsDefault) {
  const auto md = arb::MarketDataGateway::decode(
      R"({"timestamp_ms": 5, "symbol": "AAPL", "last": 190.0})");
  ASSERT_TRUE(md.has_value());
  EXPECT_DOUBLE_EQ(md->bid, 0.0);
  EXPECT_DOUBLE_EQ(md->ask, 0.0);
  EXPECT_DOUBLE_EQ(md->last, 190.0);
  EXPECT_TRUE(md->bids.empty());
  EXPECT_TRUE(md->asks.empty());
  EXPECT_FALSE(md->market_open.has_value());
}

// -----------------------------------------------------------------------------
// 3. Depth entries that are not [price, size] number pairs are skipped.
// -----------------------------------------------------------------------------
TEST(MarketDataGatewayDecodeTest, MalformedDepthEntriesSkipped) {
  const auto md = arb::MarketDataGateway::decode(R"({
    "timestamp_ms": 5, "symbol": "AAPLx",
    "bids": [[189.9, 5], [189.8], "x", [189.7, "big"], [189.6, 1]],
    "asks": {"price": 190.1}
  })");
  ASSERT_TRUE(md.has_value());
  ASSERT_EQ(md->bids.size(), 2u);
  EXPECT_DOUBLE_EQ(md->bids[0].price, 189.9);
  EXPECT_DOUBLE_EQ(md->bids[1].price, 189.6);
  EXPECT_TRUE(md->asks.empty());
}

// -----------------------------------------------------------------------------
// 4. Payloads that cannot be turned into a tick are rejected.
// -----------------------------------------------------------------------------
TEST(MarketDataGatewayDecodeTest, RejectsBadPayloads) {
  EXPECT_FALSE(arb::MarketDataGateway::decode("not json").has_value());
  EXPECT_FALSE(arb::MarketDataGateway::decode(R"({"symbol": "AAPL"})")
                   .has_value());
  EXPECT_FALSE(arb::MarketDataGateway::decode(R"({"timestamp_ms": 5})")
                   .has_value());
  EXPECT_FALSE(
      arb::MarketDataGateway::decode(R"({"timestamp_ms": 5, "symbol": ""})")
          .has_value());
  EXPECT_FALSE(arb::MarketDataGateway::decode(
                   R"({"timestamp_ms": "soon", "symbol": "AAPL"})")
                   .has_value());
  EXPECT_FALSE(arb::MarketDataGateway::decode(
                   R"({"timestamp_ms": 5, "symbol": "AAPL", "bid": "high"})")
                   .has_value());
  EXPECT_FALSE(arb::MarketDataGateway::decode(
                   R"({"timestamp_ms": 5, "symbol": "AAPL", "market_open": 1})")
                   .has_value());
}
