// =============================================================================
// spread_matcher_test.cpp
// =============================================================================
// Unit tests for arb::SpreadMatcher.
//
// Validates:
//   - Single-depth sizing against a fixed counter price, including the
//     swapped case where only the second instrument has depth
//   - Dual-depth twin-cursor walk: partial liquidity, stopping once no
//     counter level can pass the gate, the max_depth_levels cap
//   - Gate direction: buying cheap and selling dear passes, the reverse
//     does not
//   - Best-prices fallback and the last-trade price fallback
//   - Rejections: spread gate, invalid price, invalid request, below lot
//   - Zero target, forced strategies, fee-adjusted notionals
//   - Properties over a set of fixed books: opposite-sign legs, value
//     balance within one lot, lot-aligned legs, monotone share counts
//
// Spread convention: (buy / sell - 1) * 100, lower is better. Buying X at 100
// and selling Y at 102 is -1.96%, so any limit of -1.96 or above accepts it.
// =============================================================================

#include "arb/matching/match_types.hpp"
#include "arb/matching/spread_matcher.hpp"
#include "arb/matching/spread_math.hpp"
#include "fake_market_data.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

namespace {

using arb::domain::Depth;
using arb::domain::MatchDirection;

arb::MatchRequest makeRequest(const std::string& s1, const std::string& s2,
                              double target, MatchDirection direction,
                              double max_spread) {
  arb::MatchRequest r;
  r.symbol1 = s1;
  r.symbol2 = s2;
  r.target_notional = target;
  r.direction = direction;
  r.max_spread_pct = max_spread;
  return r;
}

}  // namespace

class SpreadMatcherTest : public ::testing::Test {
 protected:
  arb_test::FakeMarketData md;
  arb::SpreadMatcher matcher{md};
};

// -----------------------------------------------------------------------------
// 1. Single level of X asks (100 x 20) against Y's best bid 102: buy 10 X,
//    sell 9.8 → 9 Y, spread -1.96%, target reached.
// -----------------------------------------------------------------------------
TEST_F(SpreadMatcherTest, SingleDepthBuysBookAgainstBestBid) {
  md.setDepth("X", {{99.0, 20.0}}, {{100.0, 20.0}});
  md.setQuote("Y", 102.0, 102.5);

  auto result = matcher.matchPair(
      makeRequest("X", "Y", 1000.0, MatchDirection::LongS1, -1.0));

  ASSERT_TRUE(result.executable);
  EXPECT_EQ(result.variant, arb::MatchVariant::SingleDepth);
  EXPECT_EQ(result.leg1.symbol, "X");
  EXPECT_DOUBLE_EQ(result.leg1.quantity, 10.0);
  EXPECT_EQ(result.leg2.symbol, "Y");
  EXPECT_DOUBLE_EQ(result.leg2.quantity, -9.0);
  EXPECT_NEAR(result.avg_spread_pct, -1.9608, 1e-3);
  EXPECT_TRUE(result.reached_target);
  EXPECT_DOUBLE_EQ(result.remaining_notional, 0.0);
  EXPECT_EQ(result.valid_levels, 1u);
  EXPECT_DOUBLE_EQ(result.max_supported_notional, 2000.0);

  ASSERT_EQ(result.details.size(), 1u);
  EXPECT_DOUBLE_EQ(result.details[0].buy_quantity, 10.0);
  EXPECT_NEAR(result.details[0].sell_quantity, 1000.0 / 102.0, 1e-9);
}

// -----------------------------------------------------------------------------
// 2. A finer lot on the hedge leg keeps more of the value: 9.803 Y.
// -----------------------------------------------------------------------------
TEST_F(SpreadMatcherTest, SingleDepthHedgeUsesCounterLot) {
  md.setDepth("X", {{99.0, 20.0}}, {{100.0, 20.0}});
  md.setQuote("Y", 102.0, 102.5);
  md.setLot("Y", 0.001);

  auto result = matcher.matchPair(
      makeRequest("X", "Y", 1000.0, MatchDirection::LongS1, -1.0));

  ASSERT_TRUE(result.executable);
  EXPECT_NEAR(result.leg2.quantity, -9.803, 1e-9);
}

// -----------------------------------------------------------------------------
// 3. Depth only on the second instrument: the book is still walked, and the
//    legs come back in the caller's (symbol1, symbol2) order.
// -----------------------------------------------------------------------------
TEST_F(SpreadMatcherTest, SingleDepthOnSecondInstrumentKeepsLegOrder) {
  md.setQuote("Y", 102.0, 102.5);
  md.setDepth("X", {{99.0, 20.0}}, {{100.0, 20.0}});

  // Sell Y (symbol1), buy X (symbol2).
  auto result = matcher.matchPair(
      makeRequest("Y", "X", 1000.0, MatchDirection::ShortS1, -1.0));

  ASSERT_TRUE(result.executable);
  EXPECT_EQ(result.variant, arb::MatchVariant::SingleDepth);
  EXPECT_EQ(result.leg1.symbol, "Y");
  EXPECT_DOUBLE_EQ(result.leg1.quantity, -9.0);
  EXPECT_EQ(result.leg2.symbol, "X");
  EXPECT_DOUBLE_EQ(result.leg2.quantity, 10.0);
}

// -----------------------------------------------------------------------------
// 4. Single-depth selling: walk X's bids against Y's best ask. The 95 bid
//    would lose money, so the walk ends before the target; Y is hedged with
//    floor(627 / 100) = 6.
// -----------------------------------------------------------------------------
TEST_F(SpreadMatcherTest, SingleDepthSellWalksBidsAgainstBestAsk) {
  md.setDepth("X", {{105.0, 3.0}, {104.0, 3.0}, {95.0, 3.0}},
              {{106.0, 10.0}});
  md.setQuote("Y", 99.5, 100.0);

  // Buy Y at 100, sell X at 105 / 104 / 95: -4.76% / -3.85% / +5.26%.
  auto result = matcher.matchPair(
      makeRequest("X", "Y", 1000.0, MatchDirection::ShortS1, -3.0));

  ASSERT_TRUE(result.executable);
  EXPECT_EQ(result.variant, arb::MatchVariant::SingleDepth);
  EXPECT_DOUBLE_EQ(result.leg1.quantity, -6.0);
  EXPECT_DOUBLE_EQ(result.leg2.quantity, 6.0);
  EXPECT_FALSE(result.reached_target);
  EXPECT_NEAR(result.remaining_notional, 1000.0 - 627.0, 1e-9);
  EXPECT_EQ(result.valid_levels, 2u);
  EXPECT_NEAR(result.max_supported_notional, 627.0, 1e-9);
  ASSERT_EQ(result.details.size(), 2u);
  EXPECT_DOUBLE_EQ(result.details[0].sell_price, 105.0);
  EXPECT_DOUBLE_EQ(result.details[0].buy_price, 100.0);
  EXPECT_DOUBLE_EQ(result.details[1].sell_price, 104.0);
}

// -----------------------------------------------------------------------------
// 4b. The walk stops at the first level past the limit.
// Scenario: limit -4%. The 105 bid (-4.76%) passes, the 104 bid (-3.85%)
//           does not; 3 X sold, floor(315 / 100) = 3 Y bought.
// -----------------------------------------------------------------------------
TEST_F(SpreadMatcherTest, SingleDepthStopsAtFirstFailingLevel) {
  md.setDepth("X", {{105.0, 3.0}, {104.0, 3.0}, {95.0, 3.0}},
              {{106.0, 10.0}});
  md.setQuote("Y", 99.5, 100.0);

  auto result = matcher.matchPair(
      makeRequest("X", "Y", 1000.0, MatchDirection::ShortS1, -4.0));

  ASSERT_TRUE(result.executable);
  EXPECT_EQ(result.valid_levels, 1u);
  EXPECT_DOUBLE_EQ(result.leg1.quantity, -3.0);
  EXPECT_DOUBLE_EQ(result.leg2.quantity, 3.0);

  auto none = matcher.matchPair(
      makeRequest("X", "Y", 1000.0, MatchDirection::ShortS1, -5.0));
  EXPECT_FALSE(none.executable);
  EXPECT_EQ(none.reject_reason, arb::RejectReason::SpreadBelowThreshold);
}

// -----------------------------------------------------------------------------
// 5. The X book supplies only $500 of a $1000 target; Y is hedged with
//    floor(500 / 102) = 4.
// -----------------------------------------------------------------------------
TEST_F(SpreadMatcherTest, DualDepthInsufficientLiquidity) {
  md.setDepth("X", {{99.0, 5.0}}, {{100.0, 5.0}});
  md.setDepth("Y", {{102.0, 10.0}}, {{102.5, 10.0}});

  auto result = matcher.matchPair(
      makeRequest("X", "Y", 1000.0, MatchDirection::LongS1, -1.0));

  ASSERT_TRUE(result.executable);
  EXPECT_EQ(result.variant, arb::MatchVariant::DualDepth);
  EXPECT_FALSE(result.reached_target);
  EXPECT_NEAR(result.remaining_notional, 500.0, 1e-9);
  EXPECT_DOUBLE_EQ(result.leg1.quantity, 5.0);
  EXPECT_DOUBLE_EQ(result.leg2.quantity, -4.0);
}

// -----------------------------------------------------------------------------
// 6. Dual depth across levels: the imbalance left by lot truncation on the
//    first pair is carried into the second. Limit 0% admits both pairs
//    (-1.48% and -0.50%).
// -----------------------------------------------------------------------------
TEST_F(SpreadMatcherTest, DualDepthCarriesImbalanceAcrossLevels) {
  md.setDepth("X", {{99.0, 20.0}}, {{100.0, 4.0}, {100.5, 6.0}, {101.0, 10.0}});
  md.setDepth("Y", {{101.5, 3.0}, {101.0, 8.0}, {100.2, 20.0}},
              {{102.0, 20.0}});

  auto result = matcher.matchPair(
      makeRequest("X", "Y", 1000.0, MatchDirection::LongS1, 0.0));

  ASSERT_TRUE(result.executable);
  ASSERT_EQ(result.details.size(), 2u);
  EXPECT_DOUBLE_EQ(result.details[0].buy_quantity, 4.0);
  EXPECT_DOUBLE_EQ(result.details[0].sell_quantity, 3.0);
  EXPECT_DOUBLE_EQ(result.details[1].buy_quantity, 5.0);
  EXPECT_DOUBLE_EQ(result.details[1].sell_quantity, 5.0);
  EXPECT_DOUBLE_EQ(result.leg1.quantity, 9.0);
  EXPECT_DOUBLE_EQ(result.leg2.quantity, -8.0);
  EXPECT_NEAR(result.buy_notional, 902.5, 1e-9);
  EXPECT_NEAR(result.sell_notional, 809.5, 1e-9);
}

// -----------------------------------------------------------------------------
// 7. Once a pair fails and no deeper bid is higher, the walk stops instead
//    of selling into lower bids.
// Scenario: limit -1%. 100 / 101.5 (-1.48%) passes; 100.5 / 101 (-0.50%)
//           fails and the next bid, 100.2, is lower still.
// -----------------------------------------------------------------------------
TEST_F(SpreadMatcherTest, DualDepthStopsWhenNoCounterLevelImproves) {
  md.setDepth("X", {{99.0, 20.0}}, {{100.0, 4.0}, {100.5, 6.0}, {101.0, 10.0}});
  md.setDepth("Y", {{101.5, 3.0}, {101.0, 8.0}, {100.2, 20.0}},
              {{102.0, 20.0}});

  auto result = matcher.matchPair(
      makeRequest("X", "Y", 1000.0, MatchDirection::LongS1, -1.0));

  ASSERT_TRUE(result.executable);
  ASSERT_EQ(result.details.size(), 1u);
  EXPECT_DOUBLE_EQ(result.details[0].sell_price, 101.5);
  EXPECT_LE(result.details[0].spread_pct, -1.0);
  EXPECT_DOUBLE_EQ(result.leg1.quantity, 4.0);
  EXPECT_DOUBLE_EQ(result.leg2.quantity, -3.0);
  EXPECT_FALSE(result.reached_target);
}

// -----------------------------------------------------------------------------
// 7b. A higher bid behind a failing one is still reached.
// Scenario: Y's first bid (99) is a stale level below a 102 bid.
// -----------------------------------------------------------------------------
TEST_F(SpreadMatcherTest, DualDepthAdvancesToHigherCounterLevel) {
  md.setDepth("X", {{99.0, 20.0}}, {{100.0, 20.0}});
  md.setDepth("Y", {{99.0, 5.0}, {102.0, 20.0}}, {{102.5, 20.0}});

  auto result = matcher.matchPair(
      makeRequest("X", "Y", 1000.0, MatchDirection::LongS1, -1.0));

  ASSERT_TRUE(result.executable);
  ASSERT_EQ(result.details.size(), 1u);
  EXPECT_DOUBLE_EQ(result.details[0].sell_price, 102.0);
  EXPECT_DOUBLE_EQ(result.leg1.quantity, 10.0);
  EXPECT_DOUBLE_EQ(result.leg2.quantity, -9.0);
}

// -----------------------------------------------------------------------------
// 8. max_depth_levels caps how far each book is walked.
// -----------------------------------------------------------------------------
TEST_F(SpreadMatcherTest, DepthLevelCap) {
  arb::MatcherConfig config;
  config.max_depth_levels = 1;
  arb::SpreadMatcher capped{md, config};

  md.setDepth("X", {{99.0, 20.0}}, {{100.0, 5.0}, {100.5, 5.0}});
  md.setDepth("Y", {{102.0, 10.0}}, {{102.5, 10.0}});

  auto uncapped_result = matcher.matchPair(
      makeRequest("X", "Y", 1000.0, MatchDirection::LongS1, -1.0));
  auto capped_result = capped.matchPair(
      makeRequest("X", "Y", 1000.0, MatchDirection::LongS1, -1.0));

  ASSERT_TRUE(uncapped_result.executable);
  ASSERT_TRUE(capped_result.executable);
  EXPECT_DOUBLE_EQ(uncapped_result.leg1.quantity, 9.0);
  EXPECT_DOUBLE_EQ(capped_result.leg1.quantity, 5.0);
}

// -----------------------------------------------------------------------------
// 9. Every level past the limit → not executable, SpreadBelowThreshold.
// Scenario: buying X at 105 against selling Y at 100 is +5%, limit +1%.
// -----------------------------------------------------------------------------
TEST_F(SpreadMatcherTest, ThresholdGateRejectsInEveryVariant) {
  // Dual.
  md.setDepth("X", {{104.0, 10.0}}, {{105.0, 10.0}, {106.0, 10.0}});
  md.setDepth("Y", {{100.0, 10.0}, {99.0, 10.0}}, {{101.0, 10.0}});
  auto dual = matcher.matchPair(
      makeRequest("X", "Y", 1000.0, MatchDirection::LongS1, 1.0));
  EXPECT_FALSE(dual.executable);
  EXPECT_EQ(dual.variant, arb::MatchVariant::DualDepth);
  EXPECT_EQ(dual.reject_reason, arb::RejectReason::SpreadBelowThreshold);

  // Single.
  md.clearDepth("Y");
  auto single = matcher.matchPair(
      makeRequest("X", "Y", 1000.0, MatchDirection::LongS1, 1.0));
  EXPECT_FALSE(single.executable);
  EXPECT_EQ(single.variant, arb::MatchVariant::SingleDepth);
  EXPECT_EQ(single.reject_reason, arb::RejectReason::SpreadBelowThreshold);

  // Best prices.
  md.clearDepth("X");
  auto best = matcher.matchPair(
      makeRequest("X", "Y", 1000.0, MatchDirection::LongS1, 1.0));
  EXPECT_FALSE(best.executable);
  EXPECT_EQ(best.variant, arb::MatchVariant::BestPrices);
  EXPECT_EQ(best.reject_reason, arb::RejectReason::SpreadBelowThreshold);
}

// -----------------------------------------------------------------------------
// 10. No depth anywhere: unlimited size at best prices.
// -----------------------------------------------------------------------------
TEST_F(SpreadMatcherTest, BestPricesFallback) {
  md.setQuote("X", 99.5, 100.0);
  md.setQuote("Y", 102.0, 102.5);

  auto result = matcher.matchPair(
      makeRequest("X", "Y", 1000.0, MatchDirection::LongS1, -1.0));

  ASSERT_TRUE(result.executable);
  EXPECT_EQ(result.variant, arb::MatchVariant::BestPrices);
  EXPECT_DOUBLE_EQ(result.leg1.quantity, 10.0);
  EXPECT_DOUBLE_EQ(result.leg2.quantity, -9.0);
  EXPECT_TRUE(result.reached_target);
}

// -----------------------------------------------------------------------------
// 11. A missing quote side falls back to the last trade; nothing at all is
//     InvalidPrice.
// -----------------------------------------------------------------------------
TEST_F(SpreadMatcherTest, LastTradeFallbackAndInvalidPrice) {
  md.setQuote("X", 99.5, 100.0);
  md.setQuote("Y", 0.0, 0.0, 102.0);

  auto with_last = matcher.matchPair(
      makeRequest("X", "Y", 1000.0, MatchDirection::LongS1, -1.0));
  ASSERT_TRUE(with_last.executable);
  ASSERT_EQ(with_last.details.size(), 1u);
  EXPECT_DOUBLE_EQ(with_last.details[0].sell_price, 102.0);

  md.setQuote("Y", 0.0, 0.0, 0.0);
  auto no_price = matcher.matchPair(
      makeRequest("X", "Y", 1000.0, MatchDirection::LongS1, -1.0));
  EXPECT_FALSE(no_price.executable);
  EXPECT_EQ(no_price.reject_reason, arb::RejectReason::InvalidPrice);
}

// -----------------------------------------------------------------------------
// 12. Malformed requests are rejected before any market data is read.
// -----------------------------------------------------------------------------
TEST_F(SpreadMatcherTest, InvalidRequests) {
  md.setQuote("X", 99.5, 100.0);

  auto same = matcher.matchPair(
      makeRequest("X", "X", 1000.0, MatchDirection::LongS1, -1.0));
  EXPECT_FALSE(same.executable);
  EXPECT_EQ(same.reject_reason, arb::RejectReason::InvalidRequest);

  auto negative = matcher.matchPair(
      makeRequest("X", "Y", -1.0, MatchDirection::LongS1, -1.0));
  EXPECT_FALSE(negative.executable);
  EXPECT_EQ(negative.reject_reason, arb::RejectReason::InvalidRequest);

  auto empty = matcher.matchPair(
      makeRequest("", "Y", 1000.0, MatchDirection::LongS1, -1.0));
  EXPECT_EQ(empty.reject_reason, arb::RejectReason::InvalidRequest);
}

// -----------------------------------------------------------------------------
// 13. Target smaller than one lot's value: the gate passes, nothing is left
//     after lot alignment.
// -----------------------------------------------------------------------------
TEST_F(SpreadMatcherTest, BelowLotSize) {
  md.setQuote("X", 99.5, 100.0);
  md.setQuote("Y", 102.0, 102.5);

  auto result = matcher.matchPair(
      makeRequest("X", "Y", 50.0, MatchDirection::LongS1, -1.0));
  EXPECT_FALSE(result.executable);
  EXPECT_EQ(result.reject_reason, arb::RejectReason::BelowLotSize);
}

// -----------------------------------------------------------------------------
// 14. A zero target is executable with two zero legs.
// -----------------------------------------------------------------------------
TEST_F(SpreadMatcherTest, ZeroTargetYieldsZeroLegs) {
  md.setQuote("X", 99.5, 100.0);
  md.setQuote("Y", 102.0, 102.5);

  auto result = matcher.matchPair(
      makeRequest("X", "Y", 0.0, MatchDirection::LongS1, -1.0));
  ASSERT_TRUE(result.executable);
  EXPECT_DOUBLE_EQ(result.leg1.quantity, 0.0);
  EXPECT_DOUBLE_EQ(result.leg2.quantity, 0.0);
  EXPECT_TRUE(result.reached_target);
}

// -----------------------------------------------------------------------------
// 15. A forced strategy wins when the data supports it and degrades when it
//     does not.
// -----------------------------------------------------------------------------
TEST_F(SpreadMatcherTest, ForcedStrategy) {
  md.setDepth("X", {{99.0, 20.0}}, {{100.0, 20.0}});
  md.setDepth("Y", {{102.0, 20.0}}, {{102.5, 20.0}});

  auto request = makeRequest("X", "Y", 1000.0, MatchDirection::LongS1, -1.0);
  request.strategy = arb::MatchingStrategy::BestPrices;
  EXPECT_EQ(matcher.matchPair(request).variant,
            arb::MatchVariant::BestPrices);

  request.strategy = arb::MatchingStrategy::SingleDepth;
  EXPECT_EQ(matcher.matchPair(request).variant,
            arb::MatchVariant::SingleDepth);

  md.clearDepth("X");
  md.clearDepth("Y");
  md.setQuote("X", 99.0, 100.0);
  md.setQuote("Y", 102.0, 102.5);
  request.strategy = arb::MatchingStrategy::DualDepth;
  EXPECT_EQ(matcher.matchPair(request).variant,
            arb::MatchVariant::BestPrices);
}

// -----------------------------------------------------------------------------
// 16. Fees are added to the buy notional and taken from the sell notional.
// -----------------------------------------------------------------------------
TEST_F(SpreadMatcherTest, FeesAdjustNotionals) {
  md.setQuote("X", 99.5, 100.0);
  md.setQuote("Y", 102.0, 102.5);

  auto request = makeRequest("X", "Y", 1000.0, MatchDirection::LongS1, -1.0);
  request.fee_per_share = 0.05;
  auto result = matcher.matchPair(request);

  ASSERT_TRUE(result.executable);
  EXPECT_NEAR(result.buy_notional, 1000.0 + 0.5, 1e-9);
  EXPECT_NEAR(result.sell_notional, 918.0 - 0.45, 1e-9);
  EXPECT_NEAR(result.avg_buy_price, 100.05, 1e-9);
  EXPECT_NEAR(result.avg_sell_price, 101.95, 1e-9);
}

// -----------------------------------------------------------------------------
// 17. Buying cheap and selling dear trades; buying dear and selling cheap
//     never does.
// Scenario: limit -1%. Buy X at 90 / sell Y at 102 is -11.76%; buy X at 110
//           / sell Y at 100 is +10%.
// -----------------------------------------------------------------------------
TEST_F(SpreadMatcherTest, GateAcceptsProfitableAndRejectsLosingPairs) {
  md.setQuote("X", 89.5, 90.0);
  md.setQuote("Y", 102.0, 102.5);

  auto profitable = matcher.matchPair(
      makeRequest("X", "Y", 1000.0, MatchDirection::LongS1, -1.0));
  ASSERT_TRUE(profitable.executable);
  EXPECT_DOUBLE_EQ(profitable.leg1.quantity, 11.0);
  EXPECT_DOUBLE_EQ(profitable.leg2.quantity, -9.0);
  EXPECT_NEAR(profitable.avg_spread_pct, -11.7647, 1e-3);

  md.setQuote("X", 109.5, 110.0);
  md.setQuote("Y", 100.0, 100.5);

  auto losing = matcher.matchPair(
      makeRequest("X", "Y", 1000.0, MatchDirection::LongS1, -1.0));
  EXPECT_FALSE(losing.executable);
  EXPECT_EQ(losing.reject_reason, arb::RejectReason::SpreadBelowThreshold);

  // The same book traded the other way round sells X at 109.5 and buys Y
  // at 100.5 (-8.22%), 9 shares each.
  auto reversed = matcher.matchPair(
      makeRequest("X", "Y", 1000.0, MatchDirection::ShortS1, -1.0));
  ASSERT_TRUE(reversed.executable);
  EXPECT_DOUBLE_EQ(reversed.leg1.quantity, -9.0);
  EXPECT_DOUBLE_EQ(reversed.leg2.quantity, 9.0);
}

// =============================================================================
// Properties over fixed books
// =============================================================================
namespace {

struct BookCase {
  Depth x_asks;
  Depth y_bids;
  double x_lot;
  double y_lot;
};

std::vector<BookCase> bookCases() {
  return {
      {{{100.0, 4.0}, {100.5, 6.0}, {101.0, 10.0}},
       {{101.5, 3.0}, {101.0, 8.0}, {100.2, 20.0}},
       1.0,
       1.0},
      {{{50.0, 7.5}, {50.2, 12.3}, {50.5, 40.0}},
       {{51.0, 9.1}, {50.9, 15.0}, {50.4, 30.0}},
       0.1,
       0.5},
      {{{10.0, 30.0}, {10.1, 50.0}}, {{10.3, 45.0}, {10.2, 25.0}}, 1.0, 5.0},
  };
}

double maxPrice(const Depth& book) {
  double best = 0.0;
  for (const auto& level : book) {
    best = std::max(best, level.price);
  }
  return best;
}

}  // namespace

class SpreadMatcherPropertyTest : public ::testing::TestWithParam<int> {
 protected:
  void SetUp() override {
    const BookCase c = bookCases()[static_cast<std::size_t>(GetParam())];
    md.setDepth("X", {{c.x_asks.front().price - 0.5, 100.0}}, c.x_asks);
    md.setDepth("Y", c.y_bids, {{c.y_bids.front().price + 0.5, 100.0}});
    md.setLot("X", c.x_lot);
    md.setLot("Y", c.y_lot);
    lot_value_bound = std::max(c.x_lot * maxPrice(c.x_asks),
                               c.y_lot * maxPrice(c.y_bids));
  }

  arb_test::FakeMarketData md;
  arb::SpreadMatcher matcher{md};
  double lot_value_bound{0.0};
};

// -----------------------------------------------------------------------------
// 18. For every target: legs of opposite sign, notionals within one lot's
//     value, lot-aligned quantities, and share counts that never shrink as
//     the target grows. The limit admits every pair in these books.
// -----------------------------------------------------------------------------
TEST_P(SpreadMatcherPropertyTest, HedgeBalanceAlignmentMonotonicity) {
  const double x_lot = md.lotSize("X");
  const double y_lot = md.lotSize("Y");

  double previous_buy = 0.0;
  double previous_sell = 0.0;
  int executable_count = 0;

  for (int k = 1; k <= 40; ++k) {
    const double target = 100.0 * k;
    auto result = matcher.matchPair(
        makeRequest("X", "Y", target, MatchDirection::LongS1, 1.0));
    if (!result.executable) {
      EXPECT_EQ(executable_count, 0) << "target " << target;
      continue;
    }
    ++executable_count;

    const double bought = result.leg1.quantity;
    const double sold = -result.leg2.quantity;

    EXPECT_GT(bought, 0.0) << "target " << target;
    EXPECT_GT(sold, 0.0) << "target " << target;

    EXPECT_LT(std::abs(result.buy_notional - result.sell_notional),
              lot_value_bound)
        << "target " << target;

    EXPECT_DOUBLE_EQ(arb::roundToLot(bought, x_lot), bought);
    EXPECT_DOUBLE_EQ(arb::roundToLot(sold, y_lot), sold);

    EXPECT_GE(bought, previous_buy - 1e-9) << "target " << target;
    EXPECT_GE(sold, previous_sell - 1e-9) << "target " << target;
    previous_buy = bought;
    previous_sell = sold;
  }

  EXPECT_GT(executable_count, 30);
}

INSTANTIATE_TEST_SUITE_P(FixedBooks, SpreadMatcherPropertyTest,
                         ::testing::Values(0, 1, 2));
