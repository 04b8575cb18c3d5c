#pragma once

#include "arb/domain/direction.hpp"
#include "arb/domain/instrument.hpp"

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace arb {

// -----------------------------------------------------------------------------
// MatchingStrategy
// -----------------------------------------------------------------------------
// Caller preference for the matcher variant. AutoDetect picks from depth
// availability. A forced variant whose data is missing degrades to the best
// variant the data supports.
// -----------------------------------------------------------------------------
enum class MatchingStrategy {
  AutoDetect,
  DualDepth,
  SingleDepth,
  BestPrices,
};

// Variant that actually produced a MatchResult.
enum class MatchVariant {
  DualDepth,
  SingleDepth,
  BestPrices,
};

// -----------------------------------------------------------------------------
// RejectReason
// -----------------------------------------------------------------------------
// Why a MatchResult is not executable. All of these are ordinary "nothing to
// do this tick" outcomes; none is an error.
//
//   InvalidRequest        Negative target, identical symbols.
//   InvalidPrice          A required price is <= 0 or missing.
//   SpreadBelowThreshold  No price pair passed the spread gate.
//   BelowLotSize          Levels passed the gate but lot alignment left a leg
//                         at zero.
// -----------------------------------------------------------------------------
enum class RejectReason {
  None,
  InvalidRequest,
  InvalidPrice,
  SpreadBelowThreshold,
  BelowLotSize,
};

const char* toString(MatchingStrategy strategy);
const char* toString(MatchVariant variant);
const char* toString(RejectReason reason);

// "auto", "dual", "single", "best" (config spelling).
std::optional<MatchingStrategy> parseMatchingStrategy(std::string_view text);

// -----------------------------------------------------------------------------
// MatcherConfig
// -----------------------------------------------------------------------------
//   max_depth_levels  Book levels the matcher walks per side.
//   strategy          Default preference when a request says AutoDetect.
//   fee_per_share     Default fee when a request carries none.
//   debug             Per-level diagnostics on std::cout.
// -----------------------------------------------------------------------------
struct MatcherConfig {
  std::size_t max_depth_levels{10};
  MatchingStrategy strategy{MatchingStrategy::AutoDetect};
  double fee_per_share{0.0};
  bool debug{false};
};

// -----------------------------------------------------------------------------
// MatchRequest
// -----------------------------------------------------------------------------
// target_notional is measured on the driving side (the bought leg for
// dual-depth, the depth leg for single-depth, both legs for best prices).
// max_spread_pct is the worst buy-over-sell spread a level may take (see
// spread_math.hpp).
// fee_per_share < 0 means "use MatcherConfig::fee_per_share".
// -----------------------------------------------------------------------------
struct MatchRequest {
  domain::Symbol symbol1;
  domain::Symbol symbol2;
  double target_notional{0.0};
  domain::MatchDirection direction{domain::MatchDirection::LongS1};
  double max_spread_pct{0.0};
  double fee_per_share{-1.0};
  MatchingStrategy strategy{MatchingStrategy::AutoDetect};
};

// One leg of a result: signed quantity, positive = buy.
struct MatchLeg {
  domain::Symbol symbol;
  double quantity{0.0};
};

// -----------------------------------------------------------------------------
// MatchDetail
// -----------------------------------------------------------------------------
// One consumed price pair, kept for diagnostics. Quantities are unsigned and
// direction-neutral: buy_quantity was bought at buy_price, sell_quantity
// sold at sell_price. For single-depth results the counter-side quantity is
// the unrounded hedge share of that level.
// -----------------------------------------------------------------------------
struct MatchDetail {
  double buy_price{0.0};
  double sell_price{0.0};
  double buy_quantity{0.0};
  double sell_quantity{0.0};
  double spread_pct{0.0};
};

// -----------------------------------------------------------------------------
// MatchResult
// -----------------------------------------------------------------------------
//
// @brief  Output of SpreadMatcher::matchPair().
//
// @details
// Legs are always in (symbol1, symbol2) order. When executable:
//   - both quantities are non-zero and of opposite sign (except for a zero
//     target, which yields two zero legs),
//   - leg notionals differ by less than one lot's worth of value,
//   - every quantity is a whole number of lots.
//
// buy_notional / sell_notional include fees (added to the buy side,
// subtracted from the sell side); avg_buy_price / avg_sell_price are derived
// from them. avg_spread_pct is the buy-quantity weighted mean of the
// per-detail spreads.
//
// reached_target false with executable true is the "insufficient liquidity"
// outcome: the partial match is usable and remaining_notional says how much
// of the target is still open.
//
// valid_levels / max_supported_notional are single-depth diagnostics: how
// many depth levels passed the gate and how much notional they could absorb
// regardless of the requested target.
// -----------------------------------------------------------------------------
struct MatchResult {
  bool executable{false};
  RejectReason reject_reason{RejectReason::None};
  MatchVariant variant{MatchVariant::BestPrices};

  MatchLeg leg1;
  MatchLeg leg2;

  std::vector<MatchDetail> details;

  double buy_notional{0.0};
  double sell_notional{0.0};
  double avg_buy_price{0.0};
  double avg_sell_price{0.0};
  double avg_spread_pct{0.0};

  bool reached_target{false};
  double remaining_notional{0.0};

  std::size_t valid_levels{0};
  double max_supported_notional{0.0};
};

}  // namespace arb
