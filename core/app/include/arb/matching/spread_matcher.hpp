#pragma once

#include "arb/domain/direction.hpp"
#include "arb/domain/instrument.hpp"
#include "arb/market/i_market_data_source.hpp"
#include "arb/matching/match_types.hpp"

#include <optional>
#include <variant>

namespace arb {

// -----------------------------------------------------------------------------
// SpreadMatcher: sizes a hedged pair against live books
// -----------------------------------------------------------------------------
//
// @brief  Computes the largest lot-aligned, market-value-balanced pair of
//         signed quantities that is executable right now within a spread
//         limit, or a definitive "not executable" result.
//
// @details
// One matchPair() call runs this pipeline:
//
//   1. Request validation (negative target, identical symbols).
//   2. Capability probe: an instrument "has depth" when the source reports
//      at least one valid level on BOTH its bid and ask side.
//   3. Variant selection, once per call, into a closed tagged union:
//
//        DualDepthPlan    both instruments have depth
//        SingleDepthPlan  exactly one has depth; the other trades at its
//                         best price with unlimited size
//        FallbackPlan     neither has depth; both trade at best prices
//
//      MatchRequest::strategy (or MatcherConfig::strategy) may force a
//      variant; if the data does not support it the matcher degrades to the
//      best supported one.
//   4. Price validation while building the plan. A best price falls back to
//      the last trade when the quote side is 0; anything still <= 0 makes
//      the request not executable (InvalidPrice).
//   5. A zero target returns an executable result with two zero legs.
//   6. std::visit runs the variant.
//
// Single-depth always walks the book of the request's FIRST instrument. When
// only the second instrument has depth, matchPair() swaps the instruments,
// flips the direction, runs the swapped request and swaps the legs back, so
// callers always receive legs in (symbol1, symbol2) order.
//
// Spread gate, lot alignment and fee handling follow spread_math.hpp.
//
// Thread model:
//   Stateless between calls; matchPair() is const and only reads the
//   IMarketDataSource. Called on the execution loop.
//
// Ownership:
//   Holds a const reference to the market data source, which must outlive
//   the matcher.
// -----------------------------------------------------------------------------
class SpreadMatcher final {
 public:
  explicit SpreadMatcher(const IMarketDataSource& source,
                         MatcherConfig config = {});

  // -------------------------------------------------------------------------
  // matchPair(request)
  // -------------------------------------------------------------------------
  // @brief  Sizes one executable slice for request.
  //
  // @return MatchResult. executable == false carries a reject_reason; no
  //         partial result is ever returned when nothing passed the spread
  //         gate. Never throws.
  // -------------------------------------------------------------------------
  MatchResult matchPair(const MatchRequest& request) const;

  const MatcherConfig& config() const { return config_; }

 private:
  // Request re-expressed as "what is bought" / "what is sold".
  struct Sides {
    domain::Symbol symbol1;
    domain::Symbol symbol2;
    domain::MatchDirection direction{domain::MatchDirection::LongS1};
    domain::Symbol buy_symbol;
    domain::Symbol sell_symbol;
    double buy_lot{1.0};
    double sell_lot{1.0};
    double target_notional{0.0};
    double max_spread_pct{0.0};
    double fee_per_share{0.0};
  };

  struct DualDepthPlan {
    domain::Depth buy_book;   // asks of the bought instrument
    domain::Depth sell_book;  // bids of the sold instrument
  };

  struct SingleDepthPlan {
    domain::Depth book;       // depth of symbol1 on the side it trades
    bool book_is_buy_side{true};
    double counter_price{0.0};
  };

  struct FallbackPlan {
    double buy_price{0.0};
    double sell_price{0.0};
  };

  using Plan = std::variant<DualDepthPlan, SingleDepthPlan, FallbackPlan>;

  // Valid (price > 0, size > 0) levels, capped at max_depth_levels.
  // std::nullopt when none remain.
  std::optional<domain::Depth> loadBook(const domain::Symbol& symbol,
                                        domain::BookSide side) const;

  bool hasDepth(const domain::Symbol& symbol) const;

  // Best price a buy (ask) or sell (bid) would trade at, falling back to the
  // last trade price. 0 when unknown.
  double executablePrice(const domain::Symbol& symbol, bool buying) const;

  Sides makeSides(const MatchRequest& request) const;

  MatchResult run(const MatchRequest& request, MatchVariant variant) const;

  MatchResult runPlan(const Sides& sides, const DualDepthPlan& plan) const;
  MatchResult runPlan(const Sides& sides, const SingleDepthPlan& plan) const;
  MatchResult runPlan(const Sides& sides, const FallbackPlan& plan) const;

  // Fills legs, fee-adjusted notionals and averages from direction-neutral
  // totals.
  void finalize(const Sides& sides, double buy_quantity, double sell_quantity,
                double raw_buy_notional, double raw_sell_notional,
                MatchResult& result) const;

  static MatchResult reject(RejectReason reason, MatchVariant variant);

  const IMarketDataSource& source_;
  MatcherConfig config_;
};

}  // namespace arb
