#pragma once

#include <cmath>
#include <limits>

namespace arb {

// -----------------------------------------------------------------------------
// Spread and lot arithmetic
// -----------------------------------------------------------------------------
//
// @brief  The three numeric primitives every matcher variant and the
//         execution state machine share.
//
// @details
// Spread convention: spread = (buy_price / sell_price - 1) * 100, in percent,
// where buy_price is what the bought leg costs and sell_price is what the
// sold leg fetches. Buying at 100 and selling at 102 gives -1.96. Lower is
// better for the trader in either direction.
//
// The threshold is the worst spread a trade may take: a pair passes the gate
// when spread <= max_spread_pct. A limit of -1 accepts the 100/102 pair above
// (-1.96) and rejects buying at 110 against selling at 100 (+10).
//
// Lot alignment truncates toward zero and never rounds up. A quantity below
// one lot becomes 0.
// -----------------------------------------------------------------------------

// Fraction of a lot treated as binary representation noise when truncating.
// Without it 0.3 / 0.1 = 2.9999999999999996 would truncate to 2 lots.
inline constexpr double kLotTolerance = 1e-9;

// -------------------------------------------------------------------------
// calcSpreadPct(buy_price, sell_price)
// -------------------------------------------------------------------------
// @return (buy/sell - 1) * 100, or +infinity when sell_price <= 0 so the
//         result can never pass a threshold.
// -------------------------------------------------------------------------
inline double calcSpreadPct(double buy_price, double sell_price) {
  if (sell_price <= 0.0) {
    return std::numeric_limits<double>::infinity();
  }
  return (buy_price / sell_price - 1.0) * 100.0;
}

// -------------------------------------------------------------------------
// isSpreadAcceptable(spread_pct, max_spread_pct)
// -------------------------------------------------------------------------
// @return true when the pair is at least as favourable as the limit.
// -------------------------------------------------------------------------
inline bool isSpreadAcceptable(double spread_pct, double max_spread_pct) {
  return spread_pct <= max_spread_pct;
}

// -------------------------------------------------------------------------
// roundToLot(quantity, lot_size)
// -------------------------------------------------------------------------
// @brief  Truncates quantity toward zero to a whole number of lots.
//
// @details
// lot_size <= 0 means "no lot constraint" and returns quantity unchanged.
// Sign is preserved, so a sell quantity of -9.8 with lot 1 becomes -9.
// Applying it twice gives the same result as applying it once.
// -------------------------------------------------------------------------
inline double roundToLot(double quantity, double lot_size) {
  if (lot_size <= 0.0) {
    return quantity;
  }
  const double lots = quantity / lot_size;
  const double whole = std::trunc(lots + std::copysign(kLotTolerance, lots));
  if (whole == 0.0) {
    return 0.0;
  }
  return whole * lot_size;
}

}  // namespace arb
