#pragma once

#include "arb/domain/instrument.hpp"

#include <optional>

namespace arb {

// -----------------------------------------------------------------------------
// IMarketDataSource: read-only price, depth and session queries
// -----------------------------------------------------------------------------
//
// @brief  Everything the SpreadMatcher and the ExecutionManager read about an
//         instrument.
//
// @details
// Queries are synchronous reads of cached state; no implementation may block
// on I/O. Unknown symbols report 0 prices, no depth, lot size 1 and a closed
// market, which every caller treats as "skip this tick".
//
//   bestBid / bestAsk / lastPrice  0 when not available.
//   depth(symbol, side)            std::nullopt when the feed publishes no
//                                  depth for the instrument. Levels are
//                                  best-first.
//   lotSize                        Minimum tradable increment (> 0).
//   isMarketOpen                   Session gate, consulted before every
//                                  submission.
//   hasData                        At least one quote has been received.
//
// Implementations:
//   MarketDataCache  production / simulation (fed by MarketDataEvent).
//   test fakes       in tests/.
// -----------------------------------------------------------------------------
class IMarketDataSource {
 public:
  virtual ~IMarketDataSource() = default;

  virtual double bestBid(const domain::Symbol& symbol) const = 0;
  virtual double bestAsk(const domain::Symbol& symbol) const = 0;
  virtual double lastPrice(const domain::Symbol& symbol) const = 0;

  virtual std::optional<domain::Depth> depth(const domain::Symbol& symbol,
                                             domain::BookSide side) const = 0;

  virtual double lotSize(const domain::Symbol& symbol) const = 0;
  virtual bool isMarketOpen(const domain::Symbol& symbol) const = 0;
  virtual bool hasData(const domain::Symbol& symbol) const = 0;
};

// -----------------------------------------------------------------------------
// markPrice(source, symbol)
// -----------------------------------------------------------------------------
// Single "current price" used to value remaining quantities: last trade if
// known, else the bid/ask midpoint, else whichever side is quoted. 0 when
// nothing is known.
// -----------------------------------------------------------------------------
inline double markPrice(const IMarketDataSource& source,
                        const domain::Symbol& symbol) {
  const double last = source.lastPrice(symbol);
  if (last > 0.0) {
    return last;
  }
  const double bid = source.bestBid(symbol);
  const double ask = source.bestAsk(symbol);
  if (bid > 0.0 && ask > 0.0) {
    return (bid + ask) / 2.0;
  }
  return bid > 0.0 ? bid : (ask > 0.0 ? ask : 0.0);
}

}  // namespace arb
