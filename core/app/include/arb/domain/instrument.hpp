#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace arb {
namespace domain {

// -----------------------------------------------------------------------------
// Symbol
// -----------------------------------------------------------------------------
// Instrument identifier as it appears on the market data feed and in broker
// order events (e.g. "AAPLx" for a tokenized stock, "AAPL" for the equity).
// -----------------------------------------------------------------------------
using Symbol = std::string;

// -----------------------------------------------------------------------------
// BookSide
// -----------------------------------------------------------------------------
// Which side of an order book a depth query refers to. Buying consumes the
// Ask side, selling consumes the Bid side.
// -----------------------------------------------------------------------------
enum class BookSide {
  Bid,
  Ask,
};

// -----------------------------------------------------------------------------
// BookLevel
// -----------------------------------------------------------------------------
// Responsibility: One aggregated price level of an order book.
//
// @details
// Depth vectors are ordered best-first: descending price for bids, ascending
// price for asks. Sizes are in instrument units (shares, tokens), never in
// notional.
// -----------------------------------------------------------------------------
struct BookLevel {
  double price{0.0};
  double size{0.0};
};

using Depth = std::vector<BookLevel>;

// -----------------------------------------------------------------------------
// InstrumentSpec
// -----------------------------------------------------------------------------
// Static trading properties of an instrument. Seeded from EngineConfig into
// the MarketDataCache at startup.
//
//   lot_size     Minimum tradable increment. Every order quantity is a
//                multiple of it.
//   market_open  Initial session state. Market data ticks may toggle it.
// -----------------------------------------------------------------------------
struct InstrumentSpec {
  Symbol symbol;
  double lot_size{1.0};
  bool market_open{true};
};

}  // namespace domain
}  // namespace arb
