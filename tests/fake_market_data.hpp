#pragma once

// =============================================================================
// fake_market_data.hpp
// =============================================================================
// In-memory IMarketDataSource for matcher and execution tests. Every field is
// set directly by the test; nothing is derived. Unknown symbols answer like
// MarketDataCache does: zero prices, no depth, lot 1, market closed.
// =============================================================================

#include "arb/market/i_market_data_source.hpp"

#include <map>
#include <optional>
#include <string>
#include <utility>

namespace arb_test {

class FakeMarketData final : public arb::IMarketDataSource {
 public:
  struct Instrument {
    double bid{0.0};
    double ask{0.0};
    double last{0.0};
    std::optional<arb::domain::Depth> bids;
    std::optional<arb::domain::Depth> asks;
    double lot{1.0};
    bool open{true};
  };

  Instrument& set(const std::string& symbol) { return instruments_[symbol]; }

  void setQuote(const std::string& symbol, double bid, double ask,
                double last = 0.0) {
    auto& i = instruments_[symbol];
    i.bid = bid;
    i.ask = ask;
    i.last = last;
  }

  // Best prices follow the first level of each side.
  void setDepth(const std::string& symbol, arb::domain::Depth bids,
                arb::domain::Depth asks) {
    auto& i = instruments_[symbol];
    i.bid = bids.empty() ? 0.0 : bids.front().price;
    i.ask = asks.empty() ? 0.0 : asks.front().price;
    i.bids = std::move(bids);
    i.asks = std::move(asks);
  }

  void clearDepth(const std::string& symbol) {
    auto& i = instruments_[symbol];
    i.bids.reset();
    i.asks.reset();
  }

  void setLot(const std::string& symbol, double lot) {
    instruments_[symbol].lot = lot;
  }

  void setOpen(const std::string& symbol, bool open) {
    instruments_[symbol].open = open;
  }

  double bestBid(const arb::domain::Symbol& symbol) const override {
    const auto* i = find(symbol);
    return i ? i->bid : 0.0;
  }

  double bestAsk(const arb::domain::Symbol& symbol) const override {
    const auto* i = find(symbol);
    return i ? i->ask : 0.0;
  }

  double lastPrice(const arb::domain::Symbol& symbol) const override {
    const auto* i = find(symbol);
    return i ? i->last : 0.0;
  }

  std::optional<arb::domain::Depth> depth(
      const arb::domain::Symbol& symbol,
      arb::domain::BookSide side) const override {
    const auto* i = find(symbol);
    if (i == nullptr) {
      return std::nullopt;
    }
    return side == arb::domain::BookSide::Bid ? i->bids : i->asks;
  }

  double lotSize(const arb::domain::Symbol& symbol) const override {
    const auto* i = find(symbol);
    return i ? i->lot : 1.0;
  }

  bool isMarketOpen(const arb::domain::Symbol& symbol) const override {
    const auto* i = find(symbol);
    return i ? i->open : false;
  }

  bool hasData(const arb::domain::Symbol& symbol) const override {
    const auto* i = find(symbol);
    return i != nullptr && (i->bid > 0.0 || i->ask > 0.0 || i->last > 0.0);
  }

 private:
  const Instrument* find(const std::string& symbol) const {
    auto it = instruments_.find(symbol);
    return it == instruments_.end() ? nullptr : &it->second;
  }

  std::map<std::string, Instrument> instruments_;
};

}  // namespace arb_test
