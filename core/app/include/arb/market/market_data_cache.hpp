#pragma once

#include "arb/domain/instrument.hpp"
#include "arb/events/event_types.hpp"
#include "arb/market/i_market_data_source.hpp"

#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace arb {

// -----------------------------------------------------------------------------
// MarketDataCache: latest quote, depth and session state per instrument
// -----------------------------------------------------------------------------
//
// @brief  IMarketDataSource backed by the most recent MarketDataEvent of each
//         instrument.
//
// @details
// Instruments are registered from EngineConfig with their lot size and
// initial session state. A tick for an unregistered symbol registers it with
// lot size 1 and logs a warning once.
//
// update() semantics per tick:
//   - bid / ask / last overwrite the cached values when > 0; a 0 keeps the
//     previous value (feeds often send partial quotes).
//   - bids / asks replace the cached depth wholesale, after dropping levels
//     with non-positive price or size. An empty vector clears the depth, so
//     the matcher falls back to best prices for that side.
//   - When bids/asks carry levels but bid/ask are 0, the top level fills in
//     best bid/ask.
//   - market_open, when present, updates the session gate.
//
// Depth is reported only when BOTH sides have at least one level, matching
// the matcher's notion of "has order book depth". max_depth_levels caps how
// many levels depth() returns.
//
// Thread model:
//   Written on the execution loop (update) and read from both the execution
//   loop (matcher, manager) and the order routing loop (PaperBroker fills at
//   the cached best price). A std::shared_mutex lets readers proceed in
//   parallel; update() takes the exclusive lock.
//
// Ownership:
//   Owned by ArbitrageEngine via std::unique_ptr; referenced by
//   SpreadMatcher, ExecutionManager and PaperBroker.
// -----------------------------------------------------------------------------
class MarketDataCache final : public IMarketDataSource {
 public:
  explicit MarketDataCache(std::size_t max_depth_levels = 10);

  MarketDataCache(const MarketDataCache&) = delete;
  MarketDataCache& operator=(const MarketDataCache&) = delete;
  MarketDataCache(MarketDataCache&&) = delete;
  MarketDataCache& operator=(MarketDataCache&&) = delete;

  // Registers or re-registers an instrument. Keeps cached prices if the
  // symbol is already known.
  void registerInstrument(const domain::InstrumentSpec& spec);

  void setMarketOpen(const domain::Symbol& symbol, bool open);

  void update(const MarketDataEvent& event);

  std::vector<domain::Symbol> symbols() const;

  // Epoch ms of the last update for symbol, std::nullopt if never updated.
  std::optional<std::int64_t> lastUpdateMs(const domain::Symbol& symbol) const;

  // IMarketDataSource
  double bestBid(const domain::Symbol& symbol) const override;
  double bestAsk(const domain::Symbol& symbol) const override;
  double lastPrice(const domain::Symbol& symbol) const override;
  std::optional<domain::Depth> depth(const domain::Symbol& symbol,
                                     domain::BookSide side) const override;
  double lotSize(const domain::Symbol& symbol) const override;
  bool isMarketOpen(const domain::Symbol& symbol) const override;
  bool hasData(const domain::Symbol& symbol) const override;

 private:
  struct Entry {
    domain::InstrumentSpec spec;
    double bid{0.0};
    double ask{0.0};
    double last{0.0};
    domain::Depth bids;
    domain::Depth asks;
    bool has_quote{false};
    std::int64_t updated_ms{0};
  };

  // Drops non-positive levels and truncates to max_depth_levels_.
  domain::Depth sanitize(const domain::Depth& levels) const;

  const Entry* find(const domain::Symbol& symbol) const;

  std::size_t max_depth_levels_;

  mutable std::shared_mutex mutex_;
  std::unordered_map<domain::Symbol, Entry> entries_;
};

}  // namespace arb
