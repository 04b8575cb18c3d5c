#include "arb/market/market_data_cache.hpp"
#include "arb/time/time_utils.hpp"

#include <algorithm>
#include <iostream>
#include <mutex>

namespace arb {

MarketDataCache::MarketDataCache(std::size_t max_depth_levels)
    : max_depth_levels_(max_depth_levels == 0 ? 1 : max_depth_levels) {}

// -----------------------------------------------------------------------------
// registerInstrument()
// -----------------------------------------------------------------------------
void MarketDataCache::registerInstrument(const domain::InstrumentSpec& spec) {
  domain::InstrumentSpec normalized = spec;
  if (normalized.lot_size <= 0.0) {
    std::cerr << "[MarketDataCache] WARNING: non-positive lot size "
              << spec.lot_size << " for " << spec.symbol
              << ", using 1.\n";
    normalized.lot_size = 1.0;
  }

  std::unique_lock lock(mutex_);
  entries_[normalized.symbol].spec = normalized;
}

// -----------------------------------------------------------------------------
// setMarketOpen()
// -----------------------------------------------------------------------------
void MarketDataCache::setMarketOpen(const domain::Symbol& symbol, bool open) {
  std::unique_lock lock(mutex_);
  auto it = entries_.find(symbol);
  if (it == entries_.end()) {
    std::cerr << "[MarketDataCache] WARNING: session update for unknown "
                 "symbol " << symbol << ". Skipping.\n";
    return;
  }
  it->second.spec.market_open = open;
}

// -----------------------------------------------------------------------------
// update(): fold one tick into the cached state
// -----------------------------------------------------------------------------
void MarketDataCache::update(const MarketDataEvent& event) {
  domain::Depth bids = sanitize(event.bids);
  domain::Depth asks = sanitize(event.asks);

  std::unique_lock lock(mutex_);

  auto it = entries_.find(event.symbol);
  if (it == entries_.end()) {
    std::cerr << "[MarketDataCache] WARNING: tick for unregistered symbol "
              << event.symbol << ", registering with lot size 1.\n";
    Entry entry;
    entry.spec.symbol = event.symbol;
    it = entries_.emplace(event.symbol, std::move(entry)).first;
  }

  Entry& entry = it->second;

  if (event.bid > 0.0) {
    entry.bid = event.bid;
  } else if (!bids.empty()) {
    entry.bid = bids.front().price;
  }

  if (event.ask > 0.0) {
    entry.ask = event.ask;
  } else if (!asks.empty()) {
    entry.ask = asks.front().price;
  }

  if (event.last > 0.0) {
    entry.last = event.last;
  }

  entry.bids = std::move(bids);
  entry.asks = std::move(asks);

  if (event.market_open.has_value()) {
    entry.spec.market_open = *event.market_open;
  }

  entry.has_quote = entry.bid > 0.0 || entry.ask > 0.0 || entry.last > 0.0;
  entry.updated_ms = timestamp_to_ms(event.timestamp);
}

// -----------------------------------------------------------------------------
// symbols()
// -----------------------------------------------------------------------------
std::vector<domain::Symbol> MarketDataCache::symbols() const {
  std::shared_lock lock(mutex_);
  std::vector<domain::Symbol> out;
  out.reserve(entries_.size());
  for (const auto& [symbol, entry] : entries_) {
    out.push_back(symbol);
  }
  return out;
}

std::optional<std::int64_t> MarketDataCache::lastUpdateMs(
    const domain::Symbol& symbol) const {
  std::shared_lock lock(mutex_);
  const Entry* entry = find(symbol);
  if (entry == nullptr || !entry->has_quote) {
    return std::nullopt;
  }
  return entry->updated_ms;
}

// -----------------------------------------------------------------------------
// IMarketDataSource queries
// -----------------------------------------------------------------------------
double MarketDataCache::bestBid(const domain::Symbol& symbol) const {
  std::shared_lock lock(mutex_);
  const Entry* entry = find(symbol);
  return entry ? entry->bid : 0.0;
}

double MarketDataCache::bestAsk(const domain::Symbol& symbol) const {
  std::shared_lock lock(mutex_);
  const Entry* entry = find(symbol);
  return entry ? entry->ask : 0.0;
}

double MarketDataCache::lastPrice(const domain::Symbol& symbol) const {
  std::shared_lock lock(mutex_);
  const Entry* entry = find(symbol);
  return entry ? entry->last : 0.0;
}

std::optional<domain::Depth> MarketDataCache::depth(
    const domain::Symbol& symbol, domain::BookSide side) const {
  std::shared_lock lock(mutex_);
  const Entry* entry = find(symbol);
  if (entry == nullptr || entry->bids.empty() || entry->asks.empty()) {
    return std::nullopt;
  }
  return side == domain::BookSide::Bid ? entry->bids : entry->asks;
}

double MarketDataCache::lotSize(const domain::Symbol& symbol) const {
  std::shared_lock lock(mutex_);
  const Entry* entry = find(symbol);
  return entry ? entry->spec.lot_size : 1.0;
}

bool MarketDataCache::isMarketOpen(const domain::Symbol& symbol) const {
  std::shared_lock lock(mutex_);
  const Entry* entry = find(symbol);
  return entry != nullptr && entry->spec.market_open;
}

bool MarketDataCache::hasData(const domain::Symbol& symbol) const {
  std::shared_lock lock(mutex_);
  const Entry* entry = find(symbol);
  return entry != nullptr && entry->has_quote;
}

// -----------------------------------------------------------------------------
// Private helpers. find() expects the caller to hold the lock.
// -----------------------------------------------------------------------------
domain::Depth MarketDataCache::sanitize(const domain::Depth& levels) const {
  domain::Depth out;
  out.reserve(std::min(levels.size(), max_depth_levels_));
  for (const auto& level : levels) {
    if (out.size() >= max_depth_levels_) {
      break;
    }
    if (level.price > 0.0 && level.size > 0.0) {
      out.push_back(level);
    }
  }
  return out;
}

const MarketDataCache::Entry* MarketDataCache::find(
    const domain::Symbol& symbol) const {
  auto it = entries_.find(symbol);
  return it == entries_.end() ? nullptr : &it->second;
}

}  // namespace arb
