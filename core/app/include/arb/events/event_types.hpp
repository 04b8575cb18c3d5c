#pragma once

#include "arb/domain/instrument.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace arb {

// -----------------------------------------------------------------------------
// Timestamp
// -----------------------------------------------------------------------------
// Wall-clock (or simulated) event time. Components that need arithmetic on
// time use int64 epoch milliseconds from ITimeProvider; see time_utils.hpp
// for the conversions.
// -----------------------------------------------------------------------------
using Timestamp = std::chrono::system_clock::time_point;

// -----------------------------------------------------------------------------
// MarketDataEvent
// -----------------------------------------------------------------------------
// Responsibility: One quote / book update for one instrument.
//
// @details
// Produced by MarketDataGateway (ZeroMQ JSON feed) or pushed directly by
// tests. Consumed on the execution loop: the MarketDataCache stores it, then
// the ExecutionManager evaluates every active target trading `symbol`.
//
//   bid / ask / last  Top of book and last trade; 0 means "not provided".
//   bids / asks       Optional depth, best first. Empty means the feed has
//                     no depth for this instrument on this tick.
//   market_open       Session gate update; absent leaves the gate unchanged.
// -----------------------------------------------------------------------------
struct MarketDataEvent {
  domain::Symbol symbol;
  double bid{0.0};
  double ask{0.0};
  double last{0.0};
  domain::Depth bids;
  domain::Depth asks;
  std::optional<bool> market_open;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// HeartbeatEvent
// -----------------------------------------------------------------------------
// Periodic tick from the engine's heartbeat timer ("engine", "ok"). Drives
// timeouts in quiet markets, batch journal flushes and paper-broker
// remainder fills.
// -----------------------------------------------------------------------------
struct HeartbeatEvent {
  std::string component_id;
  std::string status;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace arb
