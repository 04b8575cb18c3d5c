#pragma once

#include <cstdint>

namespace arb {

// -----------------------------------------------------------------------------
// ITimeProvider: injectable clock
// -----------------------------------------------------------------------------
//
// @brief  Source of "now" for every component that reasons about time:
//         target creation and anchor times, timeout checks, broker event
//         timestamps.
//
// @details
// Implementations:
//   LiveTimeProvider        system_clock, for paper trading against a live
//                           feed.
//   SimulationTimeProvider  driven by the market data replay; the gateway
//                           advances it before publishing each tick, so a
//                           replayed session times out targets exactly as
//                           the live one would.
//
// Time is int64 epoch milliseconds. ExecutionTarget::isExpired() compares
// these values directly, so millisecond resolution is the timeout
// resolution.
//
// Thread-safety: now_ms() must be safe to call concurrently from any thread.
//
// Ownership: components hold a const reference; the provider must outlive
// them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // Current time in epoch milliseconds. A simulation clock returns 0 until
  // the first tick is replayed.
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace arb
