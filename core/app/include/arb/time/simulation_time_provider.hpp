#pragma once

#include "arb/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace arb {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: externally driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose time only moves when advance_time() is called.
//
// @details
// MarketDataGateway calls advance_time(tick.timestamp_ms) before it pushes
// the tick, so every component handling that tick reads the tick's time.
// Tests use it to place the clock exactly at a timeout boundary.
//
// Storage is a single std::atomic<int64_t>: one writer (gateway thread or
// test), many readers (execution loop, order routing loop).
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // Sets the clock. Monotonicity is the caller's responsibility.
  void advance_time(std::int64_t new_time_ms);

  // Moves the clock forward by delta_ms and returns the new time.
  std::int64_t advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace arb
