#pragma once

#include <atomic>
#include <cstdint>

namespace arb {

// -----------------------------------------------------------------------------
// SequenceGenerator: thread-safe, monotonically increasing id source
// -----------------------------------------------------------------------------
//
// @brief  Hands out unique ids from an atomic counter. Used for TargetIds
//         (TargetRegistry) and broker order ids (RoutedOrderGateway).
//
// @details
// The counter starts at `first` (default 1). 0 stays reserved as the "unset"
// sentinel in every id type that uses this generator. fetch_add with relaxed
// ordering is enough: the only requirement is uniqueness, no other memory
// operation is ordered against the increment.
//
// The TargetRegistry only mints ids on the execution loop thread, but broker
// order ids are minted by whichever thread calls the gateway, so the counter
// stays atomic.
//
// Ownership:
//   Value member of its owner (TargetRegistry, RoutedOrderGateway). Never a
//   global.
// -----------------------------------------------------------------------------
class SequenceGenerator {
 public:
  explicit SequenceGenerator(std::uint64_t first = 1) : next_id_(first) {}

  SequenceGenerator(const SequenceGenerator&) = delete;
  SequenceGenerator& operator=(const SequenceGenerator&) = delete;
  SequenceGenerator(SequenceGenerator&&) = delete;
  SequenceGenerator& operator=(SequenceGenerator&&) = delete;

  // Returns the next id. Safe to call concurrently from any thread.
  std::uint64_t next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

  // Value the next call to next_id() will return: every id below it has been
  // handed out. Stale if another thread mints concurrently.
  std::uint64_t peek() const {
    return next_id_.load(std::memory_order_relaxed);
  }

 private:
  std::atomic<std::uint64_t> next_id_;
};

}  // namespace arb
