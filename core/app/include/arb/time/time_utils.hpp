#pragma once

#include "arb/events/event_types.hpp"

#include <chrono>
#include <cstdint>

namespace arb {

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
// Event structs carry Timestamp (system_clock::time_point); ITimeProvider and
// all timeout arithmetic use int64 epoch milliseconds. These two helpers are
// the only place the representations meet.
// -----------------------------------------------------------------------------

inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

}  // namespace arb
