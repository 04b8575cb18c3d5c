#pragma once

#include "arb/events/event_types.hpp"
#include "arb/execution/target_types.hpp"

#include <cstdint>

namespace arb {

// -----------------------------------------------------------------------------
// TargetRequestEvent
// -----------------------------------------------------------------------------
// Carries a new opportunity into the execution loop. Registration happens on
// the loop thread so the registry keeps a single writer.
// -----------------------------------------------------------------------------
struct TargetRequestEvent {
  TargetRequest request;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// TargetUpdateEvent
// -----------------------------------------------------------------------------
// Published by ExecutionJournal on the execution loop for every target
// transition it records. `retired` is true for the final (terminal) update.
// The IPC server streams these as JSON telemetry.
// -----------------------------------------------------------------------------
struct TargetUpdateEvent {
  TargetSnapshot snapshot;
  bool retired{false};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace arb
