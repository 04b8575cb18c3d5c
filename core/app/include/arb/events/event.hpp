#pragma once

#include "arb/events/event_types.hpp"
#include "arb/events/order_events.hpp"
#include "arb/events/target_events.hpp"

#include <variant>

namespace arb {

// -----------------------------------------------------------------------------
// Event
// -----------------------------------------------------------------------------
// The envelope every EventBus and every loop queue carries. A closed variant:
// adding an event kind means adding it here, and every std::get_if /
// std::visit site sees the new alternative at compile time.
//
// Flow by alternative:
//   MarketDataEvent     market data thread → execution loop
//   TargetRequestEvent  caller → execution loop
//   OrderRequestEvent   execution loop → order routing loop
//   CancelRequestEvent  execution loop → order routing loop
//   LegOrderEvent       order routing loop → execution loop
//   TargetUpdateEvent   execution loop → IPC telemetry
//   HeartbeatEvent      any → IPC telemetry
// -----------------------------------------------------------------------------
using Event = std::variant<
    MarketDataEvent,
    TargetRequestEvent,
    OrderRequestEvent,
    CancelRequestEvent,
    LegOrderEvent,
    TargetUpdateEvent,
    HeartbeatEvent>;

}  // namespace arb
