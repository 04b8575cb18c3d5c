#pragma once

#include "arb/domain/instrument.hpp"
#include "arb/domain/leg_order.hpp"
#include "arb/domain/order_status.hpp"
#include "arb/events/event_types.hpp"

#include <cstdint>
#include <string>

namespace arb {

// -----------------------------------------------------------------------------
// OrderRequestEvent
// -----------------------------------------------------------------------------
// Responsibility: A market order on its way from RoutedOrderGateway
// (execution loop) to the PaperBroker (order routing loop).
//
// quantity is signed (positive buy, negative sell). tag carries the owning
// target's id (see target_tag.hpp) and is echoed back on every LegOrderEvent.
// -----------------------------------------------------------------------------
struct OrderRequestEvent {
  domain::BrokerOrderId order_id{0};
  domain::Symbol symbol;
  double quantity{0.0};
  std::string tag;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// CancelRequestEvent
// -----------------------------------------------------------------------------
// Asks the broker to cancel every still-open order carrying `tag`. Sent when a
// target times out; the broker answers with Canceled LegOrderEvents.
// -----------------------------------------------------------------------------
struct CancelRequestEvent {
  std::string tag;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// LegOrderEvent
// -----------------------------------------------------------------------------
// Responsibility: Broker report for one order (ack, fill, partial fill,
// cancel, rejection).
//
// @details
// order_quantity echoes the signed quantity originally requested, so the
// first report for an order can open its bookkeeping entry.
// fill_quantity and fee are INCREMENTAL: they describe this report only.
// fill_quantity is signed like the order. fill_price is the price of this
// fill (0 when nothing filled). Events for the same order_id arrive in the
// order the broker produced them.
// -----------------------------------------------------------------------------
struct LegOrderEvent {
  domain::BrokerOrderId order_id{0};
  domain::Symbol symbol;
  double order_quantity{0.0};
  domain::LegOrderStatus status{domain::LegOrderStatus::Submitted};
  double fill_quantity{0.0};
  double fill_price{0.0};
  double fee{0.0};
  std::string tag;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace arb
