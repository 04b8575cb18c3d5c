#pragma once

#include "arb/domain/instrument.hpp"
#include "arb/domain/order_status.hpp"

#include <cstdint>

namespace arb {
namespace domain {

// -----------------------------------------------------------------------------
// BrokerOrderId / TargetId
// -----------------------------------------------------------------------------
// BrokerOrderId is assigned by the order gateway when a leg is submitted.
// TargetId is minted once per ExecutionTarget by the TargetRegistry and is
// carried verbatim in every order tag, so order events can be routed back
// without relying on object identity. 0 is reserved as "unset" for both.
// -----------------------------------------------------------------------------
using BrokerOrderId = std::uint64_t;
using TargetId = std::uint64_t;

// -----------------------------------------------------------------------------
// LegOrder
// -----------------------------------------------------------------------------
// Responsibility: Bookkeeping copy of one broker order belonging to an
// OrderGroup.
//
// @details
// Quantities are signed: positive buys, negative sells. filled_quantity is
// cumulative and carries the same sign as quantity. average_fill_price is
// the quantity-weighted price of all fills so far. fee is cumulative.
//
// The ExecutionManager creates the LegOrder when the first order event for
// an order id arrives and folds every later event into it. Nothing else
// mutates it.
// -----------------------------------------------------------------------------
struct LegOrder {
  BrokerOrderId order_id{0};
  Symbol symbol;
  double quantity{0.0};
  double filled_quantity{0.0};
  double average_fill_price{0.0};
  double fee{0.0};
  LegOrderStatus status{LegOrderStatus::New};
  std::int64_t updated_ms{0};
};

}  // namespace domain
}  // namespace arb
