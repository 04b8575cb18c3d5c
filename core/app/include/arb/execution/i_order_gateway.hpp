#pragma once

#include "arb/domain/instrument.hpp"
#include "arb/domain/leg_order.hpp"

#include <string>

namespace arb {

using OrderHandle = domain::BrokerOrderId;

// -----------------------------------------------------------------------------
// IOrderGateway: outbound order path of the ExecutionManager
// -----------------------------------------------------------------------------
//
// @brief  Submits market orders and cancels open ones, identified by tag.
//
// @details
// Both calls are fire-and-forget: the outcome arrives later as LegOrderEvents
// on the execution loop. submitMarketOrder() never reports failure
// synchronously; a rejected order comes back as an Invalid LegOrderEvent.
// The returned handle is the broker order id every later event carries.
//
// Implementations:
//   RoutedOrderGateway  pushes requests into the order routing loop.
//   test doubles        record requests in tests/.
//
// Thread model:
//   Called on the execution loop thread only.
// -----------------------------------------------------------------------------
class IOrderGateway {
 public:
  virtual ~IOrderGateway() = default;

  // quantity is signed: positive buys, negative sells.
  virtual OrderHandle submitMarketOrder(const domain::Symbol& symbol,
                                        double quantity,
                                        const std::string& tag) = 0;

  // Requests cancellation of every still-open order carrying tag.
  virtual void cancelOpenOrders(const std::string& tag) = 0;
};

}  // namespace arb
