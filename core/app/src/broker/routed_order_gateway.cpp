#include "arb/broker/routed_order_gateway.hpp"
#include "arb/events/order_events.hpp"
#include "arb/time/time_utils.hpp"

#include <utility>

namespace arb {

RoutedOrderGateway::RoutedOrderGateway(EventSink sink,
                                       const ITimeProvider& clock)
    : sink_(std::move(sink)), clock_(clock) {}

OrderHandle RoutedOrderGateway::submitMarketOrder(const domain::Symbol& symbol,
                                                  double quantity,
                                                  const std::string& tag) {
  OrderRequestEvent request;
  request.order_id = order_ids_.next_id();
  request.symbol = symbol;
  request.quantity = quantity;
  request.tag = tag;
  request.timestamp = ms_to_timestamp(clock_.now_ms());
  request.sequence_id = request.order_id;

  const OrderHandle handle = request.order_id;
  sink_(std::move(request));
  submitted_.fetch_add(1);
  return handle;
}

void RoutedOrderGateway::cancelOpenOrders(const std::string& tag) {
  CancelRequestEvent request;
  request.tag = tag;
  request.timestamp = ms_to_timestamp(clock_.now_ms());
  sink_(std::move(request));
}

}  // namespace arb
