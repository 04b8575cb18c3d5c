#pragma once

#include "arb/domain/instrument.hpp"
#include "arb/domain/leg_order.hpp"
#include "arb/domain/order_status.hpp"
#include "arb/eventbus/event_bus.hpp"
#include "arb/events/order_events.hpp"
#include "arb/market/i_market_data_source.hpp"
#include "arb/time/i_time_provider.hpp"

#include <cstddef>
#include <map>
#include <string>

namespace arb {

// -----------------------------------------------------------------------------
// PaperBrokerConfig
// -----------------------------------------------------------------------------
//   fee_per_share   Fee charged per filled share, reported on each fill.
//   max_fill_ratio  Share of an order filled on arrival, in (0, 1]. Below 1
//                   the remainder stays open and fills on the next
//                   HeartbeatEvent (or is canceled by a CancelRequestEvent).
// -----------------------------------------------------------------------------
struct PaperBrokerConfig {
  double fee_per_share{0.0};
  double max_fill_ratio{1.0};
};

// -----------------------------------------------------------------------------
// PaperBroker: simulated market-order venue on the order routing loop
// -----------------------------------------------------------------------------
//
// @brief  Fills OrderRequestEvents against the current best prices and
//         reports every step as a LegOrderEvent.
//
// @details
// Per OrderRequestEvent:
//
//   1. Submitted ack.
//   2. Invalid when the market is closed, no price is known for the side
//      (ask for buys, bid for sells, last trade as fallback) or the
//      quantity is zero.
//   3. Otherwise an immediate fill of max_fill_ratio of the quantity
//      (lot-aligned, at least one lot): Filled when that is everything,
//      PartiallyFilled with the remainder kept open otherwise.
//
// HeartbeatEvent fills every open remainder at the then-current price.
// CancelRequestEvent cancels every open order carrying the tag.
//
// All reports are published on the routing bus; OrderRoutingThread's owner
// bridges them back to the execution loop.
//
// Thread model:
//   Lives on the order routing loop. Every callback runs on that thread;
//   open_orders_ needs no lock. The IMarketDataSource is read concurrently
//   with the execution loop and must be thread-safe (MarketDataCache is).
//
// Ownership:
//   Owned by OrderRoutingThread via std::unique_ptr. Subscribes in the
//   constructor and unsubscribes in the destructor.
// -----------------------------------------------------------------------------
class PaperBroker final {
 public:
  PaperBroker(EventBus& bus, const IMarketDataSource& source,
              const ITimeProvider& clock, PaperBrokerConfig config = {});
  ~PaperBroker();

  PaperBroker(const PaperBroker&) = delete;
  PaperBroker& operator=(const PaperBroker&) = delete;
  PaperBroker(PaperBroker&&) = delete;
  PaperBroker& operator=(PaperBroker&&) = delete;

  std::size_t openOrderCount() const { return open_orders_.size(); }

 private:
  struct OpenOrder {
    domain::Symbol symbol;
    double quantity{0.0};
    double filled{0.0};
    std::string tag;
  };

  void onOrderRequest(const OrderRequestEvent& event);
  void onCancelRequest(const CancelRequestEvent& event);
  void onHeartbeat();

  // Fills `quantity` of order at the current price. Returns false (and
  // leaves the order untouched) when no price is available.
  bool fill(domain::BrokerOrderId order_id, OpenOrder& order, double quantity);

  double fillPrice(const domain::Symbol& symbol, double quantity) const;

  void report(domain::BrokerOrderId order_id, const OpenOrder& order,
              domain::LegOrderStatus status, double fill_quantity = 0.0,
              double fill_price = 0.0);

  EventBus& bus_;
  const IMarketDataSource& source_;
  const ITimeProvider& clock_;
  PaperBrokerConfig config_;

  EventBus::SubscriptionId order_sub_id_{0};
  EventBus::SubscriptionId cancel_sub_id_{0};
  EventBus::SubscriptionId heartbeat_sub_id_{0};

  // Orders with an unfilled remainder, keyed by broker order id.
  std::map<domain::BrokerOrderId, OpenOrder> open_orders_;
};

}  // namespace arb
