#include "arb/broker/paper_broker.hpp"
#include "arb/matching/spread_math.hpp"
#include "arb/time/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>

namespace arb {

// -----------------------------------------------------------------------------
// Constructor: subscribe to order, cancel and heartbeat events
// -----------------------------------------------------------------------------
PaperBroker::PaperBroker(EventBus& bus, const IMarketDataSource& source,
                         const ITimeProvider& clock, PaperBrokerConfig config)
    : bus_(bus), source_(source), clock_(clock), config_(config) {
  if (!(config_.max_fill_ratio > 0.0) || config_.max_fill_ratio > 1.0) {
    std::cerr << "[PaperBroker] WARNING: max_fill_ratio "
              << config_.max_fill_ratio << " outside (0, 1], using 1.\n";
    config_.max_fill_ratio = 1.0;
  }

  order_sub_id_ = bus_.subscribe<OrderRequestEvent>(
      [this](const OrderRequestEvent& e) { onOrderRequest(e); });

  cancel_sub_id_ = bus_.subscribe<CancelRequestEvent>(
      [this](const CancelRequestEvent& e) { onCancelRequest(e); });

  heartbeat_sub_id_ = bus_.subscribe<HeartbeatEvent>(
      [this](const HeartbeatEvent&) { onHeartbeat(); });
}

// -----------------------------------------------------------------------------
// Destructor: unsubscribe
// -----------------------------------------------------------------------------
PaperBroker::~PaperBroker() {
  bus_.unsubscribe(heartbeat_sub_id_);
  bus_.unsubscribe(cancel_sub_id_);
  bus_.unsubscribe(order_sub_id_);
}

// -----------------------------------------------------------------------------
// onOrderRequest: ack, validate, fill (fully or partially)
// -----------------------------------------------------------------------------
void PaperBroker::onOrderRequest(const OrderRequestEvent& event) {
  OpenOrder order;
  order.symbol = event.symbol;
  order.quantity = event.quantity;
  order.tag = event.tag;

  report(event.order_id, order, domain::LegOrderStatus::Submitted);

  if (event.quantity == 0.0 || !source_.isMarketOpen(event.symbol)) {
    std::cerr << "[PaperBroker] WARNING: rejecting order " << event.order_id
              << " (" << event.symbol << " " << event.quantity
              << "): market closed or empty order.\n";
    report(event.order_id, order, domain::LegOrderStatus::Invalid);
    return;
  }

  double first_fill = event.quantity;
  if (config_.max_fill_ratio < 1.0) {
    const double lot = source_.lotSize(event.symbol);
    first_fill = roundToLot(event.quantity * config_.max_fill_ratio, lot);
    if (first_fill == 0.0) {
      first_fill = std::abs(event.quantity) >= lot
                       ? std::copysign(lot, event.quantity)
                       : event.quantity;
    }
  }

  if (!fill(event.order_id, order, first_fill)) {
    std::cerr << "[PaperBroker] WARNING: rejecting order " << event.order_id
              << " (" << event.symbol << "): no price.\n";
    report(event.order_id, order, domain::LegOrderStatus::Invalid);
    return;
  }

  if (order.filled != order.quantity) {
    open_orders_.emplace(event.order_id, std::move(order));
  }
}

// -----------------------------------------------------------------------------
// onCancelRequest: cancel every open remainder carrying the tag
// -----------------------------------------------------------------------------
void PaperBroker::onCancelRequest(const CancelRequestEvent& event) {
  for (auto it = open_orders_.begin(); it != open_orders_.end();) {
    if (it->second.tag != event.tag) {
      ++it;
      continue;
    }
    std::cout << "[PaperBroker] canceled order " << it->first << " ("
              << it->second.symbol << ", "
              << it->second.quantity - it->second.filled << " open)\n";
    report(it->first, it->second, domain::LegOrderStatus::Canceled);
    it = open_orders_.erase(it);
  }
}

// -----------------------------------------------------------------------------
// onHeartbeat: fill open remainders
// -----------------------------------------------------------------------------
void PaperBroker::onHeartbeat() {
  for (auto it = open_orders_.begin(); it != open_orders_.end();) {
    OpenOrder& order = it->second;
    if (!source_.isMarketOpen(order.symbol) ||
        !fill(it->first, order, order.quantity - order.filled)) {
      ++it;
      continue;
    }
    it = open_orders_.erase(it);
  }
}

// -----------------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------------
bool PaperBroker::fill(domain::BrokerOrderId order_id, OpenOrder& order,
                       double quantity) {
  const double price = fillPrice(order.symbol, quantity);
  if (price <= 0.0) {
    return false;
  }

  order.filled += quantity;
  const bool done = std::abs(order.quantity - order.filled) <
                    kLotTolerance * std::max(1.0, std::abs(order.quantity));
  if (done) {
    order.filled = order.quantity;
  }

  report(order_id, order,
         done ? domain::LegOrderStatus::Filled
              : domain::LegOrderStatus::PartiallyFilled,
         quantity, price);
  return true;
}

double PaperBroker::fillPrice(const domain::Symbol& symbol,
                              double quantity) const {
  const double quote =
      quantity > 0.0 ? source_.bestAsk(symbol) : source_.bestBid(symbol);
  return quote > 0.0 ? quote : source_.lastPrice(symbol);
}

void PaperBroker::report(domain::BrokerOrderId order_id, const OpenOrder& order,
                         domain::LegOrderStatus status, double fill_quantity,
                         double fill_price) {
  LegOrderEvent event;
  event.order_id = order_id;
  event.symbol = order.symbol;
  event.order_quantity = order.quantity;
  event.status = status;
  event.fill_quantity = fill_quantity;
  event.fill_price = fill_price;
  event.fee = config_.fee_per_share * std::abs(fill_quantity);
  event.tag = order.tag;
  event.timestamp = ms_to_timestamp(clock_.now_ms());

  bus_.publish(event);
}

}  // namespace arb
