#pragma once

#include "arb/concurrent/sequence_generator.hpp"
#include "arb/events/event.hpp"
#include "arb/execution/i_order_gateway.hpp"
#include "arb/time/i_time_provider.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <string>

namespace arb {

// -----------------------------------------------------------------------------
// RoutedOrderGateway: IOrderGateway backed by the order routing loop
// -----------------------------------------------------------------------------
//
// @brief  Mints broker order ids and forwards OrderRequestEvent /
//         CancelRequestEvent through an event sink.
//
// @details
// The sink is OrderRoutingThread::push() in the engine, a recording lambda in
// tests. Submission never blocks and never fails synchronously; the broker's
// verdict arrives as LegOrderEvents.
//
// Thread model:
//   Called on the execution loop. The sink must be thread-safe.
//
// Ownership:
//   Owned by ArbitrageEngine. Holds a const reference to the engine clock.
// -----------------------------------------------------------------------------
class RoutedOrderGateway final : public IOrderGateway {
 public:
  using EventSink = std::function<void(Event)>;

  RoutedOrderGateway(EventSink sink, const ITimeProvider& clock);

  OrderHandle submitMarketOrder(const domain::Symbol& symbol, double quantity,
                                const std::string& tag) override;

  void cancelOpenOrders(const std::string& tag) override;

  std::size_t submittedCount() const { return submitted_.load(); }

 private:
  EventSink sink_;
  const ITimeProvider& clock_;
  SequenceGenerator order_ids_;
  std::atomic<std::size_t> submitted_{0};
};

}  // namespace arb
