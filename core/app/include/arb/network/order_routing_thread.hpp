#pragma once

#include "arb/broker/paper_broker.hpp"
#include "arb/concurrent/event_loop_thread.hpp"
#include "arb/market/i_market_data_source.hpp"
#include "arb/time/i_time_provider.hpp"

#include <memory>

namespace arb {

// -----------------------------------------------------------------------------
// OrderRoutingThread: dedicated thread for the broker
// -----------------------------------------------------------------------------
//
// @brief  Owns an EventLoopThread and the PaperBroker living on it, keeping
//         broker work off the execution loop.
//
// @details
// Cross-thread event bridges (wired by ArbitrageEngine):
//
//   execution_loop                     order_routing_thread
//   ─────────────────────              ─────────────────────
//   ExecutionManager submits via
//   RoutedOrderGateway
//         │
//         ├──push(OrderRequestEvent)──▶ order_routing loop queue
//         │                                       │
//         │                              PaperBroker::onOrderRequest()
//         │                                       │
//         │                              publish LegOrderEvent
//         │                              on order_routing bus
//         │                                       │
//         ◀──push()── bridge subscriber ──────────┘
//         │
//   ExecutionManager::onOrderEvent()
//
// Thread model:
//   Constructed, started and stopped on the main thread (via
//   ArbitrageEngine). push() from any thread.
//
// Ownership:
//   Owns the EventLoopThread (value member) and the PaperBroker
//   (unique_ptr, created in start()). Holds const references to the market
//   data source and the clock, which must outlive it.
// -----------------------------------------------------------------------------
class OrderRoutingThread {
 public:
  OrderRoutingThread(const IMarketDataSource& source,
                     const ITimeProvider& clock,
                     PaperBrokerConfig broker_config = {});

  // RAII: calls stop() if still running.
  ~OrderRoutingThread();

  OrderRoutingThread(const OrderRoutingThread&) = delete;
  OrderRoutingThread& operator=(const OrderRoutingThread&) = delete;
  OrderRoutingThread(OrderRoutingThread&&) = delete;
  OrderRoutingThread& operator=(OrderRoutingThread&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // @brief  Creates the PaperBroker on the loop's bus, then starts the loop.
  //
  // @details
  // The broker subscribes before the worker thread exists, so no request
  // pushed after start() returns can be dispatched to an empty bus.
  // Idempotent.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // @brief  Stops the loop thread (joins the worker), then destroys the
  //         broker. Idempotent.
  // -------------------------------------------------------------------------
  void stop();

  void push(Event event);

  // Bus of the routing loop. Used by ArbitrageEngine to bridge
  // LegOrderEvents back to the execution loop.
  EventBus& eventBus();

  bool isRunning() const { return running_; }

 private:
  const IMarketDataSource& source_;
  const ITimeProvider& clock_;
  PaperBrokerConfig broker_config_;
  EventLoopThread loop_{"order_routing"};
  std::unique_ptr<PaperBroker> broker_;
  bool running_{false};
};

}  // namespace arb
