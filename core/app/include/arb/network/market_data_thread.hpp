#pragma once

#include "arb/events/event.hpp"
#include "arb/gateway/market_data_gateway.hpp"
#include "arb/time/simulation_time_provider.hpp"

#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace arb {

// -----------------------------------------------------------------------------
// MarketDataThread: dedicated I/O thread for market data ingestion
// -----------------------------------------------------------------------------
//
// @brief  Runs the MarketDataGateway's ZMQ recv loop on its own std::thread.
//
// @details
// MarketDataGateway has its own blocking recv loop (ZMQ_RCVTIMEO polling)
// and does not consume from a queue, so it runs on a raw std::thread rather
// than an EventLoopThread. Decoded ticks go through the event sink into the
// execution loop.
//
// The gateway (and its socket) is created in start(), not in the
// constructor, so the engine can be assembled before any connection is
// made.
//
// Thread model:
//   start()/stop() on the owning thread. The worker runs
//   MarketDataGateway::run() exclusively.
//
// Ownership:
//   Owned by ArbitrageEngine via std::unique_ptr. Owns the gateway. Holds a
//   nullable pointer to the simulation clock.
// -----------------------------------------------------------------------------
class MarketDataThread {
 public:
  using EventSink = std::function<void(Event)>;

  MarketDataThread(SimulationTimeProvider* time_provider, EventSink event_sink,
                   std::string endpoint);

  // RAII: calls stop().
  ~MarketDataThread();

  MarketDataThread(const MarketDataThread&) = delete;
  MarketDataThread& operator=(const MarketDataThread&) = delete;
  MarketDataThread(MarketDataThread&&) = delete;
  MarketDataThread& operator=(MarketDataThread&&) = delete;

  // Creates the gateway and spawns the recv thread. A socket that cannot
  // connect is logged and leaves the thread stopped; returns false then.
  // Idempotent.
  bool start();

  // Signals the gateway, joins the thread and logs how many ticks were
  // forwarded and rejected. Idempotent.
  void stop();

  bool isRunning() const { return thread_.joinable(); }

 private:
  SimulationTimeProvider* time_provider_;
  EventSink event_sink_;
  std::string endpoint_;

  std::unique_ptr<MarketDataGateway> gateway_;
  std::thread thread_;
};

}  // namespace arb
