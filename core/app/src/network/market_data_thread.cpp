#include "arb/network/market_data_thread.hpp"

#include <iostream>
#include <utility>

namespace arb {

MarketDataThread::MarketDataThread(SimulationTimeProvider* time_provider,
                                   EventSink event_sink, std::string endpoint)
    : time_provider_(time_provider),
      event_sink_(std::move(event_sink)),
      endpoint_(std::move(endpoint)) {}

MarketDataThread::~MarketDataThread() { stop(); }

// -----------------------------------------------------------------------------
// start(): connect the feed socket, then spawn the recv thread
// -----------------------------------------------------------------------------
bool MarketDataThread::start() {
  if (thread_.joinable()) {
    return true;
  }

  try {
    gateway_ = std::make_unique<MarketDataGateway>(time_provider_,
                                                   event_sink_, endpoint_);
  } catch (const zmq::error_t& e) {
    std::cerr << "[MarketDataThread] WARNING: cannot connect to " << endpoint_
              << ": " << e.what() << ". Market data feed disabled.\n";
    gateway_.reset();
    return false;
  }

  thread_ = std::thread([this] {
    std::cout << "[MarketDataThread] feed " << endpoint_ << " ("
              << (time_provider_ ? "simulation" : "live")
              << " clock)\n";
    gateway_->run();
  });
  return true;
}

// -----------------------------------------------------------------------------
// stop(): signal the gateway, join, report tick counts
// -----------------------------------------------------------------------------
void MarketDataThread::stop() {
  if (!gateway_) {
    return;
  }

  gateway_->stop();
  if (thread_.joinable()) {
    thread_.join();
  }

  std::cout << "[MarketDataThread] feed closed: " << gateway_->forwardedCount()
            << " tick(s) forwarded, " << gateway_->rejectedCount()
            << " rejected.\n";
  gateway_.reset();
}

}  // namespace arb
