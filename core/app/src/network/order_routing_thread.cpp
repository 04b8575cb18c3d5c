#include "arb/network/order_routing_thread.hpp"

#include <cstddef>
#include <iostream>
#include <utility>

namespace arb {

OrderRoutingThread::OrderRoutingThread(const IMarketDataSource& source,
                                       const ITimeProvider& clock,
                                       PaperBrokerConfig broker_config)
    : source_(source), clock_(clock), broker_config_(broker_config) {}

OrderRoutingThread::~OrderRoutingThread() { stop(); }

// -----------------------------------------------------------------------------
// start(): broker subscribes first, then the loop starts dispatching
// -----------------------------------------------------------------------------
void OrderRoutingThread::start() {
  if (running_) {
    return;
  }

  broker_ = std::make_unique<PaperBroker>(loop_.eventBus(), source_, clock_,
                                          broker_config_);
  loop_.start();

  running_ = true;

  std::cout << "[OrderRoutingThread] started (PaperBroker, fee_per_share="
            << broker_config_.fee_per_share
            << ", max_fill_ratio=" << broker_config_.max_fill_ratio << ").\n";
}

// -----------------------------------------------------------------------------
// stop(): join the loop, then destroy the broker with whatever it still holds
// -----------------------------------------------------------------------------
void OrderRoutingThread::stop() {
  if (!running_) {
    return;
  }

  loop_.stop();

  if (const std::size_t open = broker_->openOrderCount(); open > 0) {
    std::cerr << "[OrderRoutingThread] WARNING: discarding " << open
              << " open paper order remainder(s).\n";
  }
  broker_.reset();
  running_ = false;

  std::cout << "[OrderRoutingThread] stopped.\n";
}

void OrderRoutingThread::push(Event event) {
  loop_.push(std::move(event));
}

EventBus& OrderRoutingThread::eventBus() {
  return loop_.eventBus();
}

}  // namespace arb
