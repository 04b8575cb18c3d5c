#include "arb/engine/arbitrage_engine.hpp"
#include "arb/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <iostream>
#include <utility>

namespace arb {

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
ArbitrageEngine::ArbitrageEngine(EngineConfig config)
    : config_(std::move(config)),
      clock_(config_.clock == ClockMode::Live
                 ? static_cast<const ITimeProvider&>(live_clock_)
                 : static_cast<const ITimeProvider&>(sim_clock_)),
      cache_(config_.matching.max_depth_levels),
      matcher_(cache_, config_.matching) {
  for (const auto& spec : config_.instruments) {
    cache_.registerInstrument(spec);
  }
}

// -----------------------------------------------------------------------------
// Destructor: RAII stop
// -----------------------------------------------------------------------------
ArbitrageEngine::~ArbitrageEngine() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void ArbitrageEngine::start() {
  if (running_) {
    return;
  }

  // ---  1) Execution components ----------------------------------------------
  registry_ = std::make_unique<TargetRegistry>();
  gateway_ = std::make_unique<RoutedOrderGateway>(
      [this](Event event) { order_routing_thread_->push(std::move(event)); },
      clock_);
  journal_ = std::make_unique<ExecutionJournal>(execution_loop_.eventBus(),
                                                clock_, config_.notify_mode);
  manager_ = std::make_unique<ExecutionManager>(
      *registry_, matcher_, cache_, *gateway_, clock_, *journal_,
      config_.execution);

  // ---  2) OrderRoutingThread -------------------------------------------------
  order_routing_thread_ = std::make_unique<OrderRoutingThread>(
      cache_, clock_, config_.paper_broker);
  order_routing_thread_->start();

  // Bridge 2: LegOrderEvent from order_routing → execution_loop
  order_routing_thread_->eventBus().subscribe<LegOrderEvent>(
      [this](const LegOrderEvent& e) { execution_loop_.push(e); });

  // ---  3) Execution loop -----------------------------------------------------
  wireExecutionBus();
  execution_loop_.start();

  // ---  4) IpcServer (telemetry + commands) -----------------------------------
  const auto& network = config_.network;
  if (!network.ipc_cmd_endpoint.empty() && !network.ipc_pub_endpoint.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        network.ipc_cmd_endpoint, network.ipc_pub_endpoint);
    if (!ipc_server_->start()) {
      ipc_server_.reset();
    }
  }

  // ---  5) Heartbeat timer ----------------------------------------------------
  if (config_.heartbeat_ms > 0) {
    startHeartbeat();
  }

  // ---  6) MarketDataThread LAST (ticks begin flowing) ------------------------
  if (!network.market_data_endpoint.empty()) {
    SimulationTimeProvider* sim_clock =
        config_.clock == ClockMode::Simulation ? &sim_clock_ : nullptr;
    market_data_thread_ = std::make_unique<MarketDataThread>(
        sim_clock, [this](Event event) { pushEvent(std::move(event)); },
        network.market_data_endpoint);
    if (!market_data_thread_->start()) {
      market_data_thread_.reset();
    }
  }

  running_ = true;

  std::cout << "[ArbitrageEngine] started (clock=" << toString(config_.clock)
            << ", notify=" << toString(config_.notify_mode)
            << "). Threads: execution, order_routing"
            << (market_data_thread_ ? ", market_data" : "")
            << (ipc_server_ ? ", ipc" : "")
            << (heartbeat_thread_.joinable() ? ", heartbeat" : "") << ".\n";

  // ---  7) Initial targets ----------------------------------------------------
  for (const auto& request : config_.targets) {
    submitTarget(request);
  }
}

// -----------------------------------------------------------------------------
// wireExecutionBus(): subscribers that run on the execution loop
// -----------------------------------------------------------------------------
void ArbitrageEngine::wireExecutionBus() {
  EventBus& bus = execution_loop_.eventBus();

  // Bridge 3 target: ticks update the cache, then drive the targets that
  // trade the symbol.
  execution_subscriptions_.push_back(bus.subscribe<MarketDataEvent>(
      [this](const MarketDataEvent& e) {
        cache_.update(e);
        manager_->onTick(e.symbol);
      }));

  execution_subscriptions_.push_back(bus.subscribe<TargetRequestEvent>(
      [this](const TargetRequestEvent& e) {
        if (auto id = manager_->registerTarget(e.request)) {
          manager_->execute(*id);
        }
      }));

  // Bridge 2 target + Bridge 5: broker reports.
  execution_subscriptions_.push_back(bus.subscribe<LegOrderEvent>(
      [this](const LegOrderEvent& e) {
        manager_->onOrderEvent(e);
        if (ipc_server_) {
          ipc_server_->pushTelemetry(e);
        }
      }));

  // Bridge 5: journal output.
  execution_subscriptions_.push_back(bus.subscribe<TargetUpdateEvent>(
      [this](const TargetUpdateEvent& e) {
        if (ipc_server_) {
          ipc_server_->pushTelemetry(e);
        }
      }));

  // Bridge 4: heartbeats check timeouts, flush a batch journal and let the
  // broker work its open remainders.
  execution_subscriptions_.push_back(bus.subscribe<HeartbeatEvent>(
      [this](const HeartbeatEvent& e) {
        manager_->onHeartbeat();
        journal_->flush();
        order_routing_thread_->push(e);
      }));
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void ArbitrageEngine::stop() {
  if (!running_) {
    return;
  }

  // ---  1) Stop market data inflow FIRST -------------------------------------
  market_data_thread_.reset();

  // ---  2) Heartbeat timer ----------------------------------------------------
  stopHeartbeat();

  // ---  3) IPC server (executeCommand() reads the components) ----------------
  ipc_server_.reset();

  // ---  4) Execution loop: join, then drop the bridge subscribers ------------
  execution_loop_.stop();
  for (const auto id : execution_subscriptions_) {
    execution_loop_.eventBus().unsubscribe(id);
  }
  execution_subscriptions_.clear();

  // ---  5) OrderRoutingThread (destroys the broker, joins) -------------------
  order_routing_thread_.reset();

  // ---  6) Execution components ----------------------------------------------
  if (registry_->size() > 0) {
    std::cerr << "[ArbitrageEngine] WARNING: stopping with "
              << registry_->size() << " active target(s).\n";
  }
  manager_.reset();
  journal_.reset();
  gateway_.reset();
  registry_.reset();

  running_ = false;

  std::cout << "[ArbitrageEngine] stopped. All threads joined.\n";
}

// -----------------------------------------------------------------------------
// Event injection
// -----------------------------------------------------------------------------
void ArbitrageEngine::submitTarget(TargetRequest request) {
  TargetRequestEvent event;
  event.request = std::move(request);
  event.timestamp = ms_to_timestamp(clock_.now_ms());
  execution_loop_.push(std::move(event));
}

void ArbitrageEngine::pushMarketData(MarketDataEvent event) {
  execution_loop_.push(std::move(event));
}

void ArbitrageEngine::pushEvent(Event event) {
  execution_loop_.push(std::move(event));
}

// -----------------------------------------------------------------------------
// executeCommand(): handle IPC command requests
// -----------------------------------------------------------------------------
std::string ArbitrageEngine::executeCommand(const std::string& cmd) {
  if (cmd == "STATUS") {
    return IpcServer::formatStatus(activeTargets(),
                                   manager_ ? manager_->isHalted() : false);
  }

  nlohmann::json response;

  if (cmd == "PING") {
    response["status"] = "ok";
    response["response"] = "PONG";
  } else if (cmd == "HALT") {
    if (manager_) {
      manager_->halt();
    }
    std::cerr << "[ArbitrageEngine] WARNING: HALT received. New targets are "
                 "rejected.\n";
    response["status"] = "ok";
    response["response"] = "New targets halted";
  } else {
    response["status"] = "error";
    response["response"] = "Unknown command: " + cmd;
  }

  return response.dump();
}

// -----------------------------------------------------------------------------
// Read accessors
// -----------------------------------------------------------------------------
std::vector<TargetSnapshot> ArbitrageEngine::activeTargets() const {
  return registry_ ? registry_->snapshots() : std::vector<TargetSnapshot>{};
}

std::vector<TargetSnapshot> ArbitrageEngine::retiredTargets() const {
  return journal_ ? journal_->retired() : std::vector<TargetSnapshot>{};
}

EventBus& ArbitrageEngine::executionEventBus() {
  return execution_loop_.eventBus();
}

EventBus& ArbitrageEngine::orderRoutingEventBus() {
  return order_routing_thread_->eventBus();
}

// -----------------------------------------------------------------------------
// Heartbeat timer
// -----------------------------------------------------------------------------
void ArbitrageEngine::startHeartbeat() {
  {
    std::lock_guard lock(heartbeat_mutex_);
    heartbeat_stop_ = false;
  }

  heartbeat_thread_ = std::thread([this] {
    const auto period = std::chrono::milliseconds(config_.heartbeat_ms);
    std::unique_lock lock(heartbeat_mutex_);
    while (!heartbeat_cv_.wait_for(lock, period,
                                   [this] { return heartbeat_stop_; })) {
      HeartbeatEvent beat{"engine", "ok", ms_to_timestamp(clock_.now_ms()), 0};
      execution_loop_.push(std::move(beat));
    }
  });
}

void ArbitrageEngine::stopHeartbeat() {
  {
    std::lock_guard lock(heartbeat_mutex_);
    heartbeat_stop_ = true;
  }
  heartbeat_cv_.notify_all();

  if (heartbeat_thread_.joinable()) {
    heartbeat_thread_.join();
  }
}

}  // namespace arb
