#pragma once

#include "arb/broker/routed_order_gateway.hpp"
#include "arb/concurrent/event_loop_thread.hpp"
#include "arb/config/engine_config.hpp"
#include "arb/execution/execution_journal.hpp"
#include "arb/execution/execution_manager.hpp"
#include "arb/execution/target_registry.hpp"
#include "arb/market/market_data_cache.hpp"
#include "arb/matching/spread_matcher.hpp"
#include "arb/network/ipc_server.hpp"
#include "arb/network/market_data_thread.hpp"
#include "arb/network/order_routing_thread.hpp"
#include "arb/time/live_time_provider.hpp"
#include "arb/time/simulation_time_provider.hpp"

#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace arb {

// -----------------------------------------------------------------------------
// ArbitrageEngine
// -----------------------------------------------------------------------------
//
// @brief  Central orchestrator that owns all threads, event loops, network
//         I/O threads and execution components.
//
// @details
// Provides a start/stop lifecycle so main() and tests can run the engine
// without wiring internals by hand.
//
// Thread layout:
//
//   execution_loop thread    → MarketDataCache updates, ExecutionManager,
//                              ExecutionJournal (single writer of every
//                              target)
//   order_routing thread     → PaperBroker
//   market_data thread       → MarketDataGateway ZMQ recv loop (optional)
//   ipc thread               → IpcServer commands + telemetry (optional)
//   heartbeat thread         → HeartbeatEvent timer (optional)
//
//   main thread              → engine.start(), wait for shutdown, engine.stop()
//
// Cross-thread bridges (wired in start()):
//   1. execution_loop → order_routing:   OrderRequestEvent, CancelRequestEvent
//                                        (RoutedOrderGateway sink)
//   2. order_routing  → execution_loop:  LegOrderEvent
//   3. market_data    → execution_loop:  MarketDataEvent (via pushEvent)
//   4. execution_loop → order_routing:   HeartbeatEvent (open remainders)
//   5. execution_loop → ipc:             TargetUpdateEvent, LegOrderEvent
//
// Thread model:
//   Constructed, started, stopped and destroyed on the caller's thread.
//   pushEvent()/pushMarketData()/submitTarget() and the read accessors are
//   safe from any thread between start() and stop().
//
// Ownership:
//   ArbitrageEngine
//    ├── config_                 (EngineConfig, value)
//    ├── sim_clock_ / live_clock_ (value; clock_ refers to one of them)
//    ├── cache_                  (MarketDataCache, value)
//    ├── matcher_                (SpreadMatcher, value, reads cache_)
//    ├── execution_loop_         (EventLoopThread, value)
//    ├── registry_, gateway_, journal_, manager_   (unique_ptr, per run)
//    ├── order_routing_thread_   (unique_ptr<OrderRoutingThread>)
//    ├── market_data_thread_     (unique_ptr<MarketDataThread>)
//    ├── ipc_server_             (unique_ptr<IpcServer>)
//    └── heartbeat_thread_       (std::thread)
//
// Execution components are recreated by every start() so a restarted engine
// begins with an empty registry and a cleared halt flag.
// -----------------------------------------------------------------------------
class ArbitrageEngine {
 public:
  // No threads are spawned and no sockets are opened here. Instruments from
  // the config are registered with the market data cache.
  explicit ArbitrageEngine(EngineConfig config);

  // Destructor calls stop() for RAII safety.
  ~ArbitrageEngine();

  ArbitrageEngine(const ArbitrageEngine&) = delete;
  ArbitrageEngine& operator=(const ArbitrageEngine&) = delete;
  ArbitrageEngine(ArbitrageEngine&&) = delete;
  ArbitrageEngine& operator=(ArbitrageEngine&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  //
  // @brief  Brings the engine to a running state.
  //
  // @details
  // Startup sequence:
  //   1. Create the execution components (registry, gateway, journal,
  //      manager).
  //   2. Start OrderRoutingThread; wire the LegOrderEvent bridge back.
  //   3. Wire the execution bus subscribers; start the execution loop.
  //   4. Start IpcServer (if both endpoints are set).
  //   5. Start the heartbeat timer (if heartbeat_ms > 0).
  //   6. Start MarketDataThread LAST (if an endpoint is set).
  //   7. Submit the config's initial targets.
  //
  // Idempotent: calling start() on a running engine does nothing.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  //
  // @brief  Shuts down every thread and destroys the execution components.
  //
  // @details
  // Shutdown sequence:
  //   1. Stop MarketDataThread (no new ticks).
  //   2. Stop the heartbeat timer.
  //   3. Stop IpcServer (executeCommand() reads the components).
  //   4. Stop the execution loop and drop its bridge subscriptions.
  //   5. Stop OrderRoutingThread (destroys the broker).
  //   6. Destroy the execution components.
  //
  // Targets still active at this point are abandoned with a WARNING; their
  // broker orders died with the paper broker. Idempotent.
  // -------------------------------------------------------------------------
  void stop();

  // Enqueues a TargetRequestEvent; registration and the first execute()
  // happen on the execution loop. Rejections are logged there.
  void submitTarget(TargetRequest request);

  // Enqueues a tick into the execution loop. The simulation clock is not
  // touched; tests advance it through simulationClock().
  void pushMarketData(MarketDataEvent event);

  // Enqueues any Event into the execution loop. This is the sink bound to
  // MarketDataThread.
  void pushEvent(Event event);

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  //
  // @brief  Processes a command string from the IPC server and returns a
  //         JSON response.
  //
  // @details
  // Supported commands:
  //   "PING"   → {"status":"ok","response":"PONG"}
  //   "STATUS" → {"status":"ok","halted":bool,"targets":[...]}
  //   "HALT"   → {"status":"ok","response":"New targets halted"}
  //   other    → {"status":"error","response":"Unknown command: ..."}
  //
  // HALT stops new registrations only; active targets run to completion.
  //
  // Thread-safety: Safe to call from any thread while running. Reads the
  // registry's published snapshots and the manager's atomic halt flag.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  // Snapshots of the active targets. Empty when stopped.
  std::vector<TargetSnapshot> activeTargets() const;

  // Final snapshots of retired targets, in retirement order. Empty when
  // stopped.
  std::vector<TargetSnapshot> retiredTargets() const;

  bool isRunning() const { return running_; }

  EventBus& executionEventBus();
  EventBus& orderRoutingEventBus();

  SimulationTimeProvider& simulationClock() { return sim_clock_; }
  const ITimeProvider& clock() const { return clock_; }
  MarketDataCache& marketData() { return cache_; }
  const EngineConfig& config() const { return config_; }

 private:
  // Subscribers on the execution bus; subscription ids kept for stop().
  void wireExecutionBus();

  void startHeartbeat();
  void stopHeartbeat();

  EngineConfig config_;

  // --- Clocks (value members; clock_ selects one by config) ------------------
  SimulationTimeProvider sim_clock_;
  LiveTimeProvider live_clock_;
  const ITimeProvider& clock_;

  // --- Market view (value members, live across restarts) --------------------
  MarketDataCache cache_;
  SpreadMatcher matcher_;

  // --- Execution loop ---------------------------------------------------------
  EventLoopThread execution_loop_{"execution"};
  std::vector<EventBus::SubscriptionId> execution_subscriptions_;

  // --- Network I/O threads ----------------------------------------------------
  std::unique_ptr<OrderRoutingThread> order_routing_thread_;
  std::unique_ptr<MarketDataThread> market_data_thread_;
  std::unique_ptr<IpcServer> ipc_server_;

  // --- Execution components (created by start(), destroyed by stop()) -------
  std::unique_ptr<TargetRegistry> registry_;
  std::unique_ptr<RoutedOrderGateway> gateway_;
  std::unique_ptr<ExecutionJournal> journal_;
  std::unique_ptr<ExecutionManager> manager_;

  // --- Heartbeat timer --------------------------------------------------------
  std::thread heartbeat_thread_;
  std::mutex heartbeat_mutex_;
  std::condition_variable heartbeat_cv_;
  bool heartbeat_stop_{false};

  bool running_{false};
};

}  // namespace arb
