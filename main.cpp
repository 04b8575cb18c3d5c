// -----------------------------------------------------------------------------
// arb_engine: single executable entry point.
//
//   1) Load the EngineConfig from the JSON file named on the command line
//      (defaults to config/engine.json).
//   2) Create the ArbitrageEngine and subscribe logging callbacks for the
//      target lifecycle and broker reports.
//   3) Start the engine. Market data arrives through its MarketDataThread;
//      targets come from the config or over IPC.
//   4) Sleep until SIGINT/SIGTERM, then shut down cleanly.
//
// Thread layout:
//   main thread        → waits for the shutdown signal
//   execution thread   → MarketDataCache + ExecutionManager + journal
//   order routing      → PaperBroker
//   market data        → MarketDataGateway ZMQ recv loop
//   ipc                → IpcServer
// -----------------------------------------------------------------------------

#include "arb/config/engine_config.hpp"
#include "arb/engine/arbitrage_engine.hpp"
#include "arb/events/order_events.hpp"
#include "arb/events/target_events.hpp"

#include <chrono>
#include <csignal>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

// -----------------------------------------------------------------------------
// The only global in the program. Written by the signal handler, polled by
// main().
// -----------------------------------------------------------------------------
static volatile std::sig_atomic_t g_shutdown_requested = 0;

static void shutdown_handler(int /*signum*/) { g_shutdown_requested = 1; }

int main(int argc, char* argv[]) {
  const std::string config_path = argc > 1 ? argv[1] : "config/engine.json";

  // -------------------------------------------------------------------------
  // 1) Configuration. Errors are fatal at startup.
  // -------------------------------------------------------------------------
  arb::EngineConfig config;
  try {
    config = arb::EngineConfig::fromFile(config_path);
  } catch (const std::runtime_error& e) {
    std::cerr << "[main] CRITICAL: " << e.what() << "\n";
    return 1;
  }

  std::cout << "[main] loaded " << config_path << ": "
            << config.instruments.size() << " instrument(s), "
            << config.targets.size() << " initial target(s).\n";

  // -------------------------------------------------------------------------
  // 2) Engine and logging subscribers (run on the execution thread).
  // -------------------------------------------------------------------------
  arb::ArbitrageEngine engine(std::move(config));

  engine.executionEventBus().subscribe<arb::TargetUpdateEvent>(
      [](const arb::TargetUpdateEvent& e) {
        std::cout << "[Target] id=" << e.snapshot.id
                  << " opportunity=" << e.snapshot.opportunity_key
                  << " status=" << arb::domain::toString(e.snapshot.status)
                  << " filled=" << e.snapshot.filled_quantity1 << "/"
                  << e.snapshot.target_quantity1 << ", "
                  << e.snapshot.filled_quantity2 << "/"
                  << e.snapshot.target_quantity2
                  << (e.retired ? " (retired)" : "") << "\n";
      });

  engine.executionEventBus().subscribe<arb::LegOrderEvent>(
      [](const arb::LegOrderEvent& e) {
        std::cout << "[LegOrder] order_id=" << e.order_id
                  << " symbol=" << e.symbol
                  << " status=" << arb::domain::toString(e.status)
                  << " fill=" << e.fill_quantity << "@" << e.fill_price
                  << " tag=" << e.tag << "\n";
      });

  // -------------------------------------------------------------------------
  // 3) Start.
  // -------------------------------------------------------------------------
  std::signal(SIGINT, shutdown_handler);
  std::signal(SIGTERM, shutdown_handler);

  engine.start();

  std::cout << "[main] Press Ctrl-C to shut down.\n";

  // -------------------------------------------------------------------------
  // 4) Wait for the signal, then stop (joins every thread).
  // -------------------------------------------------------------------------
  while (g_shutdown_requested == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "\n[main] shutdown requested. Stopping engine...\n";
  engine.stop();

  return 0;
}
