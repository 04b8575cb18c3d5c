#pragma once

#include "arb/broker/paper_broker.hpp"
#include "arb/domain/instrument.hpp"
#include "arb/execution/execution_journal.hpp"
#include "arb/execution/execution_manager.hpp"
#include "arb/execution/target_types.hpp"
#include "arb/matching/match_types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace arb {

// Which ITimeProvider the engine runs on. Simulation time is driven by the
// timestamps of incoming market data ticks.
enum class ClockMode {
  Simulation,
  Live,
};

const char* toString(ClockMode mode);

// "simulation" / "live".
std::optional<ClockMode> parseClockMode(std::string_view text);

// -----------------------------------------------------------------------------
// NetworkConfig
// -----------------------------------------------------------------------------
// ZeroMQ endpoints. An empty market data endpoint skips the MarketDataThread;
// an empty command or publish endpoint skips the IpcServer. Tests run with
// all three empty and push events by hand.
// -----------------------------------------------------------------------------
struct NetworkConfig {
  std::string market_data_endpoint;
  std::string ipc_cmd_endpoint;
  std::string ipc_pub_endpoint;
};

// -----------------------------------------------------------------------------
// EngineConfig
// -----------------------------------------------------------------------------
//
// @brief  Everything ArbitrageEngine needs at construction time.
//
// @details
// Loaded from JSON:
//
//   {
//     "clock": "simulation",
//     "instruments": [{"symbol": "AAPLx", "lot_size": 0.001,
//                      "market_open": true}, ...],
//     "matching":    {"max_depth_levels": 10, "strategy": "auto",
//                     "fee_per_share": 0.0, "debug": false},
//     "execution":   {"timeout_ms": 60000, "heartbeat_ms": 1000,
//                     "notify_mode": "realtime", "debug": false},
//     "network":     {"market_data_endpoint": "tcp://127.0.0.1:5555",
//                     "ipc_cmd_endpoint": "tcp://127.0.0.1:5556",
//                     "ipc_pub_endpoint": "tcp://127.0.0.1:5557"},
//     "paper_broker": {"fee_per_share": 0.0, "max_fill_ratio": 1.0},
//     "targets":     [{"pair_id": "AAPL", "level_id": "1",
//                      "symbol1": "AAPLx", "symbol2": "AAPL",
//                      "quantity1": 10, "quantity2": -10,
//                      "direction": "LONG_SPREAD",
//                      "expected_spread_pct": -0.5, "timeout_ms": 0}]
//   }
//
// Every key is optional and falls back to the member default below. A value
// of the wrong JSON type, an unknown enum spelling or an out-of-range number
// throws std::runtime_error naming the offending key.
//
// heartbeat_ms is the period of the engine's HeartbeatEvent timer; 0
// disables the timer.
// -----------------------------------------------------------------------------
struct EngineConfig {
  ClockMode clock{ClockMode::Simulation};
  std::vector<domain::InstrumentSpec> instruments;
  MatcherConfig matching;
  ExecutionConfig execution;
  NotifyMode notify_mode{NotifyMode::Realtime};
  std::int64_t heartbeat_ms{1000};
  NetworkConfig network;
  PaperBrokerConfig paper_broker;
  std::vector<TargetRequest> targets;

  // Throws std::runtime_error on malformed JSON or invalid values.
  static EngineConfig fromJson(const std::string& text);

  // Reads the file and delegates to fromJson(). Throws std::runtime_error if
  // the file cannot be opened.
  static EngineConfig fromFile(const std::string& path);
};

}  // namespace arb
