#pragma once

#include "arb/events/event.hpp"
#include "arb/events/event_types.hpp"
#include "arb/time/simulation_time_provider.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace arb {

// -----------------------------------------------------------------------------
// MarketDataGateway: ZeroMQ bridge for quote and depth ticks
// -----------------------------------------------------------------------------
//
// @brief  Listens on a ZeroMQ SUB socket for JSON-encoded ticks, advances the
//         simulation clock and pushes MarketDataEvent into the execution
//         loop.
//
// @details
// A feed process (replayer or live adapter) publishes one JSON object per
// tick. On each message the gateway performs two actions IN ORDER:
//   1. advance_time(timestamp_ms) on the simulation clock, if one is
//      attached, so every component reading now_ms() while this tick is
//      processed sees the tick's time.
//   2. event_sink_(MarketDataEvent), which enqueues the tick on the
//      execution loop.
//
// Expected JSON format:
//   {
//     "timestamp_ms": 1700000000000,          // int64 epoch milliseconds
//     "symbol":       "AAPLx",                // instrument identifier
//     "bid":          101.9,                  // optional, 0 = unknown
//     "ask":          102.1,                  // optional, 0 = unknown
//     "last":         102.0,                  // optional, 0 = unknown
//     "bids":         [[101.9, 5], [101.8, 12]],   // optional depth,
//     "asks":         [[102.1, 4]],                // best first
//     "market_open":  true                    // optional session flag
//   }
//
// Malformed messages are logged and skipped (decode() returns nullopt).
//
// Thread model:
//   run() blocks the calling thread (MarketDataThread's worker). stop() may
//   be called from any thread; the recv loop notices it within
//   kRecvTimeoutMs thanks to ZMQ_RCVTIMEO.
//
// Ownership:
//   Owns the zmq::context_t and zmq::socket_t (RAII). Holds a nullable
//   pointer to the SimulationTimeProvider (nullptr with a live clock) and a
//   copy of the event sink.
// -----------------------------------------------------------------------------
class MarketDataGateway {
 public:
  using EventSink = std::function<void(Event)>;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  time_provider  Simulation clock to advance per tick, or nullptr
  //                        when the engine runs on the live clock.
  // @param  event_sink     Callback invoked for each decoded tick.
  // @param  endpoint       ZMQ endpoint to connect to.
  //
  // Side-effects:  Opens a ZMQ SUB socket and connects to the endpoint.
  // -------------------------------------------------------------------------
  MarketDataGateway(SimulationTimeProvider* time_provider,
                    EventSink event_sink, const std::string& endpoint);

  ~MarketDataGateway() = default;

  MarketDataGateway(const MarketDataGateway&) = delete;
  MarketDataGateway& operator=(const MarketDataGateway&) = delete;
  MarketDataGateway(MarketDataGateway&&) = delete;
  MarketDataGateway& operator=(MarketDataGateway&&) = delete;

  // Blocking recv loop. Call from a dedicated thread.
  void run();

  // Requests the recv loop to exit. Safe from any thread.
  void stop();

  // -------------------------------------------------------------------------
  // decode(payload)
  // -------------------------------------------------------------------------
  // @brief  Parses one JSON tick into a MarketDataEvent.
  //
  // @return std::nullopt (with a log line) when the payload is not valid
  //         JSON, lacks timestamp_ms or symbol, or has a field of the wrong
  //         type. Depth entries that are not [price, size] pairs are
  //         skipped.
  // -------------------------------------------------------------------------
  static std::optional<MarketDataEvent> decode(const std::string& payload);

  // Ticks handed to the sink / payloads dropped by decode().
  std::uint64_t forwardedCount() const { return forwarded_.load(); }
  std::uint64_t rejectedCount() const { return rejected_.load(); }

 private:
  static constexpr int kRecvTimeoutMs = 100;

  SimulationTimeProvider* time_provider_;
  EventSink event_sink_;
  std::uint64_t sequence_{0};

  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};

  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> forwarded_{0};
  std::atomic<std::uint64_t> rejected_{0};
};

}  // namespace arb
