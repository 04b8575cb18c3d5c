#pragma once

#include "arb/concurrent/thread_safe_queue.hpp"
#include "arb/events/event.hpp"
#include "arb/events/order_events.hpp"
#include "arb/events/target_events.hpp"
#include "arb/execution/target_types.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace arb {

// -----------------------------------------------------------------------------
// IpcServer: dual-socket ZeroMQ gateway for telemetry and commands
// -----------------------------------------------------------------------------
//
// @brief  Broadcasts target and order telemetry as JSON on a PUB socket and
//         answers text commands on a REP socket, from one worker thread.
//
// @details
//   1. PUB socket: TargetUpdateEvent and LegOrderEvent, queued by bridge
//      subscribers on the execution loop through pushTelemetry(). The queue
//      keeps JSON encoding and socket I/O off the execution loop.
//   2. REP socket: each request string goes to command_handler_ (bound to
//      ArbitrageEngine::executeCommand()) and its JSON reply is sent back.
//      ZMQ_RCVTIMEO lets the worker alternate between commands and
//      telemetry.
//
// The formatters are public so the engine (STATUS reply) and tests can
// produce the same JSON without sockets.
//
// Thread model:
//   start()/stop() on the owning thread. pushTelemetry() from any thread.
//   command_handler_ runs on the IPC worker thread.
//
// Ownership:
//   Owned by ArbitrageEngine via std::unique_ptr. Owns the ZMQ context, both
//   sockets, the telemetry queue and the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // No sockets are opened until start().
  IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
            std::string pub_endpoint);

  // RAII: calls stop().
  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // @brief  Binds both sockets and spawns the worker. Idempotent.
  //
  // @details
  // A bind failure (endpoint in use, malformed address) is logged and leaves
  // the server stopped; the engine keeps running without IPC.
  //
  // @return true if the server is running afterwards.
  // -------------------------------------------------------------------------
  bool start();

  // Signals the worker, joins it and closes the sockets. Idempotent.
  void stop();

  void pushTelemetry(Event event);

  bool isRunning() const { return running_.load(); }

  // JSON for a telemetry event; std::nullopt for event types that are not
  // telemetry.
  static std::optional<std::string> formatTelemetry(const Event& event);

  static std::string formatTargetUpdate(const TargetUpdateEvent& e);
  static std::string formatLegOrder(const LegOrderEvent& e);

  // {"status":"ok", "halted":..., "targets":[...]}: the STATUS reply.
  static std::string formatStatus(const std::vector<TargetSnapshot>& targets,
                                  bool halted);

 private:
  static constexpr int kPollTimeoutMs = 50;

  // Worker: drain telemetry, poll one command, repeat.
  void run();
  void processTelemetry();
  void processCommands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace arb
