#include "arb/network/ipc_server.hpp"
#include "arb/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <iostream>
#include <utility>

namespace arb {

namespace {

nlohmann::json snapshotToJson(const TargetSnapshot& s) {
  nlohmann::json j;
  j["target_id"] = s.id;
  j["opportunity"] = s.opportunity_key;
  j["direction"] = toString(s.direction);
  j["status"] = toString(s.status);

  nlohmann::json leg1;
  leg1["symbol"] = s.symbol1;
  leg1["target"] = s.target_quantity1;
  leg1["filled"] = s.filled_quantity1;

  nlohmann::json leg2;
  leg2["symbol"] = s.symbol2;
  leg2["target"] = s.target_quantity2;
  leg2["filled"] = s.filled_quantity2;

  j["legs"] = nlohmann::json::array();
  j["legs"].push_back(std::move(leg1));
  j["legs"].push_back(std::move(leg2));
  j["expected_spread_pct"] = s.expected_spread_pct;
  j["fee"] = s.total_fee;
  j["groups"] = s.group_count;
  j["created_ms"] = s.created_ms;
  if (s.anchor_ms) {
    j["anchor_ms"] = *s.anchor_ms;
  } else {
    j["anchor_ms"] = nullptr;
  }
  return j;
}

}  // namespace

IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): create sockets and spawn worker thread
// -----------------------------------------------------------------------------
bool IpcServer::start() {
  if (running_.load()) {
    return true;
  }

  try {
    context_ = std::make_unique<zmq::context_t>(1);
    cmd_socket_ =
        std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
    pub_socket_ =
        std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

    cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
    cmd_socket_->bind(cmd_endpoint_);
    pub_socket_->bind(pub_endpoint_);
  } catch (const zmq::error_t& e) {
    std::cerr << "[IpcServer] WARNING: could not bind (CMD=" << cmd_endpoint_
              << " PUB=" << pub_endpoint_ << "): " << e.what()
              << ". IPC disabled.\n";
    cmd_socket_.reset();
    pub_socket_.reset();
    context_.reset();
    return false;
  }

  running_.store(true);

  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] started. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
  return true;
}

// -----------------------------------------------------------------------------
// stop(): signal and join
// -----------------------------------------------------------------------------
void IpcServer::stop() {
  if (!running_.load()) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  running_.store(false);

  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped.\n";
}

void IpcServer::pushTelemetry(Event event) {
  telemetry_queue_.push(std::move(event));
}

// -----------------------------------------------------------------------------
// run(): combined poll/drain loop
// -----------------------------------------------------------------------------
void IpcServer::run() {
  while (running_.load()) {
    try {
      processTelemetry();
      processCommands();
    } catch (const zmq::error_t& e) {
      std::cerr << "[IpcServer] CRITICAL: socket error: " << e.what()
                << ". Stopping IPC worker.\n";
      running_.store(false);
      return;
    }
  }

  // Publish whatever telemetry is left before shutdown.
  try {
    processTelemetry();
  } catch (const zmq::error_t& e) {
    std::cerr << "[IpcServer] WARNING: final telemetry drain failed: "
              << e.what() << "\n";
  }
}

void IpcServer::processTelemetry() {
  while (auto maybe_event = telemetry_queue_.try_pop()) {
    auto json_str = formatTelemetry(*maybe_event);
    if (json_str.has_value()) {
      zmq::message_t msg(json_str->data(), json_str->size());
      pub_socket_->send(msg, zmq::send_flags::dontwait);
    }
  }
}

void IpcServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }

  if (!result.has_value()) {
    return;
  }

  std::string cmd(static_cast<const char*>(request.data()), request.size());
  std::string response = command_handler_(cmd);

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

// -----------------------------------------------------------------------------
// Formatters
// -----------------------------------------------------------------------------
std::optional<std::string> IpcServer::formatTelemetry(const Event& event) {
  if (auto* e = std::get_if<TargetUpdateEvent>(&event)) {
    return formatTargetUpdate(*e);
  }
  if (auto* e = std::get_if<LegOrderEvent>(&event)) {
    return formatLegOrder(*e);
  }
  return std::nullopt;
}

std::string IpcServer::formatTargetUpdate(const TargetUpdateEvent& e) {
  nlohmann::json j = snapshotToJson(e.snapshot);
  j["type"] = e.retired ? "target_retired" : "target_update";
  j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
  return j.dump();
}

std::string IpcServer::formatLegOrder(const LegOrderEvent& e) {
  nlohmann::json j;
  j["type"] = "leg_order";
  j["order_id"] = e.order_id;
  j["symbol"] = e.symbol;
  j["status"] = toString(e.status);
  j["order_quantity"] = e.order_quantity;
  j["fill_quantity"] = e.fill_quantity;
  j["fill_price"] = e.fill_price;
  j["fee"] = e.fee;
  j["tag"] = e.tag;
  j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
  return j.dump();
}

std::string IpcServer::formatStatus(const std::vector<TargetSnapshot>& targets,
                                    bool halted) {
  nlohmann::json j;
  j["status"] = "ok";
  j["halted"] = halted;
  j["targets"] = nlohmann::json::array();
  for (const auto& target : targets) {
    j["targets"].push_back(snapshotToJson(target));
  }
  return j.dump();
}

}  // namespace arb
