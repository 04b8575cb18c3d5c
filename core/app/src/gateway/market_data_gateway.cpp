#include "arb/gateway/market_data_gateway.hpp"
#include "arb/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <string>
#include <utility>

namespace arb {

namespace {

// [[price, size], ...] → Depth. Entries that are not two numbers are skipped.
domain::Depth decodeLevels(const nlohmann::json& levels) {
  domain::Depth out;
  if (!levels.is_array()) {
    return out;
  }
  for (const auto& level : levels) {
    if (!level.is_array() || level.size() < 2 || !level[0].is_number() ||
        !level[1].is_number()) {
      continue;
    }
    out.push_back(domain::BookLevel{level[0].get<double>(),
                                    level[1].get<double>()});
  }
  return out;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: create ZMQ SUB socket with receive timeout
// -----------------------------------------------------------------------------
MarketDataGateway::MarketDataGateway(SimulationTimeProvider* time_provider,
                                     EventSink event_sink,
                                     const std::string& endpoint)
    : time_provider_(time_provider), event_sink_(std::move(event_sink)) {
  socket_.set(zmq::sockopt::subscribe, "");

  // Without a receive timeout recv() blocks forever and stop() is never
  // observed.
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);

  socket_.connect(endpoint);
}

// -----------------------------------------------------------------------------
// run(): blocking recv loop
// -----------------------------------------------------------------------------
void MarketDataGateway::run() {
  running_.store(true);

  while (running_.load()) {
    zmq::message_t msg;

    zmq::recv_result_t result;
    try {
      result = socket_.recv(msg, zmq::recv_flags::none);
    } catch (const zmq::error_t& e) {
      std::cerr << "[MarketDataGateway] recv failed: " << e.what() << "\n";
      break;
    }

    if (!result.has_value()) {
      continue;
    }

    std::optional<MarketDataEvent> md = decode(msg.to_string());
    if (!md) {
      rejected_.fetch_add(1);
      continue;
    }

    if (time_provider_ != nullptr) {
      time_provider_->advance_time(timestamp_to_ms(md->timestamp));
    }

    md->sequence_id = ++sequence_;
    event_sink_(std::move(*md));
    forwarded_.fetch_add(1);
  }
}

void MarketDataGateway::stop() {
  running_.store(false);
}

// -----------------------------------------------------------------------------
// decode(): JSON payload → MarketDataEvent
// -----------------------------------------------------------------------------
std::optional<MarketDataEvent> MarketDataGateway::decode(
    const std::string& payload) {
  try {
    const auto json = nlohmann::json::parse(payload);

    MarketDataEvent md;
    md.timestamp = ms_to_timestamp(json.at("timestamp_ms").get<std::int64_t>());
    md.symbol = json.at("symbol").get<std::string>();
    md.bid = json.value("bid", 0.0);
    md.ask = json.value("ask", 0.0);
    md.last = json.value("last", 0.0);

    if (json.contains("bids")) {
      md.bids = decodeLevels(json.at("bids"));
    }
    if (json.contains("asks")) {
      md.asks = decodeLevels(json.at("asks"));
    }
    if (json.contains("market_open")) {
      md.market_open = json.at("market_open").get<bool>();
    }

    if (md.symbol.empty()) {
      std::cerr << "[MarketDataGateway] tick without symbol skipped: "
                << payload << "\n";
      return std::nullopt;
    }
    return md;

  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[MarketDataGateway] JSON parse error: " << e.what()
              << " | payload: " << payload << "\n";
    return std::nullopt;
  }
}

}  // namespace arb
