#include "arb/config/engine_config.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace arb {

namespace {

using nlohmann::json;

[[noreturn]] void fail(const std::string& path, const std::string& what) {
  throw std::runtime_error("[EngineConfig] " + path + ": " + what);
}

// Optional section: absent → empty object; present but not an object →
// error.
json section(const json& root, const char* key) {
  if (!root.contains(key)) {
    return json::object();
  }
  const json& value = root.at(key);
  if (!value.is_object()) {
    fail(key, "expected an object");
  }
  return value;
}

// obj[key] converted to T, or fallback when the key is absent. A type
// mismatch is reported with its dotted path.
template <typename T>
T read(const json& obj, const char* key, T fallback, const std::string& path) {
  if (!obj.contains(key) || obj.at(key).is_null()) {
    return fallback;
  }
  try {
    return obj.at(key).get<T>();
  } catch (const json::exception& e) {
    fail(path + "." + key, e.what());
  }
}

template <typename T>
T require(const json& obj, const char* key, const std::string& path) {
  if (!obj.contains(key)) {
    fail(path + "." + key, "missing required key");
  }
  return read<T>(obj, key, T{}, path);
}

domain::InstrumentSpec parseInstrument(const json& item,
                                       const std::string& path) {
  if (!item.is_object()) {
    fail(path, "expected an object");
  }
  domain::InstrumentSpec spec;
  spec.symbol = require<std::string>(item, "symbol", path);
  spec.lot_size = read<double>(item, "lot_size", spec.lot_size, path);
  spec.market_open = read<bool>(item, "market_open", spec.market_open, path);

  if (spec.symbol.empty()) {
    fail(path + ".symbol", "must not be empty");
  }
  if (!(spec.lot_size > 0.0)) {
    fail(path + ".lot_size", "must be positive");
  }
  return spec;
}

TargetRequest parseTarget(const json& item, const std::string& path) {
  if (!item.is_object()) {
    fail(path, "expected an object");
  }
  TargetRequest request;
  request.pair_id = require<std::string>(item, "pair_id", path);
  request.level_id = read<std::string>(item, "level_id", "0", path);
  request.symbol1 = require<std::string>(item, "symbol1", path);
  request.symbol2 = require<std::string>(item, "symbol2", path);
  request.quantity1 = require<double>(item, "quantity1", path);
  request.quantity2 = require<double>(item, "quantity2", path);
  request.expected_spread_pct =
      read<double>(item, "expected_spread_pct", 0.0, path);
  request.timeout_ms = read<std::int64_t>(item, "timeout_ms", 0, path);

  const auto direction_text = require<std::string>(item, "direction", path);
  const auto direction = domain::parseSpreadDirection(direction_text);
  if (!direction) {
    fail(path + ".direction", "unknown direction '" + direction_text + "'");
  }
  request.direction = *direction;
  return request;
}

}  // namespace

const char* toString(ClockMode mode) {
  switch (mode) {
    case ClockMode::Simulation: return "simulation";
    case ClockMode::Live:       return "live";
  }
  return "unknown";
}

std::optional<ClockMode> parseClockMode(std::string_view text) {
  if (text == "simulation") return ClockMode::Simulation;
  if (text == "live")       return ClockMode::Live;
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// fromJson()
// -----------------------------------------------------------------------------
EngineConfig EngineConfig::fromJson(const std::string& text) {
  json root;
  try {
    root = json::parse(text);
  } catch (const json::parse_error& e) {
    fail("<root>", e.what());
  }
  if (!root.is_object()) {
    fail("<root>", "expected an object");
  }

  EngineConfig config;

  // --- clock ------------------------------------------------------------------
  const auto clock_text =
      read<std::string>(root, "clock", toString(config.clock), "<root>");
  const auto clock = parseClockMode(clock_text);
  if (!clock) {
    fail("clock", "unknown clock mode '" + clock_text + "'");
  }
  config.clock = *clock;

  // --- instruments ------------------------------------------------------------
  if (root.contains("instruments")) {
    const json& instruments = root.at("instruments");
    if (!instruments.is_array()) {
      fail("instruments", "expected an array");
    }
    for (std::size_t i = 0; i < instruments.size(); ++i) {
      config.instruments.push_back(parseInstrument(
          instruments[i], "instruments[" + std::to_string(i) + "]"));
    }
  }

  // --- matching ---------------------------------------------------------------
  {
    const json matching = section(root, "matching");
    auto& m = config.matching;
    const auto depth = read<std::int64_t>(
        matching, "max_depth_levels",
        static_cast<std::int64_t>(m.max_depth_levels), "matching");
    if (depth <= 0) {
      fail("matching.max_depth_levels", "must be positive");
    }
    m.max_depth_levels = static_cast<std::size_t>(depth);

    const auto strategy_text =
        read<std::string>(matching, "strategy", toString(m.strategy),
                          "matching");
    const auto strategy = parseMatchingStrategy(strategy_text);
    if (!strategy) {
      fail("matching.strategy", "unknown strategy '" + strategy_text + "'");
    }
    m.strategy = *strategy;

    m.fee_per_share =
        read<double>(matching, "fee_per_share", m.fee_per_share, "matching");
    if (m.fee_per_share < 0.0) {
      fail("matching.fee_per_share", "must not be negative");
    }
    m.debug = read<bool>(matching, "debug", m.debug, "matching");
  }

  // --- execution --------------------------------------------------------------
  {
    const json execution = section(root, "execution");
    auto& e = config.execution;
    e.timeout_ms =
        read<std::int64_t>(execution, "timeout_ms", e.timeout_ms, "execution");
    if (e.timeout_ms <= 0) {
      fail("execution.timeout_ms", "must be positive");
    }
    e.debug = read<bool>(execution, "debug", e.debug, "execution");

    config.heartbeat_ms = read<std::int64_t>(execution, "heartbeat_ms",
                                             config.heartbeat_ms, "execution");
    if (config.heartbeat_ms < 0) {
      fail("execution.heartbeat_ms", "must not be negative");
    }

    const auto mode_text = read<std::string>(
        execution, "notify_mode", toString(config.notify_mode), "execution");
    const auto mode = parseNotifyMode(mode_text);
    if (!mode) {
      fail("execution.notify_mode", "unknown notify mode '" + mode_text + "'");
    }
    config.notify_mode = *mode;
  }

  // --- network ----------------------------------------------------------------
  {
    const json network = section(root, "network");
    auto& n = config.network;
    n.market_data_endpoint = read<std::string>(
        network, "market_data_endpoint", n.market_data_endpoint, "network");
    n.ipc_cmd_endpoint = read<std::string>(network, "ipc_cmd_endpoint",
                                           n.ipc_cmd_endpoint, "network");
    n.ipc_pub_endpoint = read<std::string>(network, "ipc_pub_endpoint",
                                           n.ipc_pub_endpoint, "network");
  }

  // --- paper_broker -----------------------------------------------------------
  {
    const json broker = section(root, "paper_broker");
    auto& b = config.paper_broker;
    b.fee_per_share =
        read<double>(broker, "fee_per_share", b.fee_per_share, "paper_broker");
    if (b.fee_per_share < 0.0) {
      fail("paper_broker.fee_per_share", "must not be negative");
    }
    b.max_fill_ratio = read<double>(broker, "max_fill_ratio", b.max_fill_ratio,
                                    "paper_broker");
    if (!(b.max_fill_ratio > 0.0 && b.max_fill_ratio <= 1.0)) {
      fail("paper_broker.max_fill_ratio", "must be in (0, 1]");
    }
  }

  // --- targets ----------------------------------------------------------------
  if (root.contains("targets")) {
    const json& targets = root.at("targets");
    if (!targets.is_array()) {
      fail("targets", "expected an array");
    }
    for (std::size_t i = 0; i < targets.size(); ++i) {
      config.targets.push_back(
          parseTarget(targets[i], "targets[" + std::to_string(i) + "]"));
    }
  }

  return config;
}

// -----------------------------------------------------------------------------
// fromFile()
// -----------------------------------------------------------------------------
EngineConfig EngineConfig::fromFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    fail(path, "cannot open config file");
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return fromJson(buffer.str());
}

}  // namespace arb
