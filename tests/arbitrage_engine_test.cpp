// =============================================================================
// arbitrage_engine_test.cpp
// =============================================================================
// End-to-end tests for ArbitrageEngine with real loop threads and the paper
// broker. No sockets: every endpoint is empty and the heartbeat timer is off,
// so the test pushes ticks and heartbeats itself.
//
// Validates:
//   - Command replies (PING, HALT, STATUS, unknown)
//   - Tick → target → paper fills → Filled retirement, fees included
//   - Targets from the config are submitted at start()
//   - Heartbeat-driven timeout on the simulation clock
//   - stop()/start() begins with a fresh registry and halt flag
// =============================================================================

#include "arb/engine/arbitrage_engine.hpp"
#include "arb/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>

using arb::domain::ExecutionStatus;

namespace {

// Polls `done` every few ms until it holds or two seconds pass.
bool waitFor(const std::function<bool()>& done) {
  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::seconds(2);
  while (std::chrono::steady_clock::now() < deadline) {
    if (done()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return done();
}

}  // namespace

class ArbitrageEngineTest : public ::testing::Test {
 protected:
  static arb::EngineConfig makeConfig() {
    arb::EngineConfig config;
    config.instruments = {{"X", 1.0, true}, {"Y", 1.0, true}};
    config.execution.timeout_ms = 500;
    config.heartbeat_ms = 0;
    config.paper_broker.fee_per_share = 0.005;
    return config;
  }

  static arb::TargetRequest makeRequest(double expected_spread) {
    arb::TargetRequest r;
    r.pair_id = "X-Y";
    r.level_id = "0";
    r.symbol1 = "X";
    r.symbol2 = "Y";
    r.quantity1 = 10.0;
    r.quantity2 = -10.0;
    r.direction = arb::domain::SpreadDirection::LongSpread;
    r.expected_spread_pct = expected_spread;
    return r;
  }

  static arb::MarketDataEvent tick(const std::string& symbol, double bid,
                                   double ask) {
    arb::MarketDataEvent e;
    e.symbol = symbol;
    e.bid = bid;
    e.ask = ask;
    e.timestamp = arb::ms_to_timestamp(1000);
    return e;
  }

  void startEngine(arb::EngineConfig config) {
    engine = std::make_unique<arb::ArbitrageEngine>(std::move(config));
    engine->simulationClock().advance_time(1000);
    engine->start();
    engine->executionEventBus().subscribe<arb::HeartbeatEvent>(
        [this](const arb::HeartbeatEvent&) { ++beats; });
  }

  void quoteBoth() {
    engine->pushMarketData(tick("X", 99.5, 100.0));
    engine->pushMarketData(tick("Y", 100.0, 100.5));
  }

  // Returns once the execution loop has handled everything queued before it.
  void drainExecutionLoop() {
    const int expected = beats.load() + 1;
    engine->pushEvent(arb::HeartbeatEvent{"test", "ok", {}, 0});
    ASSERT_TRUE(waitFor([&] { return beats.load() >= expected; }));
  }

  // Declared before the engine so the heartbeat counter outlives it.
  std::atomic<int> beats{0};
  std::unique_ptr<arb::ArbitrageEngine> engine;
};

// -----------------------------------------------------------------------------
// 1. Command replies.
// -----------------------------------------------------------------------------
TEST_F(ArbitrageEngineTest, Commands) {
  startEngine(makeConfig());

  auto reply = nlohmann::json::parse(engine->executeCommand("PING"));
  EXPECT_EQ(reply.at("response"), "PONG");

  reply = nlohmann::json::parse(engine->executeCommand("STATUS"));
  EXPECT_EQ(reply.at("status"), "ok");
  EXPECT_EQ(reply.at("halted"), false);
  EXPECT_TRUE(reply.at("targets").empty());

  reply = nlohmann::json::parse(engine->executeCommand("HALT"));
  EXPECT_EQ(reply.at("status"), "ok");
  reply = nlohmann::json::parse(engine->executeCommand("STATUS"));
  EXPECT_EQ(reply.at("halted"), true);

  reply = nlohmann::json::parse(engine->executeCommand("LAUNCH"));
  EXPECT_EQ(reply.at("status"), "error");
  EXPECT_EQ(reply.at("response"), "Unknown command: LAUNCH");
}

// -----------------------------------------------------------------------------
// 2. A target submitted after quotes arrive fills through the paper broker.
// Scenario: buy X at 100, sell Y at 100 (spread 0%, inside a 0% limit), ten
//           shares each, fee 0.005 per share on both legs.
// -----------------------------------------------------------------------------
TEST_F(ArbitrageEngineTest, TargetFillsEndToEnd) {
  startEngine(makeConfig());
  quoteBoth();
  engine->submitTarget(makeRequest(0.0));

  ASSERT_TRUE(waitFor([&] { return engine->retiredTargets().size() == 1; }));

  const auto retired = engine->retiredTargets()[0];
  EXPECT_EQ(retired.status, ExecutionStatus::Filled);
  EXPECT_DOUBLE_EQ(retired.filled_quantity1, 10.0);
  EXPECT_DOUBLE_EQ(retired.filled_quantity2, -10.0);
  EXPECT_NEAR(retired.total_fee, 0.1, 1e-9);
  EXPECT_EQ(retired.group_count, 1u);
  EXPECT_TRUE(engine->activeTargets().empty());
}

// -----------------------------------------------------------------------------
// 3. Targets listed in the config are submitted by start().
// -----------------------------------------------------------------------------
TEST_F(ArbitrageEngineTest, ConfigTargetsSubmittedAtStart) {
  auto config = makeConfig();
  config.targets.push_back(makeRequest(0.0));
  startEngine(config);

  drainExecutionLoop();
  ASSERT_EQ(engine->activeTargets().size(), 1u);
  EXPECT_EQ(engine->activeTargets()[0].opportunity_key, "X-Y#0");

  // The first quotes satisfy the preconditions and the target fills.
  quoteBoth();
  ASSERT_TRUE(waitFor([&] { return engine->retiredTargets().size() == 1; }));
  EXPECT_EQ(engine->retiredTargets()[0].status, ExecutionStatus::Filled);
}

// -----------------------------------------------------------------------------
// 4. A target demanding a 5% edge from a flat book never trades and times
//    out on a heartbeat once the simulation clock is past anchor + timeout.
// -----------------------------------------------------------------------------
TEST_F(ArbitrageEngineTest, HeartbeatTimesOutTarget) {
  startEngine(makeConfig());
  quoteBoth();
  engine->submitTarget(makeRequest(-5.0));
  drainExecutionLoop();

  ASSERT_EQ(engine->activeTargets().size(), 1u);
  EXPECT_EQ(engine->activeTargets()[0].status, ExecutionStatus::New);

  engine->simulationClock().advance_time(1500);
  drainExecutionLoop();
  EXPECT_TRUE(engine->retiredTargets().empty());

  engine->simulationClock().advance_time(1501);
  drainExecutionLoop();
  ASSERT_EQ(engine->retiredTargets().size(), 1u);
  EXPECT_EQ(engine->retiredTargets()[0].status, ExecutionStatus::Canceled);
  EXPECT_DOUBLE_EQ(engine->retiredTargets()[0].filled_quantity1, 0.0);
}

// -----------------------------------------------------------------------------
// 5. A restarted engine has no targets and is not halted.
// -----------------------------------------------------------------------------
TEST_F(ArbitrageEngineTest, RestartResetsExecutionState) {
  startEngine(makeConfig());
  quoteBoth();
  engine->submitTarget(makeRequest(-5.0));
  drainExecutionLoop();
  engine->executeCommand("HALT");
  ASSERT_EQ(engine->activeTargets().size(), 1u);

  engine->stop();
  EXPECT_FALSE(engine->isRunning());
  EXPECT_TRUE(engine->activeTargets().empty());

  engine->start();
  EXPECT_TRUE(engine->isRunning());
  const auto reply = nlohmann::json::parse(engine->executeCommand("STATUS"));
  EXPECT_EQ(reply.at("halted"), false);
  EXPECT_TRUE(reply.at("targets").empty());

  // Cached quotes survive the restart, so a new target fills at once.
  engine->submitTarget(makeRequest(0.0));
  ASSERT_TRUE(waitFor([&] { return engine->retiredTargets().size() == 1; }));
  EXPECT_EQ(engine->retiredTargets()[0].status, ExecutionStatus::Filled);
}
