#pragma once

#include "arb/domain/instrument.hpp"
#include "arb/domain/leg_order.hpp"
#include "arb/events/order_events.hpp"
#include "arb/execution/execution_target.hpp"
#include "arb/execution/i_execution_listener.hpp"
#include "arb/execution/i_order_gateway.hpp"
#include "arb/execution/target_registry.hpp"
#include "arb/execution/target_types.hpp"
#include "arb/market/i_market_data_source.hpp"
#include "arb/matching/spread_matcher.hpp"
#include "arb/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace arb {

// -----------------------------------------------------------------------------
// ExecutionConfig
// -----------------------------------------------------------------------------
//   timeout_ms  Default target timeout, measured from the anchor (first tick
//               on which the target passed its preconditions).
//   debug       Logs every skipped tick and every wait.
// -----------------------------------------------------------------------------
struct ExecutionConfig {
  std::int64_t timeout_ms{60000};
  bool debug{false};
};

// -----------------------------------------------------------------------------
// ExecutionManager: drives every active target to a terminal status
// -----------------------------------------------------------------------------
//
// @brief  Turns ticks into matched order slices and order events into target
//         state, one target at a time.
//
// @details
// execute(target_id), once per relevant tick:
//
//   1. Preconditions: both markets open, both instruments quoted with a
//      positive price. Otherwise the tick is skipped.
//   2. The first tick that passes step 1 anchors the timeout clock.
//   3. shouldFillRemainingOrders() → sweep and return. A target sweeps at
//      most once; needing a second sweep is orphaned exposure → Failed.
//   4. isCompletelyFilled() → Filled, retire.
//   5. isExpired(now) → Canceled, cancel open broker orders, retire.
//   6. Active group still in flight → wait for its order events.
//   7. Match a slice sized to what is left: notional = min over the legs of
//      |remaining| * executable price, threshold = the target's expected
//      spread, quantities capped at the lot-aligned remainder. Nothing
//      executable → wait.
//   8. Append a Pair group, submit both legs tagged "arb-target:<id>". The
//      first submission moves the target to Submitted.
//
// onOrderEvent(event):
//
//   1. Tag → TargetId. Unparsable or never issued → CRITICAL, drop. An
//      issued id that is no longer active is a late report → WARNING, drop.
//   2. Known order id → its group. Otherwise the event's order is attached to
//      the active group, unless that group is already complete or does not
//      trade the event's symbol (leg mismatch → CRITICAL, drop).
//   3. Fee accumulated on the target.
//   4. Fills: completely filled → Filled, retire; else PartiallyFilled.
//   5. Cancel / Invalid: every group failed → Failed, retire. A failure in
//      a Sweep group is orphaned exposure → Failed, retire. Otherwise the
//      next tick decides.
//
// Every "nothing to do" outcome is a silent return (logged in debug mode).
// Only states that should be impossible are logged as CRITICAL. No exception
// escapes the manager; listener exceptions are caught and logged.
//
// Thread model:
//   Single writer. Every method except activeTargets(), hasActiveExecution()
//   and halt()/isHalted() must be called on the execution loop thread.
//
// Ownership:
//   References only. Registry, matcher, source, gateway, clock and listener
//   are owned by ArbitrageEngine (or a test) and must outlive the manager.
// -----------------------------------------------------------------------------
class ExecutionManager final {
 public:
  ExecutionManager(TargetRegistry& registry, const SpreadMatcher& matcher,
                   const IMarketDataSource& source, IOrderGateway& gateway,
                   const ITimeProvider& clock, IExecutionListener& listener,
                   ExecutionConfig config = {});

  ExecutionManager(const ExecutionManager&) = delete;
  ExecutionManager& operator=(const ExecutionManager&) = delete;
  ExecutionManager(ExecutionManager&&) = delete;
  ExecutionManager& operator=(ExecutionManager&&) = delete;

  // -------------------------------------------------------------------------
  // registerTarget(request)
  // -------------------------------------------------------------------------
  // @brief  Validates the request, mints a TargetId and notifies the
  //         listener of the new target.
  //
  // @return std::nullopt (with a WARNING) when the manager is halted, the
  //         request is malformed (empty or identical symbols, zero quantity,
  //         quantity signs that contradict the direction) or its opportunity
  //         key already has an active target.
  // -------------------------------------------------------------------------
  std::optional<domain::TargetId> registerTarget(const TargetRequest& request);

  void execute(domain::TargetId target_id);

  // Runs execute() for every active target trading symbol.
  void onTick(const domain::Symbol& symbol);

  // Runs execute() for every active target, so timeouts fire in a quiet
  // market. Driven by the engine's HeartbeatEvent timer.
  void onHeartbeat();

  void onOrderEvent(const LegOrderEvent& event);

  bool hasActiveExecution(const std::string& opportunity_key) const;

  // Thread-safe copy of the active targets' latest snapshots.
  std::vector<TargetSnapshot> activeTargets() const;

  // Stops accepting new targets. Active targets keep running.
  void halt() { halted_.store(true); }
  bool isHalted() const { return halted_.load(); }

  const ExecutionConfig& config() const { return config_; }

 private:
  // Steps 7 and 8 of execute().
  void submitSlice(ExecutionTarget& target, std::int64_t now_ms);

  // Sweep / orphan handling of step 3.
  void sweep(ExecutionTarget& target, std::int64_t now_ms);

  // Step 1.
  bool preconditionsHold(const ExecutionTarget& target) const;

  // Ask when buying, bid when selling, last trade as fallback.
  double executablePrice(const domain::Symbol& symbol, bool buying) const;

  // Moves target to `status`, removes it from the registry and hands it to
  // the listener. `target` is dangling afterwards.
  void finish(ExecutionTarget& target, domain::ExecutionStatus status,
              const char* reason);

  // Refreshes the registry snapshot and calls onTargetUpdated.
  void publish(const ExecutionTarget& target);

  TargetRegistry& registry_;
  const SpreadMatcher& matcher_;
  const IMarketDataSource& source_;
  IOrderGateway& gateway_;
  const ITimeProvider& clock_;
  IExecutionListener& listener_;
  ExecutionConfig config_;

  std::atomic<bool> halted_{false};
};

}  // namespace arb
