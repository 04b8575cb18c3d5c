#include "arb/execution/execution_manager.hpp"
#include "arb/execution/target_tag.hpp"
#include "arb/matching/spread_math.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <iostream>
#include <utility>

namespace arb {

ExecutionManager::ExecutionManager(TargetRegistry& registry,
                                   const SpreadMatcher& matcher,
                                   const IMarketDataSource& source,
                                   IOrderGateway& gateway,
                                   const ITimeProvider& clock,
                                   IExecutionListener& listener,
                                   ExecutionConfig config)
    : registry_(registry),
      matcher_(matcher),
      source_(source),
      gateway_(gateway),
      clock_(clock),
      listener_(listener),
      config_(config) {}

// -----------------------------------------------------------------------------
// registerTarget()
// -----------------------------------------------------------------------------
std::optional<domain::TargetId> ExecutionManager::registerTarget(
    const TargetRequest& request) {
  const std::string key = request.opportunityKey();

  if (halted_.load()) {
    std::cerr << "[ExecutionManager] WARNING: halted, rejecting target "
              << key << ".\n";
    return std::nullopt;
  }

  const bool long_spread =
      request.direction == domain::SpreadDirection::LongSpread;
  const bool signs_ok = long_spread
                            ? (request.quantity1 > 0.0 && request.quantity2 < 0.0)
                            : (request.quantity1 < 0.0 && request.quantity2 > 0.0);

  if (request.symbol1.empty() || request.symbol2.empty() ||
      request.symbol1 == request.symbol2 ||
      !std::isfinite(request.quantity1) || !std::isfinite(request.quantity2) ||
      !signs_ok) {
    std::cerr << "[ExecutionManager] WARNING: malformed target " << key
              << " (" << request.symbol1 << " " << request.quantity1 << " / "
              << request.symbol2 << " " << request.quantity2 << " "
              << toString(request.direction) << "). Rejecting.\n";
    return std::nullopt;
  }

  const std::int64_t timeout_ms =
      request.timeout_ms > 0 ? request.timeout_ms : config_.timeout_ms;

  const auto id = registry_.add(request, clock_.now_ms(), timeout_ms);
  if (!id) {
    std::cerr << "[ExecutionManager] WARNING: opportunity " << key
              << " already has an active target. Rejecting.\n";
    return std::nullopt;
  }

  std::cout << "[ExecutionManager] target " << *id << " registered: " << key
            << " | " << request.symbol1 << " " << request.quantity1 << " / "
            << request.symbol2 << " " << request.quantity2 << " "
            << toString(request.direction)
            << " expected_spread=" << request.expected_spread_pct << "%\n";

  if (ExecutionTarget* target = registry_.find(*id)) {
    publish(*target);
  }
  return id;
}

// -----------------------------------------------------------------------------
// execute(): one pass of the per-tick state machine
// -----------------------------------------------------------------------------
void ExecutionManager::execute(domain::TargetId target_id) {
  ExecutionTarget* target = registry_.find(target_id);
  if (target == nullptr) {
    if (config_.debug) {
      std::cout << "[ExecutionManager] execute: target " << target_id
                << " is not active\n";
    }
    return;
  }

  // 1. Preconditions
  if (!preconditionsHold(*target)) {
    return;
  }

  const std::int64_t now = clock_.now_ms();

  // 2. Anchor the timeout clock on the first valid tick
  if (target->anchor(now) && config_.debug) {
    std::cout << "[ExecutionManager] target " << target_id
              << " anchored at " << now << "\n";
  }

  // 3. Sweep a remainder no pair can close
  if (target->shouldFillRemainingOrders(source_)) {
    sweep(*target, now);
    return;
  }

  // 4. Done
  if (target->isCompletelyFilled()) {
    finish(*target, domain::ExecutionStatus::Filled, "target quantity filled");
    return;
  }

  // 5. Timeout
  if (target->isExpired(now)) {
    const std::string tag = target->tag();
    std::cerr << "[ExecutionManager] WARNING: target " << target_id
              << " timed out after " << target->timeoutMs()
              << " ms. Canceling open orders.\n";
    gateway_.cancelOpenOrders(tag);
    finish(*target, domain::ExecutionStatus::Canceled, "timeout");
    return;
  }

  // 6. Wait for the active group
  if (const OrderGroup* active = target->activeGroup();
      active != nullptr && active->isInFlight()) {
    if (config_.debug) {
      std::cout << "[ExecutionManager] target " << target_id
                << " waiting on " << toString(active->kind()) << " group ("
                << active->legCount() << "/" << active->expectedLegCount()
                << " legs attached)\n";
    }
    return;
  }

  // 7 + 8. Match and submit the next slice
  submitSlice(*target, now);
}

// -----------------------------------------------------------------------------
// onTick()
// -----------------------------------------------------------------------------
void ExecutionManager::onTick(const domain::Symbol& symbol) {
  for (const domain::TargetId id : registry_.idsTrading(symbol)) {
    execute(id);
  }
}

void ExecutionManager::onHeartbeat() {
  for (const domain::TargetId id : registry_.activeIds()) {
    execute(id);
  }
}

// -----------------------------------------------------------------------------
// onOrderEvent(): fold one broker report into its target
// -----------------------------------------------------------------------------
void ExecutionManager::onOrderEvent(const LegOrderEvent& event) {
  const auto target_id = parseTargetTag(event.tag);
  if (!target_id) {
    std::cerr << "[ExecutionManager] CRITICAL: order " << event.order_id
              << " carries unparsable tag '" << event.tag << "'. Dropping.\n";
    return;
  }

  ExecutionTarget* target = registry_.find(*target_id);
  if (target == nullptr) {
    if (registry_.wasIssued(*target_id)) {
      std::cerr << "[ExecutionManager] WARNING: " << toString(event.status)
                << " for order " << event.order_id << " of retired target "
                << *target_id << ". Dropping.\n";
    } else {
      std::cerr << "[ExecutionManager] CRITICAL: order " << event.order_id
                << " references unknown target " << *target_id
                << ". Dropping.\n";
    }
    return;
  }

  const std::int64_t now = clock_.now_ms();

  // 2. Route the report to its group
  OrderGroup* group = target->findGroupByOrder(event.order_id);
  if (group == nullptr) {
    OrderGroup* active = target->activeGroup();
    if (active == nullptr || active->isComplete() ||
        !active->involves(event.symbol)) {
      std::cerr << "[ExecutionManager] CRITICAL: leg mismatch for target "
                << *target_id << ": order " << event.order_id << " ("
                << event.symbol << ") has no open slot in the active group. "
                   "Dropping.\n";
      return;
    }

    domain::LegOrder leg;
    leg.order_id = event.order_id;
    leg.symbol = event.symbol;
    leg.quantity = event.order_quantity;
    leg.updated_ms = now;
    active->attach(leg);
    group = active;
  }

  if (!group->applyUpdate(event, now)) {
    std::cerr << "[ExecutionManager] CRITICAL: leg mismatch for target "
              << *target_id << ": order " << event.order_id
              << " reported for symbol " << event.symbol << ". Dropping.\n";
    return;
  }

  // 3. Fees
  target->addFee(event.fee);

  // 4 + 5. Status
  switch (event.status) {
    case domain::LegOrderStatus::New:
    case domain::LegOrderStatus::Submitted:
      if (config_.debug) {
        std::cout << "[ExecutionManager] target " << *target_id << " order "
                  << event.order_id << " acknowledged\n";
      }
      break;

    case domain::LegOrderStatus::PartiallyFilled:
    case domain::LegOrderStatus::Filled:
      std::cout << "[ExecutionManager] target " << *target_id << " fill: "
                << event.symbol << " " << event.fill_quantity << " @ "
                << event.fill_price << " (order " << event.order_id << ", "
                << toString(event.status) << ")\n";
      if (target->isCompletelyFilled()) {
        finish(*target, domain::ExecutionStatus::Filled,
               "target quantity filled");
      } else {
        target->transitionTo(domain::ExecutionStatus::PartiallyFilled);
        publish(*target);
      }
      break;

    case domain::LegOrderStatus::Canceled:
    case domain::LegOrderStatus::Invalid:
      std::cerr << "[ExecutionManager] WARNING: order " << event.order_id
                << " (" << event.symbol << ") of target " << *target_id
                << " ended " << toString(event.status) << ".\n";
      if (target->isCompletelyFailed()) {
        finish(*target, domain::ExecutionStatus::Failed,
               "every order group failed");
      } else if (group->kind() == GroupKind::Sweep) {
        std::cerr << "[ExecutionManager] CRITICAL: sweep order failed for "
                     "target " << *target_id
                  << ", exposure left open.\n";
        finish(*target, domain::ExecutionStatus::Failed, "orphaned exposure");
      } else {
        publish(*target);
      }
      break;
  }
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
bool ExecutionManager::hasActiveExecution(
    const std::string& opportunity_key) const {
  return registry_.containsKey(opportunity_key);
}

std::vector<TargetSnapshot> ExecutionManager::activeTargets() const {
  return registry_.snapshots();
}

// -----------------------------------------------------------------------------
// Private helpers
// -----------------------------------------------------------------------------
bool ExecutionManager::preconditionsHold(const ExecutionTarget& target) const {
  for (const domain::Symbol* symbol : {&target.symbol1(), &target.symbol2()}) {
    if (!source_.isMarketOpen(*symbol)) {
      if (config_.debug) {
        std::cout << "[ExecutionManager] target " << target.id()
                  << " skipped: market closed for " << *symbol << "\n";
      }
      return false;
    }
    if (!source_.hasData(*symbol) || markPrice(source_, *symbol) <= 0.0) {
      if (config_.debug) {
        std::cout << "[ExecutionManager] target " << target.id()
                  << " skipped: no valid price for " << *symbol << "\n";
      }
      return false;
    }
  }
  return true;
}

double ExecutionManager::executablePrice(const domain::Symbol& symbol,
                                         bool buying) const {
  const double quote =
      buying ? source_.bestAsk(symbol) : source_.bestBid(symbol);
  return quote > 0.0 ? quote : source_.lastPrice(symbol);
}

void ExecutionManager::sweep(ExecutionTarget& target, std::int64_t now_ms) {
  if (target.sweepCount() > 0) {
    std::cerr << "[ExecutionManager] CRITICAL: target " << target.id()
              << " needs a second sweep (" << target.symbol1() << " "
              << target.quantityRemaining(target.symbol1()) << " / "
              << target.symbol2() << " "
              << target.quantityRemaining(target.symbol2())
              << " open), exposure left open.\n";
    finish(target, domain::ExecutionStatus::Failed, "orphaned exposure");
    return;
  }

  const std::size_t submitted =
      target.fillRemainingOrders(gateway_, source_, now_ms);
  std::cout << "[ExecutionManager] target " << target.id() << " sweep: "
            << submitted << " order(s) submitted\n";
  publish(target);
}

void ExecutionManager::submitSlice(ExecutionTarget& target,
                                   std::int64_t now_ms) {
  const domain::Symbol& symbol1 = target.symbol1();
  const domain::Symbol& symbol2 = target.symbol2();

  const double remaining1 = target.quantityRemaining(symbol1);
  const double remaining2 = target.quantityRemaining(symbol2);
  const double cap1 = roundToLot(remaining1, source_.lotSize(symbol1));
  const double cap2 = roundToLot(remaining2, source_.lotSize(symbol2));

  if (cap1 * target.targetQuantity(symbol1) <= 0.0 ||
      cap2 * target.targetQuantity(symbol2) <= 0.0) {
    if (config_.debug) {
      std::cout << "[ExecutionManager] target " << target.id()
                << " has no pairable remainder (" << remaining1 << " / "
                << remaining2 << ")\n";
    }
    return;
  }

  const bool long_spread =
      target.direction() == domain::SpreadDirection::LongSpread;
  const double price1 = executablePrice(symbol1, long_spread);
  const double price2 = executablePrice(symbol2, !long_spread);

  MatchRequest request;
  request.symbol1 = symbol1;
  request.symbol2 = symbol2;
  request.target_notional =
      std::min(std::abs(remaining1) * price1, std::abs(remaining2) * price2);
  request.direction = domain::toMatchDirection(target.direction());
  request.max_spread_pct = target.expectedSpreadPct();

  const MatchResult result = matcher_.matchPair(request);
  if (!result.executable) {
    if (config_.debug) {
      std::cout << "[ExecutionManager] target " << target.id()
                << " no executable slice: " << toString(result.reject_reason)
                << "\n";
    }
    return;
  }

  const double quantity1 = std::copysign(
      std::min(std::abs(result.leg1.quantity), std::abs(cap1)), cap1);
  const double quantity2 = std::copysign(
      std::min(std::abs(result.leg2.quantity), std::abs(cap2)), cap2);
  if (quantity1 == 0.0 || quantity2 == 0.0) {
    return;
  }

  target.appendPairGroup(now_ms, result.avg_spread_pct);

  const OrderHandle order1 =
      gateway_.submitMarketOrder(symbol1, quantity1, target.tag());
  const OrderHandle order2 =
      gateway_.submitMarketOrder(symbol2, quantity2, target.tag());

  std::cout << "[ExecutionManager] target " << target.id() << " slice #"
            << target.groups().size() << " (" << toString(result.variant)
            << "): " << symbol1 << " " << quantity1 << " (order " << order1
            << ") / " << symbol2 << " " << quantity2 << " (order " << order2
            << ") spread=" << result.avg_spread_pct << "%"
            << (result.reached_target ? "" : " [partial liquidity]") << "\n";

  if (target.status() == domain::ExecutionStatus::New) {
    target.transitionTo(domain::ExecutionStatus::Submitted);
  }
  publish(target);
}

void ExecutionManager::finish(ExecutionTarget& target,
                              domain::ExecutionStatus status,
                              const char* reason) {
  const domain::TargetId id = target.id();
  target.transitionTo(status);

  std::cout << "[ExecutionManager] target " << id << " "
            << toString(target.status()) << " (" << reason << ")\n";

  std::optional<ExecutionTarget> retired = registry_.retire(id);
  if (!retired) {
    std::cerr << "[ExecutionManager] CRITICAL: target " << id
              << " vanished from the registry before retirement.\n";
    return;
  }

  try {
    listener_.onTargetRetired(std::move(*retired));
  } catch (const std::exception& e) {
    std::cerr << "[ExecutionManager] WARNING: listener threw on retirement "
                 "of target " << id << ": " << e.what() << "\n";
  }
}

void ExecutionManager::publish(const ExecutionTarget& target) {
  registry_.refresh(target);
  try {
    listener_.onTargetUpdated(target.snapshot());
  } catch (const std::exception& e) {
    std::cerr << "[ExecutionManager] WARNING: listener threw on update of "
                 "target " << target.id() << ": " << e.what() << "\n";
  }
}

}  // namespace arb
