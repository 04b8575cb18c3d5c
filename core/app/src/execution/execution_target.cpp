#include "arb/execution/execution_target.hpp"
#include "arb/execution/target_tag.hpp"
#include "arb/matching/spread_math.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>

namespace arb {

ExecutionTarget::ExecutionTarget(domain::TargetId id, TargetRequest request,
                                 std::int64_t created_ms,
                                 std::int64_t timeout_ms)
    : id_(id),
      request_(std::move(request)),
      tag_(makeTargetTag(id)),
      created_ms_(created_ms),
      timeout_ms_(timeout_ms) {}

// -----------------------------------------------------------------------------
// Status machine
// -----------------------------------------------------------------------------
bool ExecutionTarget::isLegalTransition(domain::ExecutionStatus current,
                                        domain::ExecutionStatus next) {
  using S = domain::ExecutionStatus;

  switch (current) {
    case S::New:
      return next != S::New;

    case S::Submitted:
      return next != S::New &&
             next != S::Submitted;

    case S::PartiallyFilled:
      return next == S::Filled ||
             next == S::Canceled ||
             next == S::Invalid ||
             next == S::Failed;

    case S::Filled:
    case S::Canceled:
    case S::Invalid:
    case S::Failed:
      return false;
  }

  return false;
}

bool ExecutionTarget::transitionTo(domain::ExecutionStatus next) {
  if (next == status_ && !domain::isTerminal(status_)) {
    return true;
  }

  if (!isLegalTransition(status_, next)) {
    std::cerr << "[ExecutionTarget] WARNING: target " << id_
              << " rejected transition " << toString(status_) << " -> "
              << toString(next) << ".\n";
    return false;
  }

  status_ = next;
  return true;
}

// -----------------------------------------------------------------------------
// Quantities
// -----------------------------------------------------------------------------
double ExecutionTarget::targetQuantity(const domain::Symbol& symbol) const {
  if (symbol == request_.symbol1) {
    return request_.quantity1;
  }
  if (symbol == request_.symbol2) {
    return request_.quantity2;
  }
  return 0.0;
}

double ExecutionTarget::quantityFilled(const domain::Symbol& symbol) const {
  double total = 0.0;
  for (const auto& group : groups_) {
    total += group.filledQuantity(symbol);
  }
  return total;
}

double ExecutionTarget::quantityRemaining(const domain::Symbol& symbol) const {
  return targetQuantity(symbol) - quantityFilled(symbol);
}

bool ExecutionTarget::isQuantityFilled() const {
  return quantityRemaining(request_.symbol1) == 0.0 &&
         quantityRemaining(request_.symbol2) == 0.0;
}

// -----------------------------------------------------------------------------
// isCompletelyFilled(): quantities decide, group statuses are cross-checked
// -----------------------------------------------------------------------------
bool ExecutionTarget::isCompletelyFilled() {
  // Exact zero only: a sub-lot residual stays open and ends in a timeout.
  if (!isQuantityFilled()) {
    return false;
  }

  const bool groups_agree =
      !groups_.empty() &&
      std::all_of(groups_.begin(), groups_.end(),
                  [](const OrderGroup& g) { return g.isFilled(); });
  if (!groups_agree) {
    ++completion_inconsistencies_;
    std::cerr << "[ExecutionTarget] WARNING: target " << id_
              << " quantities are filled but not every order group is "
                 "Filled (inconsistency #"
              << completion_inconsistencies_ << ").\n";
  }
  return true;
}

// -----------------------------------------------------------------------------
// Sweep
// -----------------------------------------------------------------------------
double ExecutionTarget::sweepableRemainder(
    const domain::Symbol& symbol, const IMarketDataSource& source) const {
  const double aligned =
      roundToLot(quantityRemaining(symbol), source.lotSize(symbol));
  if (aligned == 0.0 || aligned * targetQuantity(symbol) <= 0.0) {
    return 0.0;
  }
  return aligned;
}

bool ExecutionTarget::shouldFillRemainingOrders(
    const IMarketDataSource& source) const {
  if (groups_.empty()) {
    return false;
  }
  for (const auto& group : groups_) {
    if (!group.isComplete() || !group.allOrdersFilled()) {
      return false;
    }
  }

  if (isQuantityFilled()) {
    return false;
  }

  if (sweepableRemainder(request_.symbol1, source) == 0.0 &&
      sweepableRemainder(request_.symbol2, source) == 0.0) {
    return false;
  }

  const double price1 = markPrice(source, request_.symbol1);
  const double price2 = markPrice(source, request_.symbol2);

  const double remaining_value =
      std::min(std::abs(quantityRemaining(request_.symbol1)) * price1,
               std::abs(quantityRemaining(request_.symbol2)) * price2);
  const double lot_value =
      std::max(source.lotSize(request_.symbol1) * price1,
               source.lotSize(request_.symbol2) * price2);

  return remaining_value < lot_value;
}

std::size_t ExecutionTarget::fillRemainingOrders(
    IOrderGateway& gateway, const IMarketDataSource& source,
    std::int64_t now_ms) {
  groups_.emplace_back(id_, request_.symbol1, request_.symbol2,
                       GroupKind::Sweep, now_ms,
                       request_.expected_spread_pct);
  ++sweep_count_;

  std::size_t submitted = 0;
  for (const domain::Symbol* symbol : {&request_.symbol1, &request_.symbol2}) {
    const double quantity = sweepableRemainder(*symbol, source);
    if (quantity == 0.0) {
      continue;
    }

    groups_.back().incrementExpectedLegCount();
    const OrderHandle handle =
        gateway.submitMarketOrder(*symbol, quantity, tag_);
    ++submitted;

    std::cout << "[ExecutionTarget] target " << id_ << " sweep order "
              << handle << ": " << *symbol << " " << quantity << "\n";
  }
  return submitted;
}

// -----------------------------------------------------------------------------
// Timeout, failure, groups
// -----------------------------------------------------------------------------
bool ExecutionTarget::isExpired(std::int64_t now_ms) const {
  return anchor_ms_.has_value() && now_ms - *anchor_ms_ > timeout_ms_;
}

bool ExecutionTarget::isCompletelyFailed() const {
  return !groups_.empty() &&
         std::all_of(groups_.begin(), groups_.end(),
                     [](const OrderGroup& g) { return g.isFailed(); });
}

bool ExecutionTarget::anchor(std::int64_t now_ms) {
  if (anchor_ms_.has_value()) {
    return false;
  }
  anchor_ms_ = now_ms;
  return true;
}

OrderGroup& ExecutionTarget::appendPairGroup(std::int64_t now_ms,
                                             double expected_spread_pct) {
  groups_.emplace_back(id_, request_.symbol1, request_.symbol2,
                       GroupKind::Pair, now_ms, expected_spread_pct);
  return groups_.back();
}

OrderGroup* ExecutionTarget::activeGroup() {
  return groups_.empty() ? nullptr : &groups_.back();
}

const OrderGroup* ExecutionTarget::activeGroup() const {
  return groups_.empty() ? nullptr : &groups_.back();
}

OrderGroup* ExecutionTarget::findGroupByOrder(domain::BrokerOrderId order_id) {
  for (auto& group : groups_) {
    if (group.hasOrder(order_id)) {
      return &group;
    }
  }
  return nullptr;
}

// -----------------------------------------------------------------------------
// snapshot()
// -----------------------------------------------------------------------------
TargetSnapshot ExecutionTarget::snapshot() const {
  TargetSnapshot s;
  s.id = id_;
  s.opportunity_key = request_.opportunityKey();
  s.symbol1 = request_.symbol1;
  s.symbol2 = request_.symbol2;
  s.target_quantity1 = request_.quantity1;
  s.target_quantity2 = request_.quantity2;
  s.filled_quantity1 = quantityFilled(request_.symbol1);
  s.filled_quantity2 = quantityFilled(request_.symbol2);
  s.direction = request_.direction;
  s.status = status_;
  s.expected_spread_pct = request_.expected_spread_pct;
  s.total_fee = total_fee_;
  s.group_count = groups_.size();
  s.created_ms = created_ms_;
  s.anchor_ms = anchor_ms_;
  return s;
}

}  // namespace arb
