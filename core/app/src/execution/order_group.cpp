#include "arb/execution/order_group.hpp"
#include "arb/matching/spread_math.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>

namespace arb {

OrderGroup::OrderGroup(domain::TargetId target_id, domain::Symbol symbol1,
                       domain::Symbol symbol2, GroupKind kind,
                       std::int64_t created_ms, double expected_spread_pct)
    : target_id_(target_id),
      symbol1_(std::move(symbol1)),
      symbol2_(std::move(symbol2)),
      kind_(kind),
      expected_leg_count_(kind == GroupKind::Pair ? 2 : 0),
      created_ms_(created_ms),
      expected_spread_pct_(expected_spread_pct) {}

// -----------------------------------------------------------------------------
// status(): derived from the legs on every call
// -----------------------------------------------------------------------------
domain::ExecutionStatus OrderGroup::status() const {
  using S = domain::LegOrderStatus;

  bool any_fill = false;
  bool all_filled = !legs_.empty();

  for (const auto& leg : legs_) {
    if (domain::isFailure(leg.status)) {
      return domain::ExecutionStatus::Failed;
    }
    if (leg.status == S::Filled || leg.status == S::PartiallyFilled) {
      any_fill = true;
    }
    if (leg.status != S::Filled) {
      all_filled = false;
    }
  }

  if (all_filled && isComplete()) {
    return domain::ExecutionStatus::Filled;
  }
  if (any_fill) {
    return domain::ExecutionStatus::PartiallyFilled;
  }
  return domain::ExecutionStatus::Submitted;
}

bool OrderGroup::isFilled() const {
  return status() == domain::ExecutionStatus::Filled;
}

bool OrderGroup::isPartiallyFilled() const {
  return status() == domain::ExecutionStatus::PartiallyFilled;
}

bool OrderGroup::isFailed() const {
  return status() == domain::ExecutionStatus::Failed;
}

bool OrderGroup::isComplete() const {
  return legs_.size() == expected_leg_count_;
}

bool OrderGroup::isInFlight() const {
  if (!isComplete()) {
    return true;
  }
  return std::any_of(legs_.begin(), legs_.end(),
                     [](const domain::LegOrder& leg) {
                       return !domain::isTerminal(leg.status);
                     });
}

bool OrderGroup::allOrdersFilled() const {
  return !legs_.empty() &&
         std::all_of(legs_.begin(), legs_.end(),
                     [](const domain::LegOrder& leg) {
                       return leg.status == domain::LegOrderStatus::Filled;
                     });
}

double OrderGroup::filledQuantity(const domain::Symbol& symbol) const {
  double total = 0.0;
  for (const auto& leg : legs_) {
    if (leg.symbol == symbol) {
      total += leg.filled_quantity;
    }
  }
  return total;
}

bool OrderGroup::involves(const domain::Symbol& symbol) const {
  return symbol == symbol1_ || symbol == symbol2_;
}

bool OrderGroup::hasOrder(domain::BrokerOrderId order_id) const {
  return findLeg(order_id) != nullptr;
}

// -----------------------------------------------------------------------------
// attach()
// -----------------------------------------------------------------------------
bool OrderGroup::attach(const domain::LegOrder& order) {
  if (hasOrder(order.order_id)) {
    return false;
  }
  legs_.push_back(order);
  return true;
}

// -----------------------------------------------------------------------------
// applyUpdate(): fold one incremental broker report into its leg
// -----------------------------------------------------------------------------
bool OrderGroup::applyUpdate(const LegOrderEvent& event, std::int64_t now_ms) {
  domain::LegOrder* leg = findLeg(event.order_id);
  if (leg == nullptr || leg->symbol != event.symbol) {
    return false;
  }

  if (domain::isTerminal(leg->status)) {
    std::cerr << "[OrderGroup] WARNING: report " << toString(event.status)
              << " for order " << event.order_id << " which is already "
              << toString(leg->status) << ". Ignoring.\n";
    return true;
  }

  if (event.fill_quantity != 0.0 && event.fill_price > 0.0) {
    const double previous = std::abs(leg->filled_quantity);
    const double increment = std::abs(event.fill_quantity);
    const double total = previous + increment;
    leg->average_fill_price =
        (leg->average_fill_price * previous + event.fill_price * increment) /
        total;
    leg->filled_quantity += event.fill_quantity;
  }

  leg->fee += event.fee;

  const bool regresses =
      event.status == domain::LegOrderStatus::Submitted &&
      leg->status == domain::LegOrderStatus::PartiallyFilled;
  if (!regresses && event.status != domain::LegOrderStatus::New) {
    leg->status = event.status;
  }
  leg->updated_ms = now_ms;
  return true;
}

// -----------------------------------------------------------------------------
// realizedSpreadPct()
// -----------------------------------------------------------------------------
std::optional<double> OrderGroup::realizedSpreadPct() const {
  if (!isFilled()) {
    return std::nullopt;
  }

  const domain::LegOrder* buy = nullptr;
  const domain::LegOrder* sell = nullptr;
  for (const auto& leg : legs_) {
    const domain::LegOrder*& slot = leg.quantity > 0.0 ? buy : sell;
    if (slot != nullptr) {
      return std::nullopt;
    }
    slot = &leg;
  }

  if (buy == nullptr || sell == nullptr) {
    return std::nullopt;
  }
  return calcSpreadPct(buy->average_fill_price, sell->average_fill_price);
}

domain::LegOrder* OrderGroup::findLeg(domain::BrokerOrderId order_id) {
  auto it = std::find_if(legs_.begin(), legs_.end(),
                         [order_id](const domain::LegOrder& leg) {
                           return leg.order_id == order_id;
                         });
  return it == legs_.end() ? nullptr : &*it;
}

const domain::LegOrder* OrderGroup::findLeg(
    domain::BrokerOrderId order_id) const {
  auto it = std::find_if(legs_.begin(), legs_.end(),
                         [order_id](const domain::LegOrder& leg) {
                           return leg.order_id == order_id;
                         });
  return it == legs_.end() ? nullptr : &*it;
}

}  // namespace arb
