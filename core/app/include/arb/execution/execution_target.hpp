#pragma once

#include "arb/domain/direction.hpp"
#include "arb/domain/execution_status.hpp"
#include "arb/domain/instrument.hpp"
#include "arb/domain/leg_order.hpp"
#include "arb/execution/i_order_gateway.hpp"
#include "arb/execution/order_group.hpp"
#include "arb/execution/target_types.hpp"
#include "arb/market/i_market_data_source.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace arb {

// -----------------------------------------------------------------------------
// ExecutionTarget: hedge goal for one opportunity
// -----------------------------------------------------------------------------
//
// @brief  Per-leg signed target quantities, the timeout clock and the ordered
//         list of OrderGroups working toward them.
//
// @details
// Filled quantity per leg is the sum over ALL groups, including failed ones:
// a leg that filled before its partner was rejected is real exposure.
//
// Only the most recently appended group is active. A Pair group is appended
// only once the previous group is no longer in flight; a Sweep group is
// appended only after every group has filled.
//
// Status machine:
//
//   New → Submitted → PartiallyFilled → Filled
//   Canceled, Invalid, Failed from any non-terminal status.
//
// transitionTo() enforces it. Once terminal, every further transition is
// rejected and logged.
//
// Thread model:
//   Owned by TargetRegistry, mutated only by ExecutionManager on the
//   execution loop. Moved out of the registry on retirement and handed to
//   the IExecutionListener by value.
// -----------------------------------------------------------------------------
class ExecutionTarget {
 public:
  ExecutionTarget(domain::TargetId id, TargetRequest request,
                  std::int64_t created_ms, std::int64_t timeout_ms);

  // -------------------------------------------------------------------------
  // transitionTo(next)
  // -------------------------------------------------------------------------
  // @return true if the status is now `next` (including when it already
  //         was). false, with a WARNING, for an illegal transition.
  // -------------------------------------------------------------------------
  bool transitionTo(domain::ExecutionStatus next);

  static bool isLegalTransition(domain::ExecutionStatus current,
                                domain::ExecutionStatus next);

  // Signed target, filled and remaining quantity for symbol (0 for a symbol
  // outside the pair).
  double targetQuantity(const domain::Symbol& symbol) const;
  double quantityFilled(const domain::Symbol& symbol) const;
  double quantityRemaining(const domain::Symbol& symbol) const;

  // Both remaining quantities are exactly zero.
  bool isQuantityFilled() const;

  // -------------------------------------------------------------------------
  // isCompletelyFilled()
  // -------------------------------------------------------------------------
  // @brief  Quantity-based completion: isQuantityFilled(), nothing looser.
  //
  // @details
  // A remainder below one lot keeps the target open; it can neither be
  // paired nor swept, so the timeout retires it as Canceled.
  //
  // Group statuses are cross-checked. If the quantities say "done" while some
  // group is not Filled, a WARNING is logged and completionInconsistencies()
  // is incremented; the quantity answer is still returned.
  // -------------------------------------------------------------------------
  bool isCompletelyFilled();

  // -------------------------------------------------------------------------
  // shouldFillRemainingOrders(source)
  // -------------------------------------------------------------------------
  // @brief  True when the remaining imbalance can only be closed by a sweep.
  //
  // @details
  // All of the following must hold:
  //   1. At least one group exists, every group is complete and every order
  //      in every group is Filled.
  //   2. The target is not quantity-filled.
  //   3. Some leg has a non-zero lot-aligned remainder in its target's
  //      direction.
  //   4. The smaller remaining leg value (|remaining| * mark price) is below
  //      the larger one-lot value of the two legs, so no further matched
  //      pair can be formed.
  // -------------------------------------------------------------------------
  bool shouldFillRemainingOrders(const IMarketDataSource& source) const;

  // -------------------------------------------------------------------------
  // fillRemainingOrders(gateway, source, now_ms)
  // -------------------------------------------------------------------------
  // @brief  Appends a Sweep group and submits one market order per leg with
  //         a non-zero lot-aligned remainder.
  //
  // @details
  // The group's expected leg count is incremented before each submission so
  // the group never looks complete while an order is still being sent.
  //
  // @return Number of orders submitted.
  // -------------------------------------------------------------------------
  std::size_t fillRemainingOrders(IOrderGateway& gateway,
                                  const IMarketDataSource& source,
                                  std::int64_t now_ms);

  // Anchor set and now_ms - anchor > timeout (strictly).
  bool isExpired(std::int64_t now_ms) const;

  // At least one group and every group Failed.
  bool isCompletelyFailed() const;

  // Sets the timeout anchor if it is not set yet. Returns true if it was set
  // by this call.
  bool anchor(std::int64_t now_ms);

  OrderGroup& appendPairGroup(std::int64_t now_ms, double expected_spread_pct);

  // Most recently appended group; nullptr before the first one.
  OrderGroup* activeGroup();
  const OrderGroup* activeGroup() const;

  // Group holding a leg with order_id; nullptr if none.
  OrderGroup* findGroupByOrder(domain::BrokerOrderId order_id);

  void addFee(double fee) { total_fee_ += fee; }

  TargetSnapshot snapshot() const;

  bool tradesSymbol(const domain::Symbol& symbol) const {
    return symbol == request_.symbol1 || symbol == request_.symbol2;
  }

  domain::TargetId id() const { return id_; }
  const std::string& tag() const { return tag_; }
  std::string opportunityKey() const { return request_.opportunityKey(); }
  const TargetRequest& request() const { return request_; }
  const domain::Symbol& symbol1() const { return request_.symbol1; }
  const domain::Symbol& symbol2() const { return request_.symbol2; }
  domain::SpreadDirection direction() const { return request_.direction; }
  double expectedSpreadPct() const { return request_.expected_spread_pct; }
  domain::ExecutionStatus status() const { return status_; }
  std::int64_t createdMs() const { return created_ms_; }
  std::optional<std::int64_t> anchorMs() const { return anchor_ms_; }
  std::int64_t timeoutMs() const { return timeout_ms_; }
  double totalFee() const { return total_fee_; }
  std::size_t sweepCount() const { return sweep_count_; }
  std::size_t completionInconsistencies() const {
    return completion_inconsistencies_;
  }
  const std::vector<OrderGroup>& groups() const { return groups_; }

 private:
  // Lot-aligned remainder of symbol, or 0 if it points against the target
  // (an overfill is never swept back).
  double sweepableRemainder(const domain::Symbol& symbol,
                            const IMarketDataSource& source) const;

  domain::TargetId id_;
  TargetRequest request_;
  std::string tag_;
  domain::ExecutionStatus status_{domain::ExecutionStatus::New};
  std::int64_t created_ms_;
  std::optional<std::int64_t> anchor_ms_;
  std::int64_t timeout_ms_;
  double total_fee_{0.0};
  std::size_t sweep_count_{0};
  std::size_t completion_inconsistencies_{0};
  std::vector<OrderGroup> groups_;
};

}  // namespace arb
