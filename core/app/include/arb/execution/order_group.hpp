#pragma once

#include "arb/domain/execution_status.hpp"
#include "arb/domain/instrument.hpp"
#include "arb/domain/leg_order.hpp"
#include "arb/events/order_events.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace arb {

// Pair: one matched two-leg slice. Sweep: lone orders closing a lot-sized
// remainder after every Pair group has filled.
enum class GroupKind {
  Pair,
  Sweep,
};

inline const char* toString(GroupKind kind) {
  return kind == GroupKind::Pair ? "Pair" : "Sweep";
}

// -----------------------------------------------------------------------------
// OrderGroup: one batch of concurrently submitted leg orders
// -----------------------------------------------------------------------------
//
// @brief  Tracks the leg orders of a single execution attempt and derives the
//         attempt's status from them.
//
// @details
// The group is appended to its ExecutionTarget BEFORE its orders are
// submitted, as an empty placeholder. Legs are attached when the first
// LegOrderEvent for each broker order id arrives, so the group does not need
// the gateway's handles up front.
//
// expected_leg_count says how many legs the group will eventually hold: 2
// for a Pair group; a Sweep group starts at 0 and is incremented once per
// order right before that order is submitted.
//
// Status is derived on every read, never stored:
//
//   any leg Canceled or Invalid           → Failed
//   all legs Filled and group complete    → Filled
//   some leg Filled or PartiallyFilled    → PartiallyFilled
//   otherwise                             → Submitted
//
// Thread model:
//   Owned by an ExecutionTarget; touched only on the execution loop.
// -----------------------------------------------------------------------------
class OrderGroup {
 public:
  OrderGroup(domain::TargetId target_id, domain::Symbol symbol1,
             domain::Symbol symbol2, GroupKind kind, std::int64_t created_ms,
             double expected_spread_pct = 0.0);

  domain::ExecutionStatus status() const;

  bool isFilled() const;
  bool isPartiallyFilled() const;
  bool isFailed() const;

  // legCount() == expectedLegCount().
  bool isComplete() const;

  // Still waiting on the broker: legs not attached yet, or some attached leg
  // not terminal.
  bool isInFlight() const;

  // At least one leg, and every leg Filled.
  bool allOrdersFilled() const;

  // Signed cumulative fill of the group's legs in symbol.
  double filledQuantity(const domain::Symbol& symbol) const;

  bool involves(const domain::Symbol& symbol) const;
  bool hasOrder(domain::BrokerOrderId order_id) const;

  // -------------------------------------------------------------------------
  // attach(order)
  // -------------------------------------------------------------------------
  // @brief  Adds a leg. Idempotent per order id.
  //
  // @return false if a leg with the same order id is already attached; the
  //         group is left unchanged.
  // -------------------------------------------------------------------------
  bool attach(const domain::LegOrder& order);

  // -------------------------------------------------------------------------
  // applyUpdate(event, now_ms)
  // -------------------------------------------------------------------------
  // @brief  Folds one broker report into the matching leg.
  //
  // @details
  // Accumulates the incremental fill into filled_quantity and the weighted
  // average fill price, adds the incremental fee and takes the reported
  // status. A leg that is already terminal ignores further reports, and a
  // PartiallyFilled leg never moves back to Submitted.
  //
  // @return false when no leg has event.order_id or the leg's symbol does
  //         not match event.symbol.
  // -------------------------------------------------------------------------
  bool applyUpdate(const LegOrderEvent& event, std::int64_t now_ms);

  void incrementExpectedLegCount() { ++expected_leg_count_; }

  // Spread realized by the group's fills, from the average prices of its
  // buy and its sell leg. std::nullopt until the group is Filled or when it
  // does not hold exactly one leg on each side.
  std::optional<double> realizedSpreadPct() const;

  domain::TargetId targetId() const { return target_id_; }
  GroupKind kind() const { return kind_; }
  const domain::Symbol& symbol1() const { return symbol1_; }
  const domain::Symbol& symbol2() const { return symbol2_; }
  const std::vector<domain::LegOrder>& legs() const { return legs_; }
  std::size_t legCount() const { return legs_.size(); }
  std::size_t expectedLegCount() const { return expected_leg_count_; }
  std::int64_t createdMs() const { return created_ms_; }
  double expectedSpreadPct() const { return expected_spread_pct_; }

 private:
  domain::LegOrder* findLeg(domain::BrokerOrderId order_id);
  const domain::LegOrder* findLeg(domain::BrokerOrderId order_id) const;

  domain::TargetId target_id_;
  domain::Symbol symbol1_;
  domain::Symbol symbol2_;
  GroupKind kind_;
  std::size_t expected_leg_count_;
  std::int64_t created_ms_;
  double expected_spread_pct_;
  std::vector<domain::LegOrder> legs_;
};

}  // namespace arb
