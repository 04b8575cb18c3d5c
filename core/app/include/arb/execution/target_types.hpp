#pragma once

#include "arb/domain/direction.hpp"
#include "arb/domain/execution_status.hpp"
#include "arb/domain/instrument.hpp"
#include "arb/domain/leg_order.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace arb {

// -----------------------------------------------------------------------------
// TargetRequest
// -----------------------------------------------------------------------------
// Responsibility: Everything needed to open an ExecutionTarget for one
// detected opportunity. Produced by the (external) signal layer, by
// EngineConfig's initial target list, or by tests.
//
// @details
// pair_id + level_id form the opportunity's stable identity. At most one
// active target may exist per identity (ExecutionManager rejects duplicates).
//
// quantity1 / quantity2 are signed per-leg targets and must agree with the
// direction: LongSpread buys leg 1 (quantity1 > 0, quantity2 < 0),
// ShortSpread sells leg 1 (quantity1 < 0, quantity2 > 0).
//
// expected_spread_pct is the spread, (buy/sell - 1) * 100 for whichever leg
// the direction buys, at which the opportunity was detected. It is the worst
// spread any slice may take: the matcher limit for every pair slice.
//
// timeout_ms <= 0 means "use ExecutionConfig::timeout_ms".
// -----------------------------------------------------------------------------
struct TargetRequest {
  std::string pair_id;
  std::string level_id;
  domain::Symbol symbol1;
  domain::Symbol symbol2;
  double quantity1{0.0};
  double quantity2{0.0};
  domain::SpreadDirection direction{domain::SpreadDirection::LongSpread};
  double expected_spread_pct{0.0};
  std::int64_t timeout_ms{0};

  std::string opportunityKey() const { return pair_id + "#" + level_id; }
};

// -----------------------------------------------------------------------------
// TargetSnapshot
// -----------------------------------------------------------------------------
// Immutable copy of an ExecutionTarget's observable state. This is what the
// IExecutionListener sees for non-terminal transitions and what the engine
// publishes as telemetry.
// -----------------------------------------------------------------------------
struct TargetSnapshot {
  domain::TargetId id{0};
  std::string opportunity_key;
  domain::Symbol symbol1;
  domain::Symbol symbol2;
  double target_quantity1{0.0};
  double target_quantity2{0.0};
  double filled_quantity1{0.0};
  double filled_quantity2{0.0};
  domain::SpreadDirection direction{domain::SpreadDirection::LongSpread};
  domain::ExecutionStatus status{domain::ExecutionStatus::New};
  double expected_spread_pct{0.0};
  double total_fee{0.0};
  std::size_t group_count{0};
  std::int64_t created_ms{0};
  std::optional<std::int64_t> anchor_ms;
};

}  // namespace arb
