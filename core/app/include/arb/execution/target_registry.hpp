#pragma once

#include "arb/concurrent/sequence_generator.hpp"
#include "arb/domain/instrument.hpp"
#include "arb/domain/leg_order.hpp"
#include "arb/execution/execution_target.hpp"
#include "arb/execution/target_types.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace arb {

// -----------------------------------------------------------------------------
// TargetRegistry: single owner of every active ExecutionTarget
// -----------------------------------------------------------------------------
//
// @brief  Mints TargetIds, indexes active targets by id and by opportunity
//         key, and moves targets out on retirement.
//
// @details
// Targets live in a std::map keyed by TargetId, so iteration (and therefore
// tick processing) follows creation order.
//
// Two views:
//   1. The targets themselves. find() hands out a raw pointer that is valid
//      until the target is retired. Only the execution loop may call it.
//   2. A snapshot per target, refreshed by the ExecutionManager after every
//      mutation (refresh()). snapshots() reads this view and may be called
//      from any thread (the IPC STATUS command, tests).
//
// Thread model:
//   Writers run on the execution loop. mutex_ guards the maps and the
//   snapshot view so concurrent readers of (2) never see a torn state.
//   find() returns a pointer that escapes the lock: the contents of a target
//   are touched by the loop thread only.
//
// Ownership:
//   Owned by the engine (or a test); the ExecutionManager holds a reference.
// -----------------------------------------------------------------------------
class TargetRegistry {
 public:
  TargetRegistry() = default;

  TargetRegistry(const TargetRegistry&) = delete;
  TargetRegistry& operator=(const TargetRegistry&) = delete;
  TargetRegistry(TargetRegistry&&) = delete;
  TargetRegistry& operator=(TargetRegistry&&) = delete;

  // -------------------------------------------------------------------------
  // add(request, created_ms, timeout_ms)
  // -------------------------------------------------------------------------
  // @brief  Creates a target under a freshly minted TargetId.
  //
  // @return The new id, or std::nullopt if a target with the same
  //         opportunity key is already active (no id is consumed).
  // -------------------------------------------------------------------------
  std::optional<domain::TargetId> add(const TargetRequest& request,
                                      std::int64_t created_ms,
                                      std::int64_t timeout_ms);

  // Execution loop only. nullptr if id is not active.
  ExecutionTarget* find(domain::TargetId id);

  // Removes the target and returns it by value. std::nullopt if not active.
  std::optional<ExecutionTarget> retire(domain::TargetId id);

  // Republishes the snapshot of target.
  void refresh(const ExecutionTarget& target);

  // True for any id this registry has minted, active or retired. Ids are
  // minted in order and never reused, so this is the high-water mark check.
  bool wasIssued(domain::TargetId id) const;

  bool containsKey(const std::string& opportunity_key) const;
  std::optional<domain::TargetId> findByKey(
      const std::string& opportunity_key) const;

  // Ids of active targets trading symbol, in creation order.
  std::vector<domain::TargetId> idsTrading(const domain::Symbol& symbol) const;

  std::vector<domain::TargetId> activeIds() const;
  std::vector<TargetSnapshot> snapshots() const;
  std::size_t size() const;

 private:
  mutable std::mutex mutex_;
  SequenceGenerator ids_;
  std::map<domain::TargetId, ExecutionTarget> targets_;
  std::map<domain::TargetId, TargetSnapshot> snapshots_;
  std::unordered_map<std::string, domain::TargetId> by_key_;
};

}  // namespace arb
