#include "arb/execution/target_registry.hpp"

#include <utility>

namespace arb {

std::optional<domain::TargetId> TargetRegistry::add(const TargetRequest& request,
                                                    std::int64_t created_ms,
                                                    std::int64_t timeout_ms) {
  std::lock_guard lock(mutex_);

  const std::string key = request.opportunityKey();
  if (by_key_.count(key) != 0) {
    return std::nullopt;
  }

  const domain::TargetId id = ids_.next_id();
  auto it = targets_
                .emplace(id, ExecutionTarget(id, request, created_ms,
                                             timeout_ms))
                .first;
  by_key_.emplace(key, id);
  snapshots_[id] = it->second.snapshot();
  return id;
}

ExecutionTarget* TargetRegistry::find(domain::TargetId id) {
  std::lock_guard lock(mutex_);
  auto it = targets_.find(id);
  return it == targets_.end() ? nullptr : &it->second;
}

std::optional<ExecutionTarget> TargetRegistry::retire(domain::TargetId id) {
  std::lock_guard lock(mutex_);
  auto it = targets_.find(id);
  if (it == targets_.end()) {
    return std::nullopt;
  }

  ExecutionTarget target = std::move(it->second);
  targets_.erase(it);
  snapshots_.erase(id);
  by_key_.erase(target.opportunityKey());
  return target;
}

void TargetRegistry::refresh(const ExecutionTarget& target) {
  TargetSnapshot snapshot = target.snapshot();

  std::lock_guard lock(mutex_);
  if (targets_.count(target.id()) == 0) {
    return;
  }
  snapshots_[target.id()] = std::move(snapshot);
}

bool TargetRegistry::containsKey(const std::string& opportunity_key) const {
  std::lock_guard lock(mutex_);
  return by_key_.count(opportunity_key) != 0;
}

bool TargetRegistry::wasIssued(domain::TargetId id) const {
  return id != 0 && id < ids_.peek();
}

std::optional<domain::TargetId> TargetRegistry::findByKey(
    const std::string& opportunity_key) const {
  std::lock_guard lock(mutex_);
  auto it = by_key_.find(opportunity_key);
  if (it == by_key_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::TargetId> TargetRegistry::idsTrading(
    const domain::Symbol& symbol) const {
  std::lock_guard lock(mutex_);
  std::vector<domain::TargetId> out;
  for (const auto& [id, target] : targets_) {
    if (target.tradesSymbol(symbol)) {
      out.push_back(id);
    }
  }
  return out;
}

std::vector<domain::TargetId> TargetRegistry::activeIds() const {
  std::lock_guard lock(mutex_);
  std::vector<domain::TargetId> out;
  out.reserve(targets_.size());
  for (const auto& [id, target] : targets_) {
    out.push_back(id);
  }
  return out;
}

std::vector<TargetSnapshot> TargetRegistry::snapshots() const {
  std::lock_guard lock(mutex_);
  std::vector<TargetSnapshot> out;
  out.reserve(snapshots_.size());
  for (const auto& [id, snapshot] : snapshots_) {
    out.push_back(snapshot);
  }
  return out;
}

std::size_t TargetRegistry::size() const {
  std::lock_guard lock(mutex_);
  return targets_.size();
}

}  // namespace arb
