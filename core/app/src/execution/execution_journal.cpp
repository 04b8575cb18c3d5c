#include "arb/execution/execution_journal.hpp"
#include "arb/events/target_events.hpp"
#include "arb/time/time_utils.hpp"

#include <iostream>
#include <utility>

namespace arb {

const char* toString(NotifyMode mode) {
  return mode == NotifyMode::Realtime ? "realtime" : "batch";
}

std::optional<NotifyMode> parseNotifyMode(std::string_view text) {
  if (text == "realtime") {
    return NotifyMode::Realtime;
  }
  if (text == "batch") {
    return NotifyMode::Batch;
  }
  return std::nullopt;
}

ExecutionJournal::ExecutionJournal(EventBus& bus, const ITimeProvider& clock,
                                   NotifyMode mode)
    : bus_(bus), clock_(clock), mode_(mode) {}

// -----------------------------------------------------------------------------
// onTargetUpdated()
// -----------------------------------------------------------------------------
void ExecutionJournal::onTargetUpdated(const TargetSnapshot& snapshot) {
  if (mode_ == NotifyMode::Realtime) {
    emit(snapshot, false);
    return;
  }

  std::lock_guard lock(mutex_);
  pending_[snapshot.id] = snapshot;
}

// -----------------------------------------------------------------------------
// onTargetRetired(): record the final state and publish it immediately
// -----------------------------------------------------------------------------
void ExecutionJournal::onTargetRetired(ExecutionTarget target) {
  const TargetSnapshot snapshot = target.snapshot();

  std::cout << "[ExecutionJournal] target " << snapshot.id << " "
            << toString(snapshot.status) << " | " << snapshot.symbol1 << " "
            << snapshot.filled_quantity1 << "/" << snapshot.target_quantity1
            << " " << snapshot.symbol2 << " " << snapshot.filled_quantity2
            << "/" << snapshot.target_quantity2 << " fee=" << snapshot.total_fee
            << " groups=" << snapshot.group_count;
  for (const auto& group : target.groups()) {
    if (const auto realized = group.realizedSpreadPct()) {
      std::cout << " " << toString(group.kind()) << ":" << *realized << "%";
    }
  }
  std::cout << "\n";

  {
    std::lock_guard lock(mutex_);
    pending_.erase(snapshot.id);
    retired_.push_back(snapshot);
  }
  emit(snapshot, true);
}

// -----------------------------------------------------------------------------
// flush()
// -----------------------------------------------------------------------------
std::size_t ExecutionJournal::flush() {
  std::map<domain::TargetId, TargetSnapshot> batch;
  {
    std::lock_guard lock(mutex_);
    batch.swap(pending_);
  }

  for (const auto& [id, snapshot] : batch) {
    emit(snapshot, false);
  }
  return batch.size();
}

std::vector<TargetSnapshot> ExecutionJournal::retired() const {
  std::lock_guard lock(mutex_);
  return retired_;
}

std::size_t ExecutionJournal::pendingCount() const {
  std::lock_guard lock(mutex_);
  return pending_.size();
}

void ExecutionJournal::emit(const TargetSnapshot& snapshot, bool retired) {
  TargetUpdateEvent event;
  event.snapshot = snapshot;
  event.retired = retired;
  event.timestamp = ms_to_timestamp(clock_.now_ms());
  {
    std::lock_guard lock(mutex_);
    event.sequence_id = ++sequence_;
  }
  bus_.publish(event);
}

}  // namespace arb
