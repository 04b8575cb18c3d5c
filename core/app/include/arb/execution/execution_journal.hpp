#pragma once

#include "arb/eventbus/event_bus.hpp"
#include "arb/execution/execution_target.hpp"
#include "arb/execution/i_execution_listener.hpp"
#include "arb/execution/target_types.hpp"
#include "arb/time/i_time_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace arb {

// Realtime: every update is published as it happens. Batch: updates are
// coalesced per target and published by flush(); retirements are always
// published immediately.
enum class NotifyMode {
  Realtime,
  Batch,
};

const char* toString(NotifyMode mode);

// "realtime" / "batch".
std::optional<NotifyMode> parseNotifyMode(std::string_view text);

// -----------------------------------------------------------------------------
// ExecutionJournal: the engine's IExecutionListener
// -----------------------------------------------------------------------------
//
// @brief  Records retired targets and turns target notifications into
//         TargetUpdateEvents on the execution bus.
//
// @details
// The IPC server subscribes to TargetUpdateEvent and streams each one as
// JSON. In Batch mode intermediate snapshots are kept per target (latest
// wins) until flush(); the engine flushes on every HeartbeatEvent. A target
// that retires before a flush drops its pending snapshot, the retirement
// event supersedes it.
//
// Thread model:
//   Callbacks and flush() run on the execution loop. retired() and
//   pendingCount() may be called from any thread.
//
// Ownership:
//   Owned by ArbitrageEngine. Holds references to the execution bus and the
//   engine clock.
// -----------------------------------------------------------------------------
class ExecutionJournal final : public IExecutionListener {
 public:
  ExecutionJournal(EventBus& bus, const ITimeProvider& clock, NotifyMode mode);

  ExecutionJournal(const ExecutionJournal&) = delete;
  ExecutionJournal& operator=(const ExecutionJournal&) = delete;
  ExecutionJournal(ExecutionJournal&&) = delete;
  ExecutionJournal& operator=(ExecutionJournal&&) = delete;

  void onTargetUpdated(const TargetSnapshot& snapshot) override;
  void onTargetRetired(ExecutionTarget target) override;

  // Publishes and clears the pending snapshots. Returns how many were
  // published. A no-op in Realtime mode.
  std::size_t flush();

  // Final snapshots of every retired target, in retirement order.
  std::vector<TargetSnapshot> retired() const;

  std::size_t pendingCount() const;
  NotifyMode mode() const { return mode_; }

 private:
  void emit(const TargetSnapshot& snapshot, bool retired);

  EventBus& bus_;
  const ITimeProvider& clock_;
  NotifyMode mode_;

  mutable std::mutex mutex_;
  std::map<domain::TargetId, TargetSnapshot> pending_;
  std::vector<TargetSnapshot> retired_;
  std::uint64_t sequence_{0};
};

}  // namespace arb
