#pragma once

#include "arb/execution/execution_target.hpp"
#include "arb/execution/target_types.hpp"

namespace arb {

// -----------------------------------------------------------------------------
// IExecutionListener: outbound notifications of the ExecutionManager
// -----------------------------------------------------------------------------
//
// @brief  Receives target lifecycle notifications.
//
// @details
//   onTargetUpdated  creation, first submission, every partial fill, every
//                    sweep. Receives a snapshot; the target stays owned by
//                    the registry.
//   onTargetRetired  exactly once per target, on its terminal status. The
//                    target has already left the registry and is handed over
//                    by value.
//
// An exception thrown by either callback is caught by the manager, logged and
// otherwise ignored. It never changes target state.
//
// Thread model:
//   Called on the execution loop thread.
// -----------------------------------------------------------------------------
class IExecutionListener {
 public:
  virtual ~IExecutionListener() = default;

  virtual void onTargetUpdated(const TargetSnapshot& snapshot) = 0;
  virtual void onTargetRetired(ExecutionTarget target) = 0;
};

}  // namespace arb
