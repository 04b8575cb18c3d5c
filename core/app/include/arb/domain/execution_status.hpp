#pragma once

namespace arb {
namespace domain {

// -----------------------------------------------------------------------------
// ExecutionStatus
// -----------------------------------------------------------------------------
// Lifecycle of an ExecutionTarget and derived status of an OrderGroup.
//
//   New → Submitted → PartiallyFilled → Filled
//   Canceled, Invalid, Failed reachable from any non-terminal state.
//
// OrderGroup never reports New, Canceled or Invalid: its status is derived
// from its legs and collapses every leg failure into Failed.
// -----------------------------------------------------------------------------
enum class ExecutionStatus {
  New,
  Submitted,
  PartiallyFilled,
  Filled,
  Canceled,
  Invalid,
  Failed,
};

inline bool isTerminal(ExecutionStatus status) {
  return status == ExecutionStatus::Filled ||
         status == ExecutionStatus::Canceled ||
         status == ExecutionStatus::Invalid ||
         status == ExecutionStatus::Failed;
}

inline const char* toString(ExecutionStatus status) {
  switch (status) {
    case ExecutionStatus::New:             return "New";
    case ExecutionStatus::Submitted:       return "Submitted";
    case ExecutionStatus::PartiallyFilled: return "PartiallyFilled";
    case ExecutionStatus::Filled:          return "Filled";
    case ExecutionStatus::Canceled:        return "Canceled";
    case ExecutionStatus::Invalid:         return "Invalid";
    case ExecutionStatus::Failed:          return "Failed";
  }
  return "Unknown";
}

}  // namespace domain
}  // namespace arb
