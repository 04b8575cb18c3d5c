#pragma once

namespace arb {
namespace domain {

// -----------------------------------------------------------------------------
// LegOrderStatus
// -----------------------------------------------------------------------------
// Broker-side lifecycle of a single leg order, as reported by order events.
// -----------------------------------------------------------------------------
enum class LegOrderStatus {
  New,              // Handle minted, no broker acknowledgment yet
  Submitted,        // Acknowledged by the broker, nothing filled
  PartiallyFilled,  // Some quantity filled, remainder still working
  Filled,           // Fully filled, terminal state
  Canceled,         // Canceled by request or by the venue, terminal state
  Invalid,          // Rejected / could not be placed, terminal state
};

inline bool isTerminal(LegOrderStatus status) {
  return status == LegOrderStatus::Filled ||
         status == LegOrderStatus::Canceled ||
         status == LegOrderStatus::Invalid;
}

// Canceled and Invalid both mean the leg will never fill further.
inline bool isFailure(LegOrderStatus status) {
  return status == LegOrderStatus::Canceled ||
         status == LegOrderStatus::Invalid;
}

inline const char* toString(LegOrderStatus status) {
  switch (status) {
    case LegOrderStatus::New:             return "New";
    case LegOrderStatus::Submitted:       return "Submitted";
    case LegOrderStatus::PartiallyFilled: return "PartiallyFilled";
    case LegOrderStatus::Filled:          return "Filled";
    case LegOrderStatus::Canceled:        return "Canceled";
    case LegOrderStatus::Invalid:         return "Invalid";
  }
  return "Unknown";
}

}  // namespace domain
}  // namespace arb
