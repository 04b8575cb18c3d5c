#pragma once

#include "arb/time/i_time_provider.hpp"

namespace arb {

// -----------------------------------------------------------------------------
// LiveTimeProvider: system_clock in epoch milliseconds
// -----------------------------------------------------------------------------
// Used when EngineConfig selects clock "live". Stateless; safe from any
// thread.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace arb
