#include "arb/time/live_time_provider.hpp"
#include "arb/time/time_utils.hpp"

#include <chrono>

namespace arb {

// -----------------------------------------------------------------------------
// now_ms(): system_clock truncated to milliseconds
// -----------------------------------------------------------------------------
std::int64_t LiveTimeProvider::now_ms() const {
  return timestamp_to_ms(std::chrono::system_clock::now());
}

}  // namespace arb
