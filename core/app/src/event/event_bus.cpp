#include "arb/eventbus/event_bus.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <variant>

namespace arb {

namespace {

// Alternative names in Event's declaration order, for log lines only.
const char* eventName(const Event& event) {
  static constexpr const char* kNames[] = {
      "MarketDataEvent",   "TargetRequestEvent", "OrderRequestEvent",
      "CancelRequestEvent", "LegOrderEvent",     "TargetUpdateEvent",
      "HeartbeatEvent"};
  static_assert(sizeof(kNames) / sizeof(kNames[0]) ==
                    std::variant_size_v<Event>,
                "eventName() must list every Event alternative");
  return kNames[event.index()];
}

}  // namespace

// -----------------------------------------------------------------------------
// subscribe(GenericCallback)
// -----------------------------------------------------------------------------
EventBus::SubscriptionId EventBus::subscribe(GenericCallback callback) {
  std::lock_guard lock(mutex_);

  // Ids are never reused, so a stale id held by a stopped component can only
  // miss in unsubscribe(), never remove someone else's subscription.
  const SubscriptionId id = next_id_++;
  subscribers_.emplace_back(id, std::move(callback));
  return id;
}

// -----------------------------------------------------------------------------
// unsubscribe(id)
// -----------------------------------------------------------------------------
void EventBus::unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  subscribers_.erase(
      std::remove_if(subscribers_.begin(), subscribers_.end(),
                     [id](const SubscriberEntry& e) { return e.first == id; }),
      subscribers_.end());
}

// -----------------------------------------------------------------------------
// publish(event): snapshot subscribers, then call them unlocked
// -----------------------------------------------------------------------------
void EventBus::publish(const Event& event) {
  std::vector<SubscriberEntry> snapshot;
  {
    // Only the copy is taken under the lock. A subscriber added while the
    // callbacks run sees the next event, not this one.
    std::lock_guard lock(mutex_);
    snapshot = subscribers_;
  }

  for (const auto& [id, callback] : snapshot) {
    // The caller is a loop worker thread: an exception escaping here would
    // end the loop, so each subscriber failure is contained and counted.
    try {
      callback(event);
    } catch (const std::exception& e) {
      failed_deliveries_.fetch_add(1, std::memory_order_relaxed);
      std::cerr << "[EventBus] CRITICAL: subscriber " << id << " threw on "
                << eventName(event) << ": " << e.what()
                << ". Continuing with the remaining subscribers.\n";
    }
  }
}

std::size_t EventBus::subscriberCount() const {
  std::lock_guard lock(mutex_);
  return subscribers_.size();
}

}  // namespace arb
