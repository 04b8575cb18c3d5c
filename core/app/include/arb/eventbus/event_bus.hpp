#pragma once

#include "arb/events/event.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace arb {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: Synchronous publish/subscribe over the Event variant. Each
// EventLoopThread owns one; the engine wires cross-thread bridges by
// subscribing on one loop's bus and pushing into another loop's queue.
//
// Thread model: subscribe, unsubscribe and publish are safe from any thread.
// Callbacks run on the publishing thread before publish() returns. In the
// engine that is always the owning loop's worker thread.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  // Receives every event; use std::get_if / std::visit to pick types.
  using GenericCallback = std::function<void(const Event&)>;

  // Handle returned by subscribe(); pass it to unsubscribe().
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // -------------------------------------------------------------------------
  // subscribe(GenericCallback)
  // -------------------------------------------------------------------------
  // @brief  Registers a callback for every published event.
  // @return SubscriptionId for unsubscribe().
  // -------------------------------------------------------------------------
  SubscriptionId subscribe(GenericCallback callback);

  // -------------------------------------------------------------------------
  // subscribe<EventType>(callback)
  // -------------------------------------------------------------------------
  // @brief  Registers a callback that only fires when the published variant
  //         holds EventType (e.g. LegOrderEvent).
  // @return SubscriptionId for unsubscribe().
  // -------------------------------------------------------------------------
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // -------------------------------------------------------------------------
  // unsubscribe(id)
  // -------------------------------------------------------------------------
  // @brief  Removes a subscription. Unknown ids are ignored.
  //
  // @details
  // A publish() already in progress on another thread may still invoke the
  // callback once, because publish works on a copy of the subscriber list.
  // Components therefore unsubscribe only after their loop has stopped or
  // from the loop thread itself.
  // -------------------------------------------------------------------------
  void unsubscribe(SubscriptionId id);

  // -------------------------------------------------------------------------
  // publish(event)
  // -------------------------------------------------------------------------
  // @brief  Invokes every current subscriber with `event`.
  //
  // @details
  // The subscriber list is copied under the lock and the callbacks run with
  // the lock released, so a callback may publish (the ExecutionJournal
  // publishes TargetUpdateEvent from inside an order event callback) or
  // unsubscribe without deadlocking.
  //
  // A callback that throws std::exception is logged as CRITICAL and counted
  // in failedDeliveries(); the remaining subscribers still receive the event.
  // -------------------------------------------------------------------------
  void publish(const Event& event);

  std::size_t subscriberCount() const;

  // Callbacks that threw since construction.
  std::size_t failedDeliveries() const {
    return failed_deliveries_.load(std::memory_order_relaxed);
  }

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;       // Guards subscribers_ and next_id_
  SubscriptionId next_id_{0};
  std::vector<SubscriberEntry> subscribers_;
  std::atomic<std::size_t> failed_deliveries_{0};
};

// Typed subscribe: wrap the callback in a generic one that filters on the
// variant alternative with std::get_if.
template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  GenericCallback wrapped = [cb = std::move(callback)](const Event& event) {
    if (const auto* typed = std::get_if<EventType>(&event)) {
      cb(*typed);
    }
  };
  return subscribe(std::move(wrapped));
}

}  // namespace arb
