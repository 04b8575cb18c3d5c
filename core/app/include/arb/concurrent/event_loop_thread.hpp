#pragma once

#include "arb/concurrent/thread_safe_queue.hpp"
#include "arb/eventbus/event_bus.hpp"
#include "arb/events/event.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <string>
#include <thread>

namespace arb {

// -----------------------------------------------------------------------------
// EventLoopThread
// -----------------------------------------------------------------------------
//
// @brief  One worker thread that drains a ThreadSafeQueue<Event> and
//         publishes each event on its own EventBus.
//
// @details
// This is the engine's single-writer mechanism. Everything that mutates the
// target registry (market data ticks, broker order events, new target
// requests) is pushed into the execution loop's queue from whatever thread
// produced it. The loop pops one event at a time and publishes it, so every
// subscriber callback on the bus runs on the loop thread and never
// concurrently with another callback of the same loop.
//
// The engine runs two loops:
//   execution loop      → MarketDataCache, ExecutionManager, ExecutionJournal
//   order routing loop  → PaperBroker (see OrderRoutingThread)
//
// Idle behavior:
//   When the queue is empty the worker waits on stop_cv_ for at most
//   kIdleWaitTimeout, then polls again. stop() notifies the cv so shutdown
//   does not wait out the full timeout.
//
// Thread model:
//   start()/stop() from the owning thread. push() from any thread. Bus
//   callbacks only on the worker thread.
//
// Ownership:
//   Value member of ArbitrageEngine / OrderRoutingThread. Owns the queue,
//   the bus and the std::thread. Components subscribed to the bus must be
//   destroyed before the loop.
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  // `name` only appears in log lines.
  explicit EventLoopThread(std::string name = "event_loop");

  // Stops and joins the worker if it is still running.
  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  // Spawns the worker. No-op if already running.
  void start();

  // Requests the worker to exit and joins it. Events still queued are
  // dropped. No-op if not running.
  void stop();

  void push(Event event) { queue_.push(std::move(event)); }

  // Events waiting to be dispatched. Used by tests to wait for a drained loop.
  std::size_t pending() const { return queue_.size(); }

  bool isRunning() const { return running_.load(); }

  EventBus& eventBus() { return bus_; }
  const EventBus& eventBus() const { return bus_; }

 private:
  void run();

  std::string name_;
  ThreadSafeQueue<Event> queue_;
  EventBus bus_;

  std::atomic<bool> running_{false};
  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;
  std::thread thread_;
};

}  // namespace arb
