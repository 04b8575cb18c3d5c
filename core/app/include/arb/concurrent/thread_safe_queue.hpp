#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace arb {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>
// -----------------------------------------------------------------------------
// Responsibility: Unbounded multi-producer / multi-consumer FIFO used at every
// thread boundary of the engine: market data thread → execution loop,
// execution loop → order routing loop, order routing loop → execution loop,
// execution loop → IPC telemetry.
//
// Ordering: items pop in push order. The execution loop relies on this to
// apply order events for one OrderGroup in the order the broker sent them.
//
// Thread model: every member is safe to call from any thread. A single
// mutex guards the deque; pop() blocks on a condition variable, try_pop()
// never blocks.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  ThreadSafeQueue() = default;

  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  // Appends value and wakes one blocked consumer. The lock is released
  // before notify so the woken thread does not immediately block on it.
  void push(T value) {
    {
      std::lock_guard lock(mutex_);
      items_.push_back(std::move(value));
    }
    not_empty_.notify_one();
  }

  // Blocks until an item is available, then removes and returns it.
  T pop() {
    std::unique_lock lock(mutex_);
    not_empty_.wait(lock, [this] { return !items_.empty(); });

    T value = std::move(items_.front());
    items_.pop_front();
    return value;
  }

  // Removes and returns the front item, or std::nullopt if the queue is
  // empty. Never blocks; used by EventLoopThread so it can re-check its stop
  // flag between items.
  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    if (items_.empty()) {
      return std::nullopt;
    }
    T value = std::move(items_.front());
    items_.pop_front();
    return value;
  }

  bool empty() const {
    std::lock_guard lock(mutex_);
    return items_.empty();
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return items_.size();
  }

 private:
  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  std::deque<T> items_;
};

}  // namespace arb
