#include "arb/concurrent/event_loop_thread.hpp"

#include <chrono>
#include <iostream>
#include <utility>

namespace arb {

namespace {

// Upper bound on how long an idle worker sleeps before polling the queue
// again.
constexpr auto kIdleWaitTimeout = std::chrono::milliseconds(10);

}  // namespace

EventLoopThread::EventLoopThread(std::string name) : name_(std::move(name)) {}

EventLoopThread::~EventLoopThread() { stop(); }

// -----------------------------------------------------------------------------
// start(): spawn the worker
// -----------------------------------------------------------------------------
void EventLoopThread::start() {
  if (thread_.joinable()) {
    return;
  }

  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

// -----------------------------------------------------------------------------
// stop(): clear the flag, wake the worker, join
// -----------------------------------------------------------------------------
void EventLoopThread::stop() {
  if (!thread_.joinable()) {
    return;
  }

  running_.store(false);
  stop_cv_.notify_all();
  thread_.join();

  if (!queue_.empty()) {
    std::cerr << "[EventLoopThread:" << name_ << "] WARNING: stopped with "
              << queue_.size() << " undispatched event(s).\n";
  }
}

// -----------------------------------------------------------------------------
// run(): pop → publish, or idle-wait when the queue is empty
// -----------------------------------------------------------------------------
void EventLoopThread::run() {
  while (running_.load()) {
    if (std::optional<Event> event = queue_.try_pop()) {
      bus_.publish(*event);
      continue;
    }

    std::unique_lock lock(stop_mutex_);
    stop_cv_.wait_for(lock, kIdleWaitTimeout,
                      [this] { return !running_.load(); });
  }
}

}  // namespace arb
