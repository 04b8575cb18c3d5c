// =============================================================================
// thread_safe_queue_test.cpp
// =============================================================================
// Unit tests for arb::ThreadSafeQueue<T>.
//
// Validates:
//   - FIFO order and size() bookkeeping
//   - try_pop() on empty and non-empty queues
//   - Blocking pop() waits for a producer
//   - Move-only payloads
//   - Event variants keep their alternative through the queue
//   - Per-producer order under concurrent producers
//
// Threading model:
//   Threaded tests join every thread before asserting.
// =============================================================================

#include "arb/concurrent/thread_safe_queue.hpp"
#include "arb/events/event.hpp"
#include "arb/events/event_types.hpp"
#include "arb/events/order_events.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

class ThreadSafeQueueTest : public ::testing::Test {
 protected:
  arb::ThreadSafeQueue<int> queue;
};

// -----------------------------------------------------------------------------
// 1. Items come back in push order and size() tracks them.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, FifoOrderAndSize) {
  EXPECT_TRUE(queue.empty());

  for (int i = 1; i <= 5; ++i) {
    queue.push(i);
  }
  EXPECT_EQ(queue.size(), 5u);

  for (int i = 1; i <= 5; ++i) {
    EXPECT_EQ(queue.pop(), i);
  }
  EXPECT_TRUE(queue.empty());
  EXPECT_EQ(queue.size(), 0u);
}

// -----------------------------------------------------------------------------
// 2. try_pop() never blocks: nullopt when empty, the front item otherwise.
// Why: EventLoopThread polls with try_pop() so stop() is always observed.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, TryPopEmptyAndNonEmpty) {
  EXPECT_FALSE(queue.try_pop().has_value());

  queue.push(7);
  queue.push(8);

  std::optional<int> first = queue.try_pop();
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(*first, 7);
  EXPECT_EQ(queue.size(), 1u);
}

// -----------------------------------------------------------------------------
// 3. pop() blocks until another thread pushes.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, BlockingPopWaitsForPush) {
  std::atomic<bool> popped{false};
  int value = 0;

  std::thread consumer([&] {
    value = queue.pop();
    popped.store(true);
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_FALSE(popped.load());

  queue.push(99);
  consumer.join();

  EXPECT_TRUE(popped.load());
  EXPECT_EQ(value, 99);
}

// -----------------------------------------------------------------------------
// 4. Move-only payloads pass through without copies.
// -----------------------------------------------------------------------------
TEST(ThreadSafeQueueMoveOnly, UniquePtrPayload) {
  arb::ThreadSafeQueue<std::unique_ptr<int>> queue;
  queue.push(std::make_unique<int>(5));

  auto item = queue.try_pop();
  ASSERT_TRUE(item.has_value());
  ASSERT_NE(*item, nullptr);
  EXPECT_EQ(**item, 5);
}

// -----------------------------------------------------------------------------
// 5. Event variants keep their alternative and payload through the queue.
// Why: The execution loop's queue carries ticks and broker reports mixed.
// -----------------------------------------------------------------------------
TEST(ThreadSafeQueueEvents, VariantAlternativeSurvives) {
  arb::ThreadSafeQueue<arb::Event> queue;

  arb::MarketDataEvent md;
  md.symbol = "AAPLx";
  md.bid = 189.9;
  md.ask = 190.1;
  queue.push(md);

  arb::LegOrderEvent report;
  report.order_id = 12;
  report.symbol = "AAPL";
  report.status = arb::domain::LegOrderStatus::Filled;
  report.fill_quantity = -3.0;
  report.tag = "arb-target:4";
  queue.push(report);

  auto first = queue.try_pop();
  ASSERT_TRUE(first.has_value());
  const auto* tick = std::get_if<arb::MarketDataEvent>(&*first);
  ASSERT_NE(tick, nullptr);
  EXPECT_EQ(tick->symbol, "AAPLx");
  EXPECT_DOUBLE_EQ(tick->ask, 190.1);

  auto second = queue.try_pop();
  ASSERT_TRUE(second.has_value());
  const auto* leg = std::get_if<arb::LegOrderEvent>(&*second);
  ASSERT_NE(leg, nullptr);
  EXPECT_EQ(leg->order_id, 12u);
  EXPECT_DOUBLE_EQ(leg->fill_quantity, -3.0);
  EXPECT_EQ(leg->tag, "arb-target:4");
}

// -----------------------------------------------------------------------------
// 6. Four producers, one consumer: nothing lost, nothing duplicated, and
//    each producer's items are consumed in the order it pushed them.
// -----------------------------------------------------------------------------
TEST(ThreadSafeQueueConcurrency, PerProducerOrderPreserved) {
  constexpr int kProducers = 4;
  constexpr int kItemsPerProducer = 2000;

  // Encoded as producer * kItemsPerProducer + index.
  arb::ThreadSafeQueue<int> queue;
  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([&queue, p] {
      for (int i = 0; i < kItemsPerProducer; ++i) {
        queue.push(p * kItemsPerProducer + i);
      }
    });
  }

  std::map<int, std::vector<int>> seen;
  std::thread consumer([&] {
    for (int n = 0; n < kProducers * kItemsPerProducer; ++n) {
      const int item = queue.pop();
      seen[item / kItemsPerProducer].push_back(item % kItemsPerProducer);
    }
  });

  for (auto& t : producers) {
    t.join();
  }
  consumer.join();

  ASSERT_EQ(seen.size(), static_cast<std::size_t>(kProducers));
  for (const auto& [producer, items] : seen) {
    ASSERT_EQ(items.size(), static_cast<std::size_t>(kItemsPerProducer))
        << "producer " << producer;
    for (int i = 0; i < kItemsPerProducer; ++i) {
      EXPECT_EQ(items[i], i) << "producer " << producer;
    }
  }
  EXPECT_TRUE(queue.empty());
}
