#include "taskwarden/core/lockfree_queue.hpp"

#include <atomic>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "gtest/gtest.h"

using namespace taskwarden;

TEST(LockfreeQueueTest, CapacityRoundsUpToPowerOfTwo) {
  BoundedMPSCQueue<int> queue(100);

  EXPECT_EQ(queue.capacity(), 128u);
}

TEST(LockfreeQueueTest, PushPop_Fifo) {
  BoundedMPSCQueue<int> queue(16);
  EXPECT_TRUE(queue.empty());

  for (int i = 0; i < 10; ++i) {
    EXPECT_TRUE(queue.push(i));
  }
  EXPECT_FALSE(queue.empty());

  for (int i = 0; i < 10; ++i) {
    auto value = queue.try_pop();
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, i);
  }
  EXPECT_FALSE(queue.try_pop().has_value());
  EXPECT_TRUE(queue.empty());
}

TEST(LockfreeQueueTest, Full_RejectsPush) {
  BoundedMPSCQueue<int> queue(4);

  for (int i = 0; i < 4; ++i) {
    EXPECT_TRUE(queue.push(i));
  }
  EXPECT_FALSE(queue.push(99));

  ASSERT_EQ(queue.try_pop(), 0);
  EXPECT_TRUE(queue.push(4));
}

TEST(LockfreeQueueTest, MoveOnlyElements) {
  BoundedMPSCQueue<std::unique_ptr<std::string>> queue(8);

  EXPECT_TRUE(queue.push(std::make_unique<std::string>("hello")));
  auto value = queue.try_pop();

  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(**value, "hello");
}

TEST(LockfreeQueueTest, Destructor_ReleasesQueuedElements) {
  auto tracked = std::make_shared<int>(7);
  {
    BoundedMPSCQueue<std::shared_ptr<int>> queue(8);
    EXPECT_TRUE(queue.push(tracked));
    EXPECT_TRUE(queue.push(tracked));
    EXPECT_EQ(tracked.use_count(), 3);
  }
  EXPECT_EQ(tracked.use_count(), 1);
}

TEST(LockfreeQueueTest, ManyProducersOneConsumer) {
  constexpr int kProducers = 4;
  constexpr int kPerProducer = 10000;
  BoundedMPSCQueue<int> queue(1024);
  std::atomic<bool> done{false};
  std::vector<int> received;
  received.reserve(kProducers * kPerProducer);

  std::thread consumer([&] {
    while (!done.load(std::memory_order_acquire) || !queue.empty()) {
      if (auto v = queue.try_pop()) {
        received.push_back(*v);
      } else {
        std::this_thread::yield();
      }
    }
  });

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([&queue, p] {
      for (int i = 0; i < kPerProducer; ++i) {
        while (!queue.push(p * kPerProducer + i)) {
          std::this_thread::yield();
        }
      }
    });
  }
  for (auto& t : producers) {
    t.join();
  }
  done.store(true, std::memory_order_release);
  consumer.join();

  ASSERT_EQ(received.size(), static_cast<std::size_t>(kProducers * kPerProducer));
  std::set<int> unique(received.begin(), received.end());
  EXPECT_EQ(unique.size(), received.size());
}
