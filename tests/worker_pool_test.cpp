#include "taskwarden/core/worker_pool.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <vector>

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace taskwarden;
using namespace std::chrono_literals;

TEST(WorkerPoolTest, ZeroThreads_StillGetsOne) {
  WorkerPool pool(0);

  EXPECT_EQ(pool.size(), 1u);
}

TEST(WorkerPoolTest, Submit_ReturnsResultThroughFuture) {
  WorkerPool pool(2);

  auto future = pool.submit([] { return 6 * 7; });

  EXPECT_EQ(future.get(), 42);
}

TEST(WorkerPoolTest, Future_CanBePolledWithoutBlocking) {
  WorkerPool pool(1);
  std::atomic<bool> release{false};

  auto future = pool.submit([&] {
    while (!release.load()) {
      std::this_thread::sleep_for(1ms);
    }
    return true;
  });

  EXPECT_EQ(future.wait_for(0s), std::future_status::timeout);
  release.store(true);
  EXPECT_TRUE(future.get());
}

TEST(WorkerPoolTest, Exception_TravelsThroughFuture) {
  WorkerPool pool(1);

  auto future = pool.submit([]() -> int { throw std::runtime_error("boom"); });

  EXPECT_THROW(future.get(), std::runtime_error);
  // The worker survived.
  EXPECT_EQ(pool.submit([] { return 1; }).get(), 1);
}

TEST(WorkerPoolTest, RunsJobsInParallel) {
  WorkerPool pool(4);
  std::atomic<int> active{0};
  std::atomic<int> peak{0};

  std::vector<std::future<void>> futures;
  for (int i = 0; i < 4; ++i) {
    futures.push_back(pool.submit([&] {
      int now = active.fetch_add(1) + 1;
      int seen = peak.load();
      while (now > seen && !peak.compare_exchange_weak(seen, now)) {
      }
      std::this_thread::sleep_for(100ms);
      active.fetch_sub(1);
    }));
  }
  for (auto& f : futures) {
    f.get();
  }

  EXPECT_EQ(peak.load(), 4);
}

TEST(WorkerPoolTest, Shutdown_DrainsQueuedJobs) {
  std::atomic<int> ran{0};
  {
    WorkerPool pool(1);
    for (int i = 0; i < 20; ++i) {
      (void)pool.submit([&] { ran.fetch_add(1); });
    }
    pool.shutdown();
    pool.shutdown();
  }
  EXPECT_EQ(ran.load(), 20);
}
