#include <atomic>
#include <chrono>
#include <stdexcept>

#include <gtest/gtest.h>
#include <gradebox/worker_pool.h>

TEST(WorkerPool, ReturnsValues) {
  WorkerPool pool(3);
  EXPECT_EQ(pool.Size(), 3u);
  std::vector<std::future<int>> futures;
  for (int i = 0; i < 20; i++) futures.push_back(pool.Submit([i]() { return i * i; }));
  for (int i = 0; i < 20; i++) EXPECT_EQ(futures[i].get(), i * i);
}

TEST(WorkerPool, PropagatesExceptions) {
  WorkerPool pool(1);
  auto fut = pool.Submit([]() -> int { throw std::logic_error("boom"); });
  EXPECT_THROW(fut.get(), std::logic_error);
  // the worker survives
  EXPECT_EQ(pool.Submit([]() { return 7; }).get(), 7);
}

TEST(WorkerPool, RunsOnOtherThreads) {
  WorkerPool pool(2);
  auto id = pool.Submit([]() { return std::this_thread::get_id(); }).get();
  EXPECT_NE(id, std::this_thread::get_id());
}

TEST(WorkerPool, RunsConcurrently) {
  WorkerPool pool(4);
  std::atomic_int running = 0, max_running = 0;
  std::vector<std::future<void>> futures;
  for (int i = 0; i < 8; i++) {
    futures.push_back(pool.Submit([&]() {
      int now = ++running;
      int prev = max_running.load();
      while (now > prev && !max_running.compare_exchange_weak(prev, now));
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
      running--;
    }));
  }
  for (auto& i : futures) i.get();
  EXPECT_GT(max_running.load(), 1);
}

TEST(WorkerPool, DrainsQueueOnDestruction) {
  std::atomic_int done = 0;
  {
    WorkerPool pool(1);
    for (int i = 0; i < 5; i++) {
      pool.Submit([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        done++;
      });
    }
  }
  EXPECT_EQ(done.load(), 5);
}
