#include "gtest/gtest.h"

#include <atomic>
#include <mutex>
#include <set>
#include <thread>

#include "common/task_pool.hpp"

using skyshot::TaskPool;

TEST(TaskPoolTest, RunsEveryQueuedTaskBeforeShutdownReturns) {
  std::atomic<int> counter{0};
  {
    TaskPool pool(3);
    EXPECT_EQ(pool.worker_count(), 3u);
    for (int i = 0; i < 64; ++i) {
      EXPECT_TRUE(pool.submit([&counter](std::stop_token) { counter.fetch_add(1); }));
    }
    pool.shutdown();
  }
  EXPECT_EQ(counter.load(), 64);
}

TEST(TaskPoolTest, DrainedTasksSeeNoStopRequest) {
  std::atomic<int> ran{0};
  std::atomic<int> stopped{0};
  {
    TaskPool pool(4);
    for (int i = 0; i < 256; ++i) {
      pool.submit([&](std::stop_token stop) {
        if (stop.stop_requested()) {
          stopped.fetch_add(1);
        }
        ran.fetch_add(1);
      });
    }
    pool.shutdown();
  }
  EXPECT_EQ(ran.load(), 256);
  EXPECT_EQ(stopped.load(), 0);
}

TEST(TaskPoolTest, SubmitAfterShutdownIsRejected) {
  TaskPool pool(1);
  pool.shutdown();
  EXPECT_FALSE(pool.submit([](std::stop_token) {}));
  pool.shutdown();
  EXPECT_EQ(pool.worker_count(), 0u);
}

TEST(TaskPoolTest, ZeroWorkersPicksAtLeastOne) {
  TaskPool pool;
  pool.start(0);
  EXPECT_GE(pool.worker_count(), 1u);
}

TEST(TaskPoolTest, TasksSpreadAcrossWorkers) {
  std::mutex mutex;
  std::set<std::thread::id> seen;
  std::atomic<int> done{0};
  TaskPool pool(2);
  for (int i = 0; i < 8; ++i) {
    pool.submit([&](std::stop_token) {
      {
        std::scoped_lock lock(mutex);
        seen.insert(std::this_thread::get_id());
      }
      done.fetch_add(1);
    });
  }
  pool.shutdown();
  EXPECT_EQ(done.load(), 8);
  EXPECT_GE(seen.size(), 1u);
  EXPECT_LE(seen.size(), 2u);
}

int main(int argc, char** argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
