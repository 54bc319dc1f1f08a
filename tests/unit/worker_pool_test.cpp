#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>
#include "engine/common/worker_pool.hpp"

using namespace mdstream::engine::common;

TEST(WorkerPoolTest, RunsSubmittedTasks) {
  WorkerPool pool("test", 2);
  pool.Start();

  std::atomic<int> count{0};
  for (int i = 0; i < 100; ++i) {
    ASSERT_TRUE(pool.Submit([&count]() { count++; }));
  }
  ASSERT_TRUE(pool.WaitIdle(std::chrono::milliseconds(2000)));
  EXPECT_EQ(count.load(), 100);
  pool.Stop();
}

TEST(WorkerPoolTest, SubmitBeforeStartIsRejected) {
  WorkerPool pool("test", 1);
  EXPECT_FALSE(pool.Submit([]() {}));
  EXPECT_FALSE(pool.IsRunning());
}

TEST(WorkerPoolTest, BoundedQueueRejectsOverflow) {
  WorkerPool pool("bounded", 1, 2);
  pool.Start();

  std::mutex mutex;
  std::condition_variable cv;
  bool release = false;
  std::atomic<bool> blocker_started{false};

  ASSERT_TRUE(pool.Submit([&]() {
    blocker_started = true;
    std::unique_lock<std::mutex> lock(mutex);
    cv.wait(lock, [&]() { return release; });
  }));
  // Wait until the worker holds the blocker so the queue is empty
  while (!blocker_started.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }

  EXPECT_TRUE(pool.Submit([]() {}));
  EXPECT_TRUE(pool.Submit([]() {}));
  EXPECT_FALSE(pool.Submit([]() {}));
  EXPECT_EQ(pool.GetQueueDepth(), 2u);

  {
    std::lock_guard<std::mutex> lock(mutex);
    release = true;
  }
  cv.notify_all();
  EXPECT_TRUE(pool.WaitIdle(std::chrono::milliseconds(2000)));
  pool.Stop();
}

TEST(WorkerPoolTest, StopWithoutDrainDropsPendingTasks) {
  WorkerPool pool("drop", 1);
  pool.Start();

  std::atomic<bool> blocker_started{false};
  std::atomic<int> ran{0};
  ASSERT_TRUE(pool.Submit([&]() {
    blocker_started = true;
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }));
  while (!blocker_started.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  for (int i = 0; i < 5; ++i) {
    ASSERT_TRUE(pool.Submit([&ran]() { ran++; }));
  }

  pool.Stop(false);
  EXPECT_EQ(ran.load(), 0);
  EXPECT_FALSE(pool.Submit([]() {}));
}

TEST(WorkerPoolTest, StopWithDrainRunsPendingTasks) {
  WorkerPool pool("drain", 1);
  pool.Start();

  std::atomic<bool> blocker_started{false};
  std::atomic<int> ran{0};
  ASSERT_TRUE(pool.Submit([&]() {
    blocker_started = true;
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }));
  while (!blocker_started.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  for (int i = 0; i < 5; ++i) {
    ASSERT_TRUE(pool.Submit([&ran]() { ran++; }));
  }

  pool.Stop(true);
  EXPECT_EQ(ran.load(), 5);
}

TEST(WorkerPoolTest, ThrowingTaskDoesNotKillWorker) {
  WorkerPool pool("throwing", 1);
  pool.Start();

  std::atomic<bool> ran{false};
  ASSERT_TRUE(pool.Submit([]() { throw std::runtime_error("task failed"); }));
  ASSERT_TRUE(pool.Submit([&ran]() { ran = true; }));
  ASSERT_TRUE(pool.WaitIdle(std::chrono::milliseconds(2000)));
  EXPECT_TRUE(ran.load());
  pool.Stop();
}

TEST(WorkerPoolTest, DefaultThreadCountIsClamped) {
  EXPECT_EQ(WorkerPool::DefaultThreadCount(1, 1), 1u);
  size_t count = WorkerPool::DefaultThreadCount(2, 16);
  EXPECT_GE(count, 2u);
  EXPECT_LE(count, 16u);
  // Inverted bounds collapse to the minimum
  EXPECT_EQ(WorkerPool::DefaultThreadCount(4, 1), 4u);
}

TEST(WorkerPoolTest, ZeroThreadsBecomesOne) {
  WorkerPool pool("tiny", 0);
  EXPECT_EQ(pool.GetThreadCount(), 1u);
}
