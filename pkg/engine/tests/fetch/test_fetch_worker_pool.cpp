// Repository: Segweave
// Component: FetchWorkerPool Tests
// Purpose: Bounded concurrency, completion and cooperative cancellation.
// Copyright (c) 2025 Segweave

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>

#include "segweave/fetch/FetchWorkerPool.hpp"

namespace segweave::fetch::testing {
namespace {

using namespace std::chrono_literals;

// Spins until cancelled or the deadline passes.
static void WaitForCancel(const std::atomic<bool>& cancel) {
  const auto deadline = std::chrono::steady_clock::now() + 5s;
  while (!cancel.load() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(1ms);
  }
}

TEST(FetchWorkerPoolTest, RunsEveryJob) {
  FetchWorkerPool pool(4);
  std::atomic<int> done{0};
  for (int i = 0; i < 25; ++i) {
    pool.Submit([&done](const std::atomic<bool>&) { done.fetch_add(1); });
  }
  pool.WaitAll();

  EXPECT_EQ(done.load(), 25);
  EXPECT_FALSE(pool.HasPending());
  EXPECT_EQ(pool.ActiveCount(), 0);
  EXPECT_FALSE(pool.CancelRequested());
}

TEST(FetchWorkerPoolTest, NeverExceedsWorkerCount) {
  FetchWorkerPool pool(3);
  ASSERT_EQ(pool.worker_count(), 3);

  std::atomic<int> running{0};
  std::atomic<int> peak{0};
  for (int i = 0; i < 12; ++i) {
    pool.Submit([&](const std::atomic<bool>&) {
      int now = running.fetch_add(1) + 1;
      int prev = peak.load();
      while (now > prev && !peak.compare_exchange_weak(prev, now)) {
      }
      std::this_thread::sleep_for(5ms);
      running.fetch_sub(1);
    });
  }
  pool.WaitAll();

  EXPECT_LE(peak.load(), 3);
  EXPECT_GE(peak.load(), 1);
}

TEST(FetchWorkerPoolTest, NonPositiveWorkerCountStillRuns) {
  FetchWorkerPool pool(0);
  EXPECT_EQ(pool.worker_count(), 1);
  std::atomic<bool> ran{false};
  pool.Submit([&ran](const std::atomic<bool>&) { ran.store(true); });
  pool.WaitAll();
  EXPECT_TRUE(ran.load());
}

TEST(FetchWorkerPoolTest, CancelDropsQueuedJobsAndWaitsForRunning) {
  FetchWorkerPool pool(1);
  std::atomic<bool> started{false};
  std::atomic<bool> saw_cancel{false};
  std::atomic<int> later_jobs_run{0};

  pool.Submit([&](const std::atomic<bool>& cancel) {
    started.store(true);
    WaitForCancel(cancel);
    saw_cancel.store(cancel.load());
  });
  for (int i = 0; i < 10; ++i) {
    pool.Submit([&](const std::atomic<bool>&) { later_jobs_run.fetch_add(1); });
  }

  while (!started.load()) std::this_thread::sleep_for(1ms);
  pool.Cancel();

  // Cancel() returned, so the running job has finished.
  EXPECT_TRUE(saw_cancel.load());
  EXPECT_EQ(pool.ActiveCount(), 0);
  EXPECT_FALSE(pool.HasPending());
  EXPECT_EQ(later_jobs_run.load(), 0);
  EXPECT_TRUE(pool.CancelRequested());

  pool.Submit([&](const std::atomic<bool>&) { later_jobs_run.fetch_add(1); });
  EXPECT_FALSE(pool.HasPending());
  EXPECT_EQ(later_jobs_run.load(), 0);
}

TEST(FetchWorkerPoolTest, ExternalFlagCancelsWaitAll) {
  std::atomic<bool> external{false};
  FetchWorkerPool pool(2, &external);
  std::atomic<int> observed_cancel{0};

  for (int i = 0; i < 2; ++i) {
    pool.Submit([&](const std::atomic<bool>& cancel) {
      WaitForCancel(cancel);
      if (cancel.load()) observed_cancel.fetch_add(1);
    });
  }

  std::thread interrupter([&external] {
    std::this_thread::sleep_for(30ms);
    external.store(true);
  });

  const auto begin = std::chrono::steady_clock::now();
  pool.WaitAll();
  const auto elapsed = std::chrono::steady_clock::now() - begin;
  interrupter.join();

  EXPECT_TRUE(pool.CancelRequested());
  EXPECT_EQ(observed_cancel.load(), 2);
  EXPECT_LT(elapsed, 2s);
}

}  // namespace
}  // namespace segweave::fetch::testing
