// Repository: Segweave
// Component: FetchWorkerPool
// Purpose: Bounded pool of worker threads for segment fetches with prompt,
//          cooperative cancellation.
// Copyright (c) 2025 Segweave

#ifndef SEGWEAVE_FETCH_FETCH_WORKER_POOL_HPP_
#define SEGWEAVE_FETCH_FETCH_WORKER_POOL_HPP_

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace segweave::fetch {

// FetchWorkerPool: fixed set of persistent worker threads.
//
// Jobs run in submission order (FIFO pickup) but complete in any order;
// callers that need a deterministic order must sort the results themselves.
// Each job receives the pool's cancel flag and is expected to poll it.
//
// Cancellation sources:
//   - Cancel() from any thread;
//   - the external flag passed at construction (e.g. SIGINT), observed by
//     WaitAll(), which then performs Cancel().
// Cancel() drops queued jobs and blocks until in-flight jobs have returned.
class FetchWorkerPool {
 public:
  using Job = std::function<void(const std::atomic<bool>& cancel)>;

  static constexpr int kDefaultWorkers = 4;

  explicit FetchWorkerPool(int worker_count = kDefaultWorkers,
                           const std::atomic<bool>* external_cancel = nullptr);
  ~FetchWorkerPool();

  FetchWorkerPool(const FetchWorkerPool&) = delete;
  FetchWorkerPool& operator=(const FetchWorkerPool&) = delete;

  // Enqueue a job; wakes an idle worker. Ignored after cancellation.
  void Submit(Job job);

  // Block until the queue is empty and no job is running.
  void WaitAll();

  // Drop queued jobs, signal in-flight jobs, wait for them to return.
  void Cancel();

  bool CancelRequested() const {
    return cancel_requested_.load(std::memory_order_acquire);
  }

  bool HasPending() const;
  int ActiveCount() const;
  int worker_count() const { return static_cast<int>(workers_.size()); }

 private:
  void WorkerLoop();
  bool ExternalCancelled() const;

  mutable std::mutex mutex_;
  std::condition_variable work_cv_;
  std::condition_variable idle_cv_;

  std::deque<Job> queue_;           // Guarded by mutex_
  int active_ = 0;                  // Guarded by mutex_
  bool shutdown_ = false;           // Guarded by mutex_

  std::vector<std::thread> workers_;
  std::atomic<bool> cancel_requested_{false};
  const std::atomic<bool>* external_cancel_;
};

}  // namespace segweave::fetch

#endif  // SEGWEAVE_FETCH_FETCH_WORKER_POOL_HPP_
