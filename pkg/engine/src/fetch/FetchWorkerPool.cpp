// Repository: Segweave
// Component: FetchWorkerPool Implementation
// Copyright (c) 2025 Segweave

#include "segweave/fetch/FetchWorkerPool.hpp"

#include <chrono>
#include <sstream>

#include "segweave/util/Logger.hpp"

namespace segweave::fetch {

using segweave::util::Logger;

namespace {
constexpr auto kExternalCancelPoll = std::chrono::milliseconds(50);
}  // namespace

FetchWorkerPool::FetchWorkerPool(int worker_count,
                                 const std::atomic<bool>* external_cancel)
    : external_cancel_(external_cancel) {
  if (worker_count < 1) worker_count = 1;
  workers_.reserve(static_cast<size_t>(worker_count));
  for (int i = 0; i < worker_count; ++i) {
    workers_.emplace_back(&FetchWorkerPool::WorkerLoop, this);
  }
}

FetchWorkerPool::~FetchWorkerPool() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shutdown_ = true;
    queue_.clear();
  }
  cancel_requested_.store(true, std::memory_order_release);
  work_cv_.notify_all();
  for (auto& t : workers_) {
    if (t.joinable()) t.join();
  }
}

bool FetchWorkerPool::ExternalCancelled() const {
  return external_cancel_ && external_cancel_->load(std::memory_order_acquire);
}

void FetchWorkerPool::Submit(Job job) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_ || cancel_requested_.load(std::memory_order_acquire)) return;
    queue_.push_back(std::move(job));
  }
  work_cv_.notify_one();
}

void FetchWorkerPool::WaitAll() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (!queue_.empty() || active_ > 0) {
    idle_cv_.wait_for(lock, kExternalCancelPoll);
    if (ExternalCancelled() && !cancel_requested_.load(std::memory_order_acquire)) {
      lock.unlock();
      Logger::Info("[FetchWorkerPool] EXTERNAL_CANCEL observed, cancelling fetches");
      Cancel();
      return;
    }
  }
}

void FetchWorkerPool::Cancel() {
  size_t dropped = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cancel_requested_.store(true, std::memory_order_release);
    dropped = queue_.size();
    queue_.clear();
  }
  work_cv_.notify_all();

  std::unique_lock<std::mutex> lock(mutex_);
  idle_cv_.wait(lock, [this] { return active_ == 0; });

  std::ostringstream oss;
  oss << "[FetchWorkerPool] CANCELLED dropped_jobs=" << dropped;
  Logger::Debug(oss.str());
}

bool FetchWorkerPool::HasPending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return !queue_.empty();
}

int FetchWorkerPool::ActiveCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_;
}

// =============================================================================
// WorkerLoop: persistent thread, waits for jobs
// =============================================================================

void FetchWorkerPool::WorkerLoop() {
  while (true) {
    Job job;

    {
      std::unique_lock<std::mutex> lock(mutex_);
      work_cv_.wait(lock, [this] { return shutdown_ || !queue_.empty(); });

      if (shutdown_) return;

      job = std::move(queue_.front());
      queue_.pop_front();
      ++active_;
    }

    if (!cancel_requested_.load(std::memory_order_acquire)) {
      job(cancel_requested_);
    }

    {
      std::lock_guard<std::mutex> lock(mutex_);
      --active_;
    }
    // Wake WaitAll() / Cancel().
    idle_cv_.notify_all();
  }
}

}  // namespace segweave::fetch
