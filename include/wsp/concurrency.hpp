#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>

namespace wsp {

// Single-resolution slot: the first offer() wins, later offers are dropped.
// Used to race a handshake completion against its deadline.
template <typename T>
class SettleOnce {
public:
  bool offer(T value)
  {
    {
      std::lock_guard<std::mutex> lk(mtx_);
      if (value_) return false;
      value_.emplace(std::move(value));
    }
    cv_.notify_all();
    return true;
  }

  // true once settled; false when `deadline` passed first
  bool wait_until(std::chrono::steady_clock::time_point deadline)
  {
    std::unique_lock<std::mutex> lk(mtx_);
    return cv_.wait_until(lk, deadline, [&]{ return value_.has_value(); });
  }

  bool settled() const
  {
    std::lock_guard<std::mutex> lk(mtx_);
    return value_.has_value();
  }

  // Precondition: settled()
  T take()
  {
    std::lock_guard<std::mutex> lk(mtx_);
    return std::move(*value_);
  }

private:
  mutable std::mutex mtx_;
  std::condition_variable cv_;
  std::optional<T> value_;
};

// Simple fixed-size thread pool
class ThreadPool {
public:
  explicit ThreadPool(int threads);
  ~ThreadPool();

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  // Enqueue a task that can observe pool's cancellation flag.
  // Returns false (task discarded) once the pool has been cancelled.
  bool submit_cancelable(std::function<void(const std::atomic<bool>&)> task);

  // Wait until the queue is empty and all tasks complete
  void wait_idle();

  // Raise the cancellation flag for running tasks and drop queued ones.
  // Returns the number of queued tasks that will never run.
  std::size_t cancel();
  const std::atomic<bool>& cancel_flag() const;

  // Returns first captured exception (if any); nullptr if none
  std::exception_ptr first_exception() const;

private:
  struct Impl;
  Impl* impl_;
};

} // namespace wsp
