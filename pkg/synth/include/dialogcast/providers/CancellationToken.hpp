// Repository: DialogCast
// Component: CancellationToken
// Purpose: Run-wide cancel flag observed by retry loops, backoff waits and
//          in-flight downloads.
// Copyright (c) 2026 DialogCast

#ifndef DIALOGCAST_PROVIDERS_CANCELLATION_TOKEN_HPP_
#define DIALOGCAST_PROVIDERS_CANCELLATION_TOKEN_HPP_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace dialogcast::providers {

class CancellationToken {
 public:
  CancellationToken() = default;
  CancellationToken(const CancellationToken&) = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;

  // Idempotent. Wakes every thread blocked in WaitFor().
  void Cancel() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      cancelled_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
  }

  bool IsCancelled() const {
    return cancelled_.load(std::memory_order_acquire);
  }

  // Sleeps up to `duration`. Returns true if cancelled before it elapsed.
  bool WaitFor(std::chrono::milliseconds duration) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, duration, [this] {
      return cancelled_.load(std::memory_order_acquire);
    });
  }

 private:
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  std::atomic<bool> cancelled_{false};
};

}  // namespace dialogcast::providers

#endif  // DIALOGCAST_PROVIDERS_CANCELLATION_TOKEN_HPP_
