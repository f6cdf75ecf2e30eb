#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace taskorch::util {

/*
  Thread-safe blocking queue.

  capacity 0 means unbounded. After Shutdown() producers are refused and
  consumers drain what is left, then receive nullopt.
*/
template <typename T>
class BlockingQueue {
 public:
  explicit BlockingQueue(std::size_t capacity = 0) : capacity_(capacity) {
  }

  // false when full or shut down
  bool TryPush(T item) {
    {
      std::lock_guard lock(mutex_);
      if (shutdown_ || (capacity_ != 0 && queue_.size() >= capacity_)) {
        return false;
      }
      queue_.push_back(std::move(item));
    }
    cv_.notify_one();
    return true;
  }

  // blocking wait
  std::optional<T> Pop() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });
    return TakeLocked();
  }

  std::optional<T> PopFor(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, timeout, [&] { return shutdown_ || !queue_.empty(); });
    return TakeLocked();
  }

  void Shutdown() {
    {
      std::lock_guard lock(mutex_);
      shutdown_ = true;
    }
    cv_.notify_all();
  }

  bool IsShutdown() const {
    std::lock_guard lock(mutex_);
    return shutdown_;
  }

  std::size_t Size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

 private:
  std::optional<T> TakeLocked() {
    if (queue_.empty()) return std::nullopt;
    T item = std::move(queue_.front());
    queue_.pop_front();
    return item;
  }

  const std::size_t       capacity_;
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::deque<T>           queue_;
  bool                    shutdown_ = false;
};

} // namespace taskorch::util
