#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

namespace mprisrelay::util {

/*
  Thread-safe blocking queue shared by the monitor, player workers and
  relay sessions.

  A capacity of zero means unbounded. TryEnqueue never blocks; it reports
  false when the queue is full or shut down so the producer can decide
  what to do with the overflow.
*/
template <typename T>
class BlockingQueue {
 public:
  explicit BlockingQueue(std::size_t capacity = 0) : capacity_(capacity) {
  }

  bool TryEnqueue(T item) {
    {
      std::lock_guard lock(mutex_);
      if (shutdown_) return false;
      if (capacity_ != 0 && queue_.size() >= capacity_) return false;
      queue_.push(std::move(item));
    }
    cv_.notify_one();
    return true;
  }

  // blocking wait
  std::optional<T> Dequeue() {
    std::unique_lock lock(mutex_);

    cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

    if (shutdown_ && queue_.empty()) return std::nullopt;

    T item = std::move(queue_.front());
    queue_.pop();
    return item;
  }

  // Returns nullopt on timeout as well as on shutdown; use IsShutdown()
  // to tell them apart.
  template <typename Rep, typename Period>
  std::optional<T> DequeueFor(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock lock(mutex_);

    if (!cv_.wait_for(lock, timeout, [&] { return shutdown_ || !queue_.empty(); })) {
      return std::nullopt;
    }
    if (queue_.empty()) return std::nullopt;

    T item = std::move(queue_.front());
    queue_.pop();
    return item;
  }

  // Pending items are still drained by Dequeue after shutdown.
  void Shutdown() {
    {
      std::lock_guard lock(mutex_);
      shutdown_ = true;
    }
    cv_.notify_all();
  }

  // Drops pending items and wakes all waiters.
  void Close() {
    {
      std::lock_guard lock(mutex_);
      shutdown_ = true;
      std::queue<T> empty;
      queue_.swap(empty);
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
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::queue<T>           queue_;
  std::size_t             capacity_;
  bool                    shutdown_ = false;
};

} // namespace mprisrelay::util
