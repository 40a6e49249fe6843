#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <limits>
#include <mutex>
#include <optional>

namespace tradeflow {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>
// -----------------------------------------------------------------------------
// Responsibility: A closable FIFO channel shared by many producers and one (or
// more) consumers. Used for the engine feed, the per-exchange dispatch queues
// and the audit channel.
//
// Capacity: a queue constructed with a capacity is bounded. push() blocks
// while the queue is full; force_push() ignores the bound (used by execution
// responses so a full feed can never deadlock against a full dispatch queue).
// A default-constructed queue is unbounded.
//
// Closing: close() wakes every waiter. After close(), push() returns false and
// pop() drains the remaining items, then returns std::nullopt.
// close_and_clear() drops the remaining items instead.
//
// Thread model: all methods are thread-safe. pop()/push() may block the
// calling thread; no user code runs while the internal mutex is held.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  ThreadSafeQueue() = default;
  explicit ThreadSafeQueue(std::size_t capacity)
      : capacity_(capacity == 0 ? 1 : capacity) {}

  // Non-copyable, non-movable: owns a mutex and condition variables. Share the
  // queue by reference or through a shared_ptr.
  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  // -------------------------------------------------------------------------
  // push(value)
  // -------------------------------------------------------------------------
  // @brief  Appends value, waiting for space if the queue is bounded and full.
  // @return false if the queue was closed (value is dropped).
  // -------------------------------------------------------------------------
  bool push(T value) {
    {
      std::unique_lock lock(mutex_);
      not_full_.wait(lock,
                     [this] { return closed_ || queue_.size() < capacity_; });
      if (closed_) {
        return false;
      }
      queue_.push_back(std::move(value));
    }
    not_empty_.notify_one();
    return true;
  }

  // Appends value regardless of capacity. Returns false if closed.
  bool force_push(T value) {
    {
      std::lock_guard lock(mutex_);
      if (closed_) {
        return false;
      }
      queue_.push_back(std::move(value));
    }
    not_empty_.notify_one();
    return true;
  }

  // -------------------------------------------------------------------------
  // pop(): blocking
  // -------------------------------------------------------------------------
  // @brief  Removes and returns the front item, waiting until one is
  //         available.
  // @return std::nullopt once the queue is closed and drained.
  // -------------------------------------------------------------------------
  std::optional<T> pop() {
    std::unique_lock lock(mutex_);
    not_empty_.wait(lock, [this] { return closed_ || !queue_.empty(); });
    return take_front(lock);
  }

  // Like pop(), but gives up after timeout. A timeout and a closed, drained
  // queue both return std::nullopt; use closed() to tell them apart.
  template <typename Rep, typename Period>
  std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock lock(mutex_);
    not_empty_.wait_for(lock, timeout,
                        [this] { return closed_ || !queue_.empty(); });
    return take_front(lock);
  }

  std::optional<T> try_pop() {
    std::unique_lock lock(mutex_);
    return take_front(lock);
  }

  void close() {
    {
      std::lock_guard lock(mutex_);
      closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  // Closes the queue and discards everything still in it. Returns the
  // number of items dropped.
  std::size_t close_and_clear() {
    std::size_t dropped = 0;
    {
      std::lock_guard lock(mutex_);
      closed_ = true;
      dropped = queue_.size();
      queue_.clear();
    }
    not_empty_.notify_all();
    not_full_.notify_all();
    return dropped;
  }

  bool closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
  }

  bool empty() const {
    std::lock_guard lock(mutex_);
    return queue_.empty();
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

  std::size_t capacity() const { return capacity_; }

 private:
  std::optional<T> take_front(std::unique_lock<std::mutex>& lock) {
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    lock.unlock();
    not_full_.notify_one();
    return value;
  }

  const std::size_t capacity_{std::numeric_limits<std::size_t>::max()};

  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<T> queue_;
  bool closed_{false};
};

}  // namespace tradeflow
