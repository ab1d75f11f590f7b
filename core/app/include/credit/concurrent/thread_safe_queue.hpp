#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace credit {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>
// -----------------------------------------------------------------------------
// Responsibility: Unbounded FIFO shared between producer and consumer
// threads, with a close() that releases every blocked consumer.
//
// Used by WorkerPool to hand Narrator calls from request threads to the
// pool's worker threads. Once closed, push() is rejected and pop() drains
// what is left, then returns std::nullopt so workers can exit their loop
// without polling.
//
// Thread model: Safe for multiple producers and multiple consumers. All
// methods lock the same mutex; pop() blocks until an item arrives or the
// queue is closed.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  ThreadSafeQueue() = default;

  // Non-copyable, non-movable: owns a mutex and a condition variable.
  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  // -------------------------------------------------------------------------
  // push(value)
  // -------------------------------------------------------------------------
  // What: Appends one item and wakes one waiting consumer.
  // Input: value, taken by value so callers can std::move into the queue.
  // Output: false if the queue is closed (value is dropped), true otherwise.
  // -------------------------------------------------------------------------
  bool push(T value) {
    {
      std::lock_guard lock(mutex_);
      if (closed_) {
        return false;
      }
      queue_.push_back(std::move(value));
    }
    // Notify outside the lock so the woken consumer can take it at once.
    condition_.notify_one();
    return true;
  }

  // -------------------------------------------------------------------------
  // pop(): blocking
  // -------------------------------------------------------------------------
  // What: Removes and returns the front item, waiting while the queue is
  // empty and open.
  // Output: the item, or std::nullopt once the queue is closed and empty.
  // Items pushed before close() are still delivered.
  // -------------------------------------------------------------------------
  std::optional<T> pop() {
    std::unique_lock lock(mutex_);
    condition_.wait(lock, [this] { return closed_ || !queue_.empty(); });

    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // -------------------------------------------------------------------------
  // try_pop(): non-blocking
  // -------------------------------------------------------------------------
  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // -------------------------------------------------------------------------
  // close()
  // -------------------------------------------------------------------------
  // What: Rejects further pushes and wakes every consumer blocked in pop().
  // Idempotent.
  // -------------------------------------------------------------------------
  void close() {
    {
      std::lock_guard lock(mutex_);
      closed_ = true;
    }
    condition_.notify_all();
  }

  bool closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
  }

  // Snapshot only; another thread may push or pop right after.
  bool empty() const {
    std::lock_guard lock(mutex_);
    return queue_.empty();
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

 private:
  // Guards queue_ and closed_. mutable so the const observers can lock.
  mutable std::mutex mutex_;

  // Signalled on push (one waiter) and on close (all waiters).
  std::condition_variable condition_;

  std::deque<T> queue_;
  bool closed_{false};
};

}  // namespace credit
