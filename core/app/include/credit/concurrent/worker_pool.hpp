#pragma once

#include "credit/concurrent/thread_safe_queue.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace credit {

// Stored in the future of a task whose deadline passed before a worker
// picked it up. The task body never ran.
class TaskExpiredError : public std::runtime_error {
 public:
  explicit TaskExpiredError(const std::string& what)
      : std::runtime_error(what) {}
};

// Thrown by submit() when max_pending tasks are already queued or running.
class PoolSaturatedError : public std::runtime_error {
 public:
  explicit PoolSaturatedError(const std::string& what)
      : std::runtime_error(what) {}
};

// -----------------------------------------------------------------------------
// WorkerPool
// -----------------------------------------------------------------------------
//
// @brief  Fixed set of worker threads draining a shared task queue.
//
// @details
// The Negotiation Engine submits each Narrator call here with a deadline
// and waits on the returned future until that deadline. Two limits keep a
// slow narration service from piling up work:
//
//   - A task submitted with a deadline is skipped if no worker reached it
//     in time. Its future then holds TaskExpiredError and the body is never
//     invoked, so an abandoned call never hits the service late.
//   - With max_pending > 0, submit() refuses new work once that many tasks
//     are queued or running, throwing PoolSaturatedError. The caller takes
//     its fallback path at once.
//
// A task that has already started is not interrupted; ZmqNarrator bounds
// its own socket I/O to the same deadline.
//
// Tasks run in FIFO order of submission. With a single worker they also
// complete in that order.
//
// Thread model:
//   submit() is safe from any thread. Tasks run on the pool's threads.
//   stop() closes the queue, lets workers finish queued tasks and joins
//   them; it is idempotent and also run by the destructor.
//
// Ownership:
//   Owns its threads and queue. Futures returned by submit() own the shared
//   state of their task, so they stay valid after stop().
// -----------------------------------------------------------------------------
class WorkerPool {
 public:
  using Task = std::function<void()>;
  using Clock = std::chrono::steady_clock;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  workers      number of threads to start, must be > 0.
  // @param  max_pending  cap on queued + running tasks; 0 means no cap.
  // @throws std::invalid_argument if workers <= 0.
  // -------------------------------------------------------------------------
  explicit WorkerPool(int workers, std::size_t max_pending = 0);

  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;
  WorkerPool(WorkerPool&&) = delete;
  WorkerPool& operator=(WorkerPool&&) = delete;

  // -------------------------------------------------------------------------
  // submit(fn)
  // -------------------------------------------------------------------------
  //
  // @brief  Queues fn for execution on a worker.
  //
  // @return std::future of fn's result. An exception thrown by fn is stored
  //         in the future and rethrown by get().
  //
  // @throws std::runtime_error if the pool has been stopped.
  // @throws PoolSaturatedError if max_pending tasks are outstanding.
  // -------------------------------------------------------------------------
  template <typename Fn>
  auto submit(Fn&& fn) -> std::future<std::invoke_result_t<std::decay_t<Fn>>>;

  // Same, but fn is skipped if a worker only reaches it at or after
  // deadline; get() then throws TaskExpiredError.
  template <typename Fn>
  auto submit(Fn&& fn, Clock::time_point deadline)
      -> std::future<std::invoke_result_t<std::decay_t<Fn>>>;

  void stop();

  std::size_t size() const { return threads_.size(); }

  // Tasks queued or running right now.
  std::size_t pending() const { return pending_.load(); }

 private:
  void run();

  ThreadSafeQueue<Task> queue_;
  std::vector<std::thread> threads_;
  const std::size_t max_pending_;
  std::atomic<std::size_t> pending_{0};
};

// -----------------------------------------------------------------------------
// Template implementation: submit
// -----------------------------------------------------------------------------
// packaged_task is move-only, std::function needs a copyable target, so the
// task is held through a shared_ptr.
// -----------------------------------------------------------------------------
template <typename Fn>
auto WorkerPool::submit(Fn&& fn)
    -> std::future<std::invoke_result_t<std::decay_t<Fn>>> {
  using Result = std::invoke_result_t<std::decay_t<Fn>>;

  // Reserve a slot first so concurrent submitters cannot overshoot the cap.
  const std::size_t before = pending_.fetch_add(1);
  if (max_pending_ > 0 && before >= max_pending_) {
    pending_.fetch_sub(1);
    throw PoolSaturatedError("WorkerPool: " + std::to_string(max_pending_) +
                             " tasks already pending");
  }

  auto task =
      std::make_shared<std::packaged_task<Result()>>(std::forward<Fn>(fn));
  std::future<Result> future = task->get_future();

  if (!queue_.push([task] { (*task)(); })) {
    pending_.fetch_sub(1);
    throw std::runtime_error("WorkerPool: submit after stop");
  }
  return future;
}

template <typename Fn>
auto WorkerPool::submit(Fn&& fn, Clock::time_point deadline)
    -> std::future<std::invoke_result_t<std::decay_t<Fn>>> {
  using Result = std::invoke_result_t<std::decay_t<Fn>>;

  return submit([body = std::decay_t<Fn>(std::forward<Fn>(fn)),
                 deadline]() mutable -> Result {
    if (Clock::now() >= deadline) {
      throw TaskExpiredError("WorkerPool: deadline passed before task started");
    }
    return body();
  });
}

}  // namespace credit
