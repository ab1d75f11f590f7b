#include "credit/concurrent/worker_pool.hpp"

#include <iostream>

namespace credit {

WorkerPool::WorkerPool(int workers, std::size_t max_pending)
    : max_pending_(max_pending) {
  if (workers <= 0) {
    throw std::invalid_argument("WorkerPool: workers must be > 0");
  }
  threads_.reserve(static_cast<std::size_t>(workers));
  for (int i = 0; i < workers; ++i) {
    threads_.emplace_back([this] { run(); });
  }
  std::cout << "[WorkerPool] started " << workers << " worker(s)\n";
}

WorkerPool::~WorkerPool() { stop(); }

// -----------------------------------------------------------------------------
// stop(): close the queue, drain, join
// -----------------------------------------------------------------------------
void WorkerPool::stop() {
  queue_.close();
  for (auto& thread : threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
}

// -----------------------------------------------------------------------------
// run(): worker loop, exits when the queue is closed and drained
// -----------------------------------------------------------------------------
void WorkerPool::run() {
  while (auto task = queue_.pop()) {
    // packaged_task captures the task's own exceptions into its future.
    (*task)();
    pending_.fetch_sub(1);
  }
}

}  // namespace credit
