#include "gmx/concurrent/worker_pool.hpp"

namespace gmx {

// -----------------------------------------------------------------------------
// Constructor: spawn the workers
// -----------------------------------------------------------------------------
WorkerPool::WorkerPool(std::size_t thread_count) {
  if (thread_count == 0) {
    thread_count = 1;
  }
  workers_.reserve(thread_count);
  for (std::size_t i = 0; i < thread_count; ++i) {
    workers_.emplace_back([this] { run(); });
  }
}

// -----------------------------------------------------------------------------
// Destructor: close the queue, drain, join
// -----------------------------------------------------------------------------
WorkerPool::~WorkerPool() {
  tasks_.close();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

// -----------------------------------------------------------------------------
// run(): worker loop
// -----------------------------------------------------------------------------
void WorkerPool::run() {
  while (auto task = tasks_.pop()) {
    // packaged_task stores any exception in the future.
    (*task)();
  }
}

}  // namespace gmx
