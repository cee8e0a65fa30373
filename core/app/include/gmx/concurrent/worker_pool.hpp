#pragma once

#include "gmx/concurrent/thread_safe_queue.hpp"

#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace gmx {

// -----------------------------------------------------------------------------
// WorkerPool — bounded pool for read-only collaborator fan-out
// -----------------------------------------------------------------------------
//
// @brief  A fixed number of worker threads draining a ThreadSafeQueue of
//         tasks. Used to dispatch independent reads (token table, market
//         table, oracle snapshot, balance + allowance) concurrently and join
//         them before the pipeline advances.
//
// @details
// Only pure reads go through the pool. Writes (approval, order submission)
// stay on the caller's thread so that nonce consumption is strictly
// sequential per pipeline run.
//
// Exceptions thrown by a task are captured in its future and rethrown to the
// joining thread by get(); the pool itself never swallows them.
//
// Thread model:
//   submit() is safe from any thread. Workers run tasks in FIFO order with
//   no ordering guarantee between tasks on different workers.
//
// Ownership:
//   Owns its threads. The destructor closes the queue, lets workers finish
//   queued tasks, and joins them.
// -----------------------------------------------------------------------------
class WorkerPool {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  thread_count  number of workers; 0 is treated as 1.
  // -------------------------------------------------------------------------
  explicit WorkerPool(std::size_t thread_count);

  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;
  WorkerPool(WorkerPool&&) = delete;
  WorkerPool& operator=(WorkerPool&&) = delete;

  // -------------------------------------------------------------------------
  // submit(fn)
  // -------------------------------------------------------------------------
  // @brief  Queues fn for execution on a worker.
  //
  // @return A future for fn's result (or exception).
  //
  // @throws std::runtime_error if the pool is shutting down.
  // -------------------------------------------------------------------------
  template <typename Fn>
  std::future<std::invoke_result_t<Fn>> submit(Fn fn) {
    using Result = std::invoke_result_t<Fn>;
    auto task =
        std::make_shared<std::packaged_task<Result()>>(std::move(fn));
    std::future<Result> future = task->get_future();
    if (!tasks_.push([task] { (*task)(); })) {
      throw std::runtime_error("WorkerPool is shut down");
    }
    return future;
  }

  std::size_t size() const { return workers_.size(); }

 private:
  void run();

  ThreadSafeQueue<std::function<void()>> tasks_;
  std::vector<std::thread> workers_;
};

// -----------------------------------------------------------------------------
// joinAll(futures)
// -----------------------------------------------------------------------------
// Waits for every future before rethrowing the first failure, so no task is
// still touching caller state when the exception leaves this frame.
// -----------------------------------------------------------------------------
template <typename T>
std::vector<T> joinAll(std::vector<std::future<T>>& futures) {
  for (auto& f : futures) {
    f.wait();
  }
  std::vector<T> results;
  results.reserve(futures.size());
  for (auto& f : futures) {
    results.push_back(f.get());
  }
  return results;
}

}  // namespace gmx
