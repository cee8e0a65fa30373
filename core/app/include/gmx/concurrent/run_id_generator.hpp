#pragma once

#include <atomic>
#include <cstdint>

namespace gmx {

// -----------------------------------------------------------------------------
// RunIdGenerator — thread-safe source of pipeline run identifiers
// -----------------------------------------------------------------------------
//
// @brief  Hands out unique, monotonically increasing ids, one per pipeline
//         run, so that telemetry and log lines of concurrent submissions can
//         be told apart.
//
// @details
// Starts at 1; 0 means "no run". fetch_add with relaxed ordering: the only
// requirement is uniqueness.
//
// Owned by value by OrderEngine and injected by reference into every
// OrderPipeline it creates; never a singleton.
// -----------------------------------------------------------------------------
class RunIdGenerator {
 public:
  RunIdGenerator() = default;

  RunIdGenerator(const RunIdGenerator&) = delete;
  RunIdGenerator& operator=(const RunIdGenerator&) = delete;
  RunIdGenerator(RunIdGenerator&&) = delete;
  RunIdGenerator& operator=(RunIdGenerator&&) = delete;

  std::uint64_t next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

 private:
  std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace gmx
