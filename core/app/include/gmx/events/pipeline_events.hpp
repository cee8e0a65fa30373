#pragma once

#include "gmx/domain/order_kind.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace gmx {

using Timestamp = std::chrono::system_clock::time_point;

// -----------------------------------------------------------------------------
// PipelineState — order submission state machine
// -----------------------------------------------------------------------------
//
// @brief  States one pipeline run passes through, in order:
//
//   Initialized → Resolved → Priced → Budgeted → Enveloped → Signed
//                                                              │
//                                              Broadcast ◄─────┴────► Discarded
//
// No state is revisited. Any stage that throws moves the run to Failed and
// the exception propagates to the caller. Broadcast, Discarded and Failed
// are terminal.
// -----------------------------------------------------------------------------
enum class PipelineState {
  Initialized,
  Resolved,
  Priced,
  Budgeted,
  Enveloped,
  Signed,
  Broadcast,  // submitted; identified by a transaction id
  Discarded,  // simulate mode; never sent
  Failed,
};

inline const char* pipelineStateName(PipelineState s) {
  using S = PipelineState;
  switch (s) {
    case S::Initialized: return "Initialized";
    case S::Resolved:    return "Resolved";
    case S::Priced:      return "Priced";
    case S::Budgeted:    return "Budgeted";
    case S::Enveloped:   return "Enveloped";
    case S::Signed:      return "Signed";
    case S::Broadcast:   return "Broadcast";
    case S::Discarded:   return "Discarded";
    case S::Failed:      return "Failed";
  }
  return "Unknown";
}

inline bool isTerminal(PipelineState s) {
  return s == PipelineState::Broadcast || s == PipelineState::Discarded ||
         s == PipelineState::Failed;
}

// -----------------------------------------------------------------------------
// PipelineStateEvent
// -----------------------------------------------------------------------------
// Published by OrderPipeline on every transition. `detail` carries the
// transaction id on Broadcast, the rejection message on Failed, and a short
// summary otherwise.
// -----------------------------------------------------------------------------
struct PipelineStateEvent {
  std::uint64_t run_id{0};
  domain::OrderKind kind{domain::OrderKind::Increase};
  PipelineState state{PipelineState::Initialized};
  PipelineState previous_state{PipelineState::Initialized};
  std::string detail;
  Timestamp timestamp{};
};

// -----------------------------------------------------------------------------
// AllowanceEvent
// -----------------------------------------------------------------------------
// Published by the pipeline after the allowance step of an increase order.
// `approval_tx_id` is empty when the existing allowance already sufficed.
// -----------------------------------------------------------------------------
struct AllowanceEvent {
  std::uint64_t run_id{0};
  std::string token_address;
  std::string spender;
  std::string required_amount;  // base units, decimal string
  std::string approval_tx_id;
  Timestamp timestamp{};
};

}  // namespace gmx
