#pragma once

#include "gmx/domain/allowance_outcome.hpp"
#include "gmx/domain/gas_plan.hpp"
#include "gmx/domain/price_quote.hpp"
#include "gmx/domain/resolved_order.hpp"
#include "gmx/domain/transaction.hpp"
#include "gmx/events/pipeline_events.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace gmx {

enum class SubmitMode {
  Live,      // sign and broadcast
  Simulate,  // sign, then discard
};

inline const char* submitModeName(SubmitMode m) {
  return m == SubmitMode::Live ? "live" : "simulate";
}

// -----------------------------------------------------------------------------
// SubmissionReceipt
// -----------------------------------------------------------------------------
// Everything one successful pipeline run produced. `state` is Broadcast
// (tx_id set) or Discarded (simulate mode, tx_id empty). Failed runs throw
// instead of returning a receipt.
// -----------------------------------------------------------------------------
struct SubmissionReceipt {
  std::uint64_t run_id{0};
  SubmitMode mode{SubmitMode::Simulate};
  PipelineState state{PipelineState::Initialized};
  domain::ResolvedOrder order;
  std::optional<domain::AllowanceOutcome> allowance;
  domain::ExecutionPrice price;
  domain::GasPlan gas;
  domain::TransactionEnvelope envelope;
  std::string tx_hash;  // hash of the signed payload
  std::optional<std::string> tx_id;
};

}  // namespace gmx
