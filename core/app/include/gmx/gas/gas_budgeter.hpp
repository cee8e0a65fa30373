#pragma once

#include "gmx/domain/gas_plan.hpp"
#include "gmx/domain/order_kind.hpp"
#include "gmx/domain/venue_limits.hpp"
#include "gmx/gas/i_gas_limit_table.hpp"
#include "gmx/gateway/i_ledger_gateway.hpp"

#include <optional>

namespace gmx {

// -----------------------------------------------------------------------------
// GasBudgeter
// -----------------------------------------------------------------------------
//
// @brief  Computes the fee budget of one order transaction.
//
// @details
//   base_estimate  = gas table entry for the kind's gas-limit key
//   ceiling        = kGasSafetyMultiplier × base_estimate (always 2×)
//   max_fee        = override if configured,
//                    else floor(base_fee_multiplier × current base fee)
//   priority fee   = 0
//
// Stateless apart from its configuration. The base estimate is read once per
// budget() call and the ceiling derived from that single read.
//
// Ownership:
//   Non-owning references to the gas table and the gateway; both must
//   outlive the budgeter.
// -----------------------------------------------------------------------------
class GasBudgeter {
 public:
  GasBudgeter(IGasLimitTable& table, ILedgerGateway& gateway,
              const domain::VenueLimits& limits,
              std::optional<BigInt> max_fee_override = std::nullopt);

  // @throws GatewayError if the gas table or the base fee cannot be read.
  domain::GasPlan budget(domain::OrderKind kind);

  // Override if set, else floor(multiplier × base fee). Also used for the
  // approval transaction.
  BigInt maxFeePerGas();

 private:
  IGasLimitTable& table_;
  ILedgerGateway& gateway_;
  domain::VenueLimits limits_;
  std::optional<BigInt> max_fee_override_;
};

}  // namespace gmx
