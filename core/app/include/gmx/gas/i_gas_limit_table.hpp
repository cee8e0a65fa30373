#pragma once

#include "gmx/domain/order_kind.hpp"
#include "gmx/numeric/fixed_point.hpp"

namespace gmx {

// -----------------------------------------------------------------------------
// IGasLimitTable
// -----------------------------------------------------------------------------
// Responsibility: Per-kind base gas estimate of an order transaction, read
// under the kind's gas-limit key (OrderKindTraits::gas_limit_key).
//
// @throws GatewayError when the table cannot be read.
// -----------------------------------------------------------------------------
class IGasLimitTable {
 public:
  virtual ~IGasLimitTable() = default;

  virtual BigInt baseEstimate(domain::OrderKind kind) = 0;
};

}  // namespace gmx
