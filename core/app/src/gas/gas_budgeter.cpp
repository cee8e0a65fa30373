#include "gmx/gas/gas_budgeter.hpp"

#include <utility>

namespace gmx {

GasBudgeter::GasBudgeter(IGasLimitTable& table, ILedgerGateway& gateway,
                         const domain::VenueLimits& limits,
                         std::optional<BigInt> max_fee_override)
    : table_(table),
      gateway_(gateway),
      limits_(limits),
      max_fee_override_(std::move(max_fee_override)) {}

// -----------------------------------------------------------------------------
// budget()
// -----------------------------------------------------------------------------
domain::GasPlan GasBudgeter::budget(domain::OrderKind kind) {
  domain::GasPlan plan;
  plan.base_estimate = table_.baseEstimate(kind);
  plan.ceiling = plan.base_estimate * domain::kGasSafetyMultiplier;
  plan.max_fee_per_gas = maxFeePerGas();
  plan.max_priority_fee_per_gas = 0;
  return plan;
}

// -----------------------------------------------------------------------------
// maxFeePerGas()
// -----------------------------------------------------------------------------
BigInt GasBudgeter::maxFeePerGas() {
  if (max_fee_override_.has_value()) {
    return *max_fee_override_;
  }
  const Decimal base_fee = toDecimal(gateway_.baseFee());
  return floorToInteger(base_fee * toDecimal(limits_.base_fee_multiplier));
}

}  // namespace gmx
