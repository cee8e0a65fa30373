#pragma once

namespace gmx {
namespace domain {

// -----------------------------------------------------------------------------
// VenueLimits — exchange-wide order construction thresholds
// -----------------------------------------------------------------------------
//
// @brief  Immutable parameters that govern pre-submission checks and fee
//         budgeting for every order the engine builds.
//
// @details
// Applied by the ParameterResolver (leverage cap, default slippage) and by
// the GasBudgeter (base fee multiplier). Loaded once from the "limits"
// object of the JSON config and copied by value into the components; no
// shared mutable state.
//
// The collateral floor and the gas safety multiplier are protocol constants,
// not limits: they are below and cannot be configured.
// -----------------------------------------------------------------------------
struct VenueLimits {
  /// Maximum implied leverage (size / collateral USD) for position orders.
  double max_leverage{100.0};

  /// Slippage applied when the request carries none (fraction).
  double default_slippage{0.003};

  /// max_fee_per_gas = multiplier × base fee when not overridden.
  double base_fee_multiplier{1.35};
};

/// Increase orders must be backed by at least this much collateral (USD).
constexpr double kMinCollateralUsd = 2.0;

/// Gas ceiling = multiplier × per-kind base estimate.
constexpr int kGasSafetyMultiplier = 2;

}  // namespace domain
}  // namespace gmx
