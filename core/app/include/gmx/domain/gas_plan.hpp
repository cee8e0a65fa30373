#pragma once

#include "gmx/numeric/fixed_point.hpp"

namespace gmx {
namespace domain {

// -----------------------------------------------------------------------------
// GasPlan
// -----------------------------------------------------------------------------
// Responsibility: Fee budget of one order transaction.
//
//   base_estimate            per-kind base gas limit from the DataStore
//   ceiling                  gas limit on the envelope (2 × base_estimate)
//   max_fee_per_gas          caller override or 1.35 × current base fee
//   max_priority_fee_per_gas always 0, no tip bidding
// -----------------------------------------------------------------------------
struct GasPlan {
  BigInt base_estimate{0};
  BigInt ceiling{0};
  BigInt max_fee_per_gas{0};
  BigInt max_priority_fee_per_gas{0};
};

}  // namespace domain
}  // namespace gmx
