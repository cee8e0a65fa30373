#pragma once

#include "gmx/domain/order_kind.hpp"
#include "gmx/numeric/fixed_point.hpp"

#include <optional>
#include <string>
#include <vector>

namespace gmx {
namespace domain {

// -----------------------------------------------------------------------------
// ResolvedOrder
// -----------------------------------------------------------------------------
//
// @brief  A fully specified order: every required field present, amounts
//         converted to on-chain integer units.
//
// @details
// Produced exactly once per request by ParameterResolver::resolve() and
// never mutated afterwards. Fields that do not apply to the kind stay empty:
//
//   increase / decrease  market_key, index_token_address, collateral_address,
//                        swap_path, is_long, size_delta_scaled are set
//   swap                 out_token_address and swap_path are set;
//                        size_delta_scaled is absent
//
// size_delta_scaled        = size_delta_usd × 10^30
// collateral_delta_scaled  = initial_collateral_delta × 10^start_token_decimals
//
// Value type; safe to copy between threads.
// -----------------------------------------------------------------------------
struct ResolvedOrder {
  OrderKind kind{OrderKind::Increase};
  std::string chain;

  std::string market_key;
  std::string index_token_address;
  int index_token_decimals{0};

  std::string start_token_address;
  int start_token_decimals{0};
  std::string out_token_address;
  std::string collateral_address;
  std::vector<std::string> swap_path;

  bool is_long{false};
  double slippage_percent{0.0};

  double size_delta_usd{0.0};
  double initial_collateral_delta{0.0};
  double collateral_usd{0.0};       // oracle-valued collateral, 0 for swaps
  std::optional<double> leverage;   // implied size / collateral, if defined

  std::optional<BigInt> size_delta_scaled;
  BigInt collateral_delta_scaled{0};
};

}  // namespace domain
}  // namespace gmx
