#pragma once

#include "gmx/domain/order_kind.hpp"

#include <optional>
#include <string>
#include <vector>

namespace gmx {
namespace domain {

// -----------------------------------------------------------------------------
// OrderRequest
// -----------------------------------------------------------------------------
// Responsibility: The caller's partially specified trading intent. Any field
// left empty is derived by the ParameterResolver from the registries and the
// oracle snapshot, or reported as missing.
//
// @details
// Symbols are convenience inputs: they are only consulted when the matching
// address is absent. Human-scale amounts are doubles as the caller typed
// them; the resolver converts them through exact decimal arithmetic.
//
// Value type. Created by the caller, read (never mutated) by the resolver.
// -----------------------------------------------------------------------------
struct OrderRequest {
  OrderKind kind{OrderKind::Increase};

  std::optional<std::string> chain;               // e.g. "arbitrum"

  std::optional<std::string> index_token_symbol;  // e.g. "BTC"
  std::optional<std::string> index_token_address;
  std::optional<std::string> market_key;

  std::optional<std::string> start_token_symbol;
  std::optional<std::string> start_token_address;
  std::optional<std::string> out_token_symbol;    // swap only
  std::optional<std::string> out_token_address;   // swap only
  std::optional<std::string> collateral_token_symbol;
  std::optional<std::string> collateral_address;

  std::optional<std::vector<std::string>> swap_path;  // market keys

  std::optional<bool> is_long;
  std::optional<double> size_delta_usd;            // position notional, USD
  std::optional<double> leverage;                  // derives size when absent
  std::optional<double> initial_collateral_delta;  // start token, human units
  std::optional<double> slippage_percent;          // fraction, 0.003 = 0.3 %
};

}  // namespace domain
}  // namespace gmx
