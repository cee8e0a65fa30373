#pragma once

#include "gmx/numeric/fixed_point.hpp"

#include <string>
#include <unordered_map>

namespace gmx {
namespace domain {

// -----------------------------------------------------------------------------
// PriceQuote
// -----------------------------------------------------------------------------
// Responsibility: One token's current oracle bid/ask, as raw integers in the
// exchange's price scale (USD × 10^(30 − token_decimals)).
// -----------------------------------------------------------------------------
struct PriceQuote {
  std::string token_address;
  BigInt min_price{0};  // bid
  BigInt max_price{0};  // ask

  // (bid + ask) / 2 without integer truncation.
  Decimal median() const {
    return (toDecimal(min_price) + toDecimal(max_price)) / 2;
  }
};

// Oracle snapshot for one chain, keyed by token address.
using OracleSnapshot = std::unordered_map<std::string, PriceQuote>;

// -----------------------------------------------------------------------------
// ExecutionPrice
// -----------------------------------------------------------------------------
//
// @brief  Slippage-bounded price for one order, computed fresh per run.
//
// @details
//   median            (bid + ask) / 2 in raw price scale
//   adjusted          median moved against the trader by the slippage
//   acceptable_price  floor(adjusted), the integer written to the order
//   acceptable_price_usd
//                     floor(adjusted) × 10^(token_decimals − 30); the
//                     exponent is usually negative, kept exact in Decimal
//
// Never cached: it must reflect the oracle at submission time.
// -----------------------------------------------------------------------------
struct ExecutionPrice {
  Decimal median{0};
  Decimal adjusted{0};
  BigInt acceptable_price{0};
  Decimal acceptable_price_usd{0};
};

}  // namespace domain
}  // namespace gmx
