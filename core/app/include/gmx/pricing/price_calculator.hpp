#pragma once

#include "gmx/domain/order_kind.hpp"
#include "gmx/domain/price_quote.hpp"

#include <string>

namespace gmx {

// -----------------------------------------------------------------------------
// PriceCalculator — price and slippage law
// -----------------------------------------------------------------------------
//
// @brief  Derives the acceptable execution price of one order from a fresh
//         oracle quote.
//
// @details
// Slippage always moves the bound against the trader:
//
//                 long             short
//   Open     median × (1 + s)  median × (1 − s)
//   Close    median × (1 − s)  median × (1 + s)
//   Swap     median            median
//
// All arithmetic runs in 50-digit decimal. The acceptable price written to
// the order is floor(adjusted); the USD view is
// floor(adjusted) × 10^(token_decimals − 30), exact for negative exponents.
//
// Pure functions; safe from any thread.
// -----------------------------------------------------------------------------
class PriceCalculator {
 public:
  static domain::ExecutionPrice price(int token_decimals,
                                      const domain::PriceQuote& quote,
                                      bool is_long, domain::PriceIntent intent,
                                      double slippage);

  // -------------------------------------------------------------------------
  // priceFor(snapshot, token, ...)
  // -------------------------------------------------------------------------
  // Looks the token up in the snapshot (case-insensitive) and prices it.
  //
  // @throws PriceUnavailableError if the snapshot has no entry for token.
  // -------------------------------------------------------------------------
  static domain::ExecutionPrice priceFor(const domain::OracleSnapshot& snapshot,
                                         const std::string& token_address,
                                         int token_decimals, bool is_long,
                                         domain::PriceIntent intent,
                                         double slippage);

  // The quote for token, or PriceUnavailableError.
  static const domain::PriceQuote& quoteFor(
      const domain::OracleSnapshot& snapshot, const std::string& token_address);
};

}  // namespace gmx
