#pragma once

#include "gmx/domain/price_quote.hpp"

#include <string>

namespace gmx {

// -----------------------------------------------------------------------------
// IPriceOracle — price oracle feed
// -----------------------------------------------------------------------------
// Responsibility: Current bid/ask of every token the exchange prices on
// `chain`. The snapshot is keyed by lower-case token address.
//
// @throws GatewayError when the feed cannot be read. Callers that need a
//         specific token's price map this to PriceUnavailable.
// -----------------------------------------------------------------------------
class IPriceOracle {
 public:
  virtual ~IPriceOracle() = default;

  virtual domain::OracleSnapshot snapshot(const std::string& chain) = 0;
};

}  // namespace gmx
