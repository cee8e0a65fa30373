#pragma once

#include "gmx/domain/address.hpp"

#include <string>

namespace gmx {
namespace domain {

// -----------------------------------------------------------------------------
// TokenInfo
// -----------------------------------------------------------------------------
// One registry entry of the token table (GMX /tokens shape).
// -----------------------------------------------------------------------------
struct TokenInfo {
  std::string address;
  std::string symbol;
  int decimals{18};
  bool synthetic{false};  // index-only token with no on-chain contract
};

// -----------------------------------------------------------------------------
// MarketInfo
// -----------------------------------------------------------------------------
// One perpetual/swap market: the pool identified by market_key, priced off
// index_token, backed by the long and short tokens.
// -----------------------------------------------------------------------------
struct MarketInfo {
  std::string market_key;
  std::string index_token_address;
  std::string long_token_address;
  std::string short_token_address;
  std::string symbol;  // display name, e.g. "BTC/USD [WBTC.b-USDC]"

  bool backedBy(const std::string& token) const {
    return sameAddress(token, long_token_address) ||
           sameAddress(token, short_token_address);
  }
};

}  // namespace domain
}  // namespace gmx
