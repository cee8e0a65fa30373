#pragma once

#include "gmx/domain/market_info.hpp"

#include <string>
#include <vector>

namespace gmx {

// -----------------------------------------------------------------------------
// ITokenRegistry / IMarketRegistry — market and token registry
// -----------------------------------------------------------------------------
// Responsibility: Enumerate the tokens and markets the exchange lists on a
// chain. An unknown chain yields an empty list; the resolver then reports
// every field it could not derive from it.
//
// Refresh and caching are the implementation's business. Both calls may run
// concurrently on the WorkerPool.
//
// @throws GatewayError when a remote registry cannot be read.
// -----------------------------------------------------------------------------
class ITokenRegistry {
 public:
  virtual ~ITokenRegistry() = default;

  virtual std::vector<domain::TokenInfo> tokens(const std::string& chain) = 0;
};

class IMarketRegistry {
 public:
  virtual ~IMarketRegistry() = default;

  virtual std::vector<domain::MarketInfo> markets(const std::string& chain) = 0;
};

}  // namespace gmx
