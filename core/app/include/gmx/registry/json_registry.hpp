#pragma once

#include "gmx/registry/i_registries.hpp"

#include <nlohmann/json_fwd.hpp>

#include <string>
#include <unordered_map>
#include <vector>

namespace gmx {

// -----------------------------------------------------------------------------
// Registry file
// -----------------------------------------------------------------------------
//
// One JSON document per deployment, keyed by chain name:
//
//   {
//     "arbitrum": {
//       "tokens": [
//         { "symbol": "WBTC.b", "address": "0x2f2a...", "decimals": 8 },
//         { "symbol": "BTC", "address": "0x47904...", "decimals": 8,
//           "synthetic": true },
//         ...
//       ],
//       "markets": [
//         { "marketToken": "0x47c0...", "indexToken": "0x4790...",
//           "longToken": "0x2f2a...", "shortToken": "0xaf88...",
//           "symbol": "BTC/USD [WBTC.b-USDC]" },
//         ...
//       ]
//     }
//   }
//
// The token entries follow the exchange's /tokens endpoint; the market
// entries follow the Reader contract's market struct.
// -----------------------------------------------------------------------------

// Reads and parses the file. @throws ConfigError.
nlohmann::json loadRegistryDocument(const std::string& path);

// -----------------------------------------------------------------------------
// JsonTokenRegistry
// -----------------------------------------------------------------------------
// Parsed once at construction; immutable afterwards, so tokens() is safe to
// call from any thread.
// -----------------------------------------------------------------------------
class JsonTokenRegistry : public ITokenRegistry {
 public:
  // @throws ConfigError if an entry is malformed.
  explicit JsonTokenRegistry(const nlohmann::json& doc);

  std::vector<domain::TokenInfo> tokens(const std::string& chain) override;

 private:
  std::unordered_map<std::string, std::vector<domain::TokenInfo>> by_chain_;
};

// -----------------------------------------------------------------------------
// JsonMarketRegistry
// -----------------------------------------------------------------------------
class JsonMarketRegistry : public IMarketRegistry {
 public:
  explicit JsonMarketRegistry(const nlohmann::json& doc);

  std::vector<domain::MarketInfo> markets(const std::string& chain) override;

 private:
  std::unordered_map<std::string, std::vector<domain::MarketInfo>> by_chain_;
};

}  // namespace gmx
