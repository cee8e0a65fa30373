#pragma once

#include "gmx/network/rpc_channel.hpp"
#include "gmx/oracle/i_price_oracle.hpp"

#include <nlohmann/json_fwd.hpp>

namespace gmx {

// -----------------------------------------------------------------------------
// RpcPriceOracle
// -----------------------------------------------------------------------------
//
// @brief  IPriceOracle over the node bridge channel.
//
// @details
// Calls "oracle_prices" with {"chain": name}. The bridge relays the
// exchange's signed-prices feed unchanged; the reply is either the feed
// object {"signedPrices": [...]} or the bare array. Each entry carries
// tokenAddress, minPriceFull and maxPriceFull (integer strings in the raw
// price scale). Entries missing any of the three are skipped with a warning.
//
// Thread model: snapshot() is safe to call concurrently.
// -----------------------------------------------------------------------------
class RpcPriceOracle : public IPriceOracle {
 public:
  explicit RpcPriceOracle(RpcChannel& channel);

  domain::OracleSnapshot snapshot(const std::string& chain) override;

  // Parses a feed reply into a snapshot. Exposed for tests.
  static domain::OracleSnapshot parseSnapshot(const nlohmann::json& reply);

 private:
  RpcChannel& channel_;
};

}  // namespace gmx
