#include "gmx/oracle/rpc_price_oracle.hpp"
#include "gmx/codec/json_codec.hpp"
#include "gmx/domain/address.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <stdexcept>

namespace gmx {

RpcPriceOracle::RpcPriceOracle(RpcChannel& channel) : channel_(channel) {}

domain::OracleSnapshot RpcPriceOracle::snapshot(const std::string& chain) {
  return parseSnapshot(channel_.call("oracle_prices", {{"chain", chain}}));
}

// -----------------------------------------------------------------------------
// parseSnapshot()
// -----------------------------------------------------------------------------
domain::OracleSnapshot RpcPriceOracle::parseSnapshot(
    const nlohmann::json& reply) {
  const nlohmann::json* entries = &reply;
  if (reply.is_object()) {
    auto it = reply.find("signedPrices");
    if (it == reply.end()) {
      throw GatewayError("oracle_prices: reply has no signedPrices");
    }
    entries = &*it;
  }
  if (!entries->is_array()) {
    throw GatewayError("oracle_prices: expected an array of prices");
  }

  domain::OracleSnapshot snapshot;
  snapshot.reserve(entries->size());
  for (const auto& entry : *entries) {
    if (!entry.is_object() || !entry.contains("tokenAddress") ||
        !entry.contains("minPriceFull") || !entry.contains("maxPriceFull")) {
      std::cerr << "[RpcPriceOracle] skipping malformed entry "
                << entry.dump() << "\n";
      continue;
    }
    try {
      domain::PriceQuote quote;
      quote.token_address = entry.at("tokenAddress").get<std::string>();
      quote.min_price = bigIntFromJson(entry.at("minPriceFull"));
      quote.max_price = bigIntFromJson(entry.at("maxPriceFull"));
      snapshot[domain::normalizeAddress(quote.token_address)] =
          std::move(quote);
    } catch (const std::invalid_argument& e) {
      std::cerr << "[RpcPriceOracle] skipping entry: " << e.what() << "\n";
    } catch (const nlohmann::json::type_error& e) {
      std::cerr << "[RpcPriceOracle] skipping entry: " << e.what() << "\n";
    }
  }
  return snapshot;
}

}  // namespace gmx
