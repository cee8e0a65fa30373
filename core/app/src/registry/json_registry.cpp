#include "gmx/registry/json_registry.hpp"
#include "gmx/core/errors.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>

namespace gmx {

namespace {

const nlohmann::json& chainSection(const nlohmann::json& chain_doc,
                                   const std::string& chain,
                                   const char* section) {
  static const nlohmann::json kEmpty = nlohmann::json::array();
  auto it = chain_doc.find(section);
  if (it == chain_doc.end()) {
    return kEmpty;
  }
  if (!it->is_array()) {
    throw ConfigError("registry " + chain + "." + section +
                      " must be an array");
  }
  return *it;
}

domain::TokenInfo parseToken(const nlohmann::json& j) {
  domain::TokenInfo token;
  token.address = j.at("address").get<std::string>();
  token.symbol = j.at("symbol").get<std::string>();
  token.decimals = j.at("decimals").get<int>();
  token.synthetic = j.value("synthetic", false);
  if (token.decimals < 0 || token.decimals > 36) {
    throw ConfigError("token " + token.symbol + " has decimals " +
                      std::to_string(token.decimals));
  }
  return token;
}

domain::MarketInfo parseMarket(const nlohmann::json& j) {
  domain::MarketInfo market;
  market.market_key = j.at("marketToken").get<std::string>();
  market.index_token_address = j.at("indexToken").get<std::string>();
  market.long_token_address = j.at("longToken").get<std::string>();
  market.short_token_address = j.at("shortToken").get<std::string>();
  market.symbol = j.value("symbol", std::string{});
  return market;
}

}  // namespace

// -----------------------------------------------------------------------------
// loadRegistryDocument()
// -----------------------------------------------------------------------------
nlohmann::json loadRegistryDocument(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open registry file " + path);
  }
  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError(path + ": " + e.what());
  }
  if (!doc.is_object()) {
    throw ConfigError(path + ": top-level document must be an object");
  }
  return doc;
}

// -----------------------------------------------------------------------------
// JsonTokenRegistry
// -----------------------------------------------------------------------------
JsonTokenRegistry::JsonTokenRegistry(const nlohmann::json& doc) {
  try {
    for (const auto& [chain, chain_doc] : doc.items()) {
      auto& list = by_chain_[chain];
      for (const auto& entry : chainSection(chain_doc, chain, "tokens")) {
        list.push_back(parseToken(entry));
      }
      std::cout << "[JsonTokenRegistry] " << chain << ": " << list.size()
                << " token(s)\n";
    }
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("registry tokens: ") + e.what());
  }
}

std::vector<domain::TokenInfo> JsonTokenRegistry::tokens(
    const std::string& chain) {
  auto it = by_chain_.find(chain);
  if (it == by_chain_.end()) {
    return {};
  }
  return it->second;
}

// -----------------------------------------------------------------------------
// JsonMarketRegistry
// -----------------------------------------------------------------------------
JsonMarketRegistry::JsonMarketRegistry(const nlohmann::json& doc) {
  try {
    for (const auto& [chain, chain_doc] : doc.items()) {
      auto& list = by_chain_[chain];
      for (const auto& entry : chainSection(chain_doc, chain, "markets")) {
        list.push_back(parseMarket(entry));
      }
      std::cout << "[JsonMarketRegistry] " << chain << ": " << list.size()
                << " market(s)\n";
    }
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("registry markets: ") + e.what());
  }
}

std::vector<domain::MarketInfo> JsonMarketRegistry::markets(
    const std::string& chain) {
  auto it = by_chain_.find(chain);
  if (it == by_chain_.end()) {
    return {};
  }
  return it->second;
}

}  // namespace gmx
