// =============================================================================
// json_registry_test.cpp
// =============================================================================
// Unit tests for gmx::JsonTokenRegistry, gmx::JsonMarketRegistry and
// gmx::loadRegistryDocument.
// =============================================================================

#include "gmx/core/errors.hpp"
#include "gmx/registry/json_registry.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <cstdio>
#include <fstream>
#include <string>

using nlohmann::json;

namespace {

json registryDoc() {
  return json::parse(R"({
    "arbitrum": {
      "tokens": [
        { "symbol": "USDC", "address": "0xaf88d065e77c8cC2239327C5EDb3A432268e5831", "decimals": 6 },
        { "symbol": "WBTC.b", "address": "0x47904963fc8b2340414262125aF798B9655E58Cd", "decimals": 8, "synthetic": true }
      ],
      "markets": [
        { "symbol": "BTC/USD [WBTC-USDC]",
          "marketToken": "0x47c031236e19d024b42f8AE6780E44A573170703",
          "indexToken": "0x47904963fc8b2340414262125aF798B9655E58Cd",
          "longToken": "0x2f2a2543B76A4166549F7aaB2e75Bef0aefC5B0f",
          "shortToken": "0xaf88d065e77c8cC2239327C5EDb3A432268e5831" }
      ]
    },
    "avalanche": { "tokens": [] }
  })");
}

}  // namespace

TEST(JsonRegistryTest, TokensPerChain) {
  gmx::JsonTokenRegistry registry(registryDoc());

  const auto tokens = registry.tokens("arbitrum");
  ASSERT_EQ(tokens.size(), 2u);
  EXPECT_EQ(tokens[0].symbol, "USDC");
  EXPECT_EQ(tokens[0].decimals, 6);
  EXPECT_FALSE(tokens[0].synthetic);
  EXPECT_TRUE(tokens[1].synthetic);

  EXPECT_TRUE(registry.tokens("avalanche").empty());
  EXPECT_TRUE(registry.tokens("unknown").empty());
}

TEST(JsonRegistryTest, MarketsPerChain) {
  gmx::JsonMarketRegistry registry(registryDoc());

  const auto markets = registry.markets("arbitrum");
  ASSERT_EQ(markets.size(), 1u);
  EXPECT_EQ(markets[0].market_key,
            "0x47c031236e19d024b42f8AE6780E44A573170703");
  EXPECT_TRUE(markets[0].backedBy("0xAF88D065E77C8CC2239327C5EDB3A432268E5831"));
  EXPECT_FALSE(markets[0].backedBy("0x47904963fc8b2340414262125aF798B9655E58Cd"));

  // A chain without a "markets" section has none.
  EXPECT_TRUE(registry.markets("avalanche").empty());
}

TEST(JsonRegistryTest, MalformedEntriesAreConfigErrors) {
  json doc = registryDoc();
  doc["arbitrum"]["tokens"][0].erase("decimals");
  EXPECT_THROW(gmx::JsonTokenRegistry{doc}, gmx::ConfigError);

  doc = registryDoc();
  doc["arbitrum"]["tokens"][0]["decimals"] = 99;
  EXPECT_THROW(gmx::JsonTokenRegistry{doc}, gmx::ConfigError);

  doc = registryDoc();
  doc["arbitrum"]["markets"] = "none";
  EXPECT_THROW(gmx::JsonMarketRegistry{doc}, gmx::ConfigError);
}

TEST(JsonRegistryTest, LoadsDocumentFromFile) {
  const std::string path = ::testing::TempDir() + "gmx_registry.json";
  {
    std::ofstream out(path);
    out << registryDoc().dump();
  }
  const json doc = gmx::loadRegistryDocument(path);
  EXPECT_TRUE(doc.contains("arbitrum"));
  std::remove(path.c_str());

  EXPECT_THROW(gmx::loadRegistryDocument("/nonexistent/registry.json"),
               gmx::ConfigError);
}
