// =============================================================================
// json_codec_test.cpp
// =============================================================================
// Unit tests for the JSON codec in gmx/codec/json_codec.hpp.
//
// Validates:
//   - Big integers accepted as decimal strings, hex strings and numbers
//   - OrderRequest parsing: absent/null keys stay unset, bad types and
//     unknown kinds are rejected
//   - Wide integers are written as strings
//   - Telemetry lines for both event types
//   - Error replies for every error family
// =============================================================================

#include "gmx/codec/json_codec.hpp"
#include "gmx/core/errors.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using gmx::BigInt;
using nlohmann::json;

TEST(JsonCodecTest, BigIntFromStringsAndNumbers) {
  EXPECT_EQ(gmx::bigIntFromJson(json("1000000000000000000000000000000000")),
            BigInt("1000000000000000000000000000000000"));
  EXPECT_EQ(gmx::bigIntFromJson(json("0x10")), BigInt(16));
  EXPECT_EQ(gmx::bigIntFromJson(json(42)), BigInt(42));
  EXPECT_EQ(gmx::bigIntFromJson(json(-7)), BigInt(-7));

  EXPECT_THROW(gmx::bigIntFromJson(json(1.5)), std::invalid_argument);
  EXPECT_THROW(gmx::bigIntFromJson(json(nullptr)), std::invalid_argument);
}

TEST(JsonCodecTest, Uint64RejectsOutOfRange) {
  EXPECT_EQ(gmx::uint64FromJson(json("42161")), 42161u);
  EXPECT_THROW(gmx::uint64FromJson(json("-1")), std::invalid_argument);
  EXPECT_THROW(gmx::uint64FromJson(json("18446744073709551616")),
               std::invalid_argument);
}

// -----------------------------------------------------------------------------
// 1. Request parsing.
// -----------------------------------------------------------------------------
TEST(JsonCodecTest, ParsesOrderRequest) {
  const json j = json::parse(R"({
    "kind": "increase",
    "chain": "arbitrum",
    "index_token_symbol": "BTC",
    "start_token_symbol": "USDC",
    "is_long": true,
    "size_delta_usd": 1000,
    "initial_collateral_delta": 10.5,
    "swap_path": [],
    "market_key": null
  })");

  const auto r = gmx::orderRequestFromJson(j);
  EXPECT_EQ(r.kind, gmx::domain::OrderKind::Increase);
  EXPECT_EQ(r.chain, std::optional<std::string>("arbitrum"));
  EXPECT_EQ(r.index_token_symbol, std::optional<std::string>("BTC"));
  EXPECT_EQ(r.is_long, std::optional<bool>(true));
  EXPECT_EQ(r.size_delta_usd, std::optional<double>(1000.0));
  EXPECT_EQ(r.initial_collateral_delta, std::optional<double>(10.5));
  ASSERT_TRUE(r.swap_path.has_value());
  EXPECT_TRUE(r.swap_path->empty());

  EXPECT_FALSE(r.market_key.has_value());
  EXPECT_FALSE(r.slippage_percent.has_value());
  EXPECT_FALSE(r.leverage.has_value());
}

TEST(JsonCodecTest, OrderKindNames) {
  EXPECT_EQ(gmx::orderKindFromString("decrease"),
            gmx::domain::OrderKind::Decrease);
  EXPECT_EQ(gmx::orderKindFromString("swap"), gmx::domain::OrderKind::Swap);
  EXPECT_THROW(gmx::orderKindFromString("limit"), std::invalid_argument);
}

TEST(JsonCodecTest, RejectsMalformedRequests) {
  EXPECT_THROW(gmx::orderRequestFromJson(json::array()), std::invalid_argument);
  EXPECT_THROW(gmx::orderRequestFromJson(json::parse(R"({"chain":"arbitrum"})")),
               std::invalid_argument);
  EXPECT_THROW(
      gmx::orderRequestFromJson(json::parse(R"({"kind":"increase","is_long":"yes"})")),
      std::invalid_argument);
  EXPECT_THROW(
      gmx::orderRequestFromJson(json::parse(R"({"kind":"swap","swap_path":"0xabc"})")),
      std::invalid_argument);
}

// -----------------------------------------------------------------------------
// 2. Output: wide integers as strings, absent optionals as null.
// -----------------------------------------------------------------------------
TEST(JsonCodecTest, ResolvedOrderWritesScaledAmountsAsStrings) {
  gmx::domain::ResolvedOrder o;
  o.kind = gmx::domain::OrderKind::Swap;
  o.chain = "arbitrum";
  o.collateral_delta_scaled = BigInt("25000000");

  const json j = gmx::toJson(o);
  EXPECT_EQ(j.at("kind").get<std::string>(), "swap");
  EXPECT_TRUE(j.at("size_delta").is_null());
  EXPECT_TRUE(j.at("leverage").is_null());
  EXPECT_EQ(j.at("initial_collateral_delta_amount").get<std::string>(),
            "25000000");

  o.size_delta_scaled = BigInt("1000000000000000000000000000000000");
  EXPECT_EQ(gmx::toJson(o).at("size_delta").get<std::string>(),
            "1000000000000000000000000000000000");
}

TEST(JsonCodecTest, EnvelopeFields) {
  gmx::domain::TransactionEnvelope e;
  e.from = "0x1";
  e.to = "0x2";
  e.value = BigInt("10000000000000000");
  e.chain_id = 42161;
  e.gas = 6'000'000;
  e.nonce = 9;

  const json j = gmx::toJson(e);
  EXPECT_EQ(j.at("value").get<std::string>(), "10000000000000000");
  EXPECT_EQ(j.at("gas").get<std::string>(), "6000000");
  EXPECT_EQ(j.at("chain_id").get<std::uint64_t>(), 42161u);
  EXPECT_EQ(j.at("nonce").get<std::uint64_t>(), 9u);
}

TEST(JsonCodecTest, ExecutionPriceFormatting) {
  gmx::domain::ExecutionPrice p;
  p.median = gmx::parseDecimal("60005");
  p.adjusted = gmx::parseDecimal("60185.015");
  p.acceptable_price = BigInt("601850150000000000000000000");
  p.acceptable_price_usd = gmx::parseDecimal("60185.015");

  const json j = gmx::toJson(p);
  EXPECT_EQ(j.at("median").get<std::string>(), "60005");
  EXPECT_EQ(j.at("adjusted").get<std::string>(), "60185.015");
  EXPECT_EQ(j.at("acceptable_price").get<std::string>(),
            "601850150000000000000000000");
}

// -----------------------------------------------------------------------------
// 3. Telemetry lines.
// -----------------------------------------------------------------------------
TEST(JsonCodecTest, PipelineTelemetryLine) {
  gmx::PipelineStateEvent e;
  e.run_id = 5;
  e.kind = gmx::domain::OrderKind::Decrease;
  e.previous_state = gmx::PipelineState::Signed;
  e.state = gmx::PipelineState::Broadcast;
  e.detail = "0xtx1";

  const json j = gmx::toJson(gmx::Event{e});
  EXPECT_EQ(j.at("type").get<std::string>(), "pipeline_state");
  EXPECT_EQ(j.at("run_id").get<std::uint64_t>(), 5u);
  EXPECT_EQ(j.at("kind").get<std::string>(), "decrease");
  EXPECT_EQ(j.at("state").get<std::string>(), "Broadcast");
  EXPECT_EQ(j.at("previous_state").get<std::string>(), "Signed");
  EXPECT_EQ(j.at("detail").get<std::string>(), "0xtx1");
  EXPECT_TRUE(j.contains("timestamp_ms"));
}

TEST(JsonCodecTest, AllowanceTelemetryLine) {
  gmx::AllowanceEvent e;
  e.run_id = 2;
  e.token_address = "0xusdc";
  e.spender = "0xrouter";
  e.required_amount = "10000000";

  const json j = gmx::toJson(gmx::Event{e});
  EXPECT_EQ(j.at("type").get<std::string>(), "allowance");
  EXPECT_EQ(j.at("required_amount").get<std::string>(), "10000000");
  EXPECT_EQ(j.at("approval_tx_id").get<std::string>(), "");
}

// -----------------------------------------------------------------------------
// 4. Error replies.
// -----------------------------------------------------------------------------
TEST(JsonCodecTest, MissingFieldErrorListsFields) {
  const gmx::MissingFieldError err({"chain", "market_key"});
  const json j = gmx::errorToJson(err);
  EXPECT_EQ(j.at("status").get<std::string>(), "error");
  EXPECT_EQ(j.at("kind").get<std::string>(), "MissingField");
  EXPECT_EQ(j.at("fields").get<std::vector<std::string>>(),
            (std::vector<std::string>{"chain", "market_key"}));
  EXPECT_NE(j.at("message").get<std::string>().find("market_key"),
            std::string::npos);
}

TEST(JsonCodecTest, ErrorKindsByFamily) {
  EXPECT_EQ(gmx::errorToJson(gmx::ThresholdError(
                                 gmx::ErrorKind::LeverageExceeded, "leverage",
                                 "500", "<= 100"))
                .at("kind")
                .get<std::string>(),
            "LeverageExceeded");
  EXPECT_EQ(gmx::errorToJson(gmx::SubmissionFailedError("rejected"))
                .at("kind")
                .get<std::string>(),
            "SubmissionFailed");
  EXPECT_EQ(gmx::errorToJson(std::invalid_argument("bad"))
                .at("kind")
                .get<std::string>(),
            "InvalidRequest");
  EXPECT_EQ(gmx::errorToJson(std::runtime_error("boom"))
                .at("kind")
                .get<std::string>(),
            "Internal");
  EXPECT_FALSE(gmx::errorToJson(gmx::GatewayError("down")).contains("fields"));
}
