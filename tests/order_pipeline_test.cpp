// =============================================================================
// order_pipeline_test.cpp
// =============================================================================
// Integration tests for gmx::OrderPipeline against the in-memory fakes.
//
// Validates:
//   - Simulate mode signs but never submits; repeated simulations differ
//     only in the nonce
//   - Live mode broadcasts and returns the transaction id
//   - A rejected broadcast publishes Failed and rethrows
//   - The published state sequence and its previous_state links
//   - Multicall contents per order kind, including sendWnt value
//   - createOrder parameters
//   - The allowance step completes before the oracle is re-read, and its
//     failure stops the run before pricing
//
// The resolved orders come from a real ParameterResolver over the same
// fakes, so the fixture exercises resolver → pipeline end to end.
// =============================================================================

#include "gmx/core/errors.hpp"
#include "gmx/order/order_pipeline.hpp"
#include "gmx/resolver/parameter_resolver.hpp"

#include "support/fakes.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

using gmx::BigInt;
using gmx::PipelineState;
using gmx::SubmitMode;
using gmx::domain::OrderKind;
using gmx::domain::OrderRequest;

class OrderPipelineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    tokens.list = gmx_test::arbitrumTokens();
    markets.list = gmx_test::arbitrumMarkets();
    gmx_test::setArbitrumPrices(oracle);

    gateway.setTokenBalance(gmx_test::kUsdc, gmx_test::kWallet,
                            BigInt(1'000'000'000));
    gateway.setAllowance(gmx_test::kUsdc, gmx_test::kWallet,
                         gmx_test::kSyntheticsRouter, BigInt(1'000'000'000));
    gateway.setNonce(gmx_test::kWallet, 3);

    bus.subscribe<gmx::PipelineStateEvent>(
        [this](const gmx::PipelineStateEvent& e) { transitions.push_back(e); });
  }

  gmx::domain::ResolvedOrder resolve(const OrderRequest& r) {
    return resolver.resolve(r);
  }

  static OrderRequest btcLong() {
    OrderRequest r;
    r.kind = OrderKind::Increase;
    r.chain = "arbitrum";
    r.index_token_symbol = "BTC";
    r.start_token_symbol = "USDC";
    r.is_long = true;
    r.size_delta_usd = 1000.0;
    r.initial_collateral_delta = 10.0;
    r.slippage_percent = 0.003;
    return r;
  }

  std::vector<PipelineState> states() const {
    std::vector<PipelineState> out;
    for (const auto& e : transitions) {
      out.push_back(e.state);
    }
    return out;
  }

  std::vector<std::string> encodedMethods() const {
    std::vector<std::string> out;
    for (const auto& c : gateway.encoded()) {
      out.push_back(c.method);
    }
    return out;
  }

  gmx_test::FakeLedgerGateway gateway;
  gmx_test::FakeSigner signer;
  gmx_test::FakePriceOracle oracle;
  gmx_test::FakeTokenRegistry tokens;
  gmx_test::FakeMarketRegistry markets;
  gmx_test::FakeGasLimitTable gas_table;

  gmx::WorkerPool pool{3};
  gmx::EventBus bus;
  gmx::RunIdGenerator run_ids;
  gmx::EngineConfig config = gmx_test::testConfig();

  gmx::ParameterResolver resolver{tokens, markets, oracle, pool, config.limits};
  gmx::OrderPipeline pipeline{gateway, signer,  oracle, gas_table,
                              pool,    bus,     run_ids};

  std::vector<gmx::PipelineStateEvent> transitions;
};

// -----------------------------------------------------------------------------
// 1. Simulate: signed, discarded, nothing submitted. Two simulations of the
//    same order differ only in the nonce they read.
// -----------------------------------------------------------------------------
TEST_F(OrderPipelineTest, SimulateTwiceDiffersOnlyInNonce) {
  const auto order = resolve(btcLong());

  const auto first = pipeline.buildAndSubmit(order, config, SubmitMode::Simulate);
  gateway.setNonce(gmx_test::kWallet, 4);
  const auto second =
      pipeline.buildAndSubmit(order, config, SubmitMode::Simulate);

  EXPECT_EQ(first.state, PipelineState::Discarded);
  EXPECT_FALSE(first.tx_id.has_value());
  EXPECT_EQ(gateway.submitCalls(), 0);
  EXPECT_EQ(signer.signs(), 2);

  EXPECT_EQ(first.envelope.nonce, 3u);
  EXPECT_EQ(second.envelope.nonce, 4u);
  auto patched = second.envelope;
  patched.nonce = first.envelope.nonce;
  EXPECT_EQ(patched, first.envelope);

  EXPECT_NE(first.run_id, second.run_id);
}

// -----------------------------------------------------------------------------
// 2. Live: broadcast, tx id returned, nonce consumed.
// -----------------------------------------------------------------------------
TEST_F(OrderPipelineTest, LiveRunBroadcasts) {
  const auto receipt =
      pipeline.buildAndSubmit(resolve(btcLong()), config, SubmitMode::Live);

  EXPECT_EQ(receipt.state, PipelineState::Broadcast);
  ASSERT_TRUE(receipt.tx_id.has_value());
  EXPECT_EQ(*receipt.tx_id, "0xtx1");
  EXPECT_EQ(receipt.tx_hash, "0xhash1");
  EXPECT_EQ(gateway.submitCalls(), 1);
  EXPECT_EQ(gateway.submitted()[0].raw, "0xraw3");

  ASSERT_TRUE(receipt.allowance.has_value());
  EXPECT_EQ(receipt.allowance->status, gmx::domain::AllowanceStatus::Sufficient);
}

TEST_F(OrderPipelineTest, EnvelopeCarriesGasPlanAndChain) {
  const auto receipt =
      pipeline.buildAndSubmit(resolve(btcLong()), config, SubmitMode::Simulate);

  const auto& env = receipt.envelope;
  EXPECT_EQ(env.from, gmx_test::kWallet);
  EXPECT_EQ(env.to, gmx_test::kExchangeRouter);
  EXPECT_EQ(env.chain_id, 42161u);
  EXPECT_EQ(env.gas, BigInt(6'000'000));
  EXPECT_EQ(env.max_fee_per_gas, BigInt(135'000'000));
  EXPECT_EQ(env.max_priority_fee_per_gas, BigInt(0));
  EXPECT_EQ(env.value, BigInt(0));

  // Acceptable price: 60005 × 1.003, raw scale for 8 decimals.
  EXPECT_EQ(receipt.price.acceptable_price,
            gmx_test::rawPrice("60185.015", 8));
}

TEST_F(OrderPipelineTest, MaxFeeOverrideFromConfig) {
  config.max_fee_per_gas = "2000000000";
  const auto receipt =
      pipeline.buildAndSubmit(resolve(btcLong()), config, SubmitMode::Simulate);
  EXPECT_EQ(receipt.envelope.max_fee_per_gas, BigInt(2'000'000'000));
  EXPECT_EQ(gateway.baseFeeReads(), 0);
}

// -----------------------------------------------------------------------------
// 3. A rejected broadcast moves the run to Failed and rethrows unchanged.
// -----------------------------------------------------------------------------
TEST_F(OrderPipelineTest, RejectedBroadcastPublishesFailed) {
  gateway.rejectSubmissions("nonce too low");

  EXPECT_THROW(
      pipeline.buildAndSubmit(resolve(btcLong()), config, SubmitMode::Live),
      gmx::SubmissionFailedError);

  ASSERT_FALSE(transitions.empty());
  const auto& last = transitions.back();
  EXPECT_EQ(last.state, PipelineState::Failed);
  EXPECT_EQ(last.previous_state, PipelineState::Signed);
  EXPECT_NE(last.detail.find("nonce too low"), std::string::npos);
}

// -----------------------------------------------------------------------------
// 4. The state sequence is fixed and every event links to its predecessor.
// -----------------------------------------------------------------------------
TEST_F(OrderPipelineTest, PublishesStatesInOrder) {
  pipeline.buildAndSubmit(resolve(btcLong()), config, SubmitMode::Live);

  const std::vector<PipelineState> expected = {
      PipelineState::Initialized, PipelineState::Resolved,
      PipelineState::Priced,      PipelineState::Budgeted,
      PipelineState::Enveloped,   PipelineState::Signed,
      PipelineState::Broadcast,
  };
  EXPECT_EQ(states(), expected);

  for (std::size_t i = 1; i < transitions.size(); ++i) {
    EXPECT_EQ(transitions[i].previous_state, transitions[i - 1].state);
    EXPECT_EQ(transitions[i].run_id, transitions[0].run_id);
  }
  EXPECT_EQ(transitions.back().detail, "0xtx1");
}

// -----------------------------------------------------------------------------
// 5. Multicall contents.
// -----------------------------------------------------------------------------
TEST_F(OrderPipelineTest, IncreaseSendsTokensThenCreatesOrder) {
  const auto receipt =
      pipeline.buildAndSubmit(resolve(btcLong()), config, SubmitMode::Simulate);

  EXPECT_EQ(receipt.envelope.multicall_args.size(), 2u);
  EXPECT_EQ(encodedMethods(), (std::vector<std::string>{
                                  "sendTokens", "createOrder", "multicall"}));

  const auto calls = gateway.encoded();
  EXPECT_EQ(calls[0].args.at(0).get<std::string>(), gmx_test::kUsdc);
  EXPECT_EQ(calls[0].args.at(1).get<std::string>(), gmx_test::kOrderVault);
  EXPECT_EQ(calls[0].args.at(2).get<std::string>(), "10000000");
}

TEST_F(OrderPipelineTest, WrappedNativeCollateralUsesSendWntWithValue) {
  gateway.setNativeBalance(gmx_test::kWallet, BigInt("5000000000000000000"));
  gateway.setAllowance(gmx_test::kWeth, gmx_test::kWallet,
                       gmx_test::kSyntheticsRouter,
                       BigInt("5000000000000000000"));
  OrderRequest r = btcLong();
  r.index_token_symbol = "WETH";
  r.start_token_symbol = "WETH";
  r.initial_collateral_delta = 0.01;  // 30 USD
  r.size_delta_usd = 300.0;

  const auto receipt =
      pipeline.buildAndSubmit(resolve(r), config, SubmitMode::Simulate);

  EXPECT_EQ(encodedMethods().front(), "sendWnt");
  EXPECT_EQ(receipt.envelope.value, BigInt("10000000000000000"));
}

TEST_F(OrderPipelineTest, DecreaseOnlyCreatesOrderAndSkipsAllowance) {
  OrderRequest r = btcLong();
  r.kind = OrderKind::Decrease;
  r.initial_collateral_delta = 0.0;

  const auto receipt =
      pipeline.buildAndSubmit(resolve(r), config, SubmitMode::Simulate);

  EXPECT_EQ(receipt.envelope.multicall_args.size(), 1u);
  EXPECT_EQ(encodedMethods(),
            (std::vector<std::string>{"createOrder", "multicall"}));
  EXPECT_FALSE(receipt.allowance.has_value());
  EXPECT_EQ(gateway.allowanceReads(), 0);
  EXPECT_EQ(receipt.envelope.gas, BigInt(5'000'000));
}

TEST_F(OrderPipelineTest, SwapIsPricedOnStartToken) {
  OrderRequest r;
  r.kind = OrderKind::Swap;
  r.chain = "arbitrum";
  r.start_token_symbol = "USDC";
  r.out_token_symbol = "WETH";
  r.initial_collateral_delta = 25.0;

  const auto receipt =
      pipeline.buildAndSubmit(resolve(r), config, SubmitMode::Simulate);

  EXPECT_EQ(gmx::formatDecimal(receipt.price.acceptable_price_usd), "1");
  EXPECT_EQ(encodedMethods().front(), "sendTokens");
  EXPECT_EQ(receipt.envelope.gas, BigInt(4'000'000));
}

// -----------------------------------------------------------------------------
// 6. createOrder parameters.
// -----------------------------------------------------------------------------
TEST_F(OrderPipelineTest, CreateOrderParamsForIncrease) {
  const auto order = resolve(btcLong());
  gmx::domain::ExecutionPrice price;
  price.acceptable_price = BigInt(12345);

  const nlohmann::json p =
      gmx::OrderPipeline::createOrderParams(order, price, gmx_test::kWallet);

  EXPECT_EQ(p["addresses"]["receiver"], gmx_test::kWallet);
  EXPECT_EQ(p["addresses"]["market"], gmx_test::kBtcMarket);
  EXPECT_EQ(p["addresses"]["initialCollateralToken"], gmx_test::kUsdc);
  EXPECT_TRUE(p["addresses"]["swapPath"].empty());
  EXPECT_EQ(p["numbers"]["sizeDeltaUsd"], "1" + std::string(33, '0'));
  EXPECT_EQ(p["numbers"]["initialCollateralDeltaAmount"], "0");
  EXPECT_EQ(p["numbers"]["acceptablePrice"], "12345");
  EXPECT_EQ(p["numbers"]["executionFee"], "0");
  EXPECT_EQ(p["orderType"], 2);
  EXPECT_EQ(p["isLong"], true);
}

TEST_F(OrderPipelineTest, CreateOrderParamsForDecreaseCarryCollateralDelta) {
  OrderRequest r = btcLong();
  r.kind = OrderKind::Decrease;
  r.initial_collateral_delta = 5.0;
  r.size_delta_usd = 100.0;
  const auto order = resolve(r);

  const nlohmann::json p = gmx::OrderPipeline::createOrderParams(
      order, gmx::domain::ExecutionPrice{}, gmx_test::kWallet);

  EXPECT_EQ(p["numbers"]["initialCollateralDeltaAmount"], "5000000");
  EXPECT_EQ(p["orderType"], 4);
}

// -----------------------------------------------------------------------------
// 7. The allowance step is settled before the oracle is re-read, and a
//    failing allowance stops the run before pricing.
// -----------------------------------------------------------------------------
TEST_F(OrderPipelineTest, AllowanceCompletesBeforePricing) {
  const auto order = resolve(btcLong());
  const int reads_after_resolve = oracle.reads();

  int reads_at_allowance = -1;
  bus.subscribe<gmx::AllowanceEvent>(
      [this, &reads_at_allowance](const gmx::AllowanceEvent&) {
        reads_at_allowance = oracle.reads();
      });

  pipeline.buildAndSubmit(order, config, SubmitMode::Simulate);

  EXPECT_EQ(reads_at_allowance, reads_after_resolve);
  EXPECT_EQ(oracle.reads(), reads_after_resolve + 1);
}

TEST_F(OrderPipelineTest, InsufficientBalanceStopsBeforePricing) {
  gateway.setTokenBalance(gmx_test::kUsdc, gmx_test::kWallet, BigInt(1));
  const auto order = resolve(btcLong());
  const int reads_after_resolve = oracle.reads();

  try {
    pipeline.buildAndSubmit(order, config, SubmitMode::Live);
    FAIL() << "expected ThresholdError";
  } catch (const gmx::ThresholdError& e) {
    EXPECT_EQ(e.kind(), gmx::ErrorKind::InsufficientBalance);
  }

  EXPECT_EQ(oracle.reads(), reads_after_resolve);
  EXPECT_EQ(gas_table.reads(), 0);
  EXPECT_EQ(signer.signs(), 0);
  EXPECT_EQ(transitions.back().state, PipelineState::Failed);
  EXPECT_EQ(transitions.back().previous_state, PipelineState::Resolved);
}

TEST_F(OrderPipelineTest, AutoApprovalPublishesApprovalTx) {
  gateway.setAllowance(gmx_test::kUsdc, gmx_test::kWallet,
                       gmx_test::kSyntheticsRouter, BigInt(0));
  std::vector<gmx::AllowanceEvent> approvals;
  bus.subscribe<gmx::AllowanceEvent>(
      [&approvals](const gmx::AllowanceEvent& e) { approvals.push_back(e); });

  const auto receipt =
      pipeline.buildAndSubmit(resolve(btcLong()), config, SubmitMode::Live);

  ASSERT_EQ(approvals.size(), 1u);
  EXPECT_EQ(approvals[0].approval_tx_id, "0xtx1");
  EXPECT_EQ(approvals[0].required_amount, "10000000");
  // The approval consumed nonce 3; the order reads 4.
  EXPECT_EQ(receipt.envelope.nonce, 4u);
  EXPECT_EQ(*receipt.tx_id, "0xtx2");
}

TEST_F(OrderPipelineTest, OracleFailureDuringPricingIsPriceUnavailable) {
  const auto order = resolve(btcLong());
  oracle.failWith("feed down");

  EXPECT_THROW(pipeline.buildAndSubmit(order, config, SubmitMode::Simulate),
               gmx::PriceUnavailableError);
  EXPECT_EQ(transitions.back().state, PipelineState::Failed);
}
