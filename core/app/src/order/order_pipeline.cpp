#include "gmx/order/order_pipeline.hpp"
#include "gmx/allowance/allowance_manager.hpp"
#include "gmx/core/errors.hpp"
#include "gmx/domain/address.hpp"
#include "gmx/gas/gas_budgeter.hpp"
#include "gmx/pricing/price_calculator.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <optional>
#include <utility>

namespace gmx {

namespace {

const std::string kZeroReferralCode =
    "0x0000000000000000000000000000000000000000000000000000000000000000";

// -----------------------------------------------------------------------------
// RunTracker
// -----------------------------------------------------------------------------
// Holds the current state of one run and publishes every transition.
// -----------------------------------------------------------------------------
class RunTracker {
 public:
  RunTracker(EventBus& bus, std::uint64_t run_id, domain::OrderKind kind,
             bool verbose)
      : bus_(bus), run_id_(run_id), kind_(kind), verbose_(verbose) {
    publish(PipelineState::Initialized, "run started");
  }

  void advance(PipelineState next, const std::string& detail) {
    publish(next, detail);
    if (verbose_ || isTerminal(next)) {
      std::cout << "[OrderPipeline] run " << run_id_ << " ("
                << domain::orderKindName(kind_) << ") "
                << pipelineStateName(next)
                << (detail.empty() ? "" : ": " + detail) << "\n";
    }
  }

  void fail(const std::string& reason) {
    publish(PipelineState::Failed, reason);
    std::cerr << "[OrderPipeline] run " << run_id_ << " ("
              << domain::orderKindName(kind_) << ") Failed in "
              << pipelineStateName(previous_) << ": " << reason << "\n";
  }

  PipelineState state() const { return state_; }
  std::uint64_t runId() const { return run_id_; }

 private:
  void publish(PipelineState next, const std::string& detail) {
    PipelineStateEvent event;
    event.run_id = run_id_;
    event.kind = kind_;
    event.previous_state = state_;
    event.state = next;
    event.detail = detail;
    event.timestamp = std::chrono::system_clock::now();
    previous_ = state_;
    state_ = next;
    bus_.publish(event);
  }

  EventBus& bus_;
  std::uint64_t run_id_;
  domain::OrderKind kind_;
  bool verbose_;
  PipelineState state_{PipelineState::Initialized};
  PipelineState previous_{PipelineState::Initialized};
};

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
OrderPipeline::OrderPipeline(ILedgerGateway& gateway, ISigner& signer,
                             IPriceOracle& oracle, IGasLimitTable& gas_table,
                             WorkerPool& pool, EventBus& bus,
                             RunIdGenerator& run_ids)
    : gateway_(gateway),
      signer_(signer),
      oracle_(oracle),
      gas_table_(gas_table),
      pool_(pool),
      bus_(bus),
      run_ids_(run_ids) {}

// -----------------------------------------------------------------------------
// buildAndSubmit()
// -----------------------------------------------------------------------------
SubmissionReceipt OrderPipeline::buildAndSubmit(
    const domain::ResolvedOrder& order, const EngineConfig& config,
    SubmitMode mode) {
  const domain::OrderKindTraits traits = domain::traitsFor(order.kind);

  SubmissionReceipt receipt;
  receipt.run_id = run_ids_.next_id();
  receipt.mode = mode;
  receipt.order = order;

  RunTracker run(bus_, receipt.run_id, order.kind, config.debug_mode);

  std::optional<BigInt> fee_override;
  if (config.max_fee_per_gas.has_value()) {
    fee_override = parseBigInt(*config.max_fee_per_gas);
  }
  GasBudgeter budgeter(gas_table_, gateway_, config.limits, fee_override);

  try {
    run.advance(PipelineState::Resolved,
                std::string(submitModeName(mode)) + " " +
                    domain::orderKindName(order.kind) + " on " + order.chain);

    // --- Allowance: settled before any price or gas input is read ------------
    if (order.kind == domain::OrderKind::Increase && config.check_allowance) {
      AllowanceManager allowances(gateway_, signer_, pool_,
                                  config.wrapped_native_address,
                                  config.chain_id);
      receipt.allowance = allowances.ensureAllowance(
          config.wallet_address, config.contracts.synthetics_router,
          order.start_token_address, order.collateral_delta_scaled,
          budgeter.maxFeePerGas(), config.auto_approve);

      AllowanceEvent event;
      event.run_id = receipt.run_id;
      event.token_address = receipt.allowance->token_address;
      event.spender = config.contracts.synthetics_router;
      event.required_amount = formatInteger(order.collateral_delta_scaled);
      event.approval_tx_id = receipt.allowance->approval_tx_id.value_or("");
      event.timestamp = std::chrono::system_clock::now();
      bus_.publish(event);
    }

    // --- Priced -----------------------------------------------------------------
    receipt.price = priceOrder(order);
    run.advance(PipelineState::Priced,
                "acceptable_price=" + formatInteger(receipt.price.acceptable_price) +
                    " (" + formatDecimal(receipt.price.acceptable_price_usd, 6) +
                    " USD)");

    // --- Budgeted ---------------------------------------------------------------
    receipt.gas = budgeter.budget(order.kind);
    run.advance(PipelineState::Budgeted,
                std::string(traits.gas_limit_key) +
                    " base=" + formatInteger(receipt.gas.base_estimate) +
                    " ceiling=" + formatInteger(receipt.gas.ceiling) +
                    " max_fee=" + formatInteger(receipt.gas.max_fee_per_gas));

    // --- Enveloped --------------------------------------------------------------
    receipt.envelope = assemble(order, receipt.price, receipt.gas, config);
    run.advance(PipelineState::Enveloped,
                "nonce=" + std::to_string(receipt.envelope.nonce) +
                    " calls=" +
                    std::to_string(receipt.envelope.multicall_args.size()));

    // --- Signed -----------------------------------------------------------------
    domain::SignedTransaction signed_tx = signer_.sign(receipt.envelope);
    receipt.tx_hash = signed_tx.hash;
    run.advance(PipelineState::Signed, signed_tx.hash);

    // --- Broadcast | Discarded ----------------------------------------------------
    if (mode == SubmitMode::Simulate) {
      run.advance(PipelineState::Discarded, "simulate mode, not sent");
    } else {
      receipt.tx_id = gateway_.submit(signed_tx);
      run.advance(PipelineState::Broadcast, *receipt.tx_id);
    }
  } catch (const std::exception& e) {
    run.fail(e.what());
    throw;
  }

  receipt.state = run.state();
  return receipt;
}

// -----------------------------------------------------------------------------
// priceOrder(): fresh snapshot, then the price law
// -----------------------------------------------------------------------------
domain::ExecutionPrice OrderPipeline::priceOrder(
    const domain::ResolvedOrder& order) {
  const domain::OrderKindTraits traits = domain::traitsFor(order.kind);

  // Position orders are priced on the index token, swaps on the start token.
  const bool is_swap = order.kind == domain::OrderKind::Swap;
  const std::string& token =
      is_swap ? order.start_token_address : order.index_token_address;
  const int decimals =
      is_swap ? order.start_token_decimals : order.index_token_decimals;

  domain::OracleSnapshot snapshot;
  try {
    snapshot = oracle_.snapshot(order.chain);
  } catch (const GatewayError& e) {
    throw PriceUnavailableError(token,
                                std::string("oracle read failed: ") + e.what());
  }
  return PriceCalculator::priceFor(snapshot, token, decimals, order.is_long,
                                   traits.intent, order.slippage_percent);
}

// -----------------------------------------------------------------------------
// createOrderParams()
// -----------------------------------------------------------------------------
nlohmann::json OrderPipeline::createOrderParams(
    const domain::ResolvedOrder& order, const domain::ExecutionPrice& price,
    const std::string& receiver) {
  const domain::OrderKindTraits traits = domain::traitsFor(order.kind);
  const bool is_swap = order.kind == domain::OrderKind::Swap;

  nlohmann::json addresses;
  addresses["receiver"] = receiver;
  addresses["callbackContract"] = domain::zeroAddress();
  addresses["uiFeeReceiver"] = domain::zeroAddress();
  addresses["market"] = is_swap ? domain::zeroAddress() : order.market_key;
  addresses["initialCollateralToken"] = order.start_token_address;
  addresses["swapPath"] = order.swap_path;

  // The collateral delta is only a field of the order for decreases; the
  // other kinds move collateral with sendTokens/sendWnt.
  const BigInt collateral_delta = order.kind == domain::OrderKind::Decrease
                                      ? order.collateral_delta_scaled
                                      : BigInt(0);

  nlohmann::json numbers;
  numbers["sizeDeltaUsd"] = formatInteger(order.size_delta_scaled.value_or(0));
  numbers["initialCollateralDeltaAmount"] = formatInteger(collateral_delta);
  numbers["triggerPrice"] = "0";
  numbers["acceptablePrice"] = formatInteger(price.acceptable_price);
  numbers["executionFee"] = "0";
  numbers["callbackGasLimit"] = "0";
  numbers["minOutputAmount"] = "0";

  nlohmann::json params;
  params["addresses"] = std::move(addresses);
  params["numbers"] = std::move(numbers);
  params["orderType"] = traits.order_type;
  params["decreasePositionSwapType"] = 0;
  params["isLong"] = order.is_long;
  params["shouldUnwrapNativeToken"] = true;
  params["referralCode"] = kZeroReferralCode;
  return params;
}

// -----------------------------------------------------------------------------
// assemble(): encode the multicall, read the nonce last
// -----------------------------------------------------------------------------
domain::TransactionEnvelope OrderPipeline::assemble(
    const domain::ResolvedOrder& order, const domain::ExecutionPrice& price,
    const domain::GasPlan& gas, const EngineConfig& config) {
  const domain::OrderKindTraits traits = domain::traitsFor(order.kind);
  const std::string& router = config.contracts.exchange_router;
  const std::string amount = formatInteger(order.collateral_delta_scaled);

  domain::TransactionEnvelope envelope;
  envelope.from = config.wallet_address;
  envelope.to = router;

  if (traits.sends_collateral) {
    if (domain::sameAddress(order.start_token_address,
                            config.wrapped_native_address)) {
      envelope.multicall_args.push_back(gateway_.encodeCall(
          router, "sendWnt",
          nlohmann::json::array({config.contracts.order_vault, amount})));
      envelope.value = order.collateral_delta_scaled;
    } else {
      envelope.multicall_args.push_back(gateway_.encodeCall(
          router, "sendTokens",
          nlohmann::json::array({order.start_token_address,
                                 config.contracts.order_vault, amount})));
    }
  }
  envelope.multicall_args.push_back(gateway_.encodeCall(
      router, "createOrder",
      nlohmann::json::array(
          {createOrderParams(order, price, config.wallet_address)})));

  envelope.data = gateway_.encodeCall(
      router, "multicall", nlohmann::json::array({envelope.multicall_args}));
  envelope.chain_id = config.chain_id;
  envelope.gas = gas.ceiling;
  envelope.max_fee_per_gas = gas.max_fee_per_gas;
  envelope.max_priority_fee_per_gas = gas.max_priority_fee_per_gas;
  envelope.nonce = gateway_.nonce(config.wallet_address);
  return envelope;
}

}  // namespace gmx
