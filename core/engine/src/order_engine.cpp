#include "gmx/engine/order_engine.hpp"
#include "gmx/allowance/allowance_manager.hpp"
#include "gmx/codec/json_codec.hpp"
#include "gmx/core/errors.hpp"
#include "gmx/gas/data_store_gas_limit_table.hpp"
#include "gmx/gas/gas_budgeter.hpp"
#include "gmx/gateway/rpc_ledger_gateway.hpp"
#include "gmx/network/rpc_channel.hpp"
#include "gmx/oracle/rpc_price_oracle.hpp"
#include "gmx/registry/json_registry.hpp"
#include "gmx/signing/rpc_signer.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <stdexcept>
#include <utility>

namespace gmx {

// -----------------------------------------------------------------------------
// Constructors / destructor
// -----------------------------------------------------------------------------
OrderEngine::OrderEngine(EngineConfig config) : config_(std::move(config)) {}

OrderEngine::OrderEngine(EngineConfig config,
                         EngineCollaborators collaborators)
    : config_(std::move(config)), injected_(collaborators) {}

OrderEngine::~OrderEngine() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void OrderEngine::start() {
  if (running_.load()) {
    return;
  }

  // ---  1) Collaborators -----------------------------------------------------
  if (injected_.has_value()) {
    gateway_ = &injected_->gateway;
    signer_ = &injected_->signer;
    oracle_ = &injected_->oracle;
    tokens_ = &injected_->tokens;
    markets_ = &injected_->markets;
    gas_table_ = &injected_->gas_table;
  } else {
    createCollaborators();
  }

  // ---  2) Pool and pipeline components -------------------------------------
  pool_ = std::make_unique<WorkerPool>(config_.worker_threads);
  resolver_ = std::make_unique<ParameterResolver>(
      *tokens_, *markets_, *oracle_, *pool_, config_.limits,
      config_.debug_mode);
  pipeline_ = std::make_unique<OrderPipeline>(*gateway_, *signer_, *oracle_,
                                              *gas_table_, *pool_, bus_,
                                              run_ids_);

  // ---  3) Run counters -------------------------------------------------------
  counter_subscription_ = bus_.subscribe<PipelineStateEvent>(
      [this](const PipelineStateEvent& e) {
        if (e.state == PipelineState::Broadcast ||
            e.state == PipelineState::Discarded) {
          completed_runs_.fetch_add(1);
        } else if (e.state == PipelineState::Failed) {
          failed_runs_.fetch_add(1);
        }
      });

  running_.store(true);

  // ---  4) IpcServer LAST -----------------------------------------------------
  if (!config_.ipc_cmd_endpoint.empty() && !config_.ipc_pub_endpoint.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.ipc_cmd_endpoint, config_.ipc_pub_endpoint);
    telemetry_subscription_ = bus_.subscribe(
        [this](const Event& e) { ipc_server_->pushTelemetry(e); });
    ipc_server_->start();
  }

  std::cout << "[OrderEngine] started. chain=" << config_.chain
            << " wallet=" << signer_->address()
            << " workers=" << pool_->size()
            << " mode=" << submitModeName(defaultMode())
            << (ipc_server_ ? " ipc=on" : " ipc=off") << "\n";
}

// -----------------------------------------------------------------------------
// createCollaborators(): ZeroMQ bridge stack from config
// -----------------------------------------------------------------------------
void OrderEngine::createCollaborators() {
  gateway_channel_ = std::make_unique<RpcChannel>(
      "gateway", config_.gateway_endpoint, config_.rpc_timeout_ms);
  signer_channel_ = std::make_unique<RpcChannel>(
      "signer", config_.signer_endpoint, config_.rpc_timeout_ms);

  rpc_gateway_ = std::make_unique<RpcLedgerGateway>(*gateway_channel_);
  rpc_gateway_->connect();

  const std::uint64_t bridge_chain_id = rpc_gateway_->chainId();
  if (bridge_chain_id != config_.chain_id) {
    throw ConfigError("chain_id " + std::to_string(config_.chain_id) +
                      " does not match the gateway's chain id " +
                      std::to_string(bridge_chain_id));
  }

  rpc_signer_ =
      std::make_unique<RpcSigner>(*signer_channel_, config_.wallet_address);
  rpc_oracle_ = std::make_unique<RpcPriceOracle>(*gateway_channel_);

  const nlohmann::json registry = loadRegistryDocument(config_.registry_file);
  json_tokens_ = std::make_unique<JsonTokenRegistry>(registry);
  json_markets_ = std::make_unique<JsonMarketRegistry>(registry);

  datastore_gas_table_ = std::make_unique<DataStoreGasLimitTable>(
      *rpc_gateway_, config_.contracts.datastore);

  gateway_ = rpc_gateway_.get();
  signer_ = rpc_signer_.get();
  oracle_ = rpc_oracle_.get();
  tokens_ = json_tokens_.get();
  markets_ = json_markets_.get();
  gas_table_ = datastore_gas_table_.get();
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void OrderEngine::stop() {
  if (!running_.load()) {
    return;
  }

  // ---  1) IPC first: executeCommand() uses every component below ------------
  if (telemetry_subscription_.has_value()) {
    bus_.unsubscribe(*telemetry_subscription_);
    telemetry_subscription_.reset();
  }
  ipc_server_.reset();

  if (counter_subscription_.has_value()) {
    bus_.unsubscribe(*counter_subscription_);
    counter_subscription_.reset();
  }

  // ---  2) Components, then the pool they submit to --------------------------
  pipeline_.reset();
  resolver_.reset();
  pool_.reset();

  // ---  3) Bridge stack --------------------------------------------------------
  gateway_ = nullptr;
  signer_ = nullptr;
  oracle_ = nullptr;
  tokens_ = nullptr;
  markets_ = nullptr;
  gas_table_ = nullptr;
  datastore_gas_table_.reset();
  json_markets_.reset();
  json_tokens_.reset();
  rpc_oracle_.reset();
  rpc_signer_.reset();
  rpc_gateway_.reset();
  signer_channel_.reset();
  gateway_channel_.reset();

  running_.store(false);

  std::cout << "[OrderEngine] stopped. completed=" << completed_runs_.load()
            << " failed=" << failed_runs_.load() << "\n";
}

// -----------------------------------------------------------------------------
// Operations
// -----------------------------------------------------------------------------
domain::ResolvedOrder OrderEngine::resolve(
    const domain::OrderRequest& request) {
  requireRunning();
  return resolver_->resolve(request);
}

domain::AllowanceOutcome OrderEngine::ensureAllowance(const std::string& token,
                                                      const BigInt& required) {
  requireRunning();

  std::optional<BigInt> fee_override;
  if (config_.max_fee_per_gas.has_value()) {
    fee_override = parseBigInt(*config_.max_fee_per_gas);
  }
  GasBudgeter budgeter(*gas_table_, *gateway_, config_.limits, fee_override);

  AllowanceManager allowances(*gateway_, *signer_, *pool_,
                              config_.wrapped_native_address,
                              config_.chain_id);
  return allowances.ensureAllowance(
      config_.wallet_address, config_.contracts.synthetics_router, token,
      required, budgeter.maxFeePerGas(), config_.auto_approve);
}

SubmissionReceipt OrderEngine::buildAndSubmit(
    const domain::ResolvedOrder& order, SubmitMode mode) {
  requireRunning();
  return pipeline_->buildAndSubmit(order, config_, mode);
}

SubmissionReceipt OrderEngine::submit(const domain::OrderRequest& request,
                                      SubmitMode mode) {
  return buildAndSubmit(resolve(request), mode);
}

// -----------------------------------------------------------------------------
// executeCommand(): handle IPC command requests
// -----------------------------------------------------------------------------
std::string OrderEngine::executeCommand(const std::string& cmd) {
  nlohmann::json response;

  try {
    const nlohmann::json request = nlohmann::json::parse(cmd);
    if (!request.is_object() || !request.contains("cmd") ||
        !request["cmd"].is_string()) {
      throw std::invalid_argument("request must be an object with a 'cmd'");
    }
    const std::string name = request["cmd"].get<std::string>();

    if (name == "PING") {
      response["status"] = "ok";
      response["response"] = "PONG";
    } else if (name == "STATUS") {
      response["status"] = "ok";
      response["chain"] = config_.chain;
      response["chain_id"] = config_.chain_id;
      response["wallet"] = config_.wallet_address;
      response["mode"] = submitModeName(defaultMode());
      response["running"] = running_.load();
      response["completed_runs"] = completed_runs_.load();
      response["failed_runs"] = failed_runs_.load();
    } else if (name == "RESOLVE") {
      const domain::ResolvedOrder order =
          resolve(orderRequestFromJson(request.value("order", nlohmann::json())));
      response["status"] = "ok";
      response["order"] = toJson(order);
    } else if (name == "SUBMIT") {
      SubmitMode mode = defaultMode();
      if (auto it = request.find("mode"); it != request.end()) {
        const std::string text = it->get<std::string>();
        if (text == "live") {
          mode = SubmitMode::Live;
        } else if (text == "simulate") {
          mode = SubmitMode::Simulate;
        } else {
          throw std::invalid_argument("unknown mode '" + text + "'");
        }
      }
      const SubmissionReceipt receipt = submit(
          orderRequestFromJson(request.value("order", nlohmann::json())), mode);
      response["status"] = "ok";
      response["receipt"] = toJson(receipt);
    } else {
      response["status"] = "error";
      response["kind"] = "InvalidRequest";
      response["message"] = "Unknown command: " + name;
    }
  } catch (const nlohmann::json::exception& e) {
    response = nlohmann::json::object();
    response["status"] = "error";
    response["kind"] = "InvalidRequest";
    response["message"] = e.what();
  } catch (const std::exception& e) {
    response = errorToJson(e);
    std::cerr << "[OrderEngine] command rejected: " << e.what() << "\n";
  }

  return response.dump();
}

// -----------------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------------
void OrderEngine::requireRunning() const {
  if (!running_.load()) {
    throw std::logic_error("OrderEngine is not started");
  }
}

SubmitMode OrderEngine::defaultMode() const {
  return config_.simulate ? SubmitMode::Simulate : SubmitMode::Live;
}

}  // namespace gmx
