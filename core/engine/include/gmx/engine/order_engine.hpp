#pragma once

#include "gmx/concurrent/run_id_generator.hpp"
#include "gmx/concurrent/worker_pool.hpp"
#include "gmx/config/engine_config.hpp"
#include "gmx/domain/allowance_outcome.hpp"
#include "gmx/domain/order_request.hpp"
#include "gmx/domain/resolved_order.hpp"
#include "gmx/eventbus/event_bus.hpp"
#include "gmx/gas/i_gas_limit_table.hpp"
#include "gmx/gateway/i_ledger_gateway.hpp"
#include "gmx/network/ipc_server.hpp"
#include "gmx/oracle/i_price_oracle.hpp"
#include "gmx/order/order_pipeline.hpp"
#include "gmx/order/submission_receipt.hpp"
#include "gmx/registry/i_registries.hpp"
#include "gmx/resolver/parameter_resolver.hpp"
#include "gmx/signing/i_signer.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <string>

namespace gmx {

class RpcChannel;
class RpcLedgerGateway;
class RpcSigner;
class RpcPriceOracle;
class JsonTokenRegistry;
class JsonMarketRegistry;
class DataStoreGasLimitTable;

// -----------------------------------------------------------------------------
// EngineCollaborators
// -----------------------------------------------------------------------------
// Externally owned collaborator set. Passing one to OrderEngine replaces the
// ZeroMQ bridge stack (tests, embedding). Every reference must outlive the
// engine.
// -----------------------------------------------------------------------------
struct EngineCollaborators {
  ILedgerGateway& gateway;
  ISigner& signer;
  IPriceOracle& oracle;
  ITokenRegistry& tokens;
  IMarketRegistry& markets;
  IGasLimitTable& gas_table;
};

// -----------------------------------------------------------------------------
// OrderEngine
// -----------------------------------------------------------------------------
//
// @brief  Root object of the order daemon: owns the configuration, the
//         collaborator stack, the worker pool, the event bus and the IPC
//         server, and exposes the three public operations.
//
// @details
// Operations:
//   resolve(request)             ParameterResolver::resolve
//   ensureAllowance(token, amt)  AllowanceManager::ensureAllowance with the
//                                configured wallet and synthetics router
//   buildAndSubmit(order, mode)  OrderPipeline::buildAndSubmit
//   submit(request, mode)        resolve, then buildAndSubmit
//
// Startup sequence (start()):
//   1. Collaborators. Without an injected set: open the gateway and signer
//      RpcChannels, run the gateway capability check (connect()), verify
//      the bridge's chain id against the config, load the registry file.
//   2. WorkerPool, ParameterResolver, OrderPipeline.
//   3. Run counters subscribe to the EventBus.
//   4. IpcServer LAST (if configured), so no command arrives before the
//      pipeline exists. Its telemetry bridge forwards every bus event.
//
// stop() tears down in reverse order. Both are idempotent.
//
// Thread model:
//   start()/stop() from the owning thread (main). The operations may be
//   called from any thread between start() and stop(); with the IPC server
//   running, commands execute on the IPC thread.
//
// Ownership:
//   OrderEngine
//    ├── config_            (EngineConfig, immutable after construction)
//    ├── run_ids_, bus_     (value members, outlive every component)
//    ├── channels + Rpc*    (unique_ptr, only without injected collaborators)
//    ├── pool_              (unique_ptr<WorkerPool>)
//    ├── resolver_          (unique_ptr<ParameterResolver>)
//    ├── pipeline_          (unique_ptr<OrderPipeline>)
//    └── ipc_server_        (unique_ptr<IpcServer>)
// -----------------------------------------------------------------------------
class OrderEngine {
 public:
  // Production: the collaborators are created from config in start().
  explicit OrderEngine(EngineConfig config);

  // Injected collaborators; no bridge channel is opened.
  OrderEngine(EngineConfig config, EngineCollaborators collaborators);

  ~OrderEngine();

  OrderEngine(const OrderEngine&) = delete;
  OrderEngine& operator=(const OrderEngine&) = delete;
  OrderEngine(OrderEngine&&) = delete;
  OrderEngine& operator=(OrderEngine&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // @throws GatewayError  bridge unreachable or interface unsupported
  // @throws ConfigError   registry file invalid, chain id mismatch
  // @throws zmq::error_t  IPC endpoint cannot be bound
  // -------------------------------------------------------------------------
  void start();
  void stop();

  domain::ResolvedOrder resolve(const domain::OrderRequest& request);

  domain::AllowanceOutcome ensureAllowance(const std::string& token,
                                           const BigInt& required);

  SubmissionReceipt buildAndSubmit(const domain::ResolvedOrder& order,
                                   SubmitMode mode);

  SubmissionReceipt submit(const domain::OrderRequest& request,
                           SubmitMode mode);

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  // @brief  Handles one JSON command from the IPC server.
  //
  // @details
  //   {"cmd":"PING"}                      → {"status":"ok","response":"PONG"}
  //   {"cmd":"STATUS"}                    → chain, wallet, mode, counters
  //   {"cmd":"RESOLVE","order":{...}}     → {"status":"ok","order":{...}}
  //   {"cmd":"SUBMIT","order":{...},
  //    "mode":"live"|"simulate"}          → {"status":"ok","receipt":{...}}
  //
  // Every failure, malformed JSON included, is answered with
  // {"status":"error","kind":...,"message":...}; nothing escapes to the
  // IPC thread.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  EventBus& eventBus() { return bus_; }
  const EngineConfig& config() const { return config_; }

  // Runs that reached Broadcast or Discarded / runs that reached Failed.
  std::uint64_t completedRuns() const { return completed_runs_.load(); }
  std::uint64_t failedRuns() const { return failed_runs_.load(); }

 private:
  void createCollaborators();
  void requireRunning() const;
  SubmitMode defaultMode() const;

  const EngineConfig config_;
  std::optional<EngineCollaborators> injected_;

  // --- Value members (outlive every component) ------------------------------
  RunIdGenerator run_ids_;
  EventBus bus_;

  // --- Bridge stack, only without injected collaborators ---------------------
  std::unique_ptr<RpcChannel> gateway_channel_;
  std::unique_ptr<RpcChannel> signer_channel_;
  std::unique_ptr<RpcLedgerGateway> rpc_gateway_;
  std::unique_ptr<RpcSigner> rpc_signer_;
  std::unique_ptr<RpcPriceOracle> rpc_oracle_;
  std::unique_ptr<JsonTokenRegistry> json_tokens_;
  std::unique_ptr<JsonMarketRegistry> json_markets_;
  std::unique_ptr<DataStoreGasLimitTable> datastore_gas_table_;

  // --- Active collaborators (injected or owned above) ------------------------
  ILedgerGateway* gateway_{nullptr};
  ISigner* signer_{nullptr};
  IPriceOracle* oracle_{nullptr};
  ITokenRegistry* tokens_{nullptr};
  IMarketRegistry* markets_{nullptr};
  IGasLimitTable* gas_table_{nullptr};

  // --- Components -------------------------------------------------------------
  std::unique_ptr<WorkerPool> pool_;
  std::unique_ptr<ParameterResolver> resolver_;
  std::unique_ptr<OrderPipeline> pipeline_;
  std::unique_ptr<IpcServer> ipc_server_;

  std::optional<EventBus::SubscriptionId> counter_subscription_;
  std::optional<EventBus::SubscriptionId> telemetry_subscription_;
  std::atomic<std::uint64_t> completed_runs_{0};
  std::atomic<std::uint64_t> failed_runs_{0};
  std::atomic<bool> running_{false};
};

}  // namespace gmx
