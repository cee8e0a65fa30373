#pragma once

#include "gmx/concurrent/run_id_generator.hpp"
#include "gmx/concurrent/worker_pool.hpp"
#include "gmx/config/engine_config.hpp"
#include "gmx/eventbus/event_bus.hpp"
#include "gmx/gas/i_gas_limit_table.hpp"
#include "gmx/gateway/i_ledger_gateway.hpp"
#include "gmx/oracle/i_price_oracle.hpp"
#include "gmx/order/submission_receipt.hpp"
#include "gmx/signing/i_signer.hpp"

#include <nlohmann/json_fwd.hpp>

namespace gmx {

// -----------------------------------------------------------------------------
// OrderPipeline — order builder and submitter
// -----------------------------------------------------------------------------
//
// @brief  Takes a ResolvedOrder through pricing, fee budgeting, assembly,
//         signing and (in live mode) broadcast.
//
// @details
// One pipeline type serves all three order kinds. What differs between
// kinds (gas-limit key, price intent, order type, whether collateral is
// sent) is read from domain::traitsFor(kind).
//
// Run sequence, each step publishing a PipelineStateEvent:
//
//   Initialized  run id assigned
//   Resolved     order accepted; for increase orders the allowance step
//                runs here and must succeed before anything else is read
//   Priced       fresh oracle snapshot → ExecutionPrice
//   Budgeted     fresh gas table and base fee → GasPlan
//   Enveloped    multicall encoded, nonce read last
//   Signed       signing service returned the raw payload
//   Broadcast    live mode: gateway accepted, tx id known
//   Discarded    simulate mode: never sent
//
// Any exception moves the run to Failed (published with the message) and
// is rethrown unchanged. No step is retried.
//
// Multicall contents (destination: exchange router):
//   increase  sendTokens(start, vault, amount) | sendWnt(vault, amount),
//             createOrder
//   decrease  createOrder
//   swap      sendTokens(start, vault, amount) | sendWnt(vault, amount),
//             createOrder
// sendWnt is used when the start token is the wrapped-native token; the
// envelope then carries value = amount. Otherwise value is 0.
//
// Thread model:
//   buildAndSubmit() runs on the caller's thread; concurrent runs are
//   independent (each reads its own nonce). Reads inside the allowance
//   step fan out on the WorkerPool.
//
// Ownership:
//   Non-owning references to every collaborator, the pool, the bus and the
//   run id generator; all must outlive the pipeline.
// -----------------------------------------------------------------------------
class OrderPipeline {
 public:
  OrderPipeline(ILedgerGateway& gateway, ISigner& signer, IPriceOracle& oracle,
                IGasLimitTable& gas_table, WorkerPool& pool, EventBus& bus,
                RunIdGenerator& run_ids);

  OrderPipeline(const OrderPipeline&) = delete;
  OrderPipeline& operator=(const OrderPipeline&) = delete;

  // -------------------------------------------------------------------------
  // buildAndSubmit(order, config, mode)
  // -------------------------------------------------------------------------
  // @return Receipt in state Broadcast (live) or Discarded (simulate).
  //
  // @throws ThresholdError         InsufficientBalance / AllowanceTooLow
  //                                from the allowance step
  // @throws PriceUnavailableError  no oracle price for the priced token
  // @throws SubmissionFailedError  broadcast rejected
  // @throws GatewayError           collaborator failure
  // -------------------------------------------------------------------------
  SubmissionReceipt buildAndSubmit(const domain::ResolvedOrder& order,
                                   const EngineConfig& config,
                                   SubmitMode mode);

  // createOrder parameter struct for `order` at `price`. Exposed for tests.
  static nlohmann::json createOrderParams(const domain::ResolvedOrder& order,
                                          const domain::ExecutionPrice& price,
                                          const std::string& receiver);

 private:
  domain::ExecutionPrice priceOrder(const domain::ResolvedOrder& order);

  domain::TransactionEnvelope assemble(const domain::ResolvedOrder& order,
                                       const domain::ExecutionPrice& price,
                                       const domain::GasPlan& gas,
                                       const EngineConfig& config);

  ILedgerGateway& gateway_;
  ISigner& signer_;
  IPriceOracle& oracle_;
  IGasLimitTable& gas_table_;
  WorkerPool& pool_;
  EventBus& bus_;
  RunIdGenerator& run_ids_;
};

}  // namespace gmx
