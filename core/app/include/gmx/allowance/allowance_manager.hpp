#pragma once

#include "gmx/concurrent/worker_pool.hpp"
#include "gmx/domain/allowance_outcome.hpp"
#include "gmx/gateway/i_ledger_gateway.hpp"
#include "gmx/signing/i_signer.hpp"

#include <cstdint>
#include <string>

namespace gmx {

// -----------------------------------------------------------------------------
// AllowanceManager
// -----------------------------------------------------------------------------
//
// @brief  Makes sure a spender may move at least `required` of the owner's
//         tokens before an order that pulls collateral is submitted.
//
// @details
// Steps, in order:
//   1. Apply the legacy token alias (see legacyTokenAlias()).
//   2. Read balance and allowance concurrently on the WorkerPool. The
//      balance is the native balance when the token is the chain's
//      wrapped-native token, the token balance otherwise.
//   3. balance < required             → InsufficientBalance
//   4. allowance >= required          → Sufficient, no side effect
//   5. auto_approve == false          → AllowanceTooLow
//   6. otherwise approve(spender, required) for the exact amount, gas limit
//      kApprovalGasLimit, fresh nonce, signed and broadcast. Success as soon
//      as the gateway accepts the broadcast; no confirmation wait.
//
// Repeating the call with unchanged inputs submits at most one approval:
// once the allowance covers `required`, step 4 returns early.
//
// Thread model:
//   ensureAllowance() runs on the caller's thread; only the two reads are
//   dispatched to the pool. The approval write stays on the caller's thread.
//
// Ownership:
//   Non-owning references to gateway, signer and pool.
// -----------------------------------------------------------------------------
class AllowanceManager {
 public:
  static constexpr std::uint64_t kApprovalGasLimit = 4'000'000;

  AllowanceManager(ILedgerGateway& gateway, ISigner& signer, WorkerPool& pool,
                   std::string wrapped_native_address, std::uint64_t chain_id);

  // -------------------------------------------------------------------------
  // ensureAllowance()
  // -------------------------------------------------------------------------
  // @throws ThresholdError (InsufficientBalance, AllowanceTooLow)
  // @throws SubmissionFailedError if the approval broadcast is rejected
  // @throws GatewayError on read or signing failures
  // -------------------------------------------------------------------------
  domain::AllowanceOutcome ensureAllowance(const std::string& owner,
                                           const std::string& spender,
                                           const std::string& token,
                                           const BigInt& required,
                                           const BigInt& max_fee_per_gas,
                                           bool auto_approve);

  // -------------------------------------------------------------------------
  // legacyTokenAlias(token)
  // -------------------------------------------------------------------------
  // The exchange lists BTC under its synthetic index address
  // 0x47904963fc8b2340414262125aF798B9655E58Cd, which has no ERC-20
  // contract. Collateral held as wrapped BTC lives at
  // 0x2f2a2543B76A4166549F7aaB2e75Bef0aefC5B0f, so allowance checks are
  // redirected there. One entry; not a general alias mechanism.
  // -------------------------------------------------------------------------
  static std::string legacyTokenAlias(const std::string& token);

 private:
  domain::TransactionEnvelope approvalEnvelope(const std::string& owner,
                                               const std::string& spender,
                                               const std::string& token,
                                               const BigInt& amount,
                                               const BigInt& max_fee_per_gas);

  ILedgerGateway& gateway_;
  ISigner& signer_;
  WorkerPool& pool_;
  std::string wrapped_native_address_;
  std::uint64_t chain_id_;
};

}  // namespace gmx
