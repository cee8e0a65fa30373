#include "gmx/allowance/allowance_manager.hpp"
#include "gmx/core/errors.hpp"
#include "gmx/domain/address.hpp"

#include <nlohmann/json.hpp>

#include <future>
#include <iostream>
#include <utility>
#include <vector>

namespace gmx {

namespace {

// Synthetic BTC index token → wrapped BTC collateral token.
constexpr const char* kLegacyTokenAlias[2] = {
    "0x47904963fc8b2340414262125aF798B9655E58Cd",
    "0x2f2a2543B76A4166549F7aaB2e75Bef0aefC5B0f",
};

}  // namespace

AllowanceManager::AllowanceManager(ILedgerGateway& gateway, ISigner& signer,
                                   WorkerPool& pool,
                                   std::string wrapped_native_address,
                                   std::uint64_t chain_id)
    : gateway_(gateway),
      signer_(signer),
      pool_(pool),
      wrapped_native_address_(std::move(wrapped_native_address)),
      chain_id_(chain_id) {}

std::string AllowanceManager::legacyTokenAlias(const std::string& token) {
  if (domain::sameAddress(token, kLegacyTokenAlias[0])) {
    return kLegacyTokenAlias[1];
  }
  return token;
}

// -----------------------------------------------------------------------------
// ensureAllowance()
// -----------------------------------------------------------------------------
domain::AllowanceOutcome AllowanceManager::ensureAllowance(
    const std::string& owner, const std::string& spender,
    const std::string& token, const BigInt& required,
    const BigInt& max_fee_per_gas, bool auto_approve) {
  domain::AllowanceOutcome outcome;
  outcome.token_address = legacyTokenAlias(token);
  const std::string& checked = outcome.token_address;
  const bool native = domain::sameAddress(checked, wrapped_native_address_);

  // --- Balance and allowance, read concurrently ------------------------------
  std::vector<std::future<BigInt>> reads;
  reads.push_back(pool_.submit([this, native, &checked, &owner] {
    return native ? gateway_.nativeBalance(owner)
                  : gateway_.tokenBalance(checked, owner);
  }));
  reads.push_back(pool_.submit([this, &checked, &owner, &spender] {
    return gateway_.allowance(checked, owner, spender);
  }));
  std::vector<BigInt> values = joinAll(reads);
  outcome.balance = values[0];
  outcome.allowance = values[1];

  if (outcome.balance < required) {
    std::cerr << "[AllowanceManager] balance of " << checked << " is "
              << outcome.balance << ", need " << required << "\n";
    throw ThresholdError(ErrorKind::InsufficientBalance,
                         "balance of " + checked, formatInteger(outcome.balance),
                         formatInteger(required));
  }

  if (outcome.allowance >= required) {
    outcome.status = domain::AllowanceStatus::Sufficient;
    return outcome;
  }

  if (!auto_approve) {
    throw ThresholdError(ErrorKind::AllowanceTooLow,
                         "allowance of " + checked + " for " + spender,
                         formatInteger(outcome.allowance),
                         formatInteger(required));
  }

  // --- Approve exactly the required amount -----------------------------------
  std::cout << "[AllowanceManager] approving " << required << " of " << checked
            << " for " << spender << " (current " << outcome.allowance
            << ")\n";

  domain::SignedTransaction signed_tx = signer_.sign(
      approvalEnvelope(owner, spender, checked, required, max_fee_per_gas));
  outcome.approval_tx_id = gateway_.submit(signed_tx);
  outcome.status = domain::AllowanceStatus::Approved;

  std::cout << "[AllowanceManager] approval broadcast: "
            << *outcome.approval_tx_id << "\n";
  return outcome;
}

// -----------------------------------------------------------------------------
// approvalEnvelope()
// -----------------------------------------------------------------------------
domain::TransactionEnvelope AllowanceManager::approvalEnvelope(
    const std::string& owner, const std::string& spender,
    const std::string& token, const BigInt& amount,
    const BigInt& max_fee_per_gas) {
  domain::TransactionEnvelope envelope;
  envelope.from = owner;
  envelope.to = token;
  envelope.data = gateway_.encodeCall(
      token, "approve", nlohmann::json::array({spender, amount.str()}));
  envelope.value = 0;
  envelope.chain_id = chain_id_;
  envelope.gas = kApprovalGasLimit;
  envelope.max_fee_per_gas = max_fee_per_gas;
  envelope.max_priority_fee_per_gas = 0;
  // Read last: the nonce belongs to this transaction only.
  envelope.nonce = gateway_.nonce(owner);
  return envelope;
}

}  // namespace gmx
