#pragma once

#include "gmx/domain/transaction.hpp"
#include "gmx/numeric/fixed_point.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <string>

namespace gmx {

// -----------------------------------------------------------------------------
// ILedgerGateway — the engine's only view of the distributed ledger
// -----------------------------------------------------------------------------
//
// @brief  Read chain state, call and encode contract methods, and broadcast
//         signed transactions.
//
// @details
// Contract calls are addressed by contract address plus method name; the
// gateway owns the ABI tables. `args` is a JSON array of call arguments in
// ABI order, with every integer passed as a decimal string so uint256 values
// are never rounded through a double. The structured createOrder parameters
// travel as a nested JSON object.
//
// Reads may be issued concurrently from the WorkerPool. submit() is only
// ever called from the pipeline's thread.
//
// Failure contract:
//   reads and encodeCall()  throw GatewayError
//   submit()                throws SubmissionFailedError when the node
//                           rejects the broadcast or the transport fails
//                           mid-submission
// -----------------------------------------------------------------------------
class ILedgerGateway {
 public:
  virtual ~ILedgerGateway() = default;

  virtual std::uint64_t chainId() = 0;

  // Base fee of the latest block, wei.
  virtual BigInt baseFee() = 0;

  // Next usable nonce of `address` (pending transactions included).
  virtual std::uint64_t nonce(const std::string& address) = 0;

  virtual BigInt nativeBalance(const std::string& owner) = 0;

  virtual BigInt tokenBalance(const std::string& token,
                              const std::string& owner) = 0;

  virtual BigInt allowance(const std::string& token, const std::string& owner,
                           const std::string& spender) = 0;

  // Read-only contract call (eth_call). Returns the decoded result.
  virtual nlohmann::json call(const std::string& contract,
                              const std::string& method,
                              const nlohmann::json& args) = 0;

  // ABI-encodes method(args) for `contract` and returns 0x-prefixed calldata.
  virtual std::string encodeCall(const std::string& contract,
                                 const std::string& method,
                                 const nlohmann::json& args) = 0;

  // Broadcasts the raw payload. Returns the transaction id.
  virtual std::string submit(const domain::SignedTransaction& tx) = 0;
};

}  // namespace gmx
