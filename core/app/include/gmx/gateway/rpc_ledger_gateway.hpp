#pragma once

#include "gmx/gateway/i_ledger_gateway.hpp"
#include "gmx/network/rpc_channel.hpp"

#include <atomic>
#include <string>

namespace gmx {

// -----------------------------------------------------------------------------
// GatewayMethodTable
// -----------------------------------------------------------------------------
// Bridge method names for one interface version. Node client libraries
// renamed their calls between major versions (getBalance → get_balance,
// rawTransaction → raw_transaction); the bridge exposes whichever one its
// client library speaks and reports the version through
// "interface_version".
// -----------------------------------------------------------------------------
struct GatewayMethodTable {
  int version;
  const char* chain_id;
  const char* base_fee;
  const char* nonce;
  const char* native_balance;
  const char* token_balance;
  const char* allowance;
  const char* call;
  const char* encode_call;
  const char* send_raw;
};

// Returns the table for `version`, or nullptr if the version is unknown.
const GatewayMethodTable* gatewayMethodTable(int version);

// -----------------------------------------------------------------------------
// RpcLedgerGateway
// -----------------------------------------------------------------------------
//
// @brief  ILedgerGateway over an RpcChannel to the node bridge.
//
// @details
// connect() asks the bridge for its interface version exactly once and
// selects one GatewayMethodTable. There is no per-call fallback between
// method names: a bridge that reports an unknown version is refused at
// startup.
//
// Integers travel as decimal strings in both directions; a bridge that
// answers with a JSON number is accepted as long as it is integral.
//
// Thread model:
//   connect() once, from the owning thread, before any other call. After
//   that every method is safe to call concurrently (RpcChannel is).
//
// Ownership:
//   Holds a non-owning reference to the RpcChannel, which must outlive it.
// -----------------------------------------------------------------------------
class RpcLedgerGateway : public ILedgerGateway {
 public:
  explicit RpcLedgerGateway(RpcChannel& channel);

  // @throws GatewayError if the bridge is unreachable or its version is
  //         not supported.
  void connect();

  int interfaceVersion() const;

  std::uint64_t chainId() override;
  BigInt baseFee() override;
  std::uint64_t nonce(const std::string& address) override;
  BigInt nativeBalance(const std::string& owner) override;
  BigInt tokenBalance(const std::string& token,
                      const std::string& owner) override;
  BigInt allowance(const std::string& token, const std::string& owner,
                   const std::string& spender) override;
  nlohmann::json call(const std::string& contract, const std::string& method,
                      const nlohmann::json& args) override;
  std::string encodeCall(const std::string& contract,
                         const std::string& method,
                         const nlohmann::json& args) override;
  std::string submit(const domain::SignedTransaction& tx) override;

 private:
  const GatewayMethodTable& methods() const;

  RpcChannel& channel_;
  std::atomic<const GatewayMethodTable*> methods_{nullptr};
};

}  // namespace gmx
