#include "gmx/gateway/rpc_ledger_gateway.hpp"
#include "gmx/codec/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <stdexcept>

namespace gmx {

namespace {

// Version 1: camelCase names of the older node client generation.
constexpr GatewayMethodTable kMethodsV1{
    1,
    "chainId",
    "getBaseFee",
    "getTransactionCount",
    "getBalance",
    "balanceOf",
    "allowance",
    "call",
    "encodeABI",
    "sendRawTransaction",
};

// Version 2: snake_case names of the current generation.
constexpr GatewayMethodTable kMethodsV2{
    2,
    "chain_id",
    "get_base_fee",
    "get_transaction_count",
    "get_balance",
    "balance_of",
    "allowance",
    "call",
    "encode_abi",
    "send_raw_transaction",
};

BigInt readBigInt(const nlohmann::json& v, const char* what) {
  try {
    return bigIntFromJson(v);
  } catch (const std::invalid_argument& e) {
    throw GatewayError(std::string(what) + ": " + e.what());
  }
}

std::uint64_t readUint64(const nlohmann::json& v, const char* what) {
  try {
    return uint64FromJson(v);
  } catch (const std::invalid_argument& e) {
    throw GatewayError(std::string(what) + ": " + e.what());
  }
}

}  // namespace

const GatewayMethodTable* gatewayMethodTable(int version) {
  switch (version) {
    case 1: return &kMethodsV1;
    case 2: return &kMethodsV2;
    default: return nullptr;
  }
}

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
RpcLedgerGateway::RpcLedgerGateway(RpcChannel& channel) : channel_(channel) {}

// -----------------------------------------------------------------------------
// connect(): one-time capability check
// -----------------------------------------------------------------------------
void RpcLedgerGateway::connect() {
  nlohmann::json reply = channel_.call("interface_version", nullptr);
  if (!reply.is_number_integer()) {
    throw GatewayError("interface_version: expected an integer, got " +
                       reply.dump());
  }
  const int version = reply.get<int>();
  const GatewayMethodTable* table = gatewayMethodTable(version);
  if (table == nullptr) {
    throw GatewayError("unsupported bridge interface version " +
                       std::to_string(version));
  }
  methods_.store(table);

  std::cout << "[RpcLedgerGateway] connected to " << channel_.endpoint()
            << " (interface v" << version << ")\n";
}

int RpcLedgerGateway::interfaceVersion() const {
  const GatewayMethodTable* table = methods_.load();
  return table != nullptr ? table->version : 0;
}

const GatewayMethodTable& RpcLedgerGateway::methods() const {
  const GatewayMethodTable* table = methods_.load();
  if (table == nullptr) {
    throw GatewayError("gateway used before connect()");
  }
  return *table;
}

// -----------------------------------------------------------------------------
// Chain reads
// -----------------------------------------------------------------------------
std::uint64_t RpcLedgerGateway::chainId() {
  return readUint64(channel_.call(methods().chain_id, nullptr), "chain id");
}

BigInt RpcLedgerGateway::baseFee() {
  return readBigInt(channel_.call(methods().base_fee, nullptr), "base fee");
}

std::uint64_t RpcLedgerGateway::nonce(const std::string& address) {
  nlohmann::json params = {{"address", address}, {"block", "pending"}};
  return readUint64(channel_.call(methods().nonce, params), "nonce");
}

BigInt RpcLedgerGateway::nativeBalance(const std::string& owner) {
  nlohmann::json params = {{"address", owner}};
  return readBigInt(channel_.call(methods().native_balance, params),
                    "native balance");
}

BigInt RpcLedgerGateway::tokenBalance(const std::string& token,
                                      const std::string& owner) {
  nlohmann::json params = {{"token", token}, {"owner", owner}};
  return readBigInt(channel_.call(methods().token_balance, params),
                    "token balance");
}

BigInt RpcLedgerGateway::allowance(const std::string& token,
                                   const std::string& owner,
                                   const std::string& spender) {
  nlohmann::json params = {
      {"token", token}, {"owner", owner}, {"spender", spender}};
  return readBigInt(channel_.call(methods().allowance, params), "allowance");
}

// -----------------------------------------------------------------------------
// Contract calls
// -----------------------------------------------------------------------------
nlohmann::json RpcLedgerGateway::call(const std::string& contract,
                                      const std::string& method,
                                      const nlohmann::json& args) {
  nlohmann::json params = {
      {"contract", contract}, {"method", method}, {"args", args}};
  return channel_.call(methods().call, params);
}

std::string RpcLedgerGateway::encodeCall(const std::string& contract,
                                         const std::string& method,
                                         const nlohmann::json& args) {
  nlohmann::json params = {
      {"contract", contract}, {"method", method}, {"args", args}};
  nlohmann::json reply = channel_.call(methods().encode_call, params);
  if (!reply.is_string()) {
    throw GatewayError("encode " + method + ": expected calldata string");
  }
  return reply.get<std::string>();
}

// -----------------------------------------------------------------------------
// submit(): broadcast; every failure here is a SubmissionFailed
// -----------------------------------------------------------------------------
std::string RpcLedgerGateway::submit(const domain::SignedTransaction& tx) {
  const char* method = methods().send_raw;
  nlohmann::json reply;
  try {
    reply = channel_.call(method, {{"raw", tx.raw}});
  } catch (const RpcRemoteError& e) {
    throw SubmissionFailedError("node rejected transaction: " +
                                e.remoteMessage());
  } catch (const GatewayError& e) {
    // The node may or may not have seen the payload; the caller decides
    // whether a new run is warranted.
    throw SubmissionFailedError(e.what());
  }
  if (!reply.is_string() || reply.get<std::string>().empty()) {
    throw SubmissionFailedError("node returned no transaction id");
  }
  return reply.get<std::string>();
}

}  // namespace gmx
