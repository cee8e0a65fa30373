#include "gmx/signing/rpc_signer.hpp"
#include "gmx/codec/json_codec.hpp"
#include "gmx/domain/address.hpp"

#include <nlohmann/json.hpp>

#include <utility>

namespace gmx {

RpcSigner::RpcSigner(RpcChannel& channel, std::string address)
    : channel_(channel), address_(std::move(address)) {}

// -----------------------------------------------------------------------------
// sign()
// -----------------------------------------------------------------------------
domain::SignedTransaction RpcSigner::sign(
    const domain::TransactionEnvelope& envelope) {
  if (!domain::sameAddress(envelope.from, address_)) {
    throw GatewayError("signer holds " + address_ + ", envelope is from " +
                       envelope.from);
  }

  nlohmann::json reply;
  {
    std::lock_guard lock(mutex_);
    reply = channel_.call("sign_transaction", toJson(envelope));
  }

  auto raw = reply.find("raw");
  auto hash = reply.find("hash");
  if (!reply.is_object() || raw == reply.end() || !raw->is_string() ||
      hash == reply.end() || !hash->is_string()) {
    throw GatewayError("sign_transaction: reply lacks raw/hash strings");
  }

  domain::SignedTransaction signed_tx;
  signed_tx.envelope = envelope;
  signed_tx.raw = raw->get<std::string>();
  signed_tx.hash = hash->get<std::string>();
  return signed_tx;
}

}  // namespace gmx
