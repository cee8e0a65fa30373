#pragma once

#include "gmx/network/rpc_channel.hpp"
#include "gmx/signing/i_signer.hpp"

#include <mutex>
#include <string>

namespace gmx {

// -----------------------------------------------------------------------------
// RpcSigner
// -----------------------------------------------------------------------------
//
// @brief  ISigner backed by the key service over an RpcChannel.
//
// @details
// Request:  "sign_transaction" with the envelope as JSON (integers as
//           decimal strings).
// Reply:    {"raw": "0x...", "hash": "0x..."}
//
// Thread model:
//   sign() holds mutex_ for the whole round trip, so at most one signature
//   is in flight per signer.
//
// Ownership:
//   Non-owning reference to the channel; the channel must outlive it.
// -----------------------------------------------------------------------------
class RpcSigner : public ISigner {
 public:
  RpcSigner(RpcChannel& channel, std::string address);

  const std::string& address() const override { return address_; }

  domain::SignedTransaction sign(
      const domain::TransactionEnvelope& envelope) override;

 private:
  RpcChannel& channel_;
  std::string address_;
  std::mutex mutex_;
};

}  // namespace gmx
