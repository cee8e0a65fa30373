#pragma once

#include "gmx/domain/transaction.hpp"

#include <string>

namespace gmx {

// -----------------------------------------------------------------------------
// ISigner — key/signing service
// -----------------------------------------------------------------------------
// Responsibility: Turn an unsigned envelope into a signed transaction. The
// private key never enters this process.
//
// Thread model: implementations serialize sign(); the signing credential is
// a single-writer resource.
//
// @throws GatewayError when the service is unreachable or refuses to sign.
// -----------------------------------------------------------------------------
class ISigner {
 public:
  virtual ~ISigner() = default;

  // Account the service signs for.
  virtual const std::string& address() const = 0;

  virtual domain::SignedTransaction sign(
      const domain::TransactionEnvelope& envelope) = 0;
};

}  // namespace gmx
