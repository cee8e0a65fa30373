#pragma once

#include "gmx/numeric/fixed_point.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace gmx {
namespace domain {

// -----------------------------------------------------------------------------
// TransactionEnvelope
// -----------------------------------------------------------------------------
//
// @brief  An unsigned EIP-1559 transaction, ready for the signing service.
//
// @details
// `multicall_args` holds the encoded inner calls when the destination is the
// exchange router; `data` is the encoded outer call (multicall or a direct
// call such as approve). Both encodings come from the Ledger Gateway.
//
// Value type. Two envelopes built from the same resolved order differ only
// in `nonce` as long as the gateway reports the same base fee and gas table.
// -----------------------------------------------------------------------------
struct TransactionEnvelope {
  std::string from;
  std::string to;
  std::vector<std::string> multicall_args;
  std::string data;
  BigInt value{0};
  std::uint64_t chain_id{0};
  BigInt gas{0};
  BigInt max_fee_per_gas{0};
  BigInt max_priority_fee_per_gas{0};
  std::uint64_t nonce{0};

  bool operator==(const TransactionEnvelope& o) const {
    return from == o.from && to == o.to &&
           multicall_args == o.multicall_args && data == o.data &&
           value == o.value && chain_id == o.chain_id && gas == o.gas &&
           max_fee_per_gas == o.max_fee_per_gas &&
           max_priority_fee_per_gas == o.max_priority_fee_per_gas &&
           nonce == o.nonce;
  }
  bool operator!=(const TransactionEnvelope& o) const { return !(*this == o); }
};

// -----------------------------------------------------------------------------
// SignedTransaction
// -----------------------------------------------------------------------------
// The envelope plus the signing service's raw payload. Immutable once built;
// broadcast at most once.
// -----------------------------------------------------------------------------
struct SignedTransaction {
  TransactionEnvelope envelope;
  std::string raw;   // 0x-prefixed signed RLP
  std::string hash;  // transaction hash the signer computed
};

}  // namespace domain
}  // namespace gmx
