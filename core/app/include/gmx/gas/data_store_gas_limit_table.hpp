#pragma once

#include "gmx/gas/i_gas_limit_table.hpp"
#include "gmx/gateway/i_ledger_gateway.hpp"

#include <string>

namespace gmx {

// -----------------------------------------------------------------------------
// DataStoreGasLimitTable
// -----------------------------------------------------------------------------
// Reads the exchange's on-chain DataStore: getUint(<gas_limit_key>) through
// the ledger gateway. The key is passed by name; the bridge derives the
// hashed storage key. Nothing is cached, each budget reads the table fresh.
//
// Non-owning reference to the gateway.
// -----------------------------------------------------------------------------
class DataStoreGasLimitTable : public IGasLimitTable {
 public:
  DataStoreGasLimitTable(ILedgerGateway& gateway, std::string datastore);

  BigInt baseEstimate(domain::OrderKind kind) override;

 private:
  ILedgerGateway& gateway_;
  std::string datastore_;
};

}  // namespace gmx
