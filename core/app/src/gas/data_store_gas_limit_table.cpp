#include "gmx/gas/data_store_gas_limit_table.hpp"
#include "gmx/codec/json_codec.hpp"
#include "gmx/core/errors.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <utility>

namespace gmx {

DataStoreGasLimitTable::DataStoreGasLimitTable(ILedgerGateway& gateway,
                                               std::string datastore)
    : gateway_(gateway), datastore_(std::move(datastore)) {}

BigInt DataStoreGasLimitTable::baseEstimate(domain::OrderKind kind) {
  const char* key = domain::traitsFor(kind).gas_limit_key;
  nlohmann::json reply =
      gateway_.call(datastore_, "getUint", nlohmann::json::array({key}));
  try {
    BigInt estimate = bigIntFromJson(reply);
    if (estimate <= 0) {
      throw GatewayError(std::string("DataStore ") + key + " is zero");
    }
    return estimate;
  } catch (const std::invalid_argument& e) {
    throw GatewayError(std::string("DataStore ") + key + ": " + e.what());
  }
}

}  // namespace gmx
