#pragma once

#include "gmx/domain/venue_limits.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace gmx {

// -----------------------------------------------------------------------------
// ContractAddresses
// -----------------------------------------------------------------------------
// Per-chain deployment of the exchange contracts the pipeline talks to.
// -----------------------------------------------------------------------------
struct ContractAddresses {
  std::string exchange_router;    // multicall destination for orders
  std::string synthetics_router;  // spender of collateral allowances
  std::string order_vault;        // receives collateral sent with orders
  std::string datastore;          // on-chain configuration store (gas table)
};

// -----------------------------------------------------------------------------
// EngineConfig
// -----------------------------------------------------------------------------
//
// @brief  Everything one engine instance needs, loaded once at startup and
//         passed by const reference into every component.
//
// @details
// There is no process-wide configuration object: the caller constructs one
// EngineConfig (usually via loadEngineConfig()) and threads it through. The
// private key is not part of the config; the signing service holds it.
//
// JSON shape (all keys required unless marked optional):
//
//   {
//     "chain": "arbitrum",
//     "chain_id": 42161,
//     "wallet_address": "0x...",
//     "wrapped_native_address": "0x82aF...",
//     "contracts": { "exchange_router": "0x...", "synthetics_router": "0x...",
//                    "order_vault": "0x...", "datastore": "0x..." },
//     "endpoints": { "gateway": "tcp://...", "signer": "tcp://...",
//                    "ipc_cmd": "tcp://...",   // optional
//                    "ipc_pub": "tcp://..." }, // optional
//     "registry_file": "config/registry.json",
//     "limits": { ... VenueLimits ... },       // optional, defaults apply
//     "debug_mode": false,                     // optional
//     "auto_approve": true,                    // optional
//     "check_allowance": true,                 // optional
//     "simulate": false,                       // optional
//     "max_fee_per_gas": "120000000",          // optional override (wei)
//     "worker_threads": 4,                     // optional
//     "rpc_timeout_ms": 5000                   // optional
//   }
// -----------------------------------------------------------------------------
struct EngineConfig {
  std::string chain;
  std::uint64_t chain_id{0};
  std::string wallet_address;
  std::string wrapped_native_address;
  ContractAddresses contracts;

  std::string gateway_endpoint;
  std::string signer_endpoint;
  std::string ipc_cmd_endpoint;  // empty: IPC server disabled
  std::string ipc_pub_endpoint;

  std::string registry_file;

  domain::VenueLimits limits;

  bool debug_mode{false};      // verbose per-stage logging
  bool auto_approve{true};     // raise a short allowance automatically
  bool check_allowance{true};  // run the allowance step for increase orders
  bool simulate{false};        // default mode when a SUBMIT names none
  std::optional<std::string> max_fee_per_gas;  // wei, decimal string
  std::size_t worker_threads{4};
  int rpc_timeout_ms{5000};
};

// -----------------------------------------------------------------------------
// parseEngineConfig(json) / loadEngineConfig(path)
// -----------------------------------------------------------------------------
// @throws ConfigError naming the offending key when the document is
//         malformed, a required key is missing, or a value has the wrong type.
// -----------------------------------------------------------------------------
EngineConfig parseEngineConfig(const nlohmann::json& doc);
EngineConfig loadEngineConfig(const std::string& path);

}  // namespace gmx
