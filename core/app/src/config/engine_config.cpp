#include "gmx/config/engine_config.hpp"
#include "gmx/core/errors.hpp"
#include "gmx/numeric/fixed_point.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace gmx {

namespace {

// at() with the key name in the error, instead of nlohmann's generic text.
const nlohmann::json& required(const nlohmann::json& obj,
                               const std::string& key) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) {
    throw ConfigError("missing required key '" + key + "'");
  }
  return *it;
}

std::string requiredString(const nlohmann::json& obj, const std::string& key) {
  const auto& v = required(obj, key);
  if (!v.is_string() || v.get<std::string>().empty()) {
    throw ConfigError("key '" + key + "' must be a non-empty string");
  }
  return v.get<std::string>();
}

// max_fee_per_gas as an integer wei string. Floats are taken only when
// they hold a whole number (1.5e9 is fine, 1.5 is not).
std::string maxFeeText(const nlohmann::json& v) {
  if (v.is_string()) {
    return parseBigInt(v.get<std::string>()).str();
  }
  if (v.is_number_float()) {
    const double d = v.get<double>();
    if (!std::isfinite(d) || d < 0.0 || std::floor(d) != d) {
      throw ConfigError("max_fee_per_gas must be a whole number of wei, got " +
                        v.dump());
    }
    std::ostringstream out;
    out << std::fixed << std::setprecision(0) << d;
    return out.str();
  }
  if (v.is_number()) {
    return parseBigInt(v.dump()).str();
  }
  throw ConfigError("max_fee_per_gas must be a number or a decimal string");
}

// Keys that older configs carried for values the protocol fixes.
constexpr const char* kFixedLimitKeys[] = {"min_collateral_usd",
                                           "gas_safety_multiplier"};

domain::VenueLimits parseLimits(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw ConfigError("limits must be an object");
  }
  for (const char* key : kFixedLimitKeys) {
    if (j.contains(key)) {
      throw ConfigError(std::string("limits.") + key +
                        " is fixed by the exchange and cannot be configured");
    }
  }

  domain::VenueLimits limits;
  limits.max_leverage = j.value("max_leverage", limits.max_leverage);
  limits.default_slippage = j.value("default_slippage", limits.default_slippage);
  limits.base_fee_multiplier =
      j.value("base_fee_multiplier", limits.base_fee_multiplier);

  if (limits.max_leverage <= 0.0) {
    throw ConfigError("limits.max_leverage must be > 0");
  }
  if (limits.default_slippage < 0.0 || limits.default_slippage >= 1.0) {
    throw ConfigError("limits.default_slippage must be in [0, 1)");
  }
  if (limits.base_fee_multiplier <= 0.0) {
    throw ConfigError("limits.base_fee_multiplier must be > 0");
  }
  return limits;
}

}  // namespace

// -----------------------------------------------------------------------------
// parseEngineConfig()
// -----------------------------------------------------------------------------
EngineConfig parseEngineConfig(const nlohmann::json& doc) {
  if (!doc.is_object()) {
    throw ConfigError("top-level document must be an object");
  }

  EngineConfig cfg;
  try {
    cfg.chain = requiredString(doc, "chain");
    cfg.chain_id = required(doc, "chain_id").get<std::uint64_t>();
    cfg.wallet_address = requiredString(doc, "wallet_address");
    cfg.wrapped_native_address = requiredString(doc, "wrapped_native_address");

    const auto& contracts = required(doc, "contracts");
    cfg.contracts.exchange_router = requiredString(contracts, "exchange_router");
    cfg.contracts.synthetics_router =
        requiredString(contracts, "synthetics_router");
    cfg.contracts.order_vault = requiredString(contracts, "order_vault");
    cfg.contracts.datastore = requiredString(contracts, "datastore");

    const auto& endpoints = required(doc, "endpoints");
    cfg.gateway_endpoint = requiredString(endpoints, "gateway");
    cfg.signer_endpoint = requiredString(endpoints, "signer");
    cfg.ipc_cmd_endpoint = endpoints.value("ipc_cmd", std::string{});
    cfg.ipc_pub_endpoint = endpoints.value("ipc_pub", std::string{});

    cfg.registry_file = requiredString(doc, "registry_file");

    if (auto it = doc.find("limits"); it != doc.end()) {
      cfg.limits = parseLimits(*it);
    }

    cfg.debug_mode = doc.value("debug_mode", cfg.debug_mode);
    cfg.auto_approve = doc.value("auto_approve", cfg.auto_approve);
    cfg.check_allowance = doc.value("check_allowance", cfg.check_allowance);
    cfg.simulate = doc.value("simulate", cfg.simulate);
    cfg.worker_threads = doc.value("worker_threads", cfg.worker_threads);
    cfg.rpc_timeout_ms = doc.value("rpc_timeout_ms", cfg.rpc_timeout_ms);

    if (auto it = doc.find("max_fee_per_gas");
        it != doc.end() && !it->is_null()) {
      // Accept both a JSON number and a decimal string; keep it as text so
      // wei values beyond 2^53 are not rounded.
      cfg.max_fee_per_gas = maxFeeText(*it);
    }
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("type error: ") + e.what());
  } catch (const std::invalid_argument& e) {
    throw ConfigError(std::string("max_fee_per_gas: ") + e.what());
  }

  if (cfg.ipc_cmd_endpoint.empty() != cfg.ipc_pub_endpoint.empty()) {
    throw ConfigError("endpoints.ipc_cmd and endpoints.ipc_pub must be set "
                      "together");
  }
  if (cfg.worker_threads == 0) {
    throw ConfigError("worker_threads must be >= 1");
  }
  return cfg;
}

// -----------------------------------------------------------------------------
// loadEngineConfig()
// -----------------------------------------------------------------------------
EngineConfig loadEngineConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open " + path);
  }

  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError(path + ": " + e.what());
  }

  EngineConfig cfg = parseEngineConfig(doc);
  std::cout << "[EngineConfig] loaded " << path << ": chain=" << cfg.chain
            << " chain_id=" << cfg.chain_id
            << " wallet=" << cfg.wallet_address
            << (cfg.simulate ? " (simulate)" : "")
            << (cfg.debug_mode ? " (debug)" : "") << "\n";
  return cfg;
}

}  // namespace gmx
