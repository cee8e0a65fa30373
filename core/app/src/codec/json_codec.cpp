#include "gmx/codec/json_codec.hpp"
#include "gmx/core/errors.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <limits>
#include <stdexcept>
#include <type_traits>
#include <variant>

namespace gmx {

namespace {

template <typename T>
void readOptional(const nlohmann::json& j, const char* key,
                  std::optional<T>& out) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return;
  }
  try {
    if constexpr (std::is_same_v<T, double>) {
      if (!it->is_number()) {
        throw std::invalid_argument("expected a number");
      }
    } else if constexpr (std::is_same_v<T, bool>) {
      if (!it->is_boolean()) {
        throw std::invalid_argument("expected a boolean");
      }
    } else if constexpr (std::is_same_v<T, std::string>) {
      if (!it->is_string()) {
        throw std::invalid_argument("expected a string");
      }
    }
    out = it->get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw std::invalid_argument(std::string(key) + ": " + e.what());
  } catch (const std::invalid_argument& e) {
    throw std::invalid_argument(std::string(key) + ": " + e.what());
  }
}

std::int64_t millisSinceEpoch(Timestamp t) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             t.time_since_epoch())
      .count();
}

}  // namespace

// -----------------------------------------------------------------------------
// Integers
// -----------------------------------------------------------------------------
BigInt bigIntFromJson(const nlohmann::json& v) {
  if (v.is_string()) {
    return parseBigInt(v.get<std::string>());
  }
  if (v.is_number_unsigned()) {
    return BigInt(v.get<std::uint64_t>());
  }
  if (v.is_number_integer()) {
    return BigInt(v.get<std::int64_t>());
  }
  throw std::invalid_argument("expected an integer, got " + v.dump());
}

std::uint64_t uint64FromJson(const nlohmann::json& v) {
  const BigInt value = bigIntFromJson(v);
  if (value < 0 || value > std::numeric_limits<std::uint64_t>::max()) {
    throw std::invalid_argument("value out of 64-bit range: " + value.str());
  }
  return value.convert_to<std::uint64_t>();
}

domain::OrderKind orderKindFromString(const std::string& text) {
  if (text == "increase") return domain::OrderKind::Increase;
  if (text == "decrease") return domain::OrderKind::Decrease;
  if (text == "swap") return domain::OrderKind::Swap;
  throw std::invalid_argument("unknown order kind '" + text + "'");
}

// -----------------------------------------------------------------------------
// orderRequestFromJson()
// -----------------------------------------------------------------------------
domain::OrderRequest orderRequestFromJson(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw std::invalid_argument("order must be a JSON object");
  }
  auto kind = j.find("kind");
  if (kind == j.end() || !kind->is_string()) {
    throw std::invalid_argument("order.kind must be a string");
  }

  domain::OrderRequest r;
  r.kind = orderKindFromString(kind->get<std::string>());
  readOptional(j, "chain", r.chain);
  readOptional(j, "index_token_symbol", r.index_token_symbol);
  readOptional(j, "index_token_address", r.index_token_address);
  readOptional(j, "market_key", r.market_key);
  readOptional(j, "start_token_symbol", r.start_token_symbol);
  readOptional(j, "start_token_address", r.start_token_address);
  readOptional(j, "out_token_symbol", r.out_token_symbol);
  readOptional(j, "out_token_address", r.out_token_address);
  readOptional(j, "collateral_token_symbol", r.collateral_token_symbol);
  readOptional(j, "collateral_address", r.collateral_address);
  readOptional(j, "swap_path", r.swap_path);
  readOptional(j, "is_long", r.is_long);
  readOptional(j, "size_delta_usd", r.size_delta_usd);
  readOptional(j, "leverage", r.leverage);
  readOptional(j, "initial_collateral_delta", r.initial_collateral_delta);
  readOptional(j, "slippage_percent", r.slippage_percent);
  return r;
}

// -----------------------------------------------------------------------------
// Domain → JSON
// -----------------------------------------------------------------------------
nlohmann::json toJson(const domain::ResolvedOrder& o) {
  nlohmann::json j;
  j["kind"] = domain::orderKindName(o.kind);
  j["chain"] = o.chain;
  j["market_key"] = o.market_key;
  j["index_token_address"] = o.index_token_address;
  j["start_token_address"] = o.start_token_address;
  j["out_token_address"] = o.out_token_address;
  j["collateral_address"] = o.collateral_address;
  j["swap_path"] = o.swap_path;
  j["is_long"] = o.is_long;
  j["slippage_percent"] = o.slippage_percent;
  j["size_delta_usd"] = o.size_delta_usd;
  j["initial_collateral_delta"] = o.initial_collateral_delta;
  j["collateral_usd"] = o.collateral_usd;
  j["leverage"] = o.leverage.has_value() ? nlohmann::json(*o.leverage)
                                         : nlohmann::json(nullptr);
  j["size_delta"] = o.size_delta_scaled.has_value()
                        ? nlohmann::json(formatInteger(*o.size_delta_scaled))
                        : nlohmann::json(nullptr);
  j["initial_collateral_delta_amount"] =
      formatInteger(o.collateral_delta_scaled);
  return j;
}

nlohmann::json toJson(const domain::ExecutionPrice& p) {
  nlohmann::json j;
  j["median"] = formatDecimal(p.median);
  j["adjusted"] = formatDecimal(p.adjusted);
  j["acceptable_price"] = formatInteger(p.acceptable_price);
  j["acceptable_price_usd"] = formatDecimal(p.acceptable_price_usd);
  return j;
}

nlohmann::json toJson(const domain::GasPlan& g) {
  nlohmann::json j;
  j["base_estimate"] = formatInteger(g.base_estimate);
  j["ceiling"] = formatInteger(g.ceiling);
  j["max_fee_per_gas"] = formatInteger(g.max_fee_per_gas);
  j["max_priority_fee_per_gas"] = formatInteger(g.max_priority_fee_per_gas);
  return j;
}

nlohmann::json toJson(const domain::TransactionEnvelope& e) {
  nlohmann::json j;
  j["from"] = e.from;
  j["to"] = e.to;
  j["data"] = e.data;
  j["multicall_args"] = e.multicall_args;
  j["value"] = formatInteger(e.value);
  j["chain_id"] = e.chain_id;
  j["gas"] = formatInteger(e.gas);
  j["max_fee_per_gas"] = formatInteger(e.max_fee_per_gas);
  j["max_priority_fee_per_gas"] = formatInteger(e.max_priority_fee_per_gas);
  j["nonce"] = e.nonce;
  return j;
}

nlohmann::json toJson(const domain::AllowanceOutcome& a) {
  nlohmann::json j;
  j["status"] = domain::allowanceStatusName(a.status);
  j["token_address"] = a.token_address;
  j["balance"] = formatInteger(a.balance);
  j["allowance"] = formatInteger(a.allowance);
  j["approval_tx_id"] = a.approval_tx_id.has_value()
                            ? nlohmann::json(*a.approval_tx_id)
                            : nlohmann::json(nullptr);
  return j;
}

nlohmann::json toJson(const SubmissionReceipt& r) {
  nlohmann::json j;
  j["run_id"] = r.run_id;
  j["mode"] = submitModeName(r.mode);
  j["state"] = pipelineStateName(r.state);
  j["order"] = toJson(r.order);
  j["allowance"] =
      r.allowance.has_value() ? toJson(*r.allowance) : nlohmann::json(nullptr);
  j["price"] = toJson(r.price);
  j["gas"] = toJson(r.gas);
  j["envelope"] = toJson(r.envelope);
  j["tx_hash"] = r.tx_hash;
  j["tx_id"] = r.tx_id.has_value() ? nlohmann::json(*r.tx_id)
                                   : nlohmann::json(nullptr);
  return j;
}

// -----------------------------------------------------------------------------
// Telemetry
// -----------------------------------------------------------------------------
nlohmann::json toJson(const Event& event) {
  return std::visit(
      [](const auto& e) -> nlohmann::json {
        using T = std::decay_t<decltype(e)>;
        nlohmann::json j;
        j["run_id"] = e.run_id;
        j["timestamp_ms"] = millisSinceEpoch(e.timestamp);
        if constexpr (std::is_same_v<T, PipelineStateEvent>) {
          j["type"] = "pipeline_state";
          j["kind"] = domain::orderKindName(e.kind);
          j["state"] = pipelineStateName(e.state);
          j["previous_state"] = pipelineStateName(e.previous_state);
          j["detail"] = e.detail;
        } else if constexpr (std::is_same_v<T, AllowanceEvent>) {
          j["type"] = "allowance";
          j["token_address"] = e.token_address;
          j["spender"] = e.spender;
          j["required_amount"] = e.required_amount;
          j["approval_tx_id"] = e.approval_tx_id;
        }
        return j;
      },
      event);
}

// -----------------------------------------------------------------------------
// errorToJson()
// -----------------------------------------------------------------------------
nlohmann::json errorToJson(const std::exception& e) {
  nlohmann::json j;
  j["status"] = "error";
  if (const auto* order_error = dynamic_cast<const OrderError*>(&e)) {
    j["kind"] = errorKindName(order_error->kind());
    if (const auto* missing = dynamic_cast<const MissingFieldError*>(&e)) {
      j["fields"] = missing->fields();
    }
  } else if (dynamic_cast<const std::invalid_argument*>(&e) != nullptr) {
    j["kind"] = "InvalidRequest";
  } else {
    j["kind"] = "Internal";
  }
  j["message"] = e.what();
  return j;
}

}  // namespace gmx
