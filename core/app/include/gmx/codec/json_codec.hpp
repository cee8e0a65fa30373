#pragma once

#include "gmx/domain/allowance_outcome.hpp"
#include "gmx/domain/gas_plan.hpp"
#include "gmx/domain/order_request.hpp"
#include "gmx/domain/price_quote.hpp"
#include "gmx/domain/resolved_order.hpp"
#include "gmx/domain/transaction.hpp"
#include "gmx/events/event.hpp"
#include "gmx/numeric/fixed_point.hpp"
#include "gmx/order/submission_receipt.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <exception>
#include <string>

namespace gmx {

// -----------------------------------------------------------------------------
// JSON codec
// -----------------------------------------------------------------------------
// Conversions between domain types and the JSON carried by the IPC server
// and the collaborator bridge.
//
// Integers wider than 53 bits (wei, 30-decimal USD, raw prices) are written
// as decimal strings. On input both strings and integral JSON numbers are
// accepted.
// -----------------------------------------------------------------------------

// @throws std::invalid_argument if v is neither an integer string nor an
//         integral number.
BigInt bigIntFromJson(const nlohmann::json& v);
std::uint64_t uint64FromJson(const nlohmann::json& v);

// "increase" | "decrease" | "swap". @throws std::invalid_argument.
domain::OrderKind orderKindFromString(const std::string& text);

// -----------------------------------------------------------------------------
// orderRequestFromJson(j)
// -----------------------------------------------------------------------------
// Keys match the OrderRequest members ("kind", "chain", "index_token_symbol",
// "size_delta_usd", ...). Absent or null keys stay unset.
//
// @throws std::invalid_argument on an unknown kind or a wrongly typed value.
// -----------------------------------------------------------------------------
domain::OrderRequest orderRequestFromJson(const nlohmann::json& j);

nlohmann::json toJson(const domain::ResolvedOrder& order);
nlohmann::json toJson(const domain::ExecutionPrice& price);
nlohmann::json toJson(const domain::GasPlan& gas);
nlohmann::json toJson(const domain::TransactionEnvelope& envelope);
nlohmann::json toJson(const domain::AllowanceOutcome& outcome);
nlohmann::json toJson(const SubmissionReceipt& receipt);

// Telemetry line for the PUB socket.
nlohmann::json toJson(const Event& event);

// {"status":"error","kind":...,"message":...}. OrderError subclasses report
// their ErrorKind; std::invalid_argument reports "InvalidRequest"; anything
// else "Internal".
nlohmann::json errorToJson(const std::exception& e);

}  // namespace gmx
