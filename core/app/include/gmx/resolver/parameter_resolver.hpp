#pragma once

#include "gmx/concurrent/worker_pool.hpp"
#include "gmx/domain/market_info.hpp"
#include "gmx/domain/order_request.hpp"
#include "gmx/domain/price_quote.hpp"
#include "gmx/domain/resolved_order.hpp"
#include "gmx/domain/venue_limits.hpp"
#include "gmx/oracle/i_price_oracle.hpp"
#include "gmx/registry/i_registries.hpp"

#include <optional>
#include <string>
#include <vector>

namespace gmx {

// -----------------------------------------------------------------------------
// RequestField
// -----------------------------------------------------------------------------
// Every order field the resolver may have to fill in. Presence checks and
// derivations are exhaustive switches over this enum, so a new field cannot
// be added without deciding how it is derived.
// -----------------------------------------------------------------------------
enum class RequestField {
  Chain,
  IndexTokenAddress,
  MarketKey,
  StartTokenAddress,
  OutTokenAddress,
  CollateralAddress,
  SwapPath,
  IsLong,
  SizeDeltaUsd,
  InitialCollateralDelta,
  SlippagePercent,
};

// Field name as it appears in requests and MissingField errors.
const char* requestFieldName(RequestField field);

// Fields that must be present (given or derived) for an order of `kind`.
const std::vector<RequestField>& requiredFields(domain::OrderKind kind);

// -----------------------------------------------------------------------------
// ResolverSnapshot
// -----------------------------------------------------------------------------
// The registry and oracle state one resolution works from. Read once, up
// front, and never refreshed during the resolution.
// -----------------------------------------------------------------------------
struct ResolverSnapshot {
  std::vector<domain::TokenInfo> tokens;
  std::vector<domain::MarketInfo> markets;
  domain::OracleSnapshot prices;
  std::optional<std::string> oracle_error;  // set when the feed read failed
};

// -----------------------------------------------------------------------------
// ParameterResolver
// -----------------------------------------------------------------------------
//
// @brief  Completes a partial OrderRequest into a validated ResolvedOrder.
//
// @details
// resolve() runs in four phases:
//
//   1. Snapshot. Token table, market table and oracle prices are read
//      concurrently on the WorkerPool and joined. A request without a chain
//      skips this phase entirely.
//   2. Derivation. Absent fields are derived in dependency order (index
//      token, start token, out token, market, collateral, swap path,
//      slippage, size). Every derivation is a pure function of the draft
//      request and the snapshot. Anything still absent and required is
//      reported in a single MissingFieldError.
//   3. Checks (non-swap). Implied leverage above the venue maximum fails
//      with LeverageExceeded; increase orders backed by less than the
//      collateral floor fail with CollateralTooLow. Both run before any
//      order-specific price or gas read.
//   4. Scaling. Size to 30-decimal USD, collateral to start-token base
//      units. Always runs.
//
// The resolver holds no per-request state; concurrent resolve() calls are
// independent.
//
// Ownership:
//   Non-owning references to the registries, oracle and pool.
// -----------------------------------------------------------------------------
class ParameterResolver {
 public:
  ParameterResolver(ITokenRegistry& tokens, IMarketRegistry& markets,
                    IPriceOracle& oracle, WorkerPool& pool,
                    const domain::VenueLimits& limits, bool debug = false);

  // -------------------------------------------------------------------------
  // resolve(request)
  // -------------------------------------------------------------------------
  // @throws MissingFieldError     listing every field that is absent and
  //                               could not be derived
  // @throws ThresholdError        LeverageExceeded or CollateralTooLow
  // @throws PriceUnavailableError when the start token has no oracle price
  //                               but its USD value is needed
  // @throws std::invalid_argument for negative amounts or slippage outside
  //                               [0, 1)
  // -------------------------------------------------------------------------
  domain::ResolvedOrder resolve(const domain::OrderRequest& request);

  // Phase 1 on its own. Registry read failures leave the list empty (the
  // fields depending on it are then reported missing); an oracle failure is
  // recorded in oracle_error.
  ResolverSnapshot readSnapshot(const std::string& chain);

  // Phases 2 to 4 against an already-read snapshot.
  domain::ResolvedOrder resolveWith(const domain::OrderRequest& request,
                                    const ResolverSnapshot& snapshot) const;

 private:
  ITokenRegistry& tokens_;
  IMarketRegistry& markets_;
  IPriceOracle& oracle_;
  WorkerPool& pool_;
  domain::VenueLimits limits_;
  bool debug_;
};

}  // namespace gmx
