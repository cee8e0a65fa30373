#include "gmx/resolver/parameter_resolver.hpp"
#include "gmx/core/errors.hpp"
#include "gmx/domain/address.hpp"
#include "gmx/domain/order_kind.hpp"
#include "gmx/numeric/fixed_point.hpp"
#include "gmx/pricing/price_calculator.hpp"

#include <cmath>
#include <future>
#include <iostream>
#include <stdexcept>

namespace gmx {

namespace {

using domain::MarketInfo;
using domain::OrderKind;
using domain::OrderRequest;
using domain::TokenInfo;

// A request for "BTC" means the wrapped BTC token the BTC markets settle in.
constexpr const char* kIndexSymbolAlias[2] = {"BTC", "WBTC.b"};

// BTC markets are indexed by the synthetic BTC address, not by the wrapped
// token the symbol alias above resolves to. Applied to market lookups only.
constexpr const char* kMarketIndexAlias[2] = {
    "0x2f2a2543B76A4166549F7aaB2e75Bef0aefC5B0f",
    "0x47904963fc8b2340414262125aF798B9655E58Cd",
};

// Dependency order: each field only reads fields earlier in the list.
constexpr RequestField kDerivationOrder[] = {
    RequestField::Chain,
    RequestField::IndexTokenAddress,
    RequestField::StartTokenAddress,
    RequestField::OutTokenAddress,
    RequestField::MarketKey,
    RequestField::CollateralAddress,
    RequestField::SwapPath,
    RequestField::IsLong,
    RequestField::SlippagePercent,
    RequestField::InitialCollateralDelta,
    RequestField::SizeDeltaUsd,
};

bool hasText(const std::optional<std::string>& v) {
  return v.has_value() && !v->empty();
}

const TokenInfo* findTokenBySymbol(const std::vector<TokenInfo>& tokens,
                                   const std::string& symbol) {
  for (const auto& t : tokens) {
    if (t.symbol == symbol) {
      return &t;
    }
  }
  return nullptr;
}

const TokenInfo* findTokenByAddress(const std::vector<TokenInfo>& tokens,
                                    const std::string& address) {
  for (const auto& t : tokens) {
    if (domain::sameAddress(t.address, address)) {
      return &t;
    }
  }
  return nullptr;
}

const MarketInfo* findMarket(const std::vector<MarketInfo>& markets,
                             const std::string& market_key) {
  for (const auto& m : markets) {
    if (domain::sameAddress(m.market_key, market_key)) {
      return &m;
    }
  }
  return nullptr;
}

std::optional<std::string> addressForSymbol(
    const std::optional<std::string>& symbol,
    const std::vector<TokenInfo>& tokens) {
  if (!hasText(symbol)) {
    return std::nullopt;
  }
  const TokenInfo* token = findTokenBySymbol(tokens, *symbol);
  if (token == nullptr) {
    return std::nullopt;
  }
  return token->address;
}

std::string marketIndexAddress(const std::string& index_token) {
  if (domain::sameAddress(index_token, kMarketIndexAlias[0])) {
    return kMarketIndexAlias[1];
  }
  return index_token;
}

std::string formatNumber(double value) {
  return formatDecimal(toDecimal(value), 6);
}

// -----------------------------------------------------------------------------
// Presence
// -----------------------------------------------------------------------------
bool isPresent(const OrderRequest& r, RequestField field) {
  switch (field) {
    case RequestField::Chain:                  return hasText(r.chain);
    case RequestField::IndexTokenAddress:      return hasText(r.index_token_address);
    case RequestField::MarketKey:              return hasText(r.market_key);
    case RequestField::StartTokenAddress:      return hasText(r.start_token_address);
    case RequestField::OutTokenAddress:        return hasText(r.out_token_address);
    case RequestField::CollateralAddress:      return hasText(r.collateral_address);
    case RequestField::SwapPath:               return r.swap_path.has_value();
    case RequestField::IsLong:                 return r.is_long.has_value();
    case RequestField::SizeDeltaUsd:           return r.size_delta_usd.has_value();
    case RequestField::InitialCollateralDelta: return r.initial_collateral_delta.has_value();
    case RequestField::SlippagePercent:        return r.slippage_percent.has_value();
  }
  return false;
}

// -----------------------------------------------------------------------------
// Derivations: pure functions of the draft request and the snapshot
// -----------------------------------------------------------------------------
std::optional<std::string> deriveIndexToken(const OrderRequest& r,
                                            const ResolverSnapshot& s) {
  if (!hasText(r.index_token_symbol)) {
    return std::nullopt;
  }
  std::string symbol = *r.index_token_symbol;
  if (symbol == kIndexSymbolAlias[0]) {
    symbol = kIndexSymbolAlias[1];
  }
  return addressForSymbol(symbol, s.tokens);
}

std::optional<std::string> deriveMarketKey(const OrderRequest& r,
                                           const ResolverSnapshot& s) {
  if (!hasText(r.index_token_address)) {
    return std::nullopt;
  }
  const std::string index = marketIndexAddress(*r.index_token_address);

  std::vector<const MarketInfo*> candidates;
  for (const auto& m : s.markets) {
    if (domain::sameAddress(m.index_token_address, index)) {
      candidates.push_back(&m);
    }
  }
  if (candidates.empty()) {
    return std::nullopt;
  }
  if (candidates.size() == 1) {
    return candidates.front()->market_key;
  }

  // Several pools price this index: keep the one backed by the collateral
  // (given, or named by symbol, or else the start token).
  std::optional<std::string> backing = r.collateral_address;
  if (!hasText(backing)) {
    backing = addressForSymbol(r.collateral_token_symbol, s.tokens);
  }
  if (!hasText(backing)) {
    backing = r.start_token_address;
  }
  if (!hasText(backing)) {
    return std::nullopt;
  }

  const MarketInfo* chosen = nullptr;
  for (const MarketInfo* m : candidates) {
    if (m->backedBy(*backing)) {
      if (chosen != nullptr) {
        return std::nullopt;  // still ambiguous
      }
      chosen = m;
    }
  }
  if (chosen == nullptr) {
    return std::nullopt;
  }
  return chosen->market_key;
}

std::optional<std::string> deriveCollateral(const OrderRequest& r,
                                            const ResolverSnapshot& s) {
  if (auto from_symbol = addressForSymbol(r.collateral_token_symbol, s.tokens)) {
    return from_symbol;
  }
  if (!hasText(r.start_token_address) || !hasText(r.market_key)) {
    return std::nullopt;
  }
  const MarketInfo* market = findMarket(s.markets, *r.market_key);
  if (market != nullptr && market->backedBy(*r.start_token_address)) {
    return r.start_token_address;
  }
  return std::nullopt;
}

std::optional<std::vector<std::string>> deriveSwapPath(
    const OrderRequest& r, const ResolverSnapshot& s) {
  // Token the order starts from and the token it must end up in.
  std::optional<std::string> from;
  std::optional<std::string> to;
  switch (r.kind) {
    case OrderKind::Increase:
      from = r.start_token_address;
      to = r.collateral_address;
      break;
    case OrderKind::Decrease:
      from = r.collateral_address;
      to = r.start_token_address;
      break;
    case OrderKind::Swap:
      from = r.start_token_address;
      to = r.out_token_address;
      break;
  }
  if (!hasText(from) || !hasText(to)) {
    return std::nullopt;
  }
  if (domain::sameAddress(*from, *to)) {
    return std::vector<std::string>{};
  }

  std::vector<const MarketInfo*> pools;
  for (const auto& m : s.markets) {
    if (m.backedBy(*from) && m.backedBy(*to)) {
      pools.push_back(&m);
    }
  }
  if (pools.size() == 1) {
    return std::vector<std::string>{pools.front()->market_key};
  }

  // Several pools hold the pair: prefer the one indexed by either token.
  const MarketInfo* preferred = nullptr;
  for (const MarketInfo* m : pools) {
    if (domain::sameAddress(m->index_token_address, marketIndexAddress(*from)) ||
        domain::sameAddress(m->index_token_address, marketIndexAddress(*to))) {
      if (preferred != nullptr) {
        return std::nullopt;
      }
      preferred = m;
    }
  }
  if (preferred == nullptr) {
    return std::nullopt;
  }
  return std::vector<std::string>{preferred->market_key};
}

// -----------------------------------------------------------------------------
// collateralUsd()
// -----------------------------------------------------------------------------
// median × 10^(decimals − 30) × amount. Zero collateral needs no price.
// -----------------------------------------------------------------------------
double collateralUsd(const std::string& start_token, int decimals,
                     double amount, const ResolverSnapshot& s) {
  if (amount == 0.0) {
    return 0.0;
  }
  if (s.oracle_error.has_value()) {
    throw PriceUnavailableError(start_token,
                                "oracle read failed: " + *s.oracle_error);
  }
  const domain::PriceQuote& quote =
      PriceCalculator::quoteFor(s.prices, start_token);
  const Decimal usd =
      quote.median() * pow10(decimals - kUsdDecimals) * toDecimal(amount);
  return usd.convert_to<double>();
}

std::optional<double> deriveSizeDelta(const OrderRequest& r,
                                      const ResolverSnapshot& s) {
  if (r.kind == OrderKind::Swap || !r.leverage.has_value() ||
      !r.initial_collateral_delta.has_value() ||
      !hasText(r.start_token_address)) {
    return std::nullopt;
  }
  const TokenInfo* start = findTokenByAddress(s.tokens, *r.start_token_address);
  if (start == nullptr) {
    return std::nullopt;
  }
  return *r.leverage * collateralUsd(start->address, start->decimals,
                                     *r.initial_collateral_delta, s);
}

// Fills `field` in the draft if it can be derived; leaves it absent otherwise.
void deriveField(RequestField field, OrderRequest& draft,
                 const ResolverSnapshot& s, const domain::VenueLimits& limits) {
  switch (field) {
    case RequestField::Chain:
    case RequestField::IsLong:
    case RequestField::InitialCollateralDelta:
      // Never guessed.
      return;
    case RequestField::IndexTokenAddress:
      draft.index_token_address = deriveIndexToken(draft, s);
      return;
    case RequestField::MarketKey:
      draft.market_key = deriveMarketKey(draft, s);
      return;
    case RequestField::StartTokenAddress:
      draft.start_token_address =
          addressForSymbol(draft.start_token_symbol, s.tokens);
      return;
    case RequestField::OutTokenAddress:
      draft.out_token_address =
          addressForSymbol(draft.out_token_symbol, s.tokens);
      return;
    case RequestField::CollateralAddress:
      draft.collateral_address = deriveCollateral(draft, s);
      return;
    case RequestField::SwapPath:
      draft.swap_path = deriveSwapPath(draft, s);
      return;
    case RequestField::SizeDeltaUsd:
      draft.size_delta_usd = deriveSizeDelta(draft, s);
      return;
    case RequestField::SlippagePercent:
      draft.slippage_percent = limits.default_slippage;
      return;
  }
}

std::vector<std::string> missingFields(const OrderRequest& draft) {
  std::vector<std::string> missing;
  for (RequestField field : requiredFields(draft.kind)) {
    if (!isPresent(draft, field)) {
      missing.emplace_back(requestFieldName(field));
    }
  }
  return missing;
}

void validateAmounts(const OrderRequest& r) {
  auto check = [](const std::optional<double>& v, const char* name,
                  bool allow_zero) {
    if (!v.has_value()) {
      return;
    }
    if (!std::isfinite(*v) || *v < 0.0 || (!allow_zero && *v == 0.0)) {
      throw std::invalid_argument(std::string(name) + " must be " +
                                  (allow_zero ? "non-negative" : "positive") +
                                  ", got " + std::to_string(*v));
    }
  };
  check(r.size_delta_usd, "size_delta_usd", true);
  check(r.initial_collateral_delta, "initial_collateral_delta", true);
  check(r.leverage, "leverage", false);
  check(r.slippage_percent, "slippage_percent", true);
  if (r.slippage_percent.has_value() && *r.slippage_percent >= 1.0) {
    throw std::invalid_argument("slippage_percent must be below 1, got " +
                                std::to_string(*r.slippage_percent));
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// requestFieldName()
// -----------------------------------------------------------------------------
const char* requestFieldName(RequestField field) {
  switch (field) {
    case RequestField::Chain:                  return "chain";
    case RequestField::IndexTokenAddress:      return "index_token_address";
    case RequestField::MarketKey:              return "market_key";
    case RequestField::StartTokenAddress:      return "start_token_address";
    case RequestField::OutTokenAddress:        return "out_token_address";
    case RequestField::CollateralAddress:      return "collateral_address";
    case RequestField::SwapPath:               return "swap_path";
    case RequestField::IsLong:                 return "is_long";
    case RequestField::SizeDeltaUsd:           return "size_delta_usd";
    case RequestField::InitialCollateralDelta: return "initial_collateral_delta";
    case RequestField::SlippagePercent:        return "slippage_percent";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// requiredFields()
// -----------------------------------------------------------------------------
const std::vector<RequestField>& requiredFields(OrderKind kind) {
  using F = RequestField;
  static const std::vector<F> kIncrease = {
      F::Chain,
      F::IndexTokenAddress,
      F::MarketKey,
      F::StartTokenAddress,
      F::CollateralAddress,
      F::SwapPath,
      F::IsLong,
      F::SizeDeltaUsd,
      F::InitialCollateralDelta,
      F::SlippagePercent,
  };
  static const std::vector<F> kDecrease = {
      F::Chain,
      F::IndexTokenAddress,
      F::MarketKey,
      F::StartTokenAddress,
      F::CollateralAddress,
      F::IsLong,
      F::SizeDeltaUsd,
      F::InitialCollateralDelta,
      F::SlippagePercent,
  };
  static const std::vector<F> kSwap = {
      F::Chain,
      F::StartTokenAddress,
      F::OutTokenAddress,
      F::InitialCollateralDelta,
      F::SwapPath,
      F::SlippagePercent,
  };

  switch (kind) {
    case OrderKind::Increase: return kIncrease;
    case OrderKind::Decrease: return kDecrease;
    case OrderKind::Swap:     return kSwap;
  }
  return kIncrease;
}

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
ParameterResolver::ParameterResolver(ITokenRegistry& tokens,
                                     IMarketRegistry& markets,
                                     IPriceOracle& oracle, WorkerPool& pool,
                                     const domain::VenueLimits& limits,
                                     bool debug)
    : tokens_(tokens),
      markets_(markets),
      oracle_(oracle),
      pool_(pool),
      limits_(limits),
      debug_(debug) {}

// -----------------------------------------------------------------------------
// resolve()
// -----------------------------------------------------------------------------
domain::ResolvedOrder ParameterResolver::resolve(const OrderRequest& request) {
  validateAmounts(request);

  if (!isPresent(request, RequestField::Chain)) {
    // Nothing can be looked up without a chain: report every absent field
    // without touching the registries or the oracle.
    OrderRequest draft = request;
    if (!draft.slippage_percent.has_value()) {
      draft.slippage_percent = limits_.default_slippage;
    }
    throw MissingFieldError(missingFields(draft));
  }

  return resolveWith(request, readSnapshot(*request.chain));
}

// -----------------------------------------------------------------------------
// readSnapshot(): three independent reads, joined before returning
// -----------------------------------------------------------------------------
ResolverSnapshot ParameterResolver::readSnapshot(const std::string& chain) {
  auto tokens = pool_.submit([this, &chain] { return tokens_.tokens(chain); });
  auto markets =
      pool_.submit([this, &chain] { return markets_.markets(chain); });
  auto prices = pool_.submit([this, &chain] { return oracle_.snapshot(chain); });
  tokens.wait();
  markets.wait();
  prices.wait();

  ResolverSnapshot snapshot;
  try {
    snapshot.tokens = tokens.get();
  } catch (const GatewayError& e) {
    std::cerr << "[ParameterResolver] token registry read failed: "
              << e.what() << "\n";
  }
  try {
    snapshot.markets = markets.get();
  } catch (const GatewayError& e) {
    std::cerr << "[ParameterResolver] market registry read failed: "
              << e.what() << "\n";
  }
  try {
    snapshot.prices = prices.get();
  } catch (const GatewayError& e) {
    std::cerr << "[ParameterResolver] oracle read failed: " << e.what()
              << "\n";
    snapshot.oracle_error = e.what();
  }

  if (debug_) {
    std::cout << "[ParameterResolver] snapshot " << chain << ": "
              << snapshot.tokens.size() << " token(s), "
              << snapshot.markets.size() << " market(s), "
              << snapshot.prices.size() << " price(s)\n";
  }
  return snapshot;
}

// -----------------------------------------------------------------------------
// resolveWith(): derivation, checks, scaling
// -----------------------------------------------------------------------------
domain::ResolvedOrder ParameterResolver::resolveWith(
    const OrderRequest& request, const ResolverSnapshot& snapshot) const {
  validateAmounts(request);

  // --- Derivation -------------------------------------------------------------
  OrderRequest draft = request;
  for (RequestField field : kDerivationOrder) {
    if (isPresent(draft, field)) {
      continue;
    }
    deriveField(field, draft, snapshot, limits_);
    if (debug_ && isPresent(draft, field)) {
      std::cout << "[ParameterResolver] derived " << requestFieldName(field)
                << "\n";
    }
  }

  std::vector<std::string> missing = missingFields(draft);
  if (!missing.empty()) {
    throw MissingFieldError(std::move(missing));
  }

  const bool is_position = domain::traitsFor(draft.kind).checks_position;

  // Decimals come from the registry listing of the addresses in use.
  const TokenInfo* start =
      findTokenByAddress(snapshot.tokens, *draft.start_token_address);
  if (start == nullptr) {
    throw MissingFieldError({"start_token_decimals"});
  }
  const TokenInfo* index = nullptr;
  if (is_position) {
    index = findTokenByAddress(snapshot.tokens, *draft.index_token_address);
    if (index == nullptr) {
      throw MissingFieldError({"index_token_decimals"});
    }
  }

  domain::ResolvedOrder order;
  order.kind = draft.kind;
  order.chain = *draft.chain;
  order.start_token_address = *draft.start_token_address;
  order.start_token_decimals = start->decimals;
  order.swap_path = draft.swap_path.value_or(std::vector<std::string>{});
  order.slippage_percent = *draft.slippage_percent;
  order.initial_collateral_delta = *draft.initial_collateral_delta;

  if (!is_position) {
    order.out_token_address = *draft.out_token_address;
  } else {
    order.market_key = *draft.market_key;
    order.index_token_address = *draft.index_token_address;
    order.index_token_decimals = index->decimals;
    order.collateral_address = *draft.collateral_address;
    order.is_long = *draft.is_long;
    order.size_delta_usd = *draft.size_delta_usd;

    // --- Checks ---------------------------------------------------------------
    order.collateral_usd =
        collateralUsd(order.start_token_address, order.start_token_decimals,
                      order.initial_collateral_delta, snapshot);

    if (order.collateral_usd > 0.0) {
      order.leverage = order.size_delta_usd / order.collateral_usd;
      if (*order.leverage > limits_.max_leverage) {
        throw ThresholdError(ErrorKind::LeverageExceeded, "leverage",
                             formatNumber(*order.leverage),
                             "<= " + formatNumber(limits_.max_leverage));
      }
    }

    if (order.kind == OrderKind::Increase &&
        order.collateral_usd < domain::kMinCollateralUsd) {
      throw ThresholdError(ErrorKind::CollateralTooLow, "collateral USD",
                           formatNumber(order.collateral_usd),
                           ">= " + formatNumber(domain::kMinCollateralUsd));
    }

    // --- Scaling --------------------------------------------------------------
    order.size_delta_scaled = scaleAmount(order.size_delta_usd, kUsdDecimals);
  }

  order.collateral_delta_scaled =
      scaleAmount(order.initial_collateral_delta, order.start_token_decimals);

  if (debug_) {
    std::cout << "[ParameterResolver] resolved "
              << domain::orderKindName(order.kind) << " on " << order.chain
              << ": market=" << order.market_key
              << " start=" << order.start_token_address
              << " collateral_usd=" << formatNumber(order.collateral_usd)
              << " collateral_scaled=" << order.collateral_delta_scaled
              << "\n";
  }
  return order;
}

}  // namespace gmx
