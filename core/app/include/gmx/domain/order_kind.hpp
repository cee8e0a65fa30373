#pragma once

#include <cstdint>

namespace gmx {
namespace domain {

// -----------------------------------------------------------------------------
// OrderKind
// -----------------------------------------------------------------------------
// Responsibility: Tags what the order does to a position. A single pipeline
// type handles all three; the kind selects the handful of values that differ
// through OrderKindTraits below.
// -----------------------------------------------------------------------------
enum class OrderKind {
  Increase,  // open or add to a leveraged position
  Decrease,  // close or reduce a leveraged position
  Swap,      // exchange one token for another through pool markets
};

// -----------------------------------------------------------------------------
// PriceIntent
// -----------------------------------------------------------------------------
// Direction semantics handed to the price calculator. Open and Close flip the
// sign of the slippage adjustment for a given side; Swap applies none.
// -----------------------------------------------------------------------------
enum class PriceIntent {
  Open,
  Close,
  Swap,
};

// -----------------------------------------------------------------------------
// OrderKindTraits
// -----------------------------------------------------------------------------
//
// @brief  The kind-specific values of one order kind.
//
// @details
//   gas_limit_key   key of the base gas estimator in the DataStore table
//   intent          direction semantics for the price calculator
//   order_type      exchange enum written into createOrder
//                   (MarketSwap = 0, MarketIncrease = 2, MarketDecrease = 4)
//   checks_position collateral and leverage checks apply
//   sends_collateral  multicall moves collateral into the order vault
//
// Pure value table; see traitsFor().
// -----------------------------------------------------------------------------
struct OrderKindTraits {
  const char* gas_limit_key;
  PriceIntent intent;
  std::uint8_t order_type;
  bool checks_position;
  bool sends_collateral;
};

constexpr OrderKindTraits traitsFor(OrderKind kind) {
  switch (kind) {
    case OrderKind::Increase:
      return {"increase_order", PriceIntent::Open, 2, true, true};
    case OrderKind::Decrease:
      return {"decrease_order", PriceIntent::Close, 4, true, false};
    case OrderKind::Swap:
      return {"swap_order", PriceIntent::Swap, 0, false, true};
  }
  return {"swap_order", PriceIntent::Swap, 0, false, true};
}

inline const char* orderKindName(OrderKind kind) {
  switch (kind) {
    case OrderKind::Increase: return "increase";
    case OrderKind::Decrease: return "decrease";
    case OrderKind::Swap:     return "swap";
  }
  return "unknown";
}

}  // namespace domain
}  // namespace gmx
