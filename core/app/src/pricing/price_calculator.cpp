#include "gmx/pricing/price_calculator.hpp"
#include "gmx/core/errors.hpp"
#include "gmx/domain/address.hpp"

namespace gmx {

// -----------------------------------------------------------------------------
// price()
// -----------------------------------------------------------------------------
domain::ExecutionPrice PriceCalculator::price(int token_decimals,
                                              const domain::PriceQuote& quote,
                                              bool is_long,
                                              domain::PriceIntent intent,
                                              double slippage) {
  domain::ExecutionPrice result;
  result.median = quote.median();

  const Decimal s = toDecimal(slippage);
  const Decimal up = 1 + s;
  const Decimal down = 1 - s;
  switch (intent) {
    case domain::PriceIntent::Open:
      result.adjusted = result.median * (is_long ? up : down);
      break;
    case domain::PriceIntent::Close:
      result.adjusted = result.median * (is_long ? down : up);
      break;
    case domain::PriceIntent::Swap:
      result.adjusted = result.median;
      break;
  }

  result.acceptable_price = floorToInteger(result.adjusted);
  result.acceptable_price_usd =
      toDecimal(result.acceptable_price) * pow10(token_decimals - kUsdDecimals);
  return result;
}

// -----------------------------------------------------------------------------
// quoteFor()
// -----------------------------------------------------------------------------
const domain::PriceQuote& PriceCalculator::quoteFor(
    const domain::OracleSnapshot& snapshot, const std::string& token_address) {
  auto it = snapshot.find(domain::normalizeAddress(token_address));
  if (it == snapshot.end()) {
    throw PriceUnavailableError(token_address);
  }
  return it->second;
}

// -----------------------------------------------------------------------------
// priceFor()
// -----------------------------------------------------------------------------
domain::ExecutionPrice PriceCalculator::priceFor(
    const domain::OracleSnapshot& snapshot, const std::string& token_address,
    int token_decimals, bool is_long, domain::PriceIntent intent,
    double slippage) {
  return price(token_decimals, quoteFor(snapshot, token_address), is_long,
               intent, slippage);
}

}  // namespace gmx
