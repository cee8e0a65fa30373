#include "gmx/numeric/fixed_point.hpp"

#include <cmath>
#include <cstdio>
#include <ios>
#include <stdexcept>

namespace gmx {

// -----------------------------------------------------------------------------
// pow10()
// -----------------------------------------------------------------------------
Decimal pow10(int exponent) {
  Decimal result = 1;
  const Decimal ten = 10;
  int remaining = exponent < 0 ? -exponent : exponent;
  for (int i = 0; i < remaining; ++i) {
    result *= ten;
  }
  if (exponent < 0) {
    // cpp_dec_float stores base-10 limbs, so 1 / 10^n is exact.
    return Decimal(1) / result;
  }
  return result;
}

// -----------------------------------------------------------------------------
// toDecimal(double)
// -----------------------------------------------------------------------------
Decimal toDecimal(double value) {
  if (!std::isfinite(value)) {
    throw std::invalid_argument("non-finite amount");
  }
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.15g", value);
  return Decimal(buf);
}

// -----------------------------------------------------------------------------
// parseBigInt()
// -----------------------------------------------------------------------------
BigInt parseBigInt(const std::string& text) {
  if (text.empty()) {
    throw std::invalid_argument("empty integer string");
  }
  try {
    return BigInt(text.c_str());
  } catch (const std::runtime_error& e) {
    throw std::invalid_argument("malformed integer '" + text + "': " +
                                e.what());
  }
}

// -----------------------------------------------------------------------------
// parseDecimal()
// -----------------------------------------------------------------------------
Decimal parseDecimal(const std::string& text) {
  if (text.empty()) {
    throw std::invalid_argument("empty decimal string");
  }
  try {
    return Decimal(text.c_str());
  } catch (const std::runtime_error& e) {
    throw std::invalid_argument("malformed decimal '" + text + "': " +
                                e.what());
  }
}

Decimal toDecimal(const BigInt& value) {
  return Decimal(value.str().c_str());
}

// -----------------------------------------------------------------------------
// floorToInteger()
// -----------------------------------------------------------------------------
BigInt floorToInteger(const Decimal& value) {
  Decimal floored = boost::multiprecision::floor(value);
  // One fractional digit keeps str() in plain fixed notation; floored
  // values always print ".0", which is cut before parsing.
  std::string text = floored.str(1, std::ios_base::fixed);
  auto dot = text.find('.');
  if (dot != std::string::npos) {
    text.erase(dot);
  }
  if (text == "-0") {
    text = "0";
  }
  return parseBigInt(text);
}

// -----------------------------------------------------------------------------
// scaleAmount()
// -----------------------------------------------------------------------------
BigInt scaleAmount(double amount, int decimals) {
  if (!std::isfinite(amount) || amount < 0.0) {
    throw std::invalid_argument("amount must be finite and non-negative");
  }
  return scaleAmount(toDecimal(amount), decimals);
}

BigInt scaleAmount(const Decimal& amount, int decimals) {
  if (amount < 0) {
    throw std::invalid_argument("amount must be non-negative");
  }
  return floorToInteger(amount * pow10(decimals));
}

// -----------------------------------------------------------------------------
// descaleAmount()
// -----------------------------------------------------------------------------
double descaleAmount(const BigInt& scaled, int decimals) {
  Decimal human = toDecimal(scaled) * pow10(-decimals);
  return human.convert_to<double>();
}

// -----------------------------------------------------------------------------
// formatDecimal()
// -----------------------------------------------------------------------------
std::string formatDecimal(const Decimal& value, int max_fraction_digits) {
  std::string text = value.str(max_fraction_digits, std::ios_base::fixed);
  auto dot = text.find('.');
  if (dot == std::string::npos) {
    return text;
  }
  auto last = text.find_last_not_of('0');
  if (last == dot) {
    --last;
  }
  text.erase(last + 1);
  if (text == "-0") {
    return "0";
  }
  return text;
}

}  // namespace gmx
