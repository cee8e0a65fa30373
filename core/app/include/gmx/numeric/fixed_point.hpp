#pragma once

#include <boost/multiprecision/cpp_dec_float.hpp>
#include <boost/multiprecision/cpp_int.hpp>

#include <string>

namespace gmx {

// -----------------------------------------------------------------------------
// On-chain numeric types
// -----------------------------------------------------------------------------
//
// BigInt:  arbitrary precision integer. Every on-chain quantity (30-decimal
//          USD sizes, token amounts in base units, gas, wei fees, nonces
//          read as uint256) is a BigInt. 1000 USD at 30 decimals is 1e33,
//          well past 64 bits.
//
// Decimal: 50 significant decimal digits, base-10 representation. Used for
//          every intermediate price computation (median, slippage, scaling
//          by a negative power of ten) so that raw oracle integers of up
//          to ~36 digits survive without binary rounding.
// -----------------------------------------------------------------------------
using BigInt = boost::multiprecision::cpp_int;
using Decimal = boost::multiprecision::cpp_dec_float_50;

// Implicit decimal scale of USD amounts and oracle prices on the exchange.
constexpr int kUsdDecimals = 30;

// 10^exponent, exact for negative exponents as well (base-10 backend).
Decimal pow10(int exponent);

// Converts a human-entered double through its shortest 15-significant-digit
// text form, so 0.1 becomes exactly 0.1 rather than its binary neighbour.
Decimal toDecimal(double value);

// Parses an integer string (decimal or 0x-prefixed hex).
// Throws std::invalid_argument on malformed input.
BigInt parseBigInt(const std::string& text);

// Parses a decimal number string ("60005", "0.003", "1e24").
// Throws std::invalid_argument on malformed input.
Decimal parseDecimal(const std::string& text);

Decimal toDecimal(const BigInt& value);

// floor(value) as an integer. Valid for negative values as well.
BigInt floorToInteger(const Decimal& value);

// -----------------------------------------------------------------------------
// scaleAmount(amount, decimals)
// -----------------------------------------------------------------------------
// @brief  floor(amount × 10^decimals): human units to on-chain base units.
//
// @throws std::invalid_argument if amount is negative or not finite. The
//         result is therefore always non-negative.
// -----------------------------------------------------------------------------
BigInt scaleAmount(double amount, int decimals);
BigInt scaleAmount(const Decimal& amount, int decimals);

// Inverse of scaleAmount: base units back to human units.
double descaleAmount(const BigInt& scaled, int decimals);

// Fixed-notation text with at most `max_fraction_digits` fractional digits;
// trailing zeros are trimmed ("60185.015", "2", "0.000001").
std::string formatDecimal(const Decimal& value, int max_fraction_digits = 18);

inline std::string formatInteger(const BigInt& value) { return value.str(); }

}  // namespace gmx
