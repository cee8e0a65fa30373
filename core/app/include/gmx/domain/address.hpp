#pragma once

#include <algorithm>
#include <cctype>
#include <string>

namespace gmx {
namespace domain {

// Ledger addresses arrive in mixed (checksummed) and lower case. Lookups key
// on the lower-case form; the caller's spelling is kept for output.
inline std::string normalizeAddress(std::string address) {
  std::transform(address.begin(), address.end(), address.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return address;
}

inline bool sameAddress(const std::string& a, const std::string& b) {
  return a.size() == b.size() && normalizeAddress(a) == normalizeAddress(b);
}

inline const std::string& zeroAddress() {
  static const std::string kZero = "0x0000000000000000000000000000000000000000";
  return kZero;
}

}  // namespace domain
}  // namespace gmx
