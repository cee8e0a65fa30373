#pragma once

#include "gmx/numeric/fixed_point.hpp"

#include <optional>
#include <string>

namespace gmx {
namespace domain {

enum class AllowanceStatus {
  Sufficient,  // existing allowance already covered the amount
  Approved,    // an approval transaction was broadcast
};

// -----------------------------------------------------------------------------
// AllowanceOutcome
// -----------------------------------------------------------------------------
// Result of one allowance check. `token_address` is the token actually
// checked, after the legacy alias was applied. Balance and allowance are the
// values observed before any approval.
// -----------------------------------------------------------------------------
struct AllowanceOutcome {
  AllowanceStatus status{AllowanceStatus::Sufficient};
  std::string token_address;
  BigInt balance{0};
  BigInt allowance{0};
  std::optional<std::string> approval_tx_id;
};

inline const char* allowanceStatusName(AllowanceStatus s) {
  switch (s) {
    case AllowanceStatus::Sufficient: return "Sufficient";
    case AllowanceStatus::Approved:   return "Approved";
  }
  return "Unknown";
}

}  // namespace domain
}  // namespace gmx
