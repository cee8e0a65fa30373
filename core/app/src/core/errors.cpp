#include "gmx/core/errors.hpp"

#include <utility>

namespace gmx {

// -----------------------------------------------------------------------------
// errorKindName()
// -----------------------------------------------------------------------------
const char* errorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::MissingField:        return "MissingField";
    case ErrorKind::InsufficientBalance: return "InsufficientBalance";
    case ErrorKind::AllowanceTooLow:     return "AllowanceTooLow";
    case ErrorKind::CollateralTooLow:    return "CollateralTooLow";
    case ErrorKind::LeverageExceeded:    return "LeverageExceeded";
    case ErrorKind::PriceUnavailable:    return "PriceUnavailable";
    case ErrorKind::SubmissionFailed:    return "SubmissionFailed";
    case ErrorKind::ConfigError:         return "ConfigError";
    case ErrorKind::GatewayError:        return "GatewayError";
  }
  return "Unknown";
}

namespace {

std::string joinFields(const std::vector<std::string>& fields) {
  std::string out;
  for (const auto& f : fields) {
    if (!out.empty()) {
      out += ", ";
    }
    out += f;
  }
  return out;
}

}  // namespace

// -----------------------------------------------------------------------------
// MissingFieldError
// -----------------------------------------------------------------------------
MissingFieldError::MissingFieldError(std::vector<std::string> fields)
    : OrderError(ErrorKind::MissingField,
                 "missing field(s) that could not be derived: " +
                     joinFields(fields)),
      fields_(std::move(fields)) {}

// -----------------------------------------------------------------------------
// ThresholdError
// -----------------------------------------------------------------------------
ThresholdError::ThresholdError(ErrorKind kind, std::string subject,
                               std::string observed, std::string required)
    : OrderError(kind, std::string(errorKindName(kind)) + ": " + subject +
                           " observed=" + observed + " required=" + required),
      subject_(std::move(subject)),
      observed_(std::move(observed)),
      required_(std::move(required)) {}

}  // namespace gmx
