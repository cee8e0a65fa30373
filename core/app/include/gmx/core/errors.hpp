#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace gmx {

// -----------------------------------------------------------------------------
// ErrorKind — rejection taxonomy of the order-construction pipeline
// -----------------------------------------------------------------------------
//
// @brief  Classifies every failure the pipeline can surface to a caller.
//
// @details
//   MissingField        request incomplete and the field is underivable
//   InsufficientBalance owner balance below the amount the order moves
//   AllowanceTooLow     spender allowance too low and auto-approve is off
//   CollateralTooLow    collateral USD value below the venue floor
//   LeverageExceeded    implied leverage above the venue maximum
//   PriceUnavailable    oracle snapshot has no entry for the token
//   SubmissionFailed    gateway rejected the broadcast
//   ConfigError         configuration file unreadable or invalid
//   GatewayError        collaborator transport or protocol failure
//
// The first seven are the pipeline's business rejections. ConfigError and
// GatewayError cover the plumbing around it.
// -----------------------------------------------------------------------------
enum class ErrorKind {
  MissingField,
  InsufficientBalance,
  AllowanceTooLow,
  CollateralTooLow,
  LeverageExceeded,
  PriceUnavailable,
  SubmissionFailed,
  ConfigError,
  GatewayError,
};

// Stable name used in logs and IPC error replies (e.g. "MissingField").
const char* errorKindName(ErrorKind kind);

// -----------------------------------------------------------------------------
// OrderError — base exception for all pipeline rejections
// -----------------------------------------------------------------------------
//
// @brief  std::runtime_error carrying an ErrorKind.
//
// @details
// Every rejection message names the field or threshold that failed together
// with the observed and required values. The pipeline never swallows these:
// they propagate unmodified to the caller, which decides whether a new run
// (fresh nonce, fresh prices) is warranted.
// -----------------------------------------------------------------------------
class OrderError : public std::runtime_error {
 public:
  OrderError(ErrorKind kind, const std::string& message)
      : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const noexcept { return kind_; }

 private:
  ErrorKind kind_;
};

// Lists every required field that could not be derived.
class MissingFieldError : public OrderError {
 public:
  explicit MissingFieldError(std::vector<std::string> fields);

  const std::vector<std::string>& fields() const noexcept { return fields_; }

 private:
  std::vector<std::string> fields_;
};

// Observed vs required threshold rejections. `observed` and `required` are
// already formatted by the thrower so integer and decimal values both keep
// their full precision in the message.
class ThresholdError : public OrderError {
 public:
  ThresholdError(ErrorKind kind, std::string subject, std::string observed,
                 std::string required);

  const std::string& subject() const noexcept { return subject_; }
  const std::string& observed() const noexcept { return observed_; }
  const std::string& required() const noexcept { return required_; }

 private:
  std::string subject_;
  std::string observed_;
  std::string required_;
};

class PriceUnavailableError : public OrderError {
 public:
  explicit PriceUnavailableError(
      const std::string& token_address,
      const std::string& reason = "oracle snapshot has no entry for token")
      : OrderError(ErrorKind::PriceUnavailable,
                   "price unavailable for " + token_address + ": " + reason),
        token_address_(token_address) {}

  const std::string& tokenAddress() const noexcept { return token_address_; }

 private:
  std::string token_address_;
};

class SubmissionFailedError : public OrderError {
 public:
  explicit SubmissionFailedError(const std::string& reason)
      : OrderError(ErrorKind::SubmissionFailed,
                   "submission failed: " + reason) {}
};

class ConfigError : public OrderError {
 public:
  explicit ConfigError(const std::string& reason)
      : OrderError(ErrorKind::ConfigError, "config error: " + reason) {}
};

class GatewayError : public OrderError {
 public:
  explicit GatewayError(const std::string& reason)
      : OrderError(ErrorKind::GatewayError, "gateway error: " + reason) {}
};

}  // namespace gmx
