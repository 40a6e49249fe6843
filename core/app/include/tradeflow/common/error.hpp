#pragma once

#include <stdexcept>
#include <string>

namespace tradeflow {

// -----------------------------------------------------------------------------
// ValidationError
// -----------------------------------------------------------------------------
// Thrown at construction and at ingress (config loading, JSON decoding,
// System::sendEvent) when a value breaks a domain rule: empty identifiers,
// non-positive quantities, free > total, unknown exchanges, out-of-bounds
// indices. Never thrown from inside the engine loop.
// -----------------------------------------------------------------------------
class ValidationError : public std::invalid_argument {
 public:
  explicit ValidationError(const std::string& message)
      : std::invalid_argument(message) {}
};

// Raised when a caller-supplied deadline on an engine wait expires.
class TimeoutError : public std::runtime_error {
 public:
  explicit TimeoutError(const std::string& message)
      : std::runtime_error(message) {}
};

// Raised by the audit channel when the Fail overflow policy trips.
class AuditOverflowError : public std::runtime_error {
 public:
  explicit AuditOverflowError(const std::string& message)
      : std::runtime_error(message) {}
};

}  // namespace tradeflow
