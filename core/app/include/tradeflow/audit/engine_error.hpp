#pragma once

#include "tradeflow/domain/order.hpp"

#include <optional>
#include <string>
#include <variant>

namespace tradeflow {

// -----------------------------------------------------------------------------
// EngineError: a failure the engine records instead of throwing
// -----------------------------------------------------------------------------
// Recoverable: one request refused by risk or by the dispatch queue, or one
// untrusted event that could not be applied. Processing continues.
//
// Unrecoverable: an account event references state the engine does not
// have (unknown exchange, instrument or asset). The engine drains
// immediately and ends the audit stream.
//
// order names the offending request when there is one.
// -----------------------------------------------------------------------------
struct EngineError {
  enum class Severity {
    Recoverable,
    Unrecoverable,
  };

  Severity severity{Severity::Recoverable};
  std::optional<OrderRequest> order;
  std::string message;

  static EngineError recoverable(std::string message,
                                 std::optional<OrderRequest> order = std::nullopt) {
    return EngineError{Severity::Recoverable, std::move(order), std::move(message)};
  }
  static EngineError unrecoverable(std::string message) {
    return EngineError{Severity::Unrecoverable, std::nullopt, std::move(message)};
  }

  bool is_unrecoverable() const { return severity == Severity::Unrecoverable; }
};

const char* to_string(EngineError::Severity severity);

}  // namespace tradeflow
