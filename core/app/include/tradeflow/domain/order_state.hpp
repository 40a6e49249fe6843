#pragma once

#include "tradeflow/domain/identifiers.hpp"
#include "tradeflow/numeric/decimal.hpp"
#include "tradeflow/time/time_utils.hpp"

#include <optional>
#include <string>
#include <variant>

namespace tradeflow {
namespace domain {

// -----------------------------------------------------------------------------
// Order lifecycle
// -----------------------------------------------------------------------------
//
//   Active:   OpenInFlight ──► Open{id, time, filled} ──► CancelInFlight
//                   │              │    ▲                        │
//                   │              │    └──(cancel rejected)─────┤
//                   ▼              ▼                             ▼
//   Inactive: FullyFilled | Expired | Cancelled | Rejected | OpenFailed
//
// Transitions only ever go from Active* to Inactive*. An Inactive order is
// terminal: the engine removes it from the order table.
// -----------------------------------------------------------------------------

struct OpenInFlight {};

struct Open {
  OrderId id;
  Timestamp time_exchange{};
  Decimal filled_quantity;
};

// Cancel dispatched, exchange has not answered. Keeps the Open state it came
// from (if any) so a rejected cancel can restore it.
struct CancelInFlight {
  std::optional<Open> order;
};

struct FullyFilled {};
struct Expired {};

struct Cancelled {
  std::optional<OrderId> id;
  Timestamp time_exchange{};
};

struct Rejected {
  std::string reason;
};

struct OpenFailed {
  std::string reason;
};

using OrderState = std::variant<OpenInFlight, Open, CancelInFlight, FullyFilled,
                                Expired, Cancelled, Rejected, OpenFailed>;

inline bool is_active(const OrderState& state) {
  return std::holds_alternative<OpenInFlight>(state) ||
         std::holds_alternative<Open>(state) ||
         std::holds_alternative<CancelInFlight>(state);
}

inline bool is_inactive(const OrderState& state) { return !is_active(state); }

// "OpenInFlight", "Open", ..., "OpenFailed"
const char* state_name(const OrderState& state);

// -----------------------------------------------------------------------------
// is_valid_transition(current, next)
// -----------------------------------------------------------------------------
// @brief  Pure state-machine check used by the order manager before applying
//         an exchange snapshot.
//
// @details
//   OpenInFlight   → OpenInFlight, Open, CancelInFlight, any Inactive
//   Open           → Open (filled_quantity non-decreasing), CancelInFlight,
//                    any Inactive
//   CancelInFlight → CancelInFlight, Open (cancel rejected), any Inactive
//   Inactive       → nothing
// -----------------------------------------------------------------------------
bool is_valid_transition(const OrderState& current, const OrderState& next);

}  // namespace domain
}  // namespace tradeflow
