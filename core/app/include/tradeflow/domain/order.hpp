#pragma once

#include "tradeflow/domain/identifiers.hpp"
#include "tradeflow/domain/order_state.hpp"
#include "tradeflow/numeric/decimal.hpp"

#include <optional>
#include <variant>

namespace tradeflow {
namespace domain {

// -----------------------------------------------------------------------------
// Side
// -----------------------------------------------------------------------------
enum class Side {
  Buy,
  Sell,
};

const char* to_string(Side side);
Side opposite(Side side);

// +1 for Buy, -1 for Sell.
inline int side_sign(Side side) { return side == Side::Buy ? 1 : -1; }

enum class OrderKind {
  Market,
  Limit,
};

const char* to_string(OrderKind kind);

// -----------------------------------------------------------------------------
// TimeInForce
// -----------------------------------------------------------------------------
// GoodUntilCancelled carries the post_only flag; the other policies do not.
// -----------------------------------------------------------------------------
struct TimeInForce {
  enum class Type {
    GoodUntilCancelled,
    GoodUntilEndOfDay,
    FillOrKill,
    ImmediateOrCancel,
  };

  Type type{Type::GoodUntilCancelled};
  bool post_only{false};

  static TimeInForce good_until_cancelled(bool post_only = false) {
    return TimeInForce{Type::GoodUntilCancelled, post_only};
  }
  static TimeInForce good_until_end_of_day() {
    return TimeInForce{Type::GoodUntilEndOfDay, false};
  }
  static TimeInForce fill_or_kill() { return TimeInForce{Type::FillOrKill, false}; }
  static TimeInForce immediate_or_cancel() {
    return TimeInForce{Type::ImmediateOrCancel, false};
  }
};

inline bool operator==(const TimeInForce& a, const TimeInForce& b) {
  return a.type == b.type && a.post_only == b.post_only;
}

// -----------------------------------------------------------------------------
// OrderKey
// -----------------------------------------------------------------------------
// The engine's identity for an order. ClientOrderId is unique per
// (exchange, instrument, strategy); the engine additionally keys its order
// table by ClientOrderId within an instrument.
// -----------------------------------------------------------------------------
struct OrderKey {
  ExchangeIndex exchange{0};
  InstrumentIndex instrument{0};
  StrategyId strategy;
  ClientOrderId cid;
};

bool operator==(const OrderKey& a, const OrderKey& b);
inline bool operator!=(const OrderKey& a, const OrderKey& b) { return !(a == b); }

// -----------------------------------------------------------------------------
// OrderRequestOpen
// -----------------------------------------------------------------------------
// Intent to open an order. For Market orders price is the reference price the
// mock venue fills at (0 means "use the latest market price").
//
// validate() throws ValidationError when quantity <= 0, price < 0, or a limit
// order has no positive price.
// -----------------------------------------------------------------------------
struct OrderRequestOpen {
  OrderKey key;
  Side side{Side::Buy};
  Decimal price;
  Decimal quantity;
  OrderKind kind{OrderKind::Market};
  TimeInForce time_in_force;

  void validate() const;
};

// Cancel intent. id is the exchange OrderId when the engine already knows it.
struct OrderRequestCancel {
  OrderKey key;
  std::optional<OrderId> id;
};

// -----------------------------------------------------------------------------
// OrderSnapshot
// -----------------------------------------------------------------------------
//
// @brief  The engine's (or exchange's) view of one order at a point in time.
//
// @details
// Invariants (checked by validate(), which throws ValidationError):
//   - quantity > 0
//   - price > 0 unless kind == Market (Market allows price >= 0)
//   - 0 <= filled_quantity <= quantity when the state is Open
//
// from_request() derives the initial state from what the venue has told us:
//   - neither order_id nor time_exchange → Active(OpenInFlight)
//   - both                               → Active(Open{id, time, filled})
//   - exactly one                        → ValidationError
// -----------------------------------------------------------------------------
struct OrderSnapshot {
  OrderKey key;
  Side side{Side::Buy};
  Decimal price;
  Decimal quantity;
  OrderKind kind{OrderKind::Market};
  TimeInForce time_in_force;
  OrderState state{OpenInFlight{}};

  static OrderSnapshot from_request(const OrderRequestOpen& request,
                                    std::optional<OrderId> order_id = std::nullopt,
                                    std::optional<Timestamp> time_exchange = std::nullopt,
                                    Decimal filled_quantity = Decimal{0});

  void validate() const;

  bool is_active() const { return domain::is_active(state); }
  bool is_inactive() const { return domain::is_inactive(state); }

  // Remaining quantity when Open, full quantity otherwise.
  Decimal quantity_remaining() const;

  OrderRequestCancel to_cancel_request() const;
};

}  // namespace domain

// Either half of an order request, as queued for an exchange.
using OrderRequest =
    std::variant<domain::OrderRequestOpen, domain::OrderRequestCancel>;

}  // namespace tradeflow
