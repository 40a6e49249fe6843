#include "tradeflow/domain/order.hpp"

#include "tradeflow/common/error.hpp"
#include "tradeflow/common/overloaded.hpp"

namespace tradeflow {
namespace domain {

const char* to_string(Side side) {
  switch (side) {
    case Side::Buy:  return "buy";
    case Side::Sell: return "sell";
  }
  return "buy";
}

Side opposite(Side side) { return side == Side::Buy ? Side::Sell : Side::Buy; }

const char* to_string(OrderKind kind) {
  switch (kind) {
    case OrderKind::Market: return "market";
    case OrderKind::Limit:  return "limit";
  }
  return "market";
}

bool operator==(const OrderKey& a, const OrderKey& b) {
  return a.exchange == b.exchange && a.instrument == b.instrument &&
         a.strategy == b.strategy && a.cid == b.cid;
}

const char* state_name(const OrderState& state) {
  return std::visit(overloaded{
                        [](const OpenInFlight&) { return "OpenInFlight"; },
                        [](const Open&) { return "Open"; },
                        [](const CancelInFlight&) { return "CancelInFlight"; },
                        [](const FullyFilled&) { return "FullyFilled"; },
                        [](const Expired&) { return "Expired"; },
                        [](const Cancelled&) { return "Cancelled"; },
                        [](const Rejected&) { return "Rejected"; },
                        [](const OpenFailed&) { return "OpenFailed"; },
                    },
                    state);
}

bool is_valid_transition(const OrderState& current, const OrderState& next) {
  if (is_inactive(current)) {
    return false;
  }
  if (is_inactive(next)) {
    return true;
  }
  if (std::holds_alternative<OpenInFlight>(current)) {
    return true;
  }
  if (const auto* open = std::get_if<Open>(&current)) {
    if (const auto* next_open = std::get_if<Open>(&next)) {
      return next_open->filled_quantity >= open->filled_quantity;
    }
    return std::holds_alternative<CancelInFlight>(next);
  }
  // CancelInFlight
  return !std::holds_alternative<OpenInFlight>(next);
}

namespace {

void validate_price_quantity(OrderKind kind, const Decimal& price,
                             const Decimal& quantity, const OrderKey& key) {
  if (!quantity.is_positive()) {
    throw ValidationError("order " + key.cid.str() +
                          ": quantity must be positive, received " +
                          quantity.to_string());
  }
  if (price.is_negative()) {
    throw ValidationError("order " + key.cid.str() +
                          ": price must not be negative, received " +
                          price.to_string());
  }
  if (kind == OrderKind::Limit && !price.is_positive()) {
    throw ValidationError("order " + key.cid.str() +
                          ": limit order price must be positive");
  }
}

void validate_key(const OrderKey& key) {
  ensure_non_empty_id(key.strategy.str(), StrategyIdTag::kName);
  ensure_non_empty_id(key.cid.str(), ClientOrderIdTag::kName);
}

}  // namespace

void OrderRequestOpen::validate() const {
  validate_key(key);
  validate_price_quantity(kind, price, quantity, key);
}

OrderSnapshot OrderSnapshot::from_request(const OrderRequestOpen& request,
                                          std::optional<OrderId> order_id,
                                          std::optional<Timestamp> time_exchange,
                                          Decimal filled_quantity) {
  OrderSnapshot snapshot;
  snapshot.key = request.key;
  snapshot.side = request.side;
  snapshot.price = request.price;
  snapshot.quantity = request.quantity;
  snapshot.kind = request.kind;
  snapshot.time_in_force = request.time_in_force;

  if (order_id.has_value() != time_exchange.has_value()) {
    throw ValidationError("order " + request.key.cid.str() +
                          ": order_id and time_exchange must be set together");
  }
  if (order_id) {
    snapshot.state = Open{*order_id, *time_exchange, filled_quantity};
  } else {
    snapshot.state = OpenInFlight{};
  }
  snapshot.validate();
  return snapshot;
}

void OrderSnapshot::validate() const {
  validate_key(key);
  validate_price_quantity(kind, price, quantity, key);

  const Open* open = std::get_if<Open>(&state);
  if (const auto* cancel = std::get_if<CancelInFlight>(&state)) {
    open = cancel->order ? &*cancel->order : nullptr;
  }
  if (open != nullptr) {
    if (open->filled_quantity.is_negative()) {
      throw ValidationError("order " + key.cid.str() +
                            ": filled_quantity must not be negative");
    }
    if (open->filled_quantity > quantity) {
      throw ValidationError("order " + key.cid.str() + ": filled_quantity " +
                            open->filled_quantity.to_string() +
                            " exceeds quantity " + quantity.to_string());
    }
  }
}

Decimal OrderSnapshot::quantity_remaining() const {
  if (const auto* open = std::get_if<Open>(&state)) {
    return quantity - open->filled_quantity;
  }
  return quantity;
}

OrderRequestCancel OrderSnapshot::to_cancel_request() const {
  OrderRequestCancel request;
  request.key = key;
  if (const auto* open = std::get_if<Open>(&state)) {
    request.id = open->id;
  } else if (const auto* cancel = std::get_if<CancelInFlight>(&state)) {
    if (cancel->order) {
      request.id = cancel->order->id;
    }
  }
  return request;
}

}  // namespace domain
}  // namespace tradeflow
