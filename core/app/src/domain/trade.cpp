#include "tradeflow/domain/trade.hpp"

#include "tradeflow/common/error.hpp"
#include "tradeflow/domain/position.hpp"

namespace tradeflow {
namespace domain {

void Trade::validate() const {
  ensure_non_empty_id(id.str(), TradeIdTag::kName);
  ensure_non_empty_id(order_id.str(), OrderIdTag::kName);
  ensure_non_empty_id(strategy.str(), StrategyIdTag::kName);
  if (!price.is_positive()) {
    throw ValidationError("trade " + id.str() +
                          ": price must be positive, received " +
                          price.to_string());
  }
  if (!quantity.is_positive()) {
    throw ValidationError("trade " + id.str() +
                          ": quantity must be positive, received " +
                          quantity.to_string());
  }
  if (fees.fees.is_negative()) {
    throw ValidationError("trade " + id.str() + ": fees must not be negative");
  }
}

Decimal ClosedPosition::pnl_return() const {
  const Decimal cost = price_entry_average * quantity_abs_max;
  if (cost.is_zero()) {
    return Decimal{0};
  }
  return pnl_realised / cost;
}

}  // namespace domain
}  // namespace tradeflow
