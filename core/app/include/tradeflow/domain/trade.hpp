#pragma once

#include "tradeflow/domain/identifiers.hpp"
#include "tradeflow/domain/order.hpp"
#include "tradeflow/numeric/decimal.hpp"
#include "tradeflow/time/time_utils.hpp"

namespace tradeflow {
namespace domain {

// Fees charged for a trade, in the named asset.
struct AssetFees {
  AssetIndex asset{0};
  Decimal fees;
};

// -----------------------------------------------------------------------------
// Trade: one fill reported by an exchange
// -----------------------------------------------------------------------------
// quantity is always positive; side gives the direction. The position
// manager turns the trade stream into Positions and ClosedPositions.
// -----------------------------------------------------------------------------
struct Trade {
  TradeId id;
  OrderId order_id;
  InstrumentIndex instrument{0};
  StrategyId strategy;
  Timestamp time_exchange{};
  Side side{Side::Buy};
  Decimal price;
  Decimal quantity;
  AssetFees fees;

  Decimal value_quote() const { return price * quantity; }

  // Throws ValidationError for empty ids or non-positive price/quantity.
  void validate() const;
};

}  // namespace domain
}  // namespace tradeflow
