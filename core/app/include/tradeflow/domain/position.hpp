#pragma once

#include "tradeflow/domain/identifiers.hpp"
#include "tradeflow/domain/order.hpp"
#include "tradeflow/numeric/decimal.hpp"
#include "tradeflow/time/time_utils.hpp"

#include <optional>
#include <vector>

namespace tradeflow {
namespace domain {

// -----------------------------------------------------------------------------
// Position: open exposure of one strategy on one instrument
// -----------------------------------------------------------------------------
//
// @brief  Built from the trade stream by PositionManager.
//
// @details
// Sign convention: side says which way the position faces; quantity_abs is
// always positive while the position exists (a flat strategy has no
// Position at all). signed_quantity() returns +quantity_abs for long and
// -quantity_abs for short.
//
// price_entry_average is the quantity-weighted entry price. It moves only
// when the position grows; reductions keep it.
//
// pnl_realised accumulates closed-portion PnL net of every fee paid so far
// (entry fees are charged the moment they are paid). pnl_unrealised is the
// mark-to-market of the open quantity at the last known price, ignoring the
// exit fees not yet paid.
//
// quantity_abs_max is the largest size the position reached; it is the
// denominator base for ClosedPosition::pnl_return().
// -----------------------------------------------------------------------------
struct Position {
  InstrumentIndex instrument{0};
  StrategyId strategy;
  Side side{Side::Buy};
  Decimal price_entry_average;
  Decimal quantity_abs;
  Decimal quantity_abs_max;
  Decimal pnl_unrealised;
  Decimal pnl_realised;
  Decimal fees_enter;
  Decimal fees_exit;
  Timestamp time_enter{};
  Timestamp time_exchange_update{};
  std::vector<TradeId> trades;

  Decimal signed_quantity() const {
    return side == Side::Buy ? quantity_abs : -quantity_abs;
  }
};

// -----------------------------------------------------------------------------
// ClosedPosition: a Position whose quantity returned to zero
// -----------------------------------------------------------------------------
struct ClosedPosition {
  InstrumentIndex instrument{0};
  StrategyId strategy;
  Side side{Side::Buy};
  Decimal price_entry_average;
  Decimal quantity_abs_max;
  Decimal pnl_realised;
  Decimal fees_enter;
  Decimal fees_exit;
  Timestamp time_enter{};
  Timestamp time_exit{};
  std::vector<TradeId> trades;

  // pnl_realised / (price_entry_average * quantity_abs_max); zero when the
  // cost base is zero.
  Decimal pnl_return() const;
};

}  // namespace domain
}  // namespace tradeflow
