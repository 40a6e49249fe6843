#pragma once

#include "tradeflow/domain/identifiers.hpp"
#include "tradeflow/domain/position.hpp"
#include "tradeflow/domain/trade.hpp"
#include "tradeflow/numeric/decimal.hpp"

#include <map>
#include <optional>

namespace tradeflow {

// -----------------------------------------------------------------------------
// PositionManager: per-strategy positions of one instrument
// -----------------------------------------------------------------------------
//
// @brief  Turns the trade stream into Positions and hands back a
//         ClosedPosition whenever net quantity returns to zero.
//
// @details
// applyTrade(trade, fees_quote) cases, mirroring the fill math:
//
//   Case 1: No position: open one facing trade.side at trade.price.
//
//   Case 2: Same direction: increase.
//     avg = (qty * avg + fill_qty * price) / (qty + fill_qty)
//     fees_enter += fees; pnl_realised -= fees.
//
//   Case 3: Opposite direction, fill_qty <= qty: reduce.
//     pnl_realised += fill_qty * (price - avg) * sign - fees
//     fees_exit += fees; avg unchanged.
//     fill_qty == qty closes the position.
//
//   Case 4: Opposite direction, fill_qty > qty: crossing zero.
//     The existing position closes at price (the whole fee is charged to the
//     exit) and a new position of (fill_qty - qty) opens at price, facing
//     trade.side, with no fees.
//
// fees_quote is the trade's fee expressed in the instrument's pricing asset.
// After every trade pnl_unrealised is re-marked at the trade price;
// markToMarket() re-marks it at the latest market price.
//
// Thread model: owned by EngineState on the engine thread; no locking.
// -----------------------------------------------------------------------------
class PositionManager {
 public:
  const std::map<domain::StrategyId, domain::Position>& positions() const {
    return positions_;
  }

  const domain::Position* find(const domain::StrategyId& strategy) const;

  // Σ signed quantity across strategies.
  Decimal netQuantity() const;

  std::optional<domain::ClosedPosition> applyTrade(const domain::Trade& trade,
                                                    const Decimal& fees_quote);

  void markToMarket(const Decimal& price);

  void clear() { positions_.clear(); }

 private:
  std::map<domain::StrategyId, domain::Position> positions_;
};

}  // namespace tradeflow
