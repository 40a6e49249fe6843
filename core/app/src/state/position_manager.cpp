#include "tradeflow/state/position_manager.hpp"

namespace tradeflow {

using domain::ClosedPosition;
using domain::Position;

namespace {

Decimal unrealised(const Position& pos, const Decimal& price) {
  return (price - pos.price_entry_average) * pos.quantity_abs *
         Decimal{domain::side_sign(pos.side)};
}

Position open_position(const domain::Trade& trade, const Decimal& quantity,
                       const Decimal& fees) {
  Position pos;
  pos.instrument = trade.instrument;
  pos.strategy = trade.strategy;
  pos.side = trade.side;
  pos.price_entry_average = trade.price;
  pos.quantity_abs = quantity;
  pos.quantity_abs_max = quantity;
  pos.fees_enter = fees;
  pos.pnl_realised = -fees;
  pos.time_enter = trade.time_exchange;
  pos.time_exchange_update = trade.time_exchange;
  pos.trades.push_back(trade.id);
  return pos;
}

ClosedPosition close_position(const Position& pos, Timestamp time_exit) {
  ClosedPosition closed;
  closed.instrument = pos.instrument;
  closed.strategy = pos.strategy;
  closed.side = pos.side;
  closed.price_entry_average = pos.price_entry_average;
  closed.quantity_abs_max = pos.quantity_abs_max;
  closed.pnl_realised = pos.pnl_realised;
  closed.fees_enter = pos.fees_enter;
  closed.fees_exit = pos.fees_exit;
  closed.time_enter = pos.time_enter;
  closed.time_exit = time_exit;
  closed.trades = pos.trades;
  return closed;
}

}  // namespace

const Position* PositionManager::find(const domain::StrategyId& strategy) const {
  auto it = positions_.find(strategy);
  return it == positions_.end() ? nullptr : &it->second;
}

Decimal PositionManager::netQuantity() const {
  Decimal net;
  for (const auto& [strategy, pos] : positions_) {
    net += pos.signed_quantity();
  }
  return net;
}

std::optional<ClosedPosition> PositionManager::applyTrade(
    const domain::Trade& trade, const Decimal& fees_quote) {
  auto it = positions_.find(trade.strategy);

  // --- Case 1: flat, first fill opens the position -------------------------
  if (it == positions_.end()) {
    Position pos = open_position(trade, trade.quantity, fees_quote);
    pos.pnl_unrealised = unrealised(pos, trade.price);
    positions_.emplace(trade.strategy, std::move(pos));
    return std::nullopt;
  }

  Position& pos = it->second;
  pos.time_exchange_update = trade.time_exchange;
  pos.trades.push_back(trade.id);

  // --- Case 2: increasing ---------------------------------------------------
  if (pos.side == trade.side) {
    const Decimal total = pos.quantity_abs + trade.quantity;
    pos.price_entry_average =
        (pos.quantity_abs * pos.price_entry_average +
         trade.quantity * trade.price) /
        total;
    pos.quantity_abs = total;
    pos.quantity_abs_max = max(pos.quantity_abs_max, total);
    pos.fees_enter += fees_quote;
    pos.pnl_realised -= fees_quote;
    pos.pnl_unrealised = unrealised(pos, trade.price);
    return std::nullopt;
  }

  const Decimal direction{domain::side_sign(pos.side)};
  const Decimal closed_qty = min(trade.quantity, pos.quantity_abs);

  // A crossing trade splits its fee by quantity: the closed side pays for
  // closed_qty, the reopened side for the remainder.
  const Decimal fees_exit = closed_qty < trade.quantity
                                ? fees_quote * closed_qty / trade.quantity
                                : fees_quote;

  pos.pnl_realised +=
      closed_qty * (trade.price - pos.price_entry_average) * direction -
      fees_exit;
  pos.fees_exit += fees_exit;

  // --- Case 3: reducing, possibly to exactly zero ---------------------------
  if (trade.quantity < pos.quantity_abs) {
    pos.quantity_abs -= trade.quantity;
    pos.pnl_unrealised = unrealised(pos, trade.price);
    return std::nullopt;
  }

  ClosedPosition closed = close_position(pos, trade.time_exchange);
  const Decimal remainder = trade.quantity - pos.quantity_abs;
  positions_.erase(it);

  // --- Case 4: crossing zero, remainder opens the other way -----------------
  if (remainder.is_positive()) {
    Position reopened = open_position(trade, remainder, fees_quote - fees_exit);
    reopened.pnl_unrealised = unrealised(reopened, trade.price);
    positions_.emplace(trade.strategy, std::move(reopened));
  }

  return closed;
}

void PositionManager::markToMarket(const Decimal& price) {
  for (auto& [strategy, pos] : positions_) {
    pos.pnl_unrealised = unrealised(pos, price);
  }
}

}  // namespace tradeflow
