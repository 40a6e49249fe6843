#include "tradeflow/state/market_data_state.hpp"

#include "tradeflow/common/overloaded.hpp"

namespace tradeflow {

namespace {

template <typename Side>
void apply_levels(Side& side, const std::vector<Level>& levels) {
  for (const auto& level : levels) {
    if (level.amount.is_zero()) {
      side.erase(level.price);
    } else {
      side[level.price] = level.amount;
    }
  }
}

}  // namespace

void MarketDataState::apply(const MarketEvent& event) {
  time_last_update = event.time_exchange;

  std::visit(overloaded{
                 [this](const PublicTrade& trade) { last_price = trade.price; },
                 [this](const OrderBookL1& l1) {
                   if (auto mid = l1.mid_price()) {
                     last_price = *mid;
                   }
                 },
                 [this](const OrderBookEvent& book) {
                   if (book.type == OrderBookEvent::Type::Snapshot) {
                     bids.clear();
                     asks.clear();
                   }
                   apply_levels(bids, book.book.bids);
                   apply_levels(asks, book.book.asks);
                   if (auto mid = book_mid_price()) {
                     last_price = *mid;
                   }
                 },
                 [this](const Candle& candle) {
                   last_price = candle.close;
                   last_candle = candle;
                 },
                 [](const Liquidation&) {},
             },
             event.kind);
}

std::optional<Decimal> MarketDataState::book_mid_price() const {
  if (bids.empty() || asks.empty()) {
    return std::nullopt;
  }
  return (bids.begin()->first + asks.begin()->first) / Decimal{2};
}

}  // namespace tradeflow
