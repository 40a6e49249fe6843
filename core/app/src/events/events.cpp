#include "tradeflow/common/overloaded.hpp"
#include "tradeflow/events/engine_event.hpp"

namespace tradeflow {

std::optional<Decimal> OrderBookL1::mid_price() const {
  if (!best_bid || !best_ask) {
    return std::nullopt;
  }
  return (best_bid->price + best_ask->price) / Decimal{2};
}

const char* kind_name(const MarketEventKind& kind) {
  return std::visit(overloaded{
                        [](const PublicTrade&) { return "trade"; },
                        [](const OrderBookL1&) { return "order_book_l1"; },
                        [](const OrderBookEvent&) { return "order_book"; },
                        [](const Candle&) { return "candle"; },
                        [](const Liquidation&) { return "liquidation"; },
                    },
                    kind);
}

const char* kind_name(const AccountEventKind& kind) {
  return std::visit(overloaded{
                        [](const AccountSnapshot&) { return "Snapshot"; },
                        [](const domain::AssetBalance&) { return "BalanceSnapshot"; },
                        [](const domain::OrderSnapshot&) { return "OrderSnapshot"; },
                        [](const OrderCancelled&) { return "OrderCancelled"; },
                        [](const domain::Trade&) { return "Trade"; },
                    },
                    kind);
}

const char* command_name(const Command& command) {
  return std::visit(overloaded{
                        [](const SendOpenRequests&) { return "SendOpenRequests"; },
                        [](const SendCancelRequests&) { return "SendCancelRequests"; },
                        [](const CancelOrders&) { return "CancelOrders"; },
                        [](const ClosePositions&) { return "ClosePositions"; },
                    },
                    command);
}

const char* to_string(TradingState state) {
  return state == TradingState::Enabled ? "Enabled" : "Disabled";
}

const char* event_kind(const EngineEvent& event) {
  return std::visit(overloaded{
                        [](const Shutdown&) { return "Shutdown"; },
                        [](const TradingStateUpdate&) { return "TradingStateUpdate"; },
                        [](const Command&) { return "Command"; },
                        [](const AccountStreamEvent&) { return "Account"; },
                        [](const MarketStreamEvent&) { return "Market"; },
                    },
                    event);
}

}  // namespace tradeflow
