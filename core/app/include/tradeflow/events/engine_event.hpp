#pragma once

#include "tradeflow/events/account_event.hpp"
#include "tradeflow/events/command.hpp"
#include "tradeflow/events/market_event.hpp"

#include <variant>

namespace tradeflow {

enum class TradingState {
  Enabled,
  Disabled,
};

const char* to_string(TradingState state);

struct Shutdown {};

struct TradingStateUpdate {
  TradingState state{TradingState::Disabled};
};

// -----------------------------------------------------------------------------
// EngineEvent: the single input type of the engine feed
// -----------------------------------------------------------------------------
//
//   Shutdown
//   TradingStateUpdate(Enabled | Disabled)
//   Command(SendOpenRequests | SendCancelRequests | CancelOrders |
//           ClosePositions)
//   Account(Reconnecting(exchange) | Item(AccountEvent))
//   Market(Reconnecting(exchange) | Item(MarketEvent))
//
// Values move through the feed by value; the engine owns each event once it
// has popped it.
// -----------------------------------------------------------------------------
using EngineEvent = std::variant<Shutdown, TradingStateUpdate, Command,
                                 AccountStreamEvent, MarketStreamEvent>;

// Classification recorded in every audit Process tick:
// "Shutdown", "TradingStateUpdate", "Command", "Account", "Market".
const char* event_kind(const EngineEvent& event);

}  // namespace tradeflow
