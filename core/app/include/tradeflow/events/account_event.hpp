#pragma once

#include "tradeflow/domain/balance.hpp"
#include "tradeflow/domain/identifiers.hpp"
#include "tradeflow/domain/order.hpp"
#include "tradeflow/domain/trade.hpp"
#include "tradeflow/events/market_event.hpp"

#include <string>
#include <variant>
#include <vector>

namespace tradeflow {

struct InstrumentAccountSnapshot {
  domain::InstrumentIndex instrument{0};
  std::vector<domain::OrderSnapshot> orders;
};

// -----------------------------------------------------------------------------
// AccountSnapshot
// -----------------------------------------------------------------------------
// Full account state of one exchange: balances and the orders the venue
// still knows about. Seeds EngineState at start-up and resynchronises it
// after an account reconnect.
// -----------------------------------------------------------------------------
struct AccountSnapshot {
  domain::ExchangeIndex exchange{0};
  std::vector<domain::AssetBalance> balances;
  std::vector<InstrumentAccountSnapshot> instruments;
};

struct CancelError {
  std::string reason;
};

// Exchange answer to a cancel request: Cancelled on success, CancelError
// otherwise (the order stays as it was before the cancel was sent).
struct OrderCancelled {
  domain::OrderKey key;
  std::variant<domain::Cancelled, CancelError> result;

  bool ok() const { return std::holds_alternative<domain::Cancelled>(result); }
};

// -----------------------------------------------------------------------------
// AccountEvent
// -----------------------------------------------------------------------------
//
//   Snapshot         AccountSnapshot
//   BalanceSnapshot  domain::AssetBalance
//   OrderSnapshot    domain::OrderSnapshot (also carries open failures as
//                    Inactive(OpenFailed | Rejected))
//   OrderCancelled   OrderCancelled
//   Trade            domain::Trade
// -----------------------------------------------------------------------------
using AccountEventKind =
    std::variant<AccountSnapshot, domain::AssetBalance, domain::OrderSnapshot,
                 OrderCancelled, domain::Trade>;

// "Snapshot", "BalanceSnapshot", "OrderSnapshot", "OrderCancelled", "Trade"
const char* kind_name(const AccountEventKind& kind);

struct AccountEvent {
  domain::ExchangeIndex exchange{0};
  AccountEventKind kind{domain::AssetBalance{}};
};

using AccountStreamEvent = std::variant<Reconnecting, AccountEvent>;

}  // namespace tradeflow
