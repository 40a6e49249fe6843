#pragma once

#include "tradeflow/domain/identifiers.hpp"
#include "tradeflow/domain/order.hpp"
#include "tradeflow/events/account_event.hpp"

#include <vector>

namespace tradeflow {

// -----------------------------------------------------------------------------
// IExecutionClient: one exchange's order entry and account source
// -----------------------------------------------------------------------------
//
// @brief  Converts engine order requests into venue calls and reports what
//         happened as AccountEvents.
//
// @details
// The system builds one client per configured exchange and wraps it in an
// OrderRoutingThread. That thread is the only caller of openOrder() and
// cancelOrder(), so a client sees requests in the order the engine
// dispatched them and returns responses in the same order.
//
// accountSnapshot() is called once from the system thread at start-up to
// seed EngineState, before any request is routed.
//
// A client reports every outcome, including failures, as AccountEvents:
//   - an open that fails or is refused → OrderSnapshot Inactive(Rejected |
//     OpenFailed);
//   - a cancel that fails              → OrderCancelled(CancelError).
// Exceptions escaping these calls are turned into the same failure events
// by the routing thread.
//
// Clients never touch EngineState.
//
// Ownership: shared (std::shared_ptr) between the system and its routing
// thread.
// -----------------------------------------------------------------------------
class IExecutionClient {
 public:
  virtual ~IExecutionClient() = default;

  virtual domain::ExchangeId exchange() const = 0;

  virtual AccountSnapshot accountSnapshot() = 0;

  virtual std::vector<AccountEvent> openOrder(
      const domain::OrderRequestOpen& request) = 0;

  virtual std::vector<AccountEvent> cancelOrder(
      const domain::OrderRequestCancel& request) = 0;
};

}  // namespace tradeflow
