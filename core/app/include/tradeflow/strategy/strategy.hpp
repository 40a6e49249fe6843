#pragma once

#include "tradeflow/domain/identifiers.hpp"
#include "tradeflow/domain/order.hpp"
#include "tradeflow/state/engine_state.hpp"

#include <vector>

namespace tradeflow {

// Cancel and open requests proposed in one decision.
struct OrderRequests {
  std::vector<domain::OrderRequestCancel> cancels;
  std::vector<domain::OrderRequestOpen> opens;

  bool empty() const { return cancels.empty() && opens.empty(); }
};

// -----------------------------------------------------------------------------
// Strategy capability set
// -----------------------------------------------------------------------------
//
// @brief  Engine<StrategyT, RiskManagerT> calls, on the engine thread:
//
//   OrderRequests generateAlgoOrders(const EngineState&);
//   OrderRequests onTradingDisabled(const EngineState&);
//   OrderRequests onDisconnect(const EngineState&, domain::ExchangeIndex);
//
// @details
// generateAlgoOrders() runs after each market item while trading is
// enabled and the item's exchange is healthy. Opens it proposes for an
// unhealthy exchange are dropped before dispatch.
//
// onTradingDisabled() runs once per Enabled → Disabled transition; its
// requests are dispatched without a risk check.
//
// onDisconnect() runs once per healthy → unhealthy edge of an exchange;
// its requests go through the risk manager.
//
// Any type with these three member functions works; there is no base class.
// -----------------------------------------------------------------------------

// Seam for user code: never proposes anything.
class DefaultStrategy {
 public:
  OrderRequests generateAlgoOrders(const EngineState& /*state*/) { return {}; }
  OrderRequests onTradingDisabled(const EngineState& /*state*/) { return {}; }
  OrderRequests onDisconnect(const EngineState& /*state*/,
                              domain::ExchangeIndex /*exchange*/) {
    return {};
  }
};

}  // namespace tradeflow
