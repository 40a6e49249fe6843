#pragma once

#include "tradeflow/domain/order.hpp"
#include "tradeflow/state/engine_state.hpp"

#include <string>
#include <vector>

namespace tradeflow {

template <typename Request>
struct RiskRefused {
  Request request;
  std::string reason;
};

// -----------------------------------------------------------------------------
// RiskCheckResult: partition of proposed requests
// -----------------------------------------------------------------------------
// Every request passed to check() ends up in exactly one of the four lists,
// in its original relative order.
// -----------------------------------------------------------------------------
struct RiskCheckResult {
  std::vector<domain::OrderRequestCancel> approved_cancels;
  std::vector<domain::OrderRequestOpen> approved_opens;
  std::vector<RiskRefused<domain::OrderRequestCancel>> refused_cancels;
  std::vector<RiskRefused<domain::OrderRequestOpen>> refused_opens;
};

// -----------------------------------------------------------------------------
// Risk manager capability set
// -----------------------------------------------------------------------------
//   RiskCheckResult check(const EngineState&,
//                         std::vector<domain::OrderRequestCancel>,
//                         std::vector<domain::OrderRequestOpen>);
//
// Called on the engine thread for commands, algorithmic orders and
// disconnect hooks.
// -----------------------------------------------------------------------------

// Approves everything.
class DefaultRiskManager {
 public:
  RiskCheckResult check(const EngineState& /*state*/,
                        std::vector<domain::OrderRequestCancel> cancels,
                        std::vector<domain::OrderRequestOpen> opens) {
    RiskCheckResult result;
    result.approved_cancels = std::move(cancels);
    result.approved_opens = std::move(opens);
    return result;
  }
};

}  // namespace tradeflow
