#pragma once

#include "tradeflow/domain/risk_limits.hpp"
#include "tradeflow/risk/risk_manager.hpp"
#include "tradeflow/state/engine_state.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tradeflow {

// -----------------------------------------------------------------------------
// LimitsRiskManager: pre-trade limit checks from RiskConfiguration
// -----------------------------------------------------------------------------
//
// @brief  Approves cancels unconditionally and checks each open against the
//         instrument's effective RiskLimits.
//
// @details
// For each open request, in order:
//
//   1. Connectivity: an open for an exchange that is not healthy is refused.
//
//   2. Effective limits: the instrument override if any, else the global
//      limits, else nothing to check (approve).
//
//   3. Direction: projected = Σ strategy positions + opens already approved
//      in this batch + this order. Limits apply only when |projected| >
//      |current|; reducing orders are always approved.
//
//   4. Reference price: the request price when positive, else the
//      instrument's last market price. Notional checks without any price are
//      refused.
//
//   5. Checks, first failure wins:
//        max_position_quantity   |projected|
//        max_position_notional   |projected| * price
//        max_exposure_percent    |projected| * price / equity
//        max_leverage            Σ_i |net_i * price_i| / equity
//      where equity = Σ total balance of every instrument pricing asset
//                   + Σ_i net_i * price_i
//
// The refusal reason names the limit, e.g.
//   "max_position_notional exceeded: 100 > 50".
//
// Thread model: engine thread only.
// -----------------------------------------------------------------------------
class LimitsRiskManager {
 public:
  explicit LimitsRiskManager(domain::RiskConfiguration config);

  const domain::RiskConfiguration& config() const { return config_; }

  RiskCheckResult check(const EngineState& state,
                        std::vector<domain::OrderRequestCancel> cancels,
                        std::vector<domain::OrderRequestOpen> opens);

 private:
  std::optional<std::string> checkOpen(
      const EngineState& state, const domain::OrderRequestOpen& request,
      const std::map<domain::InstrumentIndex, Decimal>& pending) const;

  domain::RiskConfiguration config_;
};

}  // namespace tradeflow
