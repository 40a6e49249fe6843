#pragma once

#include "tradeflow/domain/instrument.hpp"
#include "tradeflow/domain/risk_limits.hpp"
#include "tradeflow/execution/mock_execution_client.hpp"
#include "tradeflow/numeric/decimal.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tradeflow {

// One execution link per exchange. Mock is the only venue for now.
using ExecutionConfig = std::variant<MockExecutionConfig>;

domain::ExchangeId execution_exchange(const ExecutionConfig& config);

// -----------------------------------------------------------------------------
// SystemConfig: everything needed to build a System
// -----------------------------------------------------------------------------
//
// @brief  Instruments, execution links and risk limits, as loaded from a
//         JSON file.
//
// @details
// JSON shape:
//
//   {
//     "risk_free_return": "0.05",                 (optional)
//     "instruments": [ <InstrumentConfig>, ... ],
//     "executions":  [ <MockExecutionConfig> | {"Mock": <...>}, ... ],
//     "risk": { "global": <RiskLimits> | null,
//               "instruments": [ {"index": 0, "limits": <RiskLimits>} ] }
//   }
//
// MockExecutionConfig:
//
//   { "mocked_exchange": "binance_spot", "latency_ms": 0,
//     "fees_percent": "0.001",
//     "initial_state": { "balances": [ {"asset": "usdt",
//                                        "balance": {"total", "free"},
//                                        "time_exchange"?} ] } }
//
// ("balances" may also sit directly on the execution object.)
//
// validate() rejects:
//   - an empty instrument list or an invalid instrument;
//   - an invalid mock config, or two executions for the same exchange;
//   - risk limits out of range, or a risk index outside instruments.
// -----------------------------------------------------------------------------
struct SystemConfig {
  std::vector<domain::InstrumentConfig> instruments;
  std::vector<ExecutionConfig> executions;
  domain::RiskConfiguration risk;
  std::optional<Decimal> risk_free_return;

  void set_global_risk_limits(std::optional<domain::RiskLimits> limits);

  // Bounds-checked against instruments.size(); nullopt removes the override.
  void set_instrument_risk_limits(domain::InstrumentIndex index,
                                  std::optional<domain::RiskLimits> limits);

  const domain::RiskLimits* instrument_limits(domain::InstrumentIndex index) const;

  void validate() const;
};

// Each throws ValidationError on a malformed or invalid config.
SystemConfig parse_system_config(const nlohmann::json& j);
SystemConfig parse_system_config_text(std::string_view text);
SystemConfig load_system_config(const std::string& path);

nlohmann::json encode_system_config(const SystemConfig& config);

}  // namespace tradeflow
