#pragma once

#include "tradeflow/config/system_config.hpp"
#include "tradeflow/engine/system.hpp"
#include "tradeflow/events/market_event.hpp"
#include "tradeflow/numeric/decimal.hpp"
#include "tradeflow/statistic/time_interval.hpp"
#include "tradeflow/statistic/trading_summary.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace tradeflow {

// Builds the System for one backtest from a builder already holding the
// config, the historical clock and the market stream. The default builds
// DefaultStrategy with DefaultRiskManager.
using SystemFactory = std::function<std::unique_ptr<System>(SystemBuilder&)>;

SystemFactory default_system_factory();

struct BacktestArgs {
  std::string id;
  SystemConfig config;
  // Shared between concurrent backtests; never modified.
  std::shared_ptr<const std::vector<MarketStreamResult>> market_data;
  Decimal risk_free_return;
  TimeInterval interval{TimeInterval::annual_365()};
  SystemFactory factory{default_system_factory()};
};

struct BacktestSummary {
  std::string id;
  Decimal risk_free_return;
  TradingSummary trading_summary;
};

struct MultiBacktestSummary {
  std::size_t num_backtests{0};
  Duration duration{};
  std::vector<BacktestSummary> summaries;
};

// -----------------------------------------------------------------------------
// Historic backtests
// -----------------------------------------------------------------------------
//
// @brief  Replays recorded market data through a full System driven by a
//         HistoricalClock and returns the TradingSummary.
//
// @details
// The clock is seeded with the time_exchange of the first market item.
// Trading starts Enabled and audit is off. The system runs in Iterator mode
// with inline execution: each market record is processed together with
// every order and execution response it triggers before the next record is
// pulled, all on one thread. Identical inputs therefore produce identical
// summaries, whatever the strategy does.
//
// run_backtests() runs each backtest on its own thread and returns the
// summaries in argument order. The first failure is rethrown once every
// backtest has finished.
//
// Each throws ValidationError on invalid config or market data.
// -----------------------------------------------------------------------------
TradingSummary run_historic_backtest(const SystemConfig& config,
                                     const std::string& market_data_path,
                                     Decimal risk_free_return,
                                     const TimeInterval& interval);

BacktestSummary run_backtest(const BacktestArgs& args);

MultiBacktestSummary run_backtests(const std::vector<BacktestArgs>& args);

}  // namespace tradeflow
