#include "tradeflow/engine/backtest.hpp"

#include "tradeflow/common/error.hpp"
#include "tradeflow/common/log.hpp"
#include "tradeflow/gateway/market_stream.hpp"
#include "tradeflow/time/historical_clock.hpp"

#include <chrono>
#include <exception>
#include <future>
#include <utility>

namespace tradeflow {

namespace {

Timestamp first_market_time(const std::vector<MarketStreamResult>& records) {
  for (const auto& record : records) {
    if (const auto* item = std::get_if<MarketEvent>(&record)) {
      return item->time_exchange;
    }
  }
  return Timestamp{};
}

}  // namespace

SystemFactory default_system_factory() {
  return [](SystemBuilder& builder) { return builder.build(); };
}

BacktestSummary run_backtest(const BacktestArgs& args) {
  if (!args.market_data) {
    throw ValidationError("backtest '" + args.id + "' has no market data");
  }
  if (!args.factory) {
    throw ValidationError("backtest '" + args.id + "' has no system factory");
  }

  const Timestamp seed = first_market_time(*args.market_data);
  if (seed == Timestamp{}) {
    log::warn("Backtest", args.id, ": market data has no items.");
  }

  SystemBuilder builder(args.config);
  builder.clock(std::make_shared<HistoricalClock>(seed))
      .marketStream(std::make_unique<VectorMarketStream>(*args.market_data))
      .feedMode(FeedMode::Iterator)
      .executionMode(ExecutionMode::Inline)
      .auditMode(AuditMode::Disabled)
      .tradingState(TradingState::Enabled)
      .riskFreeReturn(args.risk_free_return);

  std::unique_ptr<System> system = args.factory(builder);
  system->start();
  system->shutdownAfterBacktest();

  BacktestSummary summary;
  summary.id = args.id;
  summary.risk_free_return = args.risk_free_return;
  summary.trading_summary = system->tradingSummary(args.risk_free_return, args.interval);

  log::info("Backtest", args.id, ": ", args.market_data->size(), " records, ",
            summary.trading_summary.instruments.size(), " instruments summarised.");
  return summary;
}

TradingSummary run_historic_backtest(const SystemConfig& config,
                                     const std::string& market_data_path,
                                     Decimal risk_free_return,
                                     const TimeInterval& interval) {
  BacktestArgs args;
  args.id = market_data_path;
  args.config = config;
  args.market_data = std::make_shared<const std::vector<MarketStreamResult>>(
      load_market_data(market_data_path));
  args.risk_free_return = std::move(risk_free_return);
  args.interval = interval;
  return run_backtest(args).trading_summary;
}

MultiBacktestSummary run_backtests(const std::vector<BacktestArgs>& args) {
  const auto started = std::chrono::steady_clock::now();

  std::vector<std::future<BacktestSummary>> running;
  running.reserve(args.size());
  for (const auto& entry : args) {
    running.push_back(
        std::async(std::launch::async, [&entry] { return run_backtest(entry); }));
  }

  MultiBacktestSummary result;
  result.num_backtests = args.size();
  std::exception_ptr failure;
  for (auto& future : running) {
    try {
      result.summaries.push_back(future.get());
    } catch (const std::exception& e) {
      log::error("Backtest", "backtest failed: ", e.what());
      if (!failure) {
        failure = std::current_exception();
      }
    }
  }
  if (failure) {
    std::rethrow_exception(failure);
  }

  result.duration = std::chrono::duration_cast<Duration>(
      std::chrono::steady_clock::now() - started);
  log::info("Backtest", result.num_backtests, " backtests finished in ",
            std::chrono::duration_cast<std::chrono::milliseconds>(result.duration).count(),
            " ms.");
  return result;
}

}  // namespace tradeflow
