// =============================================================================
// backtest_test.cpp
// =============================================================================
// Scenario tests for historic backtests over the recorded data in
// tests/data.
//
// Validates:
//   - engine time follows the market data, not the wall clock
//   - parallel backtests over shared data agree byte for byte
//   - a strategy that trades on every tick still reproduces exactly
//   - a custom SystemFactory reaches the builder
//   - failures are reported after every backtest finished
// =============================================================================

#include "tradeflow/engine/backtest.hpp"

#include "tradeflow/codec/json.hpp"
#include "tradeflow/common/error.hpp"
#include "tradeflow/gateway/market_stream.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <array>
#include <cstdint>
#include <atomic>
#include <memory>
#include <string>
#include <vector>

using namespace tradeflow;
using tradeflow::test::at;
using tradeflow::test::dec;
using tradeflow::test::kBtcUsdt;
using tradeflow::test::kEthUsd;

namespace {

std::string data_path(const char* name) {
  return std::string(TRADEFLOW_TEST_DATA_DIR) + "/" + name;
}

BacktestArgs args_for(std::string id) {
  BacktestArgs args;
  args.id = std::move(id);
  args.config = load_system_config(data_path("system_config.json"));
  args.market_data = std::make_shared<const std::vector<MarketStreamResult>>(
      load_market_data(data_path("market_data.json")));
  args.risk_free_return = dec("0.05");
  args.interval = TimeInterval::daily();
  return args;
}

// Alternates 0.1 market buys and sells on every instrument it has a price
// for, once per market event.
struct FlipStrategy {
  std::array<std::uint64_t, 2> placed{};

  OrderRequests generateAlgoOrders(const EngineState& state) {
    OrderRequests requests;
    for (domain::InstrumentIndex instrument : {kBtcUsdt, kEthUsd}) {
      if (!state.lastPrice(instrument)) {
        continue;
      }
      std::uint64_t& count = placed[instrument];
      const domain::Side side = count % 2 == 0 ? domain::Side::Buy : domain::Side::Sell;
      requests.opens.push_back(test::market_open(
          instrument, "flip-" + std::to_string(instrument) + "-" + std::to_string(count),
          side, "0.1"));
      ++count;
    }
    return requests;
  }

  OrderRequests onTradingDisabled(const EngineState& /*state*/) { return {}; }
  OrderRequests onDisconnect(const EngineState& /*state*/,
                              domain::ExchangeIndex /*exchange*/) {
    return {};
  }
};

// Trades on both test exchanges with prices that drift up and down.
std::shared_ptr<const std::vector<MarketStreamResult>> trending_data(int count) {
  std::vector<MarketStreamResult> records;
  for (int i = 0; i < count; ++i) {
    const domain::InstrumentIndex instrument = i % 2 == 0 ? kBtcUsdt : kEthUsd;
    const int base = instrument == kBtcUsdt ? 40000 : 2000;
    const std::string price = std::to_string(base + (i * 37) % 101);
    records.emplace_back(test::trade_item(instrument, price.c_str(), at(i)));
  }
  return std::make_shared<const std::vector<MarketStreamResult>>(std::move(records));
}

}  // namespace

TEST(BacktestTest, HistoricBacktestFollowsMarketTime) {
  const TradingSummary summary =
      run_historic_backtest(load_system_config(data_path("system_config.json")),
                            data_path("market_data.json"), dec("0.05"),
                            TimeInterval::daily());

  EXPECT_EQ(summary.time_engine_start, at(0));
  EXPECT_EQ(summary.time_engine_end, at(10));
  ASSERT_EQ(summary.instruments.size(), 2u);
  EXPECT_EQ(summary.instruments.at("binance_spot:btc_usdt").trades, 0u);
  EXPECT_EQ(summary.instruments.at("binance_spot:eth_usdt").pnl, Decimal{0});

  const TearSheetAsset& usdt = summary.assets.at("binance_spot:usdt");
  ASSERT_TRUE(usdt.balance_end.has_value());
  EXPECT_EQ(usdt.balance_end->total, dec("100000"));
}

TEST(BacktestTest, MissingDataFileIsValidationError) {
  EXPECT_THROW(run_historic_backtest(load_system_config(data_path("system_config.json")),
                                     data_path("missing.json"), Decimal{0},
                                     TimeInterval::daily()),
               ValidationError);
}

TEST(BacktestTest, ParallelBacktestsAreReproducible) {
  std::vector<BacktestArgs> args;
  for (int i = 0; i < 4; ++i) {
    args.push_back(args_for("run-" + std::to_string(i)));
  }

  const MultiBacktestSummary result = run_backtests(args);
  ASSERT_EQ(result.num_backtests, 4u);
  ASSERT_EQ(result.summaries.size(), 4u);

  const std::string first = encode_trading_summary(result.summaries[0].trading_summary).dump();
  for (std::size_t i = 0; i < result.summaries.size(); ++i) {
    EXPECT_EQ(result.summaries[i].id, "run-" + std::to_string(i));
    EXPECT_EQ(result.summaries[i].risk_free_return, dec("0.05"));
    EXPECT_EQ(encode_trading_summary(result.summaries[i].trading_summary).dump(), first);
  }
}

TEST(BacktestTest, CustomFactoryBuildsTheSystem) {
  auto built = std::make_shared<std::atomic<int>>(0);
  BacktestArgs args = args_for("limits");
  args.factory = [built](SystemBuilder& builder) {
    ++*built;
    return builder.buildWithLimits();
  };

  const BacktestSummary summary = run_backtest(args);
  EXPECT_EQ(built->load(), 1);
  EXPECT_EQ(summary.id, "limits");
}

TEST(BacktestTest, FailureIsRethrownAfterAllFinish) {
  std::vector<BacktestArgs> args{args_for("good"), args_for("bad")};
  args[1].market_data.reset();

  EXPECT_THROW(run_backtests(args), ValidationError);
  EXPECT_THROW(run_backtest(args[1]), ValidationError);
}

TEST(BacktestTest, TradingStrategyIsReproducible) {
  BacktestArgs args;
  args.id = "flip";
  args.config = test::system_config();
  args.market_data = trending_data(300);
  args.risk_free_return = dec("0.05");
  args.interval = TimeInterval::daily();
  args.factory = [](SystemBuilder& builder) { return builder.build(FlipStrategy{}); };

  const std::vector<BacktestArgs> runs(8, args);
  const MultiBacktestSummary result = run_backtests(runs);
  ASSERT_EQ(result.summaries.size(), 8u);

  const TradingSummary& first = result.summaries[0].trading_summary;
  // btc has a price from the first record, eth from the second.
  EXPECT_EQ(first.instruments.at("binance_spot:btc_usdt").trades, 300u);
  EXPECT_EQ(first.instruments.at("kraken:eth_usd").trades, 299u);
  EXPECT_EQ(first.time_engine_end, at(299));

  const std::string expected = encode_trading_summary(first).dump();
  for (const auto& summary : result.summaries) {
    EXPECT_EQ(encode_trading_summary(summary.trading_summary).dump(), expected);
  }
}
