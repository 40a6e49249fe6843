// =============================================================================
// statistic_test.cpp
// =============================================================================
// Unit tests for the trading statistics: Welford running variance,
// drawdowns, ratio metrics, tear sheets and the TradingSummary generator.
// =============================================================================

#include "tradeflow/common/error.hpp"
#include "tradeflow/statistic/drawdown.hpp"
#include "tradeflow/statistic/metrics.hpp"
#include "tradeflow/statistic/tear_sheet.hpp"
#include "tradeflow/statistic/time_interval.hpp"
#include "tradeflow/statistic/trading_summary.hpp"
#include "tradeflow/statistic/welford.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <vector>

using namespace tradeflow;
using tradeflow::test::at;
using tradeflow::test::dec;

namespace {

domain::ClosedPosition closed(const char* pnl, std::int64_t time_exit) {
  domain::ClosedPosition position;
  position.instrument = test::kBtcUsdt;
  position.strategy = domain::StrategyId("alpha");
  position.price_entry_average = dec("100");
  position.quantity_abs_max = dec("1");
  position.pnl_realised = dec(pnl);
  position.time_enter = at(0);
  position.time_exit = at(time_exit);
  return position;
}

}  // namespace

// -----------------------------------------------------------------------------
// Welford
// -----------------------------------------------------------------------------
TEST(WelfordTest, PopulationVarianceAndStdDev) {
  Welford welford;
  EXPECT_FALSE(welford.std_dev().has_value());

  for (const char* value : {"2", "4", "6", "8"}) {
    welford.update(dec(value));
  }
  EXPECT_EQ(welford.count(), 4u);
  EXPECT_EQ(welford.mean(), dec("5"));
  EXPECT_EQ(welford.variance(), dec("5"));
  EXPECT_TRUE(welford.std_dev().has_value());

  Welford pair;
  pair.update(dec("1"));
  pair.update(dec("3"));
  EXPECT_EQ(pair.std_dev(), std::optional<Decimal>(dec("1")));
}

// -----------------------------------------------------------------------------
// Drawdown
// -----------------------------------------------------------------------------
TEST(DrawdownTest, PeakToTroughUntilRecovery) {
  const std::vector<TimedValue> curve{{at(0), dec("100")}, {at(1), dec("120")},
                                      {at(2), dec("90")},  {at(3), dec("130")},
                                      {at(4), dec("125")}};

  const auto series = generate_drawdown_series(curve);
  ASSERT_EQ(series.size(), 1u);
  EXPECT_EQ(series[0].value, dec("0.25"));
  EXPECT_EQ(series[0].time_start, at(1));
  EXPECT_EQ(series[0].time_end, at(3));
  EXPECT_EQ(series[0].duration(), std::chrono::seconds(2));

  const auto max = calculate_max_drawdown(curve);
  ASSERT_TRUE(max.has_value());
  EXPECT_EQ(max->value, dec("0.25"));

  const auto mean = calculate_mean_drawdown(curve);
  ASSERT_TRUE(mean.has_value());
  EXPECT_EQ(mean->mean_value, dec("0.25"));
  EXPECT_EQ(mean->mean_duration, std::chrono::seconds(2));
}

TEST(DrawdownTest, RisingCurveHasNoDrawdown) {
  DrawdownGenerator generator;
  for (int i = 0; i < 5; ++i) {
    EXPECT_FALSE(generator.update(TimedValue{at(i), Decimal{static_cast<std::int64_t>(100 + i)}}).has_value());
  }
  EXPECT_FALSE(generator.generate().has_value());
}

TEST(DrawdownTest, OngoingDrawdownIsReported) {
  DrawdownGenerator generator;
  generator.update(TimedValue{at(0), dec("200")});
  generator.update(TimedValue{at(1), dec("150")});
  generator.update(TimedValue{at(2), dec("180")});

  const auto current = generator.generate();
  ASSERT_TRUE(current.has_value());
  EXPECT_EQ(current->value, dec("0.25"));
  EXPECT_EQ(current->time_end, at(2));
}

TEST(DrawdownTest, MeanOfSeveralDrawdowns) {
  MeanDrawdownGenerator mean;
  mean.update(Drawdown{dec("0.1"), at(0), at(10)});
  mean.update(Drawdown{dec("0.3"), at(20), at(50)});

  const auto result = mean.generate();
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->mean_value, dec("0.2"));
  EXPECT_EQ(result->mean_duration, std::chrono::seconds(20));
}

// -----------------------------------------------------------------------------
// Metrics
// -----------------------------------------------------------------------------
TEST(MetricsTest, RateOfReturnScalesLinearly) {
  const auto daily = RateOfReturn::calculate(dec("0.01"), TimeInterval::daily());
  const auto annual = daily.scale(TimeInterval::annual_365());
  EXPECT_EQ(annual.value, dec("3.65"));
  EXPECT_EQ(annual.interval, TimeInterval::annual_365());
}

TEST(MetricsTest, SharpeScalesWithSquareRootOfTime) {
  const auto sharpe = SharpeRatio::calculate(dec("0.01"), dec("0.11"), dec("0.2"),
                                             TimeInterval::daily());
  ASSERT_TRUE(sharpe.has_value());
  EXPECT_EQ(sharpe->value, dec("0.5"));

  const auto four_days =
      sharpe->scale(TimeInterval::custom(std::chrono::hours(24 * 4)));
  EXPECT_EQ(four_days.value, dec("1"));
}

TEST(MetricsTest, ZeroDenominatorsHaveNoValue) {
  EXPECT_FALSE(SharpeRatio::calculate(dec("0"), dec("1"), dec("0"),
                                      TimeInterval::daily())
                   .has_value());
  EXPECT_FALSE(SortinoRatio::calculate(dec("0"), dec("1"), dec("0"),
                                       TimeInterval::daily())
                   .has_value());
  EXPECT_FALSE(CalmarRatio::calculate(dec("0"), dec("1"), dec("0"),
                                      TimeInterval::daily())
                   .has_value());
  EXPECT_FALSE(ProfitFactor::calculate(dec("10"), dec("0")).has_value());
  EXPECT_FALSE(WinRate::calculate(dec("0"), dec("0")).has_value());
}

TEST(MetricsTest, CalmarUsesAbsoluteDrawdown) {
  const auto calmar = CalmarRatio::calculate(dec("0"), dec("0.1"), dec("-0.2"),
                                             TimeInterval::daily());
  ASSERT_TRUE(calmar.has_value());
  EXPECT_EQ(calmar->value, dec("0.5"));
}

TEST(MetricsTest, ProfitFactorAndWinRate) {
  EXPECT_EQ(ProfitFactor::calculate(dec("30"), dec("10"))->value, dec("3"));
  EXPECT_EQ(WinRate::calculate(dec("3"), dec("4"))->value, dec("0.75"));
}

// -----------------------------------------------------------------------------
// TimeInterval
// -----------------------------------------------------------------------------
TEST(TimeIntervalTest, ParseAndName) {
  EXPECT_EQ(TimeInterval::parse("daily"), TimeInterval::daily());
  EXPECT_EQ(TimeInterval::parse("Annual(252)"), TimeInterval::annual_252());
  EXPECT_EQ(TimeInterval::parse("annual_365"), TimeInterval::annual_365());
  EXPECT_THROW(TimeInterval::parse("weekly"), ValidationError);

  EXPECT_EQ(TimeInterval::annual_365().name(), "Annual(365)");
  EXPECT_EQ(TimeInterval::custom(std::chrono::minutes(90)).name(),
            "Duration 90 (minutes)");
}

// -----------------------------------------------------------------------------
// Tear sheets
// -----------------------------------------------------------------------------
TEST(TearSheetTest, WinsLossesAndDrawdown) {
  TearSheetGenerator generator;
  generator.update_from_trade();
  generator.update_from_trade();
  generator.update_from_position(closed("10", 1));
  generator.update_from_position(closed("-5", 2));

  const TimeInterval period = TimeInterval::daily();
  const TearSheet sheet = generator.generate(dec("0"), period, period);

  EXPECT_EQ(sheet.pnl, dec("5"));
  EXPECT_EQ(sheet.trades, 2u);
  EXPECT_EQ(sheet.positions_closed, 2u);
  ASSERT_TRUE(sheet.win_rate.has_value());
  EXPECT_EQ(sheet.win_rate->value, dec("0.5"));
  ASSERT_TRUE(sheet.profit_factor.has_value());
  EXPECT_EQ(sheet.profit_factor->value, dec("2"));

  // Mean of +10% and -5% returns.
  EXPECT_EQ(sheet.pnl_return.value, dec("0.025"));
  ASSERT_TRUE(sheet.sharpe_ratio.has_value());
  // A single losing position has no downside deviation.
  EXPECT_FALSE(sheet.sortino_ratio.has_value());

  // Cumulative PnL fell from 10 to 5.
  ASSERT_TRUE(sheet.pnl_drawdown.has_value());
  EXPECT_EQ(sheet.pnl_drawdown->value, dec("0.5"));
  ASSERT_TRUE(sheet.pnl_drawdown_max.has_value());
  EXPECT_EQ(sheet.pnl_drawdown_max->value, dec("0.5"));
  ASSERT_TRUE(sheet.calmar_ratio.has_value());
  EXPECT_EQ(sheet.calmar_ratio->value, dec("0.05"));
}

TEST(TearSheetTest, EmptyGeneratorHasNoRatios) {
  TearSheetGenerator generator;
  const TearSheet sheet =
      generator.generate(dec("0"), TimeInterval::daily(), TimeInterval::annual_365());
  EXPECT_TRUE(sheet.pnl.is_zero());
  EXPECT_FALSE(sheet.sharpe_ratio.has_value());
  EXPECT_FALSE(sheet.win_rate.has_value());
  EXPECT_FALSE(sheet.pnl_drawdown.has_value());
}

TEST(TearSheetAssetTest, RateOfReturnFromBalances) {
  TearSheetAssetGenerator generator;
  generator.update_from_balance(domain::Balance::make(dec("100"), dec("100")), at(0));
  generator.update_from_balance(domain::Balance::make(dec("80"), dec("80")), at(1));
  generator.update_from_balance(domain::Balance::make(dec("110"), dec("100")), at(2));

  const TimeInterval period = TimeInterval::daily();
  const TearSheetAsset sheet = generator.generate(period, period);
  ASSERT_TRUE(sheet.balance_end.has_value());
  EXPECT_EQ(sheet.balance_end->total, dec("110"));
  ASSERT_TRUE(sheet.rate_of_return.has_value());
  EXPECT_EQ(sheet.rate_of_return->value, dec("0.1"));
  ASSERT_TRUE(sheet.drawdown_max.has_value());
  EXPECT_EQ(sheet.drawdown_max->value, dec("0.2"));
  EXPECT_FALSE(sheet.drawdown.has_value());
}

// -----------------------------------------------------------------------------
// TradingSummaryGenerator
// -----------------------------------------------------------------------------
TEST(TradingSummaryTest, KeysByInternalNames) {
  TradingSummaryGenerator generator(test::catalogue(), dec("0"), at(0));
  generator.update_from_balance(domain::AssetBalance{
      test::kUsdt, domain::Balance::make(dec("100"), dec("100")), at(0)});
  generator.update_from_balance(domain::AssetBalance{
      test::kUsdt, domain::Balance::make(dec("150"), dec("150")), at(10)});
  generator.update_from_trade(test::fill(test::kBtcUsdt, "t1", domain::Side::Buy,
                                         "1", "100", at(5)));
  generator.update_from_position(closed("50", 10));

  generator.update_time_now(at(10));
  generator.update_time_now(at(3));
  EXPECT_EQ(generator.time_engine_now(), at(10));

  const TradingSummary summary =
      generator.generate(TimeInterval::custom(std::chrono::seconds(10)));
  EXPECT_EQ(summary.trading_duration(), std::chrono::seconds(10));
  ASSERT_EQ(summary.instruments.size(), 2u);
  ASSERT_EQ(summary.assets.size(), 4u);

  const TearSheet& btc = summary.instruments.at("binance_spot:btc_usdt");
  EXPECT_EQ(btc.pnl, dec("50"));
  EXPECT_EQ(btc.trades, 1u);
  EXPECT_EQ(summary.instruments.at("kraken:eth_usd").trades, 0u);

  const TearSheetAsset& usdt = summary.assets.at("binance_spot:usdt");
  ASSERT_TRUE(usdt.rate_of_return.has_value());
  EXPECT_EQ(usdt.rate_of_return->value, dec("0.5"));
  EXPECT_FALSE(summary.assets.at("kraken:usd").balance_end.has_value());
}

TEST(TradingSummaryTest, UnknownIndicesAreLogicErrors) {
  TradingSummaryGenerator generator(test::catalogue(), dec("0"), at(0));
  domain::ClosedPosition position = closed("1", 1);
  position.instrument = 9;
  EXPECT_THROW(generator.update_from_position(position), std::logic_error);
}
