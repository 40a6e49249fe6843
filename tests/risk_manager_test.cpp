// =============================================================================
// risk_manager_test.cpp
// =============================================================================
// Unit tests for the pre-trade risk managers.
//
// Validates:
//   - DefaultRiskManager approves everything
//   - LimitsRiskManager refuses opens that grow a position past a limit and
//     always lets reducing orders and cancels through
//   - per-instrument overrides win over the global limits
//   - opens approved earlier in a batch count against later ones
//   - missing prices and unhealthy exchanges refuse with a reason
// =============================================================================

#include "tradeflow/common/error.hpp"
#include "tradeflow/risk/limits_risk_manager.hpp"
#include "tradeflow/risk/risk_manager.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace tradeflow;
using domain::Balance;
using domain::OrderRequestCancel;
using domain::OrderRequestOpen;
using domain::RiskConfiguration;
using domain::RiskLimits;
using domain::Side;
using tradeflow::test::at;
using tradeflow::test::dec;
using tradeflow::test::kBtcUsdt;
using tradeflow::test::kEthUsd;

namespace {

bool mentions(const std::string& text, const std::string& word) {
  return text.find(word) != std::string::npos;
}

}  // namespace

class LimitsRiskManagerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    state_.seedBalance(test::kUsdt, Balance::make(dec("100000"), dec("100000")), at(0));
    state_.applyMarket(MarketStreamEvent{test::trade_item(kBtcUsdt, "50000", at(1))});
  }

  RiskCheckResult check(const RiskLimits& limits, std::vector<OrderRequestOpen> opens,
                        std::vector<OrderRequestCancel> cancels = {}) {
    RiskConfiguration config;
    config.set_global_limits(limits);
    LimitsRiskManager risk(config);
    return risk.check(state_, std::move(cancels), std::move(opens));
  }

  EngineState state_{test::catalogue(), TradingState::Enabled};
};

TEST(DefaultRiskManagerTest, ApprovesEverything) {
  EngineState state(test::catalogue(), TradingState::Enabled);
  DefaultRiskManager risk;
  auto result = risk.check(
      state, {OrderRequestCancel{test::key(kBtcUsdt, "c0"), std::nullopt}},
      {test::market_open(kBtcUsdt, "c1", Side::Buy, "1000")});

  EXPECT_EQ(result.approved_cancels.size(), 1u);
  EXPECT_EQ(result.approved_opens.size(), 1u);
  EXPECT_TRUE(result.refused_opens.empty());
}

TEST_F(LimitsRiskManagerTest, NoLimitsApprovesOpens) {
  LimitsRiskManager risk{RiskConfiguration{}};
  auto result = risk.check(state_, {}, {test::market_open(kBtcUsdt, "c1", Side::Buy, "5")});
  EXPECT_EQ(result.approved_opens.size(), 1u);
}

TEST_F(LimitsRiskManagerTest, MaxPositionQuantity) {
  RiskLimits limits;
  limits.max_position_quantity = dec("1");

  auto result = check(limits, {test::market_open(kBtcUsdt, "ok", Side::Buy, "1"),
                               test::market_open(kBtcUsdt, "big", Side::Sell, "2.5")});
  // The sell is evaluated after the approved buy: 1 - 2.5 = -1.5.
  ASSERT_EQ(result.approved_opens.size(), 1u);
  ASSERT_EQ(result.refused_opens.size(), 1u);
  EXPECT_EQ(result.refused_opens[0].request.key.cid.str(), "big");
  EXPECT_TRUE(mentions(result.refused_opens[0].reason, "max_position_quantity"));
}

TEST_F(LimitsRiskManagerTest, PendingOpensAccumulateWithinBatch) {
  RiskLimits limits;
  limits.max_position_quantity = dec("1.5");

  auto result = check(limits, {test::market_open(kBtcUsdt, "a", Side::Buy, "1"),
                               test::market_open(kBtcUsdt, "b", Side::Buy, "1")});
  EXPECT_EQ(result.approved_opens.size(), 1u);
  ASSERT_EQ(result.refused_opens.size(), 1u);
  EXPECT_EQ(result.refused_opens[0].request.key.cid.str(), "b");
}

TEST_F(LimitsRiskManagerTest, ReducingOrdersAlwaysPass) {
  state_.applyAccount(AccountStreamEvent{AccountEvent{
      test::kBinance, test::fill(kBtcUsdt, "t1", Side::Buy, "3", "50000", at(2))}});

  RiskLimits limits;
  limits.max_position_quantity = dec("1");
  auto result = check(limits, {test::market_open(kBtcUsdt, "reduce", Side::Sell, "1")});
  EXPECT_EQ(result.approved_opens.size(), 1u);
  EXPECT_TRUE(result.refused_opens.empty());
}

TEST_F(LimitsRiskManagerTest, CancelsAreNeverRefused) {
  RiskLimits limits;
  limits.max_position_quantity = dec("0.0001");
  auto result = check(limits, {}, {OrderRequestCancel{test::key(kBtcUsdt, "c1"), std::nullopt}});
  EXPECT_EQ(result.approved_cancels.size(), 1u);
}

TEST_F(LimitsRiskManagerTest, MaxPositionNotionalUsesLimitPrice) {
  RiskLimits limits;
  limits.max_position_notional = dec("10000");

  auto result = check(limits, {test::limit_open(kBtcUsdt, "cheap", Side::Buy, "1", "9000"),
                               test::market_open(kBtcUsdt, "market", Side::Buy, "0.1")});
  // The limit order is priced at 9000; the market order at the last trade,
  // on top of the pending 1: 1.1 * 50000.
  ASSERT_EQ(result.approved_opens.size(), 1u);
  EXPECT_EQ(result.approved_opens[0].key.cid.str(), "cheap");
  ASSERT_EQ(result.refused_opens.size(), 1u);
  EXPECT_TRUE(mentions(result.refused_opens[0].reason, "max_position_notional"));
}

TEST_F(LimitsRiskManagerTest, MissingReferencePriceRefuses) {
  RiskLimits limits;
  limits.max_position_notional = dec("1000000");
  auto result = check(limits, {test::market_open(kEthUsd, "c1", Side::Buy, "1")});
  ASSERT_EQ(result.refused_opens.size(), 1u);
  EXPECT_TRUE(mentions(result.refused_opens[0].reason, "no reference price"));
}

TEST_F(LimitsRiskManagerTest, MaxExposurePercent) {
  RiskLimits limits;
  limits.max_exposure_percent = dec("0.1");

  auto result = check(limits, {test::market_open(kBtcUsdt, "small", Side::Buy, "0.1")});
  EXPECT_EQ(result.approved_opens.size(), 1u);

  result = check(limits, {test::market_open(kBtcUsdt, "large", Side::Buy, "1")});
  ASSERT_EQ(result.refused_opens.size(), 1u);
  EXPECT_TRUE(mentions(result.refused_opens[0].reason, "max_exposure_percent"));
}

TEST_F(LimitsRiskManagerTest, MaxLeverage) {
  RiskLimits limits;
  limits.max_leverage = dec("2");

  auto result = check(limits, {test::market_open(kBtcUsdt, "x1", Side::Buy, "3")});
  // 150000 gross on 100000 equity.
  EXPECT_EQ(result.approved_opens.size(), 1u);

  result = check(limits, {test::market_open(kBtcUsdt, "x3", Side::Buy, "5")});
  ASSERT_EQ(result.refused_opens.size(), 1u);
  EXPECT_TRUE(mentions(result.refused_opens[0].reason, "max_leverage"));
}

TEST_F(LimitsRiskManagerTest, NonPositiveEquityRefuses) {
  EngineState empty(test::catalogue(), TradingState::Enabled);
  empty.applyMarket(MarketStreamEvent{test::trade_item(kBtcUsdt, "50000", at(1))});

  RiskConfiguration config;
  RiskLimits limits;
  limits.max_leverage = dec("10");
  config.set_global_limits(limits);
  LimitsRiskManager risk(config);

  auto result = risk.check(empty, {}, {test::market_open(kBtcUsdt, "c1", Side::Buy, "1")});
  ASSERT_EQ(result.refused_opens.size(), 1u);
  EXPECT_TRUE(mentions(result.refused_opens[0].reason, "equity"));
}

TEST_F(LimitsRiskManagerTest, InstrumentOverrideWinsOverGlobal) {
  RiskConfiguration config;
  RiskLimits global;
  global.max_position_quantity = dec("100");
  config.set_global_limits(global);
  RiskLimits tight;
  tight.max_position_quantity = dec("0.5");
  config.set_instrument_limits(kBtcUsdt, tight, 2);

  LimitsRiskManager risk(config);
  auto result = risk.check(state_, {}, {test::market_open(kBtcUsdt, "c1", Side::Buy, "1")});
  EXPECT_EQ(result.refused_opens.size(), 1u);

  config.set_instrument_limits(kBtcUsdt, std::nullopt, 2);
  EXPECT_EQ(config.effective_limits(kBtcUsdt)->max_position_quantity,
            std::optional<Decimal>(dec("100")));
}

TEST_F(LimitsRiskManagerTest, UnhealthyExchangeRefuses) {
  state_.applyMarket(MarketStreamEvent{Reconnecting{domain::ExchangeId::Kraken}});
  LimitsRiskManager risk{RiskConfiguration{}};

  auto result = risk.check(state_, {}, {test::market_open(kEthUsd, "e", Side::Buy, "1"),
                                        test::market_open(kBtcUsdt, "b", Side::Buy, "1")});
  ASSERT_EQ(result.refused_opens.size(), 1u);
  EXPECT_TRUE(mentions(result.refused_opens[0].reason, "kraken"));
  EXPECT_EQ(result.approved_opens.size(), 1u);
}

TEST(RiskConfigurationTest, RejectsInvalidLimits) {
  RiskConfiguration config;
  RiskLimits limits;
  limits.max_exposure_percent = dec("1.5");
  EXPECT_THROW(config.set_global_limits(limits), ValidationError);

  limits = RiskLimits{};
  limits.max_leverage = dec("0");
  EXPECT_THROW(config.set_global_limits(limits), ValidationError);

  EXPECT_THROW(config.set_instrument_limits(9, RiskLimits{}, 2), ValidationError);
}
