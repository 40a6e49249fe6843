// =============================================================================
// engine_state_test.cpp
// =============================================================================
// Unit tests for tradeflow::EngineState and the market data it folds in.
//
// Validates:
//   - balances: newer updates apply, stale ones are dropped
//   - trades update positions and report exited positions
//   - reconnects mark only the affected exchange unhealthy
//   - malformed events surface as EngineErrors of the right severity
//   - MarketDataState last-price tracking and order book maintenance
// =============================================================================

#include "tradeflow/state/engine_state.hpp"

#include "tradeflow/common/error.hpp"
#include "tradeflow/state/market_data_state.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace tradeflow;
using domain::AssetBalance;
using domain::Balance;
using domain::ExchangeId;
using domain::Side;
using tradeflow::test::at;
using tradeflow::test::dec;
using tradeflow::test::fill;
using tradeflow::test::kBinance;
using tradeflow::test::kBtcUsdt;
using tradeflow::test::kEthUsd;
using tradeflow::test::kKraken;
using tradeflow::test::kUsdt;

class EngineStateTest : public ::testing::Test {
 protected:
  StateUpdate apply(domain::ExchangeIndex exchange, AccountEventKind kind) {
    return state_.applyAccount(AccountStreamEvent{AccountEvent{exchange, std::move(kind)}});
  }

  StateUpdate balance(const char* total, const char* free, std::int64_t time) {
    return apply(kBinance, AssetBalance{kUsdt, Balance{dec(total), dec(free)}, at(time)});
  }

  EngineState state_{test::catalogue(), TradingState::Disabled};
};

TEST_F(EngineStateTest, StartsEmptyAndHealthy) {
  EXPECT_EQ(state_.trading(), TradingState::Disabled);
  EXPECT_EQ(state_.assets().size(), 4u);
  EXPECT_EQ(state_.instruments().size(), 2u);
  EXPECT_TRUE(state_.exchangeHealthy(kBinance));
  EXPECT_TRUE(state_.exchangeHealthy(kKraken));
  EXPECT_FALSE(state_.lastPrice(kBtcUsdt).has_value());
  EXPECT_FALSE(state_.hasInFlight());
}

TEST_F(EngineStateTest, SetTradingReportsChange) {
  EXPECT_TRUE(state_.setTrading(TradingState::Enabled));
  EXPECT_FALSE(state_.setTrading(TradingState::Enabled));
  EXPECT_EQ(state_.trading(), TradingState::Enabled);
}

TEST_F(EngineStateTest, BalanceUpdatesIgnoreStaleTimes) {
  auto update = balance("100", "80", 10);
  ASSERT_EQ(update.balances.size(), 1u);
  EXPECT_EQ(state_.asset(kUsdt).balance.free, dec("80"));

  EXPECT_TRUE(balance("50", "50", 5).balances.empty());
  EXPECT_TRUE(balance("50", "50", 10).balances.empty());
  EXPECT_EQ(state_.asset(kUsdt).balance.total, dec("100"));

  balance("90", "90", 11);
  EXPECT_EQ(state_.asset(kUsdt).balance.total, dec("90"));
}

TEST_F(EngineStateTest, InvalidBalanceIsRecoverable) {
  auto update = balance("1", "2", 1);
  ASSERT_EQ(update.errors.size(), 1u);
  EXPECT_FALSE(update.unrecoverable());
  EXPECT_TRUE(state_.asset(kUsdt).balance.total.is_zero());
}

TEST_F(EngineStateTest, TradeOpensAndClosesPositions) {
  auto opened = apply(kBinance, fill(kBtcUsdt, "t1", Side::Buy, "1", "100", at(1)));
  ASSERT_EQ(opened.trades.size(), 1u);
  EXPECT_TRUE(opened.positions_exited.empty());
  ASSERT_NE(state_.instrument(kBtcUsdt).positions.find(domain::StrategyId("alpha")),
            nullptr);

  auto closed = apply(kBinance, fill(kBtcUsdt, "t2", Side::Sell, "1", "150", at(2), "1"));
  ASSERT_EQ(closed.positions_exited.size(), 1u);
  EXPECT_EQ(closed.positions_exited.front().pnl_realised, dec("49"));
  EXPECT_EQ(state_.instrument(kBtcUsdt).positions.find(domain::StrategyId("alpha")),
            nullptr);
}

TEST_F(EngineStateTest, FeesInBaseAssetAreConvertedAtFillPrice) {
  domain::Trade trade = fill(kBtcUsdt, "t1", Side::Buy, "1", "200", at(1));
  trade.fees = domain::AssetFees{test::kBtc, dec("0.01")};
  EXPECT_EQ(state_.feesInPricingAsset(trade), dec("2"));
}

TEST_F(EngineStateTest, UnknownIndicesAreUnrecoverable) {
  auto bad_exchange = apply(9, AssetBalance{kUsdt, Balance{dec("1"), dec("1")}, at(1)});
  EXPECT_TRUE(bad_exchange.unrecoverable());

  auto bad_instrument = apply(kBinance, fill(7, "t1", Side::Buy, "1", "1", at(1)));
  EXPECT_TRUE(bad_instrument.unrecoverable());
  EXPECT_TRUE(bad_instrument.trades.empty());
}

TEST_F(EngineStateTest, ReconnectAffectsOnlyThatExchange) {
  auto update = state_.applyMarket(MarketStreamEvent{Reconnecting{ExchangeId::Kraken}});
  ASSERT_TRUE(update.disconnected.has_value());
  EXPECT_EQ(*update.disconnected, kKraken);
  EXPECT_FALSE(state_.exchangeHealthy(kKraken));
  EXPECT_TRUE(state_.exchangeHealthy(kBinance));

  // A second reconnect is not a new disconnection.
  auto again = state_.applyMarket(MarketStreamEvent{Reconnecting{ExchangeId::Kraken}});
  EXPECT_FALSE(again.disconnected.has_value());

  // Market data for the exchange restores its market health.
  state_.applyMarket(MarketStreamEvent{test::trade_item(kEthUsd, "2000", at(3))});
  EXPECT_TRUE(state_.exchangeHealthy(kKraken));
}

TEST_F(EngineStateTest, AccountReconnectNeedsAccountEventToRecover) {
  state_.applyAccount(AccountStreamEvent{Reconnecting{ExchangeId::BinanceSpot}});
  EXPECT_EQ(state_.connectivity(kBinance).account, Health::Reconnecting);

  state_.applyMarket(MarketStreamEvent{test::trade_item(kBtcUsdt, "100", at(1))});
  EXPECT_FALSE(state_.exchangeHealthy(kBinance));

  balance("10", "10", 2);
  EXPECT_TRUE(state_.exchangeHealthy(kBinance));
}

TEST_F(EngineStateTest, UnknownExchangeReconnectIsRecoverable) {
  auto update = state_.applyMarket(MarketStreamEvent{Reconnecting{ExchangeId::Okx}});
  ASSERT_EQ(update.errors.size(), 1u);
  EXPECT_FALSE(update.unrecoverable());
}

TEST_F(EngineStateTest, MarketDataForUnknownInstrumentIsRecoverable) {
  auto update = state_.applyMarket(MarketStreamEvent{test::trade_item(5, "1", at(1))});
  ASSERT_EQ(update.errors.size(), 1u);
  EXPECT_FALSE(update.unrecoverable());
}

TEST_F(EngineStateTest, MarketDataMarksPositions) {
  apply(kBinance, fill(kBtcUsdt, "t1", Side::Buy, "2", "100", at(1)));
  state_.applyMarket(MarketStreamEvent{test::trade_item(kBtcUsdt, "110", at(2))});

  EXPECT_EQ(state_.lastPrice(kBtcUsdt), std::optional<Decimal>(dec("110")));
  EXPECT_EQ(state_.instrument(kBtcUsdt)
                .positions.find(domain::StrategyId("alpha"))
                ->pnl_unrealised,
            dec("20"));
}

TEST_F(EngineStateTest, SnapshotReplacesOrdersAndBalances) {
  auto open = test::limit_open(kBtcUsdt, "c1", Side::Buy, "1", "100");
  state_.recordInFlight(OrderRequest{open}, 1, at(0));
  EXPECT_TRUE(state_.hasInFlight());

  AccountSnapshot snapshot;
  snapshot.exchange = kBinance;
  snapshot.balances.push_back(AssetBalance{kUsdt, Balance{dec("5"), dec("5")}, at(3)});
  snapshot.instruments.push_back(InstrumentAccountSnapshot{
      kBtcUsdt, {domain::OrderSnapshot::from_request(open, domain::OrderId("x"), at(2))}});

  auto update = apply(kBinance, snapshot);
  EXPECT_EQ(update.balances.size(), 1u);
  EXPECT_FALSE(state_.hasInFlight());
  EXPECT_EQ(state_.instrument(kBtcUsdt).orders.orders().size(), 1u);
}

TEST_F(EngineStateTest, SeedBalanceValidates) {
  state_.seedBalance(kUsdt, Balance::make(dec("10"), dec("10")), at(0));
  EXPECT_EQ(state_.asset(kUsdt).balance.total, dec("10"));
  EXPECT_THROW(state_.seedBalance(42, Balance{}, at(0)), ValidationError);
  EXPECT_THROW(state_.instrument(42), std::logic_error);
}

// -----------------------------------------------------------------------------
// MarketDataState
// -----------------------------------------------------------------------------
namespace {

MarketEvent book_event(OrderBookEvent::Type type, std::vector<Level> bids,
                       std::vector<Level> asks) {
  MarketEvent event = test::trade_item(kBtcUsdt, "1", at(0));
  OrderBookEvent book;
  book.type = type;
  book.book.bids = std::move(bids);
  book.book.asks = std::move(asks);
  event.kind = book;
  return event;
}

}  // namespace

TEST(MarketDataStateTest, TradeSetsLastPrice) {
  MarketDataState market;
  market.apply(test::trade_item(kBtcUsdt, "123.5", at(4)));
  EXPECT_EQ(market.last_price, std::optional<Decimal>(dec("123.5")));
  EXPECT_EQ(market.time_last_update, std::optional<Timestamp>(at(4)));
}

TEST(MarketDataStateTest, L1UsesMidPrice) {
  MarketDataState market;
  MarketEvent event = test::trade_item(kBtcUsdt, "1", at(0));
  OrderBookL1 l1;
  l1.best_bid = Level{dec("99"), dec("1")};
  l1.best_ask = Level{dec("101"), dec("1")};
  event.kind = l1;
  market.apply(event);
  EXPECT_EQ(market.last_price, std::optional<Decimal>(dec("100")));

  // One-sided book leaves the price alone.
  l1.best_ask.reset();
  event.kind = l1;
  market.apply(event);
  EXPECT_EQ(market.last_price, std::optional<Decimal>(dec("100")));
}

TEST(MarketDataStateTest, BookSnapshotAndUpdates) {
  MarketDataState market;
  market.apply(book_event(OrderBookEvent::Type::Snapshot,
                          {{dec("99"), dec("1")}, {dec("98"), dec("2")}},
                          {{dec("101"), dec("1")}}));
  EXPECT_EQ(market.bids.begin()->first, dec("99"));
  EXPECT_EQ(market.last_price, std::optional<Decimal>(dec("100")));

  // Zero amount deletes a level.
  market.apply(book_event(OrderBookEvent::Type::Update, {{dec("99"), dec("0")}},
                          {{dec("100"), dec("3")}}));
  EXPECT_EQ(market.bids.size(), 1u);
  EXPECT_EQ(market.asks.begin()->first, dec("100"));
  EXPECT_EQ(market.last_price, std::optional<Decimal>(dec("99")));

  // A snapshot starts the book over.
  market.apply(book_event(OrderBookEvent::Type::Snapshot, {{dec("50"), dec("1")}}, {}));
  EXPECT_EQ(market.bids.size(), 1u);
  EXPECT_TRUE(market.asks.empty());
  EXPECT_FALSE(market.book_mid_price().has_value());
}

TEST(MarketDataStateTest, CandleClosePrice) {
  MarketDataState market;
  MarketEvent event = test::trade_item(kBtcUsdt, "1", at(0));
  Candle candle;
  candle.close = dec("42");
  event.kind = candle;
  market.apply(event);
  EXPECT_EQ(market.last_price, std::optional<Decimal>(dec("42")));
  ASSERT_TRUE(market.last_candle.has_value());
}
