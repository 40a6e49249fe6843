// =============================================================================
// indexed_instruments_test.cpp
// =============================================================================
// Unit tests for tradeflow::IndexedInstruments, the catalogue every other
// component addresses exchanges, assets and instruments through.
//
// Validates:
//   - dense indices assigned in definition order
//   - asset interning per exchange (case-insensitive)
//   - internal names "<exchange>:<base>_<quote>[_<kind>]"
//   - duplicate and malformed definitions are rejected
// =============================================================================

#include "tradeflow/common/error.hpp"
#include "tradeflow/instrument/indexed_instruments.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace tradeflow;
using domain::ExchangeId;
using tradeflow::test::spot;

class IndexedInstrumentsTest : public ::testing::Test {
 protected:
  IndexedInstruments instruments{test::instrument_configs()};
};

TEST_F(IndexedInstrumentsTest, IndicesFollowDefinitionOrder) {
  ASSERT_EQ(instruments.exchanges().size(), 2u);
  ASSERT_EQ(instruments.assets().size(), 4u);
  ASSERT_EQ(instruments.instruments().size(), 2u);

  EXPECT_EQ(instruments.exchange(test::kBinance).id, ExchangeId::BinanceSpot);
  EXPECT_EQ(instruments.exchange(test::kKraken).id, ExchangeId::Kraken);

  const IndexedInstrument& eth = instruments.instrument(test::kEthUsd);
  EXPECT_EQ(eth.exchange, test::kKraken);
  EXPECT_EQ(eth.base, test::kEth);
  EXPECT_EQ(eth.quote, test::kUsd);
  EXPECT_EQ(eth.pricing_asset(), test::kUsd);
}

TEST_F(IndexedInstrumentsTest, InternalNames) {
  EXPECT_EQ(instruments.instrument(test::kBtcUsdt).name_internal,
            "binance_spot:btc_usdt");
  EXPECT_EQ(instruments.instrument(test::kBtcUsdt).name_exchange, "BTCUSDT");
  EXPECT_EQ(instruments.asset_key(test::kUsdt), "binance_spot:usdt");
  EXPECT_EQ(instruments.find_instrument_by_internal_name("kraken:eth_usd"),
            test::kEthUsd);
}

TEST_F(IndexedInstrumentsTest, Lookups) {
  EXPECT_EQ(instruments.find_exchange_index(ExchangeId::Kraken), test::kKraken);
  EXPECT_EQ(instruments.find_asset_index(ExchangeId::BinanceSpot, "USDT"),
            test::kUsdt);
  EXPECT_EQ(instruments.find_instrument_index(ExchangeId::BinanceSpot, "BTCUSDT"),
            test::kBtcUsdt);

  EXPECT_FALSE(instruments.try_find_exchange_index(ExchangeId::Okx).has_value());
  EXPECT_THROW(instruments.find_exchange_index(ExchangeId::Okx), ValidationError);
  EXPECT_THROW(instruments.find_asset_index(ExchangeId::Kraken, "btc"),
               ValidationError);
  EXPECT_THROW(instruments.instrument(7), ValidationError);
}

TEST(IndexedInstrumentsBuildTest, AssetsAreSharedWithinAnExchange) {
  const IndexedInstruments instruments({
      spot(ExchangeId::BinanceSpot, "BTCUSDT", "BTC", "USDT"),
      spot(ExchangeId::BinanceSpot, "ETHUSDT", "eth", "usdt"),
      spot(ExchangeId::Kraken, "XBTUSDT", "btc", "usdt"),
  });

  // btc, usdt, eth on binance; btc, usdt again on kraken.
  ASSERT_EQ(instruments.assets().size(), 5u);
  EXPECT_EQ(instruments.instrument(0).quote, instruments.instrument(1).quote);
  EXPECT_NE(instruments.instrument(0).base, instruments.instrument(2).base);
  EXPECT_EQ(instruments.asset(0).name_internal, "btc");
  EXPECT_EQ(instruments.asset(0).name_exchange, "BTC");
}

TEST(IndexedInstrumentsBuildTest, DerivativeKindIsPartOfTheInternalName) {
  domain::InstrumentConfig perp =
      spot(ExchangeId::BinanceFuturesUsd, "BTCUSDT", "btc", "usdt");
  perp.kind = domain::PerpetualContract{Decimal{1}, "usdt"};

  const IndexedInstruments instruments({perp});
  EXPECT_EQ(instruments.instrument(0).name_internal,
            "binance_futures_usd:btc_usdt_perpetual");
}

TEST(IndexedInstrumentsBuildTest, DuplicatesAreRejected) {
  EXPECT_THROW(IndexedInstruments({
                   spot(ExchangeId::Kraken, "ETHUSD", "eth", "usd"),
                   spot(ExchangeId::Kraken, "ETHUSD", "eth", "usd"),
               }),
               ValidationError);

  // Same underlying under another exchange symbol still collides internally.
  EXPECT_THROW(IndexedInstruments({
                   spot(ExchangeId::Kraken, "ETHUSD", "eth", "usd"),
                   spot(ExchangeId::Kraken, "XETHZUSD", "ETH", "USD"),
               }),
               ValidationError);
}

TEST(IndexedInstrumentsBuildTest, MalformedConfigsAreRejected) {
  EXPECT_THROW(IndexedInstruments({spot(ExchangeId::Kraken, "", "eth", "usd")}),
               ValidationError);
  EXPECT_THROW(IndexedInstruments({spot(ExchangeId::Kraken, "USDUSD", "usd", "USD")}),
               ValidationError);

  domain::InstrumentConfig perp = spot(ExchangeId::Kraken, "PERP", "eth", "usd");
  perp.kind = domain::PerpetualContract{Decimal{0}, "usd"};
  EXPECT_THROW(IndexedInstruments({perp}), ValidationError);
}
