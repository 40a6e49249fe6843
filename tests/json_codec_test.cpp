// =============================================================================
// json_codec_test.cpp
// =============================================================================
// Unit tests for the nlohmann::json codec.
//
// Validates:
//   - decimals are written as strings and read from strings or numbers
//   - timestamps are canonical RFC 3339 and accept epoch milliseconds
//   - externally tagged variants and identifiers accept only canonical tags
//   - every EngineEvent shape survives encode, parse, encode
//   - decoded requests and snapshots are validated
//   - malformed text surfaces as ValidationError, never a json exception
// =============================================================================

#include "tradeflow/codec/json.hpp"

#include "tradeflow/common/error.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <optional>
#include <set>
#include <string>
#include <vector>

using namespace tradeflow;
using domain::Side;
using tradeflow::test::at;
using tradeflow::test::dec;
using tradeflow::test::kBtcUsdt;

// -----------------------------------------------------------------------------
// Scalars
// -----------------------------------------------------------------------------
TEST(JsonCodecTest, DecimalsAreStrings) {
  EXPECT_EQ(Json(dec("100.50")).dump(), "\"100.5\"");
  EXPECT_EQ(Json("0.25").get<Decimal>(), dec("0.25"));
  EXPECT_EQ(Json(42).get<Decimal>(), dec("42"));
  EXPECT_EQ(Json(0.5).get<Decimal>(), dec("0.5"));
  EXPECT_THROW(Json(true).get<Decimal>(), ValidationError);
  EXPECT_THROW(Json("abc").get<Decimal>(), ValidationError);
}

TEST(JsonCodecTest, TimestampsAreCanonical) {
  EXPECT_EQ(encode_time(at(0)).get<std::string>(), "2024-01-01T00:00:00Z");
  EXPECT_EQ(encode_time(at(0) + std::chrono::milliseconds(250)).get<std::string>(),
            "2024-01-01T00:00:00.250Z");
  EXPECT_EQ(decode_time(Json("2024-01-01T00:00:01Z")), at(1));
  EXPECT_EQ(decode_time(Json(1704067202000LL)), at(2));
  EXPECT_THROW(decode_time(Json("yesterday")), ValidationError);
}

TEST(JsonCodecTest, IdentifiersMustBeCanonical) {
  EXPECT_EQ(Json("binance_spot").get<domain::ExchangeId>(), domain::ExchangeId::BinanceSpot);
  EXPECT_THROW(Json("Binance-Spot").get<domain::ExchangeId>(), ValidationError);
  EXPECT_THROW(Json("BINANCE_SPOT").get<domain::ExchangeId>(), ValidationError);
  EXPECT_THROW(Json("binancespot").get<domain::ExchangeId>(), ValidationError);

  EXPECT_EQ(Json("Limit").get<domain::OrderKind>(), domain::OrderKind::Limit);
  EXPECT_THROW(Json("limit").get<domain::OrderKind>(), ValidationError);
  EXPECT_EQ(Json("b").get<Side>(), Side::Buy);
  EXPECT_THROW(Json("bUy").get<Side>(), ValidationError);

  EXPECT_THROW(parse_engine_event("\"shutdown\""), ValidationError);
  EXPECT_THROW(parse_engine_event(R"({"Command": {"cancel_orders": "None"}})"),
               ValidationError);
  EXPECT_THROW(parse_engine_event(R"({"Market": {"reconnecting": "kraken"}})"),
               ValidationError);
}

// -----------------------------------------------------------------------------
// Market events
// -----------------------------------------------------------------------------
TEST(JsonCodecTest, MarketTradeRoundTrip) {
  const MarketEvent event = test::trade_item(kBtcUsdt, "50000.5", at(3), "0.2");
  const Json j = event;
  EXPECT_EQ(j.at("exchange"), "binance_spot");
  EXPECT_EQ(j.at("kind").at("trade").at("price"), "50000.5");

  const auto decoded = j.get<MarketEvent>();
  EXPECT_EQ(decoded.time_exchange, at(3));
  const auto& trade = std::get<PublicTrade>(decoded.kind);
  EXPECT_EQ(trade.price, dec("50000.5"));
  EXPECT_EQ(trade.amount, dec("0.2"));
}

TEST(JsonCodecTest, OrderBookLevelsAcceptPairs) {
  const Json j = Json::parse(R"({
    "time_exchange": 1704067200000,
    "exchange": "kraken",
    "instrument": 1,
    "kind": {"order_book": {"Snapshot": {
      "sequence": 7,
      "bids": [["99", "1"], {"price": "98", "amount": "2"}],
      "asks": [["101", "3"]]
    }}}
  })");

  const auto event = j.get<MarketEvent>();
  EXPECT_EQ(event.time_received, event.time_exchange);
  const auto& book = std::get<OrderBookEvent>(event.kind);
  EXPECT_EQ(book.type, OrderBookEvent::Type::Snapshot);
  EXPECT_EQ(book.book.sequence, 7u);
  ASSERT_EQ(book.book.bids.size(), 2u);
  EXPECT_EQ(book.book.bids[1].price, dec("98"));
  EXPECT_EQ(book.book.asks[0].amount, dec("3"));
}

TEST(JsonCodecTest, MarketStreamResults) {
  const auto results = parse_market_stream_results(R"([
    {"Reconnecting": "binance_spot"},
    {"Item": {"Err": "socket closed"}},
    {"Item": {"Ok": {"time_exchange": "2024-01-01T00:00:05Z", "exchange": "binance_spot",
                     "instrument": 0,
                     "kind": {"trade": {"id": "1", "price": "10", "amount": "1", "side": "buy"}}}}}
  ])");

  ASSERT_EQ(results.size(), 3u);
  EXPECT_EQ(std::get<Reconnecting>(results[0]).exchange, domain::ExchangeId::BinanceSpot);
  EXPECT_EQ(std::get<MarketStreamError>(results[1]).message, "socket closed");
  EXPECT_EQ(std::get<MarketEvent>(results[2]).time_exchange, at(5));

  EXPECT_THROW(parse_market_stream_results("{}"), ValidationError);
  EXPECT_THROW(parse_market_stream_results("[{\"Bogus\": 1}]"), ValidationError);
  EXPECT_THROW(parse_market_stream_results("[1, 2"), ValidationError);
}

// -----------------------------------------------------------------------------
// Orders and account events
// -----------------------------------------------------------------------------
TEST(JsonCodecTest, OrderRequestOpenIsValidated) {
  const auto request = test::limit_open(kBtcUsdt, "c1", Side::Buy, "1", "100");
  Json j = request;
  EXPECT_EQ(j.at("time_in_force").at("GoodUntilCancelled").at("post_only"), false);

  const auto decoded = j.get<domain::OrderRequestOpen>();
  EXPECT_EQ(decoded.key.cid.str(), "c1");
  EXPECT_EQ(decoded.price, dec("100"));

  j["quantity"] = "-1";
  EXPECT_THROW(j.get<domain::OrderRequestOpen>(), ValidationError);
}

TEST(JsonCodecTest, OrderStateTags) {
  const domain::OrderState open =
      domain::Open{domain::OrderId("x1"), at(1), dec("0.5")};
  const Json j = encode_order_state(open);
  EXPECT_EQ(j.at("Active").at("Open").at("filled_quantity"), "0.5");

  const auto decoded = std::get<domain::Open>(decode_order_state(j));
  EXPECT_EQ(decoded.id.str(), "x1");

  EXPECT_TRUE(std::holds_alternative<domain::OpenInFlight>(
      decode_order_state(Json::parse(R"({"Active": "OpenInFlight"})"))));
  EXPECT_THROW(decode_order_state(Json::parse(R"({"active": "open_in_flight"})")),
               ValidationError);
  const auto rejected = decode_order_state(Json::parse(R"({"Inactive": {"Rejected": "no"}})"));
  EXPECT_EQ(std::get<domain::Rejected>(rejected).reason, "no");
  EXPECT_THROW(decode_order_state(Json::parse(R"({"Inactive": "Gone"})")), ValidationError);
}

TEST(JsonCodecTest, AccountTradeRoundTrip) {
  const AccountStreamEvent event = AccountEvent{
      test::kBinance, test::fill(kBtcUsdt, "t1", Side::Sell, "2", "30000", at(4), "1.5")};
  const Json j = encode_account_stream_event(event);
  EXPECT_TRUE(j.at("Item").at("kind").contains("Trade"));

  const auto decoded = std::get<AccountEvent>(decode_account_stream_event(j));
  const auto& trade = std::get<domain::Trade>(decoded.kind);
  EXPECT_EQ(trade.id.str(), "t1");
  EXPECT_EQ(trade.side, Side::Sell);
  EXPECT_EQ(trade.fees.fees, dec("1.5"));
  EXPECT_EQ(trade.time_exchange, at(4));
}

TEST(JsonCodecTest, CancelResults) {
  const OrderCancelled failed{test::key(kBtcUsdt, "c9"), CancelError{"order not found"}};
  const Json j = failed;
  EXPECT_EQ(j.at("state").at("Err"), "order not found");
  EXPECT_FALSE(j.get<OrderCancelled>().ok());

  const OrderCancelled ok{test::key(kBtcUsdt, "c9"),
                          domain::Cancelled{domain::OrderId("x9"), at(2)}};
  const auto decoded = Json(ok).get<OrderCancelled>();
  ASSERT_TRUE(decoded.ok());
  EXPECT_EQ(std::get<domain::Cancelled>(decoded.result).time_exchange, at(2));
}

// -----------------------------------------------------------------------------
// Engine events
// -----------------------------------------------------------------------------
TEST(JsonCodecTest, EngineEventTags) {
  EXPECT_TRUE(std::holds_alternative<Shutdown>(parse_engine_event("\"Shutdown\"")));

  const auto update = parse_engine_event(R"({"TradingStateUpdate": "Disabled"})");
  EXPECT_EQ(std::get<TradingStateUpdate>(update).state, TradingState::Disabled);

  const auto command = parse_engine_event(
      R"({"Command": {"ClosePositions": {"Instruments": [0]}}})");
  const auto& close = std::get<ClosePositions>(std::get<Command>(command));
  const auto catalogue = test::catalogue();
  EXPECT_TRUE(close.filter.matches(catalogue->instrument(kBtcUsdt)));
  EXPECT_FALSE(close.filter.matches(catalogue->instrument(test::kEthUsd)));

  const auto cancel = parse_engine_event(R"({"Command": {"CancelOrders": "None"}})");
  EXPECT_EQ(std::get<CancelOrders>(std::get<Command>(cancel)).filter.kind(),
            InstrumentFilter::Kind::None);
}

// -----------------------------------------------------------------------------
// Every EngineEvent shape survives encode, parse, encode unchanged.
// -----------------------------------------------------------------------------
struct RoundTripCase {
  std::string name;
  EngineEvent event;
};

namespace {

EngineEvent account_event(AccountEventKind kind) {
  return test::account(test::kBinance, std::move(kind));
}

EngineEvent market_event(MarketEventKind kind) {
  MarketEvent item = test::trade_item(kBtcUsdt, "100", at(1));
  item.kind = std::move(kind);
  return test::market(std::move(item));
}

domain::OrderSnapshot order_in(domain::OrderState state) {
  domain::OrderSnapshot order =
      domain::OrderSnapshot::from_request(test::limit_open(kBtcUsdt, "s1", Side::Buy, "1", "100"));
  order.state = std::move(state);
  return order;
}

domain::Open open_state() {
  return domain::Open{domain::OrderId("o1"), at(1), dec("0.25")};
}

std::vector<RoundTripCase> round_trip_cases() {
  const domain::OrderKey key = test::key(kBtcUsdt, "c1");
  const std::set<domain::Underlying> btc_usdt{domain::Underlying{"btc", "usdt"}};

  AccountSnapshot snapshot;
  snapshot.exchange = test::kBinance;
  snapshot.balances = {domain::AssetBalance{test::kUsdt,
                                            domain::Balance::make(dec("10"), dec("7.5")),
                                            at(1)}};
  snapshot.instruments = {InstrumentAccountSnapshot{kBtcUsdt, {order_in(open_state())}}};

  OrderBook book;
  book.sequence = 7;
  book.time_engine = at(2);
  book.bids = {Level{dec("99"), dec("1")}, Level{dec("98.5"), dec("2")}};
  book.asks = {Level{dec("101"), dec("0.5")}};
  OrderBook update;
  update.sequence = 8;
  update.asks = {Level{dec("101"), dec("0")}};

  return {
      {"Shutdown", Shutdown{}},
      {"TradingEnabled", TradingStateUpdate{TradingState::Enabled}},
      {"TradingDisabled", TradingStateUpdate{TradingState::Disabled}},
      {"SendOpenRequests",
       Command{SendOpenRequests{{test::market_open(kBtcUsdt, "c1", Side::Buy, "1", "100"),
                                 test::limit_open(test::kEthUsd, "c2", Side::Sell, "2",
                                                  "2000.5")}}}},
      {"SendCancelRequests",
       Command{SendCancelRequests{{domain::OrderRequestCancel{key, domain::OrderId("o1")},
                                   domain::OrderRequestCancel{key, std::nullopt}}}}},
      {"CancelOrdersNone", Command{CancelOrders{InstrumentFilter::none()}}},
      {"CancelOrdersExchanges", Command{CancelOrders{InstrumentFilter::exchanges({0, 1})}}},
      {"CancelOrdersInstruments", Command{CancelOrders{InstrumentFilter::instruments({1})}}},
      {"CancelOrdersUnderlyings", Command{CancelOrders{InstrumentFilter::underlyings(btc_usdt)}}},
      {"ClosePositionsNone", Command{ClosePositions{InstrumentFilter::none()}}},
      {"ClosePositionsExchanges", Command{ClosePositions{InstrumentFilter::exchanges({1})}}},
      {"ClosePositionsInstruments",
       Command{ClosePositions{InstrumentFilter::instruments({0, 1})}}},
      {"ClosePositionsUnderlyings",
       Command{ClosePositions{InstrumentFilter::underlyings(btc_usdt)}}},
      {"AccountReconnecting",
       AccountStreamEvent{Reconnecting{domain::ExchangeId::Kraken}}},
      {"AccountSnapshot", account_event(snapshot)},
      {"AssetBalance",
       account_event(domain::AssetBalance{test::kBtc,
                                          domain::Balance::make(dec("1.5"), dec("1")),
                                          at(3)})},
      {"OrderOpenInFlight", account_event(order_in(domain::OpenInFlight{}))},
      {"OrderOpen", account_event(order_in(open_state()))},
      {"OrderCancelInFlight", account_event(order_in(domain::CancelInFlight{open_state()}))},
      {"OrderCancelInFlightUnacked",
       account_event(order_in(domain::CancelInFlight{std::nullopt}))},
      {"OrderFullyFilled", account_event(order_in(domain::FullyFilled{}))},
      {"OrderExpired", account_event(order_in(domain::Expired{}))},
      {"OrderCancelled",
       account_event(order_in(domain::Cancelled{domain::OrderId("o1"), at(4)}))},
      {"OrderRejected", account_event(order_in(domain::Rejected{"insufficient balance"}))},
      {"OrderOpenFailed", account_event(order_in(domain::OpenFailed{"timeout"}))},
      {"CancelOk",
       account_event(OrderCancelled{key, domain::Cancelled{domain::OrderId("o1"), at(5)}})},
      {"CancelOkWithoutId",
       account_event(OrderCancelled{key, domain::Cancelled{std::nullopt, at(5)}})},
      {"CancelError", account_event(OrderCancelled{key, CancelError{"unknown order"}})},
      {"AccountTrade",
       account_event(test::fill(kBtcUsdt, "t1", Side::Sell, "0.5", "101", at(6), "0.05"))},
      {"MarketReconnecting", MarketStreamEvent{Reconnecting{domain::ExchangeId::BinanceSpot}}},
      {"MarketTrade", test::market(test::trade_item(kBtcUsdt, "50000.5", at(3), "0.2"))},
      {"OrderBookL1",
       market_event(OrderBookL1{at(2), Level{dec("99"), dec("1")}, Level{dec("101"), dec("2")}})},
      {"OrderBookL1BidOnly",
       market_event(OrderBookL1{at(2), Level{dec("99"), dec("1")}, std::nullopt})},
      {"OrderBookL1Empty", market_event(OrderBookL1{at(2), std::nullopt, std::nullopt})},
      {"OrderBookSnapshot",
       market_event(OrderBookEvent{OrderBookEvent::Type::Snapshot, book})},
      {"OrderBookUpdate", market_event(OrderBookEvent{OrderBookEvent::Type::Update, update})},
      {"Candle", market_event(Candle{at(60), dec("100"), dec("105"), dec("99.5"), dec("104"),
                                     dec("12.25"), 42})},
      {"Liquidation",
       market_event(Liquidation{Side::Sell, dec("98"), dec("3"), at(7)})},
  };
}

}  // namespace

class EngineEventRoundTripTest : public ::testing::TestWithParam<RoundTripCase> {};

TEST_P(EngineEventRoundTripTest, EncodeParseEncodeIsStable) {
  const std::string text = encode_engine_event(GetParam().event).dump();
  const EngineEvent decoded = parse_engine_event(text);
  EXPECT_EQ(decoded.index(), GetParam().event.index());
  EXPECT_EQ(encode_engine_event(decoded).dump(), text);
}

INSTANTIATE_TEST_SUITE_P(
    AllEngineEvents, EngineEventRoundTripTest, ::testing::ValuesIn(round_trip_cases()),
    [](const ::testing::TestParamInfo<RoundTripCase>& info) { return info.param.name; });

TEST(JsonCodecTest, MalformedEngineEvents) {
  EXPECT_THROW(parse_engine_event("not json"), ValidationError);
  EXPECT_THROW(parse_engine_event("{\"Explode\": 1}"), ValidationError);
  EXPECT_THROW(parse_engine_event("{\"TradingStateUpdate\": 3}"), ValidationError);
  EXPECT_THROW(parse_engine_event("{\"Market\": {\"Item\": {}}}"), ValidationError);
  EXPECT_THROW(parse_engine_event("{\"a\": 1, \"b\": 2}"), ValidationError);
}

// -----------------------------------------------------------------------------
// Reports
// -----------------------------------------------------------------------------
TEST(JsonCodecTest, StateDumpNamesEverything) {
  EngineState state(test::catalogue(), TradingState::Enabled);
  state.seedBalance(test::kUsdt, domain::Balance::make(dec("10"), dec("10")), at(0));

  const Json j = encode_state(state);
  EXPECT_EQ(j.at("trading"), "Enabled");
  ASSERT_EQ(j.at("connectivity").size(), 2u);
  EXPECT_EQ(j.at("connectivity").at(1).at("exchange"), "kraken");
  EXPECT_EQ(j.at("assets").at(1).at("balance").at("total"), "10");
  EXPECT_EQ(j.at("instruments").at(0).at("name"), "binance_spot:btc_usdt");
}

TEST(JsonCodecTest, EngineErrorShape) {
  const Json j = encode_engine_error(EngineError::recoverable("bad balance"));
  EXPECT_TRUE(j.at("order").is_null());
  EXPECT_EQ(j.at("error").at("message"), "bad balance");
}
