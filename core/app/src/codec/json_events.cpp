#include "tradeflow/codec/json.hpp"

#include "tradeflow/common/error.hpp"
#include "tradeflow/common/overloaded.hpp"

#include <set>
#include <string>

namespace tradeflow {

using detail::payload_of;
using detail::tag_is;
using detail::tagged;
using detail::unknown_tag;

// -----------------------------------------------------------------------------
// Market data
// -----------------------------------------------------------------------------
void to_json(Json& j, const PublicTrade& trade) {
  j = Json{{"id", trade.id},
           {"price", trade.price},
           {"amount", trade.amount},
           {"side", trade.side}};
}

void from_json(const Json& j, PublicTrade& trade) {
  trade.id = j.value("id", std::string());
  trade.price = j.at("price").get<Decimal>();
  trade.amount = j.at("amount").get<Decimal>();
  trade.side = j.at("side").get<domain::Side>();
}

void to_json(Json& j, const Level& level) {
  j = Json{{"price", level.price}, {"amount", level.amount}};
}

void from_json(const Json& j, Level& level) {
  // [price, amount] pairs are accepted as well as objects.
  if (j.is_array() && j.size() == 2) {
    level.price = j.at(0).get<Decimal>();
    level.amount = j.at(1).get<Decimal>();
    return;
  }
  level.price = j.at("price").get<Decimal>();
  level.amount = j.at("amount").get<Decimal>();
}

void to_json(Json& j, const OrderBookL1& book) {
  j = Json{{"last_update_time", encode_time(book.last_update_time)},
           {"best_bid", detail::optional_json(book.best_bid)},
           {"best_ask", detail::optional_json(book.best_ask)}};
}

void from_json(const Json& j, OrderBookL1& book) {
  book.last_update_time = decode_time(j.at("last_update_time"));
  book.best_bid = detail::optional_field<Level>(j, "best_bid");
  book.best_ask = detail::optional_field<Level>(j, "best_ask");
}

void to_json(Json& j, const OrderBook& book) {
  j = Json{{"sequence", book.sequence},
           {"time_engine", detail::optional_time(book.time_engine)},
           {"bids", book.bids},
           {"asks", book.asks}};
}

void from_json(const Json& j, OrderBook& book) {
  book.sequence = j.value("sequence", std::uint64_t{0});
  book.time_engine = detail::optional_time_field(j, "time_engine");
  book.bids = j.value("bids", Json::array()).get<std::vector<Level>>();
  book.asks = j.value("asks", Json::array()).get<std::vector<Level>>();
}

void to_json(Json& j, const Candle& candle) {
  j = Json{{"close_time", encode_time(candle.close_time)},
           {"open", candle.open},
           {"high", candle.high},
           {"low", candle.low},
           {"close", candle.close},
           {"volume", candle.volume},
           {"trade_count", candle.trade_count}};
}

void from_json(const Json& j, Candle& candle) {
  candle.close_time = decode_time(j.at("close_time"));
  candle.open = j.at("open").get<Decimal>();
  candle.high = j.at("high").get<Decimal>();
  candle.low = j.at("low").get<Decimal>();
  candle.close = j.at("close").get<Decimal>();
  candle.volume = j.at("volume").get<Decimal>();
  candle.trade_count = j.value("trade_count", std::uint64_t{0});
}

void to_json(Json& j, const Liquidation& liquidation) {
  j = Json{{"side", liquidation.side},
           {"price", liquidation.price},
           {"quantity", liquidation.quantity},
           {"time", encode_time(liquidation.time)}};
}

void from_json(const Json& j, Liquidation& liquidation) {
  liquidation.side = j.at("side").get<domain::Side>();
  liquidation.price = j.at("price").get<Decimal>();
  liquidation.quantity = j.at("quantity").get<Decimal>();
  liquidation.time = decode_time(j.at("time"));
}

namespace {

Json encode_market_kind(const MarketEventKind& kind) {
  return std::visit(
      overloaded{
          [](const PublicTrade& trade) { return Json{{"trade", trade}}; },
          [](const OrderBookL1& book) { return Json{{"order_book_l1", book}}; },
          [](const OrderBookEvent& event) {
            const char* type =
                event.type == OrderBookEvent::Type::Snapshot ? "Snapshot" : "Update";
            return Json{{"order_book", {{type, event.book}}}};
          },
          [](const Candle& candle) { return Json{{"candle", candle}}; },
          [](const Liquidation& liquidation) {
            return Json{{"liquidation", liquidation}};
          },
      },
      kind);
}

MarketEventKind decode_market_kind(const Json& j) {
  const auto kind = tagged(j, "market event kind");
  const Json& body = payload_of(kind, "market event kind");
  if (tag_is(kind.first, "trade")) {
    return body.get<PublicTrade>();
  }
  if (tag_is(kind.first, "order_book_l1")) {
    return body.get<OrderBookL1>();
  }
  if (tag_is(kind.first, "order_book")) {
    const auto type = tagged(body, "order book event");
    OrderBookEvent event;
    if (tag_is(type.first, "Snapshot")) {
      event.type = OrderBookEvent::Type::Snapshot;
    } else if (tag_is(type.first, "Update")) {
      event.type = OrderBookEvent::Type::Update;
    } else {
      unknown_tag("order book event", type.first);
    }
    event.book = payload_of(type, "order book event").get<OrderBook>();
    return event;
  }
  if (tag_is(kind.first, "candle")) {
    return body.get<Candle>();
  }
  if (tag_is(kind.first, "liquidation")) {
    return body.get<Liquidation>();
  }
  unknown_tag("market event kind", kind.first);
}

}  // namespace

void to_json(Json& j, const MarketEvent& event) {
  j = Json{{"time_exchange", encode_time(event.time_exchange)},
           {"time_received", encode_time(event.time_received)},
           {"exchange", event.exchange},
           {"instrument", event.instrument},
           {"kind", encode_market_kind(event.kind)}};
}

void from_json(const Json& j, MarketEvent& event) {
  event.time_exchange = decode_time(j.at("time_exchange"));
  event.time_received = j.contains("time_received")
                            ? decode_time(j.at("time_received"))
                            : event.time_exchange;
  event.exchange = j.at("exchange").get<domain::ExchangeId>();
  event.instrument = j.at("instrument").get<domain::InstrumentIndex>();
  event.kind = decode_market_kind(j.at("kind"));
}

// -----------------------------------------------------------------------------
// Account
// -----------------------------------------------------------------------------
void to_json(Json& j, const InstrumentAccountSnapshot& snapshot) {
  j = Json{{"instrument", snapshot.instrument}, {"orders", snapshot.orders}};
}

void from_json(const Json& j, InstrumentAccountSnapshot& snapshot) {
  snapshot.instrument = j.at("instrument").get<domain::InstrumentIndex>();
  snapshot.orders =
      j.value("orders", Json::array()).get<std::vector<domain::OrderSnapshot>>();
}

void to_json(Json& j, const AccountSnapshot& snapshot) {
  j = Json{{"exchange", snapshot.exchange},
           {"balances", snapshot.balances},
           {"instruments", snapshot.instruments}};
}

void from_json(const Json& j, AccountSnapshot& snapshot) {
  snapshot.exchange = j.at("exchange").get<domain::ExchangeIndex>();
  snapshot.balances =
      j.value("balances", Json::array()).get<std::vector<domain::AssetBalance>>();
  snapshot.instruments = j.value("instruments", Json::array())
                             .get<std::vector<InstrumentAccountSnapshot>>();
}

void to_json(Json& j, const OrderCancelled& cancelled) {
  Json state = std::visit(
      overloaded{
          [](const domain::Cancelled& ok) {
            return Json{{"Ok",
                         {{"id", detail::optional_json(ok.id)},
                          {"time_exchange", encode_time(ok.time_exchange)}}}};
          },
          [](const CancelError& error) { return Json{{"Err", error.reason}}; },
      },
      cancelled.result);
  j = Json{{"key", cancelled.key}, {"state", std::move(state)}};
}

void from_json(const Json& j, OrderCancelled& cancelled) {
  cancelled.key = j.at("key").get<domain::OrderKey>();
  const auto state = tagged(j.at("state"), "cancel result");
  const Json& body = payload_of(state, "cancel result");
  if (tag_is(state.first, "Ok")) {
    cancelled.result = domain::Cancelled{detail::optional_field<domain::OrderId>(body, "id"),
                                         decode_time(body.at("time_exchange"))};
  } else if (tag_is(state.first, "Err")) {
    cancelled.result = CancelError{body.get<std::string>()};
  } else {
    unknown_tag("cancel result", state.first);
  }
}

void to_json(Json& j, const AccountEvent& event) {
  Json kind = std::visit(
      overloaded{
          [](const AccountSnapshot& s) { return Json{{"Snapshot", s}}; },
          [](const domain::AssetBalance& b) { return Json{{"BalanceSnapshot", b}}; },
          [](const domain::OrderSnapshot& o) { return Json{{"OrderSnapshot", o}}; },
          [](const OrderCancelled& c) { return Json{{"OrderCancelled", c}}; },
          [](const domain::Trade& t) { return Json{{"Trade", t}}; },
      },
      event.kind);
  j = Json{{"exchange", event.exchange}, {"kind", std::move(kind)}};
}

void from_json(const Json& j, AccountEvent& event) {
  event.exchange = j.at("exchange").get<domain::ExchangeIndex>();
  const auto kind = tagged(j.at("kind"), "account event kind");
  const Json& body = payload_of(kind, "account event kind");
  if (tag_is(kind.first, "Snapshot")) {
    event.kind = body.get<AccountSnapshot>();
  } else if (tag_is(kind.first, "BalanceSnapshot")) {
    event.kind = body.get<domain::AssetBalance>();
  } else if (tag_is(kind.first, "OrderSnapshot")) {
    event.kind = body.get<domain::OrderSnapshot>();
  } else if (tag_is(kind.first, "OrderCancelled")) {
    event.kind = body.get<OrderCancelled>();
  } else if (tag_is(kind.first, "Trade")) {
    event.kind = body.get<domain::Trade>();
  } else {
    unknown_tag("account event kind", kind.first);
  }
}

// -----------------------------------------------------------------------------
// Control
// -----------------------------------------------------------------------------
void to_json(Json& j, const InstrumentFilter& filter) {
  switch (filter.kind()) {
    case InstrumentFilter::Kind::None:
      j = "None";
      return;
    case InstrumentFilter::Kind::Exchanges:
      j = Json{{"Exchanges", filter.exchange_set()}};
      return;
    case InstrumentFilter::Kind::Instruments:
      j = Json{{"Instruments", filter.instrument_set()}};
      return;
    case InstrumentFilter::Kind::Underlyings:
      j = Json{{"Underlyings", filter.underlying_set()}};
      return;
  }
}

void from_json(const Json& j, InstrumentFilter& filter) {
  const auto kind = tagged(j, "instrument filter");
  if (tag_is(kind.first, "None")) {
    filter = InstrumentFilter::none();
    return;
  }
  const Json& body = payload_of(kind, "instrument filter");
  if (tag_is(kind.first, "Exchanges")) {
    filter = InstrumentFilter::exchanges(body.get<std::set<domain::ExchangeIndex>>());
  } else if (tag_is(kind.first, "Instruments")) {
    filter =
        InstrumentFilter::instruments(body.get<std::set<domain::InstrumentIndex>>());
  } else if (tag_is(kind.first, "Underlyings")) {
    filter = InstrumentFilter::underlyings(body.get<std::set<domain::Underlying>>());
  } else {
    unknown_tag("instrument filter", kind.first);
  }
}

void to_json(Json& j, TradingState state) { j = to_string(state); }

void from_json(const Json& j, TradingState& state) {
  const std::string text = j.get<std::string>();
  if (tag_is(text, "Enabled")) {
    state = TradingState::Enabled;
  } else if (tag_is(text, "Disabled")) {
    state = TradingState::Disabled;
  } else {
    throw ValidationError("unknown trading state '" + text + "'");
  }
}

Json encode_command(const Command& command) {
  return std::visit(
      overloaded{
          [](const SendOpenRequests& c) { return Json{{"SendOpenRequests", c.requests}}; },
          [](const SendCancelRequests& c) {
            return Json{{"SendCancelRequests", c.requests}};
          },
          [](const CancelOrders& c) { return Json{{"CancelOrders", c.filter}}; },
          [](const ClosePositions& c) { return Json{{"ClosePositions", c.filter}}; },
      },
      command);
}

Command decode_command(const Json& j) {
  const auto kind = tagged(j, "command");
  const Json& body = payload_of(kind, "command");
  if (tag_is(kind.first, "SendOpenRequests")) {
    return SendOpenRequests{body.get<std::vector<domain::OrderRequestOpen>>()};
  }
  if (tag_is(kind.first, "SendCancelRequests")) {
    return SendCancelRequests{body.get<std::vector<domain::OrderRequestCancel>>()};
  }
  if (tag_is(kind.first, "CancelOrders")) {
    return CancelOrders{body.get<InstrumentFilter>()};
  }
  if (tag_is(kind.first, "ClosePositions")) {
    return ClosePositions{body.get<InstrumentFilter>()};
  }
  unknown_tag("command", kind.first);
}

// -----------------------------------------------------------------------------
// Streams
// -----------------------------------------------------------------------------
Json encode_account_stream_event(const AccountStreamEvent& event) {
  return std::visit(
      overloaded{
          [](const Reconnecting& r) { return Json{{"Reconnecting", r.exchange}}; },
          [](const AccountEvent& e) { return Json{{"Item", e}}; },
      },
      event);
}

AccountStreamEvent decode_account_stream_event(const Json& j) {
  const auto kind = tagged(j, "account stream event");
  const Json& body = payload_of(kind, "account stream event");
  if (tag_is(kind.first, "Reconnecting")) {
    return Reconnecting{body.get<domain::ExchangeId>()};
  }
  if (tag_is(kind.first, "Item")) {
    return body.get<AccountEvent>();
  }
  unknown_tag("account stream event", kind.first);
}

Json encode_market_stream_event(const MarketStreamEvent& event) {
  return std::visit(
      overloaded{
          [](const Reconnecting& r) { return Json{{"Reconnecting", r.exchange}}; },
          [](const MarketEvent& e) { return Json{{"Item", e}}; },
      },
      event);
}

MarketStreamEvent decode_market_stream_event(const Json& j) {
  const auto kind = tagged(j, "market stream event");
  const Json& body = payload_of(kind, "market stream event");
  if (tag_is(kind.first, "Reconnecting")) {
    return Reconnecting{body.get<domain::ExchangeId>()};
  }
  if (tag_is(kind.first, "Item")) {
    return body.get<MarketEvent>();
  }
  unknown_tag("market stream event", kind.first);
}

Json encode_market_stream_result(const MarketStreamResult& result) {
  return std::visit(
      overloaded{
          [](const Reconnecting& r) { return Json{{"Reconnecting", r.exchange}}; },
          [](const MarketEvent& e) { return Json{{"Item", {{"Ok", e}}}}; },
          [](const MarketStreamError& e) {
            return Json{{"Item", {{"Err", e.message}}}};
          },
      },
      result);
}

MarketStreamResult decode_market_stream_result(const Json& j) {
  const auto kind = tagged(j, "market stream result");
  const Json& body = payload_of(kind, "market stream result");
  if (tag_is(kind.first, "Reconnecting")) {
    return Reconnecting{body.get<domain::ExchangeId>()};
  }
  if (!tag_is(kind.first, "Item")) {
    unknown_tag("market stream result", kind.first);
  }
  const auto item = tagged(body, "market stream item");
  const Json& payload = payload_of(item, "market stream item");
  if (tag_is(item.first, "Ok")) {
    return payload.get<MarketEvent>();
  }
  if (tag_is(item.first, "Err")) {
    return MarketStreamError{payload.is_string() ? payload.get<std::string>()
                                                 : payload.dump()};
  }
  unknown_tag("market stream item", item.first);
}

// -----------------------------------------------------------------------------
// EngineEvent
// -----------------------------------------------------------------------------
Json encode_engine_event(const EngineEvent& event) {
  return std::visit(
      overloaded{
          [](const Shutdown&) { return Json("Shutdown"); },
          [](const TradingStateUpdate& u) {
            return Json{{"TradingStateUpdate", u.state}};
          },
          [](const Command& c) { return Json{{"Command", encode_command(c)}}; },
          [](const AccountStreamEvent& e) {
            return Json{{"Account", encode_account_stream_event(e)}};
          },
          [](const MarketStreamEvent& e) {
            return Json{{"Market", encode_market_stream_event(e)}};
          },
      },
      event);
}

EngineEvent decode_engine_event(const Json& j) {
  const auto kind = tagged(j, "engine event");
  if (tag_is(kind.first, "Shutdown")) {
    return Shutdown{};
  }
  const Json& body = payload_of(kind, "engine event");
  if (tag_is(kind.first, "TradingStateUpdate")) {
    return TradingStateUpdate{body.get<TradingState>()};
  }
  if (tag_is(kind.first, "Command")) {
    return decode_command(body);
  }
  if (tag_is(kind.first, "Account")) {
    return decode_account_stream_event(body);
  }
  if (tag_is(kind.first, "Market")) {
    return decode_market_stream_event(body);
  }
  unknown_tag("engine event", kind.first);
}

// -----------------------------------------------------------------------------
// Text entry points
// -----------------------------------------------------------------------------
namespace {

Json parse_text(std::string_view text) {
  try {
    return Json::parse(text.begin(), text.end());
  } catch (const Json::parse_error& e) {
    throw ValidationError(std::string("malformed JSON: ") + e.what());
  }
}

}  // namespace

EngineEvent parse_engine_event(std::string_view text) {
  const Json j = parse_text(text);
  try {
    return decode_engine_event(j);
  } catch (const Json::exception& e) {
    throw ValidationError(std::string("invalid engine event: ") + e.what());
  }
}

MarketStreamResult parse_market_stream_result(std::string_view text) {
  const Json j = parse_text(text);
  try {
    return decode_market_stream_result(j);
  } catch (const Json::exception& e) {
    throw ValidationError(std::string("invalid market stream record: ") + e.what());
  }
}

std::vector<MarketStreamResult> parse_market_stream_results(std::string_view text) {
  const Json j = parse_text(text);
  if (!j.is_array()) {
    throw ValidationError("market data must be a JSON array of stream records");
  }
  std::vector<MarketStreamResult> results;
  results.reserve(j.size());
  for (std::size_t i = 0; i < j.size(); ++i) {
    try {
      results.push_back(decode_market_stream_result(j[i]));
    } catch (const Json::exception& e) {
      throw ValidationError("invalid market stream record " + std::to_string(i) +
                            ": " + e.what());
    } catch (const ValidationError& e) {
      throw ValidationError("invalid market stream record " + std::to_string(i) +
                            ": " + e.what());
    }
  }
  return results;
}

}  // namespace tradeflow
