#include "tradeflow/codec/json.hpp"

#include "tradeflow/common/error.hpp"
#include "tradeflow/common/overloaded.hpp"

#include <cmath>
#include <string>

namespace tradeflow {

// -----------------------------------------------------------------------------
// Scalars
// -----------------------------------------------------------------------------
void to_json(Json& j, const Decimal& value) { j = value.to_string(); }

void from_json(const Json& j, Decimal& value) {
  if (j.is_string()) {
    value = Decimal::parse(j.get<std::string>());
  } else if (j.is_number_unsigned()) {
    value = Decimal(j.get<std::uint64_t>());
  } else if (j.is_number_integer()) {
    value = Decimal(j.get<std::int64_t>());
  } else if (j.is_number_float()) {
    value = Decimal::from_double(j.get<double>());
  } else {
    throw ValidationError("expected a decimal string or number, got " +
                          std::string(j.type_name()));
  }
}

Json encode_time(Timestamp time) { return format_rfc3339(time); }

Timestamp decode_time(const Json& j) {
  if (j.is_string()) {
    return parse_rfc3339(j.get<std::string>());
  }
  if (j.is_number_integer()) {
    return ms_to_timestamp(j.get<std::int64_t>());
  }
  throw ValidationError("expected an RFC 3339 timestamp or epoch milliseconds, got " +
                        std::string(j.type_name()));
}

namespace detail {

std::optional<Timestamp> optional_time_field(const Json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  return decode_time(*it);
}

std::pair<std::string, const Json*> tagged(const Json& j, const char* what) {
  if (j.is_string()) {
    return {j.get<std::string>(), nullptr};
  }
  if (j.is_object() && j.size() == 1) {
    auto it = j.begin();
    return {it.key(), &it.value()};
  }
  throw ValidationError(std::string("malformed ") + what +
                        ": expected a tag string or a single-key object");
}

bool tag_is(const std::string& tag, const char* expected) { return tag == expected; }

const Json& payload_of(const std::pair<std::string, const Json*>& tagged,
                       const char* what) {
  if (tagged.second == nullptr) {
    throw ValidationError(std::string(what) + " '" + tagged.first +
                          "' requires a payload");
  }
  return *tagged.second;
}

void unknown_tag(const char* what, const std::string& tag) {
  throw ValidationError("unknown " + std::string(what) + " variant '" + tag + "'");
}

}  // namespace detail

using detail::payload_of;
using detail::tag_is;
using detail::unknown_tag;

namespace domain {

// -----------------------------------------------------------------------------
// Enums
// -----------------------------------------------------------------------------
void to_json(Json& j, ExchangeId exchange) { j = to_string(exchange); }

void from_json(const Json& j, ExchangeId& exchange) {
  exchange = parse_exchange_id(j.get<std::string>());
}

void to_json(Json& j, Side side) { j = side == Side::Buy ? "Buy" : "Sell"; }

void from_json(const Json& j, Side& side) {
  const std::string text = j.get<std::string>();
  if (text == "Buy" || text == "buy" || text == "BUY" || text == "b") {
    side = Side::Buy;
  } else if (text == "Sell" || text == "sell" || text == "SELL" || text == "s") {
    side = Side::Sell;
  } else {
    throw ValidationError("unknown side '" + j.get<std::string>() + "'");
  }
}

void to_json(Json& j, OrderKind kind) {
  j = kind == OrderKind::Market ? "Market" : "Limit";
}

void from_json(const Json& j, OrderKind& kind) {
  const std::string text = j.get<std::string>();
  if (text == "Market") {
    kind = OrderKind::Market;
  } else if (text == "Limit") {
    kind = OrderKind::Limit;
  } else {
    throw ValidationError("unknown order kind '" + j.get<std::string>() + "'");
  }
}

void to_json(Json& j, const TimeInForce& tif) {
  switch (tif.type) {
    case TimeInForce::Type::GoodUntilCancelled:
      j = Json{{"GoodUntilCancelled", {{"post_only", tif.post_only}}}};
      return;
    case TimeInForce::Type::GoodUntilEndOfDay:
      j = "GoodUntilEndOfDay";
      return;
    case TimeInForce::Type::FillOrKill:
      j = "FillOrKill";
      return;
    case TimeInForce::Type::ImmediateOrCancel:
      j = "ImmediateOrCancel";
      return;
  }
}

void from_json(const Json& j, TimeInForce& tif) {
  const auto tagged = detail::tagged(j, "time_in_force");
  if (tag_is(tagged.first, "GoodUntilCancelled")) {
    bool post_only = false;
    if (tagged.second != nullptr) {
      post_only = tagged.second->value("post_only", false);
    }
    tif = TimeInForce::good_until_cancelled(post_only);
  } else if (tag_is(tagged.first, "GoodUntilEndOfDay")) {
    tif = TimeInForce::good_until_end_of_day();
  } else if (tag_is(tagged.first, "FillOrKill")) {
    tif = TimeInForce::fill_or_kill();
  } else if (tag_is(tagged.first, "ImmediateOrCancel")) {
    tif = TimeInForce::immediate_or_cancel();
  } else {
    unknown_tag("time_in_force", tagged.first);
  }
}

// -----------------------------------------------------------------------------
// Orders
// -----------------------------------------------------------------------------
void to_json(Json& j, const OrderKey& key) {
  j = Json{{"exchange", key.exchange},
           {"instrument", key.instrument},
           {"strategy", key.strategy},
           {"cid", key.cid}};
}

void from_json(const Json& j, OrderKey& key) {
  key.exchange = j.at("exchange").get<ExchangeIndex>();
  key.instrument = j.at("instrument").get<InstrumentIndex>();
  key.strategy = j.at("strategy").get<StrategyId>();
  key.cid = j.at("cid").get<ClientOrderId>();
}

void to_json(Json& j, const OrderRequestOpen& request) {
  j = Json{{"key", request.key},
           {"side", request.side},
           {"price", request.price},
           {"quantity", request.quantity},
           {"kind", request.kind},
           {"time_in_force", request.time_in_force}};
}

void from_json(const Json& j, OrderRequestOpen& request) {
  request.key = j.at("key").get<OrderKey>();
  request.side = j.at("side").get<Side>();
  request.price = j.at("price").get<Decimal>();
  request.quantity = j.at("quantity").get<Decimal>();
  request.kind = j.at("kind").get<OrderKind>();
  request.time_in_force = j.contains("time_in_force")
                              ? j.at("time_in_force").get<TimeInForce>()
                              : TimeInForce::good_until_cancelled();
  request.validate();
}

void to_json(Json& j, const OrderRequestCancel& request) {
  j = Json{{"key", request.key}, {"id", detail::optional_json(request.id)}};
}

void from_json(const Json& j, OrderRequestCancel& request) {
  request.key = j.at("key").get<OrderKey>();
  request.id = detail::optional_field<OrderId>(j, "id");
}

void to_json(Json& j, const Open& open) {
  j = Json{{"id", open.id},
           {"time_exchange", encode_time(open.time_exchange)},
           {"filled_quantity", open.filled_quantity}};
}

void from_json(const Json& j, Open& open) {
  open.id = j.at("id").get<OrderId>();
  open.time_exchange = decode_time(j.at("time_exchange"));
  open.filled_quantity = j.value("filled_quantity", Json("0")).get<Decimal>();
}

void to_json(Json& j, const OrderSnapshot& order) {
  j = Json{{"key", order.key},
           {"side", order.side},
           {"price", order.price},
           {"quantity", order.quantity},
           {"kind", order.kind},
           {"time_in_force", order.time_in_force},
           {"state", encode_order_state(order.state)}};
}

void from_json(const Json& j, OrderSnapshot& order) {
  order.key = j.at("key").get<OrderKey>();
  order.side = j.at("side").get<Side>();
  order.price = j.at("price").get<Decimal>();
  order.quantity = j.at("quantity").get<Decimal>();
  order.kind = j.at("kind").get<OrderKind>();
  order.time_in_force = j.contains("time_in_force")
                            ? j.at("time_in_force").get<TimeInForce>()
                            : TimeInForce::good_until_cancelled();
  order.state = decode_order_state(j.at("state"));
  order.validate();
}

// -----------------------------------------------------------------------------
// Balances and trades
// -----------------------------------------------------------------------------
void to_json(Json& j, const Balance& balance) {
  j = Json{{"total", balance.total}, {"free", balance.free}};
}

void from_json(const Json& j, Balance& balance) {
  balance = Balance::make(j.at("total").get<Decimal>(), j.at("free").get<Decimal>());
}

void to_json(Json& j, const AssetBalance& balance) {
  j = Json{{"asset", balance.asset},
           {"balance", balance.balance},
           {"time_exchange", encode_time(balance.time_exchange)}};
}

void from_json(const Json& j, AssetBalance& balance) {
  balance.asset = j.at("asset").get<AssetIndex>();
  balance.balance = j.at("balance").get<Balance>();
  balance.time_exchange = decode_time(j.at("time_exchange"));
}

void to_json(Json& j, const AssetFees& fees) {
  j = Json{{"asset", fees.asset}, {"fees", fees.fees}};
}

void from_json(const Json& j, AssetFees& fees) {
  fees.asset = j.at("asset").get<AssetIndex>();
  fees.fees = j.at("fees").get<Decimal>();
}

void to_json(Json& j, const Trade& trade) {
  j = Json{{"id", trade.id},
           {"order_id", trade.order_id},
           {"instrument", trade.instrument},
           {"strategy", trade.strategy},
           {"time_exchange", encode_time(trade.time_exchange)},
           {"side", trade.side},
           {"price", trade.price},
           {"quantity", trade.quantity},
           {"fees", trade.fees}};
}

void from_json(const Json& j, Trade& trade) {
  trade.id = j.at("id").get<TradeId>();
  trade.order_id = j.at("order_id").get<OrderId>();
  trade.instrument = j.at("instrument").get<InstrumentIndex>();
  trade.strategy = j.at("strategy").get<StrategyId>();
  trade.time_exchange = decode_time(j.at("time_exchange"));
  trade.side = j.at("side").get<Side>();
  trade.price = j.at("price").get<Decimal>();
  trade.quantity = j.at("quantity").get<Decimal>();
  trade.fees = j.at("fees").get<AssetFees>();
  trade.validate();
}

// -----------------------------------------------------------------------------
// Positions
// -----------------------------------------------------------------------------
void to_json(Json& j, const Position& position) {
  j = Json{{"instrument", position.instrument},
           {"strategy", position.strategy},
           {"side", position.side},
           {"price_entry_average", position.price_entry_average},
           {"quantity_abs", position.quantity_abs},
           {"quantity_abs_max", position.quantity_abs_max},
           {"pnl_unrealised", position.pnl_unrealised},
           {"pnl_realised", position.pnl_realised},
           {"fees_enter", position.fees_enter},
           {"fees_exit", position.fees_exit},
           {"time_enter", encode_time(position.time_enter)},
           {"time_exchange_update", encode_time(position.time_exchange_update)},
           {"trades", position.trades}};
}

void to_json(Json& j, const ClosedPosition& position) {
  j = Json{{"instrument", position.instrument},
           {"strategy", position.strategy},
           {"side", position.side},
           {"price_entry_average", position.price_entry_average},
           {"quantity_abs_max", position.quantity_abs_max},
           {"pnl_realised", position.pnl_realised},
           {"fees_enter", position.fees_enter},
           {"fees_exit", position.fees_exit},
           {"time_enter", encode_time(position.time_enter)},
           {"time_exit", encode_time(position.time_exit)},
           {"trades", position.trades}};
}

void from_json(const Json& j, ClosedPosition& position) {
  position.instrument = j.at("instrument").get<InstrumentIndex>();
  position.strategy = j.at("strategy").get<StrategyId>();
  position.side = j.at("side").get<Side>();
  position.price_entry_average = j.at("price_entry_average").get<Decimal>();
  position.quantity_abs_max = j.at("quantity_abs_max").get<Decimal>();
  position.pnl_realised = j.at("pnl_realised").get<Decimal>();
  position.fees_enter = j.at("fees_enter").get<Decimal>();
  position.fees_exit = j.at("fees_exit").get<Decimal>();
  position.time_enter = decode_time(j.at("time_enter"));
  position.time_exit = decode_time(j.at("time_exit"));
  position.trades = j.value("trades", Json::array()).get<std::vector<TradeId>>();
}

// -----------------------------------------------------------------------------
// Instrument configuration
// -----------------------------------------------------------------------------
void to_json(Json& j, const Underlying& underlying) {
  j = Json{{"base", underlying.base}, {"quote", underlying.quote}};
}

void from_json(const Json& j, Underlying& underlying) {
  underlying.base = j.at("base").get<std::string>();
  underlying.quote = j.at("quote").get<std::string>();
}

namespace {

const char* units_name(OrderQuantityUnits unit) {
  switch (unit) {
    case OrderQuantityUnits::Asset:
      return "asset";
    case OrderQuantityUnits::Contract:
      return "contract";
    case OrderQuantityUnits::Quote:
      return "quote";
  }
  return "asset";
}

OrderQuantityUnits parse_units(const std::string& text) {
  if (tag_is(text, "asset")) return OrderQuantityUnits::Asset;
  if (tag_is(text, "contract")) return OrderQuantityUnits::Contract;
  if (tag_is(text, "quote")) return OrderQuantityUnits::Quote;
  throw ValidationError("unknown order quantity unit '" + text + "'");
}

Json encode_kind(const InstrumentKind& kind) {
  return std::visit(
      overloaded{
          [](const SpotKind&) { return Json("spot"); },
          [](const PerpetualContract& c) {
            return Json{{"perpetual",
                         {{"contract_size", c.contract_size},
                          {"settlement_asset", c.settlement_asset}}}};
          },
          [](const FutureContract& c) {
            return Json{{"future",
                         {{"contract_size", c.contract_size},
                          {"settlement_asset", c.settlement_asset},
                          {"expiry", encode_time(c.expiry)}}}};
          },
          [](const OptionContract& c) {
            return Json{{"option",
                         {{"kind", c.kind == OptionKind::Call ? "call" : "put"},
                          {"exercise", c.exercise == OptionExercise::American ? "american"
                                       : c.exercise == OptionExercise::Bermudan
                                           ? "bermudan"
                                           : "european"},
                          {"expiry", encode_time(c.expiry)},
                          {"strike", c.strike},
                          {"strike_asset", c.strike_asset},
                          {"contract_size", c.contract_size},
                          {"settlement_asset", c.settlement_asset}}}};
          },
      },
      kind);
}

InstrumentKind decode_kind(const Json& j) {
  const auto tagged = detail::tagged(j, "instrument kind");
  if (tag_is(tagged.first, "spot")) {
    return SpotKind{};
  }
  const Json& body = payload_of(tagged, "instrument kind");
  if (tag_is(tagged.first, "perpetual")) {
    PerpetualContract c;
    c.contract_size = body.value("contract_size", Json("1")).get<Decimal>();
    c.settlement_asset = body.at("settlement_asset").get<std::string>();
    return c;
  }
  if (tag_is(tagged.first, "future")) {
    FutureContract c;
    c.contract_size = body.value("contract_size", Json("1")).get<Decimal>();
    c.settlement_asset = body.at("settlement_asset").get<std::string>();
    c.expiry = decode_time(body.at("expiry"));
    return c;
  }
  if (tag_is(tagged.first, "option")) {
    OptionContract c;
    const std::string kind = body.at("kind").get<std::string>();
    if (kind == "call") {
      c.kind = OptionKind::Call;
    } else if (kind == "put") {
      c.kind = OptionKind::Put;
    } else {
      throw ValidationError("unknown option kind '" + kind + "'");
    }
    const std::string exercise = body.at("exercise").get<std::string>();
    if (exercise == "american") {
      c.exercise = OptionExercise::American;
    } else if (exercise == "bermudan") {
      c.exercise = OptionExercise::Bermudan;
    } else if (exercise == "european") {
      c.exercise = OptionExercise::European;
    } else {
      throw ValidationError("unknown option exercise '" + exercise + "'");
    }
    c.expiry = decode_time(body.at("expiry"));
    c.strike = body.at("strike").get<Decimal>();
    c.strike_asset = body.at("strike_asset").get<std::string>();
    c.contract_size = body.value("contract_size", Json("1")).get<Decimal>();
    c.settlement_asset = body.at("settlement_asset").get<std::string>();
    return c;
  }
  unknown_tag("instrument kind", tagged.first);
}

}  // namespace

void to_json(Json& j, const InstrumentSpec& spec) {
  j = Json{{"price", {{"min", spec.price.min}, {"tick_size", spec.price.tick_size}}},
           {"quantity",
            {{"unit", units_name(spec.quantity.unit)},
             {"min", spec.quantity.min},
             {"increment", spec.quantity.increment}}},
           {"notional", {{"min", spec.notional.min}}}};
}

void from_json(const Json& j, InstrumentSpec& spec) {
  const Json& price = j.at("price");
  spec.price.min = price.at("min").get<Decimal>();
  spec.price.tick_size = price.at("tick_size").get<Decimal>();
  const Json& quantity = j.at("quantity");
  spec.quantity.unit = parse_units(quantity.at("unit").get<std::string>());
  spec.quantity.min = quantity.at("min").get<Decimal>();
  spec.quantity.increment = quantity.at("increment").get<Decimal>();
  spec.notional.min = j.at("notional").at("min").get<Decimal>();
}

void to_json(Json& j, const InstrumentConfig& config) {
  j = Json{{"exchange", config.exchange},
           {"name_exchange", config.name_exchange},
           {"underlying", config.underlying},
           {"quote", config.quote == InstrumentQuoteAsset::UnderlyingQuote
                         ? "underlying_quote"
                         : "underlying_base"},
           {"kind", encode_kind(config.kind)},
           {"spec", detail::optional_json(config.spec)}};
}

void from_json(const Json& j, InstrumentConfig& config) {
  config.exchange = j.at("exchange").get<ExchangeId>();
  config.name_exchange = j.at("name_exchange").get<std::string>();
  config.underlying = j.at("underlying").get<Underlying>();
  const std::string quote = j.value("quote", std::string("underlying_quote"));
  if (tag_is(quote, "underlying_quote")) {
    config.quote = InstrumentQuoteAsset::UnderlyingQuote;
  } else if (tag_is(quote, "underlying_base")) {
    config.quote = InstrumentQuoteAsset::UnderlyingBase;
  } else {
    throw ValidationError("unknown instrument quote asset '" + quote + "'");
  }
  config.kind = decode_kind(j.at("kind"));
  config.spec = detail::optional_field<InstrumentSpec>(j, "spec");
  config.validate();
}

// -----------------------------------------------------------------------------
// Risk limits
// -----------------------------------------------------------------------------
void to_json(Json& j, const RiskLimits& limits) {
  j = Json{{"max_position_notional", detail::optional_json(limits.max_position_notional)},
           {"max_position_quantity", detail::optional_json(limits.max_position_quantity)},
           {"max_leverage", detail::optional_json(limits.max_leverage)},
           {"max_exposure_percent", detail::optional_json(limits.max_exposure_percent)}};
}

void from_json(const Json& j, RiskLimits& limits) {
  limits.max_position_notional = detail::optional_field<Decimal>(j, "max_position_notional");
  limits.max_position_quantity = detail::optional_field<Decimal>(j, "max_position_quantity");
  limits.max_leverage = detail::optional_field<Decimal>(j, "max_leverage");
  limits.max_exposure_percent = detail::optional_field<Decimal>(j, "max_exposure_percent");
  limits.validate();
}

void to_json(Json& j, const RiskConfiguration& config) {
  Json instruments = Json::array();
  for (const auto& entry : config.instruments()) {
    instruments.push_back(Json{{"index", entry.index}, {"limits", entry.limits}});
  }
  j = Json{{"global", detail::optional_json(config.global())},
           {"instruments", std::move(instruments)}};
}

}  // namespace domain

// -----------------------------------------------------------------------------
// OrderState: {"Active": ...} | {"Inactive": ...}
// -----------------------------------------------------------------------------
Json encode_order_state(const domain::OrderState& state) {
  using namespace domain;
  return std::visit(
      overloaded{
          [](const OpenInFlight&) { return Json{{"Active", "OpenInFlight"}}; },
          [](const Open& open) { return Json{{"Active", {{"Open", open}}}}; },
          [](const CancelInFlight& cancel) {
            return Json{{"Active",
                         {{"CancelInFlight",
                           {{"order", detail::optional_json(cancel.order)}}}}}};
          },
          [](const FullyFilled&) { return Json{{"Inactive", "FullyFilled"}}; },
          [](const Expired&) { return Json{{"Inactive", "Expired"}}; },
          [](const Cancelled& cancelled) {
            return Json{{"Inactive",
                         {{"Cancelled",
                           {{"id", detail::optional_json(cancelled.id)},
                            {"time_exchange", encode_time(cancelled.time_exchange)}}}}}};
          },
          [](const Rejected& rejected) {
            return Json{{"Inactive", {{"Rejected", rejected.reason}}}};
          },
          [](const OpenFailed& failed) {
            return Json{{"Inactive", {{"OpenFailed", failed.reason}}}};
          },
      },
      state);
}

domain::OrderState decode_order_state(const Json& j) {
  using namespace domain;
  const auto outer = detail::tagged(j, "order state");
  const Json& body = payload_of(outer, "order state");
  const auto inner = detail::tagged(body, "order state");

  if (tag_is(outer.first, "Active")) {
    if (tag_is(inner.first, "OpenInFlight")) {
      return OpenInFlight{};
    }
    if (tag_is(inner.first, "Open")) {
      return payload_of(inner, "Open").get<Open>();
    }
    if (tag_is(inner.first, "CancelInFlight")) {
      CancelInFlight cancel;
      if (inner.second != nullptr) {
        cancel.order = detail::optional_field<Open>(*inner.second, "order");
      }
      return cancel;
    }
    unknown_tag("active order state", inner.first);
  }
  if (tag_is(outer.first, "Inactive")) {
    if (tag_is(inner.first, "FullyFilled")) {
      return FullyFilled{};
    }
    if (tag_is(inner.first, "Expired")) {
      return Expired{};
    }
    if (tag_is(inner.first, "Cancelled")) {
      const Json& cancelled = payload_of(inner, "Cancelled");
      return Cancelled{detail::optional_field<OrderId>(cancelled, "id"),
                       decode_time(cancelled.at("time_exchange"))};
    }
    if (tag_is(inner.first, "Rejected")) {
      return Rejected{payload_of(inner, "Rejected").get<std::string>()};
    }
    if (tag_is(inner.first, "OpenFailed")) {
      return OpenFailed{payload_of(inner, "OpenFailed").get<std::string>()};
    }
    unknown_tag("inactive order state", inner.first);
  }
  unknown_tag("order state", outer.first);
}

Json encode_order_request(const OrderRequest& request) {
  return std::visit(
      overloaded{
          [](const domain::OrderRequestOpen& open) { return Json{{"Open", open}}; },
          [](const domain::OrderRequestCancel& cancel) {
            return Json{{"Cancel", cancel}};
          },
      },
      request);
}

OrderRequest decode_order_request(const Json& j) {
  const auto tagged = detail::tagged(j, "order request");
  const Json& body = payload_of(tagged, "order request");
  if (tag_is(tagged.first, "Open")) {
    return body.get<domain::OrderRequestOpen>();
  }
  if (tag_is(tagged.first, "Cancel")) {
    return body.get<domain::OrderRequestCancel>();
  }
  unknown_tag("order request", tagged.first);
}

}  // namespace tradeflow
