#include "tradeflow/codec/json.hpp"

#include "tradeflow/common/overloaded.hpp"

#include <chrono>
#include <string>

namespace tradeflow {

// -----------------------------------------------------------------------------
// Engine errors and outputs
// -----------------------------------------------------------------------------
Json encode_engine_error(const EngineError& error) {
  return Json{{"order", error.order ? encode_order_request(*error.order) : Json(nullptr)},
              {"error",
               {{"variant", to_string(error.severity)}, {"message", error.message}}}};
}

Json encode_engine_output(const EngineOutput& output) {
  return std::visit(
      overloaded{
          [](const OrdersSent& sent) {
            return Json{{"OrdersSent",
                         {{"origin", to_string(sent.origin)},
                          {"cancels", sent.cancels},
                          {"opens", sent.opens}}}};
          },
          [](const PositionExited& exited) {
            return Json{{"PositionExited", exited.position}};
          },
      },
      output);
}

// -----------------------------------------------------------------------------
// EngineState
// -----------------------------------------------------------------------------
namespace {

Json encode_market(const MarketDataState& market) {
  Json bids = Json::array();
  for (const auto& [price, amount] : market.bids) {
    bids.push_back(Json(Level{price, amount}));
  }
  Json asks = Json::array();
  for (const auto& [price, amount] : market.asks) {
    asks.push_back(Json(Level{price, amount}));
  }
  return Json{{"last_price", detail::optional_json(market.last_price)},
              {"time_last_update", detail::optional_time(market.time_last_update)},
              {"bids", std::move(bids)},
              {"asks", std::move(asks)},
              {"last_candle", detail::optional_json(market.last_candle)}};
}

Json encode_instrument(const IndexedInstruments& catalogue,
                       const InstrumentState& state) {
  Json orders = Json::array();
  for (const auto& entry : state.orders.orders()) {
    orders.push_back(Json(entry.second));
  }
  Json in_flight = Json::array();
  for (const auto& [key, request] : state.orders.inFlight()) {
    in_flight.push_back(Json{{"cid", key.first},
                             {"kind", to_string(request.kind)},
                             {"sequence", request.sequence},
                             {"time", encode_time(request.time)}});
  }
  Json positions = Json::array();
  for (const auto& entry : state.positions.positions()) {
    positions.push_back(Json(entry.second));
  }
  return Json{{"instrument", state.instrument},
              {"name", catalogue.instrument(state.instrument).name_internal},
              {"exchange", state.exchange},
              {"market", encode_market(state.market)},
              {"orders", std::move(orders)},
              {"in_flight", std::move(in_flight)},
              {"positions", std::move(positions)}};
}

}  // namespace

Json encode_state(const EngineState& state) {
  const IndexedInstruments& catalogue = state.catalogue();

  Json connectivity = Json::array();
  for (std::size_t i = 0; i < state.connectivity().size(); ++i) {
    const ConnectivityState& health = state.connectivity()[i];
    connectivity.push_back(Json{{"exchange", catalogue.exchange(i).id},
                                {"market", to_string(health.market)},
                                {"account", to_string(health.account)}});
  }

  Json assets = Json::array();
  for (const AssetState& asset : state.assets()) {
    assets.push_back(Json{{"asset", asset.asset},
                          {"exchange", asset.exchange},
                          {"name", asset.name},
                          {"balance", asset.balance},
                          {"time_exchange", detail::optional_time(asset.time_exchange)}});
  }

  Json instruments = Json::array();
  for (const InstrumentState& instrument : state.instruments()) {
    instruments.push_back(encode_instrument(catalogue, instrument));
  }

  return Json{{"trading", state.trading()},
              {"connectivity", std::move(connectivity)},
              {"assets", std::move(assets)},
              {"instruments", std::move(instruments)}};
}

// -----------------------------------------------------------------------------
// AuditTick
// -----------------------------------------------------------------------------
Json encode_audit_tick(const AuditTick& tick) {
  Json event = std::visit(
      overloaded{
          [](const AuditSnapshot& snapshot) {
            return Json{{"Snapshot", encode_state(snapshot.state)}};
          },
          [](const ProcessAudit& process) {
            Json outputs = Json::array();
            for (const auto& output : process.outputs) {
              outputs.push_back(encode_engine_output(output));
            }
            Json errors = Json::array();
            for (const auto& error : process.errors) {
              errors.push_back(encode_engine_error(error));
            }
            return Json{{"Process",
                         {{"event", encode_engine_event(process.event)},
                          {"event_kind", process.event_kind},
                          {"outputs", std::move(outputs)},
                          {"errors", std::move(errors)}}}};
          },
          [](const FeedEnded&) { return Json("FeedEnded"); },
      },
      tick.event);

  return Json{{"context",
               {{"sequence", tick.context.sequence},
                {"time", encode_time(tick.context.time)}}},
              {"event", std::move(event)}};
}

// -----------------------------------------------------------------------------
// TradingSummary
// -----------------------------------------------------------------------------
namespace {

template <typename Metric>
Json encode_metric(const Metric& metric) {
  return Json{{"value", metric.value}, {"interval", metric.interval.name()}};
}

template <typename Metric>
Json encode_optional_metric(const std::optional<Metric>& metric) {
  return metric ? encode_metric(*metric) : Json(nullptr);
}

Json encode_drawdown(const std::optional<Drawdown>& drawdown) {
  if (!drawdown) {
    return nullptr;
  }
  return Json{{"value", drawdown->value},
              {"time_start", encode_time(drawdown->time_start)},
              {"time_end", encode_time(drawdown->time_end)},
              {"duration_ms", std::chrono::duration_cast<std::chrono::milliseconds>(
                                  drawdown->duration())
                                  .count()}};
}

Json encode_mean_drawdown(const std::optional<MeanDrawdown>& mean) {
  if (!mean) {
    return nullptr;
  }
  return Json{{"mean_value", mean->mean_value},
              {"mean_duration_ms",
               std::chrono::duration_cast<std::chrono::milliseconds>(mean->mean_duration)
                   .count()}};
}

Json encode_tear_sheet(const TearSheet& sheet) {
  return Json{
      {"pnl", sheet.pnl},
      {"pnl_return", encode_metric(sheet.pnl_return)},
      {"sharpe_ratio", encode_optional_metric(sheet.sharpe_ratio)},
      {"sortino_ratio", encode_optional_metric(sheet.sortino_ratio)},
      {"calmar_ratio", encode_optional_metric(sheet.calmar_ratio)},
      {"pnl_drawdown", encode_drawdown(sheet.pnl_drawdown)},
      {"pnl_drawdown_mean", encode_mean_drawdown(sheet.pnl_drawdown_mean)},
      {"pnl_drawdown_max", encode_drawdown(sheet.pnl_drawdown_max)},
      {"win_rate", sheet.win_rate ? Json(sheet.win_rate->value) : Json(nullptr)},
      {"profit_factor",
       sheet.profit_factor ? Json(sheet.profit_factor->value) : Json(nullptr)},
      {"trades", sheet.trades},
      {"positions_closed", sheet.positions_closed}};
}

Json encode_tear_sheet_asset(const TearSheetAsset& sheet) {
  Json balance_end = nullptr;
  if (sheet.balance_end) {
    balance_end = Json{{"total", sheet.balance_end->total},
                       {"free", sheet.balance_end->free},
                       {"used", sheet.balance_end->used()}};
  }
  return Json{{"balance_end", std::move(balance_end)},
              {"rate_of_return", encode_optional_metric(sheet.rate_of_return)},
              {"drawdown", encode_drawdown(sheet.drawdown)},
              {"drawdown_mean", encode_mean_drawdown(sheet.drawdown_mean)},
              {"drawdown_max", encode_drawdown(sheet.drawdown_max)}};
}

}  // namespace

Json encode_trading_summary(const TradingSummary& summary) {
  Json instruments = Json::object();
  for (const auto& [name, sheet] : summary.instruments) {
    instruments[name] = encode_tear_sheet(sheet);
  }
  Json assets = Json::object();
  for (const auto& [key, sheet] : summary.assets) {
    assets[key] = encode_tear_sheet_asset(sheet);
  }
  return Json{{"time_engine_start", encode_time(summary.time_engine_start)},
              {"time_engine_end", encode_time(summary.time_engine_end)},
              {"instruments", std::move(instruments)},
              {"assets", std::move(assets)}};
}

}  // namespace tradeflow
