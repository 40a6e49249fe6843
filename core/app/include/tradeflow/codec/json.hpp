#pragma once

#include "tradeflow/audit/audit.hpp"
#include "tradeflow/domain/balance.hpp"
#include "tradeflow/domain/identifiers.hpp"
#include "tradeflow/domain/instrument.hpp"
#include "tradeflow/domain/order.hpp"
#include "tradeflow/domain/position.hpp"
#include "tradeflow/domain/risk_limits.hpp"
#include "tradeflow/domain/trade.hpp"
#include "tradeflow/events/account_event.hpp"
#include "tradeflow/events/command.hpp"
#include "tradeflow/events/engine_event.hpp"
#include "tradeflow/events/market_event.hpp"
#include "tradeflow/instrument/instrument_filter.hpp"
#include "tradeflow/numeric/decimal.hpp"
#include "tradeflow/state/engine_state.hpp"
#include "tradeflow/statistic/trading_summary.hpp"
#include "tradeflow/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tradeflow {

using Json = nlohmann::json;

// -----------------------------------------------------------------------------
// JSON codec
// -----------------------------------------------------------------------------
//
// @brief  nlohmann::json conversions for every type that crosses a process
//         boundary: engine events, market data files, audit ticks, engine
//         state dumps, trading summaries and configuration.
//
// @details
// Conventions:
//   - Decimals are written as strings ("100.5") and read from strings or
//     JSON numbers.
//   - Timestamps are RFC 3339 UTC strings; integers are read as epoch ms.
//   - Enums that carry data are externally tagged ({"Item": ...}); unit
//     variants are bare strings ("Shutdown").
//   - Absent optionals are written as null and read from null or a
//     missing key.
//
// Struct types get ADL to_json/from_json overloads so Json::get<T>() works.
// The std::variant aliases (EngineEvent, OrderState, ...) have named
// encode_/decode_ functions instead.
//
// Decoding failures surface as ValidationError. The parse_* entry points
// also convert nlohmann's own exceptions into ValidationError.
// -----------------------------------------------------------------------------

// --- Scalars -----------------------------------------------------------------
void to_json(Json& j, const Decimal& value);
void from_json(const Json& j, Decimal& value);

Json encode_time(Timestamp time);
Timestamp decode_time(const Json& j);

namespace detail {

template <typename T>
Json optional_json(const std::optional<T>& value) {
  return value ? Json(*value) : Json(nullptr);
}

inline Json optional_time(const std::optional<Timestamp>& value) {
  return value ? encode_time(*value) : Json(nullptr);
}

template <typename T>
std::optional<T> optional_field(const Json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->template get<T>();
}

std::optional<Timestamp> optional_time_field(const Json& j, const char* key);

// Splits an externally tagged value into (tag, payload). A bare string has
// no payload. Throws ValidationError for any other shape.
std::pair<std::string, const Json*> tagged(const Json& j, const char* what);

// Exact tag comparison: only the canonical spelling the encoders write.
bool tag_is(const std::string& tag, const char* expected);

// Payload of a tagged value; throws ValidationError for a bare tag.
const Json& payload_of(const std::pair<std::string, const Json*>& tagged,
                       const char* what);

[[noreturn]] void unknown_tag(const char* what, const std::string& tag);

}  // namespace detail

namespace domain {

template <typename Tag>
void to_json(Json& j, const StringId<Tag>& id) {
  j = id.str();
}

template <typename Tag>
void from_json(const Json& j, StringId<Tag>& id) {
  id = StringId<Tag>(j.get<std::string>());
}

void to_json(Json& j, ExchangeId exchange);
void from_json(const Json& j, ExchangeId& exchange);
void to_json(Json& j, Side side);
void from_json(const Json& j, Side& side);
void to_json(Json& j, OrderKind kind);
void from_json(const Json& j, OrderKind& kind);
void to_json(Json& j, const TimeInForce& tif);
void from_json(const Json& j, TimeInForce& tif);
void to_json(Json& j, const OrderKey& key);
void from_json(const Json& j, OrderKey& key);
void to_json(Json& j, const OrderRequestOpen& request);
void from_json(const Json& j, OrderRequestOpen& request);
void to_json(Json& j, const OrderRequestCancel& request);
void from_json(const Json& j, OrderRequestCancel& request);
void to_json(Json& j, const Open& open);
void from_json(const Json& j, Open& open);
void to_json(Json& j, const OrderSnapshot& order);
void from_json(const Json& j, OrderSnapshot& order);
void to_json(Json& j, const Balance& balance);
void from_json(const Json& j, Balance& balance);
void to_json(Json& j, const AssetBalance& balance);
void from_json(const Json& j, AssetBalance& balance);
void to_json(Json& j, const AssetFees& fees);
void from_json(const Json& j, AssetFees& fees);
void to_json(Json& j, const Trade& trade);
void from_json(const Json& j, Trade& trade);
void to_json(Json& j, const Position& position);
void to_json(Json& j, const ClosedPosition& position);
void from_json(const Json& j, ClosedPosition& position);
void to_json(Json& j, const Underlying& underlying);
void from_json(const Json& j, Underlying& underlying);
void to_json(Json& j, const InstrumentSpec& spec);
void from_json(const Json& j, InstrumentSpec& spec);
void to_json(Json& j, const InstrumentConfig& config);
void from_json(const Json& j, InstrumentConfig& config);
void to_json(Json& j, const RiskLimits& limits);
void from_json(const Json& j, RiskLimits& limits);
void to_json(Json& j, const RiskConfiguration& config);

}  // namespace domain

// --- Market / account / control ------------------------------------------------
void to_json(Json& j, const PublicTrade& trade);
void from_json(const Json& j, PublicTrade& trade);
void to_json(Json& j, const Level& level);
void from_json(const Json& j, Level& level);
void to_json(Json& j, const OrderBookL1& book);
void from_json(const Json& j, OrderBookL1& book);
void to_json(Json& j, const OrderBook& book);
void from_json(const Json& j, OrderBook& book);
void to_json(Json& j, const Candle& candle);
void from_json(const Json& j, Candle& candle);
void to_json(Json& j, const Liquidation& liquidation);
void from_json(const Json& j, Liquidation& liquidation);
void to_json(Json& j, const MarketEvent& event);
void from_json(const Json& j, MarketEvent& event);
void to_json(Json& j, const InstrumentAccountSnapshot& snapshot);
void from_json(const Json& j, InstrumentAccountSnapshot& snapshot);
void to_json(Json& j, const AccountSnapshot& snapshot);
void from_json(const Json& j, AccountSnapshot& snapshot);
void to_json(Json& j, const OrderCancelled& cancelled);
void from_json(const Json& j, OrderCancelled& cancelled);
void to_json(Json& j, const AccountEvent& event);
void from_json(const Json& j, AccountEvent& event);
void to_json(Json& j, const InstrumentFilter& filter);
void from_json(const Json& j, InstrumentFilter& filter);
void to_json(Json& j, TradingState state);
void from_json(const Json& j, TradingState& state);

// --- Variant aliases -----------------------------------------------------------
Json encode_order_state(const domain::OrderState& state);
domain::OrderState decode_order_state(const Json& j);

Json encode_order_request(const OrderRequest& request);
OrderRequest decode_order_request(const Json& j);

Json encode_command(const Command& command);
Command decode_command(const Json& j);

Json encode_account_stream_event(const AccountStreamEvent& event);
AccountStreamEvent decode_account_stream_event(const Json& j);

Json encode_market_stream_event(const MarketStreamEvent& event);
MarketStreamEvent decode_market_stream_event(const Json& j);

Json encode_market_stream_result(const MarketStreamResult& result);
MarketStreamResult decode_market_stream_result(const Json& j);

Json encode_engine_event(const EngineEvent& event);
EngineEvent decode_engine_event(const Json& j);

// --- Reports (write only) ------------------------------------------------------
Json encode_engine_error(const EngineError& error);
Json encode_engine_output(const EngineOutput& output);
Json encode_state(const EngineState& state);
Json encode_audit_tick(const AuditTick& tick);
Json encode_trading_summary(const TradingSummary& summary);

// --- Text entry points ---------------------------------------------------------
// Each throws ValidationError for malformed text or a malformed shape.
EngineEvent parse_engine_event(std::string_view text);
MarketStreamResult parse_market_stream_result(std::string_view text);
std::vector<MarketStreamResult> parse_market_stream_results(std::string_view text);

}  // namespace tradeflow
