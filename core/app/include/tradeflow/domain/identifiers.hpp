#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace tradeflow {
namespace domain {

// -----------------------------------------------------------------------------
// ExchangeId
// -----------------------------------------------------------------------------
// Closed set of venues. The canonical string form is snake_case
// ("binance_spot", "kraken", "mock"); parse_exchange_id() is the only way a
// string becomes an ExchangeId and it rejects anything unknown.
// -----------------------------------------------------------------------------
enum class ExchangeId {
  Other,
  Simulated,
  Mock,
  BinanceFuturesCoin,
  BinanceFuturesUsd,
  BinanceOptions,
  BinancePortfolioMargin,
  BinanceSpot,
  BinanceUs,
  Bitazza,
  Bitfinex,
  Bitflyer,
  Bitget,
  Bitmart,
  BitmartFuturesUsd,
  Bitmex,
  Bitso,
  Bitstamp,
  Bitvavo,
  Bithumb,
  BybitPerpetualsUsd,
  BybitSpot,
  Cexio,
  Coinbase,
  CoinbaseInternational,
  Cryptocom,
  Deribit,
  GateioFuturesBtc,
  GateioFuturesUsd,
  GateioOptions,
  GateioPerpetualsBtc,
  GateioPerpetualsUsd,
  GateioSpot,
  Gemini,
  Hitbtc,
  Htx,
  Kraken,
  Kucoin,
  Liquid,
  Mexc,
  Okx,
  Poloniex,
};

const char* to_string(ExchangeId exchange);
std::optional<ExchangeId> try_parse_exchange_id(std::string_view text);
// Throws ValidationError for unknown identifiers.
ExchangeId parse_exchange_id(std::string_view text);

inline std::ostream& operator<<(std::ostream& out, ExchangeId exchange) {
  return out << to_string(exchange);
}

// Dense indices assigned once by IndexedInstruments, in definition order.
using ExchangeIndex = std::size_t;
using AssetIndex = std::size_t;
using InstrumentIndex = std::size_t;

// Labels every processed engine event; strictly increasing.
using Sequence = std::uint64_t;

// -----------------------------------------------------------------------------
// StringId<Tag>
// -----------------------------------------------------------------------------
// Short opaque identifier. The Tag keeps StrategyId, ClientOrderId, OrderId
// and TradeId from being mixed up at call sites.
//
// The explicit constructor rejects empty strings (ValidationError). The
// default constructor exists only so aggregate types can be declared before
// they are filled in; a default-constructed id is empty and never produced by
// decoding or by the engine.
// -----------------------------------------------------------------------------
template <typename Tag>
class StringId {
 public:
  StringId() = default;
  explicit StringId(std::string value);

  const std::string& str() const { return value_; }
  bool empty() const { return value_.empty(); }

  friend bool operator==(const StringId& a, const StringId& b) {
    return a.value_ == b.value_;
  }
  friend bool operator!=(const StringId& a, const StringId& b) {
    return a.value_ != b.value_;
  }
  friend bool operator<(const StringId& a, const StringId& b) {
    return a.value_ < b.value_;
  }
  friend std::ostream& operator<<(std::ostream& out, const StringId& id) {
    return out << id.value_;
  }

 private:
  std::string value_;
};

// Throws ValidationError naming the id kind.
void ensure_non_empty_id(const std::string& value, const char* kind);

template <typename Tag>
StringId<Tag>::StringId(std::string value) : value_(std::move(value)) {
  ensure_non_empty_id(value_, Tag::kName);
}

struct StrategyIdTag {
  static constexpr const char* kName = "StrategyId";
};
struct ClientOrderIdTag {
  static constexpr const char* kName = "ClientOrderId";
};
struct OrderIdTag {
  static constexpr const char* kName = "OrderId";
};
struct TradeIdTag {
  static constexpr const char* kName = "TradeId";
};

using StrategyId = StringId<StrategyIdTag>;
using ClientOrderId = StringId<ClientOrderIdTag>;
using OrderId = StringId<OrderIdTag>;
using TradeId = StringId<TradeIdTag>;

// 20 random alphanumeric characters; used when a request does not name its
// own ClientOrderId.
ClientOrderId random_client_order_id();

}  // namespace domain
}  // namespace tradeflow
