#pragma once

#include "tradeflow/domain/identifiers.hpp"
#include "tradeflow/domain/order.hpp"
#include "tradeflow/numeric/decimal.hpp"
#include "tradeflow/time/time_utils.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tradeflow {

// -----------------------------------------------------------------------------
// Market event payloads
// -----------------------------------------------------------------------------
// Normalised, exchange-independent market data. Producers (the historic file
// loader, the ZeroMQ gateway, tests) build these; the engine only reads them.
// -----------------------------------------------------------------------------

struct PublicTrade {
  std::string id;
  Decimal price;
  Decimal amount;
  domain::Side side{domain::Side::Buy};
};

struct Level {
  Decimal price;
  Decimal amount;
};

inline bool operator==(const Level& a, const Level& b) {
  return a.price == b.price && a.amount == b.amount;
}

struct OrderBookL1 {
  Timestamp last_update_time{};
  std::optional<Level> best_bid;
  std::optional<Level> best_ask;

  // (bid + ask) / 2 when both sides are present.
  std::optional<Decimal> mid_price() const;
};

struct OrderBook {
  std::uint64_t sequence{0};
  std::optional<Timestamp> time_engine;
  std::vector<Level> bids;
  std::vector<Level> asks;
};

// Snapshot replaces both sides of the book; Update upserts levels and an
// amount of zero deletes the level.
struct OrderBookEvent {
  enum class Type {
    Snapshot,
    Update,
  };

  Type type{Type::Snapshot};
  OrderBook book;
};

struct Candle {
  Timestamp close_time{};
  Decimal open;
  Decimal high;
  Decimal low;
  Decimal close;
  Decimal volume;
  std::uint64_t trade_count{0};
};

struct Liquidation {
  domain::Side side{domain::Side::Buy};
  Decimal price;
  Decimal quantity;
  Timestamp time{};
};

using MarketEventKind =
    std::variant<PublicTrade, OrderBookL1, OrderBookEvent, Candle, Liquidation>;

// "trade", "order_book_l1", "order_book", "candle", "liquidation"
const char* kind_name(const MarketEventKind& kind);

// -----------------------------------------------------------------------------
// MarketEvent
// -----------------------------------------------------------------------------
// One market data item for one catalogue instrument. exchange is the venue
// id; instrument is the catalogue index.
// -----------------------------------------------------------------------------
struct MarketEvent {
  Timestamp time_exchange{};
  Timestamp time_received{};
  domain::ExchangeId exchange{domain::ExchangeId::Other};
  domain::InstrumentIndex instrument{0};
  MarketEventKind kind{PublicTrade{}};
};

// The named exchange's stream dropped; items that follow begin a new session.
struct Reconnecting {
  domain::ExchangeId exchange{domain::ExchangeId::Other};
};

inline bool operator==(const Reconnecting& a, const Reconnecting& b) {
  return a.exchange == b.exchange;
}

using MarketStreamEvent = std::variant<Reconnecting, MarketEvent>;

// A producer-side failure to decode or receive one item.
struct MarketStreamError {
  std::string message;
};

// One record of a historic market data file, or one ZeroMQ message:
// {"Item":{"Ok":<MarketEvent>}} | {"Item":{"Err":"..."}} | {"Reconnecting":ex}
using MarketStreamResult =
    std::variant<Reconnecting, MarketEvent, MarketStreamError>;

}  // namespace tradeflow
