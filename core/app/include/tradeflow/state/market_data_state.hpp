#pragma once

#include "tradeflow/events/market_event.hpp"
#include "tradeflow/numeric/decimal.hpp"
#include "tradeflow/time/time_utils.hpp"

#include <functional>
#include <map>
#include <optional>

namespace tradeflow {

// -----------------------------------------------------------------------------
// MarketDataState: per-instrument view of the market
// -----------------------------------------------------------------------------
//
// @brief  Last traded / mid price plus a price-level book and the latest
//         candle.
//
// @details
// last_price follows, in event order:
//   - PublicTrade        → trade price
//   - OrderBookL1        → mid when both sides are present
//   - OrderBook          → mid of the maintained book when both sides exist
//   - Candle             → close
// Liquidations only move time_last_update.
//
// bids are ordered best (highest) first, asks best (lowest) first.
// -----------------------------------------------------------------------------
struct MarketDataState {
  std::optional<Decimal> last_price;
  std::optional<Timestamp> time_last_update;
  std::map<Decimal, Decimal, std::greater<Decimal>> bids;
  std::map<Decimal, Decimal> asks;
  std::optional<Candle> last_candle;

  void apply(const MarketEvent& event);

  std::optional<Decimal> book_mid_price() const;
};

}  // namespace tradeflow
