#pragma once

#include "tradeflow/time/clock.hpp"

#include <atomic>
#include <cstdint>

namespace tradeflow {

// -----------------------------------------------------------------------------
// HistoricalClock: event-driven clock for backtesting
// -----------------------------------------------------------------------------
//
// @brief  IClock whose "now" is the exchange time of the market item being
//         processed.
//
// @details
// Seeded with the time_exchange of the first market item in the data set.
// Afterwards observe_market_time() moves it forward; an item older than the
// current time leaves it untouched, so engine time never goes backwards even
// if the merged feed interleaves exchanges slightly out of order.
//
// Identical data therefore yields identical engine timestamps across runs,
// which is what makes backtest summaries byte-reproducible.
//
// Internal storage: nanoseconds since epoch in a std::atomic, so the mock
// execution thread can read it while the engine thread advances it.
// -----------------------------------------------------------------------------
class HistoricalClock final : public IClock {
 public:
  explicit HistoricalClock(Timestamp seed);

  Timestamp time_engine() const override;

  void observe_market_time(Timestamp time_exchange) override;

 private:
  std::atomic<std::int64_t> current_ns_;
};

}  // namespace tradeflow
