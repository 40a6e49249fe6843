#include "tradeflow/time/historical_clock.hpp"
#include "tradeflow/time/live_clock.hpp"

#include <chrono>

namespace tradeflow {

Timestamp LiveClock::time_engine() const {
  return std::chrono::system_clock::now();
}

HistoricalClock::HistoricalClock(Timestamp seed)
    : current_ns_(timestamp_to_ns(seed)) {}

Timestamp HistoricalClock::time_engine() const {
  return ns_to_timestamp(current_ns_.load());
}

void HistoricalClock::observe_market_time(Timestamp time_exchange) {
  const std::int64_t candidate = timestamp_to_ns(time_exchange);
  std::int64_t current = current_ns_.load();
  // Monotonic under concurrent writers.
  while (candidate > current &&
         !current_ns_.compare_exchange_weak(current, candidate)) {
  }
}

}  // namespace tradeflow
