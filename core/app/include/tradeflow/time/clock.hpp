#pragma once

#include "tradeflow/time/time_utils.hpp"

namespace tradeflow {

// -----------------------------------------------------------------------------
// IClock: source of engine time
// -----------------------------------------------------------------------------
//
// @brief  Produces the authoritative "engine time" stamped into every audit
//         context and handed to strategy/risk.
//
// @details
// The engine never reads std::chrono directly. It asks the injected clock:
//   - LiveClock       → wall-clock UTC.
//   - HistoricalClock → seeded with the first market item's time_exchange,
//                       then follows the time_exchange of each market item
//                       the engine processes.
//
// The engine calls observe_market_time() once per market item, before it
// reads time_engine() for that event's context. Only the historical clock
// cares.
//
// Thread-safety contract: time_engine() may be called from any thread (the
// mock execution client stamps fills with it). Implementations synchronise
// internally.
//
// Ownership: shared (std::shared_ptr) between the engine and any execution
// client that needs timestamps.
// -----------------------------------------------------------------------------
class IClock {
 public:
  virtual ~IClock() = default;

  virtual Timestamp time_engine() const = 0;

  virtual void observe_market_time(Timestamp /*time_exchange*/) {}
};

}  // namespace tradeflow
