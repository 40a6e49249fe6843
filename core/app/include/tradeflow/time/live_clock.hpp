#pragma once

#include "tradeflow/time/clock.hpp"

namespace tradeflow {

// Wall-clock engine time for live and paper trading.
class LiveClock final : public IClock {
 public:
  Timestamp time_engine() const override;
};

}  // namespace tradeflow
