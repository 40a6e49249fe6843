#pragma once

#include "tradeflow/domain/balance.hpp"
#include "tradeflow/domain/identifiers.hpp"
#include "tradeflow/time/time_utils.hpp"

#include <optional>
#include <string>

namespace tradeflow {

// -----------------------------------------------------------------------------
// AssetState: latest known balance of one catalogue asset
// -----------------------------------------------------------------------------
// update() applies a balance only when its time_exchange is strictly newer
// than the stored one; stale or repeated snapshots are ignored and update()
// returns false. An asset that has never seen a snapshot accepts any time.
// -----------------------------------------------------------------------------
struct AssetState {
  domain::AssetIndex asset{0};
  domain::ExchangeIndex exchange{0};
  std::string name;
  domain::Balance balance;
  std::optional<Timestamp> time_exchange;

  bool update(const domain::Balance& next, Timestamp time) {
    if (time_exchange && time <= *time_exchange) {
      return false;
    }
    balance = next;
    time_exchange = time;
    return true;
  }
};

}  // namespace tradeflow
