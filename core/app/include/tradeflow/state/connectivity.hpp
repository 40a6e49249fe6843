#pragma once

namespace tradeflow {

enum class Health {
  Healthy,
  Reconnecting,
};

const char* to_string(Health health);

// -----------------------------------------------------------------------------
// ConnectivityState: health of one exchange's market and account streams
// -----------------------------------------------------------------------------
//   Healthy ──Reconnecting event──► Reconnecting ──next Item──► Healthy
//
// Both streams start Healthy. The exchange counts as healthy only when both
// are.
// -----------------------------------------------------------------------------
struct ConnectivityState {
  Health market{Health::Healthy};
  Health account{Health::Healthy};

  bool healthy() const {
    return market == Health::Healthy && account == Health::Healthy;
  }
};

inline bool operator==(const ConnectivityState& a, const ConnectivityState& b) {
  return a.market == b.market && a.account == b.account;
}

}  // namespace tradeflow
