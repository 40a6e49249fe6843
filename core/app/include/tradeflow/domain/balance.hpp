#pragma once

#include "tradeflow/domain/identifiers.hpp"
#include "tradeflow/numeric/decimal.hpp"
#include "tradeflow/time/time_utils.hpp"

namespace tradeflow {
namespace domain {

// -----------------------------------------------------------------------------
// Balance: holdings of one asset on one exchange
// -----------------------------------------------------------------------------
//
// @brief  total and free amounts, with used = total - free.
//
// @details
// Invariant: 0 <= free <= total. make() and validate() throw ValidationError
// when it does not hold; the engine only ever stores validated balances.
// -----------------------------------------------------------------------------
struct Balance {
  Decimal total;
  Decimal free;

  static Balance make(Decimal total, Decimal free);

  Decimal used() const { return total - free; }

  void validate() const;
};

inline bool operator==(const Balance& a, const Balance& b) {
  return a.total == b.total && a.free == b.free;
}
inline bool operator!=(const Balance& a, const Balance& b) { return !(a == b); }

struct AssetBalance {
  AssetIndex asset{0};
  Balance balance;
  Timestamp time_exchange{};
};

}  // namespace domain
}  // namespace tradeflow
