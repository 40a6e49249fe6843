#include "tradeflow/domain/balance.hpp"

#include "tradeflow/common/error.hpp"

namespace tradeflow {
namespace domain {

Balance Balance::make(Decimal total, Decimal free) {
  Balance balance{total, free};
  balance.validate();
  return balance;
}

void Balance::validate() const {
  if (total.is_negative()) {
    throw ValidationError("balance total must not be negative, received " +
                          total.to_string());
  }
  if (free.is_negative()) {
    throw ValidationError("balance free must not be negative, received " +
                          free.to_string());
  }
  if (free > total) {
    throw ValidationError("balance free " + free.to_string() +
                          " exceeds total " + total.to_string());
  }
}

}  // namespace domain
}  // namespace tradeflow
