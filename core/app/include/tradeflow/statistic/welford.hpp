#pragma once

#include "tradeflow/numeric/decimal.hpp"

#include <cstdint>
#include <optional>

namespace tradeflow {

// -----------------------------------------------------------------------------
// Welford: online mean and population variance
// -----------------------------------------------------------------------------
// Numerically stable single-pass update:
//   mean_k = mean_{k-1} + (x - mean_{k-1}) / k
//   m2_k   = m2_{k-1}   + (x - mean_{k-1}) * (x - mean_k)
// variance() = m2 / count (population). std_dev() is absent for an empty
// sample.
// -----------------------------------------------------------------------------
class Welford {
 public:
  void update(const Decimal& value) {
    ++count_;
    const Decimal delta = value - mean_;
    mean_ += delta / Decimal{static_cast<std::int64_t>(count_)};
    m2_ += delta * (value - mean_);
  }

  std::uint64_t count() const { return count_; }
  const Decimal& mean() const { return mean_; }

  Decimal variance() const {
    if (count_ == 0) {
      return Decimal{0};
    }
    return m2_ / Decimal{static_cast<std::int64_t>(count_)};
  }

  std::optional<Decimal> std_dev() const {
    if (count_ == 0) {
      return std::nullopt;
    }
    return variance().sqrt();
  }

 private:
  std::uint64_t count_{0};
  Decimal mean_;
  Decimal m2_;
};

}  // namespace tradeflow
