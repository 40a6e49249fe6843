#pragma once

#include "tradeflow/numeric/decimal.hpp"
#include "tradeflow/time/time_utils.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace tradeflow {

// -----------------------------------------------------------------------------
// Drawdown: one peak-to-recovery excursion of a value curve
// -----------------------------------------------------------------------------
// value is the deepest decline relative to the peak, (peak - trough) / |peak|,
// so it is positive. time_start is the time of the peak, time_end the time of
// the last point seen inside the excursion (the recovery point once it has
// ended).
// -----------------------------------------------------------------------------
struct Drawdown {
  Decimal value;
  Timestamp time_start{};
  Timestamp time_end{};

  Duration duration() const { return time_end - time_start; }
};

inline bool operator==(const Drawdown& a, const Drawdown& b) {
  return a.value == b.value && a.time_start == b.time_start &&
         a.time_end == b.time_end;
}

// Mean depth and mean duration of completed drawdowns.
struct MeanDrawdown {
  Decimal mean_value;
  Duration mean_duration{};
};

struct TimedValue {
  Timestamp time{};
  Decimal value;
};

// -----------------------------------------------------------------------------
// DrawdownGenerator
// -----------------------------------------------------------------------------
//
// @brief  Follows a value curve point by point and reports each drawdown
//         when the curve recovers above its previous peak.
//
// @details
//   first point          → becomes the peak
//   value > peak         → the running drawdown (if any) ends and is
//                          returned; the point becomes the new peak
//   otherwise            → the decline (peak - value) / |peak| updates the
//                          running drawdown depth
//
// A zero peak has no relative scale; points under it do not deepen the
// running drawdown.
//
// generate() returns the drawdown still in progress, if any.
// -----------------------------------------------------------------------------
class DrawdownGenerator {
 public:
  std::optional<Drawdown> update(const TimedValue& point);
  std::optional<Drawdown> generate() const;

 private:
  std::optional<Decimal> peak_;
  Timestamp time_peak_{};
  Timestamp time_now_{};
  Decimal drawdown_max_;
};

// Keeps the deepest drawdown seen.
class MaxDrawdownGenerator {
 public:
  void update(const Drawdown& drawdown);
  const std::optional<Drawdown>& generate() const { return max_; }

 private:
  std::optional<Drawdown> max_;
};

// Running mean of drawdown depth and duration.
class MeanDrawdownGenerator {
 public:
  void update(const Drawdown& drawdown);
  std::optional<MeanDrawdown> generate() const;

 private:
  std::uint64_t count_{0};
  Decimal mean_value_;
  Decimal mean_duration_ns_;
};

// Completed drawdowns of a whole curve, in time order.
std::vector<Drawdown> generate_drawdown_series(const std::vector<TimedValue>& points);

std::optional<Drawdown> calculate_max_drawdown(const std::vector<TimedValue>& points);

std::optional<MeanDrawdown> calculate_mean_drawdown(
    const std::vector<TimedValue>& points);

}  // namespace tradeflow
