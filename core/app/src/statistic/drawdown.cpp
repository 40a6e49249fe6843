#include "tradeflow/statistic/drawdown.hpp"

#include <chrono>

namespace tradeflow {

// -----------------------------------------------------------------------------
// DrawdownGenerator
// -----------------------------------------------------------------------------
std::optional<Drawdown> DrawdownGenerator::update(const TimedValue& point) {
  if (!peak_) {
    peak_ = point.value;
    time_peak_ = point.time;
    time_now_ = point.time;
    return std::nullopt;
  }

  time_now_ = point.time;

  if (point.value > *peak_) {
    std::optional<Drawdown> ended = generate();
    peak_ = point.value;
    time_peak_ = point.time;
    drawdown_max_ = Decimal{0};
    return ended;
  }

  if (!peak_->is_zero()) {
    const Decimal drawdown = (*peak_ - point.value) / peak_->abs();
    if (drawdown > drawdown_max_) {
      drawdown_max_ = drawdown;
    }
  }
  return std::nullopt;
}

std::optional<Drawdown> DrawdownGenerator::generate() const {
  if (drawdown_max_.is_zero()) {
    return std::nullopt;
  }
  return Drawdown{drawdown_max_, time_peak_, time_now_};
}

// -----------------------------------------------------------------------------
// MaxDrawdownGenerator / MeanDrawdownGenerator
// -----------------------------------------------------------------------------
void MaxDrawdownGenerator::update(const Drawdown& drawdown) {
  if (!max_ || drawdown.value.abs() > max_->value.abs()) {
    max_ = drawdown;
  }
}

void MeanDrawdownGenerator::update(const Drawdown& drawdown) {
  ++count_;
  const Decimal count{static_cast<std::int64_t>(count_)};
  const Decimal duration_ns{static_cast<std::int64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(drawdown.duration())
          .count())};
  mean_value_ += (drawdown.value - mean_value_) / count;
  mean_duration_ns_ += (duration_ns - mean_duration_ns_) / count;
}

std::optional<MeanDrawdown> MeanDrawdownGenerator::generate() const {
  if (count_ == 0) {
    return std::nullopt;
  }
  const auto nanos =
      static_cast<std::int64_t>(mean_duration_ns_.round_dp(0).mantissa());
  return MeanDrawdown{
      mean_value_,
      std::chrono::duration_cast<Duration>(std::chrono::nanoseconds(nanos))};
}

// -----------------------------------------------------------------------------
// Whole-curve helpers
// -----------------------------------------------------------------------------
std::vector<Drawdown> generate_drawdown_series(const std::vector<TimedValue>& points) {
  DrawdownGenerator generator;
  std::vector<Drawdown> series;
  for (const auto& point : points) {
    if (auto drawdown = generator.update(point)) {
      series.push_back(*drawdown);
    }
  }
  return series;
}

std::optional<Drawdown> calculate_max_drawdown(const std::vector<TimedValue>& points) {
  MaxDrawdownGenerator max;
  for (const auto& drawdown : generate_drawdown_series(points)) {
    max.update(drawdown);
  }
  return max.generate();
}

std::optional<MeanDrawdown> calculate_mean_drawdown(
    const std::vector<TimedValue>& points) {
  MeanDrawdownGenerator mean;
  for (const auto& drawdown : generate_drawdown_series(points)) {
    mean.update(drawdown);
  }
  return mean.generate();
}

}  // namespace tradeflow
