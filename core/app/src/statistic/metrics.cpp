#include "tradeflow/statistic/metrics.hpp"

#include <chrono>
#include <cstdint>

namespace tradeflow {

namespace {

Decimal sqrt_ratio(const TimeInterval& source, const TimeInterval& target) {
  // interval_ratio is never negative, so sqrt() always has a value.
  return interval_ratio(source, target).sqrt().value_or(Decimal{1});
}

std::optional<Decimal> excess_over(const Decimal& risk_free_return,
                                   const Decimal& mean_return,
                                   const Decimal& denominator) {
  if (denominator.is_zero()) {
    return std::nullopt;
  }
  return (mean_return - risk_free_return) / denominator;
}

}  // namespace

Decimal interval_ratio(const TimeInterval& source, const TimeInterval& target) {
  using std::chrono::nanoseconds;
  const std::int64_t from =
      std::chrono::duration_cast<nanoseconds>(source.duration()).count();
  const std::int64_t to =
      std::chrono::duration_cast<nanoseconds>(target.duration()).count();
  if (from == 0) {
    return Decimal{1};
  }
  return Decimal{to} / Decimal{from};
}

RateOfReturn RateOfReturn::calculate(const Decimal& mean_return,
                                     TimeInterval interval) {
  return RateOfReturn{mean_return, interval};
}

RateOfReturn RateOfReturn::scale(const TimeInterval& target) const {
  return RateOfReturn{value * interval_ratio(interval, target), target};
}

std::optional<SharpeRatio> SharpeRatio::calculate(const Decimal& risk_free_return,
                                                  const Decimal& mean_return,
                                                  const Decimal& std_dev_returns,
                                                  TimeInterval interval) {
  auto value = excess_over(risk_free_return, mean_return, std_dev_returns);
  if (!value) {
    return std::nullopt;
  }
  return SharpeRatio{*value, interval};
}

SharpeRatio SharpeRatio::scale(const TimeInterval& target) const {
  return SharpeRatio{value * sqrt_ratio(interval, target), target};
}

std::optional<SortinoRatio> SortinoRatio::calculate(
    const Decimal& risk_free_return, const Decimal& mean_return,
    const Decimal& std_dev_loss_returns, TimeInterval interval) {
  auto value = excess_over(risk_free_return, mean_return, std_dev_loss_returns);
  if (!value) {
    return std::nullopt;
  }
  return SortinoRatio{*value, interval};
}

SortinoRatio SortinoRatio::scale(const TimeInterval& target) const {
  return SortinoRatio{value * sqrt_ratio(interval, target), target};
}

std::optional<CalmarRatio> CalmarRatio::calculate(const Decimal& risk_free_return,
                                                  const Decimal& mean_return,
                                                  const Decimal& max_drawdown,
                                                  TimeInterval interval) {
  auto value = excess_over(risk_free_return, mean_return, max_drawdown.abs());
  if (!value) {
    return std::nullopt;
  }
  return CalmarRatio{*value, interval};
}

CalmarRatio CalmarRatio::scale(const TimeInterval& target) const {
  return CalmarRatio{value * sqrt_ratio(interval, target), target};
}

std::optional<ProfitFactor> ProfitFactor::calculate(const Decimal& profits_gross_abs,
                                                    const Decimal& losses_gross_abs) {
  if (losses_gross_abs.is_zero()) {
    return std::nullopt;
  }
  return ProfitFactor{profits_gross_abs.abs() / losses_gross_abs.abs()};
}

std::optional<WinRate> WinRate::calculate(const Decimal& wins, const Decimal& total) {
  if (total.is_zero()) {
    return std::nullopt;
  }
  return WinRate{wins.abs() / total.abs()};
}

}  // namespace tradeflow
