#pragma once

#include "tradeflow/numeric/decimal.hpp"
#include "tradeflow/statistic/time_interval.hpp"

#include <optional>

namespace tradeflow {

// -----------------------------------------------------------------------------
// Ratio metrics
// -----------------------------------------------------------------------------
//
// @brief  Return and risk-adjusted-return ratios, each tagged with the
//         interval its value is expressed over.
//
// @details
//   RateOfReturn  = mean_return                          scales linearly
//   SharpeRatio   = (mean - rf) / std_dev(returns)       scales by sqrt
//   SortinoRatio  = (mean - rf) / std_dev(loss returns)  scales by sqrt
//   CalmarRatio   = (mean - rf) / |max_drawdown|         scales by sqrt
//
// A zero denominator makes Sharpe, Sortino and Calmar absent.
//
// scale(target) converts to another interval using the ratio
// target.duration / interval.duration. A zero-length source interval leaves
// the value as it is.
//
// Everything is decimal apart from the square root.
// -----------------------------------------------------------------------------

struct RateOfReturn {
  Decimal value;
  TimeInterval interval;

  static RateOfReturn calculate(const Decimal& mean_return, TimeInterval interval);
  RateOfReturn scale(const TimeInterval& target) const;
};

struct SharpeRatio {
  Decimal value;
  TimeInterval interval;

  static std::optional<SharpeRatio> calculate(const Decimal& risk_free_return,
                                              const Decimal& mean_return,
                                              const Decimal& std_dev_returns,
                                              TimeInterval interval);
  SharpeRatio scale(const TimeInterval& target) const;
};

struct SortinoRatio {
  Decimal value;
  TimeInterval interval;

  static std::optional<SortinoRatio> calculate(const Decimal& risk_free_return,
                                               const Decimal& mean_return,
                                               const Decimal& std_dev_loss_returns,
                                               TimeInterval interval);
  SortinoRatio scale(const TimeInterval& target) const;
};

struct CalmarRatio {
  Decimal value;
  TimeInterval interval;

  static std::optional<CalmarRatio> calculate(const Decimal& risk_free_return,
                                              const Decimal& mean_return,
                                              const Decimal& max_drawdown,
                                              TimeInterval interval);
  CalmarRatio scale(const TimeInterval& target) const;
};

// Σ profits / |Σ losses|. Absent when there are no losses.
struct ProfitFactor {
  Decimal value;

  static std::optional<ProfitFactor> calculate(const Decimal& profits_gross_abs,
                                               const Decimal& losses_gross_abs);
};

// wins / total. Absent when total is zero.
struct WinRate {
  Decimal value;

  static std::optional<WinRate> calculate(const Decimal& wins, const Decimal& total);
};

// target / source as a decimal; 1 when the source interval has zero length.
Decimal interval_ratio(const TimeInterval& source, const TimeInterval& target);

}  // namespace tradeflow
