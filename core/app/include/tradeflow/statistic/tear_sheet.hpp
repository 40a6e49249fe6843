#pragma once

#include "tradeflow/domain/balance.hpp"
#include "tradeflow/domain/position.hpp"
#include "tradeflow/numeric/decimal.hpp"
#include "tradeflow/statistic/drawdown.hpp"
#include "tradeflow/statistic/metrics.hpp"
#include "tradeflow/statistic/time_interval.hpp"
#include "tradeflow/statistic/welford.hpp"

#include <cstdint>
#include <optional>

namespace tradeflow {

// -----------------------------------------------------------------------------
// TearSheet: per-instrument performance report
// -----------------------------------------------------------------------------
// pnl                realised PnL of every closed position
// pnl_return         mean closed-position return, as a rate of return
// sharpe/sortino     absent without variance (or without losing positions)
// calmar             absent without a drawdown
// pnl_drawdown*      drawdowns of the cumulative PnL curve; the current
//                    (unfinished) drawdown counts towards mean and max
// win_rate           wins / (wins + losses), absent with neither
// profit_factor      Σ gains / |Σ losses|, absent without losses
// trades             fills seen
// positions_closed   closed positions seen
// -----------------------------------------------------------------------------
struct TearSheet {
  Decimal pnl;
  RateOfReturn pnl_return;
  std::optional<SharpeRatio> sharpe_ratio;
  std::optional<SortinoRatio> sortino_ratio;
  std::optional<CalmarRatio> calmar_ratio;
  std::optional<Drawdown> pnl_drawdown;
  std::optional<MeanDrawdown> pnl_drawdown_mean;
  std::optional<Drawdown> pnl_drawdown_max;
  std::optional<WinRate> win_rate;
  std::optional<ProfitFactor> profit_factor;
  std::uint64_t trades{0};
  std::uint64_t positions_closed{0};
};

// -----------------------------------------------------------------------------
// TearSheetGenerator: online accumulator behind TearSheet
// -----------------------------------------------------------------------------
//
// @brief  Updated once per closed position and once per fill; produces a
//         TearSheet on demand without consuming its state.
//
// @details
// Ratios are first computed over the trading period (engine start to now)
// and then scaled to the requested interval: rate of return linearly,
// Sharpe/Sortino/Calmar by the square root of the duration ratio.
// -----------------------------------------------------------------------------
class TearSheetGenerator {
 public:
  void update_from_position(const domain::ClosedPosition& position);
  void update_from_trade() { ++trades_; }

  TearSheet generate(const Decimal& risk_free_return,
                     const TimeInterval& trading_period,
                     const TimeInterval& interval) const;

 private:
  Decimal pnl_;
  Welford pnl_returns_;
  Welford loss_returns_;
  DrawdownGenerator pnl_drawdown_;
  MeanDrawdownGenerator pnl_drawdown_mean_;
  MaxDrawdownGenerator pnl_drawdown_max_;
  std::uint64_t wins_{0};
  std::uint64_t losses_{0};
  Decimal profits_gross_;
  Decimal losses_gross_abs_;
  std::uint64_t trades_{0};
  std::uint64_t positions_closed_{0};
};

// -----------------------------------------------------------------------------
// TearSheetAsset: per-asset balance report
// -----------------------------------------------------------------------------
// rate_of_return is (end.total - start.total) / start.total over the trading
// period, scaled linearly; absent when the starting total is zero.
// Drawdowns follow the total balance.
// -----------------------------------------------------------------------------
struct TearSheetAsset {
  std::optional<domain::Balance> balance_end;
  std::optional<RateOfReturn> rate_of_return;
  std::optional<Drawdown> drawdown;
  std::optional<MeanDrawdown> drawdown_mean;
  std::optional<Drawdown> drawdown_max;
};

class TearSheetAssetGenerator {
 public:
  void update_from_balance(const domain::Balance& balance, Timestamp time);

  TearSheetAsset generate(const TimeInterval& trading_period,
                          const TimeInterval& interval) const;

 private:
  std::optional<domain::Balance> balance_start_;
  std::optional<domain::Balance> balance_end_;
  DrawdownGenerator drawdown_;
  MeanDrawdownGenerator drawdown_mean_;
  MaxDrawdownGenerator drawdown_max_;
};

}  // namespace tradeflow
