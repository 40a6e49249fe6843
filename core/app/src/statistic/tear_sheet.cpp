#include "tradeflow/statistic/tear_sheet.hpp"

namespace tradeflow {

namespace {

Decimal count_of(std::uint64_t value) {
  return Decimal{static_cast<std::int64_t>(value)};
}

}  // namespace

// -----------------------------------------------------------------------------
// TearSheetGenerator
// -----------------------------------------------------------------------------
void TearSheetGenerator::update_from_position(const domain::ClosedPosition& position) {
  ++positions_closed_;
  pnl_ += position.pnl_realised;

  const Decimal pnl_return = position.pnl_return();
  pnl_returns_.update(pnl_return);
  if (pnl_return.is_negative()) {
    loss_returns_.update(pnl_return);
  }

  if (position.pnl_realised.is_positive()) {
    ++wins_;
    profits_gross_ += position.pnl_realised;
  } else if (position.pnl_realised.is_negative()) {
    ++losses_;
    losses_gross_abs_ += position.pnl_realised.abs();
  }

  if (auto ended = pnl_drawdown_.update(TimedValue{position.time_exit, pnl_})) {
    pnl_drawdown_mean_.update(*ended);
    pnl_drawdown_max_.update(*ended);
  }
}

TearSheet TearSheetGenerator::generate(const Decimal& risk_free_return,
                                       const TimeInterval& trading_period,
                                       const TimeInterval& interval) const {
  TearSheet sheet;
  sheet.pnl = pnl_;
  sheet.trades = trades_;
  sheet.positions_closed = positions_closed_;

  const Decimal& mean = pnl_returns_.mean();
  sheet.pnl_return = RateOfReturn::calculate(mean, trading_period).scale(interval);

  if (auto std_dev = pnl_returns_.std_dev()) {
    if (auto sharpe =
            SharpeRatio::calculate(risk_free_return, mean, *std_dev, trading_period)) {
      sheet.sharpe_ratio = sharpe->scale(interval);
    }
  }
  if (auto std_dev = loss_returns_.std_dev()) {
    if (auto sortino = SortinoRatio::calculate(risk_free_return, mean, *std_dev,
                                               trading_period)) {
      sheet.sortino_ratio = sortino->scale(interval);
    }
  }

  sheet.pnl_drawdown = pnl_drawdown_.generate();
  MeanDrawdownGenerator drawdown_mean = pnl_drawdown_mean_;
  MaxDrawdownGenerator drawdown_max = pnl_drawdown_max_;
  if (sheet.pnl_drawdown) {
    drawdown_mean.update(*sheet.pnl_drawdown);
    drawdown_max.update(*sheet.pnl_drawdown);
  }
  sheet.pnl_drawdown_mean = drawdown_mean.generate();
  sheet.pnl_drawdown_max = drawdown_max.generate();

  if (sheet.pnl_drawdown_max) {
    if (auto calmar = CalmarRatio::calculate(risk_free_return, mean,
                                             sheet.pnl_drawdown_max->value,
                                             trading_period)) {
      sheet.calmar_ratio = calmar->scale(interval);
    }
  }

  sheet.win_rate = WinRate::calculate(count_of(wins_), count_of(wins_ + losses_));
  sheet.profit_factor = ProfitFactor::calculate(profits_gross_, losses_gross_abs_);
  return sheet;
}

// -----------------------------------------------------------------------------
// TearSheetAssetGenerator
// -----------------------------------------------------------------------------
void TearSheetAssetGenerator::update_from_balance(const domain::Balance& balance,
                                                  Timestamp time) {
  if (!balance_start_) {
    balance_start_ = balance;
  }
  balance_end_ = balance;

  if (auto ended = drawdown_.update(TimedValue{time, balance.total})) {
    drawdown_mean_.update(*ended);
    drawdown_max_.update(*ended);
  }
}

TearSheetAsset TearSheetAssetGenerator::generate(const TimeInterval& trading_period,
                                                 const TimeInterval& interval) const {
  TearSheetAsset sheet;
  sheet.balance_end = balance_end_;

  if (balance_start_ && balance_end_ && !balance_start_->total.is_zero()) {
    const Decimal change =
        (balance_end_->total - balance_start_->total) / balance_start_->total;
    sheet.rate_of_return = RateOfReturn::calculate(change, trading_period).scale(interval);
  }

  sheet.drawdown = drawdown_.generate();
  MeanDrawdownGenerator drawdown_mean = drawdown_mean_;
  MaxDrawdownGenerator drawdown_max = drawdown_max_;
  if (sheet.drawdown) {
    drawdown_mean.update(*sheet.drawdown);
    drawdown_max.update(*sheet.drawdown);
  }
  sheet.drawdown_mean = drawdown_mean.generate();
  sheet.drawdown_max = drawdown_max.generate();
  return sheet;
}

}  // namespace tradeflow
