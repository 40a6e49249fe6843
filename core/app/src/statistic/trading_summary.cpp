#include "tradeflow/statistic/trading_summary.hpp"

#include <stdexcept>

namespace tradeflow {

TradingSummaryGenerator::TradingSummaryGenerator(
    std::shared_ptr<const IndexedInstruments> catalogue, Decimal risk_free_return,
    Timestamp time_engine_start)
    : catalogue_(std::move(catalogue)),
      risk_free_return_(std::move(risk_free_return)),
      time_engine_start_(time_engine_start),
      time_engine_now_(time_engine_start),
      instruments_(catalogue_->instruments().size()),
      assets_(catalogue_->assets().size()) {}

void TradingSummaryGenerator::update_time_now(Timestamp time) {
  if (time > time_engine_now_) {
    time_engine_now_ = time;
  }
}

void TradingSummaryGenerator::update_from_position(
    const domain::ClosedPosition& position) {
  if (position.instrument >= instruments_.size()) {
    throw std::logic_error("summary: closed position for unknown instrument " +
                           std::to_string(position.instrument));
  }
  instruments_[position.instrument].update_from_position(position);
}

void TradingSummaryGenerator::update_from_balance(const domain::AssetBalance& balance) {
  if (balance.asset >= assets_.size()) {
    throw std::logic_error("summary: balance for unknown asset " +
                           std::to_string(balance.asset));
  }
  assets_[balance.asset].update_from_balance(balance.balance, balance.time_exchange);
}

void TradingSummaryGenerator::update_from_trade(const domain::Trade& trade) {
  if (trade.instrument >= instruments_.size()) {
    throw std::logic_error("summary: trade for unknown instrument " +
                           std::to_string(trade.instrument));
  }
  instruments_[trade.instrument].update_from_trade();
}

// -----------------------------------------------------------------------------
// generate(): tear sheets over [start, now], scaled to interval
// -----------------------------------------------------------------------------
TradingSummary TradingSummaryGenerator::generate(const TimeInterval& interval) const {
  TradingSummary summary;
  summary.time_engine_start = time_engine_start_;
  summary.time_engine_end = time_engine_now_;
  if (!catalogue_) {
    return summary;
  }

  const TimeInterval trading_period =
      TimeInterval::custom(time_engine_now_ - time_engine_start_);

  for (std::size_t i = 0; i < instruments_.size(); ++i) {
    summary.instruments.emplace(
        catalogue_->instrument(static_cast<domain::InstrumentIndex>(i)).name_internal,
        instruments_[i].generate(risk_free_return_, trading_period, interval));
  }
  for (std::size_t i = 0; i < assets_.size(); ++i) {
    summary.assets.emplace(
        catalogue_->asset_key(static_cast<domain::AssetIndex>(i)),
        assets_[i].generate(trading_period, interval));
  }
  return summary;
}

}  // namespace tradeflow
