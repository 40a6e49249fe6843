#pragma once

#include "tradeflow/domain/balance.hpp"
#include "tradeflow/domain/position.hpp"
#include "tradeflow/domain/trade.hpp"
#include "tradeflow/instrument/indexed_instruments.hpp"
#include "tradeflow/numeric/decimal.hpp"
#include "tradeflow/statistic/tear_sheet.hpp"
#include "tradeflow/statistic/time_interval.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace tradeflow {

// -----------------------------------------------------------------------------
// TradingSummary: final report of one run
// -----------------------------------------------------------------------------
// instruments are keyed by canonical internal name ("binance_spot:btc_usdt"),
// assets by "<exchange>:<asset>". std::map keeps both sorted so the JSON
// form is byte-stable.
// -----------------------------------------------------------------------------
struct TradingSummary {
  Timestamp time_engine_start{};
  Timestamp time_engine_end{};
  std::map<std::string, TearSheet> instruments;
  std::map<std::string, TearSheetAsset> assets;

  Duration trading_duration() const { return time_engine_end - time_engine_start; }
};

// -----------------------------------------------------------------------------
// TradingSummaryGenerator
// -----------------------------------------------------------------------------
//
// @brief  Owns one TearSheetGenerator per instrument and one
//         TearSheetAssetGenerator per asset, indexed like the catalogue.
//
// @details
// The engine creates it at construction (time_engine_start = engine time at
// that moment), seeds every asset with its starting balance, and then feeds
// it from the state updates of each processed event:
//
//   trade fill        → update_from_trade
//   closed position   → update_from_position
//   balance snapshot  → update_from_balance
//   every event       → update_time_now
//
// generate(interval) does not consume the accumulated state; calling it
// twice with the same interval yields the same summary.
//
// Thread model: engine thread only.
// -----------------------------------------------------------------------------
class TradingSummaryGenerator {
 public:
  TradingSummaryGenerator() = default;
  TradingSummaryGenerator(std::shared_ptr<const IndexedInstruments> catalogue,
                          Decimal risk_free_return, Timestamp time_engine_start);

  const Decimal& risk_free_return() const { return risk_free_return_; }
  void set_risk_free_return(Decimal risk_free_return) {
    risk_free_return_ = std::move(risk_free_return);
  }

  Timestamp time_engine_start() const { return time_engine_start_; }
  Timestamp time_engine_now() const { return time_engine_now_; }

  // Never moves time backwards.
  void update_time_now(Timestamp time);

  void update_from_position(const domain::ClosedPosition& position);
  void update_from_balance(const domain::AssetBalance& balance);
  void update_from_trade(const domain::Trade& trade);

  TradingSummary generate(const TimeInterval& interval) const;

 private:
  std::shared_ptr<const IndexedInstruments> catalogue_;
  Decimal risk_free_return_;
  Timestamp time_engine_start_{};
  Timestamp time_engine_now_{};
  std::vector<TearSheetGenerator> instruments_;
  std::vector<TearSheetAssetGenerator> assets_;
};

}  // namespace tradeflow
