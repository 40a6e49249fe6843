#pragma once

#include "tradeflow/domain/identifiers.hpp"
#include "tradeflow/state/market_data_state.hpp"
#include "tradeflow/state/order_manager.hpp"
#include "tradeflow/state/position_manager.hpp"

namespace tradeflow {

// Everything the engine tracks for one catalogue instrument.
struct InstrumentState {
  domain::InstrumentIndex instrument{0};
  domain::ExchangeIndex exchange{0};
  MarketDataState market;
  OrderManager orders;
  PositionManager positions;
};

}  // namespace tradeflow
