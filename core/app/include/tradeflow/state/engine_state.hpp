#pragma once

#include "tradeflow/audit/engine_error.hpp"
#include "tradeflow/domain/balance.hpp"
#include "tradeflow/domain/identifiers.hpp"
#include "tradeflow/domain/position.hpp"
#include "tradeflow/domain/trade.hpp"
#include "tradeflow/events/engine_event.hpp"
#include "tradeflow/instrument/indexed_instruments.hpp"
#include "tradeflow/state/asset_state.hpp"
#include "tradeflow/state/connectivity.hpp"
#include "tradeflow/state/instrument_state.hpp"

#include <memory>
#include <optional>
#include <vector>

namespace tradeflow {

// -----------------------------------------------------------------------------
// StateUpdate: what applying one account or market event changed
// -----------------------------------------------------------------------------
// The engine feeds these into the trading summary and the audit outputs;
// the audit replica discards them.
// -----------------------------------------------------------------------------
struct StateUpdate {
  std::vector<domain::ClosedPosition> positions_exited;
  std::vector<domain::AssetBalance> balances;
  std::vector<domain::Trade> trades;
  // Set when the event moved an exchange from healthy to unhealthy.
  std::optional<domain::ExchangeIndex> disconnected;
  std::vector<EngineError> errors;

  bool unrecoverable() const {
    for (const auto& error : errors) {
      if (error.is_unrecoverable()) {
        return true;
      }
    }
    return false;
  }
};

// -----------------------------------------------------------------------------
// EngineState: the engine's complete view of the trading world
// -----------------------------------------------------------------------------
//
// @brief  Trading flag, per-exchange connectivity, per-asset balances and
//         per-instrument market data, orders, in-flight requests and
//         positions, all indexed by the catalogue's dense indices.
//
// @details
// Layers and their invariants:
//   - assets        0 <= free <= total; stale snapshots ignored.
//   - instruments   one OrderSnapshot per ClientOrderId; filled <= quantity;
//                   positions equal the signed sum of fills since last close.
//   - connectivity  Healthy until a Reconnecting event, Healthy again on the
//                   next item of the same stream.
//
// applyAccount() / applyMarket() are the only mutators for exchange input.
// They check every index an event references before touching anything, so
// an event is either applied completely or not at all. Broken references are
// reported as EngineErrors in the returned StateUpdate, never thrown:
//   - account events: Unrecoverable (the engine's view cannot be trusted);
//   - market events and reconnects for unknown exchanges: Recoverable.
//
// The engine and AuditReplica drive the same functions, so replaying an
// audit stream reproduces the engine's state exactly.
//
// Thread model: owned by one engine worker thread. Copies (audit snapshots,
// the final state handed back by shutdown) are independent values; the
// catalogue is shared read-only.
// -----------------------------------------------------------------------------
class EngineState {
 public:
  EngineState(std::shared_ptr<const IndexedInstruments> catalogue,
              TradingState trading);

  const IndexedInstruments& catalogue() const { return *catalogue_; }
  const std::shared_ptr<const IndexedInstruments>& cataloguePtr() const {
    return catalogue_;
  }

  TradingState trading() const { return trading_; }
  // Returns true when the state actually changed.
  bool setTrading(TradingState trading);

  const std::vector<ConnectivityState>& connectivity() const {
    return connectivity_;
  }
  const std::vector<AssetState>& assets() const { return assets_; }
  const std::vector<InstrumentState>& instruments() const {
    return instruments_;
  }

  const ConnectivityState& connectivity(domain::ExchangeIndex exchange) const;
  const AssetState& asset(domain::AssetIndex asset) const;
  const InstrumentState& instrument(domain::InstrumentIndex instrument) const;
  InstrumentState& instrumentMut(domain::InstrumentIndex instrument);

  bool exchangeHealthy(domain::ExchangeIndex exchange) const {
    return connectivity(exchange).healthy();
  }

  StateUpdate applyAccount(const AccountStreamEvent& event);
  StateUpdate applyMarket(const MarketStreamEvent& event);

  // Initial balance seeding; bypasses the staleness rule.
  void seedBalance(domain::AssetIndex asset, const domain::Balance& balance,
                    Timestamp time_exchange);

  // In-flight bookkeeping for a request the engine is about to dispatch.
  // Throws std::logic_error for an index outside the catalogue.
  void recordInFlight(const OrderRequest& request, domain::Sequence sequence,
                        Timestamp time);
  void forgetInFlight(const OrderRequest& request);

  bool hasInFlight() const;

  // Last known price of an instrument, if any market data arrived.
  std::optional<Decimal> lastPrice(domain::InstrumentIndex instrument) const;

  // Trade fees converted into the instrument's pricing asset.
  Decimal feesInPricingAsset(const domain::Trade& trade) const;

 private:
  StateUpdate applyAccountEvent(const AccountEvent& event);
  std::optional<EngineError> checkAccountEvent(const AccountEvent& event) const;

  std::shared_ptr<const IndexedInstruments> catalogue_;
  TradingState trading_;
  std::vector<ConnectivityState> connectivity_;
  std::vector<AssetState> assets_;
  std::vector<InstrumentState> instruments_;
};

}  // namespace tradeflow
