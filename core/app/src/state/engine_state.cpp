#include "tradeflow/state/engine_state.hpp"

#include "tradeflow/common/error.hpp"
#include "tradeflow/common/log.hpp"
#include "tradeflow/common/overloaded.hpp"

#include <stdexcept>
#include <string>

namespace tradeflow {

using domain::AssetIndex;
using domain::ExchangeIndex;
using domain::InstrumentIndex;

namespace {

std::string index_error(const char* what, std::size_t index, std::size_t size) {
  return std::string("unknown ") + what + " index " + std::to_string(index) +
         " (" + std::to_string(size) + " known)";
}

std::optional<std::string> validation_message(const domain::Balance& balance) {
  try {
    balance.validate();
  } catch (const ValidationError& e) {
    return std::string(e.what());
  }
  return std::nullopt;
}

std::optional<std::string> validation_message(const domain::OrderSnapshot& order) {
  try {
    order.validate();
  } catch (const ValidationError& e) {
    return std::string(e.what());
  }
  return std::nullopt;
}

}  // namespace

const char* to_string(Health health) {
  return health == Health::Healthy ? "Healthy" : "Reconnecting";
}

EngineState::EngineState(std::shared_ptr<const IndexedInstruments> catalogue,
                         TradingState trading)
    : catalogue_(std::move(catalogue)), trading_(trading) {
  if (!catalogue_) {
    throw std::logic_error("EngineState requires an instrument catalogue");
  }
  connectivity_.resize(catalogue_->exchanges().size());

  assets_.reserve(catalogue_->assets().size());
  for (const auto& asset : catalogue_->assets()) {
    AssetState state;
    state.asset = asset.index;
    state.exchange = asset.exchange;
    state.name = asset.name_internal;
    assets_.push_back(std::move(state));
  }

  instruments_.reserve(catalogue_->instruments().size());
  for (const auto& instrument : catalogue_->instruments()) {
    InstrumentState state;
    state.instrument = instrument.index;
    state.exchange = instrument.exchange;
    instruments_.push_back(std::move(state));
  }
}

bool EngineState::setTrading(TradingState trading) {
  if (trading_ == trading) {
    return false;
  }
  trading_ = trading;
  return true;
}

const ConnectivityState& EngineState::connectivity(ExchangeIndex exchange) const {
  if (exchange >= connectivity_.size()) {
    throw std::logic_error(index_error("exchange", exchange, connectivity_.size()));
  }
  return connectivity_[exchange];
}

const AssetState& EngineState::asset(AssetIndex asset) const {
  if (asset >= assets_.size()) {
    throw std::logic_error(index_error("asset", asset, assets_.size()));
  }
  return assets_[asset];
}

const InstrumentState& EngineState::instrument(InstrumentIndex instrument) const {
  if (instrument >= instruments_.size()) {
    throw std::logic_error(
        index_error("instrument", instrument, instruments_.size()));
  }
  return instruments_[instrument];
}

InstrumentState& EngineState::instrumentMut(InstrumentIndex instrument) {
  if (instrument >= instruments_.size()) {
    throw std::logic_error(
        index_error("instrument", instrument, instruments_.size()));
  }
  return instruments_[instrument];
}

// -----------------------------------------------------------------------------
// Account stream
// -----------------------------------------------------------------------------
StateUpdate EngineState::applyAccount(const AccountStreamEvent& event) {
  if (const auto* reconnecting = std::get_if<Reconnecting>(&event)) {
    StateUpdate update;
    auto index = catalogue_->try_find_exchange_index(reconnecting->exchange);
    if (!index) {
      update.errors.push_back(EngineError::recoverable(
          std::string("account reconnect for exchange ") +
          domain::to_string(reconnecting->exchange) +
          " which is not in the catalogue"));
      return update;
    }
    ConnectivityState& connectivity = connectivity_[*index];
    const bool was_healthy = connectivity.healthy();
    connectivity.account = Health::Reconnecting;
    if (was_healthy) {
      update.disconnected = *index;
    }
    log::warn("EngineState", "account stream reconnecting for ",
              reconnecting->exchange);
    return update;
  }
  return applyAccountEvent(std::get<AccountEvent>(event));
}

std::optional<EngineError> EngineState::checkAccountEvent(
    const AccountEvent& event) const {
  if (event.exchange >= connectivity_.size()) {
    return EngineError::unrecoverable(
        index_error("exchange", event.exchange, connectivity_.size()));
  }

  auto check_instrument = [this](InstrumentIndex index) -> std::optional<EngineError> {
    if (index >= instruments_.size()) {
      return EngineError::unrecoverable(
          index_error("instrument", index, instruments_.size()));
    }
    return std::nullopt;
  };
  auto check_asset = [this](AssetIndex index) -> std::optional<EngineError> {
    if (index >= assets_.size()) {
      return EngineError::unrecoverable(index_error("asset", index, assets_.size()));
    }
    return std::nullopt;
  };

  return std::visit(
      overloaded{
          [&](const AccountSnapshot& snapshot) -> std::optional<EngineError> {
            for (const auto& balance : snapshot.balances) {
              if (auto error = check_asset(balance.asset)) {
                return error;
              }
            }
            for (const auto& instrument : snapshot.instruments) {
              if (auto error = check_instrument(instrument.instrument)) {
                return error;
              }
              for (const auto& order : instrument.orders) {
                if (order.key.instrument != instrument.instrument) {
                  return EngineError::unrecoverable(
                      "account snapshot order " + order.key.cid.str() +
                      " filed under instrument " +
                      std::to_string(instrument.instrument) +
                      " references instrument " +
                      std::to_string(order.key.instrument));
                }
              }
            }
            return std::nullopt;
          },
          [&](const domain::AssetBalance& balance) {
            return check_asset(balance.asset);
          },
          [&](const domain::OrderSnapshot& order) {
            return check_instrument(order.key.instrument);
          },
          [&](const OrderCancelled& cancelled) {
            return check_instrument(cancelled.key.instrument);
          },
          [&](const domain::Trade& trade) -> std::optional<EngineError> {
            if (auto error = check_instrument(trade.instrument)) {
              return error;
            }
            return check_asset(trade.fees.asset);
          },
      },
      event.kind);
}

StateUpdate EngineState::applyAccountEvent(const AccountEvent& event) {
  StateUpdate update;
  if (auto error = checkAccountEvent(event)) {
    log::error("EngineState", "account event ", kind_name(event.kind),
               " rejected: ", error->message);
    update.errors.push_back(std::move(*error));
    return update;
  }

  connectivity_[event.exchange].account = Health::Healthy;

  std::visit(
      overloaded{
          [&](const AccountSnapshot& snapshot) {
            for (const auto& balance : snapshot.balances) {
              if (auto message = validation_message(balance.balance)) {
                update.errors.push_back(EngineError::recoverable(*message));
                continue;
              }
              if (assets_[balance.asset].update(balance.balance,
                                                balance.time_exchange)) {
                update.balances.push_back(balance);
              }
            }
            for (const auto& instrument : snapshot.instruments) {
              instruments_[instrument.instrument].orders.replaceAll(
                  instrument.orders);
            }
          },
          [&](const domain::AssetBalance& balance) {
            if (auto message = validation_message(balance.balance)) {
              update.errors.push_back(EngineError::recoverable(*message));
              return;
            }
            if (assets_[balance.asset].update(balance.balance,
                                              balance.time_exchange)) {
              update.balances.push_back(balance);
            }
          },
          [&](const domain::OrderSnapshot& order) {
            // Terminal snapshots may echo the invalid request they refuse.
            if (order.is_active()) {
              if (auto message = validation_message(order)) {
                update.errors.push_back(EngineError::recoverable(*message));
                return;
              }
            }
            instruments_[order.key.instrument].orders.applySnapshot(order);
          },
          [&](const OrderCancelled& cancelled) {
            instruments_[cancelled.key.instrument].orders.applyCancelled(
                cancelled);
          },
          [&](const domain::Trade& trade) {
            InstrumentState& instrument = instruments_[trade.instrument];
            auto closed = instrument.positions.applyTrade(
                trade, feesInPricingAsset(trade));
            if (instrument.market.last_price) {
              instrument.positions.markToMarket(*instrument.market.last_price);
            }
            update.trades.push_back(trade);
            if (closed) {
              update.positions_exited.push_back(std::move(*closed));
            }
          },
      },
      event.kind);

  return update;
}

// -----------------------------------------------------------------------------
// Market stream
// -----------------------------------------------------------------------------
StateUpdate EngineState::applyMarket(const MarketStreamEvent& event) {
  StateUpdate update;

  if (const auto* reconnecting = std::get_if<Reconnecting>(&event)) {
    auto index = catalogue_->try_find_exchange_index(reconnecting->exchange);
    if (!index) {
      update.errors.push_back(EngineError::recoverable(
          std::string("market reconnect for exchange ") +
          domain::to_string(reconnecting->exchange) +
          " which is not in the catalogue"));
      return update;
    }
    ConnectivityState& connectivity = connectivity_[*index];
    const bool was_healthy = connectivity.healthy();
    connectivity.market = Health::Reconnecting;
    if (was_healthy) {
      update.disconnected = *index;
    }
    log::warn("EngineState", "market stream reconnecting for ",
              reconnecting->exchange);
    return update;
  }

  const auto& item = std::get<MarketEvent>(event);
  if (item.instrument >= instruments_.size()) {
    update.errors.push_back(EngineError::recoverable(
        "market event for " +
        index_error("instrument", item.instrument, instruments_.size())));
    return update;
  }

  InstrumentState& instrument = instruments_[item.instrument];
  connectivity_[instrument.exchange].market = Health::Healthy;
  instrument.market.apply(item);
  if (instrument.market.last_price) {
    instrument.positions.markToMarket(*instrument.market.last_price);
  }
  return update;
}

// -----------------------------------------------------------------------------
// Seeding and in-flight bookkeeping
// -----------------------------------------------------------------------------
void EngineState::seedBalance(AssetIndex asset, const domain::Balance& balance,
                               Timestamp time_exchange) {
  if (asset >= assets_.size()) {
    throw ValidationError(index_error("asset", asset, assets_.size()));
  }
  balance.validate();
  assets_[asset].balance = balance;
  assets_[asset].time_exchange = time_exchange;
}

void EngineState::recordInFlight(const OrderRequest& request,
                                   domain::Sequence sequence, Timestamp time) {
  std::visit(overloaded{
                 [&](const domain::OrderRequestOpen& open) {
                   instrumentMut(open.key.instrument)
                       .orders.recordOpen(open, sequence, time);
                 },
                 [&](const domain::OrderRequestCancel& cancel) {
                   instrumentMut(cancel.key.instrument)
                       .orders.recordCancel(cancel, sequence, time);
                 },
             },
             request);
}

void EngineState::forgetInFlight(const OrderRequest& request) {
  std::visit(overloaded{
                 [&](const domain::OrderRequestOpen& open) {
                   instrumentMut(open.key.instrument)
                       .orders.forget(open.key.cid, RequestKind::Open);
                 },
                 [&](const domain::OrderRequestCancel& cancel) {
                   instrumentMut(cancel.key.instrument)
                       .orders.forget(cancel.key.cid, RequestKind::Cancel);
                 },
             },
             request);
}

bool EngineState::hasInFlight() const {
  for (const auto& instrument : instruments_) {
    if (instrument.orders.hasInFlight()) {
      return true;
    }
  }
  return false;
}

std::optional<Decimal> EngineState::lastPrice(InstrumentIndex instrument) const {
  return this->instrument(instrument).market.last_price;
}

Decimal EngineState::feesInPricingAsset(const domain::Trade& trade) const {
  const IndexedInstrument& instrument = catalogue_->instrument(trade.instrument);
  const AssetIndex pricing = instrument.pricing_asset();
  if (trade.fees.asset == pricing) {
    return trade.fees.fees;
  }
  const AssetIndex other =
      pricing == instrument.quote ? instrument.base : instrument.quote;
  if (trade.fees.asset == other && trade.price.is_positive()) {
    // Fees charged in the traded asset: convert at the fill price.
    return pricing == instrument.quote ? trade.fees.fees * trade.price
                                       : trade.fees.fees / trade.price;
  }
  return trade.fees.fees;
}

}  // namespace tradeflow
