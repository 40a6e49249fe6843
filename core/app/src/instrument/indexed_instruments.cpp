#include "tradeflow/instrument/indexed_instruments.hpp"

#include "tradeflow/common/error.hpp"
#include "tradeflow/common/overloaded.hpp"

namespace tradeflow {

using domain::AssetIndex;
using domain::ExchangeId;
using domain::ExchangeIndex;
using domain::InstrumentIndex;

namespace {

template <typename Vec>
const typename Vec::value_type& at_index(const Vec& items, std::size_t index,
                                         const char* what) {
  if (index >= items.size()) {
    throw ValidationError(std::string(what) + " index " +
                          std::to_string(index) + " out of bounds (" +
                          std::to_string(items.size()) + " known)");
  }
  return items[index];
}

}  // namespace

std::string make_instrument_name_internal(const domain::InstrumentConfig& config) {
  std::string name = std::string(domain::to_string(config.exchange)) + ":" +
                     domain::normalise_asset_name(config.underlying.base) +
                     "_" +
                     domain::normalise_asset_name(config.underlying.quote);
  if (!std::holds_alternative<domain::SpotKind>(config.kind)) {
    name += "_";
    name += domain::kind_name(config.kind);
  }
  return name;
}

IndexedInstruments::IndexedInstruments(
    const std::vector<domain::InstrumentConfig>& configs) {
  instruments_.reserve(configs.size());

  for (const auto& config : configs) {
    config.validate();

    const ExchangeIndex exchange = intern_exchange(config.exchange);

    auto name_key = std::make_pair(config.exchange, config.name_exchange);
    if (instrument_lookup_.count(name_key) != 0) {
      throw ValidationError("duplicate instrument '" + config.name_exchange +
                            "' on exchange " +
                            domain::to_string(config.exchange));
    }
    std::string name_internal = make_instrument_name_internal(config);
    if (internal_lookup_.count(name_internal) != 0) {
      throw ValidationError("duplicate instrument '" + name_internal +
                            "' (name_exchange '" + config.name_exchange + "')");
    }

    IndexedInstrument instrument;
    instrument.index = instruments_.size();
    instrument.exchange = exchange;
    instrument.exchange_id = config.exchange;
    instrument.name_internal = name_internal;
    instrument.name_exchange = config.name_exchange;
    instrument.base = intern_asset(exchange, config.underlying.base);
    instrument.quote = intern_asset(exchange, config.underlying.quote);
    instrument.underlying =
        domain::Underlying{assets_[instrument.base].name_internal,
                           assets_[instrument.quote].name_internal};
    instrument.quote_asset = config.quote;
    instrument.kind = config.kind;
    instrument.spec = config.spec;

    std::visit(overloaded{
                   [](const domain::SpotKind&) {},
                   [&](const domain::PerpetualContract& c) {
                     intern_asset(exchange, c.settlement_asset);
                   },
                   [&](const domain::FutureContract& c) {
                     intern_asset(exchange, c.settlement_asset);
                   },
                   [&](const domain::OptionContract& c) {
                     intern_asset(exchange, c.strike_asset);
                     intern_asset(exchange, c.settlement_asset);
                   },
               },
               config.kind);

    instrument_lookup_.emplace(std::move(name_key), instrument.index);
    internal_lookup_.emplace(std::move(name_internal), instrument.index);
    instruments_.push_back(std::move(instrument));
  }
}

ExchangeIndex IndexedInstruments::intern_exchange(ExchangeId exchange) {
  auto it = exchange_lookup_.find(exchange);
  if (it != exchange_lookup_.end()) {
    return it->second;
  }
  const ExchangeIndex index = exchanges_.size();
  exchanges_.push_back(IndexedExchange{index, exchange});
  exchange_lookup_.emplace(exchange, index);
  return index;
}

AssetIndex IndexedInstruments::intern_asset(ExchangeIndex exchange,
                                            const std::string& name) {
  const ExchangeId exchange_id = exchanges_[exchange].id;
  auto key = std::make_pair(exchange_id, domain::normalise_asset_name(name));
  auto it = asset_lookup_.find(key);
  if (it != asset_lookup_.end()) {
    return it->second;
  }
  const AssetIndex index = assets_.size();
  assets_.push_back(IndexedAsset{index, exchange, exchange_id, key.second, name});
  asset_lookup_.emplace(std::move(key), index);
  return index;
}

const IndexedExchange& IndexedInstruments::exchange(ExchangeIndex index) const {
  return at_index(exchanges_, index, "exchange");
}

const IndexedAsset& IndexedInstruments::asset(AssetIndex index) const {
  return at_index(assets_, index, "asset");
}

const IndexedInstrument& IndexedInstruments::instrument(
    InstrumentIndex index) const {
  return at_index(instruments_, index, "instrument");
}

std::optional<ExchangeIndex> IndexedInstruments::try_find_exchange_index(
    ExchangeId exchange) const {
  auto it = exchange_lookup_.find(exchange);
  if (it == exchange_lookup_.end()) {
    return std::nullopt;
  }
  return it->second;
}

ExchangeIndex IndexedInstruments::find_exchange_index(ExchangeId exchange) const {
  if (auto index = try_find_exchange_index(exchange)) {
    return *index;
  }
  throw ValidationError(std::string("exchange ") + domain::to_string(exchange) +
                        " is not in the instrument catalogue");
}

AssetIndex IndexedInstruments::find_asset_index(ExchangeId exchange,
                                                const std::string& name) const {
  auto it =
      asset_lookup_.find(std::make_pair(exchange, domain::normalise_asset_name(name)));
  if (it == asset_lookup_.end()) {
    throw ValidationError("asset '" + name + "' on exchange " +
                          domain::to_string(exchange) +
                          " is not in the instrument catalogue");
  }
  return it->second;
}

InstrumentIndex IndexedInstruments::find_instrument_index(
    ExchangeId exchange, const std::string& name_exchange) const {
  auto it = instrument_lookup_.find(std::make_pair(exchange, name_exchange));
  if (it == instrument_lookup_.end()) {
    throw ValidationError("instrument '" + name_exchange + "' on exchange " +
                          domain::to_string(exchange) +
                          " is not in the instrument catalogue");
  }
  return it->second;
}

InstrumentIndex IndexedInstruments::find_instrument_by_internal_name(
    const std::string& name_internal) const {
  auto it = internal_lookup_.find(name_internal);
  if (it == internal_lookup_.end()) {
    throw ValidationError("instrument '" + name_internal +
                          "' is not in the instrument catalogue");
  }
  return it->second;
}

std::string IndexedInstruments::asset_key(AssetIndex index) const {
  const IndexedAsset& entry = asset(index);
  return std::string(domain::to_string(entry.exchange_id)) + ":" +
         entry.name_internal;
}

}  // namespace tradeflow
