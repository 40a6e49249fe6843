#pragma once

#include "tradeflow/domain/identifiers.hpp"
#include "tradeflow/domain/instrument.hpp"

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tradeflow {

struct IndexedExchange {
  domain::ExchangeIndex index{0};
  domain::ExchangeId id{domain::ExchangeId::Other};
};

struct IndexedAsset {
  domain::AssetIndex index{0};
  domain::ExchangeIndex exchange{0};
  domain::ExchangeId exchange_id{domain::ExchangeId::Other};
  std::string name_internal;  // lower-case, e.g. "usdt"
  std::string name_exchange;  // as first written in the config, e.g. "USDT"
};

struct IndexedInstrument {
  domain::InstrumentIndex index{0};
  domain::ExchangeIndex exchange{0};
  domain::ExchangeId exchange_id{domain::ExchangeId::Other};
  std::string name_internal;  // "binance_spot:btc_usdt"
  std::string name_exchange;  // "BTCUSDT"
  domain::Underlying underlying;  // internal asset names
  domain::AssetIndex base{0};
  domain::AssetIndex quote{0};
  domain::InstrumentQuoteAsset quote_asset{
      domain::InstrumentQuoteAsset::UnderlyingQuote};
  domain::InstrumentKind kind{domain::SpotKind{}};
  std::optional<domain::InstrumentSpec> spec;

  // Asset that prices and PnL are denominated in.
  domain::AssetIndex pricing_asset() const {
    return quote_asset == domain::InstrumentQuoteAsset::UnderlyingQuote ? quote
                                                                        : base;
  }
};

// -----------------------------------------------------------------------------
// IndexedInstruments: the frozen catalogue
// -----------------------------------------------------------------------------
//
// @brief  Assigns dense indices to exchanges, assets and instruments and
//         resolves names to indices and back.
//
// @details
// Construction walks the instrument configs once, in order:
//   - each new ExchangeId gets the next ExchangeIndex;
//   - each new (exchange, lower-cased asset name) gets the next AssetIndex.
//     Base, quote, settlement and strike assets are all interned;
//   - each instrument gets the next InstrumentIndex and the canonical
//     internal name "<exchange>:<base>_<quote>", suffixed with "_<kind>" for
//     anything that is not spot.
//
// A second instrument with the same (exchange, name_exchange) or the same
// internal name is rejected with ValidationError, as is any config that
// fails InstrumentConfig::validate().
//
// Index lookups are O(1); name lookups are O(log n). Every miss throws
// ValidationError.
//
// Thread-safety: immutable after construction. The system shares one
// instance (std::shared_ptr<const IndexedInstruments>) between the engine,
// the execution clients and the caller.
// -----------------------------------------------------------------------------
class IndexedInstruments {
 public:
  IndexedInstruments() = default;
  explicit IndexedInstruments(const std::vector<domain::InstrumentConfig>& configs);

  const std::vector<IndexedExchange>& exchanges() const { return exchanges_; }
  const std::vector<IndexedAsset>& assets() const { return assets_; }
  const std::vector<IndexedInstrument>& instruments() const {
    return instruments_;
  }

  const IndexedExchange& exchange(domain::ExchangeIndex index) const;
  const IndexedAsset& asset(domain::AssetIndex index) const;
  const IndexedInstrument& instrument(domain::InstrumentIndex index) const;

  domain::ExchangeIndex find_exchange_index(domain::ExchangeId exchange) const;
  domain::AssetIndex find_asset_index(domain::ExchangeId exchange,
                                      const std::string& name) const;
  domain::InstrumentIndex find_instrument_index(
      domain::ExchangeId exchange, const std::string& name_exchange) const;
  domain::InstrumentIndex find_instrument_by_internal_name(
      const std::string& name_internal) const;

  std::optional<domain::ExchangeIndex> try_find_exchange_index(
      domain::ExchangeId exchange) const;

  // "<exchange>:<asset>", e.g. "binance_spot:usdt".
  std::string asset_key(domain::AssetIndex index) const;

 private:
  domain::ExchangeIndex intern_exchange(domain::ExchangeId exchange);
  domain::AssetIndex intern_asset(domain::ExchangeIndex exchange,
                                  const std::string& name);

  std::vector<IndexedExchange> exchanges_;
  std::vector<IndexedAsset> assets_;
  std::vector<IndexedInstrument> instruments_;

  std::map<domain::ExchangeId, domain::ExchangeIndex> exchange_lookup_;
  std::map<std::pair<domain::ExchangeId, std::string>, domain::AssetIndex>
      asset_lookup_;
  std::map<std::pair<domain::ExchangeId, std::string>, domain::InstrumentIndex>
      instrument_lookup_;
  std::map<std::string, domain::InstrumentIndex> internal_lookup_;
};

// Canonical internal instrument name (see IndexedInstruments).
std::string make_instrument_name_internal(const domain::InstrumentConfig& config);

}  // namespace tradeflow
