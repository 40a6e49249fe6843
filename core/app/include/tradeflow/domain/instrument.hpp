#pragma once

#include "tradeflow/domain/identifiers.hpp"
#include "tradeflow/numeric/decimal.hpp"
#include "tradeflow/time/time_utils.hpp"

#include <optional>
#include <string>
#include <variant>

namespace tradeflow {
namespace domain {

// Base/quote asset pair, by internal (lower-case) asset name.
struct Underlying {
  std::string base;
  std::string quote;
};

inline bool operator==(const Underlying& a, const Underlying& b) {
  return a.base == b.base && a.quote == b.quote;
}
inline bool operator!=(const Underlying& a, const Underlying& b) {
  return !(a == b);
}
inline bool operator<(const Underlying& a, const Underlying& b) {
  return a.base < b.base || (a.base == b.base && a.quote < b.quote);
}

// Which underlying asset prices and PnL are denominated in.
enum class InstrumentQuoteAsset {
  UnderlyingQuote,
  UnderlyingBase,
};

enum class OptionKind { Call, Put };
enum class OptionExercise { American, Bermudan, European };

struct SpotKind {};

struct PerpetualContract {
  Decimal contract_size{1};
  std::string settlement_asset;
};

struct FutureContract {
  Decimal contract_size{1};
  std::string settlement_asset;
  Timestamp expiry{};
};

struct OptionContract {
  OptionKind kind{OptionKind::Call};
  OptionExercise exercise{OptionExercise::European};
  Timestamp expiry{};
  Decimal strike;
  std::string strike_asset;
  Decimal contract_size{1};
  std::string settlement_asset;
};

using InstrumentKind =
    std::variant<SpotKind, PerpetualContract, FutureContract, OptionContract>;

// "spot", "perpetual", "future", "option"
const char* kind_name(const InstrumentKind& kind);

enum class OrderQuantityUnits { Asset, Contract, Quote };

struct InstrumentSpecPrice {
  Decimal min;
  Decimal tick_size;
};

struct InstrumentSpecQuantity {
  OrderQuantityUnits unit{OrderQuantityUnits::Asset};
  Decimal min;
  Decimal increment;
};

struct InstrumentSpecNotional {
  Decimal min;
};

// Venue trading rules. Informational: the engine carries them for strategies
// and risk managers; it does not round orders itself.
struct InstrumentSpec {
  InstrumentSpecPrice price;
  InstrumentSpecQuantity quantity;
  InstrumentSpecNotional notional;
};

// -----------------------------------------------------------------------------
// InstrumentConfig
// -----------------------------------------------------------------------------
// One tradable instrument as written in SystemConfig. validate() throws
// ValidationError for empty names, identical base/quote, non-positive
// contract sizes or a negative spec.
// -----------------------------------------------------------------------------
struct InstrumentConfig {
  ExchangeId exchange{ExchangeId::Other};
  std::string name_exchange;
  Underlying underlying;
  InstrumentQuoteAsset quote{InstrumentQuoteAsset::UnderlyingQuote};
  InstrumentKind kind{SpotKind{}};
  std::optional<InstrumentSpec> spec;

  void validate() const;
};

// Lower-cases an asset name ("USDT" -> "usdt").
std::string normalise_asset_name(const std::string& name);

}  // namespace domain
}  // namespace tradeflow
