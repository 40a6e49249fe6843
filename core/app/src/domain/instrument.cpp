#include "tradeflow/domain/instrument.hpp"

#include "tradeflow/common/error.hpp"
#include "tradeflow/common/overloaded.hpp"

#include <algorithm>
#include <cctype>

namespace tradeflow {
namespace domain {

namespace {

void ensure_positive(const Decimal& value, const std::string& field,
                     const std::string& instrument) {
  if (!value.is_positive()) {
    throw ValidationError("instrument '" + instrument + "': " + field +
                          " must be positive, received " + value.to_string());
  }
}

void ensure_non_negative(const Decimal& value, const std::string& field,
                         const std::string& instrument) {
  if (value.is_negative()) {
    throw ValidationError("instrument '" + instrument + "': " + field +
                          " must not be negative, received " +
                          value.to_string());
  }
}

void ensure_asset(const std::string& asset, const std::string& field,
                  const std::string& instrument) {
  if (asset.empty()) {
    throw ValidationError("instrument '" + instrument + "': " + field +
                          " must not be empty");
  }
}

}  // namespace

const char* kind_name(const InstrumentKind& kind) {
  return std::visit(overloaded{
                        [](const SpotKind&) { return "spot"; },
                        [](const PerpetualContract&) { return "perpetual"; },
                        [](const FutureContract&) { return "future"; },
                        [](const OptionContract&) { return "option"; },
                    },
                    kind);
}

std::string normalise_asset_name(const std::string& name) {
  std::string out = name;
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

void InstrumentConfig::validate() const {
  if (name_exchange.empty()) {
    throw ValidationError("instrument name_exchange must not be empty");
  }
  ensure_asset(underlying.base, "underlying.base", name_exchange);
  ensure_asset(underlying.quote, "underlying.quote", name_exchange);
  if (normalise_asset_name(underlying.base) ==
      normalise_asset_name(underlying.quote)) {
    throw ValidationError("instrument '" + name_exchange +
                          "': base and quote assets must differ");
  }

  std::visit(overloaded{
                 [](const SpotKind&) {},
                 [this](const PerpetualContract& c) {
                   ensure_positive(c.contract_size, "contract_size",
                                   name_exchange);
                   ensure_asset(c.settlement_asset, "settlement_asset",
                                name_exchange);
                 },
                 [this](const FutureContract& c) {
                   ensure_positive(c.contract_size, "contract_size",
                                   name_exchange);
                   ensure_asset(c.settlement_asset, "settlement_asset",
                                name_exchange);
                 },
                 [this](const OptionContract& c) {
                   ensure_positive(c.contract_size, "contract_size",
                                   name_exchange);
                   ensure_positive(c.strike, "strike", name_exchange);
                   ensure_asset(c.strike_asset, "strike_asset", name_exchange);
                   ensure_asset(c.settlement_asset, "settlement_asset",
                                name_exchange);
                 },
             },
             kind);

  if (spec) {
    ensure_non_negative(spec->price.min, "spec.price.min", name_exchange);
    ensure_non_negative(spec->price.tick_size, "spec.price.tick_size",
                        name_exchange);
    ensure_non_negative(spec->quantity.min, "spec.quantity.min",
                        name_exchange);
    ensure_non_negative(spec->quantity.increment, "spec.quantity.increment",
                        name_exchange);
    ensure_non_negative(spec->notional.min, "spec.notional.min",
                        name_exchange);
  }
}

}  // namespace domain
}  // namespace tradeflow
