#include "tradeflow/instrument/instrument_filter.hpp"

#include "tradeflow/common/error.hpp"

namespace tradeflow {

namespace {

template <typename Set>
void ensure_non_empty(const Set& values, const char* kind) {
  if (values.empty()) {
    throw ValidationError(std::string("InstrumentFilter::") + kind +
                          " requires at least one entry");
  }
}

}  // namespace

InstrumentFilter InstrumentFilter::exchanges(
    std::set<domain::ExchangeIndex> exchanges) {
  ensure_non_empty(exchanges, "Exchanges");
  InstrumentFilter filter;
  filter.kind_ = Kind::Exchanges;
  filter.exchanges_ = std::move(exchanges);
  return filter;
}

InstrumentFilter InstrumentFilter::instruments(
    std::set<domain::InstrumentIndex> instruments) {
  ensure_non_empty(instruments, "Instruments");
  InstrumentFilter filter;
  filter.kind_ = Kind::Instruments;
  filter.instruments_ = std::move(instruments);
  return filter;
}

InstrumentFilter InstrumentFilter::underlyings(
    std::set<domain::Underlying> underlyings) {
  ensure_non_empty(underlyings, "Underlyings");
  std::set<domain::Underlying> normalised;
  for (const auto& underlying : underlyings) {
    normalised.insert(
        domain::Underlying{domain::normalise_asset_name(underlying.base),
                           domain::normalise_asset_name(underlying.quote)});
  }
  InstrumentFilter filter;
  filter.kind_ = Kind::Underlyings;
  filter.underlyings_ = std::move(normalised);
  return filter;
}

bool InstrumentFilter::matches(const IndexedInstrument& instrument) const {
  switch (kind_) {
    case Kind::None:
      return true;
    case Kind::Exchanges:
      return exchanges_.count(instrument.exchange) != 0;
    case Kind::Instruments:
      return instruments_.count(instrument.index) != 0;
    case Kind::Underlyings:
      return underlyings_.count(instrument.underlying) != 0;
  }
  return false;
}

const char* to_string(InstrumentFilter::Kind kind) {
  switch (kind) {
    case InstrumentFilter::Kind::None:        return "None";
    case InstrumentFilter::Kind::Exchanges:   return "Exchanges";
    case InstrumentFilter::Kind::Instruments: return "Instruments";
    case InstrumentFilter::Kind::Underlyings: return "Underlyings";
  }
  return "None";
}

}  // namespace tradeflow
