#pragma once

#include "tradeflow/domain/identifiers.hpp"
#include "tradeflow/domain/instrument.hpp"
#include "tradeflow/instrument/indexed_instruments.hpp"

#include <set>

namespace tradeflow {

// -----------------------------------------------------------------------------
// InstrumentFilter: selector for bulk commands
// -----------------------------------------------------------------------------
// None selects every instrument. The other kinds select by exchange, by
// instrument index or by (base, quote) underlying; their named constructors
// throw ValidationError on an empty set.
// -----------------------------------------------------------------------------
class InstrumentFilter {
 public:
  enum class Kind {
    None,
    Exchanges,
    Instruments,
    Underlyings,
  };

  InstrumentFilter() = default;

  static InstrumentFilter none() { return InstrumentFilter{}; }
  static InstrumentFilter exchanges(std::set<domain::ExchangeIndex> exchanges);
  static InstrumentFilter instruments(std::set<domain::InstrumentIndex> instruments);
  static InstrumentFilter underlyings(std::set<domain::Underlying> underlyings);

  Kind kind() const { return kind_; }
  const std::set<domain::ExchangeIndex>& exchange_set() const { return exchanges_; }
  const std::set<domain::InstrumentIndex>& instrument_set() const {
    return instruments_;
  }
  const std::set<domain::Underlying>& underlying_set() const {
    return underlyings_;
  }

  bool matches(const IndexedInstrument& instrument) const;

  friend bool operator==(const InstrumentFilter& a, const InstrumentFilter& b) {
    return a.kind_ == b.kind_ && a.exchanges_ == b.exchanges_ &&
           a.instruments_ == b.instruments_ && a.underlyings_ == b.underlyings_;
  }

 private:
  Kind kind_{Kind::None};
  std::set<domain::ExchangeIndex> exchanges_;
  std::set<domain::InstrumentIndex> instruments_;
  std::set<domain::Underlying> underlyings_;
};

const char* to_string(InstrumentFilter::Kind kind);

}  // namespace tradeflow
