#include "tradeflow/domain/risk_limits.hpp"

#include "tradeflow/common/error.hpp"

#include <algorithm>
#include <string>

namespace tradeflow {
namespace domain {

namespace {

void ensure_positive(const std::optional<Decimal>& value, const char* field) {
  if (value && !value->is_positive()) {
    throw ValidationError(std::string("risk limit ") + field +
                          " must be positive, received " + value->to_string());
  }
}

void ensure_index(InstrumentIndex index, std::size_t instrument_count) {
  if (index >= instrument_count) {
    throw ValidationError("risk limits instrument index " +
                          std::to_string(index) + " out of bounds (" +
                          std::to_string(instrument_count) + " instruments)");
  }
}

}  // namespace

void RiskLimits::validate() const {
  ensure_positive(max_position_notional, "max_position_notional");
  ensure_positive(max_position_quantity, "max_position_quantity");
  ensure_positive(max_leverage, "max_leverage");
  ensure_positive(max_exposure_percent, "max_exposure_percent");
  if (max_exposure_percent && *max_exposure_percent > Decimal{1}) {
    throw ValidationError("risk limit max_exposure_percent must be in (0, 1], "
                          "received " +
                          max_exposure_percent->to_string());
  }
}

bool operator==(const RiskLimits& a, const RiskLimits& b) {
  return a.max_position_notional == b.max_position_notional &&
         a.max_position_quantity == b.max_position_quantity &&
         a.max_leverage == b.max_leverage &&
         a.max_exposure_percent == b.max_exposure_percent;
}

void RiskConfiguration::set_global_limits(std::optional<RiskLimits> limits) {
  if (limits) {
    limits->validate();
  }
  global_ = std::move(limits);
}

void RiskConfiguration::set_instrument_limits(InstrumentIndex index,
                                              std::optional<RiskLimits> limits,
                                              std::size_t instrument_count) {
  ensure_index(index, instrument_count);

  auto it = std::lower_bound(
      instruments_.begin(), instruments_.end(), index,
      [](const RiskInstrumentLimits& entry, InstrumentIndex i) {
        return entry.index < i;
      });
  const bool exists = it != instruments_.end() && it->index == index;

  if (!limits) {
    if (exists) {
      instruments_.erase(it);
    }
    return;
  }

  limits->validate();
  if (exists) {
    it->limits = std::move(*limits);
  } else {
    instruments_.insert(it, RiskInstrumentLimits{index, std::move(*limits)});
  }
}

const RiskLimits* RiskConfiguration::instrument_limits(
    InstrumentIndex index) const {
  auto it = std::lower_bound(
      instruments_.begin(), instruments_.end(), index,
      [](const RiskInstrumentLimits& entry, InstrumentIndex i) {
        return entry.index < i;
      });
  if (it != instruments_.end() && it->index == index) {
    return &it->limits;
  }
  return nullptr;
}

const RiskLimits* RiskConfiguration::effective_limits(
    InstrumentIndex index) const {
  if (const RiskLimits* limits = instrument_limits(index)) {
    return limits;
  }
  return global_ ? &*global_ : nullptr;
}

void RiskConfiguration::validate(std::size_t instrument_count) const {
  if (global_) {
    global_->validate();
  }
  for (std::size_t i = 0; i < instruments_.size(); ++i) {
    ensure_index(instruments_[i].index, instrument_count);
    instruments_[i].limits.validate();
    if (i > 0 && instruments_[i - 1].index >= instruments_[i].index) {
      throw ValidationError("risk limits instrument entries must be unique "
                            "and sorted by index");
    }
  }
}

}  // namespace domain
}  // namespace tradeflow
