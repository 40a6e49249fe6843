#pragma once

#include "tradeflow/domain/identifiers.hpp"
#include "tradeflow/numeric/decimal.hpp"

#include <optional>
#include <vector>

namespace tradeflow {
namespace domain {

// -----------------------------------------------------------------------------
// RiskLimits: pre-trade thresholds enforced by LimitsRiskManager
// -----------------------------------------------------------------------------
//
// @brief  Every field is optional; an absent field is not checked.
//
// @details
//   max_position_notional  |projected position * price| must not exceed it.
//   max_position_quantity  |projected position| must not exceed it.
//   max_leverage           Σ |notional| over all instruments / equity.
//   max_exposure_percent   |instrument notional| / equity, in (0, 1].
//
// validate() throws ValidationError for non-positive values and for an
// exposure percent above 1.
// -----------------------------------------------------------------------------
struct RiskLimits {
  std::optional<Decimal> max_position_notional;
  std::optional<Decimal> max_position_quantity;
  std::optional<Decimal> max_leverage;
  std::optional<Decimal> max_exposure_percent;

  void validate() const;

  bool empty() const {
    return !max_position_notional && !max_position_quantity && !max_leverage &&
           !max_exposure_percent;
  }
};

bool operator==(const RiskLimits& a, const RiskLimits& b);

struct RiskInstrumentLimits {
  InstrumentIndex index{0};
  RiskLimits limits;
};

// -----------------------------------------------------------------------------
// RiskConfiguration
// -----------------------------------------------------------------------------
//
// @brief  Global limits plus per-instrument overrides.
//
// @details
// An override replaces the global limits for that instrument; the two are
// never merged. instruments is kept sorted by index with at most one entry
// per index.
//
// set_instrument_limits() rejects indices >= instrument_count with a
// ValidationError; passing std::nullopt removes the override.
// -----------------------------------------------------------------------------
class RiskConfiguration {
 public:
  RiskConfiguration() = default;

  const std::optional<RiskLimits>& global() const { return global_; }
  const std::vector<RiskInstrumentLimits>& instruments() const {
    return instruments_;
  }

  void set_global_limits(std::optional<RiskLimits> limits);

  void set_instrument_limits(InstrumentIndex index,
                             std::optional<RiskLimits> limits,
                             std::size_t instrument_count);

  // Override for the instrument, if any.
  const RiskLimits* instrument_limits(InstrumentIndex index) const;

  // Override if present, else global, else nullptr.
  const RiskLimits* effective_limits(InstrumentIndex index) const;

  // Re-checks every stored limit and index bound (used after decoding).
  void validate(std::size_t instrument_count) const;

 private:
  std::optional<RiskLimits> global_;
  std::vector<RiskInstrumentLimits> instruments_;
};

}  // namespace domain
}  // namespace tradeflow
