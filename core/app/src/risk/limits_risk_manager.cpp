#include "tradeflow/risk/limits_risk_manager.hpp"

#include "tradeflow/common/log.hpp"

#include <set>

namespace tradeflow {

using domain::InstrumentIndex;
using domain::OrderRequestOpen;
using domain::RiskLimits;

namespace {

std::string exceeded(const char* limit, const Decimal& value,
                     const Decimal& threshold) {
  return std::string(limit) + " exceeded: " + value.to_string() + " > " +
         threshold.to_string();
}

Decimal pending_for(const std::map<InstrumentIndex, Decimal>& pending,
                    InstrumentIndex instrument) {
  auto it = pending.find(instrument);
  return it == pending.end() ? Decimal{0} : it->second;
}

}  // namespace

LimitsRiskManager::LimitsRiskManager(domain::RiskConfiguration config)
    : config_(std::move(config)) {}

RiskCheckResult LimitsRiskManager::check(
    const EngineState& state, std::vector<domain::OrderRequestCancel> cancels,
    std::vector<OrderRequestOpen> opens) {
  RiskCheckResult result;
  result.approved_cancels = std::move(cancels);

  std::map<InstrumentIndex, Decimal> pending;
  for (auto& request : opens) {
    if (auto reason = checkOpen(state, request, pending)) {
      log::warn("RiskManager", "refused open cid=", request.key.cid,
                " instrument=", request.key.instrument, ": ", *reason);
      result.refused_opens.push_back({std::move(request), std::move(*reason)});
      continue;
    }
    pending[request.key.instrument] +=
        request.quantity * Decimal{domain::side_sign(request.side)};
    result.approved_opens.push_back(std::move(request));
  }
  return result;
}

std::optional<std::string> LimitsRiskManager::checkOpen(
    const EngineState& state, const OrderRequestOpen& request,
    const std::map<InstrumentIndex, Decimal>& pending) const {
  const InstrumentIndex index = request.key.instrument;
  if (index >= state.instruments().size()) {
    return "unknown instrument index " + std::to_string(index);
  }
  const InstrumentState& instrument = state.instrument(index);

  // --- Connectivity ---------------------------------------------------------
  if (!state.exchangeHealthy(instrument.exchange)) {
    return std::string("exchange ") +
           domain::to_string(state.catalogue().exchange(instrument.exchange).id) +
           " is not healthy";
  }

  // --- Effective limits -------------------------------------------------------
  const RiskLimits* limits = config_.effective_limits(index);
  if (limits == nullptr || limits->empty()) {
    return std::nullopt;
  }

  // --- Direction --------------------------------------------------------------
  const Decimal current =
      instrument.positions.netQuantity() + pending_for(pending, index);
  const Decimal projected =
      current + request.quantity * Decimal{domain::side_sign(request.side)};
  if (projected.abs() <= current.abs()) {
    return std::nullopt;
  }

  if (limits->max_position_quantity &&
      projected.abs() > *limits->max_position_quantity) {
    return exceeded("max_position_quantity", projected.abs(),
                    *limits->max_position_quantity);
  }

  const bool needs_price = limits->max_position_notional ||
                           limits->max_exposure_percent || limits->max_leverage;
  if (!needs_price) {
    return std::nullopt;
  }

  // --- Reference price --------------------------------------------------------
  std::optional<Decimal> price;
  if (request.price.is_positive()) {
    price = request.price;
  } else {
    price = instrument.market.last_price;
  }
  if (!price) {
    return "no reference price for instrument " + std::to_string(index);
  }

  const Decimal notional = projected.abs() * *price;
  if (limits->max_position_notional && notional > *limits->max_position_notional) {
    return exceeded("max_position_notional", notional,
                    *limits->max_position_notional);
  }

  if (!limits->max_exposure_percent && !limits->max_leverage) {
    return std::nullopt;
  }

  // --- Equity -----------------------------------------------------------------
  std::set<domain::AssetIndex> pricing_assets;
  for (const auto& entry : state.catalogue().instruments()) {
    pricing_assets.insert(entry.pricing_asset());
  }
  Decimal equity;
  for (domain::AssetIndex asset : pricing_assets) {
    equity += state.asset(asset).balance.total;
  }

  // Equity marks filled positions only; gross exposure includes the
  // projected orders.
  Decimal gross;
  for (const auto& other : state.instruments()) {
    const Decimal held = other.positions.netQuantity();
    Decimal net = held + pending_for(pending, other.instrument);
    std::optional<Decimal> mark = other.market.last_price;
    if (other.instrument == index) {
      net = projected;
      mark = price;
    }
    if (!mark) {
      continue;
    }
    equity += held * *mark;
    gross += (net * *mark).abs();
  }

  if (!equity.is_positive()) {
    return "equity " + equity.to_string() + " is not positive";
  }

  if (limits->max_exposure_percent) {
    const Decimal exposure = notional / equity;
    if (exposure > *limits->max_exposure_percent) {
      return exceeded("max_exposure_percent", exposure,
                      *limits->max_exposure_percent);
    }
  }
  if (limits->max_leverage) {
    const Decimal leverage = gross / equity;
    if (leverage > *limits->max_leverage) {
      return exceeded("max_leverage", leverage, *limits->max_leverage);
    }
  }
  return std::nullopt;
}

}  // namespace tradeflow
