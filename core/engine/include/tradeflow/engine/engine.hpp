#pragma once

#include "tradeflow/audit/audit.hpp"
#include "tradeflow/audit/audit_channel.hpp"
#include "tradeflow/audit/engine_error.hpp"
#include "tradeflow/common/error.hpp"
#include "tradeflow/common/log.hpp"
#include "tradeflow/common/overloaded.hpp"
#include "tradeflow/engine/execution_tx_map.hpp"
#include "tradeflow/events/engine_event.hpp"
#include "tradeflow/events/engine_feed.hpp"
#include "tradeflow/risk/risk_manager.hpp"
#include "tradeflow/state/engine_state.hpp"
#include "tradeflow/statistic/trading_summary.hpp"
#include "tradeflow/strategy/strategy.hpp"
#include "tradeflow/time/clock.hpp"

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace tradeflow {

enum class EngineStatus {
  Running,
  Draining,
  Terminated,
};

inline const char* to_string(EngineStatus status) {
  switch (status) {
    case EngineStatus::Running:
      return "Running";
    case EngineStatus::Draining:
      return "Draining";
    case EngineStatus::Terminated:
      return "Terminated";
  }
  return "Unknown";
}

// Everything the system prepares before the engine exists.
struct EngineParts {
  std::shared_ptr<IClock> clock;
  EngineState state;
  ExecutionTxMap execution;
  std::optional<AuditSender> audit;
  Decimal risk_free_return;
};

// -----------------------------------------------------------------------------
// IEngine: strategy-independent handle the System drives
// -----------------------------------------------------------------------------
// Engine<StrategyT, RiskManagerT> is the only implementation. The System
// stores it behind this interface so that the orchestrator itself does not
// have to be a template.
// -----------------------------------------------------------------------------
class IEngine {
 public:
  virtual ~IEngine() = default;

  // Emits the audit Snapshot tick (sequence 0). Idempotent.
  virtual void begin() = 0;

  virtual EngineStatus process(EngineEvent event) = 0;

  // Pops and processes until Terminated or until the feed is closed.
  virtual void run(EngineFeed& feed) = 0;

  virtual EngineStatus status() const = 0;
  virtual domain::Sequence sequence() const = 0;
  virtual const EngineState& state() const = 0;

  virtual void setRiskFreeReturn(Decimal risk_free_return) = 0;
  virtual TradingSummary tradingSummary(const TimeInterval& interval) const = 0;
};

// -----------------------------------------------------------------------------
// Engine: the single-threaded event processor
// -----------------------------------------------------------------------------
//
// @brief  Processes one EngineEvent at a time: updates EngineState, asks the
//         strategy and the risk manager for decisions, dispatches approved
//         requests to the exchanges and writes one audit tick per event.
//
// @details
// Status: Running → Draining → Terminated.
//
// Every processed event gets the next sequence number and the clock's
// engine time. Market items are shown to the clock first
// (observe_market_time), so a HistoricalClock stamps the event with its own
// exchange time.
//
// Event handling:
//
//   Shutdown            trading disabled, Draining.
//   TradingStateUpdate  on an Enabled → Disabled change the strategy's
//                       onTradingDisabled() orders are dispatched without
//                       a risk check.
//   Command             SendOpenRequests / SendCancelRequests /
//                       CancelOrders / ClosePositions, all through risk.
//   Account             applyAccount(); closed positions become
//                       PositionExited outputs.
//   Market              applyMarket(); then, with trading Enabled and the
//                       item's exchange healthy, generateAlgoOrders()
//                       through risk. Algorithmic opens for an unhealthy
//                       exchange are dropped first.
//
// A healthy → unhealthy connectivity edge (account or market) runs the
// strategy's onDisconnect() through risk, once per edge.
//
// Dispatch, per request:
//   1. route check: known instrument, matching exchange, a registered
//      sender. Failures are Recoverable errors.
//   2. cancels resolve through OrderManager::prepareCancel(); a cancel for
//      an order that is not active is dropped silently.
//      opens: a Market order priced 0 takes the last market price; the
//      request must validate and its cid must be free.
//   3. record in flight with (sequence, time), then send. A refused send is
//      undone and recorded as a Recoverable error.
// Requests that were sent appear in one OrdersSent output per batch.
//
// Draining:
//   Commands and trading-state updates are refused with a Recoverable
//   error. Account and market events are still applied. FeedEnded is
//   emitted, with its own sequence number, as soon as no request is in
//   flight. An Unrecoverable error from an account event ends the stream
//   at once.
//
// Thread model: every member runs on the one thread that owns the engine.
// -----------------------------------------------------------------------------
template <typename StrategyT = DefaultStrategy, typename RiskManagerT = DefaultRiskManager>
class Engine final : public IEngine {
 public:
  Engine(EngineParts parts, StrategyT strategy, RiskManagerT risk)
      : clock_(std::move(parts.clock)),
        state_(std::move(parts.state)),
        execution_(std::move(parts.execution)),
        audit_(std::move(parts.audit)),
        strategy_(std::move(strategy)),
        risk_(std::move(risk)) {
    if (!clock_) {
      throw std::logic_error("Engine requires a clock");
    }
    summary_ = TradingSummaryGenerator(state_.cataloguePtr(),
                                       std::move(parts.risk_free_return),
                                       clock_->time_engine());
    for (const AssetState& asset : state_.assets()) {
      if (asset.time_exchange) {
        summary_.update_from_balance(
            domain::AssetBalance{asset.asset, asset.balance, *asset.time_exchange});
      }
    }
  }

  void begin() override {
    if (begun_) {
      return;
    }
    begun_ = true;
    log::info("Engine", "started: ", state_.catalogue().instruments().size(),
              " instruments, trading ", to_string(state_.trading()), ".");
    emit(AuditTick{EngineContext{sequence_, clock_->time_engine()},
                   AuditSnapshot{state_}});
  }

  EngineStatus process(EngineEvent event) override {
    if (status_ == EngineStatus::Terminated) {
      throw std::logic_error("Engine::process() called after termination");
    }
    begin();

    const EngineContext context = nextContext(event);
    summary_.update_time_now(context.time);

    Outcome outcome;
    std::visit(overloaded{
                   [&](const Shutdown&) { onShutdown(); },
                   [&](const TradingStateUpdate& update) {
                     onTradingState(update, context, outcome);
                   },
                   [&](const Command& command) { onCommand(command, context, outcome); },
                   [&](const AccountStreamEvent& account) {
                     onAccount(account, context, outcome);
                   },
                   [&](const MarketStreamEvent& market) {
                     onMarket(market, context, outcome);
                   },
               },
               event);

    for (const auto& error : outcome.errors) {
      if (error.is_unrecoverable()) {
        log::error("Engine", "seq=", context.sequence, " ", error.message);
      } else {
        log::warn("Engine", "seq=", context.sequence, " ", error.message);
      }
    }

    const bool unrecoverable = outcome.unrecoverable;
    const char* kind = event_kind(event);
    emit(AuditTick{context, ProcessAudit{std::move(event), kind,
                                         std::move(outcome.outputs),
                                         std::move(outcome.errors)}});

    if (unrecoverable) {
      status_ = EngineStatus::Draining;
      state_.setTrading(TradingState::Disabled);
      terminate();
    } else if (status_ == EngineStatus::Draining && !state_.hasInFlight()) {
      terminate();
    }
    return status_;
  }

  void run(EngineFeed& feed) override {
    begin();
    while (status_ != EngineStatus::Terminated) {
      auto event = feed.pop();
      if (!event) {
        log::warn("Engine", "feed closed before shutdown completed (seq=", sequence_,
                  ").");
        if (audit_) {
          audit_->close();
        }
        return;
      }
      process(std::move(*event));
    }
  }

  EngineStatus status() const override { return status_; }
  domain::Sequence sequence() const override { return sequence_; }
  const EngineState& state() const override { return state_; }

  void setRiskFreeReturn(Decimal risk_free_return) override {
    summary_.set_risk_free_return(std::move(risk_free_return));
  }

  TradingSummary tradingSummary(const TimeInterval& interval) const override {
    return summary_.generate(interval);
  }

  const TradingSummaryGenerator& summary() const { return summary_; }
  StrategyT& strategy() { return strategy_; }
  RiskManagerT& risk() { return risk_; }

 private:
  struct Outcome {
    std::vector<EngineOutput> outputs;
    std::vector<EngineError> errors;
    bool unrecoverable{false};
  };

  EngineContext nextContext(const EngineEvent& event) {
    if (const auto* market = std::get_if<MarketStreamEvent>(&event)) {
      if (const auto* item = std::get_if<MarketEvent>(market)) {
        clock_->observe_market_time(item->time_exchange);
      }
    }
    return EngineContext{++sequence_, clock_->time_engine()};
  }

  void emit(AuditTick tick) {
    if (audit_) {
      audit_->send(std::move(tick));
    }
  }

  void terminate() {
    emit(AuditTick{EngineContext{++sequence_, clock_->time_engine()}, FeedEnded{}});
    if (audit_) {
      audit_->close();
    }
    status_ = EngineStatus::Terminated;
    log::info("Engine", "terminated at seq=", sequence_, ".");
  }

  bool refuseWhileDraining(const char* what, Outcome& outcome) const {
    if (status_ != EngineStatus::Draining) {
      return false;
    }
    outcome.errors.push_back(
        EngineError::recoverable(std::string("engine is draining; ") + what + " refused"));
    return true;
  }

  // ---------------------------------------------------------------------------
  // Event handlers
  // ---------------------------------------------------------------------------
  void onShutdown() {
    state_.setTrading(TradingState::Disabled);
    if (status_ == EngineStatus::Running) {
      status_ = EngineStatus::Draining;
      log::info("Engine", "shutdown requested; draining.");
    }
  }

  void onTradingState(const TradingStateUpdate& update, const EngineContext& context,
                        Outcome& outcome) {
    if (refuseWhileDraining("trading state update", outcome)) {
      return;
    }
    if (!state_.setTrading(update.state)) {
      return;
    }
    log::info("Engine", "trading ", to_string(update.state), ".");
    if (update.state == TradingState::Disabled) {
      OrderRequests requests = strategy_.onTradingDisabled(state_);
      dispatch(OrderOrigin::TradingDisabled, std::move(requests.cancels),
               std::move(requests.opens), context, outcome);
    }
  }

  void onCommand(const Command& command, const EngineContext& context,
                  Outcome& outcome) {
    if (refuseWhileDraining(command_name(command), outcome)) {
      return;
    }
    std::visit(overloaded{
                   [&](const SendOpenRequests& open) {
                     checkedDispatch(OrderOrigin::Command, {}, open.requests, context,
                                      outcome);
                   },
                   [&](const SendCancelRequests& cancel) {
                     checkedDispatch(OrderOrigin::Command, cancel.requests, {}, context,
                                      outcome);
                   },
                   [&](const CancelOrders& cancel) {
                     checkedDispatch(OrderOrigin::Command, cancelRequests(cancel.filter),
                                      {}, context, outcome);
                   },
                   [&](const ClosePositions& close) {
                     OrderRequests requests = closeRequests(close.filter);
                     checkedDispatch(OrderOrigin::Command, std::move(requests.cancels),
                                      std::move(requests.opens), context, outcome);
                   },
               },
               command);
  }

  void onAccount(const AccountStreamEvent& event, const EngineContext& context,
                  Outcome& outcome) {
    StateUpdate update = state_.applyAccount(event);
    absorb(update, outcome);
    if (outcome.unrecoverable) {
      return;
    }
    if (update.disconnected) {
      onDisconnect(*update.disconnected, context, outcome);
    }
  }

  void onMarket(const MarketStreamEvent& event, const EngineContext& context,
                 Outcome& outcome) {
    StateUpdate update = state_.applyMarket(event);
    absorb(update, outcome);
    if (update.disconnected) {
      onDisconnect(*update.disconnected, context, outcome);
      return;
    }

    const auto* item = std::get_if<MarketEvent>(&event);
    if (item == nullptr || !update.errors.empty() || status_ != EngineStatus::Running ||
        state_.trading() != TradingState::Enabled) {
      return;
    }
    const domain::ExchangeIndex exchange = state_.instrument(item->instrument).exchange;
    if (!state_.exchangeHealthy(exchange)) {
      return;
    }

    OrderRequests requests = strategy_.generateAlgoOrders(state_);
    std::vector<domain::OrderRequestOpen> opens;
    opens.reserve(requests.opens.size());
    for (auto& open : requests.opens) {
      if (exchangeHealthy(open.key.exchange)) {
        opens.push_back(std::move(open));
      } else {
        log::debug("Engine", "algo open ", open.key.cid,
                   " suppressed: exchange not healthy.");
      }
    }
    checkedDispatch(OrderOrigin::Algo, std::move(requests.cancels), std::move(opens),
                     context, outcome);
  }

  void onDisconnect(domain::ExchangeIndex exchange, const EngineContext& context,
                     Outcome& outcome) {
    log::warn("Engine", "exchange ", state_.catalogue().exchange(exchange).id,
              " disconnected.");
    OrderRequests requests = strategy_.onDisconnect(state_, exchange);
    checkedDispatch(OrderOrigin::Disconnect, std::move(requests.cancels),
                     std::move(requests.opens), context, outcome);
  }

  void absorb(StateUpdate& update, Outcome& outcome) {
    for (const auto& trade : update.trades) {
      summary_.update_from_trade(trade);
    }
    for (const auto& balance : update.balances) {
      summary_.update_from_balance(balance);
    }
    for (auto& position : update.positions_exited) {
      summary_.update_from_position(position);
      outcome.outputs.push_back(PositionExited{std::move(position)});
    }
    if (update.unrecoverable()) {
      outcome.unrecoverable = true;
    }
    for (auto& error : update.errors) {
      outcome.errors.push_back(std::move(error));
    }
  }

  // ---------------------------------------------------------------------------
  // Bulk command expansion
  // ---------------------------------------------------------------------------
  std::vector<domain::OrderRequestCancel> cancelRequests(const InstrumentFilter& filter) const {
    std::vector<domain::OrderRequestCancel> cancels;
    for (const auto& instrument : state_.catalogue().instruments()) {
      if (!filter.matches(instrument)) {
        continue;
      }
      for (auto& cancel : state_.instrument(instrument.index).orders.cancelRequests()) {
        cancels.push_back(std::move(cancel));
      }
    }
    return cancels;
  }

  // Cancels for every active order, then one Market IOC per strategy holding
  // a position. The cid is "close-<instrument>", or
  // "close-<instrument>-<strategy>" when several strategies hold positions.
  OrderRequests closeRequests(const InstrumentFilter& filter) const {
    OrderRequests requests;
    requests.cancels = cancelRequests(filter);

    for (const auto& instrument : state_.catalogue().instruments()) {
      if (!filter.matches(instrument)) {
        continue;
      }
      const auto& positions = state_.instrument(instrument.index).positions.positions();
      const std::optional<Decimal> last_price = state_.lastPrice(instrument.index);
      for (const auto& [strategy, position] : positions) {
        if (position.quantity_abs.is_zero()) {
          continue;
        }
        std::string cid = "close-" + std::to_string(instrument.index);
        if (positions.size() > 1) {
          cid += "-" + strategy.str();
        }
        domain::OrderRequestOpen open;
        open.key = domain::OrderKey{instrument.exchange, instrument.index, strategy,
                                    domain::ClientOrderId(std::move(cid))};
        open.side = domain::opposite(position.side);
        open.price = last_price ? *last_price : position.price_entry_average;
        open.quantity = position.quantity_abs;
        open.kind = domain::OrderKind::Market;
        open.time_in_force = domain::TimeInForce::immediate_or_cancel();
        requests.opens.push_back(std::move(open));
      }
    }
    return requests;
  }

  // ---------------------------------------------------------------------------
  // Risk and dispatch
  // ---------------------------------------------------------------------------
  void checkedDispatch(OrderOrigin origin, std::vector<domain::OrderRequestCancel> cancels,
                        std::vector<domain::OrderRequestOpen> opens,
                        const EngineContext& context, Outcome& outcome) {
    if (cancels.empty() && opens.empty()) {
      return;
    }
    for (auto& open : opens) {
      resolveReferencePrice(open);
    }
    RiskCheckResult checked = risk_.check(state_, std::move(cancels), std::move(opens));
    for (auto& refused : checked.refused_cancels) {
      outcome.errors.push_back(
          EngineError::recoverable(std::move(refused.reason), OrderRequest{refused.request}));
    }
    for (auto& refused : checked.refused_opens) {
      outcome.errors.push_back(
          EngineError::recoverable(std::move(refused.reason), OrderRequest{refused.request}));
    }
    dispatch(origin, std::move(checked.approved_cancels), std::move(checked.approved_opens),
             context, outcome);
  }

  void dispatch(OrderOrigin origin, std::vector<domain::OrderRequestCancel> cancels,
                std::vector<domain::OrderRequestOpen> opens, const EngineContext& context,
                Outcome& outcome) {
    OrdersSent sent;
    sent.origin = origin;

    for (auto& cancel : cancels) {
      if (auto error = routeError(cancel.key)) {
        outcome.errors.push_back(EngineError::recoverable(*error, OrderRequest{cancel}));
        continue;
      }
      auto prepared = state_.instrument(cancel.key.instrument).orders.prepareCancel(cancel);
      if (!prepared) {
        log::debug("Engine", "cancel for ", cancel.key.cid, " dropped: order not active.");
        continue;
      }
      if (send(OrderRequest{*prepared}, prepared->key.exchange, context, outcome)) {
        sent.cancels.push_back(std::move(*prepared));
      }
    }

    for (auto& open : opens) {
      if (auto error = routeError(open.key)) {
        outcome.errors.push_back(EngineError::recoverable(*error, OrderRequest{open}));
        continue;
      }
      resolveReferencePrice(open);
      try {
        open.validate();
      } catch (const ValidationError& e) {
        outcome.errors.push_back(EngineError::recoverable(e.what(), OrderRequest{open}));
        continue;
      }
      if (!state_.instrument(open.key.instrument).orders.canOpen(open.key.cid)) {
        outcome.errors.push_back(EngineError::recoverable(
            "client order id " + open.key.cid.str() + " is already in use",
            OrderRequest{open}));
        continue;
      }
      if (send(OrderRequest{open}, open.key.exchange, context, outcome)) {
        sent.opens.push_back(std::move(open));
      }
    }

    if (!sent.cancels.empty() || !sent.opens.empty()) {
      log::debug("Engine", "seq=", context.sequence, " sent ", sent.cancels.size(),
                 " cancels and ", sent.opens.size(), " opens (", to_string(origin), ").");
      outcome.outputs.push_back(std::move(sent));
    }
  }

  bool send(OrderRequest request, domain::ExchangeIndex exchange,
            const EngineContext& context, Outcome& outcome) {
    state_.recordInFlight(request, context.sequence, context.time);
    if (execution_.send(exchange, request)) {
      return true;
    }
    state_.forgetInFlight(request);
    outcome.errors.push_back(EngineError::recoverable(
        std::string("dispatch queue for exchange ") +
            domain::to_string(state_.catalogue().exchange(exchange).id) + " is closed",
        std::move(request)));
    return false;
  }

  std::optional<std::string> routeError(const domain::OrderKey& key) const {
    const auto& instruments = state_.catalogue().instruments();
    if (key.instrument >= instruments.size()) {
      return "unknown instrument index " + std::to_string(key.instrument);
    }
    if (instruments[key.instrument].exchange != key.exchange) {
      return "instrument " + instruments[key.instrument].name_internal +
             " is not traded on exchange index " + std::to_string(key.exchange);
    }
    if (!execution_.contains(key.exchange)) {
      return std::string("no execution client for exchange ") +
             domain::to_string(state_.catalogue().exchange(key.exchange).id);
    }
    return std::nullopt;
  }

  bool exchangeHealthy(domain::ExchangeIndex exchange) const {
    return exchange < state_.connectivity().size() && state_.exchangeHealthy(exchange);
  }

  void resolveReferencePrice(domain::OrderRequestOpen& open) const {
    if (open.kind != domain::OrderKind::Market || !open.price.is_zero() ||
        open.key.instrument >= state_.instruments().size()) {
      return;
    }
    if (auto price = state_.lastPrice(open.key.instrument)) {
      open.price = *price;
    }
  }

  std::shared_ptr<IClock> clock_;
  EngineState state_;
  ExecutionTxMap execution_;
  std::optional<AuditSender> audit_;
  StrategyT strategy_;
  RiskManagerT risk_;
  TradingSummaryGenerator summary_;

  domain::Sequence sequence_{0};
  EngineStatus status_{EngineStatus::Running};
  bool begun_{false};
};

}  // namespace tradeflow
