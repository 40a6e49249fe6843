#include "tradeflow/engine/system.hpp"

#include "tradeflow/common/error.hpp"
#include "tradeflow/common/log.hpp"
#include "tradeflow/common/overloaded.hpp"
#include "tradeflow/execution/mock_execution_client.hpp"
#include "tradeflow/time/live_clock.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

namespace tradeflow {

const char* to_string(FeedMode mode) {
  return mode == FeedMode::Stream ? "Stream" : "Iterator";
}

const char* to_string(ExecutionMode mode) {
  return mode == ExecutionMode::Threaded ? "Threaded" : "Inline";
}

// -----------------------------------------------------------------------------
// Ingress validation
// -----------------------------------------------------------------------------
namespace {

void validate_key(const IndexedInstruments& catalogue, const domain::OrderKey& key) {
  if (key.instrument >= catalogue.instruments().size()) {
    throw ValidationError("order references unknown instrument index " +
                          std::to_string(key.instrument));
  }
  const IndexedInstrument& instrument = catalogue.instrument(key.instrument);
  if (instrument.exchange != key.exchange) {
    throw ValidationError("order for " + instrument.name_internal +
                          " names exchange index " + std::to_string(key.exchange) +
                          ", expected " + std::to_string(instrument.exchange));
  }
  if (key.strategy.empty()) {
    throw ValidationError("order has an empty StrategyId");
  }
  if (key.cid.empty()) {
    throw ValidationError("order has an empty ClientOrderId");
  }
}

void validate_filter(const IndexedInstruments& catalogue, const InstrumentFilter& filter) {
  for (auto exchange : filter.exchange_set()) {
    if (exchange >= catalogue.exchanges().size()) {
      throw ValidationError("filter references unknown exchange index " +
                            std::to_string(exchange));
    }
  }
  for (auto instrument : filter.instrument_set()) {
    if (instrument >= catalogue.instruments().size()) {
      throw ValidationError("filter references unknown instrument index " +
                            std::to_string(instrument));
    }
  }
}

void validate_exchange(const IndexedInstruments& catalogue, domain::ExchangeId exchange) {
  if (!catalogue.try_find_exchange_index(exchange)) {
    throw ValidationError(std::string("exchange ") + domain::to_string(exchange) +
                          " is not in the catalogue");
  }
}

// Account events are not checked beyond their exchange: an account event
// that references unknown state is the engine's to classify (Unrecoverable).
void validate_event(const IndexedInstruments& catalogue, const EngineEvent& event) {
  std::visit(
      overloaded{
          [](const Shutdown&) {},
          [](const TradingStateUpdate&) {},
          [&](const Command& command) {
            std::visit(overloaded{
                           [&](const SendOpenRequests& open) {
                             for (const auto& request : open.requests) {
                               validate_key(catalogue, request.key);
                               request.validate();
                             }
                           },
                           [&](const SendCancelRequests& cancel) {
                             for (const auto& request : cancel.requests) {
                               validate_key(catalogue, request.key);
                             }
                           },
                           [&](const CancelOrders& cancel) {
                             validate_filter(catalogue, cancel.filter);
                           },
                           [&](const ClosePositions& close) {
                             validate_filter(catalogue, close.filter);
                           },
                       },
                       command);
          },
          [&](const AccountStreamEvent& account) {
            if (const auto* reconnecting = std::get_if<Reconnecting>(&account)) {
              validate_exchange(catalogue, reconnecting->exchange);
            }
          },
          [&](const MarketStreamEvent& market) {
            if (const auto* reconnecting = std::get_if<Reconnecting>(&market)) {
              validate_exchange(catalogue, reconnecting->exchange);
              return;
            }
            const auto& item = std::get<MarketEvent>(market);
            if (item.instrument >= catalogue.instruments().size()) {
              throw ValidationError("market event references unknown instrument index " +
                                    std::to_string(item.instrument));
            }
            const IndexedInstrument& instrument = catalogue.instrument(item.instrument);
            if (instrument.exchange_id != item.exchange) {
              throw ValidationError(std::string("market event for ") +
                                    instrument.name_internal + " names exchange " +
                                    domain::to_string(item.exchange));
            }
          },
      },
      event);
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor / Destructor
// -----------------------------------------------------------------------------
System::System(Parts parts)
    : mode_(parts.mode),
      catalogue_(std::move(parts.catalogue)),
      feed_(std::move(parts.feed)),
      engine_(std::move(parts.engine)),
      routers_(std::move(parts.routers)),
      market_(std::move(parts.market)),
      audit_(std::move(parts.audit)),
      worker_result_(worker_done_.get_future()) {
  if (!catalogue_ || !feed_ || !engine_) {
    throw std::logic_error("System requires a catalogue, a feed and an engine");
  }
}

System::~System() {
  if (started_ && !stopped_) {
    abort();
  }
}

// -----------------------------------------------------------------------------
// start(): routing threads, engine, market stream last
// -----------------------------------------------------------------------------
void System::start() {
  if (started_) {
    return;
  }
  started_ = true;

  for (auto& router : routers_) {
    router->start();
  }

  if (mode_ == FeedMode::Stream) {
    worker_ = std::thread([this] { runWorker(); });
  } else {
    engine_->begin();
  }

  if (market_ && mode_ == FeedMode::Stream) {
    market_->start();
  }

  log::info("System", "started (", to_string(mode_), " mode, ", routers_.size(),
            " routing threads, market stream ", market_ ? "on" : "off", ").");
}

void System::runWorker() {
  try {
    engine_->run(*feed_);
    worker_done_.set_value();
  } catch (const std::exception& e) {
    log::error("System", "engine stopped on exception: ", e.what());
    feed_->close();
    worker_done_.set_exception(std::current_exception());
  } catch (...) {
    log::error("System", "engine stopped on unknown exception.");
    feed_->close();
    worker_done_.set_exception(std::current_exception());
  }
  terminated_ = true;
}

// -----------------------------------------------------------------------------
// Feed-in
// -----------------------------------------------------------------------------
bool System::enqueue(EngineEvent event) {
  if (terminated_) {
    return false;
  }
  if (!feed_->push(std::move(event))) {
    return false;
  }
  ++events_sent_;
  return true;
}

void System::validate(const EngineEvent& event) const {
  validate_event(*catalogue_, event);
}

bool System::sendEvent(EngineEvent event) {
  validate(event);
  return enqueue(std::move(event));
}

std::size_t System::feedEvents(std::vector<EngineEvent> events) {
  for (const auto& event : events) {
    validate(event);
  }
  std::size_t sent = 0;
  for (auto& event : events) {
    if (!enqueue(std::move(event))) {
      break;
    }
    ++sent;
  }
  return sent;
}

bool System::setTradingEnabled(bool enabled) {
  return sendEvent(TradingStateUpdate{enabled ? TradingState::Enabled
                                               : TradingState::Disabled});
}

bool System::sendOpenRequests(std::vector<domain::OrderRequestOpen> requests) {
  return sendEvent(Command{SendOpenRequests{std::move(requests)}});
}

bool System::sendCancelRequests(std::vector<domain::OrderRequestCancel> requests) {
  return sendEvent(Command{SendCancelRequests{std::move(requests)}});
}

bool System::closePositions(InstrumentFilter filter) {
  return sendEvent(Command{ClosePositions{std::move(filter)}});
}

bool System::cancelOrders(InstrumentFilter filter) {
  return sendEvent(Command{CancelOrders{std::move(filter)}});
}

AuditReceiver System::takeAudit() {
  if (!audit_) {
    throw std::logic_error("audit is disabled or was already taken");
  }
  AuditReceiver receiver = std::move(*audit_);
  audit_.reset();
  return receiver;
}

std::size_t System::processPending() {
  if (mode_ != FeedMode::Iterator) {
    throw std::logic_error("processPending() requires Iterator feed mode");
  }
  if (!started_) {
    throw std::logic_error("processPending() before start()");
  }
  std::size_t processed = 0;
  while (engine_->status() != EngineStatus::Terminated) {
    auto event = feed_->try_pop();
    if (!event) {
      break;
    }
    engine_->process(std::move(*event));
    ++processed;
  }
  if (engine_->status() == EngineStatus::Terminated) {
    terminated_ = true;
  }
  return processed;
}

// -----------------------------------------------------------------------------
// Termination
// -----------------------------------------------------------------------------
void System::driveUntilTerminated(Timeout timeout) {
  using Clock = std::chrono::steady_clock;
  const auto deadline = timeout ? Clock::now() + *timeout : Clock::time_point::max();

  while (engine_->status() != EngineStatus::Terminated) {
    std::optional<EngineEvent> event;
    if (timeout) {
      const auto now = Clock::now();
      if (now >= deadline) {
        throw TimeoutError("engine did not drain within " +
                           std::to_string(timeout->count()) + " ms");
      }
      event = feed_->pop_for(deadline - now);
      if (!event) {
        if (feed_->closed()) {
          break;
        }
        continue;
      }
    } else {
      event = feed_->pop();
      if (!event) {
        break;
      }
    }
    engine_->process(std::move(*event));
  }
  terminated_ = true;
}

void System::awaitEngine(Timeout timeout) {
  if (timeout && worker_result_.wait_for(*timeout) == std::future_status::timeout) {
    throw TimeoutError("engine did not drain within " +
                       std::to_string(timeout->count()) + " ms");
  }
  if (worker_.joinable()) {
    worker_.join();
  }
  stopIo();
  worker_result_.get();
}

void System::stopIo() {
  if (stopped_) {
    return;
  }
  feed_->close();
  if (market_) {
    market_->stop();
  }
  for (auto& router : routers_) {
    router->stop();
  }
  stopped_ = true;
}

EngineState System::shutdown(Timeout timeout) {
  if (!started_) {
    throw std::logic_error("System::shutdown() before start()");
  }
  if (stopped_) {
    throw std::logic_error("System already stopped");
  }

  feed_->force_push(Shutdown{});
  if (mode_ == FeedMode::Stream) {
    awaitEngine(timeout);
  } else {
    driveUntilTerminated(timeout);
    stopIo();
  }

  log::info("System", "shut down at seq=", engine_->sequence(), ".");
  return engine_->state();
}

TradingSummary System::shutdownWithSummary(Decimal risk_free_return,
                                             const TimeInterval& interval,
                                             Timeout timeout) {
  shutdown(timeout);
  return tradingSummary(std::move(risk_free_return), interval);
}

EngineState System::shutdownAfterBacktest(Timeout timeout) {
  if (!started_) {
    throw std::logic_error("System::shutdownAfterBacktest() before start()");
  }
  if (market_) {
    using Clock = std::chrono::steady_clock;
    const auto deadline = timeout ? Clock::now() + *timeout : Clock::time_point::max();
    if (mode_ == FeedMode::Stream) {
      auto exhausted = market_->exhausted();
      if (timeout && exhausted.wait_until(deadline) == std::future_status::timeout) {
        throw TimeoutError("market stream still running after " +
                           std::to_string(timeout->count()) + " ms");
      }
      exhausted.wait();
    } else {
      while (engine_->status() != EngineStatus::Terminated) {
        if (Clock::now() >= deadline) {
          throw TimeoutError("market stream still running after " +
                             std::to_string(timeout->count()) + " ms");
        }
        if (!market_->pumpNext()) {
          break;
        }
        processPending();
      }
    }
  }

  if (engine_->status() == EngineStatus::Terminated) {
    terminated_ = true;
    stopIo();
    return engine_->state();
  }
  return shutdown(timeout);
}

void System::abort() {
  if (stopped_) {
    return;
  }
  // The worker finishes the event in hand, then sees a closed, empty feed.
  const std::size_t dropped = feed_->close_and_clear();
  if (market_) {
    market_->stop();
  }
  for (auto& router : routers_) {
    router->abort();
  }
  if (worker_.joinable()) {
    worker_.join();
  }
  stopped_ = true;
  terminated_ = true;
  log::warn("System", "aborted at seq=", engine_->sequence(), " (", dropped,
            " pending events dropped).");
}

TradingSummary System::tradingSummary(Decimal risk_free_return,
                                       const TimeInterval& interval) {
  if (engine_->status() != EngineStatus::Terminated) {
    throw std::logic_error("trading summary requested before the engine terminated");
  }
  engine_->setRiskFreeReturn(std::move(risk_free_return));
  return engine_->tradingSummary(interval);
}

SystemStats System::stats() const {
  SystemStats stats;
  stats.mode = mode_;
  stats.started = started_;
  stats.terminated = terminated_.load();
  stats.events_sent = events_sent_.load();
  stats.feed_pending = feed_->size();
  if (market_) {
    stats.market_forwarded = market_->forwarded();
    stats.market_skipped = market_->skipped();
  }
  return stats;
}

// -----------------------------------------------------------------------------
// SystemBuilder
// -----------------------------------------------------------------------------
SystemBuilder::SystemBuilder(SystemConfig config) : config_(std::move(config)) {}

SystemBuilder& SystemBuilder::clock(std::shared_ptr<IClock> clock) {
  clock_ = std::move(clock);
  return *this;
}

SystemBuilder& SystemBuilder::marketStream(std::unique_ptr<IMarketStream> stream) {
  market_stream_ = std::move(stream);
  return *this;
}

SystemBuilder& SystemBuilder::feedMode(FeedMode mode) {
  feed_mode_ = mode;
  return *this;
}

SystemBuilder& SystemBuilder::executionMode(ExecutionMode mode) {
  execution_mode_ = mode;
  return *this;
}

SystemBuilder& SystemBuilder::auditMode(AuditMode mode) {
  audit_mode_ = mode;
  return *this;
}

SystemBuilder& SystemBuilder::tradingState(TradingState state) {
  trading_state_ = state;
  return *this;
}

SystemBuilder& SystemBuilder::feedCapacity(std::size_t capacity) {
  if (capacity == 0) {
    throw ValidationError("feed capacity must be positive");
  }
  feed_capacity_ = capacity;
  return *this;
}

SystemBuilder& SystemBuilder::dispatchCapacity(std::size_t capacity) {
  if (capacity == 0) {
    throw ValidationError("dispatch capacity must be positive");
  }
  dispatch_capacity_ = capacity;
  return *this;
}

SystemBuilder& SystemBuilder::balance(BalanceOverride balance) {
  balance.balance.validate();
  balances_.push_back(std::move(balance));
  return *this;
}

SystemBuilder& SystemBuilder::auditOverflow(AuditOverflowPolicy policy,
                                             std::size_t high_water_mark) {
  if (high_water_mark == 0) {
    throw ValidationError("audit high-water mark must be positive");
  }
  audit_policy_ = policy;
  audit_high_water_mark_ = high_water_mark;
  return *this;
}

SystemBuilder& SystemBuilder::riskFreeReturn(Decimal risk_free_return) {
  risk_free_return_ = std::move(risk_free_return);
  return *this;
}

SystemBuilder& SystemBuilder::executionClient(std::shared_ptr<IExecutionClient> client) {
  if (!client) {
    throw ValidationError("execution client must not be null");
  }
  const domain::ExchangeId exchange = client->exchange();
  clients_[exchange] = std::move(client);
  return *this;
}

std::unique_ptr<System> SystemBuilder::buildWith(const EngineFactory& factory) {
  SystemConfig config = config_;
  config.validate();

  auto catalogue = std::make_shared<const IndexedInstruments>(config.instruments);
  std::shared_ptr<IClock> clock = clock_ ? clock_ : std::make_shared<LiveClock>();
  auto feed = std::make_shared<EngineFeed>(feed_capacity_);

  // Balance overrides land in the matching mock config when there is one.
  std::vector<BalanceOverride> unapplied;
  for (const auto& override_balance : balances_) {
    const domain::AssetIndex asset =
        catalogue->find_asset_index(override_balance.exchange, override_balance.asset);
    bool applied = false;
    for (auto& execution : config.executions) {
      auto& mock = std::get<MockExecutionConfig>(execution);
      if (mock.exchange != override_balance.exchange ||
          clients_.count(mock.exchange) != 0) {
        continue;
      }
      applied = true;
      bool replaced = false;
      for (auto& entry : mock.balances) {
        if (catalogue->find_asset_index(mock.exchange, entry.asset) == asset) {
          entry.balance = override_balance.balance;
          replaced = true;
        }
      }
      if (!replaced) {
        mock.balances.push_back(
            MockBalance{override_balance.asset, override_balance.balance, std::nullopt});
      }
    }
    if (!applied) {
      unapplied.push_back(override_balance);
    }
  }

  std::map<domain::ExchangeId, std::shared_ptr<IExecutionClient>> clients = clients_;
  for (const auto& execution : config.executions) {
    const domain::ExchangeId exchange = execution_exchange(execution);
    if (clients.count(exchange) != 0) {
      continue;
    }
    clients[exchange] = std::visit(
        [&](const MockExecutionConfig& mock) -> std::shared_ptr<IExecutionClient> {
          return std::make_shared<MockExecutionClient>(mock, catalogue, clock);
        },
        execution);
  }

  // Seed state from each venue, and give each venue a sender.
  EngineState state(catalogue, trading_state_);
  ExecutionTxMap execution;
  std::vector<std::unique_ptr<OrderRoutingThread>> routers;
  for (const auto& [exchange, client] : clients) {
    const domain::ExchangeIndex index = catalogue->find_exchange_index(exchange);

    AccountSnapshot snapshot = client->accountSnapshot();
    snapshot.exchange = index;
    StateUpdate update = state.applyAccount(AccountEvent{index, std::move(snapshot)});
    if (!update.errors.empty()) {
      throw ValidationError(std::string("account snapshot from ") +
                            domain::to_string(exchange) +
                            " rejected: " + update.errors.front().message);
    }

    if (execution_mode_ == ExecutionMode::Inline) {
      std::shared_ptr<IExecutionClient> inline_client = client;
      execution.insert(index, [index, inline_client, feed](OrderRequest request) {
        if (feed->closed()) {
          return false;
        }
        for (auto& event : route_order_request(*inline_client, index, request)) {
          feed->force_push(EngineEvent{AccountStreamEvent{std::move(event)}});
        }
        return true;
      });
      continue;
    }

    auto router =
        std::make_unique<OrderRoutingThread>(index, client, feed, dispatch_capacity_);
    OrderRoutingThread* raw = router.get();
    execution.insert(index, [raw](OrderRequest request) {
      return raw->send(std::move(request));
    });
    routers.push_back(std::move(router));
  }

  for (const auto& override_balance : unapplied) {
    state.seedBalance(
        catalogue->find_asset_index(override_balance.exchange, override_balance.asset),
        override_balance.balance, clock->time_engine());
  }

  std::optional<AuditSender> sender;
  std::optional<AuditReceiver> receiver;
  if (audit_mode_ == AuditMode::Enabled) {
    auto channel = make_audit_channel(audit_policy_, audit_high_water_mark_);
    sender.emplace(std::move(channel.first));
    receiver.emplace(std::move(channel.second));
  }

  EngineParts parts{clock, std::move(state), std::move(execution), std::move(sender),
                    risk_free_return_ ? *risk_free_return_
                                      : config.risk_free_return.value_or(Decimal{0})};

  System::Parts system;
  system.mode = feed_mode_;
  system.catalogue = catalogue;
  system.feed = feed;
  system.engine = factory(std::move(parts));
  system.routers = std::move(routers);
  if (market_stream_) {
    system.market = std::make_unique<MarketStreamThread>(std::move(market_stream_), feed);
  }
  system.audit = std::move(receiver);

  log::info("SystemBuilder", "built system: ", catalogue->exchanges().size(),
            " exchanges, ", catalogue->assets().size(), " assets, ",
            catalogue->instruments().size(), " instruments.");
  return std::make_unique<System>(std::move(system));
}

}  // namespace tradeflow
