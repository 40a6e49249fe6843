#pragma once

#include "tradeflow/audit/audit_channel.hpp"
#include "tradeflow/config/system_config.hpp"
#include "tradeflow/domain/balance.hpp"
#include "tradeflow/engine/engine.hpp"
#include "tradeflow/events/engine_feed.hpp"
#include "tradeflow/execution/execution_client.hpp"
#include "tradeflow/gateway/market_stream.hpp"
#include "tradeflow/instrument/indexed_instruments.hpp"
#include "tradeflow/network/market_stream_thread.hpp"
#include "tradeflow/network/order_routing_thread.hpp"
#include "tradeflow/risk/limits_risk_manager.hpp"
#include "tradeflow/statistic/time_interval.hpp"
#include "tradeflow/statistic/trading_summary.hpp"
#include "tradeflow/time/clock.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace tradeflow {

// Stream: a worker thread drains the feed.
// Iterator: the caller drives the engine with processPending().
enum class FeedMode {
  Stream,
  Iterator,
};

// Threaded: one OrderRoutingThread per execution client.
// Inline: the engine thread calls the client itself and queues the
// responses behind the event being processed.
enum class ExecutionMode {
  Threaded,
  Inline,
};

enum class AuditMode {
  Enabled,
  Disabled,
};

const char* to_string(FeedMode mode);
const char* to_string(ExecutionMode mode);

// Opening balance that replaces whatever the execution config says.
struct BalanceOverride {
  domain::ExchangeId exchange{domain::ExchangeId::Mock};
  std::string asset;
  domain::Balance balance;
};

// Counters for the STATUS command.
struct SystemStats {
  FeedMode mode{FeedMode::Stream};
  bool started{false};
  bool terminated{false};
  std::uint64_t events_sent{0};
  std::size_t feed_pending{0};
  std::uint64_t market_forwarded{0};
  std::uint64_t market_skipped{0};
};

// -----------------------------------------------------------------------------
// System: running engine plus every thread that feeds it
// -----------------------------------------------------------------------------
//
// @brief  Owns the engine, the engine feed, one OrderRoutingThread per
//         execution client, the optional MarketStreamThread and the audit
//         receiver, and exposes the control surface.
//
// @details
// Thread layout (Stream mode):
//
//   engine worker          Engine::run(feed)
//   order routing (x N)    IExecutionClient calls, responses → feed
//   market stream          IMarketStream → feed
//   caller                 sendEvent(), commands, shutdown()
//
// In Iterator mode there is no engine worker: the caller's thread runs the
// engine in processPending() and shutdown(). The market stream is not given
// a thread either; shutdownAfterBacktest() pumps it one record at a time
// and processes everything that record caused before pulling the next. With
// ExecutionMode::Inline that makes a run a pure function of its inputs.
//
// start() order: routing threads, engine (Snapshot tick), market stream
// last, so the engine is live before the first tick arrives.
//
// Ingress: sendEvent() and its wrappers validate every event against the
// catalogue and throw ValidationError before anything reaches the feed.
// They return false once the feed is closed.
//
// Termination:
//   shutdown()     sends Shutdown, waits for the engine to drain and stop,
//                  then stops the I/O threads. Any exception that escaped the
//                  engine is rethrown here. With a timeout, TimeoutError is
//                  thrown on expiry and the system must be abort()ed.
//   abort()        closes the feed, drops every pending event and request,
//                  and stops every thread without draining.
//   ~System()      abort() if the engine is still running.
//
// Thread model: one controlling thread calls start/shutdown/abort;
// sendEvent() and the command wrappers are safe from any thread.
// -----------------------------------------------------------------------------
class System {
 public:
  using Timeout = std::optional<std::chrono::milliseconds>;

  struct Parts {
    FeedMode mode{FeedMode::Stream};
    std::shared_ptr<const IndexedInstruments> catalogue;
    EngineFeedPtr feed;
    std::unique_ptr<IEngine> engine;
    std::vector<std::unique_ptr<OrderRoutingThread>> routers;
    std::unique_ptr<MarketStreamThread> market;
    std::optional<AuditReceiver> audit;
  };

  explicit System(Parts parts);
  ~System();

  System(const System&) = delete;
  System& operator=(const System&) = delete;
  System(System&&) = delete;
  System& operator=(System&&) = delete;

  void start();

  // ---------------------------------------------------------------------------
  // Feed-in
  // ---------------------------------------------------------------------------
  bool sendEvent(EngineEvent event);
  // Validates every event before enqueuing any; returns how many were queued.
  std::size_t feedEvents(std::vector<EngineEvent> events);

  bool setTradingEnabled(bool enabled);
  bool sendOpenRequests(std::vector<domain::OrderRequestOpen> requests);
  bool sendCancelRequests(std::vector<domain::OrderRequestCancel> requests);
  bool closePositions(InstrumentFilter filter = InstrumentFilter::none());
  bool cancelOrders(InstrumentFilter filter = InstrumentFilter::none());

  // Transfers the audit stream to the caller. Throws std::logic_error when
  // audit is disabled or the receiver was already taken.
  AuditReceiver takeAudit();

  // Iterator mode only: processes every queued event without blocking.
  // Returns the number processed.
  std::size_t processPending();

  // ---------------------------------------------------------------------------
  // Termination
  // ---------------------------------------------------------------------------
  EngineState shutdown(Timeout timeout = std::nullopt);
  TradingSummary shutdownWithSummary(Decimal risk_free_return,
                                       const TimeInterval& interval,
                                       Timeout timeout = std::nullopt);
  // Waits for the market stream to run dry, then shuts down. In Iterator
  // mode the stream is pumped here, on the caller's thread.
  EngineState shutdownAfterBacktest(Timeout timeout = std::nullopt);
  void abort();

  // Only valid once the engine has terminated.
  TradingSummary tradingSummary(Decimal risk_free_return,
                                 const TimeInterval& interval);

  const IndexedInstruments& catalogue() const { return *catalogue_; }
  FeedMode mode() const { return mode_; }
  bool terminated() const { return terminated_.load(); }
  SystemStats stats() const;

 private:
  bool enqueue(EngineEvent event);
  void validate(const EngineEvent& event) const;
  void runWorker();
  void awaitEngine(Timeout timeout);
  void driveUntilTerminated(Timeout timeout);
  void stopIo();

  FeedMode mode_;
  std::shared_ptr<const IndexedInstruments> catalogue_;
  EngineFeedPtr feed_;
  std::unique_ptr<IEngine> engine_;
  std::vector<std::unique_ptr<OrderRoutingThread>> routers_;
  std::unique_ptr<MarketStreamThread> market_;
  std::optional<AuditReceiver> audit_;

  std::thread worker_;
  std::promise<void> worker_done_;
  std::future<void> worker_result_;

  bool started_{false};
  bool stopped_{false};
  std::atomic<bool> terminated_{false};
  std::atomic<std::uint64_t> events_sent_{0};
};

// -----------------------------------------------------------------------------
// SystemBuilder
// -----------------------------------------------------------------------------
//
// @brief  Turns a SystemConfig plus run options into a ready-to-start
//         System.
//
// @details
// build():
//   1. validates the config and builds the catalogue;
//   2. applies balance overrides to the mock execution configs (overrides
//      for an exchange without one are seeded straight into the state);
//   3. creates one execution client per exchange (MockExecutionClient
//      unless executionClient() supplied one) and seeds EngineState from
//      each client's accountSnapshot();
//   4. wires the feed, one OrderRoutingThread per client (or the inline
//      senders), the audit channel and the market stream;
//   5. constructs Engine<StrategyT, RiskManagerT>.
//
// Defaults: Stream mode, threaded execution, audit disabled, trading Disabled, feed capacity
// 4096, dispatch capacity 1024, audit overflow Detach at 1,000,000 ticks,
// LiveClock.
// -----------------------------------------------------------------------------
class SystemBuilder {
 public:
  static constexpr std::size_t kDefaultFeedCapacity = 4096;

  explicit SystemBuilder(SystemConfig config);

  SystemBuilder& clock(std::shared_ptr<IClock> clock);
  SystemBuilder& marketStream(std::unique_ptr<IMarketStream> stream);
  SystemBuilder& feedMode(FeedMode mode);
  SystemBuilder& executionMode(ExecutionMode mode);
  SystemBuilder& auditMode(AuditMode mode);
  SystemBuilder& tradingState(TradingState state);
  SystemBuilder& feedCapacity(std::size_t capacity);
  SystemBuilder& dispatchCapacity(std::size_t capacity);
  SystemBuilder& balance(BalanceOverride balance);
  SystemBuilder& auditOverflow(AuditOverflowPolicy policy, std::size_t high_water_mark);
  SystemBuilder& riskFreeReturn(Decimal risk_free_return);
  // Replaces the configured client for client->exchange().
  SystemBuilder& executionClient(std::shared_ptr<IExecutionClient> client);

  const SystemConfig& config() const { return config_; }

  template <typename StrategyT = DefaultStrategy,
            typename RiskManagerT = DefaultRiskManager>
  std::unique_ptr<System> build(StrategyT strategy = StrategyT{},
                                RiskManagerT risk = RiskManagerT{}) {
    auto shared_strategy = std::make_shared<StrategyT>(std::move(strategy));
    auto shared_risk = std::make_shared<RiskManagerT>(std::move(risk));
    return buildWith([shared_strategy, shared_risk](EngineParts parts) {
      return std::unique_ptr<IEngine>(new Engine<StrategyT, RiskManagerT>(
          std::move(parts), std::move(*shared_strategy), std::move(*shared_risk)));
    });
  }

  // Engine guarded by the configured RiskLimits.
  template <typename StrategyT = DefaultStrategy>
  std::unique_ptr<System> buildWithLimits(StrategyT strategy = StrategyT{}) {
    return build<StrategyT, LimitsRiskManager>(std::move(strategy),
                                               LimitsRiskManager(config_.risk));
  }

 private:
  using EngineFactory = std::function<std::unique_ptr<IEngine>(EngineParts)>;

  std::unique_ptr<System> buildWith(const EngineFactory& factory);

  SystemConfig config_;
  std::shared_ptr<IClock> clock_;
  std::unique_ptr<IMarketStream> market_stream_;
  FeedMode feed_mode_{FeedMode::Stream};
  ExecutionMode execution_mode_{ExecutionMode::Threaded};
  AuditMode audit_mode_{AuditMode::Disabled};
  TradingState trading_state_{TradingState::Disabled};
  std::size_t feed_capacity_{kDefaultFeedCapacity};
  std::size_t dispatch_capacity_{OrderRoutingThread::kDefaultCapacity};
  std::vector<BalanceOverride> balances_;
  AuditOverflowPolicy audit_policy_{AuditOverflowPolicy::Detach};
  std::size_t audit_high_water_mark_{AuditSender::kDefaultHighWaterMark};
  std::optional<Decimal> risk_free_return_;
  std::map<domain::ExchangeId, std::shared_ptr<IExecutionClient>> clients_;
};

}  // namespace tradeflow
