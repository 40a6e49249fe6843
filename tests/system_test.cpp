// =============================================================================
// system_test.cpp
// =============================================================================
// Scenario tests for tradeflow::System built by SystemBuilder over mock
// execution clients.
//
// Iterator-mode tests pump the engine on the test thread and watch the audit
// stream for the responses the routing threads push back.
// =============================================================================

#include "tradeflow/engine/system.hpp"

#include "tradeflow/audit/audit_replica.hpp"
#include "tradeflow/codec/json.hpp"
#include "tradeflow/common/error.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace tradeflow;
using namespace std::chrono_literals;
using domain::Side;
using tradeflow::test::at;
using tradeflow::test::dec;
using tradeflow::test::kBtcUsdt;
using tradeflow::test::kEthUsd;

namespace {

std::string data_path(const char* name) {
  return std::string(TRADEFLOW_TEST_DATA_DIR) + "/" + name;
}

bool is_account_trade(const AuditTick& tick) {
  const auto* process = std::get_if<ProcessAudit>(&tick.event);
  if (process == nullptr) {
    return false;
  }
  const auto* account = std::get_if<AccountStreamEvent>(&process->event);
  if (account == nullptr) {
    return false;
  }
  const auto* item = std::get_if<AccountEvent>(account);
  return item != nullptr && std::holds_alternative<domain::Trade>(item->kind);
}

bool has_position_exited(const AuditTick& tick) {
  const auto* process = std::get_if<ProcessAudit>(&tick.event);
  if (process == nullptr) {
    return false;
  }
  for (const auto& output : process->outputs) {
    if (std::holds_alternative<PositionExited>(output)) {
      return true;
    }
  }
  return false;
}

std::vector<std::string> error_messages(const std::vector<AuditTick>& ticks) {
  std::vector<std::string> messages;
  for (const auto& tick : ticks) {
    if (const auto* process = std::get_if<ProcessAudit>(&tick.event)) {
      for (const auto& error : process->errors) {
        messages.push_back(error.message);
      }
    }
  }
  return messages;
}

// Sleeps on every market event so the feed backs up behind the engine.
struct SlowStrategy : DefaultStrategy {
  OrderRequests generateAlgoOrders(const EngineState& /*state*/) {
    std::this_thread::sleep_for(1ms);
    return {};
  }
};

bool any_contains(const std::vector<std::string>& messages, const char* needle) {
  for (const auto& message : messages) {
    if (message.find(needle) != std::string::npos) {
      return true;
    }
  }
  return false;
}

}  // namespace

// -----------------------------------------------------------------------------
// Iterator mode
// -----------------------------------------------------------------------------
class IteratorSystemTest : public ::testing::Test {
 protected:
  void SetUp() override {
    system_ = SystemBuilder(test::system_config())
                  .clock(std::make_shared<test::ManualClock>(at(0)))
                  .feedMode(FeedMode::Iterator)
                  .auditMode(AuditMode::Enabled)
                  .tradingState(TradingState::Enabled)
                  .build();
    audit_.emplace(system_->takeAudit());
    system_->start();
  }

  // Processes pending events until a tick matching `done` is audited.
  bool pump_until(const std::function<bool(const AuditTick&)>& done) {
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (std::chrono::steady_clock::now() < deadline) {
      system_->processPending();
      while (auto tick = audit_->try_recv()) {
        ticks_.push_back(std::move(*tick));
        if (done(ticks_.back())) {
          return true;
        }
      }
      std::this_thread::sleep_for(1ms);
    }
    return false;
  }

  std::unique_ptr<System> system_;
  std::optional<AuditReceiver> audit_;
  std::vector<AuditTick> ticks_;
};

TEST_F(IteratorSystemTest, EventsWaitForTheCaller) {
  ASSERT_TRUE(system_->sendEvent(test::market(test::trade_item(kBtcUsdt, "100", at(1)))));
  EXPECT_EQ(system_->stats().feed_pending, 1u);
  EXPECT_EQ(system_->processPending(), 1u);
  EXPECT_EQ(system_->stats().feed_pending, 0u);
  EXPECT_EQ(system_->stats().events_sent, 1u);
  EXPECT_EQ(system_->stats().mode, FeedMode::Iterator);
}

TEST_F(IteratorSystemTest, MarketOrderFillsAndClosePositionsFlattens) {
  system_->sendEvent(test::market(test::trade_item(kBtcUsdt, "100", at(1))));
  ASSERT_TRUE(system_->sendOpenRequests(
      {test::market_open(kBtcUsdt, "c1", Side::Buy, "2")}));
  ASSERT_TRUE(pump_until(is_account_trade));

  system_->sendEvent(test::market(test::trade_item(kBtcUsdt, "110", at(2))));
  ASSERT_TRUE(system_->closePositions());
  ASSERT_TRUE(pump_until(has_position_exited));

  const EngineState state = system_->shutdown(5000ms);
  EXPECT_FALSE(state.hasInFlight());
  EXPECT_TRUE(state.instrument(kBtcUsdt).positions.netQuantity().is_zero());
  EXPECT_EQ(state.asset(test::kBtc).balance.total, dec("10"));
  EXPECT_EQ(state.asset(test::kUsdt).balance.total, dec("100020"));

  const TradingSummary summary = system_->tradingSummary(Decimal{0}, TimeInterval::daily());
  const TearSheet& sheet = summary.instruments.at("binance_spot:btc_usdt");
  EXPECT_EQ(sheet.trades, 2u);
  EXPECT_EQ(sheet.positions_closed, 1u);
  EXPECT_EQ(sheet.pnl, dec("20"));
}

TEST_F(IteratorSystemTest, AuditReplayMatchesFinalState) {
  system_->sendEvent(test::market(test::trade_item(kBtcUsdt, "100", at(1))));
  system_->sendEvent(test::market(test::trade_item(kEthUsd, "2000", at(1))));
  system_->sendOpenRequests({test::market_open(kBtcUsdt, "c1", Side::Buy, "1"),
                               test::limit_open(kEthUsd, "e1", Side::Buy, "1", "1900")});
  ASSERT_TRUE(pump_until(is_account_trade));
  system_->sendEvent(test::market_reconnecting(domain::ExchangeId::Kraken));

  const EngineState state = system_->shutdown(5000ms);
  while (auto tick = audit_->try_recv()) {
    ticks_.push_back(std::move(*tick));
  }
  ASSERT_TRUE(std::holds_alternative<FeedEnded>(ticks_.back().event));
  EXPECT_FALSE(state.exchangeHealthy(test::kKraken));
  EXPECT_TRUE(state.exchangeHealthy(test::kBinance));

  const EngineState replica = AuditReplica::replay(ticks_);
  EXPECT_EQ(encode_state(replica).dump(), encode_state(state).dump());
}

TEST_F(IteratorSystemTest, IngressValidation) {
  auto wrong_exchange = test::trade_item(kBtcUsdt, "100", at(1));
  wrong_exchange.exchange = domain::ExchangeId::Kraken;
  EXPECT_THROW(system_->sendEvent(test::market(wrong_exchange)), ValidationError);

  auto unknown = test::trade_item(kBtcUsdt, "100", at(1));
  unknown.instrument = 7;
  EXPECT_THROW(system_->sendEvent(test::market(unknown)), ValidationError);

  EXPECT_THROW(system_->sendEvent(test::market_reconnecting(domain::ExchangeId::Okx)),
               ValidationError);

  auto mismatched = test::limit_open(kBtcUsdt, "c1", Side::Buy, "1", "10");
  mismatched.key.exchange = test::kKraken;
  EXPECT_THROW(system_->sendOpenRequests({mismatched}), ValidationError);

  auto negative = test::limit_open(kBtcUsdt, "c2", Side::Buy, "1", "10");
  negative.quantity = dec("-1");
  EXPECT_THROW(system_->sendOpenRequests({negative}), ValidationError);

  EXPECT_THROW(system_->closePositions(InstrumentFilter::instruments({5})),
               ValidationError);

  // A bad event anywhere in a batch keeps the whole batch out.
  EXPECT_THROW(system_->feedEvents({EngineEvent{TradingStateUpdate{TradingState::Disabled}},
                                     test::market(unknown)}),
               ValidationError);
  EXPECT_EQ(system_->stats().events_sent, 0u);
}

TEST_F(IteratorSystemTest, ModeMisuseIsALogicError) {
  EXPECT_THROW(system_->takeAudit(), std::logic_error);
  system_->abort();
  EXPECT_TRUE(system_->terminated());
  EXPECT_FALSE(system_->sendEvent(EngineEvent{Shutdown{}}));
}

// -----------------------------------------------------------------------------
// Stream mode
// -----------------------------------------------------------------------------
TEST(StreamSystemTest, ConfiguredLimitsRefuseOrders) {
  auto system = SystemBuilder(load_system_config(data_path("system_config.json")))
                    .clock(std::make_shared<test::ManualClock>(at(0)))
                    .auditMode(AuditMode::Enabled)
                    .buildWithLimits();
  AuditReceiver audit = system->takeAudit();
  system->start();

  // 11 btc breaks max_position_quantity; 5 btc at 100000 breaks max_leverage
  // against 100000 usdt of equity; 1 btc at 100 rests.
  system->sendOpenRequests({test::limit_open(kBtcUsdt, "big", Side::Buy, "11", "100"),
                              test::limit_open(kBtcUsdt, "lev", Side::Buy, "5", "100000"),
                              test::limit_open(kBtcUsdt, "ok", Side::Buy, "1", "100")});

  const EngineState state = system->shutdown(5000ms);
  const auto ticks = audit.collect();
  const auto errors = error_messages(ticks);

  EXPECT_TRUE(any_contains(errors, "max_position_quantity exceeded"));
  EXPECT_TRUE(any_contains(errors, "max_leverage exceeded"));
  ASSERT_NE(state.instrument(kBtcUsdt).orders.find(domain::ClientOrderId("ok")), nullptr);
  EXPECT_EQ(state.instrument(kBtcUsdt).orders.orders().size(), 1u);
  EXPECT_EQ(state.trading(), TradingState::Disabled);
}

TEST(StreamSystemTest, BalanceOverridesReplaceConfiguredBalances) {
  auto system = SystemBuilder(test::system_config())
                    .clock(std::make_shared<test::ManualClock>(at(0)))
                    .balance(BalanceOverride{domain::ExchangeId::BinanceSpot, "usdt",
                                             domain::Balance::make(dec("5"), dec("5"))})
                    .build();
  system->start();
  const EngineState state = system->shutdown(5000ms);

  EXPECT_EQ(state.asset(test::kUsdt).balance.total, dec("5"));
  EXPECT_EQ(state.asset(test::kBtc).balance.total, dec("10"));
  EXPECT_EQ(state.asset(test::kUsd).balance.total, dec("100000"));
}

TEST(StreamSystemTest, ShutdownTwiceIsALogicError) {
  auto system = SystemBuilder(test::system_config()).build();
  EXPECT_THROW(system->shutdown(), std::logic_error);
  system->start();
  system->shutdown(5000ms);
  EXPECT_TRUE(system->terminated());
  EXPECT_THROW(system->shutdown(), std::logic_error);
  EXPECT_FALSE(system->sendEvent(EngineEvent{Shutdown{}}));
}

TEST(StreamSystemTest, AbortDropsPendingEvents) {
  auto system = SystemBuilder(test::system_config())
                    .clock(std::make_shared<test::ManualClock>(at(0)))
                    .auditMode(AuditMode::Enabled)
                    .tradingState(TradingState::Enabled)
                    .build(SlowStrategy{});
  AuditReceiver audit = system->takeAudit();
  system->start();

  constexpr std::size_t kEvents = 2000;
  std::vector<EngineEvent> events;
  for (std::size_t i = 0; i < kEvents; ++i) {
    events.push_back(test::market(test::trade_item(kBtcUsdt, "100", at(1))));
  }
  ASSERT_EQ(system->feedEvents(std::move(events)), kEvents);

  const auto started = std::chrono::steady_clock::now();
  system->abort();
  const auto elapsed = std::chrono::steady_clock::now() - started;

  EXPECT_LT(elapsed, 500ms);
  EXPECT_TRUE(system->terminated());
  EXPECT_EQ(system->stats().feed_pending, 0u);

  // Snapshot plus the few events processed before abort(); no FeedEnded.
  const auto ticks = audit.collect();
  EXPECT_LT(ticks.size(), kEvents / 2);
  ASSERT_FALSE(ticks.empty());
  EXPECT_FALSE(std::holds_alternative<FeedEnded>(ticks.back().event));
}

TEST(StreamSystemTest, MarketStreamFeedsTheEngine) {
  auto system = SystemBuilder(load_system_config(data_path("system_config.json")))
                    .clock(std::make_shared<test::ManualClock>(at(0)))
                    .marketStream(std::make_unique<VectorMarketStream>(
                        load_market_data(data_path("market_data.json"))))
                    .build();
  system->start();
  const EngineState state = system->shutdownAfterBacktest(5000ms);

  EXPECT_EQ(state.lastPrice(kBtcUsdt), std::optional<Decimal>(dec("42050")));
  EXPECT_TRUE(state.exchangeHealthy(test::kBinance));
  const SystemStats stats = system->stats();
  EXPECT_TRUE(stats.terminated);
  EXPECT_EQ(stats.market_forwarded + stats.market_skipped, 8u);
}
