// =============================================================================
// order_manager_test.cpp
// =============================================================================
// Unit tests for tradeflow::OrderManager, the per-instrument order book the
// engine keeps between requests and exchange responses.
//
// Validates:
//   - recordOpen() tracks the order as OpenInFlight plus an in-flight entry
//   - exchange snapshots advance the order and clear the in-flight entry
//   - illegal transitions are ignored
//   - cancel flow: prepareCancel(), recordCancel(), applyCancelled()
//   - forget() rolls back a request that never reached the exchange
// =============================================================================

#include "tradeflow/state/order_manager.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace tradeflow;
using domain::CancelInFlight;
using domain::ClientOrderId;
using domain::Open;
using domain::OpenInFlight;
using domain::OrderId;
using domain::OrderSnapshot;
using domain::Side;
using tradeflow::test::at;
using tradeflow::test::dec;
using tradeflow::test::kBtcUsdt;

class OrderManagerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    request_ = test::limit_open(kBtcUsdt, "c1", Side::Buy, "2", "100");
    manager_.recordOpen(request_, 1, at(0));
  }

  OrderSnapshot open_snapshot(const char* filled = "0") const {
    return OrderSnapshot::from_request(request_, OrderId("x-1"), at(1), dec(filled));
  }

  OrderSnapshot with_state(domain::OrderState state) const {
    OrderSnapshot snapshot = OrderSnapshot::from_request(request_);
    snapshot.state = std::move(state);
    return snapshot;
  }

  const ClientOrderId cid_{"c1"};
  domain::OrderRequestOpen request_;
  OrderManager manager_;
};

TEST_F(OrderManagerTest, RecordOpenTracksInFlight) {
  const OrderSnapshot* order = manager_.find(cid_);
  ASSERT_NE(order, nullptr);
  EXPECT_TRUE(std::holds_alternative<OpenInFlight>(order->state));
  EXPECT_TRUE(manager_.hasInFlight());
  EXPECT_FALSE(manager_.canOpen(cid_));
  EXPECT_TRUE(manager_.canOpen(ClientOrderId("c2")));
}

TEST_F(OrderManagerTest, OpenSnapshotClearsInFlight) {
  EXPECT_EQ(manager_.applySnapshot(open_snapshot()), OrderManager::Applied::Upserted);
  EXPECT_FALSE(manager_.hasInFlight());

  const OrderSnapshot* order = manager_.find(cid_);
  ASSERT_NE(order, nullptr);
  ASSERT_TRUE(std::holds_alternative<Open>(order->state));
  EXPECT_EQ(std::get<Open>(order->state).id.str(), "x-1");
}

TEST_F(OrderManagerTest, PartialFillsOnlyMoveForward) {
  manager_.applySnapshot(open_snapshot("1"));
  EXPECT_EQ(manager_.applySnapshot(open_snapshot("0.5")),
            OrderManager::Applied::Ignored);
  EXPECT_EQ(std::get<Open>(manager_.find(cid_)->state).filled_quantity, dec("1"));

  EXPECT_EQ(manager_.applySnapshot(open_snapshot("1.5")),
            OrderManager::Applied::Upserted);
  EXPECT_EQ(manager_.find(cid_)->quantity_remaining(), dec("0.5"));
}

TEST_F(OrderManagerTest, InactiveSnapshotRemovesOrder) {
  manager_.applySnapshot(open_snapshot());
  EXPECT_EQ(manager_.applySnapshot(with_state(domain::FullyFilled{})),
            OrderManager::Applied::Removed);
  EXPECT_EQ(manager_.find(cid_), nullptr);
  EXPECT_TRUE(manager_.canOpen(cid_));

  // A late terminal snapshot for an order no longer tracked is ignored.
  EXPECT_EQ(manager_.applySnapshot(with_state(domain::Expired{})),
            OrderManager::Applied::Ignored);
}

TEST_F(OrderManagerTest, OpenFailureRemovesOrder) {
  EXPECT_EQ(manager_.applySnapshot(with_state(domain::OpenFailed{"no funds"})),
            OrderManager::Applied::Removed);
  EXPECT_EQ(manager_.find(cid_), nullptr);
  EXPECT_FALSE(manager_.hasInFlight());
}

TEST_F(OrderManagerTest, CancelFlow) {
  manager_.applySnapshot(open_snapshot());

  const domain::OrderRequestCancel cancel{test::key(kBtcUsdt, "c1"), std::nullopt};
  auto prepared = manager_.prepareCancel(cancel);
  ASSERT_TRUE(prepared.has_value());
  ASSERT_TRUE(prepared->id.has_value());
  EXPECT_EQ(prepared->id->str(), "x-1");

  manager_.recordCancel(*prepared, 2, at(2));
  EXPECT_TRUE(std::holds_alternative<CancelInFlight>(manager_.find(cid_)->state));

  // A second cancel while one is in flight is not sent.
  EXPECT_FALSE(manager_.prepareCancel(cancel).has_value());
  EXPECT_TRUE(manager_.cancelRequests().empty());

  manager_.applyCancelled(
      OrderCancelled{cancel.key, domain::Cancelled{OrderId("x-1"), at(3)}});
  EXPECT_EQ(manager_.find(cid_), nullptr);
  EXPECT_FALSE(manager_.hasInFlight());
}

TEST_F(OrderManagerTest, FailedCancelRestoresOpenState) {
  manager_.applySnapshot(open_snapshot("0.5"));
  const domain::OrderRequestCancel cancel{test::key(kBtcUsdt, "c1"), std::nullopt};
  manager_.recordCancel(*manager_.prepareCancel(cancel), 2, at(2));

  manager_.applyCancelled(OrderCancelled{cancel.key, CancelError{"too late"}});

  const OrderSnapshot* order = manager_.find(cid_);
  ASSERT_NE(order, nullptr);
  ASSERT_TRUE(std::holds_alternative<Open>(order->state));
  EXPECT_EQ(std::get<Open>(order->state).filled_quantity, dec("0.5"));
}

TEST_F(OrderManagerTest, FillDuringCancelIsKeptUnderCancelInFlight) {
  manager_.applySnapshot(open_snapshot());
  const domain::OrderRequestCancel cancel{test::key(kBtcUsdt, "c1"), std::nullopt};
  manager_.recordCancel(*manager_.prepareCancel(cancel), 2, at(2));

  EXPECT_EQ(manager_.applySnapshot(open_snapshot("1")),
            OrderManager::Applied::Upserted);
  const auto* state = std::get_if<CancelInFlight>(&manager_.find(cid_)->state);
  ASSERT_NE(state, nullptr);
  ASSERT_TRUE(state->order.has_value());
  EXPECT_EQ(state->order->filled_quantity, dec("1"));
}

TEST_F(OrderManagerTest, ForgetRollsBackUnsentOpen) {
  manager_.forget(cid_, RequestKind::Open);
  EXPECT_EQ(manager_.find(cid_), nullptr);
  EXPECT_FALSE(manager_.hasInFlight());
}

TEST_F(OrderManagerTest, ReplaceAllKeepsOnlyActiveOrders) {
  auto other = test::limit_open(kBtcUsdt, "c2", Side::Sell, "1", "200");
  OrderSnapshot filled = OrderSnapshot::from_request(other);
  filled.state = domain::FullyFilled{};

  manager_.replaceAll({open_snapshot(), filled});

  EXPECT_EQ(manager_.orders().size(), 1u);
  EXPECT_NE(manager_.find(cid_), nullptr);
  EXPECT_FALSE(manager_.hasInFlight());
  EXPECT_EQ(manager_.cancelRequests().size(), 1u);
}
