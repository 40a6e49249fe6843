#pragma once

#include "tradeflow/concurrent/id_generator.hpp"
#include "tradeflow/domain/balance.hpp"
#include "tradeflow/domain/identifiers.hpp"
#include "tradeflow/execution/execution_client.hpp"
#include "tradeflow/instrument/indexed_instruments.hpp"
#include "tradeflow/numeric/decimal.hpp"
#include "tradeflow/time/clock.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tradeflow {

// Opening balance of one asset, by exchange-native name.
struct MockBalance {
  std::string asset;
  domain::Balance balance;
  std::optional<Timestamp> time_exchange;
};

// -----------------------------------------------------------------------------
// MockExecutionConfig
// -----------------------------------------------------------------------------
// exchange      venue the mock stands in for
// balances      opening balances (assets resolved through the catalogue)
// latency_ms    simulated round trip per request
// fees_percent  fee = notional * fees_percent, in [0, 1]
//
// validate() throws ValidationError for an out-of-range fee or an invalid
// balance.
// -----------------------------------------------------------------------------
struct MockExecutionConfig {
  domain::ExchangeId exchange{domain::ExchangeId::Mock};
  std::vector<MockBalance> balances;
  std::uint64_t latency_ms{0};
  Decimal fees_percent;

  void validate() const;
};

// -----------------------------------------------------------------------------
// MockExecutionClient: deterministic in-process venue for backtests
// -----------------------------------------------------------------------------
//
// @brief  Fills market orders at their reference price, rests limit orders,
//         and keeps its own balances.
//
// @details
// Every request first sleeps latency_ms, then:
//
//   Market open:
//     cost = price * quantity, fee = cost * fees_percent (quote asset).
//     Buy needs free quote >= cost + fee, sell needs free base >= quantity;
//     otherwise Inactive(Rejected{"insufficient balance"}) and nothing moves.
//     A market order without a positive price is Rejected{"no reference
//     price"}.
//     Emits, in order: BalanceSnapshot(quote), BalanceSnapshot(base),
//     Trade, OrderSnapshot Inactive(FullyFilled).
//
//   Limit open:
//     Reserves price * quantity of quote (buy) or quantity of base (sell)
//     from free balance, then emits BalanceSnapshot and OrderSnapshot
//     Active(Open{order_id, time, filled = 0}). No matching is simulated.
//
//   Cancel:
//     A resting order is removed, its reservation released, and
//     BalanceSnapshot + OrderCancelled(Cancelled) emitted. Anything else
//     yields OrderCancelled(CancelError{"order not found"}).
//
// Exchange timestamps come from the shared clock and are forced strictly
// increasing. Order and trade ids come from monotone generators.
//
// Thread-safety: all public calls lock an internal mutex.
// -----------------------------------------------------------------------------
class MockExecutionClient : public IExecutionClient {
 public:
  MockExecutionClient(MockExecutionConfig config,
                      std::shared_ptr<const IndexedInstruments> catalogue,
                      std::shared_ptr<IClock> clock);

  domain::ExchangeId exchange() const override { return config_.exchange; }

  AccountSnapshot accountSnapshot() override;

  std::vector<AccountEvent> openOrder(
      const domain::OrderRequestOpen& request) override;

  std::vector<AccountEvent> cancelOrder(
      const domain::OrderRequestCancel& request) override;

 private:
  struct Resting {
    domain::OrderSnapshot order;
    domain::AssetIndex reserved_asset{0};
    Decimal reserved;
  };

  Timestamp nextTime();
  void simulateLatency() const;
  domain::Balance& balance(domain::AssetIndex asset);
  AccountEvent balanceEvent(domain::AssetIndex asset, Timestamp time);
  AccountEvent orderEvent(domain::OrderSnapshot order) const;
  AccountEvent rejected(const domain::OrderRequestOpen& request,
                        const std::string& reason) const;

  std::vector<AccountEvent> fillMarket(const domain::OrderRequestOpen& request,
                                        const IndexedInstrument& instrument);
  std::vector<AccountEvent> restLimit(const domain::OrderRequestOpen& request,
                                       const IndexedInstrument& instrument);

  MockExecutionConfig config_;
  std::shared_ptr<const IndexedInstruments> catalogue_;
  std::shared_ptr<IClock> clock_;
  domain::ExchangeIndex exchange_index_{0};

  mutable std::mutex mutex_;
  std::map<domain::AssetIndex, domain::Balance> balances_;
  std::map<domain::ClientOrderId, Resting> resting_;
  std::optional<Timestamp> last_time_;
  IdGenerator order_ids_{"mock-order-"};
  IdGenerator trade_ids_{"mock-trade-"};
};

}  // namespace tradeflow
