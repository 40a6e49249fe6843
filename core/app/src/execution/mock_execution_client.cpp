#include "tradeflow/execution/mock_execution_client.hpp"

#include "tradeflow/common/error.hpp"
#include "tradeflow/common/log.hpp"

#include <algorithm>
#include <chrono>
#include <iterator>
#include <thread>

namespace tradeflow {

using domain::AssetIndex;
using domain::OrderRequestCancel;
using domain::OrderRequestOpen;
using domain::OrderSnapshot;
using domain::Side;

void MockExecutionConfig::validate() const {
  if (fees_percent.is_negative() || fees_percent > Decimal{1}) {
    throw ValidationError("mock fees_percent must be in [0, 1], got " +
                          fees_percent.to_string());
  }
  for (const auto& entry : balances) {
    if (entry.asset.empty()) {
      throw ValidationError("mock balance has an empty asset name");
    }
    entry.balance.validate();
  }
}

// -----------------------------------------------------------------------------
// Constructor: resolve the exchange and the opening balances
// -----------------------------------------------------------------------------
MockExecutionClient::MockExecutionClient(
    MockExecutionConfig config, std::shared_ptr<const IndexedInstruments> catalogue,
    std::shared_ptr<IClock> clock)
    : config_(std::move(config)),
      catalogue_(std::move(catalogue)),
      clock_(std::move(clock)) {
  config_.validate();
  exchange_index_ = catalogue_->find_exchange_index(config_.exchange);

  for (const auto& asset : catalogue_->assets()) {
    if (asset.exchange == exchange_index_) {
      balances_[asset.index] = domain::Balance{};
    }
  }
  for (const auto& entry : config_.balances) {
    const AssetIndex index =
        catalogue_->find_asset_index(config_.exchange, entry.asset);
    balances_[index] = entry.balance;
  }
}

AccountSnapshot MockExecutionClient::accountSnapshot() {
  std::lock_guard<std::mutex> lock(mutex_);
  const Timestamp now = nextTime();

  AccountSnapshot snapshot;
  snapshot.exchange = exchange_index_;
  for (const auto& [asset, balance] : balances_) {
    snapshot.balances.push_back(domain::AssetBalance{asset, balance, now});
  }
  for (const auto& [cid, resting] : resting_) {
    const auto instrument = resting.order.key.instrument;
    auto it = std::find_if(snapshot.instruments.begin(), snapshot.instruments.end(),
                           [instrument](const InstrumentAccountSnapshot& entry) {
                             return entry.instrument == instrument;
                           });
    if (it == snapshot.instruments.end()) {
      snapshot.instruments.push_back(InstrumentAccountSnapshot{instrument, {}});
      it = std::prev(snapshot.instruments.end());
    }
    it->orders.push_back(resting.order);
  }
  return snapshot;
}

// -----------------------------------------------------------------------------
// openOrder
// -----------------------------------------------------------------------------
std::vector<AccountEvent> MockExecutionClient::openOrder(
    const OrderRequestOpen& request) {
  simulateLatency();
  std::lock_guard<std::mutex> lock(mutex_);

  try {
    request.validate();
  } catch (const ValidationError& e) {
    return {rejected(request, e.what())};
  }
  if (request.key.instrument >= catalogue_->instruments().size()) {
    return {rejected(request, "unknown instrument index " +
                                  std::to_string(request.key.instrument))};
  }
  const IndexedInstrument& instrument =
      catalogue_->instrument(request.key.instrument);
  if (instrument.exchange != exchange_index_) {
    return {rejected(request, "instrument " + instrument.name_internal +
                                  " is not traded on " +
                                  domain::to_string(config_.exchange))};
  }

  if (request.kind == domain::OrderKind::Market) {
    return fillMarket(request, instrument);
  }
  return restLimit(request, instrument);
}

std::vector<AccountEvent> MockExecutionClient::fillMarket(
    const OrderRequestOpen& request, const IndexedInstrument& instrument) {
  if (!request.price.is_positive()) {
    return {rejected(request, "no reference price")};
  }

  const Decimal cost = request.price * request.quantity;
  const Decimal fee = cost * config_.fees_percent;
  domain::Balance& quote = balance(instrument.quote);
  domain::Balance& base = balance(instrument.base);

  if (request.side == Side::Buy) {
    if (quote.free < cost + fee) {
      return {rejected(request, "insufficient balance")};
    }
    quote.total -= cost + fee;
    quote.free -= cost + fee;
    base.total += request.quantity;
    base.free += request.quantity;
  } else {
    if (base.free < request.quantity) {
      return {rejected(request, "insufficient balance")};
    }
    base.total -= request.quantity;
    base.free -= request.quantity;
    quote.total += cost - fee;
    quote.free += cost - fee;
  }

  const Timestamp time = nextTime();
  const domain::OrderId order_id{order_ids_.next()};

  domain::Trade trade;
  trade.id = domain::TradeId{trade_ids_.next()};
  trade.order_id = order_id;
  trade.instrument = request.key.instrument;
  trade.strategy = request.key.strategy;
  trade.time_exchange = time;
  trade.side = request.side;
  trade.price = request.price;
  trade.quantity = request.quantity;
  trade.fees = domain::AssetFees{instrument.quote, fee};

  OrderSnapshot filled = OrderSnapshot::from_request(request);
  filled.state = domain::FullyFilled{};

  log::debug("MockExecution", "filled cid=", request.key.cid, " ",
             domain::to_string(request.side), " ", request.quantity, " @ ",
             request.price, " fee=", fee);

  std::vector<AccountEvent> events;
  events.push_back(balanceEvent(instrument.quote, time));
  events.push_back(balanceEvent(instrument.base, time));
  events.push_back(AccountEvent{exchange_index_, std::move(trade)});
  events.push_back(orderEvent(std::move(filled)));
  return events;
}

std::vector<AccountEvent> MockExecutionClient::restLimit(
    const OrderRequestOpen& request, const IndexedInstrument& instrument) {
  if (resting_.count(request.key.cid) != 0) {
    return {rejected(request, "duplicate client order id " +
                                  request.key.cid.str())};
  }

  const AssetIndex reserved_asset =
      request.side == Side::Buy ? instrument.quote : instrument.base;
  const Decimal reserved = request.side == Side::Buy
                               ? request.price * request.quantity
                               : request.quantity;
  domain::Balance& held = balance(reserved_asset);
  if (held.free < reserved) {
    return {rejected(request, "insufficient balance")};
  }
  held.free -= reserved;

  const Timestamp time = nextTime();
  OrderSnapshot open = OrderSnapshot::from_request(
      request, domain::OrderId{order_ids_.next()}, time, Decimal{0});
  resting_[request.key.cid] = Resting{open, reserved_asset, reserved};

  std::vector<AccountEvent> events;
  events.push_back(balanceEvent(reserved_asset, time));
  events.push_back(orderEvent(std::move(open)));
  return events;
}

// -----------------------------------------------------------------------------
// cancelOrder
// -----------------------------------------------------------------------------
std::vector<AccountEvent> MockExecutionClient::cancelOrder(
    const OrderRequestCancel& request) {
  simulateLatency();
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = resting_.find(request.key.cid);
  if (it == resting_.end() ||
      it->second.order.key.instrument != request.key.instrument) {
    return {AccountEvent{exchange_index_,
                         OrderCancelled{request.key, CancelError{"order not found"}}}};
  }

  Resting resting = std::move(it->second);
  resting_.erase(it);
  balance(resting.reserved_asset).free += resting.reserved;

  const Timestamp time = nextTime();
  std::optional<domain::OrderId> id;
  if (const auto* open = std::get_if<domain::Open>(&resting.order.state)) {
    id = open->id;
  }

  std::vector<AccountEvent> events;
  events.push_back(balanceEvent(resting.reserved_asset, time));
  events.push_back(AccountEvent{
      exchange_index_, OrderCancelled{request.key, domain::Cancelled{id, time}}});
  return events;
}

// -----------------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------------
Timestamp MockExecutionClient::nextTime() {
  Timestamp now = clock_->time_engine();
  if (last_time_ && now <= *last_time_) {
    now = *last_time_ + Duration(1);
  }
  last_time_ = now;
  return now;
}

void MockExecutionClient::simulateLatency() const {
  if (config_.latency_ms > 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(config_.latency_ms));
  }
}

domain::Balance& MockExecutionClient::balance(AssetIndex asset) {
  return balances_[asset];
}

AccountEvent MockExecutionClient::balanceEvent(AssetIndex asset, Timestamp time) {
  return AccountEvent{exchange_index_,
                      domain::AssetBalance{asset, balances_[asset], time}};
}

AccountEvent MockExecutionClient::orderEvent(OrderSnapshot order) const {
  return AccountEvent{exchange_index_, std::move(order)};
}

AccountEvent MockExecutionClient::rejected(const OrderRequestOpen& request,
                                           const std::string& reason) const {
  log::warn("MockExecution", "rejected cid=", request.key.cid, ": ", reason);
  // Built field by field: from_request() validates, and the request being
  // rejected may be the invalid one.
  OrderSnapshot order;
  order.key = request.key;
  order.side = request.side;
  order.price = request.price;
  order.quantity = request.quantity;
  order.kind = request.kind;
  order.time_in_force = request.time_in_force;
  order.state = domain::Rejected{reason};
  return orderEvent(std::move(order));
}

}  // namespace tradeflow
