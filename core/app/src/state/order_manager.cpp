#include "tradeflow/state/order_manager.hpp"

#include "tradeflow/common/log.hpp"

namespace tradeflow {

using domain::CancelInFlight;
using domain::ClientOrderId;
using domain::Open;
using domain::OpenInFlight;
using domain::OrderSnapshot;

const char* to_string(RequestKind kind) {
  return kind == RequestKind::Open ? "Open" : "Cancel";
}

const OrderSnapshot* OrderManager::find(const ClientOrderId& cid) const {
  auto it = orders_.find(cid);
  return it == orders_.end() ? nullptr : &it->second;
}

bool OrderManager::canOpen(const ClientOrderId& cid) const {
  return orders_.count(cid) == 0 &&
         in_flight_.count(InFlightKey{cid, RequestKind::Open}) == 0;
}

void OrderManager::recordOpen(const domain::OrderRequestOpen& request,
                               domain::Sequence sequence, Timestamp time) {
  orders_[request.key.cid] = OrderSnapshot::from_request(request);
  in_flight_[InFlightKey{request.key.cid, RequestKind::Open}] =
      InFlightRequest{RequestKind::Open, sequence, time};
}

std::optional<domain::OrderRequestCancel> OrderManager::prepareCancel(
    const domain::OrderRequestCancel& request) const {
  const OrderSnapshot* order = find(request.key.cid);
  if (order == nullptr || !order->is_active() ||
      std::holds_alternative<CancelInFlight>(order->state)) {
    return std::nullopt;
  }
  domain::OrderRequestCancel prepared = order->to_cancel_request();
  if (!prepared.id && request.id) {
    prepared.id = request.id;
  }
  return prepared;
}

void OrderManager::recordCancel(const domain::OrderRequestCancel& request,
                                 domain::Sequence sequence, Timestamp time) {
  auto it = orders_.find(request.key.cid);
  if (it != orders_.end()) {
    CancelInFlight cancel;
    if (const auto* open = std::get_if<Open>(&it->second.state)) {
      cancel.order = *open;
    }
    it->second.state = cancel;
  }
  in_flight_[InFlightKey{request.key.cid, RequestKind::Cancel}] =
      InFlightRequest{RequestKind::Cancel, sequence, time};
}

void OrderManager::forget(const ClientOrderId& cid, RequestKind kind) {
  in_flight_.erase(InFlightKey{cid, kind});

  auto it = orders_.find(cid);
  if (it == orders_.end()) {
    return;
  }
  if (kind == RequestKind::Open &&
      std::holds_alternative<OpenInFlight>(it->second.state)) {
    orders_.erase(it);
  } else if (kind == RequestKind::Cancel) {
    if (const auto* cancel = std::get_if<CancelInFlight>(&it->second.state)) {
      if (cancel->order) {
        it->second.state = *cancel->order;
      } else {
        it->second.state = OpenInFlight{};
      }
    }
  }
}

OrderManager::Applied OrderManager::applySnapshot(const OrderSnapshot& snapshot) {
  const ClientOrderId& cid = snapshot.key.cid;
  in_flight_.erase(InFlightKey{cid, RequestKind::Open});

  auto it = orders_.find(cid);
  if (it == orders_.end()) {
    if (snapshot.is_inactive()) {
      return Applied::Ignored;
    }
    orders_.emplace(cid, snapshot);
    return Applied::Upserted;
  }

  OrderSnapshot& current = it->second;
  if (!domain::is_valid_transition(current.state, snapshot.state)) {
    log::warn("OrderManager", "illegal transition for cid=", cid, " from ",
              domain::state_name(current.state), " to ",
              domain::state_name(snapshot.state), ". Skipping.");
    return Applied::Ignored;
  }

  if (snapshot.is_inactive()) {
    orders_.erase(it);
    return Applied::Removed;
  }

  if (auto* cancel = std::get_if<CancelInFlight>(&current.state)) {
    if (const auto* open = std::get_if<Open>(&snapshot.state)) {
      cancel->order = *open;
      return Applied::Upserted;
    }
  }

  current = snapshot;
  return Applied::Upserted;
}

void OrderManager::applyCancelled(const OrderCancelled& cancelled) {
  const ClientOrderId& cid = cancelled.key.cid;
  in_flight_.erase(InFlightKey{cid, RequestKind::Cancel});

  auto it = orders_.find(cid);
  if (it == orders_.end()) {
    return;
  }

  if (cancelled.ok()) {
    orders_.erase(it);
    return;
  }

  if (const auto* cancel = std::get_if<CancelInFlight>(&it->second.state)) {
    if (cancel->order) {
      it->second.state = *cancel->order;
    } else {
      it->second.state = OpenInFlight{};
    }
  }
}

void OrderManager::replaceAll(const std::vector<OrderSnapshot>& orders) {
  orders_.clear();
  for (const auto& order : orders) {
    in_flight_.erase(InFlightKey{order.key.cid, RequestKind::Open});
    if (order.is_active()) {
      orders_[order.key.cid] = order;
    }
  }
}

std::vector<domain::OrderRequestCancel> OrderManager::cancelRequests() const {
  std::vector<domain::OrderRequestCancel> requests;
  for (const auto& [cid, order] : orders_) {
    if (order.is_active() &&
        !std::holds_alternative<CancelInFlight>(order.state)) {
      requests.push_back(order.to_cancel_request());
    }
  }
  return requests;
}

}  // namespace tradeflow
