#pragma once

#include "tradeflow/domain/identifiers.hpp"
#include "tradeflow/domain/order.hpp"
#include "tradeflow/events/account_event.hpp"
#include "tradeflow/time/time_utils.hpp"

#include <map>
#include <optional>
#include <utility>
#include <vector>

namespace tradeflow {

enum class RequestKind {
  Open,
  Cancel,
};

const char* to_string(RequestKind kind);

// A request dispatched to an exchange that has not been answered yet.
struct InFlightRequest {
  RequestKind kind{RequestKind::Open};
  domain::Sequence sequence{0};
  Timestamp time{};
};

// -----------------------------------------------------------------------------
// OrderManager: order table and in-flight recorder of one instrument
// -----------------------------------------------------------------------------
//
// @brief  Keeps exactly one OrderSnapshot per ClientOrderId for the active
//         orders of an instrument, and the open/cancel requests still
//         awaiting an exchange answer.
//
// @details
// Dispatch side (engine, before a request leaves for the exchange):
//   - canOpen(cid)       false while cid is active or has an open in flight.
//   - recordOpen()       inserts the order as Active(OpenInFlight).
//   - prepareCancel()    resolves the exchange OrderId; std::nullopt when
//                         the order is unknown, inactive or already
//                         cancelling (idempotent cancels).
//   - recordCancel()     moves the order to CancelInFlight, keeping its Open
//                         state so a rejected cancel can restore it.
//   - forget()            undoes recordOpen()/recordCancel() when the
//                         dispatch queue refused the request.
//
// Exchange side (engine and audit replica):
//   - applySnapshot()    upserts by cid after is_valid_transition(); an
//                         Inactive snapshot removes the order. Illegal
//                         transitions are logged and ignored. An Open update
//                         that arrives while a cancel is in flight refreshes
//                         the saved Open state and keeps CancelInFlight.
//   - applyCancelled()   Ok removes the order, Err restores the saved state.
//   - replaceAll()       account snapshot resync.
//
// Open requests are resolved by any OrderSnapshot for their cid; cancel
// requests only by an OrderCancelled.
//
// Thread model: owned by EngineState on the engine thread; no locking.
// -----------------------------------------------------------------------------
class OrderManager {
 public:
  using InFlightKey = std::pair<domain::ClientOrderId, RequestKind>;

  enum class Applied {
    Upserted,
    Removed,
    Ignored,
  };

  const std::map<domain::ClientOrderId, domain::OrderSnapshot>& orders() const {
    return orders_;
  }
  const std::map<InFlightKey, InFlightRequest>& inFlight() const {
    return in_flight_;
  }

  const domain::OrderSnapshot* find(const domain::ClientOrderId& cid) const;

  bool canOpen(const domain::ClientOrderId& cid) const;
  void recordOpen(const domain::OrderRequestOpen& request,
                   domain::Sequence sequence, Timestamp time);

  std::optional<domain::OrderRequestCancel> prepareCancel(
      const domain::OrderRequestCancel& request) const;
  void recordCancel(const domain::OrderRequestCancel& request,
                     domain::Sequence sequence, Timestamp time);

  void forget(const domain::ClientOrderId& cid, RequestKind kind);

  Applied applySnapshot(const domain::OrderSnapshot& snapshot);
  void applyCancelled(const OrderCancelled& cancelled);
  void replaceAll(const std::vector<domain::OrderSnapshot>& orders);

  // Cancel requests for every active order not already being cancelled.
  std::vector<domain::OrderRequestCancel> cancelRequests() const;

  bool hasInFlight() const { return !in_flight_.empty(); }

 private:
  std::map<domain::ClientOrderId, domain::OrderSnapshot> orders_;
  std::map<InFlightKey, InFlightRequest> in_flight_;
};

}  // namespace tradeflow
