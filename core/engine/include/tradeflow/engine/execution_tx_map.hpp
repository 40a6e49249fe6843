#pragma once

#include "tradeflow/domain/identifiers.hpp"
#include "tradeflow/domain/order.hpp"

#include <functional>
#include <map>
#include <utility>

namespace tradeflow {

// Hands one request to an exchange's dispatch queue. Returns false when the
// queue has been closed.
using ExecutionTx = std::function<bool(OrderRequest)>;

// -----------------------------------------------------------------------------
// ExecutionTxMap: per-exchange request senders used by the engine
// -----------------------------------------------------------------------------
// The system fills it with one sender per OrderRoutingThread. Tests fill it
// with lambdas that record what the engine dispatched.
// -----------------------------------------------------------------------------
class ExecutionTxMap {
 public:
  void insert(domain::ExchangeIndex exchange, ExecutionTx tx) {
    senders_[exchange] = std::move(tx);
  }

  bool contains(domain::ExchangeIndex exchange) const {
    return senders_.count(exchange) != 0;
  }

  // false when no sender is registered or the sender refused the request.
  bool send(domain::ExchangeIndex exchange, OrderRequest request) const {
    auto it = senders_.find(exchange);
    if (it == senders_.end()) {
      return false;
    }
    return it->second(std::move(request));
  }

  std::size_t size() const { return senders_.size(); }

 private:
  std::map<domain::ExchangeIndex, ExecutionTx> senders_;
};

}  // namespace tradeflow
