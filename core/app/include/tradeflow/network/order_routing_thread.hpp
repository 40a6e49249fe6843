#pragma once

#include "tradeflow/concurrent/thread_safe_queue.hpp"
#include "tradeflow/domain/identifiers.hpp"
#include "tradeflow/domain/order.hpp"
#include "tradeflow/events/engine_feed.hpp"
#include "tradeflow/execution/execution_client.hpp"

#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

namespace tradeflow {

// -----------------------------------------------------------------------------
// OrderRoutingThread: dedicated I/O thread for one exchange's orders
// -----------------------------------------------------------------------------
//
// @brief  Pops order requests from a bounded dispatch queue, runs them
//         through an IExecutionClient, and feeds the responses back to the
//         engine.
//
// @details
// The engine never calls an execution client directly. Venue latency
// (simulated or real) would otherwise stall event processing for every
// instrument. Each configured exchange gets one routing thread:
//
//   engine thread                        order routing thread (exchange i)
//   ─────────────                        ─────────────────────────────────
//   Engine::dispatch()
//         │
//         └──send()──▶ requests_ (bounded)
//                            │
//                     client_->openOrder() / cancelOrder()
//                            │
//         ◀──force_push()── EngineEvent{AccountStreamEvent{AccountEvent}}
//   feed_
//
// Responses use force_push() so a full feed can never deadlock against a
// full dispatch queue: the engine may be blocked in send() while this
// thread is trying to hand back a response.
//
// If the client throws, the request is answered with a failure event
// (OrderSnapshot Inactive(OpenFailed) or OrderCancelled(CancelError)) so the
// engine's in-flight bookkeeping always resolves.
//
// stop() closes the dispatch queue. The worker routes whatever is still
// queued, then exits and is joined. abort() drops the queued requests.
//
// Thread model:
//   Constructed, started and stopped from the system thread.
//   send() is called from the engine thread.
//
// Ownership:
//   Owned by the System via std::unique_ptr. Shares the client and the feed.
// -----------------------------------------------------------------------------
// Runs one request through the client and returns its account events. A
// client that throws is answered with the matching failure event.
std::vector<AccountEvent> route_order_request(IExecutionClient& client,
                                              domain::ExchangeIndex exchange,
                                              const OrderRequest& request);

class OrderRoutingThread {
 public:
  static constexpr std::size_t kDefaultCapacity = 1024;

  OrderRoutingThread(domain::ExchangeIndex exchange,
                     std::shared_ptr<IExecutionClient> client, EngineFeedPtr feed,
                     std::size_t capacity = kDefaultCapacity);

  // RAII: calls stop() if still running.
  ~OrderRoutingThread();

  OrderRoutingThread(const OrderRoutingThread&) = delete;
  OrderRoutingThread& operator=(const OrderRoutingThread&) = delete;
  OrderRoutingThread(OrderRoutingThread&&) = delete;
  OrderRoutingThread& operator=(OrderRoutingThread&&) = delete;

  // Spawns the worker. Idempotent.
  void start();

  // Closes the dispatch queue, drains it and joins the worker. Idempotent.
  void stop();

  // Like stop(), but drops queued requests instead of routing them.
  void abort();

  // -------------------------------------------------------------------------
  // send(request)
  // -------------------------------------------------------------------------
  // @brief  Enqueues a request for this exchange, blocking while the
  //         dispatch queue is full.
  // @return false once the thread has been stopped (request dropped).
  // -------------------------------------------------------------------------
  bool send(OrderRequest request);

  domain::ExchangeIndex exchange() const { return exchange_; }
  bool running() const { return running_; }

 private:
  void run();

  const domain::ExchangeIndex exchange_;
  std::shared_ptr<IExecutionClient> client_;
  EngineFeedPtr feed_;
  ThreadSafeQueue<OrderRequest> requests_;
  std::thread worker_;
  bool running_{false};
};

}  // namespace tradeflow
