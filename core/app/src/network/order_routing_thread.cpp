#include "tradeflow/network/order_routing_thread.hpp"

#include "tradeflow/common/log.hpp"
#include "tradeflow/common/overloaded.hpp"

#include <exception>
#include <utility>

namespace tradeflow {

// -----------------------------------------------------------------------------
// Constructor: nothing runs until start()
// -----------------------------------------------------------------------------
OrderRoutingThread::OrderRoutingThread(domain::ExchangeIndex exchange,
                                       std::shared_ptr<IExecutionClient> client,
                                       EngineFeedPtr feed, std::size_t capacity)
    : exchange_(exchange),
      client_(std::move(client)),
      feed_(std::move(feed)),
      requests_(capacity) {}

OrderRoutingThread::~OrderRoutingThread() { stop(); }

// -----------------------------------------------------------------------------
// start(): spawn the worker
// -----------------------------------------------------------------------------
void OrderRoutingThread::start() {
  if (running_) {
    return;
  }
  running_ = true;
  worker_ = std::thread([this] { run(); });

  log::info("OrderRoutingThread", "started (",
            domain::to_string(client_->exchange()), ").");
}

// -----------------------------------------------------------------------------
// stop(): close the queue, route what is left, join
// -----------------------------------------------------------------------------
void OrderRoutingThread::stop() {
  requests_.close();
  if (!running_) {
    return;
  }
  if (worker_.joinable()) {
    worker_.join();
  }
  running_ = false;

  log::info("OrderRoutingThread", "stopped (",
            domain::to_string(client_->exchange()), ").");
}

void OrderRoutingThread::abort() {
  const std::size_t dropped = requests_.close_and_clear();
  if (dropped != 0) {
    log::warn("OrderRoutingThread", "dropped ", dropped, " queued requests (",
              domain::to_string(client_->exchange()), ").");
  }
  stop();
}

bool OrderRoutingThread::send(OrderRequest request) {
  return requests_.push(std::move(request));
}

// -----------------------------------------------------------------------------
// run(): worker loop
// -----------------------------------------------------------------------------
void OrderRoutingThread::run() {
  while (auto request = requests_.pop()) {
    for (auto& event : route_order_request(*client_, exchange_, *request)) {
      feed_->force_push(EngineEvent{AccountStreamEvent{std::move(event)}});
    }
  }
}

namespace {

AccountEvent failure(domain::ExchangeIndex exchange, const OrderRequest& request,
                     const std::string& reason) {
  return std::visit(
      overloaded{
          [&](const domain::OrderRequestOpen& open) {
            domain::OrderSnapshot order = domain::OrderSnapshot::from_request(open);
            order.state = domain::OpenFailed{reason};
            return AccountEvent{exchange, std::move(order)};
          },
          [&](const domain::OrderRequestCancel& cancel) {
            return AccountEvent{exchange,
                                OrderCancelled{cancel.key, CancelError{reason}}};
          },
      },
      request);
}

}  // namespace

std::vector<AccountEvent> route_order_request(IExecutionClient& client,
                                              domain::ExchangeIndex exchange,
                                              const OrderRequest& request) {
  try {
    return std::visit(
        overloaded{
            [&client](const domain::OrderRequestOpen& open) {
              return client.openOrder(open);
            },
            [&client](const domain::OrderRequestCancel& cancel) {
              return client.cancelOrder(cancel);
            },
        },
        request);
  } catch (const std::exception& e) {
    log::error("OrderRoutingThread", "execution client failed: ", e.what());
    return {failure(exchange, request, e.what())};
  }
}

}  // namespace tradeflow
