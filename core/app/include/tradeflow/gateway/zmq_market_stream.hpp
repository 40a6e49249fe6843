#pragma once

#include "tradeflow/gateway/market_stream.hpp"

#include <zmq.hpp>

#include <atomic>
#include <string>

namespace tradeflow {

// -----------------------------------------------------------------------------
// ZmqMarketStream: market data received over a ZeroMQ SUB socket
// -----------------------------------------------------------------------------
//
// @brief  Subscribes to a publisher and yields one MarketStreamResult per
//         message.
//
// @details
// Each message is a single JSON record, in the same shape as the records
// of a historic market data file:
//
//   {"Item": {"Ok": <MarketEvent>}} | {"Item": {"Err": "..."}}
//   | {"Reconnecting": "binance_spot"}
//
// Malformed payloads are logged and skipped.
//
// recv() uses ZMQ_RCVTIMEO (kRecvTimeoutMs). A timeout loops back to check
// the stop flag, so stop() from another thread is observed within one
// timeout window and next() returns std::nullopt.
//
// The socket is created and connected in the constructor (connect() is
// non-blocking) and used only from the thread calling next().
// -----------------------------------------------------------------------------
class ZmqMarketStream : public IMarketStream {
 public:
  explicit ZmqMarketStream(const std::string& endpoint = "tcp://127.0.0.1:5555");

  ZmqMarketStream(const ZmqMarketStream&) = delete;
  ZmqMarketStream& operator=(const ZmqMarketStream&) = delete;

  std::optional<MarketStreamResult> next() override;

  void stop() override { stopped_.store(true); }

 private:
  static constexpr int kRecvTimeoutMs = 100;

  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};
  std::atomic<bool> stopped_{false};
};

}  // namespace tradeflow
