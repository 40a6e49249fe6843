#include "tradeflow/gateway/zmq_market_stream.hpp"

#include "tradeflow/codec/json.hpp"
#include "tradeflow/common/error.hpp"
#include "tradeflow/common/log.hpp"

#include <cerrno>
#include <string>

namespace tradeflow {

// -----------------------------------------------------------------------------
// Constructor: subscribe to everything, bounded recv, connect
// -----------------------------------------------------------------------------
ZmqMarketStream::ZmqMarketStream(const std::string& endpoint) {
  socket_.set(zmq::sockopt::subscribe, "");
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
  socket_.connect(endpoint);

  log::info("ZmqMarketStream", "subscribed to ", endpoint);
}

// -----------------------------------------------------------------------------
// next(): blocking recv until a valid record or stop()
// -----------------------------------------------------------------------------
std::optional<MarketStreamResult> ZmqMarketStream::next() {
  while (!stopped_.load()) {
    zmq::message_t msg;
    zmq::recv_result_t result;
    try {
      result = socket_.recv(msg, zmq::recv_flags::none);
    } catch (const zmq::error_t& e) {
      if (e.num() == EINTR) {
        continue;
      }
      throw;
    }

    if (!result.has_value()) {
      // Timeout; re-check the stop flag.
      continue;
    }

    const std::string payload = msg.to_string();
    try {
      return parse_market_stream_result(payload);
    } catch (const ValidationError& e) {
      log::warn("ZmqMarketStream", "dropping malformed payload: ", e.what(),
                " (", payload, ")");
    }
  }
  return std::nullopt;
}

}  // namespace tradeflow
