#pragma once

#include "tradeflow/events/market_event.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace tradeflow {

// -----------------------------------------------------------------------------
// IMarketStream: source of market data records
// -----------------------------------------------------------------------------
//
// @brief  Pull interface over a sequence of MarketStreamResult records
//         (Reconnecting, Item(Ok(MarketEvent)) or Item(Err(message))).
//
// @details
// next() blocks until a record is available and returns std::nullopt once
// the stream is exhausted or stop() was called. A MarketStreamThread is
// the only caller of next(); stop() may be called from any thread.
// -----------------------------------------------------------------------------
class IMarketStream {
 public:
  virtual ~IMarketStream() = default;

  virtual std::optional<MarketStreamResult> next() = 0;

  virtual void stop() {}
};

// In-memory stream over a fixed list of records, in order.
class VectorMarketStream : public IMarketStream {
 public:
  explicit VectorMarketStream(std::vector<MarketStreamResult> records);

  std::optional<MarketStreamResult> next() override;

  std::size_t remaining() const { return records_.size() - position_; }

 private:
  std::vector<MarketStreamResult> records_;
  std::size_t position_{0};
};

// -----------------------------------------------------------------------------
// load_market_data(path)
// -----------------------------------------------------------------------------
// @brief  Reads a JSON array of MarketStreamResult records from a file.
// @throws ValidationError if the file cannot be read or a record is
//         malformed (the message names the record index).
// -----------------------------------------------------------------------------
std::vector<MarketStreamResult> load_market_data(const std::string& path);

}  // namespace tradeflow
