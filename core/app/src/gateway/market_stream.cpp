#include "tradeflow/gateway/market_stream.hpp"

#include "tradeflow/codec/json.hpp"
#include "tradeflow/common/error.hpp"
#include "tradeflow/common/log.hpp"

#include <fstream>
#include <sstream>
#include <utility>

namespace tradeflow {

VectorMarketStream::VectorMarketStream(std::vector<MarketStreamResult> records)
    : records_(std::move(records)) {}

std::optional<MarketStreamResult> VectorMarketStream::next() {
  if (position_ >= records_.size()) {
    return std::nullopt;
  }
  return std::move(records_[position_++]);
}

std::vector<MarketStreamResult> load_market_data(const std::string& path) {
  std::ifstream file(path);
  if (!file) {
    throw ValidationError("cannot open market data file '" + path + "'");
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  std::vector<MarketStreamResult> records = parse_market_stream_results(buffer.str());
  log::info("MarketData", "loaded ", records.size(), " records from ", path);
  return records;
}

}  // namespace tradeflow
