#include "tradeflow/network/market_stream_thread.hpp"

#include "tradeflow/common/log.hpp"
#include "tradeflow/common/overloaded.hpp"

#include <utility>

namespace tradeflow {

MarketStreamThread::MarketStreamThread(std::unique_ptr<IMarketStream> stream,
                                       EngineFeedPtr feed)
    : stream_(std::move(stream)),
      feed_(std::move(feed)),
      exhausted_(done_.get_future().share()) {}

MarketStreamThread::~MarketStreamThread() { stop(); }

// -----------------------------------------------------------------------------
// start(): spawn the pump
// -----------------------------------------------------------------------------
void MarketStreamThread::start() {
  if (thread_.joinable()) {
    return;
  }
  thread_ = std::thread([this] {
    log::info("MarketStreamThread", "started.");
    run();
    log::info("MarketStreamThread", "stream ended after ", forwarded_.load(),
              " events (", skipped_.load(), " skipped).");
    done_.set_value();
  });
}

// -----------------------------------------------------------------------------
// stop(): signal the stream and join
// -----------------------------------------------------------------------------
void MarketStreamThread::stop() {
  if (stream_) {
    stream_->stop();
  }
  if (thread_.joinable()) {
    thread_.join();
  }
}

void MarketStreamThread::run() {
  while (auto record = stream_->next()) {
    if (!forward(*record)) {
      log::warn("MarketStreamThread", "engine feed closed; stopping.");
      return;
    }
  }
}

bool MarketStreamThread::pumpNext() {
  auto record = stream_->next();
  return record && forward(*record);
}

bool MarketStreamThread::forward(MarketStreamResult& record) {
  const bool pushed = std::visit(
      overloaded{
          [this](Reconnecting& reconnecting) {
            return feed_->push(EngineEvent{MarketStreamEvent{reconnecting}});
          },
          [this](MarketEvent& event) {
            return feed_->push(EngineEvent{MarketStreamEvent{std::move(event)}});
          },
          [this](MarketStreamError& error) {
            log::warn("MarketStreamThread", "skipping stream error: ", error.message);
            ++skipped_;
            return true;
          },
      },
      record);

  if (pushed && !std::holds_alternative<MarketStreamError>(record)) {
    ++forwarded_;
  }
  return pushed;
}

}  // namespace tradeflow
