#pragma once

#include "tradeflow/events/engine_feed.hpp"
#include "tradeflow/gateway/market_stream.hpp"

#include <atomic>
#include <cstdint>
#include <future>
#include <memory>
#include <thread>

namespace tradeflow {

// -----------------------------------------------------------------------------
// MarketStreamThread: pumps one IMarketStream into the engine feed
// -----------------------------------------------------------------------------
//
// @brief  Dedicated thread that pulls records from a market stream and
//         pushes them into the engine feed as MarketStreamEvents.
//
// @details
//   Item(Ok(event))     → EngineEvent{MarketStreamEvent{event}}
//   Reconnecting(ex)    → EngineEvent{MarketStreamEvent{Reconnecting{ex}}}
//   Item(Err(message))  → logged and skipped
//
// push() blocks while the feed is full, so a fast stream is paced by the
// engine. The loop ends when the stream is exhausted, when stop() is
// called, or when the feed is closed. Either way, exhausted() becomes
// ready.
//
// pumpNext() is the same step run on the caller's thread, for an
// orchestrator that feeds the engine one record at a time. Do not mix it
// with start().
//
// Thread model:
//   start()/stop() from the system thread. exhausted() may be waited on
//   from any thread.
// -----------------------------------------------------------------------------
class MarketStreamThread {
 public:
  MarketStreamThread(std::unique_ptr<IMarketStream> stream, EngineFeedPtr feed);

  // RAII: calls stop().
  ~MarketStreamThread();

  MarketStreamThread(const MarketStreamThread&) = delete;
  MarketStreamThread& operator=(const MarketStreamThread&) = delete;

  // Spawns the pump. Idempotent.
  void start();

  // Stops the stream and joins. Records already pushed stay in the feed.
  void stop();

  // Pulls one record and forwards it. Returns false once the stream is
  // exhausted or the feed is closed.
  bool pumpNext();

  // Ready once the pump loop has exited.
  std::shared_future<void> exhausted() const { return exhausted_; }

  std::uint64_t forwarded() const { return forwarded_.load(); }
  std::uint64_t skipped() const { return skipped_.load(); }

 private:
  void run();
  bool forward(MarketStreamResult& record);

  std::unique_ptr<IMarketStream> stream_;
  EngineFeedPtr feed_;
  std::promise<void> done_;
  std::shared_future<void> exhausted_;
  std::thread thread_;
  std::atomic<std::uint64_t> forwarded_{0};
  std::atomic<std::uint64_t> skipped_{0};
};

}  // namespace tradeflow
