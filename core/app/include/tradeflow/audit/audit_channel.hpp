#pragma once

#include "tradeflow/audit/audit.hpp"
#include "tradeflow/concurrent/thread_safe_queue.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace tradeflow {

// What the sender does when the receiver falls behind by more than the
// high-water mark.
enum class AuditOverflowPolicy {
  Detach,  // stop auditing, log once, close the stream
  Fail,    // throw AuditOverflowError from the engine thread
};

// -----------------------------------------------------------------------------
// Audit channel: unbounded single-consumer tick stream
// -----------------------------------------------------------------------------
//
// @brief  Carries AuditTicks from the engine thread to one consumer.
//
// @details
// make_audit_channel() returns a connected (AuditSender, AuditReceiver) pair
// over one shared ThreadSafeQueue<AuditTick>. The queue is unbounded, so the
// engine never waits on its consumer. The high-water mark exists so a stalled
// consumer cannot grow memory without limit.
//
// Lifetime:
//   - Dropping the receiver turns every later send() into a no-op. The
//     sender logs this once.
//   - Dropping (or closing) the sender closes the stream. The receiver drains
//     what is queued and then sees std::nullopt.
//
// Thread model: the sender lives on the engine thread, the receiver on any
// one consumer thread. Both are move-only.
// -----------------------------------------------------------------------------

namespace detail {

struct AuditShared {
  ThreadSafeQueue<AuditTick> queue;
  std::atomic<bool> receiver_alive{true};
};

}  // namespace detail

class AuditSender {
 public:
  static constexpr std::size_t kDefaultHighWaterMark = 1'000'000;

  AuditSender(std::shared_ptr<detail::AuditShared> shared, AuditOverflowPolicy policy,
              std::size_t high_water_mark);
  ~AuditSender();

  AuditSender(AuditSender&& other) noexcept;
  AuditSender& operator=(AuditSender&& other) noexcept;
  AuditSender(const AuditSender&) = delete;
  AuditSender& operator=(const AuditSender&) = delete;

  // Enqueues a tick. No-op once detached. Throws AuditOverflowError under
  // the Fail policy when the backlog reaches the high-water mark.
  void send(AuditTick tick);

  // Closes the stream; later sends are no-ops.
  void close();

  bool detached() const { return detached_; }

 private:
  void detach(const char* reason);

  std::shared_ptr<detail::AuditShared> shared_;
  AuditOverflowPolicy policy_{AuditOverflowPolicy::Detach};
  std::size_t high_water_mark_{kDefaultHighWaterMark};
  bool detached_{false};
};

class AuditReceiver {
 public:
  explicit AuditReceiver(std::shared_ptr<detail::AuditShared> shared);
  ~AuditReceiver();

  AuditReceiver(AuditReceiver&& other) noexcept = default;
  AuditReceiver& operator=(AuditReceiver&& other) noexcept;
  AuditReceiver(const AuditReceiver&) = delete;
  AuditReceiver& operator=(const AuditReceiver&) = delete;

  // Blocks for the next tick; std::nullopt once the stream is closed and
  // drained.
  std::optional<AuditTick> recv();

  template <typename Rep, typename Period>
  std::optional<AuditTick> recv_for(std::chrono::duration<Rep, Period> timeout) {
    return shared_->queue.pop_for(timeout);
  }

  std::optional<AuditTick> try_recv();

  // Receives until the stream ends (FeedEnded or sender closed).
  std::vector<AuditTick> collect();

 private:
  void release();

  std::shared_ptr<detail::AuditShared> shared_;
};

std::pair<AuditSender, AuditReceiver> make_audit_channel(
    AuditOverflowPolicy policy = AuditOverflowPolicy::Detach,
    std::size_t high_water_mark = AuditSender::kDefaultHighWaterMark);

}  // namespace tradeflow
