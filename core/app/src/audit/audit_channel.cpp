#include "tradeflow/audit/audit_channel.hpp"

#include "tradeflow/common/error.hpp"
#include "tradeflow/common/log.hpp"

#include <string>

namespace tradeflow {

// -----------------------------------------------------------------------------
// AuditSender
// -----------------------------------------------------------------------------
AuditSender::AuditSender(std::shared_ptr<detail::AuditShared> shared,
                         AuditOverflowPolicy policy, std::size_t high_water_mark)
    : shared_(std::move(shared)),
      policy_(policy),
      high_water_mark_(high_water_mark == 0 ? 1 : high_water_mark) {}

AuditSender::~AuditSender() { close(); }

AuditSender::AuditSender(AuditSender&& other) noexcept
    : shared_(std::move(other.shared_)),
      policy_(other.policy_),
      high_water_mark_(other.high_water_mark_),
      detached_(other.detached_) {}

AuditSender& AuditSender::operator=(AuditSender&& other) noexcept {
  if (this != &other) {
    close();
    shared_ = std::move(other.shared_);
    policy_ = other.policy_;
    high_water_mark_ = other.high_water_mark_;
    detached_ = other.detached_;
  }
  return *this;
}

void AuditSender::send(AuditTick tick) {
  if (detached_ || !shared_) {
    return;
  }
  if (!shared_->receiver_alive.load(std::memory_order_acquire)) {
    detach("audit receiver dropped; audit disabled");
    return;
  }
  if (shared_->queue.size() >= high_water_mark_) {
    if (policy_ == AuditOverflowPolicy::Fail) {
      throw AuditOverflowError("audit backlog reached " +
                               std::to_string(high_water_mark_) + " ticks");
    }
    detach("audit consumer too slow; audit detached");
    return;
  }
  if (!shared_->queue.push(std::move(tick))) {
    detach("audit stream closed; audit disabled");
  }
}

void AuditSender::close() {
  if (shared_) {
    shared_->queue.close();
  }
}

void AuditSender::detach(const char* reason) {
  detached_ = true;
  log::warn("Audit", reason);
  close();
}

// -----------------------------------------------------------------------------
// AuditReceiver
// -----------------------------------------------------------------------------
AuditReceiver::AuditReceiver(std::shared_ptr<detail::AuditShared> shared)
    : shared_(std::move(shared)) {}

AuditReceiver::~AuditReceiver() { release(); }

AuditReceiver& AuditReceiver::operator=(AuditReceiver&& other) noexcept {
  if (this != &other) {
    release();
    shared_ = std::move(other.shared_);
  }
  return *this;
}

std::optional<AuditTick> AuditReceiver::recv() { return shared_->queue.pop(); }

std::optional<AuditTick> AuditReceiver::try_recv() { return shared_->queue.try_pop(); }

std::vector<AuditTick> AuditReceiver::collect() {
  std::vector<AuditTick> ticks;
  while (auto tick = recv()) {
    const bool ended = std::holds_alternative<FeedEnded>(tick->event);
    ticks.push_back(std::move(*tick));
    if (ended) {
      break;
    }
  }
  return ticks;
}

void AuditReceiver::release() {
  if (shared_) {
    shared_->receiver_alive.store(false, std::memory_order_release);
    shared_->queue.close();
    shared_.reset();
  }
}

std::pair<AuditSender, AuditReceiver> make_audit_channel(AuditOverflowPolicy policy,
                                                         std::size_t high_water_mark) {
  auto shared = std::make_shared<detail::AuditShared>();
  return {AuditSender(shared, policy, high_water_mark), AuditReceiver(shared)};
}

}  // namespace tradeflow
