#include "tradeflow/audit/audit_replica.hpp"

#include "tradeflow/common/error.hpp"
#include "tradeflow/common/overloaded.hpp"

#include <string>

namespace tradeflow {

namespace {

const EngineState& snapshot_state(const AuditTick& tick) {
  const auto* snapshot = std::get_if<AuditSnapshot>(&tick.event);
  if (snapshot == nullptr) {
    throw ValidationError(std::string("audit stream must start with a Snapshot, got ") +
                          audit_event_name(tick.event));
  }
  return snapshot->state;
}

}  // namespace

AuditReplica::AuditReplica(const AuditTick& snapshot)
    : state_(snapshot_state(snapshot)), last_sequence_(snapshot.context.sequence) {}

void AuditReplica::apply(const AuditTick& tick) {
  if (ended_) {
    throw ValidationError("audit tick after FeedEnded");
  }
  if (tick.context.sequence <= last_sequence_) {
    throw ValidationError("audit sequence " + std::to_string(tick.context.sequence) +
                          " does not follow " + std::to_string(last_sequence_));
  }
  last_sequence_ = tick.context.sequence;

  std::visit(overloaded{
                 [](const AuditSnapshot&) {
                   throw ValidationError("unexpected second audit Snapshot");
                 },
                 [&](const ProcessAudit& process) { applyProcess(tick.context, process); },
                 [&](const FeedEnded&) { ended_ = true; },
             },
             tick.event);
}

void AuditReplica::applyProcess(const EngineContext& context,
                                 const ProcessAudit& process) {
  std::visit(overloaded{
                 [&](const Shutdown&) {
                   state_.setTrading(TradingState::Disabled);
                   draining_ = true;
                 },
                 [&](const TradingStateUpdate& update) {
                   if (!draining_) {
                     state_.setTrading(update.state);
                   }
                 },
                 [](const Command&) {},
                 [&](const AccountStreamEvent& event) {
                   if (state_.applyAccount(event).unrecoverable()) {
                     state_.setTrading(TradingState::Disabled);
                     draining_ = true;
                   }
                 },
                 [&](const MarketStreamEvent& event) { state_.applyMarket(event); },
             },
             process.event);

  for (const auto& output : process.outputs) {
    const auto* sent = std::get_if<OrdersSent>(&output);
    if (sent == nullptr) {
      continue;
    }
    for (const auto& cancel : sent->cancels) {
      state_.recordInFlight(cancel, context.sequence, context.time);
    }
    for (const auto& open : sent->opens) {
      state_.recordInFlight(open, context.sequence, context.time);
    }
  }
}

EngineState AuditReplica::replay(const std::vector<AuditTick>& ticks) {
  if (ticks.empty()) {
    throw ValidationError("empty audit stream");
  }
  AuditReplica replica(ticks.front());
  for (std::size_t i = 1; i < ticks.size(); ++i) {
    replica.apply(ticks[i]);
  }
  return replica.state();
}

}  // namespace tradeflow
