#pragma once

#include "tradeflow/audit/audit.hpp"
#include "tradeflow/state/engine_state.hpp"

#include <vector>

namespace tradeflow {

// -----------------------------------------------------------------------------
// AuditReplica: rebuilds EngineState from an audit stream
// -----------------------------------------------------------------------------
//
// @brief  Starts from the Snapshot tick and re-applies every Process tick
//         through the same EngineState mutators the engine used.
//
// @details
// For each Process tick, in order:
//   1. the recorded input event is applied exactly as the engine applied it:
//        Shutdown            trading disabled, replica starts draining
//        TradingStateUpdate  applied unless draining
//        Account / Market    applyAccount / applyMarket
//        Command             no direct state change
//   2. every request listed in an OrdersSent output is recorded in flight
//      with the tick's context.
//
// An Unrecoverable error from an account event disables trading and starts
// draining, as it does in the engine.
//
// apply() throws ValidationError for a stream that breaks the
// Snapshot → Process* → FeedEnded shape or whose sequence does not strictly
// increase.
// -----------------------------------------------------------------------------
class AuditReplica {
 public:
  explicit AuditReplica(const AuditTick& snapshot);

  void apply(const AuditTick& tick);

  const EngineState& state() const { return state_; }
  bool ended() const { return ended_; }
  bool draining() const { return draining_; }

  // Replays a complete stream (first tick must be the Snapshot).
  static EngineState replay(const std::vector<AuditTick>& ticks);

 private:
  void applyProcess(const EngineContext& context, const ProcessAudit& process);

  EngineState state_;
  domain::Sequence last_sequence_{0};
  bool draining_{false};
  bool ended_{false};
};

}  // namespace tradeflow
