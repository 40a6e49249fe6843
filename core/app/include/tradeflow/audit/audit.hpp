#pragma once

#include "tradeflow/audit/engine_error.hpp"
#include "tradeflow/domain/identifiers.hpp"
#include "tradeflow/domain/order.hpp"
#include "tradeflow/domain/position.hpp"
#include "tradeflow/events/engine_event.hpp"
#include "tradeflow/state/engine_state.hpp"
#include "tradeflow/time/time_utils.hpp"

#include <string>
#include <variant>
#include <vector>

namespace tradeflow {

// Sequence and engine time of one processed event.
struct EngineContext {
  domain::Sequence sequence{0};
  Timestamp time{};
};

// Which decision path produced a batch of dispatched requests.
enum class OrderOrigin {
  Command,
  Algo,
  TradingDisabled,
  Disconnect,
};

const char* to_string(OrderOrigin origin);

// -----------------------------------------------------------------------------
// Engine outputs recorded per processed event
// -----------------------------------------------------------------------------
// OrdersSent lists only requests that reached their exchange's dispatch
// queue; each of them was recorded in flight with the tick's context.
// PositionExited carries every position closed by the event.
// -----------------------------------------------------------------------------
struct OrdersSent {
  OrderOrigin origin{OrderOrigin::Command};
  std::vector<domain::OrderRequestCancel> cancels;
  std::vector<domain::OrderRequestOpen> opens;
};

struct PositionExited {
  domain::ClosedPosition position;
};

using EngineOutput = std::variant<OrdersSent, PositionExited>;

// -----------------------------------------------------------------------------
// AuditTick: one entry of the audit stream
// -----------------------------------------------------------------------------
//
//   context            sequence + engine time
//   event:
//     AuditSnapshot    full EngineState before the first event (seq 0)
//     ProcessAudit     the processed event with its outputs and errors
//     FeedEnded        terminator, with its own sequence number
//
// The stream is Snapshot, Process*, FeedEnded. Sequence strictly increases
// across every tick.
// -----------------------------------------------------------------------------
struct AuditSnapshot {
  EngineState state;
};

struct ProcessAudit {
  EngineEvent event;
  std::string event_kind;
  std::vector<EngineOutput> outputs;
  std::vector<EngineError> errors;
};

struct FeedEnded {};

using AuditEvent = std::variant<AuditSnapshot, ProcessAudit, FeedEnded>;

struct AuditTick {
  EngineContext context;
  AuditEvent event;
};

// "Snapshot", "Process", "FeedEnded"
const char* audit_event_name(const AuditEvent& event);

}  // namespace tradeflow
