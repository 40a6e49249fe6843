#include "tradeflow/audit/audit.hpp"

#include "tradeflow/common/overloaded.hpp"

namespace tradeflow {

const char* to_string(EngineError::Severity severity) {
  switch (severity) {
    case EngineError::Severity::Recoverable:
      return "Recoverable";
    case EngineError::Severity::Unrecoverable:
      return "Unrecoverable";
  }
  return "Unknown";
}

const char* to_string(OrderOrigin origin) {
  switch (origin) {
    case OrderOrigin::Command:
      return "Command";
    case OrderOrigin::Algo:
      return "Algo";
    case OrderOrigin::TradingDisabled:
      return "TradingDisabled";
    case OrderOrigin::Disconnect:
      return "Disconnect";
  }
  return "Unknown";
}

const char* audit_event_name(const AuditEvent& event) {
  return std::visit(overloaded{
                        [](const AuditSnapshot&) { return "Snapshot"; },
                        [](const ProcessAudit&) { return "Process"; },
                        [](const FeedEnded&) { return "FeedEnded"; },
                    },
                    event);
}

}  // namespace tradeflow
