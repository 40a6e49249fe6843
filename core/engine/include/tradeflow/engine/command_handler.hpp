#pragma once

#include "tradeflow/engine/system.hpp"
#include "tradeflow/network/ipc_server.hpp"

#include <string>

namespace tradeflow {

// -----------------------------------------------------------------------------
// make_command_handler(system)
// -----------------------------------------------------------------------------
//
// @brief  Builds the IpcServer request handler that forwards operator
//         commands into a running System.
//
// @details
// Requests and replies:
//   "PING"    → {"status":"ok","response":"PONG"}
//   "STATUS"  → {"status":"ok", "mode", "started", "terminated",
//                "events_sent", "feed_pending", "market_forwarded",
//                "market_skipped"}
//   "HALT"    → trading disabled; {"status":"ok","response":"Trading disabled"}
//   <EngineEvent JSON> or [<EngineEvent JSON>, ...]
//             → validated and queued; {"status":"ok","accepted":n}
//   anything that fails to parse or validate
//             → {"status":"error","message":"..."}
//
// Thread model: runs on the IPC server thread. The System's feed-in calls
// are thread-safe. The System must outlive the IpcServer.
// -----------------------------------------------------------------------------
IpcServer::CommandHandler make_command_handler(System& system);

}  // namespace tradeflow
