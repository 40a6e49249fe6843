// -----------------------------------------------------------------------------
// tradeflow_engine_app: single executable entry point.
//
// Two modes:
//
//   backtest <config.json> <market_data.json> [risk_free_return] [interval]
//     Replays a recorded market data file through the full system under a
//     HistoricalClock and prints the TradingSummary as JSON.
//
//   paper <config.json> [market_endpoint]
//     Live paper trading against the mock execution clients:
//       - market data arrives over ZeroMQ (SUB, default tcp://127.0.0.1:5555);
//       - operators talk to the engine over the IPC REP socket (5556);
//       - every audit tick is published on the IPC PUB socket (5557).
//     Trading starts Disabled; send {"TradingStateUpdate":"Enabled"} over IPC
//     to begin. Ctrl-C shuts down, drains, and prints the summary.
//
// Thread layout (paper):
//   main thread        → waits for SIGINT, then shuts the system down
//   engine worker      → Engine::run()
//   order routing      → one thread per mock execution client
//   market stream      → ZmqMarketStream recv loop
//   ipc server         → REP commands + PUB telemetry
//   audit forwarder    → AuditReceiver → IpcServer::publish()
// -----------------------------------------------------------------------------

#include "tradeflow/codec/json.hpp"
#include "tradeflow/common/error.hpp"
#include "tradeflow/common/log.hpp"
#include "tradeflow/config/system_config.hpp"
#include "tradeflow/engine/backtest.hpp"
#include "tradeflow/engine/command_handler.hpp"
#include "tradeflow/engine/system.hpp"
#include "tradeflow/gateway/zmq_market_stream.hpp"
#include "tradeflow/network/ipc_server.hpp"
#include "tradeflow/statistic/time_interval.hpp"
#include "tradeflow/time/live_clock.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

namespace {

// -----------------------------------------------------------------------------
// Shutdown flag for the signal handler.
// The only global in the program. A lock-free atomic store is
// async-signal-safe; main() polls it.
// -----------------------------------------------------------------------------
std::atomic<bool> g_shutdown_requested{false};

void sigint_handler(int /*signum*/) { g_shutdown_requested.store(true); }

constexpr std::chrono::milliseconds kShutdownTimeout{10000};

void print_usage() {
  std::cerr << "usage:\n"
            << "  tradeflow_engine_app backtest <config.json> <market_data.json>"
               " [risk_free_return] [interval]\n"
            << "  tradeflow_engine_app paper <config.json> [market_endpoint]\n";
}

int run_backtest(int argc, char** argv) {
  if (argc < 4) {
    print_usage();
    return 2;
  }
  const tradeflow::SystemConfig config = tradeflow::load_system_config(argv[2]);
  const tradeflow::Decimal risk_free_return =
      argc > 4 ? tradeflow::Decimal::parse(argv[4])
               : config.risk_free_return.value_or(tradeflow::Decimal{0});
  const tradeflow::TimeInterval interval = argc > 5
                                               ? tradeflow::TimeInterval::parse(argv[5])
                                               : tradeflow::TimeInterval::annual_365();

  const tradeflow::TradingSummary summary =
      tradeflow::run_historic_backtest(config, argv[3], risk_free_return, interval);
  std::cout << tradeflow::encode_trading_summary(summary).dump(2) << "\n";
  return 0;
}

int run_paper(int argc, char** argv) {
  if (argc < 3) {
    print_usage();
    return 2;
  }
  const tradeflow::SystemConfig config = tradeflow::load_system_config(argv[2]);
  const std::string market_endpoint = argc > 3 ? argv[3] : "tcp://127.0.0.1:5555";

  // -------------------------------------------------------------------------
  // 1) Build the system: live clock, ZeroMQ market data, audit on.
  // -------------------------------------------------------------------------
  tradeflow::SystemBuilder builder(config);
  builder.clock(std::make_shared<tradeflow::LiveClock>())
      .marketStream(std::make_unique<tradeflow::ZmqMarketStream>(market_endpoint))
      .auditMode(tradeflow::AuditMode::Enabled)
      .tradingState(tradeflow::TradingState::Disabled);
  std::unique_ptr<tradeflow::System> system = builder.buildWithLimits();

  // -------------------------------------------------------------------------
  // 2) IPC: commands in, audit ticks out.
  // -------------------------------------------------------------------------
  tradeflow::IpcServer ipc(tradeflow::make_command_handler(*system));
  tradeflow::AuditReceiver audit = system->takeAudit();
  std::thread audit_forwarder([&audit, &ipc] {
    while (auto tick = audit.recv()) {
      ipc.publish(std::move(*tick));
    }
  });

  system->start();
  ipc.start();

  std::signal(SIGINT, sigint_handler);
  tradeflow::log::info("main", "market data on ", market_endpoint,
                       "; commands on tcp://127.0.0.1:5556; telemetry on "
                       "tcp://127.0.0.1:5557. Press Ctrl-C to shut down.");

  // -------------------------------------------------------------------------
  // 3) Wait for Ctrl-C (or for the engine to stop on its own).
  // -------------------------------------------------------------------------
  while (!g_shutdown_requested.load() && !system->terminated()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  tradeflow::log::info("main", "shutting down...");

  // -------------------------------------------------------------------------
  // 4) Drain, summarise, stop I/O.
  // -------------------------------------------------------------------------
  int status = 0;
  try {
    const tradeflow::TradingSummary summary = system->shutdownWithSummary(
        config.risk_free_return.value_or(tradeflow::Decimal{0}),
        tradeflow::TimeInterval::annual_365(), kShutdownTimeout);
    std::cout << tradeflow::encode_trading_summary(summary).dump(2) << "\n";
  } catch (const tradeflow::TimeoutError& e) {
    tradeflow::log::error("main", e.what(), "; aborting.");
    system->abort();
    // The command handler refers to the system; stop IPC before the engine
    // (and with it the audit sender) is destroyed.
    ipc.stop();
    system.reset();
    status = 1;
  }

  audit_forwarder.join();
  ipc.stop();
  return status;
}

}  // namespace

int main(int argc, char** argv) {
  tradeflow::log::init_console();

  if (argc < 2) {
    print_usage();
    return 2;
  }

  const std::string mode = argv[1];
  try {
    if (mode == "backtest") {
      return run_backtest(argc, argv);
    }
    if (mode == "paper") {
      return run_paper(argc, argv);
    }
  } catch (const tradeflow::ValidationError& e) {
    tradeflow::log::error("main", "invalid input: ", e.what());
    return 2;
  } catch (const std::exception& e) {
    tradeflow::log::error("main", "fatal: ", e.what());
    return 1;
  }

  print_usage();
  return 2;
}
