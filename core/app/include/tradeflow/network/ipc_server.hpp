#pragma once

#include "tradeflow/audit/audit.hpp"
#include "tradeflow/concurrent/thread_safe_queue.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace tradeflow {

class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @brief  Stores parameters for deferred socket creation.
  //
  // @param  command_handler  Invoked for each request received on the REP
  //                          socket. Takes the request text, returns the
  //                          JSON reply text. See make_command_handler().
  // @param  cmd_endpoint     ZMQ endpoint for the REP command socket.
  // @param  pub_endpoint     ZMQ endpoint for the PUB telemetry socket.
  //
  // @details
  // No sockets are opened and no threads are spawned here. Call start().
  // -------------------------------------------------------------------------
  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");

  // RAII: calls stop().
  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  //
  // @brief  Binds the REP and PUB sockets and spawns the IPC worker.
  //
  // @details
  // ZMQ_RCVTIMEO on the REP socket bounds each command poll, so the worker
  // alternates between publishing telemetry and answering commands.
  //
  // Idempotent.
  // -------------------------------------------------------------------------
  void start();

  // Signals the worker, publishes what is still queued, joins, closes the
  // sockets. Idempotent.
  void stop();

  // -------------------------------------------------------------------------
  // publish(tick)
  // -------------------------------------------------------------------------
  //
  // @brief  Enqueues an audit tick for broadcast on the PUB socket.
  //
  // @details
  // The IPC worker encodes the tick with encode_audit_tick() and sends it
  // without blocking (ZMQ drops it if no subscriber is ready).
  //
  // Thread-safety: safe to call from any thread.
  // -------------------------------------------------------------------------
  void publish(AuditTick tick);

  bool running() const { return running_.load(); }

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processTelemetry();
  void processCommands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<AuditTick> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace tradeflow
