#include "tradeflow/network/ipc_server.hpp"

#include "tradeflow/codec/json.hpp"
#include "tradeflow/common/log.hpp"

#include <cerrno>
#include <utility>

namespace tradeflow {

// -----------------------------------------------------------------------------
// Constructor: store parameters for deferred socket creation
// -----------------------------------------------------------------------------
IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): create sockets and spawn worker thread
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket_->bind(cmd_endpoint_);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  log::info("IpcServer", "started. CMD=", cmd_endpoint_, " PUB=", pub_endpoint_);
}

// -----------------------------------------------------------------------------
// stop(): signal and join
// -----------------------------------------------------------------------------
void IpcServer::stop() {
  if (!running_.load()) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  running_.store(false);
  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  log::info("IpcServer", "stopped.");
}

void IpcServer::publish(AuditTick tick) { telemetry_queue_.push(std::move(tick)); }

// -----------------------------------------------------------------------------
// run(): combined poll/drain loop
// -----------------------------------------------------------------------------
void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }
  // Final drain before the sockets close.
  processTelemetry();
}

void IpcServer::processTelemetry() {
  while (auto tick = telemetry_queue_.try_pop()) {
    const std::string text = encode_audit_tick(*tick).dump();
    zmq::message_t msg(text.data(), text.size());
    if (!pub_socket_->send(msg, zmq::send_flags::dontwait)) {
      log::debug("IpcServer", "telemetry dropped (sequence ",
                 tick->context.sequence, ")");
    }
  }
}

void IpcServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }

  if (!result.has_value()) {
    return;
  }

  const std::string text = request.to_string();
  const std::string response = command_handler_(text);

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

}  // namespace tradeflow
