#include "gmx/network/ipc_server.hpp"
#include "gmx/codec/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <iostream>
#include <utility>

namespace gmx {

IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): bind both sockets, then spawn the IPC thread
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  try {
    cmd_socket_ =
        std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
    pub_socket_ =
        std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

    cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
    cmd_socket_->set(zmq::sockopt::linger, 0);
    pub_socket_->set(zmq::sockopt::linger, 0);
    cmd_socket_->bind(cmd_endpoint_);
    pub_socket_->bind(pub_endpoint_);
  } catch (const zmq::error_t&) {
    // Leave nothing half-bound so a later start() can retry.
    closeSockets();
    throw;
  }

  // Wildcard ports ("tcp://127.0.0.1:*") resolve here.
  bound_cmd_endpoint_ = cmd_socket_->get(zmq::sockopt::last_endpoint);
  bound_pub_endpoint_ = pub_socket_->get(zmq::sockopt::last_endpoint);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] listening. CMD=" << bound_cmd_endpoint_
            << " PUB=" << bound_pub_endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void IpcServer::stop() {
  const bool was_running = running_.exchange(false);
  if (thread_.joinable()) {
    thread_.join();
  }
  if (!was_running) {
    return;
  }

  closeSockets();
  std::cout << "[IpcServer] stopped. commands=" << commands_served_.load()
            << " replies_failed=" << replies_failed_.load()
            << " telemetry_dropped=" << telemetry_dropped_.load() << "\n";
}

void IpcServer::closeSockets() {
  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();
}

void IpcServer::pushTelemetry(Event event) {
  telemetry_queue_.push(std::move(event));
}

// -----------------------------------------------------------------------------
// run(): one thread alternates between publishing and serving
// -----------------------------------------------------------------------------
void IpcServer::run() {
  while (running_.load()) {
    publishPending();
    serveOneCommand();
  }

  // Publish whatever the last command produced before the socket closes.
  publishPending();
}

// -----------------------------------------------------------------------------
// publishPending(): one JSON line per queued event
// -----------------------------------------------------------------------------
// A PUB socket at its high-water mark refuses the frame; the line is
// dropped and counted rather than stalling the command loop.
// -----------------------------------------------------------------------------
void IpcServer::publishPending() {
  while (auto event = telemetry_queue_.try_pop()) {
    const std::string line = toJson(*event).dump();
    try {
      if (!pub_socket_->send(zmq::buffer(line), zmq::send_flags::dontwait)) {
        telemetry_dropped_.fetch_add(1);
      }
    } catch (const zmq::error_t& e) {
      std::cerr << "[IpcServer] publish failed: " << e.what() << "\n";
      telemetry_dropped_.fetch_add(1);
    }
  }
}

// -----------------------------------------------------------------------------
// serveOneCommand(): wait up to kPollTimeoutMs for a request and answer it
// -----------------------------------------------------------------------------
// Socket errors are logged and counted; they never leave the IPC thread.
// -----------------------------------------------------------------------------
void IpcServer::serveOneCommand() {
  zmq::message_t request;
  try {
    if (!cmd_socket_->recv(request, zmq::recv_flags::none).has_value()) {
      return;
    }
  } catch (const zmq::error_t& e) {
    if (e.num() != EINTR) {
      std::cerr << "[IpcServer] recv failed: " << e.what() << "\n";
    }
    return;
  }

  // The REP socket must answer every request it received, or it cannot
  // receive again. A handler that throws still gets an error reply.
  std::string response;
  try {
    response = command_handler_(request.to_string());
  } catch (const std::exception& e) {
    std::cerr << "[IpcServer] command handler threw: " << e.what() << "\n";
    response = errorToJson(e).dump();
  }

  if (!sendReply(response)) {
    replies_failed_.fetch_add(1);
    return;
  }
  commands_served_.fetch_add(1);
}

bool IpcServer::sendReply(const std::string& response) {
  try {
    if (!cmd_socket_->send(zmq::buffer(response), zmq::send_flags::none)) {
      std::cerr << "[IpcServer] reply not sent (socket would block)\n";
      return false;
    }
  } catch (const zmq::error_t& e) {
    std::cerr << "[IpcServer] reply failed: " << e.what() << "\n";
    return false;
  }
  return true;
}

}  // namespace gmx
