#include "gmx/network/rpc_channel.hpp"

#include <iostream>
#include <utility>

namespace gmx {

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
RpcChannel::RpcChannel(std::string name, std::string endpoint, int timeout_ms)
    : name_(std::move(name)),
      endpoint_(std::move(endpoint)),
      timeout_ms_(timeout_ms) {}

// -----------------------------------------------------------------------------
// Destructor: close sockets before the context terminates
// -----------------------------------------------------------------------------
RpcChannel::~RpcChannel() {
  std::lock_guard lock(mutex_);
  idle_.clear();
}

// -----------------------------------------------------------------------------
// checkout(): reuse an idle socket or connect a new one
// -----------------------------------------------------------------------------
std::unique_ptr<zmq::socket_t> RpcChannel::checkout() {
  {
    std::lock_guard lock(mutex_);
    if (!idle_.empty()) {
      auto socket = std::move(idle_.back());
      idle_.pop_back();
      return socket;
    }
  }

  auto socket = std::make_unique<zmq::socket_t>(context_, zmq::socket_type::req);
  socket->set(zmq::sockopt::rcvtimeo, timeout_ms_);
  socket->set(zmq::sockopt::sndtimeo, timeout_ms_);
  // Pending requests must not block context shutdown.
  socket->set(zmq::sockopt::linger, 0);
  socket->connect(endpoint_);
  return socket;
}

// -----------------------------------------------------------------------------
// checkin(): return a healthy socket to the free-list
// -----------------------------------------------------------------------------
void RpcChannel::checkin(std::unique_ptr<zmq::socket_t> socket) {
  std::lock_guard lock(mutex_);
  idle_.push_back(std::move(socket));
}

// -----------------------------------------------------------------------------
// call()
// -----------------------------------------------------------------------------
nlohmann::json RpcChannel::call(const std::string& method,
                                const nlohmann::json& params) {
  std::uint64_t id = 0;
  {
    std::lock_guard lock(mutex_);
    id = next_id_++;
  }

  nlohmann::json request;
  request["id"] = id;
  request["method"] = method;
  request["params"] = params;
  const std::string payload = request.dump();

  std::unique_ptr<zmq::socket_t> socket;
  std::string reply_text;
  try {
    socket = checkout();

    zmq::message_t out(payload.data(), payload.size());
    if (!socket->send(out, zmq::send_flags::none).has_value()) {
      throw GatewayError(name_ + ": send timed out for " + method);
    }

    zmq::message_t in;
    if (!socket->recv(in, zmq::recv_flags::none).has_value()) {
      throw GatewayError(name_ + ": no reply within " +
                         std::to_string(timeout_ms_) + " ms for " + method);
    }
    reply_text = in.to_string();
  } catch (const zmq::error_t& e) {
    throw GatewayError(name_ + ": " + method + ": " + e.what());
  }

  // The exchange completed: the socket is back in a sendable state even if
  // the payload turns out to be unusable.
  checkin(std::move(socket));

  nlohmann::json reply;
  try {
    reply = nlohmann::json::parse(reply_text);
  } catch (const nlohmann::json::parse_error& e) {
    throw GatewayError(name_ + ": malformed reply to " + method + ": " +
                       e.what());
  }

  if (!reply.is_object()) {
    throw GatewayError(name_ + ": reply to " + method + " is not an object");
  }
  if (auto it = reply.find("error"); it != reply.end() && !it->is_null()) {
    std::string message = it->is_string() ? it->get<std::string>() : it->dump();
    std::cerr << "[RpcChannel:" << name_ << "] " << method
              << " refused: " << message << "\n";
    throw RpcRemoteError(method, message);
  }
  auto it = reply.find("result");
  if (it == reply.end()) {
    throw GatewayError(name_ + ": reply to " + method + " has no result");
  }
  return *it;
}

}  // namespace gmx
