#pragma once

#include "gmx/core/errors.hpp"

#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace gmx {

// -----------------------------------------------------------------------------
// RpcRemoteError
// -----------------------------------------------------------------------------
// The peer answered, but with {"error": "..."}: the request reached the
// collaborator and was refused. Transport failures (timeout, socket error,
// malformed reply) are plain GatewayError.
// -----------------------------------------------------------------------------
class RpcRemoteError : public GatewayError {
 public:
  RpcRemoteError(const std::string& method, const std::string& remote_message)
      : GatewayError(method + " refused: " + remote_message),
        remote_message_(remote_message) {}

  const std::string& remoteMessage() const noexcept { return remote_message_; }

 private:
  std::string remote_message_;
};

// -----------------------------------------------------------------------------
// RpcChannel — JSON request/reply client over ZeroMQ REQ sockets
// -----------------------------------------------------------------------------
//
// @brief  Carries calls to an out-of-process collaborator (the ledger node
//         bridge or the key service).
//
// @details
// Wire format (one ZMQ frame each way):
//   request  {"id": <n>, "method": "<name>", "params": <any>}
//   reply    {"id": <n>, "result": <any>}  or  {"id": <n>, "error": "<text>"}
//
// Sockets: a REQ socket enforces strict send/recv alternation and is not
// thread-safe, so the channel keeps a small free-list of connected sockets.
// Each call checks one out, uses it exclusively, and returns it on success.
// A socket whose call timed out or failed is closed rather than returned (a
// REQ socket stuck between send and recv cannot be reused). This lets the
// WorkerPool's concurrent reads proceed in parallel over one channel.
//
// Thread model:
//   call() is safe from any thread. The zmq::context_t is thread-safe; each
//   socket is only touched by the thread that checked it out.
//
// Ownership:
//   Owns the context and every socket. Must outlive all callers.
// -----------------------------------------------------------------------------
class RpcChannel {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  name        label for log lines, e.g. "gateway", "signer"
  // @param  endpoint    ZMQ endpoint of the collaborator's REP/ROUTER socket
  // @param  timeout_ms  send and receive timeout per call
  //
  // No socket is opened until the first call().
  // -------------------------------------------------------------------------
  RpcChannel(std::string name, std::string endpoint, int timeout_ms);

  ~RpcChannel();

  RpcChannel(const RpcChannel&) = delete;
  RpcChannel& operator=(const RpcChannel&) = delete;
  RpcChannel(RpcChannel&&) = delete;
  RpcChannel& operator=(RpcChannel&&) = delete;

  // -------------------------------------------------------------------------
  // call(method, params)
  // -------------------------------------------------------------------------
  // @return The reply's "result" member.
  //
  // @throws RpcRemoteError if the peer replied with "error".
  // @throws GatewayError   on timeout, socket error or malformed reply.
  // -------------------------------------------------------------------------
  nlohmann::json call(const std::string& method, const nlohmann::json& params);

  const std::string& endpoint() const { return endpoint_; }

 private:
  std::unique_ptr<zmq::socket_t> checkout();
  void checkin(std::unique_ptr<zmq::socket_t> socket);

  std::string name_;
  std::string endpoint_;
  int timeout_ms_;

  zmq::context_t context_{1};

  std::mutex mutex_;  // protects idle_ and next_id_
  std::vector<std::unique_ptr<zmq::socket_t>> idle_;
  std::uint64_t next_id_{1};
};

}  // namespace gmx
