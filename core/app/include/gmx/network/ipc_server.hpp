#pragma once

#include "gmx/concurrent/thread_safe_queue.hpp"
#include "gmx/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace gmx {

// -----------------------------------------------------------------------------
// IpcServer — ZeroMQ command and telemetry endpoint of the order daemon
// -----------------------------------------------------------------------------
//
// @brief  Runs a dedicated thread that answers JSON commands (REP socket)
//         and broadcasts pipeline telemetry (PUB socket).
//
// @details
// Two sockets share one thread:
//
//   1. REP socket (cmd_endpoint):
//      Each request is a JSON command ({"cmd":"SUBMIT", ...}). The string
//      is forwarded to the CommandHandler (bound to
//      OrderEngine::executeCommand()) and its reply sent back. ZMQ_RCVTIMEO
//      keeps the loop from blocking so telemetry keeps draining.
//
//   2. PUB socket (pub_endpoint):
//      One JSON line per PipelineStateEvent / AllowanceEvent, formatted by
//      the JSON codec. Events arrive through a ThreadSafeQueue so pipeline
//      threads never wait on socket I/O.
//
// A SUBMIT command runs the whole pipeline on the IPC thread, so commands
// are served one at a time; telemetry of that run is drained once the reply
// has been sent. Every request gets exactly one reply, even when the handler
// throws. Telemetry refused by a full PUB socket is dropped and counted.
//
// Thread model:
//   start()/stop() from the owning thread. pushTelemetry() from any thread.
//   The command handler runs on the IPC thread.
//
// Ownership:
//   Owned by OrderEngine via std::unique_ptr. Owns the ZMQ context, both
//   sockets, the telemetry queue and the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // No sockets are opened until start().
  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // Binds both sockets and spawns the worker. No-op when already running.
  // On a bind failure nothing stays open and start() may be called again.
  //
  // @throws zmq::error_t if an endpoint cannot be bound.
  // -------------------------------------------------------------------------
  void start();

  // Signals the worker, joins it and closes the sockets. Idempotent.
  void stop();

  void pushTelemetry(Event event);

  bool isRunning() const { return running_.load(); }

  // Endpoints actually bound, with wildcard ports resolved. Empty before
  // the first successful start().
  const std::string& commandEndpoint() const { return bound_cmd_endpoint_; }
  const std::string& telemetryEndpoint() const { return bound_pub_endpoint_; }

  std::uint64_t commandsServed() const { return commands_served_.load(); }
  std::uint64_t telemetryDropped() const { return telemetry_dropped_.load(); }
  std::uint64_t repliesFailed() const { return replies_failed_.load(); }

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void publishPending();
  void serveOneCommand();
  bool sendReply(const std::string& response);
  void closeSockets();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;
  std::string bound_cmd_endpoint_;
  std::string bound_pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> commands_served_{0};
  std::atomic<std::uint64_t> telemetry_dropped_{0};
  std::atomic<std::uint64_t> replies_failed_{0};
};

}  // namespace gmx
