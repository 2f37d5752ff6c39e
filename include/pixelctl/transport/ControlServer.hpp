// Repository: pixelctl
// Component: Control Server
// Purpose: gRPC endpoint hosting the command channel and the update stream.
// Copyright (c) 2026 Pixelctl

#ifndef PIXELCTL_TRANSPORT_CONTROL_SERVER_HPP_
#define PIXELCTL_TRANSPORT_CONTROL_SERVER_HPP_

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "pixelctl/protocol/Messages.hpp"
#include "pixelctl/transport/TransportTypes.hpp"
#include "pixelctl/transport/UpdateBroadcaster.hpp"

namespace grpc {
class Server;
}  // namespace grpc

namespace pixelctl::transport {

// Answers one decoded request. Called on a gRPC handler thread; must not
// block on job execution.
class ICommandHandler {
 public:
  virtual ~ICommandHandler() = default;
  virtual protocol::Response HandleRequest(const protocol::Request& request) = 0;
};

struct ControlServerConfig {
  // host:port. Port 0 picks a free port (see bound_port()).
  std::string listen_address = kDefaultAddress;
  KeepaliveConfig keepalive;
  // How often an idle Subscribe handler rechecks for client cancellation.
  int subscriber_poll_ms = 200;
};

// ControlServer hosts the pixelctl.v1.Control service:
//
//   Command   - one request envelope in, one response envelope out. An
//               envelope the codec rejects gets an ErrorResponse, never a
//               failed call.
//   Subscribe - server stream of update envelopes from the broadcaster, until
//               the client cancels or the server stops. Each stream holds one
//               gRPC handler thread.
class ControlServer {
 public:
  ControlServer(ICommandHandler& handler, UpdateBroadcaster& broadcaster,
                ControlServerConfig config = ControlServerConfig{});
  ~ControlServer();

  ControlServer(const ControlServer&) = delete;
  ControlServer& operator=(const ControlServer&) = delete;

  // Returns false and sets *error when the address cannot be bound.
  bool Start(std::string* error);

  // Ends every update stream, then shuts the server down.
  void Stop();

  bool IsRunning() const { return running_.load(std::memory_order_acquire); }
  int bound_port() const { return bound_port_; }
  // listen host with the bound port.
  std::string bound_address() const;

  uint64_t malformed_requests() const;

  class Impl;

 private:
  ControlServerConfig config_;
  std::unique_ptr<Impl> impl_;
  std::unique_ptr<grpc::Server> server_;
  std::mutex lifecycle_mutex_;
  std::atomic<bool> running_{false};
  int bound_port_ = 0;
};

}  // namespace pixelctl::transport

#endif  // PIXELCTL_TRANSPORT_CONTROL_SERVER_HPP_
