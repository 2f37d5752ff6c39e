// Repository: pixelctl
// Component: Control Client
// Purpose: Blocking request/reply over the command channel with a deadline.
// Copyright (c) 2026 Pixelctl

#ifndef PIXELCTL_TRANSPORT_CONTROL_CLIENT_HPP_
#define PIXELCTL_TRANSPORT_CONTROL_CLIENT_HPP_

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

#include "pixelctl/protocol/Messages.hpp"
#include "pixelctl/transport/TransportTypes.hpp"
#include "pixelctl/v1/control.grpc.pb.h"

namespace pixelctl::transport {

// ControlClient sends one request at a time and waits for its response.
// Concurrent Call()s from different threads are serialized, never pipelined.
//
// A timeout is reported as TransportError::kTimeout; the job may still have
// been accepted. Callers reconcile with a Status request.
class ControlClient {
 public:
  explicit ControlClient(std::string server_address,
                         KeepaliveConfig keepalive = KeepaliveConfig{});
  ~ControlClient();

  ControlClient(const ControlClient&) = delete;
  ControlClient& operator=(const ControlClient&) = delete;

  CallResult Call(const protocol::Request& request,
                  std::chrono::milliseconds timeout);

  // Heartbeat. Succeeds only on a Pong.
  CallResult Ping(std::chrono::milliseconds timeout);

  // Drops the channel and dials again.
  void Reconnect();

  const std::string& server_address() const { return server_address_; }

 private:
  void Dial();

  const std::string server_address_;
  const KeepaliveConfig keepalive_;
  std::mutex call_mutex_;
  std::unique_ptr<v1::Control::Stub> stub_;
};

}  // namespace pixelctl::transport

#endif  // PIXELCTL_TRANSPORT_CONTROL_CLIENT_HPP_
