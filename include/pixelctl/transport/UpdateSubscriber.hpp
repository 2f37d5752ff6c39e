// Repository: pixelctl
// Component: Update Subscriber
// Purpose: Client side of the broadcast channel with non-blocking receive.
// Copyright (c) 2026 Pixelctl

#ifndef PIXELCTL_TRANSPORT_UPDATE_SUBSCRIBER_HPP_
#define PIXELCTL_TRANSPORT_UPDATE_SUBSCRIBER_HPP_

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "pixelctl/protocol/Messages.hpp"
#include "pixelctl/transport/TransportTypes.hpp"
#include "pixelctl/v1/control.grpc.pb.h"

namespace grpc {
class ClientContext;
}  // namespace grpc

namespace pixelctl::transport {

// UpdateSubscriber holds one Subscribe stream, read on its own thread, and
// buffers decoded updates for TryRecv(). Stream loss is never silent:
// IsFinished() turns true and last_error() says why; the caller then calls
// Reconnect() and reconciles with a Status request.
//
// Undecodable updates are counted and skipped. If the caller falls behind by
// more than max_buffered updates the oldest are dropped and counted.
class UpdateSubscriber {
 public:
  explicit UpdateSubscriber(std::string server_address,
                            size_t max_buffered = 4096,
                            KeepaliveConfig keepalive = KeepaliveConfig{});
  ~UpdateSubscriber();

  UpdateSubscriber(const UpdateSubscriber&) = delete;
  UpdateSubscriber& operator=(const UpdateSubscriber&) = delete;

  // Opens the stream. Non-blocking.
  void Connect();

  // Cancels the stream and joins the reader thread.
  void Stop();

  // Stop(), a fresh channel, then Connect().
  void Reconnect();

  std::optional<protocol::Update> TryRecv();

  // Server acknowledged the stream and it has not ended.
  bool IsConnected() const;
  // Stream ended; Reconnect() to resume.
  bool IsFinished() const;

  bool WaitConnected(std::chrono::milliseconds timeout) const;
  // Waits until at least one update is buffered.
  bool WaitForUpdate(std::chrono::milliseconds timeout) const;

  uint64_t decode_errors() const;
  uint64_t dropped() const;
  std::string last_error() const;

 private:
  void ReadLoop(std::shared_ptr<grpc::ClientContext> ctx);

  void OnStreamConnected();
  void OnStreamEnvelope(const v1::Envelope& envelope);
  void OnStreamDone(const std::string& error);

  const std::string server_address_;
  const size_t max_buffered_;
  const KeepaliveConfig keepalive_;

  std::mutex lifecycle_mutex_;
  std::unique_ptr<v1::Control::Stub> stub_;
  std::shared_ptr<grpc::ClientContext> ctx_;
  std::thread reader_;

  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  std::deque<protocol::Update> buffer_;
  bool connected_ = false;
  bool finished_ = true;
  uint64_t decode_errors_ = 0;
  uint64_t dropped_ = 0;
  std::string last_error_;
};

}  // namespace pixelctl::transport

#endif  // PIXELCTL_TRANSPORT_UPDATE_SUBSCRIBER_HPP_
