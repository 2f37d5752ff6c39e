// Repository: pixelctl
// Component: Update Subscriber
// Purpose: Client side of the broadcast channel with non-blocking receive.
// Copyright (c) 2026 Pixelctl

#include "pixelctl/transport/UpdateSubscriber.hpp"

#include <sstream>

#include <grpcpp/grpcpp.h>

#include "pixelctl/protocol/MessageCodec.hpp"
#include "pixelctl/util/Logger.hpp"
#include "pixelctl/v1/control.pb.h"
#include "transport/Channels.hpp"

namespace pixelctl::transport {

using pixelctl::util::Logger;

UpdateSubscriber::UpdateSubscriber(std::string server_address,
                                   size_t max_buffered,
                                   KeepaliveConfig keepalive)
    : server_address_(std::move(server_address)),
      max_buffered_(max_buffered == 0 ? 1 : max_buffered),
      keepalive_(keepalive) {}

UpdateSubscriber::~UpdateSubscriber() { Stop(); }

void UpdateSubscriber::Connect() {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  if (reader_.joinable()) return;
  if (!stub_) {
    stub_ = v1::Control::NewStub(internal::DialControl(server_address_, keepalive_));
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    connected_ = false;
    finished_ = false;
    last_error_.clear();
  }
  ctx_ = std::make_shared<grpc::ClientContext>();
  reader_ = std::thread(&UpdateSubscriber::ReadLoop, this, ctx_);
  Logger::Debug("[UpdateSubscriber] CONNECTING address=" + server_address_);
}

void UpdateSubscriber::Stop() {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  if (!reader_.joinable()) return;
  ctx_->TryCancel();
  reader_.join();
  ctx_.reset();
}

void UpdateSubscriber::Reconnect() {
  Stop();
  {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    stub_.reset();
  }
  Logger::Info("[UpdateSubscriber] RECONNECT address=" + server_address_);
  Connect();
}

void UpdateSubscriber::ReadLoop(std::shared_ptr<grpc::ClientContext> ctx) {
  std::unique_ptr<grpc::ClientReader<v1::Envelope>> reader =
      stub_->Subscribe(ctx.get(), v1::SubscribeRequest());

  // The server sends its protocol version as initial metadata before any
  // update, so a stream that gets this far is known to be accepted.
  reader->WaitForInitialMetadata();
  const auto& metadata = ctx->GetServerInitialMetadata();
  if (metadata.find(kProtocolMetadataKey) != metadata.end()) {
    OnStreamConnected();
  }

  v1::Envelope envelope;
  while (reader->Read(&envelope)) {
    OnStreamEnvelope(envelope);
  }

  grpc::Status status = reader->Finish();
  std::string error;
  if (!status.ok()) {
    std::ostringstream oss;
    oss << "grpc_code=" << static_cast<int>(status.error_code()) << " "
        << status.error_message();
    error = oss.str();
  } else {
    error = "stream closed by server";
  }
  OnStreamDone(error);
}

std::optional<protocol::Update> UpdateSubscriber::TryRecv() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (buffer_.empty()) return std::nullopt;
  protocol::Update u = std::move(buffer_.front());
  buffer_.pop_front();
  return u;
}

bool UpdateSubscriber::IsConnected() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connected_ && !finished_;
}

bool UpdateSubscriber::IsFinished() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return finished_;
}

bool UpdateSubscriber::WaitConnected(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, timeout, [this] { return connected_ || finished_; });
  return connected_ && !finished_;
}

bool UpdateSubscriber::WaitForUpdate(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, timeout, [this] { return !buffer_.empty(); });
}

uint64_t UpdateSubscriber::decode_errors() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return decode_errors_;
}

uint64_t UpdateSubscriber::dropped() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dropped_;
}

std::string UpdateSubscriber::last_error() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_error_;
}

void UpdateSubscriber::OnStreamConnected() {
  std::lock_guard<std::mutex> lock(mutex_);
  connected_ = true;
  cv_.notify_all();
}

void UpdateSubscriber::OnStreamEnvelope(const v1::Envelope& envelope) {
  auto decoded = protocol::DecodeUpdate(envelope);
  std::lock_guard<std::mutex> lock(mutex_);
  if (!decoded.ok()) {
    ++decode_errors_;
    std::ostringstream oss;
    oss << "[UpdateSubscriber] DECODE_ERROR error="
        << protocol::ToString(decoded.error) << " detail=\"" << decoded.detail
        << "\"";
    Logger::Warn(oss.str());
    return;
  }
  if (buffer_.size() >= max_buffered_) {
    buffer_.pop_front();
    ++dropped_;
  }
  buffer_.push_back(std::move(decoded.value));
  cv_.notify_all();
}

void UpdateSubscriber::OnStreamDone(const std::string& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  finished_ = true;
  connected_ = false;
  last_error_ = error;
  cv_.notify_all();
  Logger::Debug("[UpdateSubscriber] STREAM_ENDED " + error);
}

}  // namespace pixelctl::transport
