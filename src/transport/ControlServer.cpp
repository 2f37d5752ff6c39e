// Repository: pixelctl
// Component: Control Server
// Purpose: Implements the Control gRPC service for the command and update
//          channels.
// Copyright (c) 2026 Pixelctl

#include "pixelctl/transport/ControlServer.hpp"

#include <chrono>
#include <exception>
#include <sstream>

#include <grpcpp/grpcpp.h>

#include "pixelctl/protocol/MessageCodec.hpp"
#include "pixelctl/util/Logger.hpp"
#include "pixelctl/v1/control.grpc.pb.h"
#include "pixelctl/v1/control.pb.h"
#include "transport/Channels.hpp"

namespace pixelctl::transport {

using pixelctl::util::Logger;

// =============================================================================
// Impl: thin adapter from the generated service to the command handler and
// the broadcaster.
// =============================================================================

class ControlServer::Impl final : public v1::Control::Service {
 public:
  Impl(ICommandHandler& handler, UpdateBroadcaster& broadcaster, int poll_ms)
      : handler_(handler), broadcaster_(broadcaster), poll_ms_(poll_ms) {}

  grpc::Status Command(grpc::ServerContext* context,
                       const v1::Envelope* request,
                       v1::Envelope* response) override;

  grpc::Status Subscribe(grpc::ServerContext* context,
                         const v1::SubscribeRequest* request,
                         grpc::ServerWriter<v1::Envelope>* writer) override;

  UpdateBroadcaster& broadcaster() { return broadcaster_; }
  uint64_t malformed() const { return malformed_.load(std::memory_order_relaxed); }

 private:
  ICommandHandler& handler_;
  UpdateBroadcaster& broadcaster_;
  const int poll_ms_;
  std::atomic<uint64_t> malformed_{0};
};

grpc::Status ControlServer::Impl::Command(grpc::ServerContext* /*context*/,
                                          const v1::Envelope* request,
                                          v1::Envelope* response) {
  auto decoded = protocol::DecodeRequest(*request);
  if (!decoded.ok()) {
    malformed_.fetch_add(1, std::memory_order_relaxed);
    std::ostringstream oss;
    oss << "[ControlServer] REQUEST_REJECTED error="
        << protocol::ToString(decoded.error) << " detail=\"" << decoded.detail
        << "\"";
    Logger::Warn(oss.str());
    protocol::EncodeResponse(
        protocol::ErrorResponse{std::string("bad request: ") +
                                protocol::ToString(decoded.error) + ": " +
                                decoded.detail},
        std::string(), response);
    return grpc::Status::OK;
  }

  protocol::Response answer;
  try {
    answer = handler_.HandleRequest(decoded.value);
  } catch (const std::exception& e) {
    std::ostringstream oss;
    oss << "[ControlServer] HANDLER_ERROR request="
        << protocol::VariantName(decoded.value) << " what=\"" << e.what() << "\"";
    Logger::Error(oss.str());
    answer = protocol::ErrorResponse{std::string("internal error: ") + e.what()};
  }
  protocol::EncodeResponse(answer, decoded.correlation_id, response);
  return grpc::Status::OK;
}

grpc::Status ControlServer::Impl::Subscribe(
    grpc::ServerContext* context, const v1::SubscribeRequest* /*request*/,
    grpc::ServerWriter<v1::Envelope>* writer) {
  std::shared_ptr<UpdateChannel> channel = broadcaster_.Subscribe();
  context->AddInitialMetadata(kProtocolMetadataKey, protocol::kProtocolVersion);
  writer->SendInitialMetadata();
  Logger::Info("[ControlServer] SUBSCRIBER_CONNECTED peer=" + context->peer());

  grpc::Status status;
  for (;;) {
    if (context->IsCancelled()) {
      status = grpc::Status::CANCELLED;
      break;
    }
    EncodedUpdate next = channel->WaitPop(std::chrono::milliseconds(poll_ms_));
    if (next) {
      if (!writer->Write(*next)) {
        status = grpc::Status(grpc::StatusCode::UNAVAILABLE, "subscriber gone");
        break;
      }
      continue;
    }
    if (channel->IsClosed()) {
      status = grpc::Status(grpc::StatusCode::UNAVAILABLE, "server shutting down");
      break;
    }
  }

  broadcaster_.Unsubscribe(channel);
  std::ostringstream oss;
  oss << "[ControlServer] SUBSCRIBER_DISCONNECTED peer=" << context->peer()
      << " dropped=" << channel->dropped();
  Logger::Info(oss.str());
  return status;
}

// =============================================================================
// ControlServer
// =============================================================================

ControlServer::ControlServer(ICommandHandler& handler,
                             UpdateBroadcaster& broadcaster,
                             ControlServerConfig config)
    : config_(std::move(config)),
      impl_(std::make_unique<Impl>(handler, broadcaster,
                                   config_.subscriber_poll_ms)) {}

ControlServer::~ControlServer() { Stop(); }

bool ControlServer::Start(std::string* error) {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (running_.load(std::memory_order_acquire)) return true;

  grpc::ServerBuilder builder;
  builder.AddListeningPort(config_.listen_address,
                           grpc::InsecureServerCredentials(), &bound_port_);
  internal::ApplyServerKeepalive(builder, config_.keepalive);
  builder.RegisterService(impl_.get());
  server_ = builder.BuildAndStart();
  if (!server_ || bound_port_ == 0) {
    if (error) *error = "failed to listen on " + config_.listen_address;
    Logger::Error("[ControlServer] LISTEN_FAILED address=" + config_.listen_address);
    server_.reset();
    return false;
  }
  running_.store(true, std::memory_order_release);

  std::ostringstream oss;
  oss << "[ControlServer] LISTENING address=" << bound_address()
      << " protocol=" << protocol::kProtocolVersion;
  Logger::Info(oss.str());
  return true;
}

void ControlServer::Stop() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (!running_.exchange(false, std::memory_order_acq_rel)) return;
  // Closing the channels lets every Subscribe handler return before Shutdown
  // waits on them.
  impl_->broadcaster().CloseAll();
  if (server_) {
    server_->Shutdown(std::chrono::system_clock::now() +
                      std::chrono::milliseconds(500));
    server_->Wait();
    server_.reset();
  }
  Logger::Info("[ControlServer] STOPPED");
}

std::string ControlServer::bound_address() const {
  const std::string& addr = config_.listen_address;
  const size_t colon = addr.rfind(':');
  const std::string host = colon == std::string::npos ? addr : addr.substr(0, colon);
  return host + ":" + std::to_string(bound_port_);
}

uint64_t ControlServer::malformed_requests() const { return impl_->malformed(); }

}  // namespace pixelctl::transport
