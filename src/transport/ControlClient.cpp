// Repository: pixelctl
// Component: Control Client
// Purpose: Blocking request/reply over the command channel with a deadline.
// Copyright (c) 2026 Pixelctl

#include "pixelctl/transport/ControlClient.hpp"

#include <sstream>

#include <grpcpp/grpcpp.h>

#include "pixelctl/protocol/MessageCodec.hpp"
#include "pixelctl/util/Logger.hpp"
#include "pixelctl/v1/control.pb.h"
#include "transport/Channels.hpp"

namespace pixelctl::transport {

using pixelctl::util::Logger;

namespace {

TransportError MapStatus(grpc::StatusCode code) {
  switch (code) {
    case grpc::StatusCode::DEADLINE_EXCEEDED:
      return TransportError::kTimeout;
    case grpc::StatusCode::UNAVAILABLE:
    case grpc::StatusCode::CANCELLED:
      return TransportError::kConnectionLost;
    default:
      return TransportError::kRpcFailed;
  }
}

}  // namespace

ControlClient::ControlClient(std::string server_address, KeepaliveConfig keepalive)
    : server_address_(std::move(server_address)), keepalive_(keepalive) {
  Dial();
}

ControlClient::~ControlClient() = default;

void ControlClient::Dial() {
  stub_ = v1::Control::NewStub(internal::DialControl(server_address_, keepalive_));
}

void ControlClient::Reconnect() {
  std::lock_guard<std::mutex> lock(call_mutex_);
  Logger::Info("[ControlClient] RECONNECT address=" + server_address_);
  Dial();
}

CallResult ControlClient::Call(const protocol::Request& request,
                               std::chrono::milliseconds timeout) {
  std::lock_guard<std::mutex> call_lock(call_mutex_);

  const std::string expected_correlation = protocol::CorrelationIdOf(request);
  v1::Envelope request_env;
  protocol::EncodeRequest(request, &request_env);
  v1::Envelope response_env;

  grpc::ClientContext ctx;
  ctx.set_deadline(std::chrono::system_clock::now() + timeout);
  grpc::Status status = stub_->Command(&ctx, request_env, &response_env);

  if (!status.ok()) {
    const TransportError err = MapStatus(status.error_code());
    std::ostringstream oss;
    oss << "[ControlClient] CALL_FAILED request=" << protocol::VariantName(request)
        << " error=" << ToString(err) << " grpc_code="
        << static_cast<int>(status.error_code()) << " message=\""
        << status.error_message() << "\"";
    Logger::Debug(oss.str());
    return CallResult::Failure(err, status.error_message());
  }

  auto decoded = protocol::DecodeResponse(response_env);
  if (!decoded.ok()) {
    return CallResult::Failure(
        TransportError::kDecode,
        std::string(protocol::ToString(decoded.error)) + ": " + decoded.detail);
  }
  if (!expected_correlation.empty() &&
      decoded.correlation_id != expected_correlation &&
      !std::holds_alternative<protocol::ErrorResponse>(decoded.value)) {
    return CallResult::Failure(
        TransportError::kCorrelationMismatch,
        "expected " + expected_correlation + " got " + decoded.correlation_id);
  }
  return CallResult::Success(std::move(decoded.value));
}

CallResult ControlClient::Ping(std::chrono::milliseconds timeout) {
  CallResult r = Call(protocol::Ping{}, timeout);
  if (r.ok() && !std::holds_alternative<protocol::Pong>(r.response)) {
    return CallResult::Failure(TransportError::kDecode,
                               std::string("expected Pong, got ") +
                                   protocol::VariantName(r.response));
  }
  return r;
}

}  // namespace pixelctl::transport
