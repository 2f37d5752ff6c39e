// Repository: pixelctl
// Component: Transport Types
// Purpose: Keepalive settings and the typed result of a command-channel call.
// Copyright (c) 2026 Pixelctl

#ifndef PIXELCTL_TRANSPORT_TRANSPORT_TYPES_HPP_
#define PIXELCTL_TRANSPORT_TRANSPORT_TYPES_HPP_

#include <string>

#include "pixelctl/protocol/Messages.hpp"

namespace pixelctl::transport {

inline constexpr char kDefaultAddress[] = "127.0.0.1:5555";

// Initial-metadata key the server attaches to every Subscribe stream. Its
// presence tells the subscriber the server accepted the stream.
inline constexpr char kProtocolMetadataKey[] = "pixelctl-protocol";

// HTTP/2 keepalive pings, set on clients and server alike. A peer that stops
// answering within timeout_ms fails every open call with UNAVAILABLE, so a
// half-open connection ends an update stream instead of leaving it silent.
struct KeepaliveConfig {
  int time_ms = 10'000;
  int timeout_ms = 5'000;
};

// Transport failures are recoverable by retry or reconnect. A server-side
// failure is not one of these: it arrives as kNone with an ErrorResponse or
// JobError in the response.
enum class TransportError {
  kNone,
  kTimeout,              // No answer within the caller's deadline.
  kConnectionLost,       // Server unreachable or the connection dropped.
  kDecode,               // Answer arrived but could not be decoded.
  kCorrelationMismatch,  // Answer belongs to a different request.
  kRpcFailed,            // Any other RPC status.
};

const char* ToString(TransportError error);

struct CallResult {
  TransportError error = TransportError::kNone;
  std::string detail;
  protocol::Response response;

  bool ok() const { return error == TransportError::kNone; }

  static CallResult Success(protocol::Response r) {
    CallResult c;
    c.response = std::move(r);
    return c;
  }

  static CallResult Failure(TransportError e, std::string why) {
    CallResult c;
    c.error = e;
    c.detail = std::move(why);
    return c;
  }
};

}  // namespace pixelctl::transport

#endif  // PIXELCTL_TRANSPORT_TRANSPORT_TYPES_HPP_
