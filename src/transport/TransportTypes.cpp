// Repository: pixelctl
// Component: Transport Types
// Purpose: Transport error names.
// Copyright (c) 2026 Pixelctl

#include "pixelctl/transport/TransportTypes.hpp"

namespace pixelctl::transport {

const char* ToString(TransportError error) {
  switch (error) {
    case TransportError::kNone: return "None";
    case TransportError::kTimeout: return "Timeout";
    case TransportError::kConnectionLost: return "ConnectionLost";
    case TransportError::kDecode: return "Decode";
    case TransportError::kCorrelationMismatch: return "CorrelationMismatch";
    case TransportError::kRpcFailed: return "RpcFailed";
  }
  return "Unknown";
}

}  // namespace pixelctl::transport
