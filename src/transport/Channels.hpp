// Repository: pixelctl
// Component: gRPC Channels
// Purpose: Channel and server arguments shared by the control client, the
//          update subscriber and the control server.
// Copyright (c) 2026 Pixelctl

#ifndef PIXELCTL_SRC_TRANSPORT_CHANNELS_HPP_
#define PIXELCTL_SRC_TRANSPORT_CHANNELS_HPP_

#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>

#include "pixelctl/transport/TransportTypes.hpp"

namespace pixelctl::transport::internal {

inline std::shared_ptr<grpc::Channel> DialControl(const std::string& address,
                                                  const KeepaliveConfig& keepalive) {
  grpc::ChannelArguments args;
  args.SetInt(GRPC_ARG_KEEPALIVE_TIME_MS, keepalive.time_ms);
  args.SetInt(GRPC_ARG_KEEPALIVE_TIMEOUT_MS, keepalive.timeout_ms);
  // Update streams can sit idle between jobs; keep pinging anyway.
  args.SetInt(GRPC_ARG_KEEPALIVE_PERMIT_WITHOUT_CALLS, 1);
  args.SetInt(GRPC_ARG_HTTP2_MAX_PINGS_WITHOUT_DATA, 0);
  return grpc::CreateCustomChannel(address, grpc::InsecureChannelCredentials(),
                                   args);
}

inline void ApplyServerKeepalive(grpc::ServerBuilder& builder,
                                 const KeepaliveConfig& keepalive) {
  builder.AddChannelArgument(GRPC_ARG_KEEPALIVE_TIME_MS, keepalive.time_ms);
  builder.AddChannelArgument(GRPC_ARG_KEEPALIVE_TIMEOUT_MS, keepalive.timeout_ms);
  builder.AddChannelArgument(GRPC_ARG_KEEPALIVE_PERMIT_WITHOUT_CALLS, 1);
  builder.AddChannelArgument(GRPC_ARG_HTTP2_MAX_PINGS_WITHOUT_DATA, 0);
  // Accept client pings as often as clients are configured to send them.
  builder.AddChannelArgument(GRPC_ARG_HTTP2_MIN_RECV_PING_INTERVAL_WITHOUT_DATA_MS,
                             keepalive.time_ms / 2);
}

}  // namespace pixelctl::transport::internal

#endif  // PIXELCTL_SRC_TRANSPORT_CHANNELS_HPP_
