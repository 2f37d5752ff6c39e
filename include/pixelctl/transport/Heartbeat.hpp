// Repository: pixelctl
// Component: Heartbeat
// Purpose: Client-side liveness schedule for the command channel.
// Copyright (c) 2026 Pixelctl

#ifndef PIXELCTL_TRANSPORT_HEARTBEAT_HPP_
#define PIXELCTL_TRANSPORT_HEARTBEAT_HPP_

#include <cstdint>

#include "pixelctl/util/TimeSource.hpp"

namespace pixelctl::transport {

// Heartbeat decides when a waiting client should Ping and when enough Pings
// have gone unanswered to call the server lost. A stream whose peer vanished
// without a FIN looks healthy to the reader; only an answered Ping proves
// otherwise.
//
// Not thread-safe. Owned by the loop that sends the Pings.
class Heartbeat {
 public:
  Heartbeat(const util::ITimeSource& time, int64_t interval_ms, int max_misses);

  // interval_ms has passed since construction, the last Record() or Reset().
  bool Due() const;

  // Outcome of one Ping. A success clears the miss count.
  void Record(bool answered);

  // max_misses consecutive Pings went unanswered.
  bool Lost() const;

  // Call after reconnecting.
  void Reset();

  int misses() const { return misses_; }

 private:
  const util::ITimeSource& time_;
  const int64_t interval_ms_;
  const int max_misses_;
  int64_t last_ms_;
  int misses_ = 0;
};

}  // namespace pixelctl::transport

#endif  // PIXELCTL_TRANSPORT_HEARTBEAT_HPP_
