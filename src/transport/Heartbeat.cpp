// Repository: pixelctl
// Component: Heartbeat
// Purpose: Client-side liveness schedule for the command channel.
// Copyright (c) 2026 Pixelctl

#include "pixelctl/transport/Heartbeat.hpp"

#include <algorithm>

namespace pixelctl::transport {

Heartbeat::Heartbeat(const util::ITimeSource& time, int64_t interval_ms,
                     int max_misses)
    : time_(time),
      interval_ms_(std::max<int64_t>(1, interval_ms)),
      max_misses_(std::max(1, max_misses)),
      last_ms_(time.NowUtcMs()) {}

bool Heartbeat::Due() const {
  return time_.NowUtcMs() - last_ms_ >= interval_ms_;
}

void Heartbeat::Record(bool answered) {
  last_ms_ = time_.NowUtcMs();
  misses_ = answered ? 0 : misses_ + 1;
}

bool Heartbeat::Lost() const { return misses_ >= max_misses_; }

void Heartbeat::Reset() {
  last_ms_ = time_.NowUtcMs();
  misses_ = 0;
}

}  // namespace pixelctl::transport
