// Repository: pixelctl
// Component: Time Source
// Purpose: Injectable wall clock for scheduler, tracker and cache.
// Copyright (c) 2026 Pixelctl

#pragma once

#include <chrono>
#include <cstdint>

namespace pixelctl::util {

class ITimeSource {
 public:
  virtual ~ITimeSource() = default;
  virtual int64_t NowUtcMs() const = 0;
};

class SystemTimeSource : public ITimeSource {
 public:
  int64_t NowUtcMs() const override {
    using namespace std::chrono;
    return duration_cast<milliseconds>(
        system_clock::now().time_since_epoch()).count();
  }
};

}  // namespace pixelctl::util
