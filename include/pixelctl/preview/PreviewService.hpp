// Repository: pixelctl
// Component: Preview Service
// Purpose: Non-blocking preview requests over PreviewCache with a background
//          render worker and in-flight deduplication.
// Copyright (c) 2026 Pixelctl

#ifndef PIXELCTL_PREVIEW_PREVIEW_SERVICE_HPP_
#define PIXELCTL_PREVIEW_PREVIEW_SERVICE_HPP_

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "pixelctl/preview/PreviewCache.hpp"
#include "pixelctl/preview/PreviewTypes.hpp"
#include "pixelctl/util/TimeSource.hpp"

namespace pixelctl::preview {

struct PreviewServiceConfig {
  size_t cache_budget_bytes = kDefaultPreviewBudgetBytes;
};

enum class PreviewStatus {
  kHit,          // bytes are ready now.
  kPending,      // poll TryRecv() for ticket_id.
  kUnavailable,  // refused up front; see error.
};

const char* ToString(PreviewStatus status);

struct PreviewTicket {
  PreviewStatus status = PreviewStatus::kUnavailable;
  uint64_t ticket_id = 0;
  PreviewBytes bytes;
  std::string error;
};

// Completion of one Pending ticket. Deduplicated waiters each get their own
// result pointing at the same bytes.
struct PreviewResult {
  uint64_t ticket_id = 0;
  PreviewKey key;
  bool success = false;
  PreviewBytes bytes;
  std::string error;
  // False for failures, oversized renders and renders overtaken by Clear().
  bool cached = false;
};

struct PreviewServiceStats {
  PreviewCacheStats cache;
  uint64_t renders = 0;
  uint64_t render_failures = 0;
  uint64_t deduplicated = 0;
  size_t in_flight = 0;
  size_t undelivered = 0;
};

// PreviewService never blocks the caller on a render.
//
// Request() answers from the cache or registers a ticket. The first ticket
// for a (path, options) key queues one render; later tickets for the same key
// join it. The worker renders outside any lock, then caches the bytes (unless
// the render failed, was too large, or Clear() ran meanwhile) and queues one
// PreviewResult per waiting ticket for TryRecv().
//
// Failures are never cached and never retried automatically.
class PreviewService {
 public:
  PreviewService(IPreviewRenderer& renderer, const util::ITimeSource& time,
                 PreviewServiceConfig config = PreviewServiceConfig{});
  ~PreviewService();

  PreviewService(const PreviewService&) = delete;
  PreviewService& operator=(const PreviewService&) = delete;

  PreviewTicket Request(const std::string& path, const RenderOptions& options);

  std::optional<PreviewResult> TryRecv();

  // Drops all cache entries atomically with respect to Request(). Renders in
  // flight still deliver their results but are not cached.
  void Clear();

  void Shutdown();

  PreviewServiceStats Stats() const;

  const PreviewCache& cache() const { return cache_; }

 private:
  struct RenderJob {
    PreviewKey key;
    uint64_t generation = 0;
  };

  void WorkerLoop();
  void ProcessJob(const RenderJob& job);

  IPreviewRenderer& renderer_;
  PreviewCache cache_;

  mutable std::mutex mutex_;
  std::condition_variable work_cv_;
  std::deque<RenderJob> queue_;
  std::unordered_map<PreviewKey, std::vector<uint64_t>, PreviewKeyHash>
      in_flight_;
  std::deque<PreviewResult> results_;
  uint64_t next_ticket_ = 1;
  uint64_t generation_ = 0;

  uint64_t renders_ = 0;
  uint64_t render_failures_ = 0;
  uint64_t deduplicated_ = 0;

  std::atomic<bool> shutdown_{false};
  std::thread worker_thread_;
};

}  // namespace pixelctl::preview

#endif  // PIXELCTL_PREVIEW_PREVIEW_SERVICE_HPP_
