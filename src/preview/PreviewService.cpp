// Repository: pixelctl
// Component: Preview Service
// Purpose: Background render worker with in-flight deduplication.
// Copyright (c) 2026 Pixelctl

#include "pixelctl/preview/PreviewService.hpp"

#include <exception>
#include <sstream>

#include "pixelctl/util/Logger.hpp"

namespace pixelctl::preview {

using pixelctl::util::Logger;

const char* ToString(PreviewStatus status) {
  switch (status) {
    case PreviewStatus::kHit: return "Hit";
    case PreviewStatus::kPending: return "Pending";
    case PreviewStatus::kUnavailable: return "Unavailable";
  }
  return "Unknown";
}

PreviewService::PreviewService(IPreviewRenderer& renderer,
                               const util::ITimeSource& time,
                               PreviewServiceConfig config)
    : renderer_(renderer), cache_(config.cache_budget_bytes, time) {
  worker_thread_ = std::thread(&PreviewService::WorkerLoop, this);
}

PreviewService::~PreviewService() { Shutdown(); }

void PreviewService::Shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shutdown_.store(true, std::memory_order_release);
  }
  work_cv_.notify_all();
  if (worker_thread_.joinable()) {
    worker_thread_.join();
  }
}

PreviewTicket PreviewService::Request(const std::string& path,
                                      const RenderOptions& options) {
  PreviewTicket ticket;
  if (path.empty()) {
    ticket.error = "empty path";
    return ticket;
  }
  if (options.protocol == TerminalProtocol::kNone) {
    ticket.error = "terminal has no graphics protocol";
    return ticket;
  }
  if (options.width_cells == 0 || options.height_cells == 0) {
    ticket.error = "zero-sized preview area";
    return ticket;
  }

  PreviewKey key{CanonicalArtifactPath(path), options};

  bool queued_render = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_.load(std::memory_order_acquire)) {
      ticket.error = "preview service stopped";
      return ticket;
    }

    PreviewBytes hit = cache_.Lookup(key);
    if (hit) {
      ticket.status = PreviewStatus::kHit;
      ticket.bytes = std::move(hit);
      return ticket;
    }

    ticket.status = PreviewStatus::kPending;
    ticket.ticket_id = next_ticket_++;

    auto found = in_flight_.find(key);
    if (found != in_flight_.end()) {
      found->second.push_back(ticket.ticket_id);
      ++deduplicated_;
    } else {
      in_flight_.emplace(key, std::vector<uint64_t>{ticket.ticket_id});
      queue_.push_back(RenderJob{key, generation_});
      queued_render = true;
    }
  }

  if (queued_render) {
    work_cv_.notify_one();
    std::ostringstream oss;
    oss << "[PreviewService] RENDER_QUEUED path=" << key.path
        << " ticket=" << ticket.ticket_id;
    Logger::Debug(oss.str());
  }
  return ticket;
}

std::optional<PreviewResult> PreviewService::TryRecv() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (results_.empty()) return std::nullopt;
  PreviewResult r = std::move(results_.front());
  results_.pop_front();
  return r;
}

void PreviewService::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  cache_.Clear();
  ++generation_;
  Logger::Debug("[PreviewService] CLEARED");
}

PreviewServiceStats PreviewService::Stats() const {
  PreviewServiceStats s;
  s.cache = cache_.Stats();
  std::lock_guard<std::mutex> lock(mutex_);
  s.renders = renders_;
  s.render_failures = render_failures_;
  s.deduplicated = deduplicated_;
  s.in_flight = in_flight_.size();
  s.undelivered = results_.size();
  return s;
}

// =============================================================================
// WorkerLoop: one render at a time, in request order.
// =============================================================================

void PreviewService::WorkerLoop() {
  while (true) {
    RenderJob job;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      work_cv_.wait(lock, [this] {
        return shutdown_.load(std::memory_order_acquire) || !queue_.empty();
      });
      if (shutdown_.load(std::memory_order_acquire)) return;
      job = std::move(queue_.front());
      queue_.pop_front();
    }
    ProcessJob(job);
  }
}

void PreviewService::ProcessJob(const RenderJob& job) {
  RenderResult rendered;
  try {
    rendered = renderer_.Render(job.key.path, job.key.options);
  } catch (const std::exception& e) {
    rendered = RenderResult::Failure(std::string("renderer error: ") + e.what());
  } catch (...) {
    rendered = RenderResult::Failure("renderer error: unknown exception");
  }
  if (rendered.success && !rendered.bytes) {
    rendered = RenderResult::Failure("renderer returned no bytes");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  ++renders_;

  bool cached = false;
  if (!rendered.success) {
    ++render_failures_;
    std::ostringstream oss;
    oss << "[PreviewService] RENDER_FAILED path=" << job.key.path
        << " error=\"" << rendered.error << "\"";
    Logger::Warn(oss.str());
  } else if (job.generation == generation_) {
    cached = cache_.Insert(job.key, rendered.bytes) != InsertOutcome::kTooLarge;
  }

  std::vector<uint64_t> waiters;
  auto found = in_flight_.find(job.key);
  if (found != in_flight_.end()) {
    waiters = std::move(found->second);
    in_flight_.erase(found);
  }

  for (uint64_t ticket_id : waiters) {
    PreviewResult r;
    r.ticket_id = ticket_id;
    r.key = job.key;
    r.success = rendered.success;
    r.bytes = rendered.bytes;
    r.error = rendered.error;
    r.cached = cached;
    results_.push_back(std::move(r));
  }
}

}  // namespace pixelctl::preview
