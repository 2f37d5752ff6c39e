// Repository: pixelctl
// Component: Control Service
// Purpose: Answers control requests and turns scheduler events into ordered
//          broadcast updates.
// Copyright (c) 2026 Pixelctl

#include "pixelctl/server/ControlService.hpp"

#include <sstream>
#include <type_traits>
#include <variant>

#include "pixelctl/util/Logger.hpp"

namespace pixelctl::server {

using pixelctl::util::Logger;

namespace {

template <class>
inline constexpr bool kAlwaysFalse = false;

constexpr char kCancelRejected[] = "Job not found or already completed";

}  // namespace

ControlService::ControlService(scheduler::Scheduler& scheduler,
                               progress::ProgressTracker& tracker,
                               progress::StageHistory& history,
                               transport::UpdateBroadcaster& broadcaster,
                               const models::ModelCatalog& catalog,
                               const util::ITimeSource& time,
                               ControlServiceConfig config)
    : scheduler_(scheduler),
      tracker_(tracker),
      history_(history),
      broadcaster_(broadcaster),
      catalog_(catalog),
      time_(time),
      config_(std::move(config)),
      started_at_ms_(time.NowUtcMs()) {}

void ControlService::Attach() {
  scheduler::SchedulerCallbacks callbacks;
  callbacks.on_job_started = [this](const core::JobRecord& job) {
    OnJobStarted(job);
  };
  callbacks.on_stage = [this](const std::string& id, core::Stage stage,
                              std::optional<double> fraction) {
    OnStage(id, stage, fraction);
  };
  callbacks.on_preview = [this](const std::string& id, const std::string& path) {
    OnPreview(id, path);
  };
  callbacks.on_job_finished = [this](const core::JobRecord& job) {
    OnJobFinished(job);
  };
  scheduler_.SetCallbacks(std::move(callbacks));
}

// =============================================================================
// Requests
// =============================================================================

protocol::Response ControlService::HandleRequest(const protocol::Request& request) {
  return std::visit(
      [this](const auto& r) -> protocol::Response {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, protocol::Generate>) {
          return HandleGenerate(r);
        } else if constexpr (std::is_same_v<T, protocol::Cancel>) {
          return HandleCancel(r);
        } else if constexpr (std::is_same_v<T, protocol::ListModels>) {
          return HandleListModels();
        } else if constexpr (std::is_same_v<T, protocol::StatusRequest>) {
          return HandleStatus();
        } else if constexpr (std::is_same_v<T, protocol::Ping>) {
          return HandlePing();
        } else {
          static_assert(kAlwaysFalse<T>, "unhandled request variant");
        }
      },
      request);
}

protocol::Response ControlService::HandleGenerate(const protocol::Generate& request) {
  scheduler::SubmitResult result =
      scheduler_.Submit(request.payload, request.priority, request.id);

  if (!result.created) {
    std::ostringstream oss;
    oss << "[ControlService] GENERATE_DUPLICATE job_id=" << result.job_id
        << " status=" << core::ToString(result.job.status);
    Logger::Info(oss.str());
    return AnswerForExisting(result.job, result.jobs_ahead);
  }

  protocol::JobAccepted accepted;
  accepted.id = result.job_id;
  accepted.estimated_seconds = EstimateSeconds(result.jobs_ahead);
  return accepted;
}

protocol::Response ControlService::AnswerForExisting(const core::JobRecord& job,
                                                     size_t jobs_ahead) const {
  switch (job.status) {
    case core::JobStatus::kQueued:
      return protocol::JobAccepted{job.id, EstimateSeconds(jobs_ahead)};
    case core::JobStatus::kRunning: {
      double eta = tracker_.EstimateJobSeconds();
      if (auto snap = tracker_.Current(job.id)) eta = snap->eta_seconds;
      return protocol::JobAccepted{job.id, eta};
    }
    case core::JobStatus::kCompleted:
      return protocol::JobComplete{job.id, job.outputs};
    case core::JobStatus::kFailed:
      return protocol::JobError{job.id, job.error.value_or("execution failed")};
    case core::JobStatus::kCancelled:
      return protocol::JobCancelled{job.id};
  }
  return protocol::ErrorResponse{"unknown job status"};
}

// One job's worth of time per worker-round ahead of it, plus its own run.
double ControlService::EstimateSeconds(size_t jobs_ahead) const {
  const double per_job = tracker_.EstimateJobSeconds();
  const double workers = static_cast<double>(scheduler_.worker_count());
  return per_job * (1.0 + static_cast<double>(jobs_ahead) / workers);
}

protocol::Response ControlService::HandleCancel(const protocol::Cancel& request) {
  scheduler::CancelResult result = scheduler_.Cancel(request.id);
  if (result.success) return protocol::JobCancelled{request.id};
  return protocol::JobError{request.id, kCancelRejected};
}

protocol::Response ControlService::HandleListModels() {
  return protocol::ModelList{catalog_.List()};
}

protocol::Response ControlService::HandleStatus() {
  const scheduler::SchedulerStats stats = scheduler_.Stats();

  protocol::StatusInfo info;
  info.queued = static_cast<uint32_t>(stats.queued);
  info.running = static_cast<uint32_t>(stats.running);
  info.throughput_per_min = stats.throughput_per_min;
  info.completed = stats.completed;
  info.failed = stats.failed;
  info.cancelled = stats.cancelled;
  info.version = kDaemonVersion;
  info.uptime_seconds = (time_.NowUtcMs() - started_at_ms_) / 1000.0;

  for (const core::JobRecord& job : scheduler_.ActiveJobs()) {
    info.jobs.push_back(protocol::JobSummary{job.id, job.status, job.stage,
                                             job.progress});
  }
  for (const progress::StageHistoryRow& row : history_.Table()) {
    info.stage_estimates.push_back(
        protocol::StageEstimate{row.stage, row.estimate_seconds, row.samples});
  }
  return info;
}

protocol::Response ControlService::HandlePing() {
  return protocol::Pong{time_.NowUtcMs()};
}

// =============================================================================
// Scheduler events -> updates
// =============================================================================

void ControlService::OnJobStarted(const core::JobRecord& job) {
  std::lock_guard<std::mutex> lock(publish_mutex_);
  const progress::ProgressSnapshot snap = tracker_.OnJobStarted(job.id);
  broadcaster_.Publish(protocol::JobStarted{
      job.id, job.started_at_ms.value_or(time_.NowUtcMs())});
  PublishProgressLocked(snap);
}

void ControlService::OnStage(const std::string& job_id, core::Stage stage,
                             std::optional<double> stage_fraction) {
  std::lock_guard<std::mutex> lock(publish_mutex_);
  auto snap = tracker_.OnStageSignal(job_id, stage, stage_fraction);
  if (snap) PublishProgressLocked(*snap);
}

void ControlService::OnPreview(const std::string& job_id,
                               const std::string& path) {
  std::lock_guard<std::mutex> lock(publish_mutex_);
  broadcaster_.Publish(protocol::Preview{job_id, path});
}

void ControlService::OnJobFinished(const core::JobRecord& job) {
  {
    std::lock_guard<std::mutex> lock(publish_mutex_);
    const progress::ProgressSnapshot snap = tracker_.OnJobFinished(job.id, job.status);
    if (job.status == core::JobStatus::kCompleted) PublishProgressLocked(snap);

    protocol::JobFinished finished;
    finished.id = job.id;
    finished.status = job.status;
    finished.duration_seconds = job.DurationSeconds();
    if (job.error) finished.error = *job.error;
    broadcaster_.Publish(finished);
  }

  if (job.status == core::JobStatus::kCompleted && !config_.history_path.empty()) {
    std::string error;
    if (!SaveHistory(&error)) {
      Logger::Warn("[ControlService] HISTORY_SAVE_FAILED path=" +
                   config_.history_path + " error=\"" + error + "\"");
    }
  }
}

void ControlService::Tick() {
  std::lock_guard<std::mutex> lock(publish_mutex_);
  for (const progress::ProgressSnapshot& snap : tracker_.Tick()) {
    PublishProgressLocked(snap);
  }
}

void ControlService::PublishProgressLocked(const progress::ProgressSnapshot& snap) {
  scheduler_.ReportProgress(snap.job_id, snap.fraction);
  broadcaster_.Publish(
      protocol::Progress{snap.job_id, snap.stage, snap.fraction, snap.eta_seconds});
}

size_t ControlService::Purge(int64_t retention_ms) {
  const size_t purged = scheduler_.PurgeTerminal(retention_ms);
  if (purged > 0) {
    std::ostringstream oss;
    oss << "[ControlService] PURGED jobs=" << purged
        << " retention_ms=" << retention_ms;
    Logger::Info(oss.str());
  }
  return purged;
}

bool ControlService::SaveHistory(std::string* error) const {
  if (config_.history_path.empty()) return true;
  std::lock_guard<std::mutex> lock(history_save_mutex_);
  return history_.Save(config_.history_path, error);
}

}  // namespace pixelctl::server
