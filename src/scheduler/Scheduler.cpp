// Repository: pixelctl
// Component: Job Scheduler
// Purpose: Worker pool, lifecycle transitions, cancellation and statistics.
// Copyright (c) 2026 Pixelctl

#include "pixelctl/scheduler/Scheduler.hpp"

#include <algorithm>
#include <exception>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>

#include "pixelctl/util/Logger.hpp"

namespace pixelctl::scheduler {

using pixelctl::util::Logger;

const char* ToString(SchedulerError error) {
  switch (error) {
    case SchedulerError::kNone: return "None";
    case SchedulerError::kJobNotFound: return "JobNotFound";
    case SchedulerError::kAlreadyTerminal: return "AlreadyTerminal";
  }
  return "Unknown";
}

const char* ToString(CancelOutcome outcome) {
  switch (outcome) {
    case CancelOutcome::kCancelledQueued: return "CancelledQueued";
    case CancelOutcome::kCancelRequested: return "CancelRequested";
    case CancelOutcome::kNotFound: return "NotFound";
    case CancelOutcome::kAlreadyTerminal: return "AlreadyTerminal";
  }
  return "Unknown";
}

// =============================================================================
// JobSink: forwards executor signals for one job, refuses late calls.
// =============================================================================

class Scheduler::JobSink : public IExecutionSink {
 public:
  JobSink(Scheduler& owner, std::string job_id)
      : owner_(owner), job_id_(std::move(job_id)) {}

  void OnStage(core::Stage stage, std::optional<double> stage_fraction) override {
    if (closed_.load(std::memory_order_acquire)) return;
    owner_.HandleStage(job_id_, stage, stage_fraction);
  }

  void OnPreview(const std::string& path) override {
    if (closed_.load(std::memory_order_acquire)) return;
    owner_.HandlePreview(job_id_, path);
  }

  void Close() { closed_.store(true, std::memory_order_release); }

 private:
  Scheduler& owner_;
  const std::string job_id_;
  std::atomic<bool> closed_{false};
};

// =============================================================================
// Lifecycle
// =============================================================================

namespace {

SchedulerConfig Normalize(SchedulerConfig config) {
  if (config.worker_count == 0) {
    Logger::Warn("[Scheduler] CONFIG worker_count=0 raised to 1");
    config.worker_count = 1;
  }
  if (config.throughput_window_ms <= 0) config.throughput_window_ms = 60'000;
  return config;
}

bool Transition(core::JobRecord& rec, core::JobStatus to) {
  const core::JobStatus from = rec.status;
  if (core::TransitionTo(&rec, to)) return true;
  std::ostringstream oss;
  oss << "[Scheduler] ILLEGAL_TRANSITION job_id=" << rec.id
      << " from=" << core::ToString(from) << " to=" << core::ToString(to);
  Logger::Error(oss.str());
  return false;
}

}  // namespace

Scheduler::Scheduler(IJobExecutor& executor, const util::ITimeSource& time,
                     SchedulerConfig config)
    : executor_(executor), time_(time), config_(Normalize(config)) {}

Scheduler::~Scheduler() { Stop(); }

void Scheduler::SetCallbacks(SchedulerCallbacks callbacks) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  callbacks_ = std::move(callbacks);
}

void Scheduler::Start() {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (started_) return;
  started_ = true;
  shutdown_.store(false, std::memory_order_release);
  for (size_t i = 0; i < config_.worker_count; ++i) {
    workers_.emplace_back(&Scheduler::WorkerLoop, this, i);
  }
  std::ostringstream oss;
  oss << "[Scheduler] STARTED workers=" << config_.worker_count;
  Logger::Info(oss.str());
}

void Scheduler::Stop() {
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (!started_) return;
    shutdown_.store(true, std::memory_order_release);
    for (auto& [id, entry] : jobs_) {
      if (entry.record.status == core::JobStatus::kRunning) {
        entry.token.RequestCancellation();
        entry.cancel_requested = true;
      }
    }
  }
  work_cv_.notify_all();
  for (auto& t : workers_) {
    if (t.joinable()) t.join();
  }
  workers_.clear();
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    started_ = false;
  }
  Logger::Info("[Scheduler] STOPPED");
}

// =============================================================================
// Commands
// =============================================================================

std::string Scheduler::GenerateJobId() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  std::ostringstream oss;
  oss << "job-" << std::hex << std::setw(6) << std::setfill('0')
      << (next_sequence_ & 0xFFFFFF) << "-" << std::setw(8)
      << (rng() & 0xFFFFFFFFu);
  return oss.str();
}

SubmitResult Scheduler::Submit(core::JobPayload payload,
                               core::JobPriority priority, std::string job_id) {
  SubmitResult result;
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (job_id.empty()) {
      do {
        job_id = GenerateJobId();
      } while (jobs_.count(job_id) != 0);
    }

    auto existing = jobs_.find(job_id);
    if (existing != jobs_.end()) {
      result.job_id = job_id;
      result.created = false;
      result.job = existing->second.record;
      result.jobs_ahead = queue_.PositionOf(job_id) + running_;
      return result;
    }

    JobEntry entry;
    entry.record.id = job_id;
    entry.record.payload = std::move(payload);
    entry.record.priority = priority;
    entry.record.status = core::JobStatus::kQueued;
    entry.record.stage = core::Stage::kQueued;
    entry.record.created_at_ms = time_.NowUtcMs();
    entry.record.sequence = next_sequence_++;
    queue_.Push(job_id, priority, entry.record.sequence);

    result.job_id = job_id;
    result.created = true;
    result.job = entry.record;
    result.jobs_ahead = queue_.PositionOf(job_id) + running_;
    jobs_.emplace(job_id, std::move(entry));
  }
  work_cv_.notify_one();

  std::ostringstream oss;
  oss << "[Scheduler] JOB_QUEUED job_id=" << result.job_id
      << " priority=" << core::ToString(priority)
      << " ahead=" << result.jobs_ahead;
  Logger::Info(oss.str());
  return result;
}

CancelResult Scheduler::Cancel(const std::string& job_id) {
  CancelResult result;
  core::JobRecord finished;
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = jobs_.find(job_id);
    if (it == jobs_.end()) {
      result.outcome = CancelOutcome::kNotFound;
      result.error = SchedulerError::kJobNotFound;
      return result;
    }
    JobEntry& entry = it->second;
    result.prior_status = entry.record.status;

    if (core::IsTerminal(entry.record.status)) {
      result.outcome = CancelOutcome::kAlreadyTerminal;
      result.error = SchedulerError::kAlreadyTerminal;
      return result;
    }

    if (entry.record.status == core::JobStatus::kRunning) {
      entry.token.RequestCancellation();
      entry.cancel_requested = true;
      result.success = true;
      result.outcome = CancelOutcome::kCancelRequested;
    } else {
      queue_.Remove(job_id);
      if (!Transition(entry.record, core::JobStatus::kCancelled)) {
        result.outcome = CancelOutcome::kAlreadyTerminal;
        result.error = SchedulerError::kAlreadyTerminal;
        return result;
      }
      entry.record.finished_at_ms = time_.NowUtcMs();
      ++cancelled_total_;
      finished = entry.record;
      result.success = true;
      result.outcome = CancelOutcome::kCancelledQueued;
    }
  }

  std::ostringstream oss;
  oss << "[Scheduler] CANCEL job_id=" << job_id
      << " outcome=" << ToString(result.outcome);
  Logger::Info(oss.str());

  if (result.outcome == CancelOutcome::kCancelledQueued) {
    idle_cv_.notify_all();
    if (callbacks_.on_job_finished) callbacks_.on_job_finished(finished);
  }
  return result;
}

void Scheduler::ReportProgress(const std::string& job_id, double fraction) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto it = jobs_.find(job_id);
  if (it == jobs_.end()) return;
  core::JobRecord& rec = it->second.record;
  if (rec.status != core::JobStatus::kRunning) return;
  rec.progress = std::clamp(std::max(rec.progress, fraction), 0.0, 1.0);
}

// =============================================================================
// Queries
// =============================================================================

std::optional<core::JobRecord> Scheduler::Get(const std::string& job_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = jobs_.find(job_id);
  if (it == jobs_.end()) return std::nullopt;
  return it->second.record;
}

std::vector<core::JobRecord> Scheduler::ListJobs() const {
  std::vector<core::JobRecord> out;
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    out.reserve(jobs_.size());
    for (const auto& [id, entry] : jobs_) out.push_back(entry.record);
  }
  std::sort(out.begin(), out.end(),
            [](const core::JobRecord& a, const core::JobRecord& b) {
              return a.sequence < b.sequence;
            });
  return out;
}

std::vector<core::JobRecord> Scheduler::ActiveJobs() const {
  std::vector<core::JobRecord> out;
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto& [id, entry] : jobs_) {
      if (!core::IsTerminal(entry.record.status)) out.push_back(entry.record);
    }
  }
  std::sort(out.begin(), out.end(),
            [](const core::JobRecord& a, const core::JobRecord& b) {
              return a.sequence < b.sequence;
            });
  return out;
}

size_t Scheduler::PurgeTerminal(int64_t older_than_ms) {
  const int64_t cutoff = time_.NowUtcMs() - older_than_ms;
  size_t purged = 0;
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (auto it = jobs_.begin(); it != jobs_.end();) {
      const core::JobRecord& rec = it->second.record;
      if (core::IsTerminal(rec.status) && rec.finished_at_ms &&
          *rec.finished_at_ms <= cutoff) {
        it = jobs_.erase(it);
        ++purged;
      } else {
        ++it;
      }
    }
  }
  if (purged > 0) {
    std::ostringstream oss;
    oss << "[Scheduler] PURGED count=" << purged;
    Logger::Debug(oss.str());
  }
  return purged;
}

SchedulerStats Scheduler::Stats() const {
  const int64_t now = time_.NowUtcMs();
  std::shared_lock<std::shared_mutex> lock(mutex_);
  SchedulerStats s;
  s.queued = queue_.Size();
  s.running = running_;
  s.completed = completed_total_;
  s.failed = failed_total_;
  s.cancelled = cancelled_total_;

  const int64_t window = std::max<int64_t>(1, config_.throughput_window_ms);
  auto first = std::lower_bound(completion_times_ms_.begin(),
                                completion_times_ms_.end(), now - window);
  const auto in_window =
      static_cast<double>(std::distance(first, completion_times_ms_.end()));
  s.throughput_per_min = in_window * 60'000.0 / static_cast<double>(window);
  return s;
}

bool Scheduler::WaitIdle(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  return idle_cv_.wait_for(lock, timeout,
                           [this] { return queue_.Empty() && running_ == 0; });
}

void Scheduler::PruneThroughputLocked(int64_t now_ms) {
  const int64_t cutoff = now_ms - config_.throughput_window_ms;
  while (!completion_times_ms_.empty() &&
         completion_times_ms_.front() < cutoff) {
    completion_times_ms_.pop_front();
  }
}

// =============================================================================
// Worker side
// =============================================================================

void Scheduler::WorkerLoop(size_t worker_index) {
  while (true) {
    std::string job_id;
    core::JobPayload payload;
    CancellationToken token;
    core::JobRecord started;

    {
      std::unique_lock<std::shared_mutex> lock(mutex_);
      work_cv_.wait(lock, [this] {
        return shutdown_.load(std::memory_order_acquire) || !queue_.Empty();
      });
      if (shutdown_.load(std::memory_order_acquire)) return;

      auto next = queue_.Pop();
      if (!next) continue;
      job_id = *next;

      JobEntry& entry = jobs_.at(job_id);
      if (!Transition(entry.record, core::JobStatus::kRunning)) continue;
      entry.record.stage = core::Stage::kPreparing;
      entry.record.started_at_ms = time_.NowUtcMs();
      ++running_;

      payload = entry.record.payload;
      token = entry.token;
      started = entry.record;
    }

    std::ostringstream oss;
    oss << "[Scheduler] JOB_STARTED job_id=" << job_id
        << " worker=" << worker_index
        << " priority=" << core::ToString(started.priority);
    Logger::Info(oss.str());

    if (callbacks_.on_job_started) callbacks_.on_job_started(started);

    RunJob(job_id, payload, token);
  }
}

void Scheduler::RunJob(const std::string& job_id,
                       const core::JobPayload& payload,
                       const CancellationToken& token) {
  JobSink sink(*this, job_id);
  ExecutionOutcome outcome;
  try {
    outcome = executor_.Execute(job_id, payload, sink, token);
  } catch (const std::exception& e) {
    outcome = ExecutionOutcome::Failed(std::string("executor error: ") + e.what());
  } catch (...) {
    outcome = ExecutionOutcome::Failed("executor error: unknown exception");
  }
  sink.Close();

  core::JobRecord finished = Finalize(job_id, std::move(outcome));

  std::ostringstream oss;
  oss << "[Scheduler] JOB_FINISHED job_id=" << job_id
      << " status=" << core::ToString(finished.status)
      << " duration_s=" << finished.DurationSeconds();
  if (finished.error) oss << " error=\"" << *finished.error << "\"";
  if (finished.status == core::JobStatus::kFailed) {
    Logger::Warn(oss.str());
  } else {
    Logger::Info(oss.str());
  }

  idle_cv_.notify_all();
  if (callbacks_.on_job_finished) callbacks_.on_job_finished(finished);
}

core::JobRecord Scheduler::Finalize(const std::string& job_id,
                                    ExecutionOutcome outcome) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  JobEntry& entry = jobs_.at(job_id);
  core::JobRecord& rec = entry.record;
  const int64_t now = time_.NowUtcMs();

  core::JobStatus status = outcome.status;
  if (entry.cancel_requested || entry.token.IsCancellationRequested()) {
    status = core::JobStatus::kCancelled;
  } else if (!core::IsTerminal(status)) {
    status = core::JobStatus::kFailed;
    outcome.error = "executor returned non-terminal status";
  }

  --running_;
  if (!Transition(rec, status)) return rec;
  rec.finished_at_ms = now;
  switch (status) {
    case core::JobStatus::kCompleted:
      rec.outputs = std::move(outcome.outputs);
      rec.stage = core::Stage::kDone;
      rec.progress = 1.0;
      ++completed_total_;
      completion_times_ms_.push_back(now);
      PruneThroughputLocked(now);
      break;
    case core::JobStatus::kFailed:
      rec.error = outcome.error.empty() ? std::string("execution failed")
                                        : std::move(outcome.error);
      ++failed_total_;
      break;
    default:
      ++cancelled_total_;
      break;
  }
  return rec;
}

void Scheduler::HandleStage(const std::string& job_id, core::Stage stage,
                            std::optional<double> stage_fraction) {
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = jobs_.find(job_id);
    if (it == jobs_.end()) return;
    core::JobRecord& rec = it->second.record;
    if (rec.status != core::JobStatus::kRunning) return;
    if (stage == core::Stage::kQueued || stage == core::Stage::kDone ||
        stage < rec.stage) {
      std::ostringstream oss;
      oss << "[Scheduler] STAGE_IGNORED job_id=" << job_id
          << " stage=" << core::ToString(stage)
          << " current=" << core::ToString(rec.stage);
      Logger::Debug(oss.str());
      return;
    }
    rec.stage = stage;
  }
  if (callbacks_.on_stage) callbacks_.on_stage(job_id, stage, stage_fraction);
}

void Scheduler::HandlePreview(const std::string& job_id,
                              const std::string& path) {
  if (callbacks_.on_preview) callbacks_.on_preview(job_id, path);
}

}  // namespace pixelctl::scheduler
