// Repository: pixelctl
// Component: Job Scheduler
// Purpose: Owns the job table, the priority queue and the bounded worker pool.
// Copyright (c) 2026 Pixelctl

#ifndef PIXELCTL_SCHEDULER_SCHEDULER_HPP_
#define PIXELCTL_SCHEDULER_SCHEDULER_HPP_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "pixelctl/core/JobTypes.hpp"
#include "pixelctl/scheduler/IJobExecutor.hpp"
#include "pixelctl/scheduler/JobQueue.hpp"
#include "pixelctl/util/TimeSource.hpp"

namespace pixelctl::scheduler {

struct SchedulerConfig {
  // Concurrent Running jobs. 1 suits a single-accelerator worker.
  size_t worker_count = 1;
  // Rolling window for the throughput figure.
  int64_t throughput_window_ms = 60'000;
};

// Invoked with no scheduler lock held. on_job_started, on_stage, on_preview
// and on_job_finished for one job are called in that causal order.
struct SchedulerCallbacks {
  std::function<void(const core::JobRecord&)> on_job_started;
  std::function<void(const std::string& job_id, core::Stage stage,
                     std::optional<double> stage_fraction)>
      on_stage;
  std::function<void(const std::string& job_id, const std::string& path)>
      on_preview;
  std::function<void(const core::JobRecord&)> on_job_finished;
};

enum class SchedulerError {
  kNone,
  kJobNotFound,
  kAlreadyTerminal,
};

const char* ToString(SchedulerError error);

struct SubmitResult {
  std::string job_id;
  // False when job_id already existed; job then reflects the existing job.
  bool created = false;
  core::JobRecord job;
  // Queued jobs ahead of this one plus jobs currently running.
  size_t jobs_ahead = 0;
};

enum class CancelOutcome {
  kCancelledQueued,   // Removed before it ever started.
  kCancelRequested,   // Running; flag raised, finishes as Cancelled.
  kNotFound,
  kAlreadyTerminal,
};

const char* ToString(CancelOutcome outcome);

struct CancelResult {
  bool success = false;
  CancelOutcome outcome = CancelOutcome::kNotFound;
  SchedulerError error = SchedulerError::kNone;
  // Status at the time of the call.
  std::optional<core::JobStatus> prior_status;
};

struct SchedulerStats {
  size_t queued = 0;
  size_t running = 0;
  uint64_t completed = 0;
  uint64_t failed = 0;
  uint64_t cancelled = 0;
  double throughput_per_min = 0.0;
};

// Scheduler runs submitted jobs through IJobExecutor on a fixed worker pool.
//
// Jobs start in priority order (Urgent first), FIFO within a priority. A
// Running job is never preempted. Cancellation is cooperative: a queued job is
// removed immediately, a running job has its CancellationToken raised and
// finishes as Cancelled whatever the executor returns afterwards.
//
// The job table is guarded by one shared_mutex: readers (Get, ListJobs,
// Stats) share it, mutators take it exclusively. Neither the executor nor any
// callback is ever invoked with the lock held.
class Scheduler {
 public:
  Scheduler(IJobExecutor& executor, const util::ITimeSource& time,
            SchedulerConfig config = SchedulerConfig{});
  ~Scheduler();

  Scheduler(const Scheduler&) = delete;
  Scheduler& operator=(const Scheduler&) = delete;

  // Must be called before Start().
  void SetCallbacks(SchedulerCallbacks callbacks);

  void Start();

  // Raises cancellation on running jobs and joins the workers. Queued jobs
  // stay Queued.
  void Stop();

  // Always accepted. An empty job_id gets a generated one. Re-submitting an
  // existing id returns that job unchanged (created == false).
  SubmitResult Submit(core::JobPayload payload, core::JobPriority priority,
                      std::string job_id = std::string());

  CancelResult Cancel(const std::string& job_id);

  // Monotonic: values below the current progress are ignored.
  void ReportProgress(const std::string& job_id, double fraction);

  std::optional<core::JobRecord> Get(const std::string& job_id) const;

  // All retained jobs in submission order.
  std::vector<core::JobRecord> ListJobs() const;

  // Queued and Running jobs in submission order.
  std::vector<core::JobRecord> ActiveJobs() const;

  // Drops terminal jobs finished at least older_than_ms ago. Returns count.
  size_t PurgeTerminal(int64_t older_than_ms);

  SchedulerStats Stats() const;

  // Blocks until no job is queued or running, or the timeout passes.
  bool WaitIdle(std::chrono::milliseconds timeout) const;

  size_t worker_count() const { return config_.worker_count; }

 private:
  struct JobEntry {
    core::JobRecord record;
    CancellationToken token;
    bool cancel_requested = false;
  };

  class JobSink;

  void WorkerLoop(size_t worker_index);
  void RunJob(const std::string& job_id, const core::JobPayload& payload,
              const CancellationToken& token);
  void HandleStage(const std::string& job_id, core::Stage stage,
                   std::optional<double> stage_fraction);
  void HandlePreview(const std::string& job_id, const std::string& path);
  core::JobRecord Finalize(const std::string& job_id, ExecutionOutcome outcome);

  std::string GenerateJobId();
  void PruneThroughputLocked(int64_t now_ms);

  IJobExecutor& executor_;
  const util::ITimeSource& time_;
  const SchedulerConfig config_;
  SchedulerCallbacks callbacks_;

  mutable std::shared_mutex mutex_;
  std::condition_variable_any work_cv_;
  mutable std::condition_variable_any idle_cv_;

  std::unordered_map<std::string, JobEntry> jobs_;
  JobQueue queue_;
  uint64_t next_sequence_ = 0;

  size_t running_ = 0;
  uint64_t completed_total_ = 0;
  uint64_t failed_total_ = 0;
  uint64_t cancelled_total_ = 0;
  std::deque<int64_t> completion_times_ms_;

  std::atomic<bool> shutdown_{false};
  bool started_ = false;
  std::vector<std::thread> workers_;
};

}  // namespace pixelctl::scheduler

#endif  // PIXELCTL_SCHEDULER_SCHEDULER_HPP_
