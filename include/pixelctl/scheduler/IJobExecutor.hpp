// Repository: pixelctl
// Component: Job Executor Interface
// Purpose: Boundary to the collaborator that performs the generative work.
// Copyright (c) 2026 Pixelctl

#ifndef PIXELCTL_SCHEDULER_I_JOB_EXECUTOR_HPP_
#define PIXELCTL_SCHEDULER_I_JOB_EXECUTOR_HPP_

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "pixelctl/core/JobTypes.hpp"

namespace pixelctl::scheduler {

// Shared cancellation flag. Copies observe the same flag. The scheduler
// raises it; the executor polls it at safe checkpoints.
class CancellationToken {
 public:
  CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

  void RequestCancellation() const {
    flag_->store(true, std::memory_order_release);
  }

  bool IsCancellationRequested() const {
    return flag_->load(std::memory_order_acquire);
  }

 private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

// Signals from a running job. Called synchronously from within Execute(), on
// the scheduler worker thread. Must not be used after Execute() returns.
class IExecutionSink {
 public:
  virtual ~IExecutionSink() = default;

  // stage_fraction is progress within the stage, when the worker knows it.
  virtual void OnStage(core::Stage stage,
                       std::optional<double> stage_fraction) = 0;

  // An intermediate image is available.
  virtual void OnPreview(const std::string& path) = 0;
};

struct ExecutionOutcome {
  // kCompleted, kFailed or kCancelled.
  core::JobStatus status = core::JobStatus::kFailed;
  std::vector<std::string> outputs;
  std::string error;

  static ExecutionOutcome Completed(std::vector<std::string> paths) {
    ExecutionOutcome o;
    o.status = core::JobStatus::kCompleted;
    o.outputs = std::move(paths);
    return o;
  }

  static ExecutionOutcome Failed(std::string message) {
    ExecutionOutcome o;
    o.status = core::JobStatus::kFailed;
    o.error = std::move(message);
    return o;
  }

  static ExecutionOutcome Cancelled() {
    ExecutionOutcome o;
    o.status = core::JobStatus::kCancelled;
    return o;
  }
};

class IJobExecutor {
 public:
  virtual ~IJobExecutor() = default;

  // Runs one job to completion. Blocks the calling worker thread. Once
  // cancel.IsCancellationRequested() is observed the executor should stop at
  // its next safe point and return Cancelled. Exceptions are mapped to Failed
  // by the caller.
  virtual ExecutionOutcome Execute(const std::string& job_id,
                                   const core::JobPayload& payload,
                                   IExecutionSink& sink,
                                   const CancellationToken& cancel) = 0;
};

}  // namespace pixelctl::scheduler

#endif  // PIXELCTL_SCHEDULER_I_JOB_EXECUTOR_HPP_
