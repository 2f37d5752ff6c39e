// Repository: pixelctl
// Component: Job Update Validator
// Purpose: Subscriber-side check of per-job update order and monotonic progress.
// Copyright (c) 2026 Pixelctl

#ifndef PIXELCTL_PROGRESS_JOB_UPDATE_VALIDATOR_HPP_
#define PIXELCTL_PROGRESS_JOB_UPDATE_VALIDATOR_HPP_

#include <string>
#include <unordered_map>

#include "pixelctl/core/JobTypes.hpp"
#include "pixelctl/protocol/Messages.hpp"

namespace pixelctl::progress {

enum class UpdateViolation {
  kNone,
  kDuplicateStart,       // JobStarted seen twice.
  kUpdateBeforeStart,    // Progress/Preview with no JobStarted.
  kUpdateAfterFinish,    // Anything after JobFinished.
  kProgressRegression,   // fraction lower than the previous one.
  kStageRegression,      // stage earlier than the previous one.
};

const char* ToString(UpdateViolation violation);

struct UpdateCheck {
  bool accepted = true;
  UpdateViolation violation = UpdateViolation::kNone;
  std::string detail;
};

// Per job: JobStarted, then Progress/Preview, then JobFinished. JobFinished
// alone is legal (a queued job that was cancelled). Rejected updates do not
// change the tracked state. Not thread-safe.
class JobUpdateValidator {
 public:
  UpdateCheck Check(const protocol::Update& update);

  // Seeds state for a job learned from a Status reply, so a subscriber that
  // joins mid-run accepts the job's later Progress.
  void Adopt(const std::string& job_id, core::JobStatus status,
             core::Stage stage, double progress);

  void Forget(const std::string& job_id);
  size_t TrackedJobs() const { return jobs_.size(); }

 private:
  struct State {
    bool started = false;
    bool finished = false;
    core::Stage stage = core::Stage::kQueued;
    double fraction = 0.0;
  };

  std::unordered_map<std::string, State> jobs_;
};

}  // namespace pixelctl::progress

#endif  // PIXELCTL_PROGRESS_JOB_UPDATE_VALIDATOR_HPP_
