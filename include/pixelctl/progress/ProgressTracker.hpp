// Repository: pixelctl
// Component: Progress Tracker
// Purpose: Turns stage signals into a monotonic fraction and an ETA, with
//          throttled emission.
// Copyright (c) 2026 Pixelctl

#ifndef PIXELCTL_PROGRESS_PROGRESS_TRACKER_HPP_
#define PIXELCTL_PROGRESS_PROGRESS_TRACKER_HPP_

#include <array>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "pixelctl/core/JobTypes.hpp"
#include "pixelctl/progress/StageHistory.hpp"
#include "pixelctl/util/TimeSource.hpp"

namespace pixelctl::progress {

struct ProgressTrackerConfig {
  // Minimum spacing of Progress updates within one stage.
  int64_t min_emit_interval_ms = 250;
  // Cap on time-based in-stage progress when the worker reports no fraction,
  // so an overrunning stage does not look finished.
  double max_time_based_stage_fraction = 0.95;
};

struct ProgressSnapshot {
  std::string job_id;
  core::Stage stage = core::Stage::kQueued;
  double fraction = 0.0;
  double eta_seconds = 0.0;
};

// ProgressTracker keeps per-job stage timing for Running jobs.
//
// fraction = (expected time of finished stages + expected time of current
//             stage * in-stage progress) / expected total
//
// where expected times come from StageHistory. In-stage progress is the
// worker-reported fraction when present, else elapsed / expected. The result
// never decreases and reaches 1.0 only at Done.
//
// Stage signals that move backwards are ignored. History is updated only when
// a job completes; failed and cancelled runs would skew the averages.
//
// Thread-safe.
class ProgressTracker {
 public:
  ProgressTracker(StageHistory& history, const util::ITimeSource& time,
                  ProgressTrackerConfig config = ProgressTrackerConfig{});

  // Begins tracking in Preparing. Always returns a snapshot to emit.
  ProgressSnapshot OnJobStarted(const std::string& job_id);

  // Returns a snapshot when one should be emitted: on every stage transition,
  // otherwise at most once per min_emit_interval_ms.
  std::optional<ProgressSnapshot> OnStageSignal(
      const std::string& job_id, core::Stage stage,
      std::optional<double> stage_fraction);

  // Time-based advance for jobs that have been quiet for at least the emit
  // interval. Call periodically.
  std::vector<ProgressSnapshot> Tick();

  // Stops tracking. For Completed, records per-stage durations into history
  // and returns {Done, 1.0, 0}. Otherwise returns the last computed state.
  ProgressSnapshot OnJobFinished(const std::string& job_id,
                                 core::JobStatus status);

  std::optional<ProgressSnapshot> Current(const std::string& job_id) const;

  // Expected wall time of a fresh job.
  double EstimateJobSeconds() const { return history_.TotalEstimate(); }

  size_t ActiveCount() const;

 private:
  struct JobState {
    core::Stage stage = core::Stage::kPreparing;
    int64_t stage_started_ms = 0;
    std::optional<double> stage_fraction;
    double last_fraction = 0.0;
    int64_t last_emit_ms = 0;
    std::array<double, core::kStageCount> stage_seconds{};
    std::array<bool, core::kStageCount> visited{};
  };

  ProgressSnapshot Compute(const std::string& job_id, JobState& state,
                           int64_t now_ms) const;
  void CloseStage(JobState& state, int64_t now_ms) const;

  StageHistory& history_;
  const util::ITimeSource& time_;
  const ProgressTrackerConfig config_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, JobState> jobs_;
};

}  // namespace pixelctl::progress

#endif  // PIXELCTL_PROGRESS_PROGRESS_TRACKER_HPP_
