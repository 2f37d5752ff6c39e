// Repository: pixelctl
// Component: Progress Tracker
// Purpose: Stage-weighted progress fraction, ETA and emission throttling.
// Copyright (c) 2026 Pixelctl

#include "pixelctl/progress/ProgressTracker.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <sstream>

#include "pixelctl/util/Logger.hpp"

namespace pixelctl::progress {

using pixelctl::util::Logger;

namespace {

size_t Index(core::Stage stage) { return static_cast<size_t>(stage); }

// Below this reported in-stage progress the observed rate is too noisy to
// project from.
constexpr double kMinFractionForRate = 0.05;

// Highest fraction reported before Done.
constexpr double kMaxRunningFraction = 0.99;

}  // namespace

ProgressTracker::ProgressTracker(StageHistory& history,
                                 const util::ITimeSource& time,
                                 ProgressTrackerConfig config)
    : history_(history), time_(time), config_(config) {}

ProgressSnapshot ProgressTracker::OnJobStarted(const std::string& job_id) {
  const int64_t now = time_.NowUtcMs();
  std::lock_guard<std::mutex> lock(mutex_);
  JobState& state = jobs_[job_id];
  state = JobState{};
  state.stage = core::Stage::kPreparing;
  state.stage_started_ms = now;
  state.visited[Index(core::Stage::kPreparing)] = true;
  state.last_emit_ms = now;
  return Compute(job_id, state, now);
}

std::optional<ProgressSnapshot> ProgressTracker::OnStageSignal(
    const std::string& job_id, core::Stage stage,
    std::optional<double> stage_fraction) {
  const int64_t now = time_.NowUtcMs();
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = jobs_.find(job_id);
  if (it == jobs_.end()) return std::nullopt;
  JobState& state = it->second;

  if (stage < state.stage || stage == core::Stage::kQueued ||
      stage == core::Stage::kDone) {
    std::ostringstream oss;
    oss << "[ProgressTracker] STAGE_REJECTED job_id=" << job_id
        << " stage=" << core::ToString(stage)
        << " current=" << core::ToString(state.stage);
    Logger::Debug(oss.str());
    return std::nullopt;
  }

  std::optional<double> local;
  if (stage_fraction && std::isfinite(*stage_fraction)) {
    local = std::clamp(*stage_fraction, 0.0, 1.0);
  }

  bool transition = false;
  if (stage > state.stage) {
    CloseStage(state, now);
    state.stage = stage;
    state.stage_started_ms = now;
    state.stage_fraction = local;
    state.visited[Index(stage)] = true;
    transition = true;
  } else if (local) {
    state.stage_fraction =
        state.stage_fraction ? std::max(*state.stage_fraction, *local) : *local;
  }

  if (!transition && now - state.last_emit_ms < config_.min_emit_interval_ms) {
    return std::nullopt;
  }
  state.last_emit_ms = now;
  return Compute(job_id, state, now);
}

std::vector<ProgressSnapshot> ProgressTracker::Tick() {
  const int64_t now = time_.NowUtcMs();
  std::vector<ProgressSnapshot> out;
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& [id, state] : jobs_) {
    if (now - state.last_emit_ms < config_.min_emit_interval_ms) continue;
    state.last_emit_ms = now;
    out.push_back(Compute(id, state, now));
  }
  return out;
}

ProgressSnapshot ProgressTracker::OnJobFinished(const std::string& job_id,
                                                core::JobStatus status) {
  const int64_t now = time_.NowUtcMs();
  JobState state;
  ProgressSnapshot snap;
  snap.job_id = job_id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(job_id);
    if (it == jobs_.end()) {
      if (status == core::JobStatus::kCompleted) {
        snap.stage = core::Stage::kDone;
        snap.fraction = 1.0;
      }
      return snap;
    }
    state = it->second;
    jobs_.erase(it);
    if (status != core::JobStatus::kCompleted) {
      return Compute(job_id, state, now);
    }
  }

  CloseStage(state, now);
  for (core::Stage s : core::kWorkStages) {
    if (state.visited[Index(s)]) history_.Record(s, state.stage_seconds[Index(s)]);
  }
  snap.stage = core::Stage::kDone;
  snap.fraction = 1.0;
  snap.eta_seconds = 0.0;
  return snap;
}

std::optional<ProgressSnapshot> ProgressTracker::Current(
    const std::string& job_id) const {
  const int64_t now = time_.NowUtcMs();
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = jobs_.find(job_id);
  if (it == jobs_.end()) return std::nullopt;
  JobState copy = it->second;
  return Compute(job_id, copy, now);
}

size_t ProgressTracker::ActiveCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return jobs_.size();
}

void ProgressTracker::CloseStage(JobState& state, int64_t now_ms) const {
  const int64_t elapsed = std::max<int64_t>(0, now_ms - state.stage_started_ms);
  state.stage_seconds[Index(state.stage)] += elapsed / 1000.0;
  state.stage_started_ms = now_ms;
}

ProgressSnapshot ProgressTracker::Compute(const std::string& job_id,
                                          JobState& state,
                                          int64_t now_ms) const {
  ProgressSnapshot snap;
  snap.job_id = job_id;
  snap.stage = state.stage;

  std::array<double, core::kStageCount> expected{};
  double total = 0.0;
  for (core::Stage s : core::kWorkStages) {
    expected[Index(s)] = std::max(0.0, history_.Estimate(s));
    total += expected[Index(s)];
  }
  // All-zero estimates would make every weight zero; treat stages as equal.
  if (total <= 0.0) {
    for (core::Stage s : core::kWorkStages) expected[Index(s)] = 1.0;
    total = static_cast<double>(std::size(core::kWorkStages));
  }

  const double current_expected = expected[Index(state.stage)];
  const double elapsed_s =
      std::max<int64_t>(0, now_ms - state.stage_started_ms) / 1000.0;

  double local = 0.0;
  if (state.stage_fraction) {
    local = *state.stage_fraction;
  } else if (current_expected > 0.0) {
    local = std::min(elapsed_s / current_expected,
                     config_.max_time_based_stage_fraction);
  }

  double finished = 0.0;
  double remaining_after = 0.0;
  for (core::Stage s : core::kWorkStages) {
    if (s < state.stage) finished += expected[Index(s)];
    if (s > state.stage) remaining_after += expected[Index(s)];
  }

  double fraction = (finished + current_expected * local) / total;
  fraction = std::clamp(fraction, 0.0, kMaxRunningFraction);
  fraction = std::max(fraction, state.last_fraction);
  state.last_fraction = fraction;

  double remaining_current;
  if (state.stage_fraction && local >= kMinFractionForRate && elapsed_s > 0.0) {
    remaining_current = elapsed_s * (1.0 - local) / local;
  } else {
    remaining_current = current_expected * (1.0 - local);
  }

  snap.fraction = fraction;
  snap.eta_seconds = std::max(0.0, remaining_current) + remaining_after;
  return snap;
}

}  // namespace pixelctl::progress
