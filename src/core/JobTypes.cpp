// Repository: pixelctl
// Component: Job Types
// Purpose: Enum names, parsing and the job state machine.
// Copyright (c) 2026 Pixelctl

#include "pixelctl/core/JobTypes.hpp"

#include <algorithm>
#include <cctype>

namespace pixelctl::core {

namespace {

std::string Lower(const std::string& s) {
  std::string out = s;
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

}  // namespace

const char* ToString(JobPriority priority) {
  switch (priority) {
    case JobPriority::kUrgent: return "Urgent";
    case JobPriority::kHigh: return "High";
    case JobPriority::kNormal: return "Normal";
    case JobPriority::kLow: return "Low";
  }
  return "Unknown";
}

const char* ToString(JobStatus status) {
  switch (status) {
    case JobStatus::kQueued: return "Queued";
    case JobStatus::kRunning: return "Running";
    case JobStatus::kCompleted: return "Completed";
    case JobStatus::kFailed: return "Failed";
    case JobStatus::kCancelled: return "Cancelled";
  }
  return "Unknown";
}

const char* ToString(Stage stage) {
  switch (stage) {
    case Stage::kQueued: return "Queued";
    case Stage::kPreparing: return "Preparing";
    case Stage::kExecuting: return "Executing";
    case Stage::kPostprocessing: return "Postprocessing";
    case Stage::kSaving: return "Saving";
    case Stage::kDone: return "Done";
  }
  return "Unknown";
}

bool ParseJobPriority(const std::string& text, JobPriority* out) {
  const std::string t = Lower(text);
  if (t == "urgent") { *out = JobPriority::kUrgent; return true; }
  if (t == "high") { *out = JobPriority::kHigh; return true; }
  if (t == "normal") { *out = JobPriority::kNormal; return true; }
  if (t == "low") { *out = JobPriority::kLow; return true; }
  return false;
}

bool ParseStage(const std::string& text, Stage* out) {
  const std::string t = Lower(text);
  if (t == "queued") { *out = Stage::kQueued; return true; }
  if (t == "preparing") { *out = Stage::kPreparing; return true; }
  if (t == "executing") { *out = Stage::kExecuting; return true; }
  if (t == "postprocessing") { *out = Stage::kPostprocessing; return true; }
  if (t == "saving") { *out = Stage::kSaving; return true; }
  if (t == "done") { *out = Stage::kDone; return true; }
  return false;
}

bool IsTerminal(JobStatus status) {
  return status == JobStatus::kCompleted || status == JobStatus::kFailed ||
         status == JobStatus::kCancelled;
}

bool IsLegalTransition(JobStatus from, JobStatus to) {
  switch (from) {
    case JobStatus::kQueued:
      return to == JobStatus::kRunning || to == JobStatus::kCancelled;
    case JobStatus::kRunning:
      return to == JobStatus::kCompleted || to == JobStatus::kFailed ||
             to == JobStatus::kCancelled;
    default:
      return false;
  }
}

bool TransitionTo(JobRecord* record, JobStatus to) {
  if (!IsLegalTransition(record->status, to)) return false;
  record->status = to;
  return true;
}

double JobRecord::DurationSeconds() const {
  if (!finished_at_ms) return 0.0;
  const int64_t begin = started_at_ms ? *started_at_ms : created_at_ms;
  return std::max<int64_t>(0, *finished_at_ms - begin) / 1000.0;
}

}  // namespace pixelctl::core
