// Repository: pixelctl
// Component: Job Types
// Purpose: Job lifecycle enums, payload blob and the job record snapshot.
// Copyright (c) 2026 Pixelctl

#ifndef PIXELCTL_CORE_JOB_TYPES_HPP_
#define PIXELCTL_CORE_JOB_TYPES_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pixelctl::core {

// Ordered: lower value runs first.
enum class JobPriority : uint8_t {
  kUrgent = 0,
  kHigh = 1,
  kNormal = 2,
  kLow = 3,
};

enum class JobStatus : uint8_t {
  kQueued,
  kRunning,
  kCompleted,
  kFailed,
  kCancelled,
};

// Named execution phases, in execution order. kQueued and kDone carry no
// work; the four between them are timed for ETA.
enum class Stage : uint8_t {
  kQueued = 0,
  kPreparing = 1,
  kExecuting = 2,
  kPostprocessing = 3,
  kSaving = 4,
  kDone = 5,
};

inline constexpr Stage kWorkStages[] = {
    Stage::kPreparing, Stage::kExecuting, Stage::kPostprocessing,
    Stage::kSaving};
inline constexpr size_t kStageCount = 6;

const char* ToString(JobPriority priority);
const char* ToString(JobStatus status);
const char* ToString(Stage stage);

// Case-insensitive. Accepts the ToString() spelling.
bool ParseJobPriority(const std::string& text, JobPriority* out);
bool ParseStage(const std::string& text, Stage* out);

bool IsTerminal(JobStatus status);

// Queued -> Running | Cancelled
// Running -> Completed | Failed | Cancelled
// Terminal -> nothing
bool IsLegalTransition(JobStatus from, JobStatus to);

// Opaque parameter bag. The core forwards the bytes and never decodes them.
struct JobPayload {
  uint32_t schema_version = 1;
  std::string bytes;

  bool operator==(const JobPayload& o) const {
    return schema_version == o.schema_version && bytes == o.bytes;
  }
  bool operator!=(const JobPayload& o) const { return !(*this == o); }
};

// Read-only copy of a job handed out by the scheduler.
struct JobRecord {
  std::string id;
  JobPayload payload;
  JobPriority priority = JobPriority::kNormal;
  JobStatus status = JobStatus::kQueued;
  Stage stage = Stage::kQueued;
  double progress = 0.0;

  int64_t created_at_ms = 0;
  std::optional<int64_t> started_at_ms;
  std::optional<int64_t> finished_at_ms;

  std::vector<std::string> outputs;
  std::optional<std::string> error;

  // Submission order, used for FIFO tie-breaks.
  uint64_t sequence = 0;

  // Seconds from start (or creation, if never started) to finish.
  double DurationSeconds() const;
};

// Moves record->status to `to` if IsLegalTransition allows it. Otherwise the
// record is left untouched and false is returned.
bool TransitionTo(JobRecord* record, JobStatus to);

}  // namespace pixelctl::core

#endif  // PIXELCTL_CORE_JOB_TYPES_HPP_
