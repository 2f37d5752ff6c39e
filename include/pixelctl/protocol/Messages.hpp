// Repository: pixelctl
// Component: Protocol Messages
// Purpose: In-memory shape of every request, response and update variant.
// Copyright (c) 2026 Pixelctl

#ifndef PIXELCTL_PROTOCOL_MESSAGES_HPP_
#define PIXELCTL_PROTOCOL_MESSAGES_HPP_

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "pixelctl/core/JobTypes.hpp"

namespace pixelctl::protocol {

// =============================================================================
// Requests (client -> server). Each expects exactly one Response.
// =============================================================================

struct Generate {
  std::string id;
  core::JobPayload payload;
  core::JobPriority priority = core::JobPriority::kNormal;

  bool operator==(const Generate& o) const {
    return id == o.id && payload == o.payload && priority == o.priority;
  }
};

struct Cancel {
  std::string id;

  bool operator==(const Cancel& o) const { return id == o.id; }
};

struct ListModels {
  bool operator==(const ListModels&) const { return true; }
};

struct StatusRequest {
  bool operator==(const StatusRequest&) const { return true; }
};

struct Ping {
  bool operator==(const Ping&) const { return true; }
};

using Request = std::variant<Generate, Cancel, ListModels, StatusRequest, Ping>;

// =============================================================================
// Responses (server -> client)
// =============================================================================

struct JobAccepted {
  std::string id;
  // Expected run time from the stage history, including jobs ahead.
  double estimated_seconds = 0.0;

  bool operator==(const JobAccepted& o) const {
    return id == o.id && estimated_seconds == o.estimated_seconds;
  }
};

struct JobComplete {
  std::string id;
  std::vector<std::string> outputs;

  bool operator==(const JobComplete& o) const {
    return id == o.id && outputs == o.outputs;
  }
};

struct JobError {
  std::string id;
  std::string message;

  bool operator==(const JobError& o) const {
    return id == o.id && message == o.message;
  }
};

struct JobCancelled {
  std::string id;

  bool operator==(const JobCancelled& o) const { return id == o.id; }
};

enum class ModelKind : uint8_t {
  kCheckpoint,
  kLora,
  kVae,
};

const char* ToString(ModelKind kind);

struct ModelInfo {
  std::string name;
  std::string path;
  ModelKind kind = ModelKind::kCheckpoint;
  double size_mb = 0.0;

  bool operator==(const ModelInfo& o) const {
    return name == o.name && path == o.path && kind == o.kind &&
           size_mb == o.size_mb;
  }
};

struct ModelList {
  std::vector<ModelInfo> items;

  bool operator==(const ModelList& o) const { return items == o.items; }
};

struct JobSummary {
  std::string id;
  core::JobStatus status = core::JobStatus::kQueued;
  core::Stage stage = core::Stage::kQueued;
  double progress = 0.0;

  bool operator==(const JobSummary& o) const {
    return id == o.id && status == o.status && stage == o.stage &&
           progress == o.progress;
  }
};

struct StageEstimate {
  core::Stage stage = core::Stage::kPreparing;
  double estimate_seconds = 0.0;
  uint32_t samples = 0;

  bool operator==(const StageEstimate& o) const {
    return stage == o.stage && estimate_seconds == o.estimate_seconds &&
           samples == o.samples;
  }
};

struct StatusInfo {
  uint32_t queued = 0;
  uint32_t running = 0;
  // Completions per minute over the scheduler's rolling window.
  double throughput_per_min = 0.0;
  uint64_t completed = 0;
  uint64_t failed = 0;
  uint64_t cancelled = 0;
  std::string version;
  double uptime_seconds = 0.0;
  // Non-terminal jobs, for subscribers reconciling after a (re)connect.
  std::vector<JobSummary> jobs;
  std::vector<StageEstimate> stage_estimates;

  bool operator==(const StatusInfo& o) const {
    return queued == o.queued && running == o.running &&
           throughput_per_min == o.throughput_per_min &&
           completed == o.completed && failed == o.failed &&
           cancelled == o.cancelled && version == o.version &&
           uptime_seconds == o.uptime_seconds && jobs == o.jobs &&
           stage_estimates == o.stage_estimates;
  }
};

struct Pong {
  int64_t server_time_ms = 0;

  bool operator==(const Pong& o) const {
    return server_time_ms == o.server_time_ms;
  }
};

// Generic failure answer to any request (bad request, internal failure).
struct ErrorResponse {
  std::string message;

  bool operator==(const ErrorResponse& o) const { return message == o.message; }
};

using Response = std::variant<JobAccepted, JobComplete, JobError, JobCancelled,
                              ModelList, StatusInfo, Pong, ErrorResponse>;

// =============================================================================
// Updates (server -> every subscriber). Ordered per job, unordered across jobs.
// =============================================================================

struct JobStarted {
  std::string id;
  int64_t timestamp_ms = 0;

  bool operator==(const JobStarted& o) const {
    return id == o.id && timestamp_ms == o.timestamp_ms;
  }
};

struct Progress {
  std::string id;
  core::Stage stage = core::Stage::kQueued;
  double fraction = 0.0;
  double eta_seconds = 0.0;

  bool operator==(const Progress& o) const {
    return id == o.id && stage == o.stage && fraction == o.fraction &&
           eta_seconds == o.eta_seconds;
  }
};

struct Preview {
  std::string id;
  std::string path;

  bool operator==(const Preview& o) const {
    return id == o.id && path == o.path;
  }
};

struct JobFinished {
  std::string id;
  core::JobStatus status = core::JobStatus::kCompleted;
  double duration_seconds = 0.0;
  std::string error;

  bool operator==(const JobFinished& o) const {
    return id == o.id && status == o.status &&
           duration_seconds == o.duration_seconds && error == o.error;
  }
};

using Update = std::variant<JobStarted, Progress, Preview, JobFinished>;

// Variant name for logs ("Generate", "StatusInfo", "Progress", ...).
const char* VariantName(const Request& request);
const char* VariantName(const Response& response);
const char* VariantName(const Update& update);

// Job id carried by a job-scoped request, empty for Ping/Status/ListModels.
std::string CorrelationIdOf(const Request& request);

// Every update is job-scoped.
const std::string& JobIdOf(const Update& update);

}  // namespace pixelctl::protocol

#endif  // PIXELCTL_PROTOCOL_MESSAGES_HPP_
