// Repository: pixelctl
// Component: Control Service
// Purpose: Answers control requests and turns scheduler events into ordered
//          broadcast updates.
// Copyright (c) 2026 Pixelctl

#ifndef PIXELCTL_SERVER_CONTROL_SERVICE_HPP_
#define PIXELCTL_SERVER_CONTROL_SERVICE_HPP_

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

#include "pixelctl/core/JobTypes.hpp"
#include "pixelctl/models/ModelCatalog.hpp"
#include "pixelctl/progress/ProgressTracker.hpp"
#include "pixelctl/progress/StageHistory.hpp"
#include "pixelctl/protocol/Messages.hpp"
#include "pixelctl/scheduler/Scheduler.hpp"
#include "pixelctl/transport/ControlServer.hpp"
#include "pixelctl/transport/UpdateBroadcaster.hpp"
#include "pixelctl/util/TimeSource.hpp"

namespace pixelctl::server {

inline constexpr char kDaemonVersion[] = "0.1.0";

struct ControlServiceConfig {
  // Stage history file. Empty disables persistence.
  std::string history_path;
};

// ControlService is the daemon's request handler and event fan-out point.
//
// Requests:
//   Generate    -> JobAccepted (new, queued or running), or the terminal answer
//                  of an existing job with the same id
//   Cancel      -> JobCancelled, or JobError for unknown/terminal jobs
//   ListModels  -> ModelList
//   Status      -> StatusInfo
//   Ping        -> Pong
//
// Updates: every tracker step and its Publish() run under one mutex, so a
// job's JobStarted, Progress, Preview and JobFinished reach subscribers in
// causal order and Progress fractions never go backwards on the wire.
class ControlService : public transport::ICommandHandler {
 public:
  ControlService(scheduler::Scheduler& scheduler,
                 progress::ProgressTracker& tracker,
                 progress::StageHistory& history,
                 transport::UpdateBroadcaster& broadcaster,
                 const models::ModelCatalog& catalog,
                 const util::ITimeSource& time,
                 ControlServiceConfig config = ControlServiceConfig{});

  ControlService(const ControlService&) = delete;
  ControlService& operator=(const ControlService&) = delete;

  // Installs the scheduler callbacks. Call before Scheduler::Start().
  void Attach();

  protocol::Response HandleRequest(const protocol::Request& request) override;

  // Time-based progress for running jobs. Call at the emit interval.
  void Tick();

  // Forgets terminal jobs finished more than retention_ms ago.
  size_t Purge(int64_t retention_ms);

  bool SaveHistory(std::string* error) const;

 private:
  protocol::Response HandleGenerate(const protocol::Generate& request);
  protocol::Response HandleCancel(const protocol::Cancel& request);
  protocol::Response HandleListModels();
  protocol::Response HandleStatus();
  protocol::Response HandlePing();

  // Answer for a job that already exists.
  protocol::Response AnswerForExisting(const core::JobRecord& job,
                                       size_t jobs_ahead) const;
  double EstimateSeconds(size_t jobs_ahead) const;

  void OnJobStarted(const core::JobRecord& job);
  void OnStage(const std::string& job_id, core::Stage stage,
               std::optional<double> stage_fraction);
  void OnPreview(const std::string& job_id, const std::string& path);
  void OnJobFinished(const core::JobRecord& job);

  // Caller holds publish_mutex_.
  void PublishProgressLocked(const progress::ProgressSnapshot& snap);

  scheduler::Scheduler& scheduler_;
  progress::ProgressTracker& tracker_;
  progress::StageHistory& history_;
  transport::UpdateBroadcaster& broadcaster_;
  const models::ModelCatalog& catalog_;
  const util::ITimeSource& time_;
  const ControlServiceConfig config_;
  const int64_t started_at_ms_;

  std::mutex publish_mutex_;
  mutable std::mutex history_save_mutex_;
};

}  // namespace pixelctl::server

#endif  // PIXELCTL_SERVER_CONTROL_SERVICE_HPP_
