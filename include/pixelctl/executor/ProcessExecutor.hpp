// Repository: pixelctl
// Component: Process Executor
// Purpose: Runs one external worker process per job and translates its line
//          protocol into stage, preview and outcome signals.
// Copyright (c) 2026 Pixelctl

#ifndef PIXELCTL_EXECUTOR_PROCESS_EXECUTOR_HPP_
#define PIXELCTL_EXECUTOR_PROCESS_EXECUTOR_HPP_

#include <cstdint>
#include <optional>
#include <string>

#include "pixelctl/core/JobTypes.hpp"
#include "pixelctl/scheduler/IJobExecutor.hpp"

namespace pixelctl::executor {

struct ProcessExecutorConfig {
  // Run through /bin/sh -c.
  std::string command;
  // Where payload files are written.
  std::string temp_dir = "/tmp";
  // How often the cancellation token is checked while the worker is quiet.
  int poll_interval_ms = 100;
  // After "cancel" is sent, how long the worker gets before SIGKILL.
  int cancel_grace_ms = 5000;
};

// One parsed line of worker stdout.
//
//   stage <name> [fraction]
//   preview <path>
//   output <path>
//   error <message>
//   cancelled
struct WorkerLine {
  enum class Kind { kStage, kPreview, kOutput, kError, kCancelled, kUnknown };

  Kind kind = Kind::kUnknown;
  core::Stage stage = core::Stage::kQueued;
  std::optional<double> fraction;
  std::string text;
};

WorkerLine ParseWorkerLine(const std::string& line);

// ProcessExecutor forks "/bin/sh -c <command>" for every job. The child gets
//
//   PIXELCTL_JOB_ID               job id
//   PIXELCTL_PAYLOAD_FILE         file holding the opaque payload bytes
//   PIXELCTL_PAYLOAD_SCHEMA       payload schema version
//
// and reports on stdout, one command per line (see WorkerLine). stderr is
// inherited. Cancellation writes "cancel\n" to the child's stdin; a child
// that ignores it is killed, with its whole process group, after
// cancel_grace_ms.
//
// Outcome: a cancel request or a "cancelled" line gives Cancelled; an
// "error" line or a non-zero exit gives Failed; otherwise Completed with the
// "output" paths.
class ProcessExecutor : public scheduler::IJobExecutor {
 public:
  explicit ProcessExecutor(ProcessExecutorConfig config);

  scheduler::ExecutionOutcome Execute(
      const std::string& job_id, const core::JobPayload& payload,
      scheduler::IExecutionSink& sink,
      const scheduler::CancellationToken& cancel) override;

  const ProcessExecutorConfig& config() const { return config_; }

 private:
  bool WritePayloadFile(const std::string& job_id,
                        const core::JobPayload& payload, std::string* path,
                        std::string* error) const;

  const ProcessExecutorConfig config_;
};

}  // namespace pixelctl::executor

#endif  // PIXELCTL_EXECUTOR_PROCESS_EXECUTOR_HPP_
