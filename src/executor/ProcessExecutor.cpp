// Repository: pixelctl
// Component: Process Executor
// Purpose: Runs one external worker process per job and translates its line
//          protocol into stage, preview and outcome signals.
// Copyright (c) 2026 Pixelctl

#include "pixelctl/executor/ProcessExecutor.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <vector>

#include "pixelctl/util/Logger.hpp"

extern char** environ;

namespace pixelctl::executor {

using pixelctl::util::Logger;

namespace {

constexpr char kJobIdEnv[] = "PIXELCTL_JOB_ID";
constexpr char kPayloadFileEnv[] = "PIXELCTL_PAYLOAD_FILE";
constexpr char kPayloadSchemaEnv[] = "PIXELCTL_PAYLOAD_SCHEMA";

std::string Trim(const std::string& s) {
  const size_t b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return std::string();
  const size_t e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

bool HasEnvName(const char* entry, const char* name) {
  const size_t n = std::strlen(name);
  return std::strncmp(entry, name, n) == 0 && entry[n] == '=';
}

// Closes fds owned by one Execute() call.
class FdCloser {
 public:
  explicit FdCloser(int fd = -1) : fd_(fd) {}
  ~FdCloser() { Reset(); }
  FdCloser(const FdCloser&) = delete;
  FdCloser& operator=(const FdCloser&) = delete;

  int get() const { return fd_; }
  void Reset() {
    if (fd_ >= 0) ::close(fd_);
    fd_ = -1;
  }

 private:
  int fd_;
};

bool WriteAll(int fd, const char* data, size_t len) {
  while (len > 0) {
    const ssize_t n = ::write(fd, data, len);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    data += n;
    len -= static_cast<size_t>(n);
  }
  return true;
}

}  // namespace

WorkerLine ParseWorkerLine(const std::string& raw) {
  WorkerLine out;
  const std::string line = Trim(raw);
  const size_t space = line.find(' ');
  const std::string verb = line.substr(0, space);
  const std::string rest =
      space == std::string::npos ? std::string() : Trim(line.substr(space + 1));

  if (verb == "stage") {
    std::istringstream iss(rest);
    std::string name;
    iss >> name;
    core::Stage stage;
    if (name.empty() || !core::ParseStage(name, &stage)) return out;
    out.kind = WorkerLine::Kind::kStage;
    out.stage = stage;
    double fraction;
    if (iss >> fraction && std::isfinite(fraction)) out.fraction = fraction;
  } else if (verb == "preview" && !rest.empty()) {
    out.kind = WorkerLine::Kind::kPreview;
    out.text = rest;
  } else if (verb == "output" && !rest.empty()) {
    out.kind = WorkerLine::Kind::kOutput;
    out.text = rest;
  } else if (verb == "error") {
    out.kind = WorkerLine::Kind::kError;
    out.text = rest.empty() ? "worker reported an error" : rest;
  } else if (verb == "cancelled") {
    out.kind = WorkerLine::Kind::kCancelled;
  } else {
    out.text = line;
  }
  return out;
}

ProcessExecutor::ProcessExecutor(ProcessExecutorConfig config)
    : config_(std::move(config)) {
  // A worker that exits before reading "cancel" must not kill the daemon.
  ::signal(SIGPIPE, SIG_IGN);
}

bool ProcessExecutor::WritePayloadFile(const std::string& job_id,
                                       const core::JobPayload& payload,
                                       std::string* path,
                                       std::string* error) const {
  std::string tmpl = config_.temp_dir + "/pixelctl-payload-XXXXXX";
  std::vector<char> buf(tmpl.begin(), tmpl.end());
  buf.push_back('\0');
  FdCloser fd(::mkstemp(buf.data()));
  if (fd.get() < 0) {
    *error = "cannot create payload file in " + config_.temp_dir + ": " +
             std::strerror(errno);
    return false;
  }
  *path = buf.data();
  if (!WriteAll(fd.get(), payload.bytes.data(), payload.bytes.size())) {
    *error = "cannot write payload file for " + job_id + ": " + std::strerror(errno);
    ::unlink(path->c_str());
    return false;
  }
  return true;
}

scheduler::ExecutionOutcome ProcessExecutor::Execute(
    const std::string& job_id, const core::JobPayload& payload,
    scheduler::IExecutionSink& sink,
    const scheduler::CancellationToken& cancel) {
  if (cancel.IsCancellationRequested()) {
    return scheduler::ExecutionOutcome::Cancelled();
  }

  std::string payload_path;
  std::string error;
  if (!WritePayloadFile(job_id, payload, &payload_path, &error)) {
    Logger::Error("[ProcessExecutor] PAYLOAD_WRITE_FAILED job_id=" + job_id +
                  " error=\"" + error + "\"");
    return scheduler::ExecutionOutcome::Failed(error);
  }

  // Everything the child needs is built before fork(); the child only calls
  // async-signal-safe functions.
  std::vector<std::string> env_list;
  for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
    if (HasEnvName(*e, kJobIdEnv) || HasEnvName(*e, kPayloadFileEnv) ||
        HasEnvName(*e, kPayloadSchemaEnv)) {
      continue;
    }
    env_list.emplace_back(*e);
  }
  env_list.push_back(std::string(kJobIdEnv) + "=" + job_id);
  env_list.push_back(std::string(kPayloadFileEnv) + "=" + payload_path);
  env_list.push_back(std::string(kPayloadSchemaEnv) + "=" +
                     std::to_string(payload.schema_version));
  std::vector<char*> envp;
  envp.reserve(env_list.size() + 1);
  for (auto& entry : env_list) envp.push_back(entry.data());
  envp.push_back(nullptr);

  std::string sh = "/bin/sh";
  std::string dash_c = "-c";
  std::string command = config_.command;
  char* argv[] = {sh.data(), dash_c.data(), command.data(), nullptr};

  int stdin_pipe[2];
  int stdout_pipe[2];
  if (::pipe2(stdin_pipe, O_CLOEXEC) != 0) {
    ::unlink(payload_path.c_str());
    return scheduler::ExecutionOutcome::Failed(std::string("pipe failed: ") +
                                               std::strerror(errno));
  }
  if (::pipe2(stdout_pipe, O_CLOEXEC) != 0) {
    ::close(stdin_pipe[0]);
    ::close(stdin_pipe[1]);
    ::unlink(payload_path.c_str());
    return scheduler::ExecutionOutcome::Failed(std::string("pipe failed: ") +
                                               std::strerror(errno));
  }

  const pid_t pid = ::fork();
  if (pid < 0) {
    const std::string reason = std::string("fork failed: ") + std::strerror(errno);
    for (int fd : {stdin_pipe[0], stdin_pipe[1], stdout_pipe[0], stdout_pipe[1]}) {
      ::close(fd);
    }
    ::unlink(payload_path.c_str());
    Logger::Error("[ProcessExecutor] SPAWN_FAILED job_id=" + job_id + " " + reason);
    return scheduler::ExecutionOutcome::Failed(reason);
  }

  if (pid == 0) {
    // Own process group, so a kill reaches whatever the shell spawned.
    ::setpgid(0, 0);
    ::dup2(stdin_pipe[0], STDIN_FILENO);
    ::dup2(stdout_pipe[1], STDOUT_FILENO);
    ::signal(SIGPIPE, SIG_DFL);
    ::execve(argv[0], argv, envp.data());
    ::_exit(127);
  }

  // Also set from the parent: a cancel may arrive before the child runs.
  // EACCES here means the child already called exec after its own setpgid.
  if (::setpgid(pid, pid) != 0 && errno != EACCES) {
    Logger::Debug("[ProcessExecutor] SETPGID_FAILED job_id=" + job_id + " errno=" +
                  std::to_string(errno));
  }

  ::close(stdin_pipe[0]);
  ::close(stdout_pipe[1]);
  FdCloser to_child(stdin_pipe[1]);
  FdCloser from_child(stdout_pipe[0]);

  {
    std::ostringstream oss;
    oss << "[ProcessExecutor] WORKER_STARTED job_id=" << job_id << " pid=" << pid;
    Logger::Info(oss.str());
  }

  std::vector<std::string> outputs;
  std::optional<std::string> reported_error;
  bool reported_cancelled = false;

  auto handle_line = [&](const std::string& line) {
    const WorkerLine parsed = ParseWorkerLine(line);
    switch (parsed.kind) {
      case WorkerLine::Kind::kStage:
        sink.OnStage(parsed.stage, parsed.fraction);
        break;
      case WorkerLine::Kind::kPreview:
        sink.OnPreview(parsed.text);
        break;
      case WorkerLine::Kind::kOutput:
        outputs.push_back(parsed.text);
        break;
      case WorkerLine::Kind::kError:
        reported_error = parsed.text;
        break;
      case WorkerLine::Kind::kCancelled:
        reported_cancelled = true;
        break;
      case WorkerLine::Kind::kUnknown:
        if (!parsed.text.empty()) {
          Logger::Debug("[ProcessExecutor] WORKER_OUTPUT job_id=" + job_id +
                        " line=\"" + parsed.text + "\"");
        }
        break;
    }
  };

  using Clock = std::chrono::steady_clock;
  bool cancel_sent = false;
  bool killed = false;
  Clock::time_point kill_deadline;
  std::string pending;
  char buf[4096];

  for (;;) {
    if (!cancel_sent && cancel.IsCancellationRequested()) {
      cancel_sent = true;
      kill_deadline = Clock::now() + std::chrono::milliseconds(config_.cancel_grace_ms);
      static const char kCancel[] = "cancel\n";
      if (!WriteAll(to_child.get(), kCancel, sizeof(kCancel) - 1)) {
        Logger::Debug("[ProcessExecutor] CANCEL_WRITE_FAILED job_id=" + job_id);
      }
      Logger::Info("[ProcessExecutor] CANCEL_SENT job_id=" + job_id);
    }
    if (cancel_sent && !killed && Clock::now() >= kill_deadline) {
      ::kill(-pid, SIGKILL);
      killed = true;
      Logger::Warn("[ProcessExecutor] WORKER_KILLED job_id=" + job_id +
                   " reason=cancel_grace_expired");
    }
    // A descendant that left the group can still hold stdout open.
    if (killed && Clock::now() >= kill_deadline + std::chrono::milliseconds(
                                                      config_.cancel_grace_ms)) {
      Logger::Warn("[ProcessExecutor] WORKER_PIPE_HELD job_id=" + job_id +
                   " reason=descendant_outlived_kill");
      break;
    }

    pollfd pfd{};
    pfd.fd = from_child.get();
    pfd.events = POLLIN;
    const int rc = ::poll(&pfd, 1, config_.poll_interval_ms);
    if (rc < 0) {
      if (errno == EINTR) continue;
      Logger::Error("[ProcessExecutor] POLL_FAILED job_id=" + job_id);
      ::kill(-pid, SIGKILL);
      break;
    }
    if (rc == 0) continue;

    const ssize_t n = ::read(from_child.get(), buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) continue;
      break;
    }
    if (n == 0) break;
    pending.append(buf, static_cast<size_t>(n));
    size_t nl;
    while ((nl = pending.find('\n')) != std::string::npos) {
      handle_line(pending.substr(0, nl));
      pending.erase(0, nl + 1);
    }
  }
  if (!pending.empty()) handle_line(pending);

  from_child.Reset();
  to_child.Reset();

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      status = -1;
      break;
    }
  }
  ::unlink(payload_path.c_str());

  int exit_code = -1;
  if (status >= 0 && WIFEXITED(status)) exit_code = WEXITSTATUS(status);

  std::ostringstream oss;
  oss << "[ProcessExecutor] WORKER_EXITED job_id=" << job_id << " pid=" << pid
      << " exit_code=" << exit_code;
  if (status >= 0 && WIFSIGNALED(status)) oss << " signal=" << WTERMSIG(status);
  Logger::Info(oss.str());

  if (cancel_sent || reported_cancelled) {
    return scheduler::ExecutionOutcome::Cancelled();
  }
  if (reported_error) {
    return scheduler::ExecutionOutcome::Failed(*reported_error);
  }
  if (exit_code != 0) {
    std::ostringstream reason;
    if (status >= 0 && WIFSIGNALED(status)) {
      reason << "worker terminated by signal " << WTERMSIG(status);
    } else {
      reason << "worker exited with status " << exit_code;
    }
    return scheduler::ExecutionOutcome::Failed(reason.str());
  }
  return scheduler::ExecutionOutcome::Completed(std::move(outputs));
}

}  // namespace pixelctl::executor
