// Repository: pixelctl
// Component: Daemon Configuration
// Purpose: Command-line and environment settings for pixelctld.
// Copyright (c) 2026 Pixelctl

#ifndef PIXELCTL_SERVER_DAEMON_CONFIG_HPP_
#define PIXELCTL_SERVER_DAEMON_CONFIG_HPP_

#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>

namespace pixelctl::server {

struct DaemonConfig {
  std::string listen_address = "127.0.0.1:5555";
  size_t workers = 1;
  std::string worker_command;
  std::string models_dir;
  std::string history_path;
  int64_t progress_interval_ms = 250;
  int64_t throughput_window_s = 60;
  int64_t retention_s = 3600;
  size_t max_subscriber_queue = 1024;

  bool help = false;
  bool valid = false;
  std::string error;
};

using EnvGetter = std::function<const char*(const char*)>;

// Flags win over environment variables, which win over defaults.
//
//   --listen ADDR                PIXELCTL_LISTEN
//   --workers N
//   --worker-cmd CMD             PIXELCTL_WORKER_CMD (required)
//   --models-dir DIR             PIXELCTL_MODELS_DIR ($HOME/ComfyUI/models)
//   --history FILE               PIXELCTL_HISTORY
//   --progress-interval-ms N
//   --throughput-window-s N
//   --retention-s N
//   --max-subscriber-queue N
DaemonConfig ParseDaemonArgs(int argc, const char* const argv[],
                             const EnvGetter& env);
DaemonConfig ParseDaemonArgs(int argc, const char* const argv[]);

void PrintDaemonUsage(std::ostream& out, const char* program_name);

}  // namespace pixelctl::server

#endif  // PIXELCTL_SERVER_DAEMON_CONFIG_HPP_
