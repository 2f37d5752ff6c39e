// Repository: pixelctl
// Component: Daemon Configuration
// Purpose: Command-line and environment settings for pixelctld.
// Copyright (c) 2026 Pixelctl

#include "pixelctl/server/DaemonConfig.hpp"

#include <cerrno>
#include <cstdlib>

namespace pixelctl::server {

namespace {

// Whole-string base-10 parse with a lower bound.
bool ParseInteger(const std::string& text, int64_t min_value, int64_t* out) {
  if (text.empty()) return false;
  errno = 0;
  char* end = nullptr;
  const long long v = std::strtoll(text.c_str(), &end, 10);
  if (errno != 0 || end == nullptr || *end != '\0' || v < min_value) return false;
  *out = static_cast<int64_t>(v);
  return true;
}

}  // namespace

DaemonConfig ParseDaemonArgs(int argc, const char* const argv[],
                             const EnvGetter& env) {
  DaemonConfig cfg;

  if (const char* v = env("PIXELCTL_LISTEN")) cfg.listen_address = v;
  if (const char* v = env("PIXELCTL_WORKER_CMD")) cfg.worker_command = v;
  if (const char* v = env("PIXELCTL_HISTORY")) cfg.history_path = v;
  if (const char* v = env("PIXELCTL_MODELS_DIR")) {
    cfg.models_dir = v;
  } else if (const char* home = env("HOME")) {
    cfg.models_dir = std::string(home) + "/ComfyUI/models";
  } else {
    cfg.models_dir = "ComfyUI/models";
  }

  auto integer_flag = [&](const std::string& flag, const char* value,
                          int64_t min_value, int64_t* out) {
    if (!ParseInteger(value, min_value, out)) {
      cfg.error = flag + " expects an integer >= " + std::to_string(min_value) +
                  ", got \"" + value + "\"";
      return false;
    }
    return true;
  };

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    const bool has_value = i + 1 < argc;
    int64_t n = 0;

    if (arg == "--help" || arg == "-h") {
      cfg.help = true;
      cfg.valid = true;
      return cfg;
    } else if (arg == "--listen" && has_value) {
      cfg.listen_address = argv[++i];
    } else if (arg == "--workers" && has_value) {
      if (!integer_flag(arg, argv[++i], 1, &n)) return cfg;
      cfg.workers = static_cast<size_t>(n);
    } else if (arg == "--worker-cmd" && has_value) {
      cfg.worker_command = argv[++i];
    } else if (arg == "--models-dir" && has_value) {
      cfg.models_dir = argv[++i];
    } else if (arg == "--history" && has_value) {
      cfg.history_path = argv[++i];
    } else if (arg == "--progress-interval-ms" && has_value) {
      if (!integer_flag(arg, argv[++i], 1, &cfg.progress_interval_ms)) return cfg;
    } else if (arg == "--throughput-window-s" && has_value) {
      if (!integer_flag(arg, argv[++i], 1, &cfg.throughput_window_s)) return cfg;
    } else if (arg == "--retention-s" && has_value) {
      if (!integer_flag(arg, argv[++i], 0, &cfg.retention_s)) return cfg;
    } else if (arg == "--max-subscriber-queue" && has_value) {
      if (!integer_flag(arg, argv[++i], 1, &n)) return cfg;
      cfg.max_subscriber_queue = static_cast<size_t>(n);
    } else {
      cfg.error = "Unknown or incomplete argument: " + arg;
      return cfg;
    }
  }

  if (cfg.worker_command.empty()) {
    cfg.error = "--worker-cmd (or PIXELCTL_WORKER_CMD) is required";
    return cfg;
  }

  cfg.valid = true;
  return cfg;
}

DaemonConfig ParseDaemonArgs(int argc, const char* const argv[]) {
  return ParseDaemonArgs(argc, argv,
                         [](const char* name) -> const char* { return std::getenv(name); });
}

void PrintDaemonUsage(std::ostream& out, const char* program_name) {
  out << "Usage: " << program_name << " --worker-cmd CMD [OPTIONS]\n"
      << "\n"
      << "Image generation control daemon.\n"
      << "\n"
      << "OPTIONS:\n"
      << "  --listen ADDR               host:port to serve on (default: 127.0.0.1:5555)\n"
      << "  --workers N                 Jobs run concurrently (default: 1)\n"
      << "  --worker-cmd CMD            Worker command, run via /bin/sh -c per job\n"
      << "  --models-dir DIR            Model root (default: $HOME/ComfyUI/models)\n"
      << "  --history FILE              Stage timing history (JSON lines)\n"
      << "  --progress-interval-ms N    Progress update spacing (default: 250)\n"
      << "  --throughput-window-s N     Throughput window (default: 60)\n"
      << "  --retention-s N             Keep finished jobs this long (default: 3600)\n"
      << "  --max-subscriber-queue N    Updates buffered per subscriber (default: 1024)\n"
      << "  --help                      Show this help message\n"
      << "\n"
      << "ENVIRONMENT:\n"
      << "  PIXELCTL_LISTEN, PIXELCTL_WORKER_CMD, PIXELCTL_MODELS_DIR,\n"
      << "  PIXELCTL_HISTORY, PIXELCTL_DEBUG\n"
      << "\n"
      << "WORKER PROTOCOL (stdout, one per line):\n"
      << "  stage <Preparing|Executing|Postprocessing|Saving> [fraction]\n"
      << "  preview <path>\n"
      << "  output <path>\n"
      << "  error <message>\n"
      << "  cancelled\n"
      << "The worker reads the payload from $PIXELCTL_PAYLOAD_FILE and receives\n"
      << "\"cancel\" on stdin when the job is cancelled.\n";
}

}  // namespace pixelctl::server
