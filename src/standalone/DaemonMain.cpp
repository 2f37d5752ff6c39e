// Repository: pixelctl
// Component: pixelctld
// Purpose: Control daemon entry point: scheduler, worker pool and gRPC
//          endpoint.
// Copyright (c) 2026 Pixelctl

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

#include "pixelctl/executor/ProcessExecutor.hpp"
#include "pixelctl/models/ModelCatalog.hpp"
#include "pixelctl/progress/ProgressTracker.hpp"
#include "pixelctl/progress/StageHistory.hpp"
#include "pixelctl/scheduler/Scheduler.hpp"
#include "pixelctl/server/ControlService.hpp"
#include "pixelctl/server/DaemonConfig.hpp"
#include "pixelctl/transport/ControlServer.hpp"
#include "pixelctl/transport/UpdateBroadcaster.hpp"
#include "pixelctl/util/Logger.hpp"
#include "pixelctl/util/TimeSource.hpp"

namespace {

using pixelctl::util::Logger;

// =============================================================================
// Global state for signal handling
// =============================================================================
std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

// Purge runs far less often than Tick.
constexpr int64_t kPurgeIntervalMs = 30'000;

int Run(const pixelctl::server::DaemonConfig& cfg) {
  pixelctl::util::SystemTimeSource clock;

  pixelctl::progress::StageHistory history;
  if (!cfg.history_path.empty()) {
    std::string error;
    if (!history.Load(cfg.history_path, &error)) {
      Logger::Warn("[pixelctld] HISTORY_LOAD_FAILED path=" + cfg.history_path +
                   " error=\"" + error + "\"");
    }
  }

  pixelctl::progress::ProgressTrackerConfig tracker_cfg;
  tracker_cfg.min_emit_interval_ms = cfg.progress_interval_ms;
  pixelctl::progress::ProgressTracker tracker(history, clock, tracker_cfg);

  pixelctl::executor::ProcessExecutorConfig exec_cfg;
  exec_cfg.command = cfg.worker_command;
  pixelctl::executor::ProcessExecutor executor(exec_cfg);

  pixelctl::scheduler::SchedulerConfig sched_cfg;
  sched_cfg.worker_count = cfg.workers;
  sched_cfg.throughput_window_ms = cfg.throughput_window_s * 1000;
  pixelctl::scheduler::Scheduler scheduler(executor, clock, sched_cfg);

  pixelctl::transport::UpdateBroadcaster broadcaster(cfg.max_subscriber_queue);
  pixelctl::models::ModelCatalog catalog(cfg.models_dir);

  pixelctl::server::ControlServiceConfig service_cfg;
  service_cfg.history_path = cfg.history_path;
  pixelctl::server::ControlService service(scheduler, tracker, history,
                                           broadcaster, catalog, clock,
                                           service_cfg);
  service.Attach();

  pixelctl::transport::ControlServerConfig server_cfg;
  server_cfg.listen_address = cfg.listen_address;
  pixelctl::transport::ControlServer server(service, broadcaster, server_cfg);

  std::string error;
  if (!server.Start(&error)) {
    std::cerr << "Error: " << error << "\n";
    return 1;
  }
  scheduler.Start();

  {
    std::ostringstream oss;
    oss << "[pixelctld] READY version=" << pixelctl::server::kDaemonVersion
        << " address=" << server.bound_address() << " workers=" << cfg.workers
        << " models_dir=" << cfg.models_dir;
    Logger::Info(oss.str());
  }

  int64_t last_purge_ms = clock.NowUtcMs();
  while (!g_termination_requested.load(std::memory_order_acquire)) {
    std::this_thread::sleep_for(std::chrono::milliseconds(cfg.progress_interval_ms));
    service.Tick();
    const int64_t now = clock.NowUtcMs();
    if (now - last_purge_ms >= kPurgeIntervalMs) {
      service.Purge(cfg.retention_s * 1000);
      last_purge_ms = now;
    }
  }

  Logger::Info("[pixelctld] SHUTDOWN_REQUESTED");
  server.Stop();
  scheduler.Stop();

  if (!service.SaveHistory(&error)) {
    Logger::Warn("[pixelctld] HISTORY_SAVE_FAILED path=" + cfg.history_path +
                 " error=\"" + error + "\"");
  }
  Logger::Info("[pixelctld] EXITED");
  return 0;
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
  pixelctl::server::DaemonConfig cfg =
      pixelctl::server::ParseDaemonArgs(argc, argv);

  if (cfg.help) {
    pixelctl::server::PrintDaemonUsage(std::cout, argv[0]);
    return 0;
  }

  if (!cfg.valid) {
    std::cerr << "Error: " << cfg.error << "\n\n";
    pixelctl::server::PrintDaemonUsage(std::cerr, argv[0]);
    return 1;
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  return Run(cfg);
}
