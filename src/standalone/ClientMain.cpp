// Repository: pixelctl
// Component: pixelctl
// Purpose: Terminal client: submit, cancel and watch jobs, list models, show
//          previews inline.
// Copyright (c) 2026 Pixelctl
//
// COMMANDS:
//   ping | status | models | generate [--wait] | cancel ID | watch | preview PATH

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <random>
#include <sstream>
#include <string>
#include <thread>
#include <type_traits>
#include <variant>
#include <vector>

#include "pixelctl/v1/control.pb.h"
#include "pixelctl/core/JobTypes.hpp"
#include "pixelctl/preview/FfmpegImageRenderer.hpp"
#include "pixelctl/preview/PreviewService.hpp"
#include "pixelctl/preview/TerminalEncoder.hpp"
#include "pixelctl/progress/JobUpdateValidator.hpp"
#include "pixelctl/protocol/MessageCodec.hpp"
#include "pixelctl/protocol/Messages.hpp"
#include "pixelctl/transport/ControlClient.hpp"
#include "pixelctl/transport/Heartbeat.hpp"
#include "pixelctl/transport/UpdateSubscriber.hpp"
#include "pixelctl/util/Logger.hpp"
#include "pixelctl/util/TimeSource.hpp"

namespace {

using pixelctl::util::Logger;
namespace protocol = pixelctl::protocol;
namespace preview = pixelctl::preview;
namespace transport = pixelctl::transport;

template <class>
inline constexpr bool kAlwaysFalse = false;

// =============================================================================
// Global state for signal handling
// =============================================================================
std::atomic<bool> g_interrupted{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_interrupted.store(true, std::memory_order_release);
  }
}

// Exit codes for generate --wait.
constexpr int kExitFailed = 2;
constexpr int kExitCancelled = 3;
constexpr int kExitTransport = 4;
constexpr int kExitInterrupted = 130;

// A waiting client Pings this often and gives the server up after this many
// unanswered Pings in a row.
constexpr int64_t kHeartbeatIntervalMs = 5000;
constexpr int kHeartbeatMisses = 2;
constexpr std::chrono::milliseconds kHeartbeatTimeout{2000};

// =============================================================================
// CLI Arguments
// =============================================================================
struct ClientConfig {
  std::string server = transport::kDefaultAddress;
  int64_t timeout_ms = 5000;
  size_t cache_mb = 50;

  std::string command;
  std::vector<std::string> positional;

  // generate
  pixelctl::v1::GenerationParams params;
  pixelctl::core::JobPriority priority = pixelctl::core::JobPriority::kNormal;
  std::string job_id;
  bool wait = false;
  bool show_previews = false;

  // preview
  preview::RenderOptions render;

  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [GLOBAL OPTIONS] COMMAND [ARGS]\n"
            << "\n"
            << "Client for the pixelctld image generation daemon.\n"
            << "\n"
            << "GLOBAL OPTIONS:\n"
            << "  --server ADDR        Daemon address (default: $PIXELCTL_SERVER or "
            << transport::kDefaultAddress << ")\n"
            << "  --timeout-ms N       Per-request timeout (default: 5000)\n"
            << "  --cache-mb N         Preview cache budget (default: 50)\n"
            << "  --help               Show this help message\n"
            << "\n"
            << "COMMANDS:\n"
            << "  ping                 Round-trip check\n"
            << "  status               Queue, throughput and stage estimates\n"
            << "  models               List checkpoints, LoRAs and VAEs\n"
            << "  generate             Submit a job\n"
            << "      --prompt TEXT  --negative TEXT  --model NAME\n"
            << "      --width N  --height N  --steps N  --cfg X\n"
            << "      --lora NAME  --lora-strength X  --batch N  --seed N\n"
            << "      --priority urgent|high|normal|low  --id ID\n"
            << "      --wait           Follow the job until it finishes\n"
            << "      --show-previews  With --wait, draw previews inline\n"
            << "  cancel ID            Cancel a queued or running job\n"
            << "  watch                Print every update; reconnects on loss\n"
            << "  preview PATH         Draw an image in the terminal\n"
            << "      --cols N  --rows N  --stretch  --fast\n"
            << "      --protocol kitty|sixel|blocks|none\n"
            << "\n"
            << "ENVIRONMENT:\n"
            << "  PIXELCTL_SERVER, PIXELCTL_IMAGE_PROTOCOL, PIXELCTL_DEBUG\n"
            << "\n"
            << "EXAMPLES:\n"
            << "  " << program_name << " generate --prompt \"pixel knight\" --steps 20 --wait\n"
            << "  " << program_name << " preview out/knight.png --cols 32 --rows 16\n"
            << "\n";
}

bool ParseNumber(const std::string& text, double* out) {
  char* end = nullptr;
  *out = std::strtod(text.c_str(), &end);
  return !text.empty() && end != nullptr && *end == '\0';
}

bool ParseCount(const std::string& text, int64_t* out) {
  char* end = nullptr;
  const long long v = std::strtoll(text.c_str(), &end, 10);
  if (text.empty() || end == nullptr || *end != '\0') return false;
  *out = static_cast<int64_t>(v);
  return true;
}

ClientConfig ParseArgs(int argc, char* argv[]) {
  ClientConfig cfg;
  if (const char* v = std::getenv("PIXELCTL_SERVER")) cfg.server = v;
  cfg.render.protocol = preview::DetectTerminalProtocol();
  cfg.params.set_width(1024);
  cfg.params.set_height(1024);
  cfg.params.set_steps(30);
  cfg.params.set_cfg_scale(7.0);
  cfg.params.set_lora_strength(1.0);
  cfg.params.set_batch_size(1);
  cfg.params.set_seed(-1);

  auto bad = [&cfg](const std::string& flag, const std::string& value) {
    cfg.error = "Invalid value for " + flag + ": \"" + value + "\"";
    return cfg;
  };

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    const bool has_value = i + 1 < argc;
    int64_t n = 0;
    double x = 0.0;

    if (arg == "--help" || arg == "-h") {
      cfg.help = true;
      cfg.valid = true;
      return cfg;
    } else if (arg == "--server" && has_value) {
      cfg.server = argv[++i];
    } else if (arg == "--timeout-ms" && has_value) {
      const std::string v = argv[++i];
      if (!ParseCount(v, &n) || n <= 0) return bad(arg, v);
      cfg.timeout_ms = n;
    } else if (arg == "--cache-mb" && has_value) {
      const std::string v = argv[++i];
      if (!ParseCount(v, &n) || n <= 0) return bad(arg, v);
      cfg.cache_mb = static_cast<size_t>(n);
    } else if (arg == "--prompt" && has_value) {
      cfg.params.set_prompt(argv[++i]);
    } else if (arg == "--negative" && has_value) {
      cfg.params.set_negative_prompt(argv[++i]);
    } else if (arg == "--model" && has_value) {
      cfg.params.set_model(argv[++i]);
    } else if ((arg == "--width" || arg == "--height" || arg == "--steps" ||
                arg == "--batch") && has_value) {
      const std::string v = argv[++i];
      if (!ParseCount(v, &n) || n <= 0) return bad(arg, v);
      if (arg == "--width") cfg.params.set_width(static_cast<uint32_t>(n));
      if (arg == "--height") cfg.params.set_height(static_cast<uint32_t>(n));
      if (arg == "--steps") cfg.params.set_steps(static_cast<uint32_t>(n));
      if (arg == "--batch") cfg.params.set_batch_size(static_cast<uint32_t>(n));
    } else if (arg == "--seed" && has_value) {
      const std::string v = argv[++i];
      if (!ParseCount(v, &n)) return bad(arg, v);
      cfg.params.set_seed(n);
    } else if (arg == "--cfg" && has_value) {
      const std::string v = argv[++i];
      if (!ParseNumber(v, &x)) return bad(arg, v);
      cfg.params.set_cfg_scale(x);
    } else if (arg == "--lora" && has_value) {
      cfg.params.set_lora(argv[++i]);
    } else if (arg == "--lora-strength" && has_value) {
      const std::string v = argv[++i];
      if (!ParseNumber(v, &x)) return bad(arg, v);
      cfg.params.set_lora_strength(x);
    } else if (arg == "--priority" && has_value) {
      const std::string v = argv[++i];
      if (!pixelctl::core::ParseJobPriority(v, &cfg.priority)) return bad(arg, v);
    } else if (arg == "--id" && has_value) {
      cfg.job_id = argv[++i];
    } else if (arg == "--wait") {
      cfg.wait = true;
    } else if (arg == "--show-previews") {
      cfg.show_previews = true;
    } else if ((arg == "--cols" || arg == "--rows") && has_value) {
      const std::string v = argv[++i];
      if (!ParseCount(v, &n) || n <= 0) return bad(arg, v);
      if (arg == "--cols") cfg.render.width_cells = static_cast<uint32_t>(n);
      if (arg == "--rows") cfg.render.height_cells = static_cast<uint32_t>(n);
    } else if (arg == "--stretch") {
      cfg.render.preserve_aspect = false;
    } else if (arg == "--fast") {
      cfg.render.high_quality = false;
    } else if (arg == "--protocol" && has_value) {
      const std::string v = argv[++i];
      if (!preview::ParseTerminalProtocol(v, &cfg.render.protocol)) return bad(arg, v);
    } else if (!arg.empty() && arg[0] == '-') {
      cfg.error = "Unknown or incomplete argument: " + arg;
      return cfg;
    } else if (cfg.command.empty()) {
      cfg.command = arg;
    } else {
      cfg.positional.push_back(arg);
    }
  }

  if (cfg.command.empty()) {
    cfg.error = "No command given";
    return cfg;
  }
  if ((cfg.command == "cancel" || cfg.command == "preview") &&
      cfg.positional.size() != 1) {
    cfg.error = cfg.command + " takes exactly one argument";
    return cfg;
  }
  if (cfg.command == "generate" && cfg.params.prompt().empty()) {
    cfg.error = "generate requires --prompt";
    return cfg;
  }

  cfg.valid = true;
  return cfg;
}

// =============================================================================
// Output helpers
// =============================================================================

std::string NewJobId() {
  std::random_device rd;
  std::ostringstream oss;
  oss << "cli-" << std::hex << std::setfill('0') << std::setw(8) << rd()
      << std::setw(8) << rd();
  return oss.str();
}

int ReportTransportFailure(const transport::CallResult& result) {
  std::cerr << "Error: " << transport::ToString(result.error) << ": "
            << result.detail << "\n";
  if (result.error == transport::TransportError::kTimeout) {
    std::cerr << "The request may still have been applied; check with 'status'.\n";
  }
  return kExitTransport;
}

// Prints any response variant. Returns the process exit code it implies.
int PrintResponse(const protocol::Response& response) {
  return std::visit(
      [](const auto& r) -> int {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, protocol::JobAccepted>) {
          std::cout << "accepted " << r.id << " (estimated "
                    << std::fixed << std::setprecision(1) << r.estimated_seconds
                    << "s)\n";
          return 0;
        } else if constexpr (std::is_same_v<T, protocol::JobComplete>) {
          std::cout << "completed " << r.id << "\n";
          for (const auto& path : r.outputs) std::cout << "  " << path << "\n";
          return 0;
        } else if constexpr (std::is_same_v<T, protocol::JobError>) {
          std::cout << "error " << r.id << ": " << r.message << "\n";
          return kExitFailed;
        } else if constexpr (std::is_same_v<T, protocol::JobCancelled>) {
          std::cout << "cancelled " << r.id << "\n";
          return 0;
        } else if constexpr (std::is_same_v<T, protocol::ModelList>) {
          if (r.items.empty()) std::cout << "no models found\n";
          for (const auto& m : r.items) {
            std::cout << std::left << std::setw(11) << protocol::ToString(m.kind)
                      << std::setw(48) << m.name << std::right << std::fixed
                      << std::setprecision(1) << std::setw(10) << m.size_mb
                      << " MB\n";
          }
          return 0;
        } else if constexpr (std::is_same_v<T, protocol::StatusInfo>) {
          std::cout << "pixelctld " << r.version << " up "
                    << static_cast<int64_t>(r.uptime_seconds) << "s\n"
                    << "queued " << r.queued << "  running " << r.running
                    << "  completed " << r.completed << "  failed " << r.failed
                    << "  cancelled " << r.cancelled << "\n"
                    << "throughput " << std::fixed << std::setprecision(2)
                    << r.throughput_per_min << " jobs/min\n";
          for (const auto& j : r.jobs) {
            std::cout << "  " << j.id << "  " << pixelctl::core::ToString(j.status)
                      << "  " << pixelctl::core::ToString(j.stage) << "  "
                      << std::setprecision(1) << j.progress * 100.0 << "%\n";
          }
          std::cout << "stage estimates:\n";
          for (const auto& e : r.stage_estimates) {
            std::cout << "  " << std::left << std::setw(15)
                      << pixelctl::core::ToString(e.stage) << std::right
                      << std::setprecision(2) << e.estimate_seconds << "s  ("
                      << e.samples << " samples)\n";
          }
          return 0;
        } else if constexpr (std::is_same_v<T, protocol::Pong>) {
          std::cout << "pong server_time_ms=" << r.server_time_ms << "\n";
          return 0;
        } else if constexpr (std::is_same_v<T, protocol::ErrorResponse>) {
          std::cout << "server error: " << r.message << "\n";
          return kExitFailed;
        } else {
          static_assert(kAlwaysFalse<T>, "unhandled response variant");
        }
      },
      response);
}

void PrintUpdate(const protocol::Update& update) {
  std::visit(
      [](const auto& u) {
        using T = std::decay_t<decltype(u)>;
        if constexpr (std::is_same_v<T, protocol::JobStarted>) {
          std::cout << u.id << " started\n";
        } else if constexpr (std::is_same_v<T, protocol::Progress>) {
          std::cout << u.id << " " << pixelctl::core::ToString(u.stage) << " "
                    << std::fixed << std::setprecision(1) << u.fraction * 100.0
                    << "% eta " << std::setprecision(0) << u.eta_seconds << "s\n";
        } else if constexpr (std::is_same_v<T, protocol::Preview>) {
          std::cout << u.id << " preview " << u.path << "\n";
        } else if constexpr (std::is_same_v<T, protocol::JobFinished>) {
          std::cout << u.id << " " << pixelctl::core::ToString(u.status) << " after "
                    << std::fixed << std::setprecision(1) << u.duration_seconds << "s";
          if (!u.error.empty()) std::cout << ": " << u.error;
          std::cout << "\n";
        } else {
          static_assert(kAlwaysFalse<T>, "unhandled update variant");
        }
      },
      update);
  std::cout.flush();
}

// Seeds the validator from a Status answer after (re)connecting.
bool Reconcile(transport::ControlClient& client, std::chrono::milliseconds timeout,
               pixelctl::progress::JobUpdateValidator& validator) {
  transport::CallResult status = client.Call(protocol::StatusRequest{}, timeout);
  if (!status.ok()) return false;
  const auto* info = std::get_if<protocol::StatusInfo>(&status.response);
  if (info == nullptr) return false;
  for (const auto& job : info->jobs) {
    validator.Adopt(job.id, job.status, job.stage, job.progress);
  }
  return true;
}

// Pings when the heartbeat is due. True once the server has stopped answering;
// the command channel is redialled and the caller restarts its stream.
bool ServerLost(transport::Heartbeat& heartbeat, transport::ControlClient& client) {
  if (!heartbeat.Due()) return false;
  heartbeat.Record(client.Ping(kHeartbeatTimeout).ok());
  if (!heartbeat.Lost()) return false;
  heartbeat.Reset();
  std::cerr << "server not answering, reconnecting\n";
  client.Reconnect();
  return true;
}

// Draws every preview result already delivered.
void DrainPreviews(preview::PreviewService& previews) {
  while (auto result = previews.TryRecv()) {
    if (result->success && result->bytes) {
      std::cout << *result->bytes << std::flush;
    } else {
      std::cerr << "preview failed: " << result->error << "\n";
    }
  }
}

void ShowPreview(preview::PreviewService& previews, const std::string& path,
                 const preview::RenderOptions& options) {
  preview::PreviewTicket ticket = previews.Request(path, options);
  if (ticket.status == preview::PreviewStatus::kHit && ticket.bytes) {
    std::cout << *ticket.bytes << std::flush;
  } else if (ticket.status == preview::PreviewStatus::kUnavailable) {
    Logger::Debug("[pixelctl] PREVIEW_UNAVAILABLE path=" + path + " error=\"" +
                  ticket.error + "\"");
  }
}

// =============================================================================
// Commands
// =============================================================================

int RunPing(transport::ControlClient& client, std::chrono::milliseconds timeout) {
  const auto start = std::chrono::steady_clock::now();
  transport::CallResult result = client.Ping(timeout);
  if (!result.ok()) return ReportTransportFailure(result);
  const auto rtt = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
  const int rc = PrintResponse(result.response);
  std::cout << "rtt_ms=" << rtt.count() << "\n";
  return rc;
}

int RunSimple(transport::ControlClient& client, const protocol::Request& request,
              std::chrono::milliseconds timeout) {
  transport::CallResult result = client.Call(request, timeout);
  if (!result.ok()) return ReportTransportFailure(result);
  return PrintResponse(result.response);
}

int RunGenerate(const ClientConfig& cfg, transport::ControlClient& client) {
  const std::chrono::milliseconds timeout(cfg.timeout_ms);

  protocol::Generate request;
  request.id = cfg.job_id.empty() ? NewJobId() : cfg.job_id;
  request.priority = cfg.priority;
  request.payload.schema_version = 1;
  if (!cfg.params.SerializeToString(&request.payload.bytes)) {
    std::cerr << "Error: cannot encode generation parameters\n";
    return 1;
  }

  // Subscribe first so no update for this job can be missed.
  std::unique_ptr<transport::UpdateSubscriber> updates;
  if (cfg.wait) {
    updates = std::make_unique<transport::UpdateSubscriber>(cfg.server);
    updates->Connect();
    if (!updates->WaitConnected(timeout)) {
      std::cerr << "Error: update stream unavailable: " << updates->last_error()
                << "\n";
      return kExitTransport;
    }
  }

  transport::CallResult result = client.Call(request, timeout);
  if (!result.ok()) return ReportTransportFailure(result);
  const int rc = PrintResponse(result.response);
  if (!cfg.wait || !std::holds_alternative<protocol::JobAccepted>(result.response)) {
    return rc;
  }

  pixelctl::util::SystemTimeSource clock;
  preview::FfmpegImageRenderer renderer;
  preview::PreviewServiceConfig preview_cfg;
  preview_cfg.cache_budget_bytes = cfg.cache_mb * 1024 * 1024;
  preview::PreviewService previews(renderer, clock, preview_cfg);

  pixelctl::progress::JobUpdateValidator validator;
  const std::string& id = request.id;
  transport::Heartbeat heartbeat(clock, kHeartbeatIntervalMs, kHeartbeatMisses);

  while (!g_interrupted.load(std::memory_order_acquire)) {
    if (cfg.show_previews) DrainPreviews(previews);
    // Ending the stream sends the loop through the reconnect path below.
    if (ServerLost(heartbeat, client)) updates->Stop();

    if (updates->IsFinished()) {
      std::cerr << "update stream lost (" << updates->last_error()
                << "), reconnecting\n";
      std::this_thread::sleep_for(std::chrono::seconds(1));
      updates->Reconnect();
      if (!updates->WaitConnected(timeout)) continue;
      validator.Forget(id);
      // A finished job no longer shows in Status; the idempotent Generate
      // answers with its terminal state instead.
      transport::CallResult again = client.Call(request, timeout);
      if (!again.ok()) continue;
      if (!std::holds_alternative<protocol::JobAccepted>(again.response)) {
        return PrintResponse(again.response);
      }
      Reconcile(client, timeout, validator);
      continue;
    }

    if (!updates->WaitForUpdate(std::chrono::milliseconds(200))) continue;
    while (auto update = updates->TryRecv()) {
      if (protocol::JobIdOf(*update) != id) continue;
      const pixelctl::progress::UpdateCheck check = validator.Check(*update);
      if (!check.accepted) {
        Logger::Warn("[pixelctl] UPDATE_REJECTED " + check.detail);
        continue;
      }
      PrintUpdate(*update);

      if (const auto* p = std::get_if<protocol::Preview>(&*update)) {
        if (cfg.show_previews) ShowPreview(previews, p->path, cfg.render);
      } else if (const auto* f = std::get_if<protocol::JobFinished>(&*update)) {
        if (f->status == pixelctl::core::JobStatus::kCompleted) {
          transport::CallResult final_answer = client.Call(request, timeout);
          if (final_answer.ok()) PrintResponse(final_answer.response);
          return 0;
        }
        return f->status == pixelctl::core::JobStatus::kCancelled ? kExitCancelled
                                                                  : kExitFailed;
      }
    }
  }
  std::cerr << "interrupted; job " << id << " keeps running on the server\n";
  return kExitInterrupted;
}

int RunWatch(const ClientConfig& cfg, transport::ControlClient& client) {
  const std::chrono::milliseconds timeout(cfg.timeout_ms);
  transport::UpdateSubscriber updates(cfg.server);
  pixelctl::progress::JobUpdateValidator validator;
  pixelctl::util::SystemTimeSource clock;
  transport::Heartbeat heartbeat(clock, kHeartbeatIntervalMs, kHeartbeatMisses);

  updates.Connect();
  bool reconciled = false;
  while (!g_interrupted.load(std::memory_order_acquire)) {
    if (ServerLost(heartbeat, client)) updates.Stop();
    if (updates.IsFinished()) {
      std::cerr << "update stream lost (" << updates.last_error()
                << "), reconnecting\n";
      std::this_thread::sleep_for(std::chrono::seconds(1));
      updates.Reconnect();
      reconciled = false;
      continue;
    }
    if (!reconciled && updates.IsConnected()) {
      reconciled = Reconcile(client, timeout, validator);
      if (reconciled) std::cerr << "watching " << cfg.server << "\n";
    }
    if (!updates.WaitForUpdate(std::chrono::milliseconds(200))) continue;
    while (auto update = updates.TryRecv()) {
      const pixelctl::progress::UpdateCheck check = validator.Check(*update);
      if (!check.accepted) {
        Logger::Warn("[pixelctl] UPDATE_REJECTED " + check.detail);
        continue;
      }
      PrintUpdate(*update);
      if (std::holds_alternative<protocol::JobFinished>(*update)) {
        validator.Forget(protocol::JobIdOf(*update));
      }
    }
  }
  if (updates.decode_errors() > 0 || updates.dropped() > 0) {
    std::cerr << "decode_errors=" << updates.decode_errors()
              << " dropped=" << updates.dropped() << "\n";
  }
  return 0;
}

int RunPreview(const ClientConfig& cfg) {
  pixelctl::util::SystemTimeSource clock;
  preview::FfmpegImageRenderer renderer;
  preview::PreviewServiceConfig preview_cfg;
  preview_cfg.cache_budget_bytes = cfg.cache_mb * 1024 * 1024;
  preview::PreviewService previews(renderer, clock, preview_cfg);

  preview::PreviewTicket ticket = previews.Request(cfg.positional[0], cfg.render);
  switch (ticket.status) {
    case preview::PreviewStatus::kHit:
      std::cout << *ticket.bytes << std::flush;
      return 0;
    case preview::PreviewStatus::kUnavailable:
      std::cerr << "Error: " << ticket.error << "\n";
      return 1;
    case preview::PreviewStatus::kPending:
      break;
  }

  while (!g_interrupted.load(std::memory_order_acquire)) {
    if (auto result = previews.TryRecv()) {
      if (!result->success) {
        std::cerr << "Error: " << result->error << "\n";
        return 1;
      }
      std::cout << *result->bytes << std::flush;
      return 0;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return kExitInterrupted;
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
  GOOGLE_PROTOBUF_VERIFY_VERSION;

  ClientConfig cfg = ParseArgs(argc, argv);
  if (cfg.help) {
    PrintUsage(argv[0]);
    return 0;
  }
  if (!cfg.valid) {
    std::cerr << "Error: " << cfg.error << "\n\n";
    PrintUsage(argv[0]);
    return 1;
  }

  // Log lines would corrupt inline images.
  Logger::SetQuiet(true);

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  if (cfg.command == "preview") return RunPreview(cfg);

  transport::ControlClient client(cfg.server);
  const std::chrono::milliseconds timeout(cfg.timeout_ms);

  if (cfg.command == "ping") return RunPing(client, timeout);
  if (cfg.command == "status") {
    return RunSimple(client, protocol::StatusRequest{}, timeout);
  }
  if (cfg.command == "models") {
    return RunSimple(client, protocol::ListModels{}, timeout);
  }
  if (cfg.command == "cancel") {
    return RunSimple(client, protocol::Cancel{cfg.positional[0]}, timeout);
  }
  if (cfg.command == "generate") return RunGenerate(cfg, client);
  if (cfg.command == "watch") return RunWatch(cfg, client);

  std::cerr << "Error: unknown command '" << cfg.command << "'\n\n";
  PrintUsage(argv[0]);
  return 1;
}
