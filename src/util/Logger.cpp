// Repository: pixelctl
// Component: Logger
// Purpose: Line logging shared by the daemon, the client and tests.
// Copyright (c) 2026 Pixelctl

#include "pixelctl/util/Logger.hpp"

#include <cstdlib>
#include <iostream>
#include <mutex>

namespace pixelctl::util {

namespace {

std::mutex g_mutex;
bool g_quiet = false;
Logger::Capture g_capture;

}  // namespace

const char* ToString(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug: return "debug";
    case LogLevel::kInfo: return "info";
    case LogLevel::kWarn: return "warn";
    case LogLevel::kError: return "error";
  }
  return "unknown";
}

void Logger::SetQuiet(bool quiet) {
  std::lock_guard<std::mutex> lock(g_mutex);
  g_quiet = quiet;
}

void Logger::SetCapture(Capture capture) {
  std::lock_guard<std::mutex> lock(g_mutex);
  g_capture = std::move(capture);
}

void Logger::Write(LogLevel level, const std::string& line) {
  if (level == LogLevel::kDebug && std::getenv("PIXELCTL_DEBUG") == nullptr) {
    return;
  }
  std::lock_guard<std::mutex> lock(g_mutex);
  if (g_capture) g_capture(level, line);

  const bool to_stderr = level == LogLevel::kWarn || level == LogLevel::kError;
  if (!to_stderr && g_quiet) return;
  std::ostream& out = to_stderr ? std::cerr : std::cout;
  out << line << '\n';
  out.flush();
}

}  // namespace pixelctl::util
