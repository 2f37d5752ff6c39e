// Repository: pixelctl
// Component: Logger
// Purpose: Line logging shared by the daemon, the client and tests.
// Copyright (c) 2026 Pixelctl

#ifndef PIXELCTL_UTIL_LOGGER_HPP_
#define PIXELCTL_UTIL_LOGGER_HPP_

#include <functional>
#include <string>

namespace pixelctl::util {

enum class LogLevel {
  kDebug,
  kInfo,
  kWarn,
  kError,
};

const char* ToString(LogLevel level);

// Lines are written whole and flushed, one writer at a time.
// Debug and Info go to stdout, Warn and Error to stderr. Debug lines are
// dropped unless PIXELCTL_DEBUG is set.
//
// Line convention: "[Component] EVENT key=value ...".
class Logger {
 public:
  using Capture = std::function<void(LogLevel, const std::string&)>;

  static void Debug(const std::string& line) { Write(LogLevel::kDebug, line); }
  static void Info(const std::string& line) { Write(LogLevel::kInfo, line); }
  static void Warn(const std::string& line) { Write(LogLevel::kWarn, line); }
  static void Error(const std::string& line) { Write(LogLevel::kError, line); }

  // Keeps stdout clean for terminal graphics. Warn and Error still print.
  static void SetQuiet(bool quiet);

  // Receives every line that passes the debug gate, quiet or not.
  // nullptr detaches.
  static void SetCapture(Capture capture);

 private:
  static void Write(LogLevel level, const std::string& line);
};

}  // namespace pixelctl::util

#endif  // PIXELCTL_UTIL_LOGGER_HPP_
