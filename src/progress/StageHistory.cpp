// Repository: pixelctl
// Component: Stage History
// Purpose: EWMA stage durations and their JSON-lines persistence.
// Copyright (c) 2026 Pixelctl

#include "pixelctl/progress/StageHistory.hpp"

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <unistd.h>

#include "pixelctl/util/Logger.hpp"

namespace pixelctl::progress {

using pixelctl::util::Logger;

namespace {

size_t Index(core::Stage stage) { return static_cast<size_t>(stage); }

bool IsWorkStage(core::Stage stage) {
  return stage != core::Stage::kQueued && stage != core::Stage::kDone;
}

// Value after "key": as a quoted string. No escapes: stage names are plain.
bool ParseStringField(const std::string& line, const std::string& key,
                      std::string* out) {
  const std::string search = "\"" + key + "\":\"";
  size_t start = line.find(search);
  if (start == std::string::npos) return false;
  start += search.size();
  size_t end = line.find('"', start);
  if (end == std::string::npos) return false;
  *out = line.substr(start, end - start);
  return true;
}

bool ParseNumberField(const std::string& line, const std::string& key,
                      double* out) {
  const std::string search = "\"" + key + "\":";
  size_t start = line.find(search);
  if (start == std::string::npos) return false;
  start += search.size();
  const char* begin = line.c_str() + start;
  char* end = nullptr;
  errno = 0;
  double v = std::strtod(begin, &end);
  if (end == begin || errno == ERANGE || !std::isfinite(v)) return false;
  *out = v;
  return true;
}

}  // namespace

StageHistory::StageHistory(StageHistoryConfig config) : config_(config) {}

void StageHistory::Record(core::Stage stage, double seconds) {
  if (!IsWorkStage(stage) || !std::isfinite(seconds) || seconds < 0.0) return;
  std::lock_guard<std::mutex> lock(mutex_);
  Slot& slot = slots_[Index(stage)];
  if (slot.samples == 0) {
    slot.ewma_seconds = seconds;
  } else {
    slot.ewma_seconds =
        config_.alpha * seconds + (1.0 - config_.alpha) * slot.ewma_seconds;
  }
  ++slot.samples;
}

double StageHistory::EstimateLocked(core::Stage stage) const {
  const double prior = config_.prior_seconds[Index(stage)];
  const Slot& slot = slots_[Index(stage)];
  const uint32_t m = config_.min_samples;
  if (slot.samples == 0) return prior;
  if (m == 0 || slot.samples >= m) return slot.ewma_seconds;
  const double n = static_cast<double>(slot.samples);
  return (prior * (m - n) + slot.ewma_seconds * n) / static_cast<double>(m);
}

double StageHistory::Estimate(core::Stage stage) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return EstimateLocked(stage);
}

uint32_t StageHistory::Samples(core::Stage stage) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return slots_[Index(stage)].samples;
}

double StageHistory::TotalEstimate() const {
  std::lock_guard<std::mutex> lock(mutex_);
  double total = 0.0;
  for (core::Stage s : core::kWorkStages) total += EstimateLocked(s);
  return total;
}

std::vector<StageHistoryRow> StageHistory::Table() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<StageHistoryRow> rows;
  for (core::Stage s : core::kWorkStages) {
    StageHistoryRow row;
    row.stage = s;
    row.estimate_seconds = EstimateLocked(s);
    row.ewma_seconds = slots_[Index(s)].ewma_seconds;
    row.samples = slots_[Index(s)].samples;
    rows.push_back(row);
  }
  return rows;
}

void StageHistory::Reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  slots_ = {};
}

bool StageHistory::Save(const std::string& path, std::string* error) const {
  std::vector<StageHistoryRow> rows = Table();
  const std::string tmp_path =
      path + ".tmp." + std::to_string(static_cast<unsigned long>(getpid()));
  {
    std::ofstream of(tmp_path, std::ios::trunc);
    if (!of) {
      if (error) *error = "cannot open " + tmp_path + ": " + std::strerror(errno);
      return false;
    }
    of.precision(17);
    for (const auto& row : rows) {
      of << "{\"stage\":\"" << core::ToString(row.stage) << "\""
         << ",\"ewma_seconds\":" << row.ewma_seconds
         << ",\"samples\":" << row.samples << "}\n";
    }
    of.flush();
    if (!of) {
      if (error) *error = "write failed for " + tmp_path;
      std::remove(tmp_path.c_str());
      return false;
    }
  }
  if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
    if (error) *error = "rename to " + path + " failed: " + std::strerror(errno);
    std::remove(tmp_path.c_str());
    return false;
  }
  return true;
}

bool StageHistory::Load(const std::string& path, std::string* error) {
  std::ifstream in(path);
  if (!in) {
    if (errno == ENOENT) {
      Logger::Info("[StageHistory] LOAD_SKIPPED path=" + path + " reason=missing");
      return true;
    }
    if (error) *error = "cannot open " + path + ": " + std::strerror(errno);
    return false;
  }

  std::array<Slot, core::kStageCount> loaded{};
  std::string line;
  size_t line_no = 0;
  size_t accepted = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.empty()) continue;
    std::string stage_name;
    double ewma = 0.0;
    double samples = 0.0;
    core::Stage stage;
    if (!ParseStringField(line, "stage", &stage_name) ||
        !core::ParseStage(stage_name, &stage) || !IsWorkStage(stage) ||
        !ParseNumberField(line, "ewma_seconds", &ewma) ||
        !ParseNumberField(line, "samples", &samples) || ewma < 0.0 ||
        samples < 0.0 || samples > 4294967295.0) {
      std::ostringstream oss;
      oss << "[StageHistory] LOAD_LINE_SKIPPED path=" << path
          << " line=" << line_no;
      Logger::Warn(oss.str());
      continue;
    }
    loaded[Index(stage)].ewma_seconds = ewma;
    loaded[Index(stage)].samples = static_cast<uint32_t>(samples);
    ++accepted;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    slots_ = loaded;
  }
  std::ostringstream oss;
  oss << "[StageHistory] LOADED path=" << path << " stages=" << accepted;
  Logger::Info(oss.str());
  return true;
}

}  // namespace pixelctl::progress
