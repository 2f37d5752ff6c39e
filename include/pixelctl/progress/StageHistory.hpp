// Repository: pixelctl
// Component: Stage History
// Purpose: Per-stage duration estimates (EWMA with cold-start prior), persisted
//          as JSON lines so ETA survives a daemon restart.
// Copyright (c) 2026 Pixelctl

#ifndef PIXELCTL_PROGRESS_STAGE_HISTORY_HPP_
#define PIXELCTL_PROGRESS_STAGE_HISTORY_HPP_

#include <array>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "pixelctl/core/JobTypes.hpp"

namespace pixelctl::progress {

struct StageHistoryConfig {
  // Weight of the newest sample in the moving average.
  double alpha = 0.2;
  // Samples needed before the observed average fully replaces the prior.
  uint32_t min_samples = 3;
  // Prior duration in seconds, indexed by core::Stage.
  std::array<double, core::kStageCount> prior_seconds = {
      0.0,   // Queued
      2.0,   // Preparing
      10.0,  // Executing
      1.0,   // Postprocessing
      0.5,   // Saving
      0.0,   // Done
  };
};

struct StageHistoryRow {
  core::Stage stage = core::Stage::kPreparing;
  double estimate_seconds = 0.0;
  double ewma_seconds = 0.0;
  uint32_t samples = 0;
};

// Thread-safe. Estimate() never divides by the sample count, so a stage with
// no history returns its prior.
class StageHistory {
 public:
  explicit StageHistory(StageHistoryConfig config = StageHistoryConfig{});

  // Non-finite and negative samples are dropped.
  void Record(core::Stage stage, double seconds);

  // Blend of prior and EWMA weighted by sample count until min_samples is
  // reached, then the EWMA alone.
  double Estimate(core::Stage stage) const;

  uint32_t Samples(core::Stage stage) const;

  // Sum of Estimate() over the work stages.
  double TotalEstimate() const;

  // One row per work stage, in stage order.
  std::vector<StageHistoryRow> Table() const;

  // Writes to a temp file then renames over path. Returns false and sets
  // *error on failure.
  bool Save(const std::string& path, std::string* error) const;

  // A missing file is not an error (fresh install). Malformed lines are
  // skipped with a warning.
  bool Load(const std::string& path, std::string* error);

  void Reset();

 private:
  struct Slot {
    double ewma_seconds = 0.0;
    uint32_t samples = 0;
  };

  double EstimateLocked(core::Stage stage) const;

  const StageHistoryConfig config_;
  mutable std::mutex mutex_;
  std::array<Slot, core::kStageCount> slots_{};
};

}  // namespace pixelctl::progress

#endif  // PIXELCTL_PROGRESS_STAGE_HISTORY_HPP_
