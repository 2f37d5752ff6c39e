// Repository: pixelctl
// Component: Job Update Validator
// Purpose: Subscriber-side check of per-job update order and monotonic progress.
// Copyright (c) 2026 Pixelctl

#include "pixelctl/progress/JobUpdateValidator.hpp"

#include <sstream>
#include <type_traits>

namespace pixelctl::progress {

const char* ToString(UpdateViolation violation) {
  switch (violation) {
    case UpdateViolation::kNone: return "None";
    case UpdateViolation::kDuplicateStart: return "DuplicateStart";
    case UpdateViolation::kUpdateBeforeStart: return "UpdateBeforeStart";
    case UpdateViolation::kUpdateAfterFinish: return "UpdateAfterFinish";
    case UpdateViolation::kProgressRegression: return "ProgressRegression";
    case UpdateViolation::kStageRegression: return "StageRegression";
  }
  return "Unknown";
}

namespace {

UpdateCheck Reject(UpdateViolation v, const std::string& job_id,
                   const std::string& what) {
  UpdateCheck c;
  c.accepted = false;
  c.violation = v;
  c.detail = "job_id=" + job_id + " " + what;
  return c;
}

}  // namespace

UpdateCheck JobUpdateValidator::Check(const protocol::Update& update) {
  const std::string& id = protocol::JobIdOf(update);
  State& state = jobs_[id];

  if (state.finished) {
    return Reject(UpdateViolation::kUpdateAfterFinish, id,
                  std::string(protocol::VariantName(update)) + " after JobFinished");
  }

  return std::visit(
      [&](const auto& m) -> UpdateCheck {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, protocol::JobStarted>) {
          if (state.started) {
            return Reject(UpdateViolation::kDuplicateStart, id, "second JobStarted");
          }
          state.started = true;
          state.stage = core::Stage::kPreparing;
        } else if constexpr (std::is_same_v<T, protocol::Progress>) {
          if (!state.started) {
            return Reject(UpdateViolation::kUpdateBeforeStart, id,
                          "Progress before JobStarted");
          }
          if (m.fraction < state.fraction) {
            std::ostringstream oss;
            oss << "fraction " << m.fraction << " < " << state.fraction;
            return Reject(UpdateViolation::kProgressRegression, id, oss.str());
          }
          if (m.stage < state.stage) {
            return Reject(UpdateViolation::kStageRegression, id,
                          std::string("stage ") + core::ToString(m.stage) +
                              " after " + core::ToString(state.stage));
          }
          state.fraction = m.fraction;
          state.stage = m.stage;
        } else if constexpr (std::is_same_v<T, protocol::Preview>) {
          if (!state.started) {
            return Reject(UpdateViolation::kUpdateBeforeStart, id,
                          "Preview before JobStarted");
          }
        } else if constexpr (std::is_same_v<T, protocol::JobFinished>) {
          state.finished = true;
        }
        return UpdateCheck{};
      },
      update);
}

void JobUpdateValidator::Adopt(const std::string& job_id,
                               core::JobStatus status, core::Stage stage,
                               double progress) {
  State& state = jobs_[job_id];
  state.started = status != core::JobStatus::kQueued;
  state.finished = core::IsTerminal(status);
  state.stage = stage;
  state.fraction = progress;
}

void JobUpdateValidator::Forget(const std::string& job_id) {
  jobs_.erase(job_id);
}

}  // namespace pixelctl::progress
