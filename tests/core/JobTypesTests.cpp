// Repository: pixelctl
// Component: Job Types Tests
// Purpose: Lifecycle transitions, enum parsing and duration accounting.
// Copyright (c) 2026 Pixelctl

#include <gtest/gtest.h>

#include "pixelctl/core/JobTypes.hpp"

namespace pixelctl::core::testing {
namespace {

TEST(JobTypesTest, LifecycleTransitions) {
  EXPECT_TRUE(IsLegalTransition(JobStatus::kQueued, JobStatus::kRunning));
  EXPECT_TRUE(IsLegalTransition(JobStatus::kQueued, JobStatus::kCancelled));
  EXPECT_FALSE(IsLegalTransition(JobStatus::kQueued, JobStatus::kCompleted));
  EXPECT_TRUE(IsLegalTransition(JobStatus::kRunning, JobStatus::kCompleted));
  EXPECT_TRUE(IsLegalTransition(JobStatus::kRunning, JobStatus::kFailed));
  EXPECT_TRUE(IsLegalTransition(JobStatus::kRunning, JobStatus::kCancelled));
  EXPECT_FALSE(IsLegalTransition(JobStatus::kRunning, JobStatus::kQueued));

  for (JobStatus terminal : {JobStatus::kCompleted, JobStatus::kFailed,
                             JobStatus::kCancelled}) {
    EXPECT_TRUE(IsTerminal(terminal));
    for (JobStatus to : {JobStatus::kQueued, JobStatus::kRunning,
                         JobStatus::kCompleted, JobStatus::kFailed,
                         JobStatus::kCancelled}) {
      EXPECT_FALSE(IsLegalTransition(terminal, to));
    }
  }
}

TEST(JobTypesTest, TransitionToRefusesIllegalMoves) {
  JobRecord rec;
  rec.id = "j";
  EXPECT_FALSE(TransitionTo(&rec, JobStatus::kCompleted));
  EXPECT_EQ(rec.status, JobStatus::kQueued);

  EXPECT_TRUE(TransitionTo(&rec, JobStatus::kRunning));
  EXPECT_TRUE(TransitionTo(&rec, JobStatus::kCompleted));
  EXPECT_EQ(rec.status, JobStatus::kCompleted);

  EXPECT_FALSE(TransitionTo(&rec, JobStatus::kRunning));
  EXPECT_FALSE(TransitionTo(&rec, JobStatus::kCancelled));
  EXPECT_EQ(rec.status, JobStatus::kCompleted);
}

TEST(JobTypesTest, ParsingIsCaseInsensitive) {
  JobPriority p;
  ASSERT_TRUE(ParseJobPriority("HIGH", &p));
  EXPECT_EQ(p, JobPriority::kHigh);
  ASSERT_TRUE(ParseJobPriority(ToString(JobPriority::kUrgent), &p));
  EXPECT_EQ(p, JobPriority::kUrgent);
  EXPECT_FALSE(ParseJobPriority("critical", &p));

  Stage s;
  ASSERT_TRUE(ParseStage("postprocessing", &s));
  EXPECT_EQ(s, Stage::kPostprocessing);
  EXPECT_FALSE(ParseStage("", &s));
}

TEST(JobTypesTest, StagesAreOrdered) {
  EXPECT_LT(Stage::kQueued, Stage::kPreparing);
  EXPECT_LT(Stage::kPreparing, Stage::kExecuting);
  EXPECT_LT(Stage::kExecuting, Stage::kPostprocessing);
  EXPECT_LT(Stage::kPostprocessing, Stage::kSaving);
  EXPECT_LT(Stage::kSaving, Stage::kDone);
  EXPECT_LT(JobPriority::kUrgent, JobPriority::kLow);
}

TEST(JobTypesTest, DurationUsesStartWhenKnown) {
  JobRecord rec;
  rec.created_at_ms = 1000;
  EXPECT_DOUBLE_EQ(rec.DurationSeconds(), 0.0);

  rec.finished_at_ms = 4000;
  EXPECT_DOUBLE_EQ(rec.DurationSeconds(), 3.0);

  rec.started_at_ms = 2500;
  EXPECT_DOUBLE_EQ(rec.DurationSeconds(), 1.5);
}

}  // namespace
}  // namespace pixelctl::core::testing
