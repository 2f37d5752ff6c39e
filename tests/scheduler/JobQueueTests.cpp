// Repository: pixelctl
// Component: Job Queue Tests
// Purpose: Priority order, FIFO ties, removal and position queries.
// Copyright (c) 2026 Pixelctl

#include <gtest/gtest.h>

#include "pixelctl/scheduler/JobQueue.hpp"

namespace pixelctl::scheduler::testing {
namespace {

using core::JobPriority;

TEST(JobQueueTest, PopsByPriorityThenSubmissionOrder) {
  JobQueue q;
  ASSERT_TRUE(q.Push("low", JobPriority::kLow, 0));
  ASSERT_TRUE(q.Push("n1", JobPriority::kNormal, 1));
  ASSERT_TRUE(q.Push("urgent", JobPriority::kUrgent, 2));
  ASSERT_TRUE(q.Push("n2", JobPriority::kNormal, 3));
  ASSERT_TRUE(q.Push("high", JobPriority::kHigh, 4));

  EXPECT_EQ(q.Snapshot(),
            (std::vector<std::string>{"urgent", "high", "n1", "n2", "low"}));
  EXPECT_EQ(q.Peek().value(), "urgent");
  EXPECT_EQ(q.Pop().value(), "urgent");
  EXPECT_EQ(q.Pop().value(), "high");
  EXPECT_EQ(q.Pop().value(), "n1");
  EXPECT_EQ(q.Pop().value(), "n2");
  EXPECT_EQ(q.Pop().value(), "low");
  EXPECT_FALSE(q.Pop().has_value());
  EXPECT_TRUE(q.Empty());
}

TEST(JobQueueTest, DuplicateIdIsRejected) {
  JobQueue q;
  ASSERT_TRUE(q.Push("a", JobPriority::kNormal, 0));
  EXPECT_FALSE(q.Push("a", JobPriority::kUrgent, 1));
  EXPECT_EQ(q.Size(), 1u);
  EXPECT_EQ(q.Pop().value(), "a");
}

TEST(JobQueueTest, RemoveTakesEntryOutOfOrder) {
  JobQueue q;
  q.Push("a", JobPriority::kNormal, 0);
  q.Push("b", JobPriority::kNormal, 1);
  q.Push("c", JobPriority::kNormal, 2);

  EXPECT_TRUE(q.Remove("b"));
  EXPECT_FALSE(q.Remove("b"));
  EXPECT_FALSE(q.Contains("b"));
  EXPECT_EQ(q.Snapshot(), (std::vector<std::string>{"a", "c"}));

  // Removed id can be queued again.
  EXPECT_TRUE(q.Push("b", JobPriority::kHigh, 3));
  EXPECT_EQ(q.Peek().value(), "b");
}

TEST(JobQueueTest, PositionCountsEntriesAhead) {
  JobQueue q;
  q.Push("n1", JobPriority::kNormal, 0);
  q.Push("n2", JobPriority::kNormal, 1);
  q.Push("u", JobPriority::kUrgent, 2);

  EXPECT_EQ(q.PositionOf("u"), 0u);
  EXPECT_EQ(q.PositionOf("n1"), 1u);
  EXPECT_EQ(q.PositionOf("n2"), 2u);
  EXPECT_EQ(q.PositionOf("missing"), 0u);
}

TEST(JobQueueTest, EmptyQueue) {
  JobQueue q;
  EXPECT_FALSE(q.Peek().has_value());
  EXPECT_FALSE(q.Pop().has_value());
  EXPECT_TRUE(q.Snapshot().empty());
  EXPECT_EQ(q.Size(), 0u);
}

}  // namespace
}  // namespace pixelctl::scheduler::testing
