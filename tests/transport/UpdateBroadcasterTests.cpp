// Repository: pixelctl
// Component: Update Broadcaster Tests
// Purpose: Fan-out, drop-oldest backpressure and shutdown of update channels.
// Copyright (c) 2026 Pixelctl

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <variant>

#include "pixelctl/protocol/MessageCodec.hpp"
#include "pixelctl/transport/UpdateBroadcaster.hpp"

namespace pixelctl::transport::testing {
namespace {

using protocol::DecodeUpdate;
using protocol::JobStarted;
using protocol::Progress;
using protocol::Update;

Update Started(const std::string& id, int64_t ts = 1) {
  return JobStarted{id, ts};
}

EncodedUpdate Encoded(const std::string& job_id) {
  auto envelope = std::make_shared<v1::Envelope>();
  protocol::EncodeUpdate(Started(job_id), envelope.get());
  return envelope;
}

std::string JobIdIn(const EncodedUpdate& envelope) {
  auto decoded = DecodeUpdate(*envelope);
  EXPECT_TRUE(decoded.ok()) << decoded.detail;
  return protocol::JobIdOf(decoded.value);
}

TEST(UpdateBroadcasterTest, PublishWithoutSubscribersDeliversNothing) {
  UpdateBroadcaster broadcaster;
  EXPECT_EQ(broadcaster.Publish(Started("a")), 0u);
  BroadcasterStats stats = broadcaster.Stats();
  EXPECT_EQ(stats.published, 1u);
  EXPECT_EQ(stats.deliveries, 0u);
  EXPECT_EQ(stats.subscribers, 0u);
}

TEST(UpdateBroadcasterTest, EverySubscriberSharesOneEncoding) {
  UpdateBroadcaster broadcaster;
  auto first = broadcaster.Subscribe();
  auto second = broadcaster.Subscribe();
  EXPECT_EQ(broadcaster.SubscriberCount(), 2u);

  EXPECT_EQ(broadcaster.Publish(Started("a")), 2u);

  EncodedUpdate x = first->TryPop();
  EncodedUpdate y = second->TryPop();
  ASSERT_NE(x, nullptr);
  ASSERT_NE(y, nullptr);
  EXPECT_EQ(x.get(), y.get());
  EXPECT_EQ(JobIdIn(x), "a");
  EXPECT_EQ(first->TryPop(), nullptr);
}

TEST(UpdateBroadcasterTest, SubscribersSeePublishOrder) {
  UpdateBroadcaster broadcaster;
  auto channel = broadcaster.Subscribe();
  broadcaster.Publish(Started("a"));
  broadcaster.Publish(Progress{"a", core::Stage::kPreparing, 0.1, 5.0});
  broadcaster.Publish(Started("b"));

  ASSERT_EQ(channel->Size(), 3u);
  auto first = DecodeUpdate(*channel->TryPop());
  ASSERT_TRUE(first.ok());
  EXPECT_TRUE(std::holds_alternative<JobStarted>(first.value));
  auto second = DecodeUpdate(*channel->TryPop());
  ASSERT_TRUE(second.ok());
  EXPECT_TRUE(std::holds_alternative<Progress>(second.value));
  EXPECT_EQ(JobIdIn(channel->TryPop()), "b");
}

TEST(UpdateBroadcasterTest, LateSubscriberGetsNoReplay) {
  UpdateBroadcaster broadcaster;
  auto early = broadcaster.Subscribe();
  broadcaster.Publish(Started("a"));
  auto late = broadcaster.Subscribe();
  broadcaster.Publish(Started("b"));

  EXPECT_EQ(early->Size(), 2u);
  ASSERT_EQ(late->Size(), 1u);
  EXPECT_EQ(JobIdIn(late->TryPop()), "b");
}

TEST(UpdateBroadcasterTest, UnsubscribeStopsDelivery) {
  UpdateBroadcaster broadcaster;
  auto keep = broadcaster.Subscribe();
  auto leave = broadcaster.Subscribe();
  broadcaster.Unsubscribe(leave);
  broadcaster.Unsubscribe(leave);
  EXPECT_EQ(broadcaster.SubscriberCount(), 1u);

  EXPECT_EQ(broadcaster.Publish(Started("a")), 1u);
  EXPECT_EQ(keep->Size(), 1u);
  EXPECT_EQ(leave->Size(), 0u);
}

TEST(UpdateBroadcasterTest, SlowSubscriberDropsOldest) {
  UpdateBroadcaster broadcaster(2);
  auto slow = broadcaster.Subscribe();
  auto other = broadcaster.Subscribe();
  broadcaster.Publish(Started("a"));
  broadcaster.Publish(Started("b"));
  broadcaster.Publish(Started("c"));

  ASSERT_EQ(slow->Size(), 2u);
  EXPECT_EQ(slow->dropped(), 1u);
  EXPECT_EQ(JobIdIn(slow->TryPop()), "b");
  EXPECT_EQ(JobIdIn(slow->TryPop()), "c");

  BroadcasterStats stats = broadcaster.Stats();
  EXPECT_EQ(stats.published, 3u);
  EXPECT_EQ(stats.deliveries, 6u);
  EXPECT_EQ(stats.dropped, 2u);

  // Drops stay counted after the subscriber leaves.
  broadcaster.Unsubscribe(other);
  EXPECT_EQ(broadcaster.Stats().dropped, 2u);
}

TEST(UpdateBroadcasterTest, CloseAllEndsEveryChannel) {
  UpdateBroadcaster broadcaster;
  auto channel = broadcaster.Subscribe();
  broadcaster.Publish(Started("a"));
  broadcaster.CloseAll();

  EXPECT_TRUE(channel->IsClosed());
  EXPECT_EQ(broadcaster.SubscriberCount(), 0u);
  // Queued updates remain readable after close.
  EXPECT_NE(channel->TryPop(), nullptr);
  EXPECT_FALSE(channel->Push(Encoded("x")));

  auto late = broadcaster.Subscribe();
  EXPECT_TRUE(late->IsClosed());
  EXPECT_EQ(broadcaster.Publish(Started("b")), 0u);
}

TEST(UpdateChannelTest, WaitPopWakesOnPush) {
  UpdateChannel channel(4);
  std::thread pusher([&channel] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    channel.Push(Encoded("late"));
  });
  EncodedUpdate got = channel.WaitPop(std::chrono::seconds(5));
  pusher.join();
  ASSERT_NE(got, nullptr);
  EXPECT_EQ(JobIdIn(got), "late");
}

TEST(UpdateChannelTest, WaitPopTimesOutEmpty) {
  UpdateChannel channel(4);
  EXPECT_EQ(channel.WaitPop(std::chrono::milliseconds(10)), nullptr);
  EXPECT_FALSE(channel.IsClosed());
}

TEST(UpdateChannelTest, CloseWakesWaiterAndDrainsFirst) {
  UpdateChannel channel(4);
  ASSERT_TRUE(channel.Push(Encoded("1")));
  channel.Close();
  channel.Close();
  EXPECT_FALSE(channel.Push(Encoded("2")));

  EncodedUpdate first = channel.WaitPop(std::chrono::seconds(5));
  ASSERT_NE(first, nullptr);
  EXPECT_EQ(JobIdIn(first), "1");

  const auto start = std::chrono::steady_clock::now();
  EXPECT_EQ(channel.WaitPop(std::chrono::seconds(5)), nullptr);
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(1));
}

TEST(UpdateChannelTest, CloseReleasesBlockedWaiter) {
  UpdateChannel channel(4);
  std::thread closer([&channel] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    channel.Close();
  });
  const auto start = std::chrono::steady_clock::now();
  EXPECT_EQ(channel.WaitPop(std::chrono::seconds(10)), nullptr);
  closer.join();
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
}

TEST(UpdateChannelTest, ZeroCapacityStillHoldsOne) {
  UpdateChannel channel(0);
  channel.Push(Encoded("1"));
  channel.Push(Encoded("2"));
  EXPECT_EQ(channel.Size(), 1u);
  EXPECT_EQ(JobIdIn(channel.TryPop()), "2");
  EXPECT_EQ(channel.dropped(), 1u);
}

}  // namespace
}  // namespace pixelctl::transport::testing
