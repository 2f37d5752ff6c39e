// Repository: pixelctl
// Component: Update Broadcaster
// Purpose: Fire-and-forget fan-out of encoded updates to bounded per-subscriber
//          channels.
// Copyright (c) 2026 Pixelctl

#ifndef PIXELCTL_TRANSPORT_UPDATE_BROADCASTER_HPP_
#define PIXELCTL_TRANSPORT_UPDATE_BROADCASTER_HPP_

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <vector>

#include "pixelctl/protocol/Messages.hpp"
#include "pixelctl/v1/control.pb.h"

namespace pixelctl::transport {

// One update envelope, built once and shared by every subscriber.
using EncodedUpdate = std::shared_ptr<const v1::Envelope>;

// Bounded queue of encoded updates for one subscriber. When full the oldest
// entry is dropped and counted, so a slow subscriber never blocks publishers.
class UpdateChannel {
 public:
  explicit UpdateChannel(size_t capacity);

  // False once closed.
  bool Push(EncodedUpdate update);

  // nullptr when empty.
  EncodedUpdate TryPop();

  // Waits up to timeout for an update. nullptr on timeout, or once the
  // channel is closed and drained.
  EncodedUpdate WaitPop(std::chrono::milliseconds timeout);

  // Wakes WaitPop callers. Queued updates stay readable.
  void Close();
  bool IsClosed() const;

  size_t Size() const;
  uint64_t dropped() const;

 private:
  const size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<EncodedUpdate> queue_;
  bool closed_ = false;
  uint64_t dropped_ = 0;
};

struct BroadcasterStats {
  uint64_t published = 0;
  uint64_t deliveries = 0;
  uint64_t dropped = 0;
  size_t subscribers = 0;
};

// UpdateBroadcaster encodes each update once and offers it to every current
// subscriber. No replay: a subscriber sees only updates published after it
// subscribed. Publish() calls are serialized so every subscriber observes the
// same order.
class UpdateBroadcaster {
 public:
  explicit UpdateBroadcaster(size_t subscriber_capacity = 1024);

  // After CloseAll() the returned channel is already closed.
  std::shared_ptr<UpdateChannel> Subscribe();
  void Unsubscribe(const std::shared_ptr<UpdateChannel>& channel);

  // Returns the number of subscribers offered the update.
  size_t Publish(const protocol::Update& update);

  // Closes and forgets every channel; later Subscribe() calls get closed
  // channels.
  void CloseAll();

  size_t SubscriberCount() const;
  BroadcasterStats Stats() const;

 private:
  const size_t subscriber_capacity_;

  mutable std::mutex mutex_;
  std::vector<std::shared_ptr<UpdateChannel>> subscribers_;
  bool closed_ = false;
  uint64_t published_ = 0;
  uint64_t deliveries_ = 0;
  uint64_t dropped_from_removed_ = 0;

  std::mutex publish_mutex_;
};

}  // namespace pixelctl::transport

#endif  // PIXELCTL_TRANSPORT_UPDATE_BROADCASTER_HPP_
