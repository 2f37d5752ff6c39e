// Repository: pixelctl
// Component: Update Broadcaster
// Purpose: Fire-and-forget fan-out of encoded updates to bounded per-subscriber
//          channels.
// Copyright (c) 2026 Pixelctl

#include "pixelctl/transport/UpdateBroadcaster.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

#include "pixelctl/protocol/MessageCodec.hpp"
#include "pixelctl/util/Logger.hpp"

namespace pixelctl::transport {

using pixelctl::util::Logger;

// =============================================================================
// UpdateChannel
// =============================================================================

UpdateChannel::UpdateChannel(size_t capacity)
    : capacity_(std::max<size_t>(1, capacity)) {}

bool UpdateChannel::Push(EncodedUpdate update) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) return false;
    if (queue_.size() >= capacity_) {
      queue_.pop_front();
      ++dropped_;
    }
    queue_.push_back(std::move(update));
  }
  cv_.notify_one();
  return true;
}

EncodedUpdate UpdateChannel::TryPop() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (queue_.empty()) return nullptr;
  EncodedUpdate u = std::move(queue_.front());
  queue_.pop_front();
  return u;
}

EncodedUpdate UpdateChannel::WaitPop(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); });
  if (queue_.empty()) return nullptr;
  EncodedUpdate u = std::move(queue_.front());
  queue_.pop_front();
  return u;
}

void UpdateChannel::Close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) return;
    closed_ = true;
  }
  cv_.notify_all();
}

bool UpdateChannel::IsClosed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

size_t UpdateChannel::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

uint64_t UpdateChannel::dropped() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dropped_;
}

// =============================================================================
// UpdateBroadcaster
// =============================================================================

UpdateBroadcaster::UpdateBroadcaster(size_t subscriber_capacity)
    : subscriber_capacity_(subscriber_capacity) {}

std::shared_ptr<UpdateChannel> UpdateBroadcaster::Subscribe() {
  auto channel = std::make_shared<UpdateChannel>(subscriber_capacity_);
  size_t count = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      channel->Close();
      return channel;
    }
    subscribers_.push_back(channel);
    count = subscribers_.size();
  }
  std::ostringstream oss;
  oss << "[UpdateBroadcaster] SUBSCRIBED subscribers=" << count;
  Logger::Debug(oss.str());
  return channel;
}

void UpdateBroadcaster::Unsubscribe(const std::shared_ptr<UpdateChannel>& channel) {
  if (!channel) return;
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = std::find(subscribers_.begin(), subscribers_.end(), channel);
  if (it == subscribers_.end()) return;
  dropped_from_removed_ += channel->dropped();
  subscribers_.erase(it);
}

size_t UpdateBroadcaster::Publish(const protocol::Update& update) {
  auto envelope = std::make_shared<v1::Envelope>();
  protocol::EncodeUpdate(update, envelope.get());
  EncodedUpdate encoded = std::move(envelope);

  std::lock_guard<std::mutex> publish_lock(publish_mutex_);
  std::vector<std::shared_ptr<UpdateChannel>> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++published_;
    targets = subscribers_;
  }

  size_t delivered = 0;
  for (const auto& channel : targets) {
    if (channel->Push(encoded)) ++delivered;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    deliveries_ += delivered;
  }
  if (targets.empty()) {
    std::ostringstream oss;
    oss << "[UpdateBroadcaster] NO_SUBSCRIBERS update="
        << protocol::VariantName(update)
        << " job_id=" << protocol::JobIdOf(update);
    Logger::Debug(oss.str());
  }
  return delivered;
}

void UpdateBroadcaster::CloseAll() {
  std::vector<std::shared_ptr<UpdateChannel>> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    targets.swap(subscribers_);
    for (const auto& c : targets) dropped_from_removed_ += c->dropped();
  }
  for (const auto& c : targets) c->Close();
}

size_t UpdateBroadcaster::SubscriberCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return subscribers_.size();
}

BroadcasterStats UpdateBroadcaster::Stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  BroadcasterStats s;
  s.published = published_;
  s.deliveries = deliveries_;
  s.dropped = dropped_from_removed_;
  for (const auto& c : subscribers_) s.dropped += c->dropped();
  s.subscribers = subscribers_.size();
  return s;
}

}  // namespace pixelctl::transport
