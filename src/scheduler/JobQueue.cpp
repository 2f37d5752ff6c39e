// Repository: pixelctl
// Component: Job Queue
// Purpose: Priority-ordered pending set with FIFO ties and O(log n) removal.
// Copyright (c) 2026 Pixelctl

#include "pixelctl/scheduler/JobQueue.hpp"

#include <iterator>

namespace pixelctl::scheduler {

bool JobQueue::Push(const std::string& job_id, core::JobPriority priority,
                    uint64_t sequence) {
  if (index_.count(job_id) != 0) return false;
  auto [it, inserted] = entries_.insert(Key{priority, sequence, job_id});
  if (!inserted) return false;
  index_.emplace(job_id, it);
  return true;
}

std::optional<std::string> JobQueue::Pop() {
  if (entries_.empty()) return std::nullopt;
  auto it = entries_.begin();
  std::string id = it->job_id;
  index_.erase(id);
  entries_.erase(it);
  return id;
}

std::optional<std::string> JobQueue::Peek() const {
  if (entries_.empty()) return std::nullopt;
  return entries_.begin()->job_id;
}

bool JobQueue::Remove(const std::string& job_id) {
  auto found = index_.find(job_id);
  if (found == index_.end()) return false;
  entries_.erase(found->second);
  index_.erase(found);
  return true;
}

bool JobQueue::Contains(const std::string& job_id) const {
  return index_.count(job_id) != 0;
}

size_t JobQueue::PositionOf(const std::string& job_id) const {
  auto found = index_.find(job_id);
  if (found == index_.end()) return 0;
  return static_cast<size_t>(
      std::distance(entries_.begin(), found->second));
}

std::vector<std::string> JobQueue::Snapshot() const {
  std::vector<std::string> ids;
  ids.reserve(entries_.size());
  for (const auto& k : entries_) ids.push_back(k.job_id);
  return ids;
}

}  // namespace pixelctl::scheduler
