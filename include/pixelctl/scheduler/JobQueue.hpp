// Repository: pixelctl
// Component: Job Queue
// Purpose: Priority-ordered pending set with FIFO ties and O(log n) removal.
// Copyright (c) 2026 Pixelctl

#ifndef PIXELCTL_SCHEDULER_JOB_QUEUE_HPP_
#define PIXELCTL_SCHEDULER_JOB_QUEUE_HPP_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "pixelctl/core/JobTypes.hpp"

namespace pixelctl::scheduler {

// JobQueue orders pending job ids by (priority, submission sequence).
// Not thread-safe: the Scheduler owns it under its own lock.
class JobQueue {
 public:
  // Returns false if the id is already queued.
  bool Push(const std::string& job_id, core::JobPriority priority,
            uint64_t sequence);

  // Removes and returns the highest-priority, earliest-submitted id.
  std::optional<std::string> Pop();

  std::optional<std::string> Peek() const;

  // Returns false if the id was not queued.
  bool Remove(const std::string& job_id);

  bool Contains(const std::string& job_id) const;

  // Number of queued entries strictly ahead of job_id (0 if absent).
  size_t PositionOf(const std::string& job_id) const;

  // Ids in pop order.
  std::vector<std::string> Snapshot() const;

  size_t Size() const { return entries_.size(); }
  bool Empty() const { return entries_.empty(); }

 private:
  struct Key {
    core::JobPriority priority;
    uint64_t sequence;
    std::string job_id;

    bool operator<(const Key& o) const {
      if (priority != o.priority) return priority < o.priority;
      return sequence < o.sequence;
    }
  };

  std::set<Key> entries_;
  std::unordered_map<std::string, std::set<Key>::const_iterator> index_;
};

}  // namespace pixelctl::scheduler

#endif  // PIXELCTL_SCHEDULER_JOB_QUEUE_HPP_
