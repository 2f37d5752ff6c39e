// Repository: pixelctl
// Component: Preview Cache
// Purpose: Byte-budgeted LRU store of rendered previews.
// Copyright (c) 2026 Pixelctl

#ifndef PIXELCTL_PREVIEW_PREVIEW_CACHE_HPP_
#define PIXELCTL_PREVIEW_PREVIEW_CACHE_HPP_

#include <cstddef>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

#include "pixelctl/preview/PreviewTypes.hpp"
#include "pixelctl/util/TimeSource.hpp"

namespace pixelctl::preview {

inline constexpr size_t kDefaultPreviewBudgetBytes = 50u * 1024u * 1024u;

enum class InsertOutcome {
  kInserted,
  kReplaced,  // An entry for the key existed and was swapped.
  kTooLarge,  // Larger than the whole budget; not stored.
};

struct PreviewCacheStats {
  size_t entries = 0;
  size_t bytes_used = 0;
  size_t budget_bytes = 0;
  uint64_t hits = 0;
  uint64_t misses = 0;
  uint64_t evictions = 0;
  uint64_t rejected_too_large = 0;
};

// PreviewCache holds immutable rendered bytes under a byte budget with strict
// LRU eviction.
//
// Invariant: bytes_used() <= budget at every point a caller can observe.
// Insert evicts the least recently accessed entry, one at a time, until the
// new entry fits, then inserts. An entry larger than the whole budget is never
// stored (and drops any older entry for the same key).
//
// Every hit moves the entry to the front, so lookups mutate; one mutex guards
// everything.
class PreviewCache {
 public:
  PreviewCache(size_t budget_bytes, const util::ITimeSource& time);

  // Hit: refreshes last access and returns the bytes. Miss: nullptr.
  PreviewBytes Lookup(const PreviewKey& key);

  InsertOutcome Insert(const PreviewKey& key, PreviewBytes bytes);

  // No access refresh.
  bool Contains(const PreviewKey& key) const;
  std::optional<int64_t> LastAccessMs(const PreviewKey& key) const;

  // Drops everything and resets byte accounting. Hit/miss counters survive.
  void Clear();

  size_t Size() const;
  size_t BytesUsed() const;
  size_t budget_bytes() const { return budget_bytes_; }
  PreviewCacheStats Stats() const;

  // Coldest first.
  std::vector<PreviewKey> KeysByRecency() const;

 private:
  struct Entry {
    PreviewKey key;
    PreviewBytes bytes;
    size_t size_bytes = 0;
    int64_t last_access_ms = 0;
  };
  using LruList = std::list<Entry>;

  void EraseLocked(LruList::iterator it);

  const size_t budget_bytes_;
  const util::ITimeSource& time_;

  mutable std::mutex mutex_;
  // Front = most recently accessed.
  LruList lru_;
  std::unordered_map<PreviewKey, LruList::iterator, PreviewKeyHash> index_;
  size_t bytes_used_ = 0;

  uint64_t hits_ = 0;
  uint64_t misses_ = 0;
  uint64_t evictions_ = 0;
  uint64_t rejected_too_large_ = 0;
};

}  // namespace pixelctl::preview

#endif  // PIXELCTL_PREVIEW_PREVIEW_CACHE_HPP_
