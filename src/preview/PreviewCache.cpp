// Repository: pixelctl
// Component: Preview Cache
// Purpose: Byte-budgeted LRU store of rendered previews.
// Copyright (c) 2026 Pixelctl

#include "pixelctl/preview/PreviewCache.hpp"

#include <iterator>
#include <sstream>

#include "pixelctl/util/Logger.hpp"

namespace pixelctl::preview {

using pixelctl::util::Logger;

PreviewCache::PreviewCache(size_t budget_bytes, const util::ITimeSource& time)
    : budget_bytes_(budget_bytes), time_(time) {}

PreviewBytes PreviewCache::Lookup(const PreviewKey& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto found = index_.find(key);
  if (found == index_.end()) {
    ++misses_;
    return nullptr;
  }
  ++hits_;
  lru_.splice(lru_.begin(), lru_, found->second);
  found->second->last_access_ms = time_.NowUtcMs();
  return found->second->bytes;
}

InsertOutcome PreviewCache::Insert(const PreviewKey& key, PreviewBytes bytes) {
  const size_t size = bytes ? bytes->size() : 0;
  std::lock_guard<std::mutex> lock(mutex_);

  bool replaced = false;
  auto existing = index_.find(key);
  if (existing != index_.end()) {
    EraseLocked(existing->second);
    replaced = true;
  }

  if (size > budget_bytes_) {
    ++rejected_too_large_;
    std::ostringstream oss;
    oss << "[PreviewCache] NOT_CACHED path=" << key.path << " size=" << size
        << " budget=" << budget_bytes_;
    Logger::Debug(oss.str());
    return InsertOutcome::kTooLarge;
  }

  while (bytes_used_ + size > budget_bytes_ && !lru_.empty()) {
    auto coldest = std::prev(lru_.end());
    std::ostringstream oss;
    oss << "[PreviewCache] EVICT path=" << coldest->key.path
        << " size=" << coldest->size_bytes;
    Logger::Debug(oss.str());
    EraseLocked(coldest);
    ++evictions_;
  }

  Entry entry;
  entry.key = key;
  entry.bytes = std::move(bytes);
  entry.size_bytes = size;
  entry.last_access_ms = time_.NowUtcMs();
  lru_.push_front(std::move(entry));
  index_.emplace(key, lru_.begin());
  bytes_used_ += size;
  return replaced ? InsertOutcome::kReplaced : InsertOutcome::kInserted;
}

bool PreviewCache::Contains(const PreviewKey& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return index_.count(key) != 0;
}

std::optional<int64_t> PreviewCache::LastAccessMs(const PreviewKey& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto found = index_.find(key);
  if (found == index_.end()) return std::nullopt;
  return found->second->last_access_ms;
}

void PreviewCache::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  index_.clear();
  lru_.clear();
  bytes_used_ = 0;
}

size_t PreviewCache::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return lru_.size();
}

size_t PreviewCache::BytesUsed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return bytes_used_;
}

PreviewCacheStats PreviewCache::Stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  PreviewCacheStats s;
  s.entries = lru_.size();
  s.bytes_used = bytes_used_;
  s.budget_bytes = budget_bytes_;
  s.hits = hits_;
  s.misses = misses_;
  s.evictions = evictions_;
  s.rejected_too_large = rejected_too_large_;
  return s;
}

std::vector<PreviewKey> PreviewCache::KeysByRecency() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<PreviewKey> keys;
  keys.reserve(lru_.size());
  for (auto it = lru_.rbegin(); it != lru_.rend(); ++it) keys.push_back(it->key);
  return keys;
}

void PreviewCache::EraseLocked(LruList::iterator it) {
  bytes_used_ -= it->size_bytes;
  index_.erase(it->key);
  lru_.erase(it);
}

}  // namespace pixelctl::preview
