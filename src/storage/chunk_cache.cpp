#include "nl/storage/chunk_cache.h"

#include <algorithm>
#include <cassert>
#include <cstring>
#include <iterator>
#include <limits>
#include <mutex>
#include <utility>

namespace nl::storage {

DecryptedChunkCache::DecryptedChunkCache(size_t capacity, std::chrono::milliseconds recency_window,
                                         BufferPool& pool, NowFn now)
    : capacity_(std::max<size_t>(1, capacity)),
      recency_window_(recency_window),
      pool_(pool),
      now_(now ? std::move(now) : NowFn([] { return Clock::now(); })) {}

DecryptedChunkCache::~DecryptedChunkCache() {
  Close();
}

DecryptedChunkCache::CopyStatus DecryptedChunkCache::CopyOut(uint32_t index, uint64_t offset,
                                                             std::span<uint8_t> dest) {
  std::unique_lock lock(mutex_);  // exclusive: the copy must finish before any eviction
  if (closed_) {
    return CopyStatus::kClosed;
  }
  auto it = entries_.find(index);
  if (it == entries_.end()) {
    return CopyStatus::kMiss;
  }
  const Entry& entry = it->second;
  if (offset > entry.length || dest.size() > entry.length - offset) {
    return CopyStatus::kShort;
  }
  if (!dest.empty()) {
    std::memcpy(dest.data(), entry.buffer.data() + offset, dest.size());
  }
  TouchLocked(index);
  return CopyStatus::kHit;
}

bool DecryptedChunkCache::Insert(uint32_t index, PooledBuffer buffer, size_t length) {
  std::vector<PooledBuffer> victims;
  bool inserted = false;
  {
    std::unique_lock lock(mutex_);
    CheckInvariantsLocked();
    if (!closed_ && entries_.find(index) == entries_.end()) {
      const auto now = now_();
      while (entries_.size() >= capacity_) {
        victims.push_back(EraseLocked(SelectVictimLocked(now)));
        evictions_.fetch_add(1, std::memory_order_relaxed);
      }
      Entry entry;
      entry.buffer = std::move(buffer);
      entry.length = std::min(length, entry.buffer.size());
      entry.loaded_at = now;
      entry.sequence = next_sequence_++;
      entries_.emplace(index, std::move(entry));
      TouchLocked(index);
      inserted = true;
    }
    CheckInvariantsLocked();
  }
  if (!inserted) {
    pool_.Release(std::move(buffer));
  }
  for (auto& victim : victims) {
    pool_.Release(std::move(victim));
  }
  return inserted;
}

bool DecryptedChunkCache::Contains(uint32_t index) const {
  std::shared_lock lock(mutex_);
  return entries_.find(index) != entries_.end();
}

void DecryptedChunkCache::Close() {
  std::vector<PooledBuffer> victims;
  {
    std::unique_lock lock(mutex_);
    closed_ = true;
    victims.reserve(entries_.size());
    for (auto& [index, entry] : entries_) {
      victims.push_back(std::move(entry.buffer));
    }
    entries_.clear();
    lru_list_.clear();
    lru_map_.clear();
  }
  for (auto& victim : victims) {
    pool_.Release(std::move(victim));
  }
}

size_t DecryptedChunkCache::Size() const {
  std::shared_lock lock(mutex_);
  return entries_.size();
}

void DecryptedChunkCache::TouchLocked(uint32_t index) {
  if (!lru_list_.empty() && lru_list_.front() == index) {
    return;
  }
  if (auto map_it = lru_map_.find(index); map_it != lru_map_.end()) {
    lru_list_.erase(map_it->second);
  }
  lru_list_.push_front(index);
  lru_map_[index] = lru_list_.begin();
}

uint32_t DecryptedChunkCache::SelectVictimLocked(Clock::time_point now) const {
  for (auto it = lru_list_.rbegin(); it != lru_list_.rend(); ++it) {
    const auto& entry = entries_.at(*it);
    if (now - entry.loaded_at >= recency_window_) {
      return *it;
    }
  }
  // Everything is inside the recency window: fall back to insertion order.
  uint32_t victim = lru_list_.back();
  uint64_t oldest = std::numeric_limits<uint64_t>::max();
  for (const auto& [index, entry] : entries_) {
    if (entry.sequence < oldest) {
      oldest = entry.sequence;
      victim = index;
    }
  }
  return victim;
}

PooledBuffer DecryptedChunkCache::EraseLocked(uint32_t index) {
  PooledBuffer buffer;
  if (auto it = entries_.find(index); it != entries_.end()) {
    buffer = std::move(it->second.buffer);
    entries_.erase(it);
  }
  if (auto lru_it = lru_map_.find(index); lru_it != lru_map_.end()) {
    lru_list_.erase(lru_it->second);
    lru_map_.erase(lru_it);
  }
  return buffer;
}

void DecryptedChunkCache::CheckInvariantsLocked() const {
#ifndef NDEBUG
  assert(entries_.size() == lru_map_.size());
  assert(lru_map_.size() == lru_list_.size());
  assert(entries_.size() <= capacity_);
  for (const auto& [index, entry] : entries_) {
    assert(lru_map_.find(index) != lru_map_.end());
    assert(entry.length <= entry.buffer.size());
  }
#endif
}

}  // namespace nl::storage
