#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <list>
#include <shared_mutex>
#include <span>
#include <unordered_map>
#include <vector>

#include "nl/storage/buffer_pool.h"

namespace nl::storage {

// Bounded map from chunk index to decrypted payload for one reader session.
//
// Entries are evicted least-recently-used first, skipping any entry loaded
// within the recency window. When every resident entry is protected the one
// inserted earliest is evicted anyway so inserts always make progress.
// Evicted buffers are scrubbed and handed back to the pool outside the lock.
//
// CopyOut copies while holding the exclusive lock: an eviction can never
// scrub a buffer that a reader is still copying from.
class DecryptedChunkCache {
 public:
  using Clock = std::chrono::steady_clock;
  using NowFn = std::function<Clock::time_point()>;

  enum class CopyStatus { kHit, kMiss, kShort, kClosed };

  DecryptedChunkCache(size_t capacity, std::chrono::milliseconds recency_window,
                      BufferPool& pool, NowFn now = {});
  ~DecryptedChunkCache();

  DecryptedChunkCache(const DecryptedChunkCache&) = delete;
  DecryptedChunkCache& operator=(const DecryptedChunkCache&) = delete;

  // Copies dest.size() bytes starting at |offset| within chunk |index|.
  // kShort means the resident chunk holds fewer bytes than requested.
  CopyStatus CopyOut(uint32_t index, uint64_t offset, std::span<uint8_t> dest);

  // Takes ownership of |buffer| holding |length| valid bytes. Returns false
  // if the index was already resident or the cache is closed; the buffer is
  // then returned to the pool.
  bool Insert(uint32_t index, PooledBuffer buffer, size_t length);

  bool Contains(uint32_t index) const;

  // Evicts and scrubs every entry. Later inserts are refused.
  void Close();

  size_t Size() const;
  size_t capacity() const noexcept { return capacity_; }
  uint64_t Evictions() const noexcept { return evictions_.load(std::memory_order_relaxed); }

 private:
  struct Entry {
    PooledBuffer buffer;
    size_t length{0};
    Clock::time_point loaded_at{};
    uint64_t sequence{0};
  };

  void TouchLocked(uint32_t index);
  uint32_t SelectVictimLocked(Clock::time_point now) const;
  PooledBuffer EraseLocked(uint32_t index);
  void CheckInvariantsLocked() const;

  const size_t capacity_;
  const std::chrono::milliseconds recency_window_;
  BufferPool& pool_;
  NowFn now_;

  std::unordered_map<uint32_t, Entry> entries_;
  std::list<uint32_t> lru_list_;  // front = most recently used
  std::unordered_map<uint32_t, std::list<uint32_t>::iterator> lru_map_;
  uint64_t next_sequence_{0};
  bool closed_{false};
  std::atomic<uint64_t> evictions_{0};

  mutable std::shared_mutex mutex_;
};

}  // namespace nl::storage
