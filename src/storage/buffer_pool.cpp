#include "nl/storage/buffer_pool.h"

#include <algorithm>
#include <utility>

#include "nl/security/zeroizer.h"

namespace nl::storage {

BufferPool::BufferPool(size_t canonical_size, size_t retention_limit)
    : canonical_size_(canonical_size), retention_limit_(retention_limit) {}

BufferPool::~BufferPool() {
  Drain();
}

PooledBuffer BufferPool::Acquire(size_t min_size) {
  {
    std::lock_guard lock(mutex_);
    auto it = std::find_if(free_.begin(), free_.end(),
                           [min_size](const PooledBuffer& b) { return b.size() >= min_size; });
    if (it != free_.end()) {
      PooledBuffer buffer = std::move(*it);
      free_.erase(it);
      reuses_.fetch_add(1, std::memory_order_relaxed);
      return buffer;
    }
  }
  allocations_.fetch_add(1, std::memory_order_relaxed);
  return PooledBuffer(std::max(min_size, canonical_size_));
}

void BufferPool::Release(PooledBuffer buffer) {
  if (buffer.empty()) {
    return;
  }
  // Scrub before taking the lock; a full chunk takes milliseconds.
  nl::security::Zeroizer::Scrub(buffer.AsU8Span());
  {
    std::lock_guard lock(mutex_);
    if (!drained_ && buffer.size() == canonical_size_ && free_.size() < retention_limit_) {
      free_.push_back(std::move(buffer));
      retained_.fetch_add(1, std::memory_order_relaxed);
      return;
    }
  }
  dropped_.fetch_add(1, std::memory_order_relaxed);
  // |buffer| is wiped again and freed on scope exit.
}

void BufferPool::Drain() {
  std::vector<PooledBuffer> victims;
  {
    std::lock_guard lock(mutex_);
    drained_ = true;
    victims.swap(free_);
  }
  for (auto& buffer : victims) {
    nl::security::Zeroizer::Scrub(buffer.AsU8Span());
  }
}

size_t BufferPool::FreeCount() const {
  std::lock_guard lock(mutex_);
  return free_.size();
}

BufferPool::Stats BufferPool::GetStats() const {
  Stats stats;
  stats.allocations = allocations_.load(std::memory_order_relaxed);
  stats.reuses = reuses_.load(std::memory_order_relaxed);
  stats.retained = retained_.load(std::memory_order_relaxed);
  stats.dropped = dropped_.load(std::memory_order_relaxed);
  return stats;
}

}  // namespace nl::storage
