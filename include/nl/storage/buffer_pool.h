#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

#include "nl/security/secure_buffer.h"

namespace nl::storage {

using PooledBuffer = nl::security::SecureBuffer<uint8_t>;

// Free list of chunk-sized plaintext buffers for one reader session. Every
// buffer is scrubbed (random then zero) on release, so Acquire never hands out
// residual plaintext.
class BufferPool {
 public:
  struct Stats {
    uint64_t allocations{0};
    uint64_t reuses{0};
    uint64_t retained{0};
    uint64_t dropped{0};
  };

  BufferPool(size_t canonical_size, size_t retention_limit);
  ~BufferPool();

  BufferPool(const BufferPool&) = delete;
  BufferPool& operator=(const BufferPool&) = delete;

  // Returns a free buffer of at least |min_size| bytes, else a new one of
  // max(min_size, canonical_size).
  PooledBuffer Acquire(size_t min_size);

  // Scrubs |buffer| and keeps it only if its size is canonical, fewer than
  // retention_limit buffers are free and the pool is not drained.
  void Release(PooledBuffer buffer);

  // Frees every pooled buffer and refuses further retention.
  void Drain();

  size_t FreeCount() const;
  size_t canonical_size() const noexcept { return canonical_size_; }
  Stats GetStats() const;

 private:
  const size_t canonical_size_;
  const size_t retention_limit_;

  mutable std::mutex mutex_;
  std::vector<PooledBuffer> free_;
  bool drained_{false};

  std::atomic<uint64_t> allocations_{0};
  std::atomic<uint64_t> reuses_{0};
  std::atomic<uint64_t> retained_{0};
  std::atomic<uint64_t> dropped_{0};
};

}  // namespace nl::storage
