#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <span>

#include "nl/security/secure_buffer.h"
#include "nl/storage/buffer_pool.h"
#include "nl/storage/chunk_cache.h"
#include "nl/storage/chunk_geometry.h"
#include "nl/storage/chunk_source.h"
#include "nl/storage/prefetch.h"
#include "nl/storage/reader_policy.h"
#include "nl/storage/task_pool.h"

namespace nl::storage {

enum class ReaderStrategy { kPreload, kWindowed, kSingleSlot };

const char* ReaderStrategyName(ReaderStrategy strategy);

struct ReaderStats {
  uint64_t hits{0};
  uint64_t misses{0};
  uint64_t decrypts{0};
  uint64_t evictions{0};
  uint64_t retries{0};
  uint64_t load_failures{0};
  uint64_t prefetch_scheduled{0};
  uint64_t prefetch_cancelled{0};
};

// Read surface handed to media decoders.
//
// ReadAt returns the number of bytes copied, and 0 only at or past the end of
// the stream. A chunk that cannot be loaded is reported by throwing
// nl::Error; the result is never silently truncated or zero-filled. ReadAt
// after Close throws Error{State, kReaderClosed}. Close is idempotent, safe to
// call concurrently with reads, and returns only after every plaintext buffer
// owned by the reader has been scrubbed.
class RandomAccessReader {
 public:
  virtual ~RandomAccessReader() = default;

  virtual size_t ReadAt(uint64_t position, std::span<uint8_t> dest) = 0;
  virtual uint64_t Size() const = 0;
  virtual void Close() = 0;

  virtual ReaderStrategy strategy() const = 0;
  virtual ReaderStats Stats() const = 0;
};

// Decrypts the whole file once into a single locked buffer.
class PreloadedReader final : public RandomAccessReader {
 public:
  // Throws ChunkLoadFailed / ChunkLoadTimeout if the preload does not
  // complete within policy.preload_timeout.
  PreloadedReader(std::shared_ptr<ChunkSource> source, FileHandle handle, ChunkGeometry geometry,
                  const ReaderPolicy& policy);
  ~PreloadedReader() override;

  size_t ReadAt(uint64_t position, std::span<uint8_t> dest) override;
  uint64_t Size() const override { return geometry_.total_size; }
  void Close() override;
  ReaderStrategy strategy() const override { return ReaderStrategy::kPreload; }
  ReaderStats Stats() const override;

 private:
  struct PreloadJob;

  ChunkGeometry geometry_;
  nl::security::SecureBuffer<uint8_t> data_;
  uint64_t decrypts_{0};
  bool closed_{false};
  mutable std::shared_mutex mutex_;
};

// Windowed strategy: bounded decrypted-chunk cache, pooled buffers, and
// background prefetch ahead of the cursor.
class WindowedReader final : public RandomAccessReader {
 public:
  WindowedReader(std::shared_ptr<ChunkSource> source, FileHandle handle, ChunkGeometry geometry,
                 const ReaderPolicy& policy);
  ~WindowedReader() override;

  size_t ReadAt(uint64_t position, std::span<uint8_t> dest) override;
  uint64_t Size() const override { return geometry_.total_size; }
  void Close() override;
  ReaderStrategy strategy() const override { return ReaderStrategy::kWindowed; }
  ReaderStats Stats() const override;

  const ChunkGeometry& geometry() const noexcept { return geometry_; }
  size_t ResidentChunks() const { return cache_->Size(); }
  size_t CacheCapacityChunks() const noexcept { return cache_->capacity(); }
  bool PrefetchInFlight(uint32_t index) const;

 private:
  void ReadFromChunk(uint32_t index, uint64_t offset, std::span<uint8_t> dest);
  void LoadUrgent(uint32_t index);
  void FillChunk(uint32_t index);
  void NoteCursor(uint64_t position, size_t length);
  bool SleepUnlessClosed(std::chrono::milliseconds delay);
  [[noreturn]] void ThrowClosed() const;
  void PublishLoadFailure(uint32_t index, const std::exception& cause);

  std::shared_ptr<ChunkSource> source_;
  FileHandle handle_;
  ChunkGeometry geometry_;
  ReaderPolicy policy_;

  std::unique_ptr<BufferPool> pool_;
  std::unique_ptr<DecryptedChunkCache> cache_;
  std::unique_ptr<TaskPool> tasks_;
  std::unique_ptr<PrefetchScheduler> prefetch_;
  // Guards prefetch_ against Close for Stats and PrefetchInFlight; the read
  // path is fenced by active_reads_ instead. Counters survive the scheduler.
  mutable std::mutex prefetch_mutex_;
  uint64_t final_prefetch_scheduled_{0};
  uint64_t final_prefetch_cancelled_{0};

  static constexpr uint64_t kNoCursor = UINT64_MAX;
  std::atomic<uint64_t> expected_next_{kNoCursor};

  std::atomic<uint64_t> hits_{0};
  std::atomic<uint64_t> misses_{0};
  std::atomic<uint64_t> decrypts_{0};
  std::atomic<uint64_t> retries_{0};
  std::atomic<uint64_t> load_failures_{0};

  std::atomic<bool> closed_{false};
  std::mutex close_mutex_;
  std::mutex state_mutex_;
  std::condition_variable state_cv_;
  size_t active_reads_{0};
};

// Chooses the strategy for |handle|: files above policy.max_file_bytes are
// rejected before any decrypt, files up to the preload threshold are
// preloaded, larger ones are windowed.
std::unique_ptr<RandomAccessReader> OpenReader(std::shared_ptr<ChunkSource> source,
                                               const FileHandle& handle,
                                               const ReaderPolicy& policy = {});

namespace detail {
// Throws Error{Validation, kOversizeRejected} when the handle is too large.
void RejectOversize(const FileHandle& handle, const ReaderPolicy& policy);
// Resolves geometry and reports non-standard layouts.
ChunkGeometry ResolveForReader(const FileHandle& handle, const ReaderPolicy& policy);
void PublishReaderOpened(const FileHandle& handle, const ChunkGeometry& geometry,
                         ReaderStrategy strategy, const ReaderPolicy& policy);
void PublishReaderClosed(const FileHandle& handle, ReaderStrategy strategy,
                         const ReaderStats& stats);
}  // namespace detail

}  // namespace nl::storage
