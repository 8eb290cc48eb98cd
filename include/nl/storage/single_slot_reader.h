#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <span>

#include "nl/security/secure_buffer.h"
#include "nl/storage/chunk_geometry.h"
#include "nl/storage/chunk_source.h"
#include "nl/storage/random_access_reader.h"
#include "nl/storage/reader_policy.h"

namespace nl::storage {

// Holds at most one decrypted chunk. Moving to another index scrubs the
// previous chunk first. Decrypts run synchronously on the calling thread.
class SingleSlotReader final : public RandomAccessReader {
 public:
  SingleSlotReader(std::shared_ptr<ChunkSource> source, FileHandle handle,
                   ChunkGeometry geometry);
  ~SingleSlotReader() override;

  size_t ReadAt(uint64_t position, std::span<uint8_t> dest) override;
  uint64_t Size() const override { return geometry_.total_size; }
  void Close() override;
  ReaderStrategy strategy() const override { return ReaderStrategy::kSingleSlot; }
  ReaderStats Stats() const override;

  std::optional<uint32_t> SlotIndex() const;

 private:
  void LoadSlotLocked(uint32_t index);
  void ClearSlotLocked() noexcept;

  std::shared_ptr<ChunkSource> source_;
  FileHandle handle_;
  ChunkGeometry geometry_;

  mutable std::mutex mutex_;
  nl::security::SecureBuffer<uint8_t> slot_;
  size_t slot_length_{0};
  std::optional<uint32_t> slot_index_;
  bool closed_{false};
  ReaderStats stats_;
};

// Sequential readers (export, hashing) use the single-slot strategy. Oversize
// handles are rejected before any decrypt.
std::unique_ptr<RandomAccessReader> OpenSequentialReader(std::shared_ptr<ChunkSource> source,
                                                         const FileHandle& handle,
                                                         const ReaderPolicy& policy = {});

}  // namespace nl::storage
