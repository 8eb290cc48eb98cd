#include "nl/storage/single_slot_reader.h"

#include <algorithm>
#include <cstring>
#include <exception>
#include <string>
#include <utility>

#include "nl/error.h"
#include "nl/errors.h"
#include "nl/security/zeroizer.h"

namespace nl::storage {

SingleSlotReader::SingleSlotReader(std::shared_ptr<ChunkSource> source, FileHandle handle,
                                   ChunkGeometry geometry)
    : source_(std::move(source)), handle_(handle), geometry_(geometry) {}

SingleSlotReader::~SingleSlotReader() {
  Close();
}

size_t SingleSlotReader::ReadAt(uint64_t position, std::span<uint8_t> dest) {
  std::lock_guard lock(mutex_);
  if (closed_) {
    throw Error{ErrorDomain::State, errors::state::kReaderClosed,
                std::string(errors::msg::kReaderClosed)};
  }
  if (dest.empty() || position >= geometry_.total_size) {
    return 0;
  }
  const size_t total =
      static_cast<size_t>(std::min<uint64_t>(dest.size(), geometry_.total_size - position));
  size_t copied = 0;
  while (copied < total) {
    const uint64_t absolute = position + copied;
    const uint32_t index = geometry_.IndexOf(absolute);
    const auto range = geometry_.Range(index);
    if (slot_index_ == index) {
      ++stats_.hits;
    } else {
      ++stats_.misses;
      LoadSlotLocked(index);
    }
    const auto offset = static_cast<size_t>(absolute - range.first);
    const size_t length =
        static_cast<size_t>(std::min<uint64_t>(total - copied, range.second - absolute));
    std::memcpy(dest.data() + copied, slot_.data() + offset, length);
    copied += length;
  }
  return copied;
}

void SingleSlotReader::LoadSlotLocked(uint32_t index) {
  ClearSlotLocked();
  const uint64_t expected = geometry_.ChunkLength(index);
  nl::security::SecureBuffer<uint8_t> plain;
  try {
    plain = source_->DecryptChunk(handle_.id, index);
  } catch (const std::exception& ex) {
    ++stats_.load_failures;
    throw Error{ErrorDomain::IO, errors::io::kChunkLoadFailed,
                std::string(errors::msg::kChunkLoadFailed) + ": " + ex.what(), std::nullopt,
                Retryability::kRetryable, {"chunk " + std::to_string(index)}};
  }
  ++stats_.decrypts;
  if (plain.size() < expected) {
    nl::security::Zeroizer::Scrub(plain.AsU8Span());
    ++stats_.load_failures;
    throw Error{ErrorDomain::IO, errors::io::kChunkLoadFailed,
                std::string(errors::msg::kChunkShorterThanGeometry), std::nullopt,
                Retryability::kFatal, {"chunk " + std::to_string(index)}};
  }
  slot_ = std::move(plain);
  slot_length_ = static_cast<size_t>(expected);
  slot_index_ = index;
}

void SingleSlotReader::ClearSlotLocked() noexcept {
  if (slot_index_) {
    ++stats_.evictions;
  }
  nl::security::Zeroizer::Scrub(slot_.AsU8Span());
  slot_ = nl::security::SecureBuffer<uint8_t>();
  slot_length_ = 0;
  slot_index_.reset();
}

void SingleSlotReader::Close() {
  std::lock_guard lock(mutex_);
  if (closed_) {
    return;
  }
  closed_ = true;
  ClearSlotLocked();
  detail::PublishReaderClosed(handle_, ReaderStrategy::kSingleSlot, stats_);
}

ReaderStats SingleSlotReader::Stats() const {
  std::lock_guard lock(mutex_);
  return stats_;
}

std::optional<uint32_t> SingleSlotReader::SlotIndex() const {
  std::lock_guard lock(mutex_);
  return slot_index_;
}

std::unique_ptr<RandomAccessReader> OpenSequentialReader(std::shared_ptr<ChunkSource> source,
                                                         const FileHandle& handle,
                                                         const ReaderPolicy& policy) {
  detail::RejectOversize(handle, policy);
  const ChunkGeometry geometry = detail::ResolveForReader(handle, policy);
  auto reader = std::make_unique<SingleSlotReader>(std::move(source), handle, geometry);
  detail::PublishReaderOpened(handle, geometry, ReaderStrategy::kSingleSlot, policy);
  return reader;
}

}  // namespace nl::storage
