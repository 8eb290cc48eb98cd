#pragma once

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>

#include "nl/error.h"
#include "nl/errors.h"
#include "nl/security/secure_buffer.h"
#include "nl/storage/chunk_source.h"

namespace nl::test {

// Deterministic in-memory engine. Byte |p| of the file is PatternByte(p).
// Chosen indices can be gated (the decrypt blocks until released), made to
// fail a number of times, or returned short.
class FakeChunkSource final : public nl::storage::ChunkSource {
 public:
  FakeChunkSource(uint64_t total_size, uint64_t chunk_size)
      : total_size_(total_size), chunk_size_(chunk_size) {}

  ~FakeChunkSource() override { ReleaseAll(); }

  static uint8_t PatternByte(uint64_t position) {
    return static_cast<uint8_t>((position * 2654435761ULL) >> 13) ^
           static_cast<uint8_t>(position >> 8);
  }

  nl::storage::FileHandle Handle() const {
    nl::storage::FileHandle handle;
    handle.id.fill(0x5A);
    handle.total_size = total_size_;
    handle.chunk_count = static_cast<uint32_t>(
        chunk_size_ == 0 ? 0 : (total_size_ + chunk_size_ - 1) / chunk_size_);
    return handle;
  }

  nl::security::SecureBuffer<uint8_t> DecryptChunk(const FileId&, uint32_t index) override {
    std::unique_lock lock(mutex_);
    ++calls_[index];
    ++total_calls_;
    started_.insert(index);
    cv_.notify_all();
    cv_.wait(lock, [&]() { return gated_.count(index) == 0; });
    if (auto it = failures_.find(index); it != failures_.end() && it->second > 0) {
      --it->second;
      throw Error{ErrorDomain::IO, 0, "injected decrypt failure for chunk " + std::to_string(index)};
    }
    const auto delay = delay_;
    const bool short_chunk = short_.count(index) != 0;
    lock.unlock();

    if (delay.count() > 0) {
      std::this_thread::sleep_for(delay);
    }
    const uint64_t start = static_cast<uint64_t>(index) * chunk_size_;
    const uint64_t end = std::min(start + chunk_size_, total_size_);
    uint64_t length = end > start ? end - start : 0;
    if (short_chunk && length > 0) {
      length /= 2;
    }
    nl::security::SecureBuffer<uint8_t> out(static_cast<size_t>(length));
    for (uint64_t i = 0; i < length; ++i) {
      out.data()[i] = PatternByte(start + i);
    }
    return out;
  }

  void Gate(uint32_t index) {
    std::lock_guard lock(mutex_);
    gated_.insert(index);
  }

  void Release(uint32_t index) {
    {
      std::lock_guard lock(mutex_);
      gated_.erase(index);
    }
    cv_.notify_all();
  }

  void ReleaseAll() {
    {
      std::lock_guard lock(mutex_);
      gated_.clear();
    }
    cv_.notify_all();
  }

  void FailTimes(uint32_t index, int times) {
    std::lock_guard lock(mutex_);
    failures_[index] = times;
  }

  void ReturnShort(uint32_t index) {
    std::lock_guard lock(mutex_);
    short_.insert(index);
  }

  void SetDelay(std::chrono::milliseconds delay) {
    std::lock_guard lock(mutex_);
    delay_ = delay;
  }

  // Waits until a decrypt of |index| has started.
  bool WaitForStart(uint32_t index, std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, timeout, [&]() { return started_.count(index) != 0; });
  }

  int Calls(uint32_t index) const {
    std::lock_guard lock(mutex_);
    auto it = calls_.find(index);
    return it == calls_.end() ? 0 : it->second;
  }

  int TotalCalls() const {
    std::lock_guard lock(mutex_);
    return total_calls_;
  }

 private:
  const uint64_t total_size_;
  const uint64_t chunk_size_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::map<uint32_t, int> calls_;
  std::map<uint32_t, int> failures_;
  std::set<uint32_t> gated_;
  std::set<uint32_t> started_;
  std::set<uint32_t> short_;
  std::chrono::milliseconds delay_{0};
  int total_calls_{0};
};

}  // namespace nl::test
