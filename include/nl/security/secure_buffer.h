#pragma once
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <new>
#include <span>
#include <vector>

#include "nl/common.h"
#include "nl/security/zeroizer.h"

namespace nl::security {

// Move-only heap buffer for plaintext. Pages are locked best-effort in 64 KiB
// regions and the whole allocation is wiped before it is returned to the heap.
template<typename T>
class SecureBuffer {
  T* ptr_{nullptr};
  size_t size_{0};
  size_t allocation_size_{0};
  bool locked_{false};
  struct LockRegion {
    uint8_t* begin{nullptr};
    size_t length{0};
    bool locked{false};
  };
  std::vector<LockRegion> lock_regions_;

  void Release() noexcept {
    if (ptr_ && allocation_size_ > 0) {
      Zeroizer::Wipe(std::span<uint8_t>(reinterpret_cast<uint8_t*>(ptr_), allocation_size_));
      for (auto& region : lock_regions_) {
        if (region.locked) {
          Zeroizer::UnlockMemory(std::span<uint8_t>(region.begin, region.length));
        }
      }
    }
    std::free(ptr_);
    ptr_ = nullptr;
    size_ = 0;
    allocation_size_ = 0;
    locked_ = false;
    lock_regions_.clear();
  }

  static size_t RoundUpToAlignment(size_t value) {
    const size_t alignment = alignof(T);
    if (alignment <= 1U) {
      return value;
    }
    const size_t remainder = value % alignment;
    if (remainder == 0U) {
      return value;
    }
    const size_t padding = alignment - remainder;
    if (value > (std::numeric_limits<size_t>::max() - padding)) {
      throw std::bad_array_new_length{};
    }
    return value + padding;
  }

  void LockPages() {
    if (!Zeroizer::MemoryLockingSupported()) {
      return;
    }
    auto* raw = reinterpret_cast<uint8_t*>(ptr_);
    constexpr size_t kRegionTarget = 64U * 1024U;
    size_t offset = 0;
    bool all_locked = true;
    while (offset < allocation_size_) {
      const size_t length = std::min(kRegionTarget, allocation_size_ - offset);
      const auto status = Zeroizer::TryLockMemory(std::span<uint8_t>(raw + offset, length));
      const bool region_locked = status == Zeroizer::LockStatus::Locked;
      lock_regions_.push_back(LockRegion{raw + offset, length, region_locked});
      all_locked = all_locked && region_locked;
      offset += length;
    }
    locked_ = all_locked;
    if (!locked_) {
      Zeroizer::ReportLockShortfall();
    }
  }

public:
  SecureBuffer() = default;

  explicit SecureBuffer(size_t n) : size_(n) {
    if (n > 0 && n > (std::numeric_limits<size_t>::max() / sizeof(T))) {
      throw std::bad_array_new_length{};
    }
    const size_t bytes = n * sizeof(T);
    if (bytes == 0) {
      return;
    }
    allocation_size_ = RoundUpToAlignment(bytes);
    ptr_ = static_cast<T*>(std::aligned_alloc(alignof(T), allocation_size_));
    if (!ptr_) {
      size_ = 0;
      allocation_size_ = 0;
      throw std::bad_alloc{};
    }
    Zeroizer::Wipe(std::span<uint8_t>(reinterpret_cast<uint8_t*>(ptr_), allocation_size_));
    try {
      LockPages();
    } catch (...) {
      Release();
      throw;
    }
  }
  ~SecureBuffer() {
    Release();
  }
  SecureBuffer(const SecureBuffer&) = delete;
  SecureBuffer& operator=(const SecureBuffer&) = delete;
  SecureBuffer(SecureBuffer&& o) noexcept
      : ptr_(o.ptr_), size_(o.size_), allocation_size_(o.allocation_size_), locked_(o.locked_),
        lock_regions_(std::move(o.lock_regions_)) {
    o.ptr_ = nullptr;
    o.size_ = 0;
    o.allocation_size_ = 0;
    o.locked_ = false;
    o.lock_regions_.clear();
  }
  SecureBuffer& operator=(SecureBuffer&& o) noexcept {
    if (this != &o) {
      Release();
      ptr_ = o.ptr_;
      size_ = o.size_;
      allocation_size_ = o.allocation_size_;
      locked_ = o.locked_;
      lock_regions_ = std::move(o.lock_regions_);
      o.ptr_ = nullptr;
      o.size_ = 0;
      o.allocation_size_ = 0;
      o.locked_ = false;
      o.lock_regions_.clear();
    }
    return *this;
  }
  T* data() noexcept { return ptr_; }
  const T* data() const noexcept { return ptr_; }
  size_t size() const noexcept { return size_; }
  bool empty() const noexcept { return size_ == 0; }
  std::span<T> AsSpan() noexcept { return {ptr_, size_}; }
  std::span<const T> AsSpan() const noexcept { return {ptr_, size_}; }
  std::span<uint8_t> AsU8Span() noexcept {
    return {reinterpret_cast<uint8_t*>(ptr_), size_ * sizeof(T)};
  }
  std::span<const uint8_t> AsU8Span() const noexcept {
    return {reinterpret_cast<const uint8_t*>(ptr_), size_ * sizeof(T)};
  }
  bool IsLocked() const noexcept { return locked_; }
};

} // namespace nl::security
