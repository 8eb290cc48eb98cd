#pragma once
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace nl::security {

class Zeroizer {
public:
  // Overwrites |data| with zeros in a way the optimiser cannot elide.
  static void Wipe(std::span<uint8_t> data) noexcept;

  // Overwrites |data| with random bytes, then zeros. Plaintext chunk buffers go
  // through this before they are recycled or freed.
  static void Scrub(std::span<uint8_t> data) noexcept;

  static bool MemoryLockingSupported() noexcept;

  enum class LockStatus {
    Locked,
    BestEffort,
    Unsupported,
  };

  static LockStatus TryLockMemory(std::span<uint8_t> data) noexcept;
  static void UnlockMemory(std::span<uint8_t> data) noexcept;

  // Publishes a single warning per process the first time a secure buffer
  // could not lock all of its pages.
  static void ReportLockShortfall() noexcept;

  template <typename T>
  static void WipeVector(std::vector<T>& vec) noexcept {
    if (vec.empty()) {
      return;
    }
    const std::size_t bytes = vec.size() * sizeof(T);
    Wipe(std::span<uint8_t>(reinterpret_cast<uint8_t*>(vec.data()), bytes));
  }

  template <typename T>
  class ScopeWiper {
  public:
    explicit ScopeWiper(std::span<T> span) noexcept : span_(span) {}
    ScopeWiper(T* ptr, std::size_t count) noexcept : ScopeWiper(std::span<T>(ptr, count)) {}

    ScopeWiper(const ScopeWiper&) = delete;
    ScopeWiper& operator=(const ScopeWiper&) = delete;
    ScopeWiper(ScopeWiper&&) = delete;
    ScopeWiper& operator=(ScopeWiper&&) = delete;

    ~ScopeWiper() noexcept {
      if (span_.empty()) {
        return;
      }
      Zeroizer::Wipe(std::span<uint8_t>(reinterpret_cast<uint8_t*>(span_.data()),
                                        span_.size_bytes()));
    }

  private:
    std::span<T> span_;
  };

  // Scrubs the caller's plaintext on every exit path, including throws.
  class ScopeScrubber {
  public:
    explicit ScopeScrubber(std::span<uint8_t> span) noexcept : span_(span) {}

    ScopeScrubber(const ScopeScrubber&) = delete;
    ScopeScrubber& operator=(const ScopeScrubber&) = delete;

    ~ScopeScrubber() noexcept { Zeroizer::Scrub(span_); }

  private:
    std::span<uint8_t> span_;
  };
};

} // namespace nl::security
