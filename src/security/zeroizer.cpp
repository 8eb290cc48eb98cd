#include "nl/security/zeroizer.h"

#include "nl/crypto/random.h"
#include "nl/orchestrator/event_bus.h"

#include <atomic>
#include <cerrno>
#include <cstdlib>
#include <exception>
#include <mutex>
#include <string>

#include <sys/mman.h>
#include <sys/resource.h>
#include <unistd.h>

#if defined(_POSIX_VERSION) || defined(__APPLE__)
#define NL_HAS_POSIX_LOCKING 1
#else
#define NL_HAS_POSIX_LOCKING 0
#endif

namespace nl::security {
  namespace {

    inline void PortableZero(std::span<uint8_t> data) noexcept {
      if (data.empty()) {
        return;
      }
      volatile uint8_t* ptr = reinterpret_cast<volatile uint8_t*>(data.data());
      for (std::size_t i = 0; i < data.size(); ++i) {
        ptr[i] = 0;
      }
#if defined(__GNUC__) || defined(__clang__)
      __asm__ __volatile__("" ::: "memory");
#endif
      std::atomic_thread_fence(std::memory_order_seq_cst);
    }

    struct LockedRegion {
      uint8_t* ptr{nullptr};
      std::size_t size{0};
      std::size_t refcount{0};
    };

    std::mutex g_lock_registry_mutex;
    std::vector<LockedRegion> g_lock_registry;

    void RegisterLock(uint8_t* ptr, std::size_t size) noexcept {
      if (!ptr || size == 0) {
        return;
      }
      std::lock_guard<std::mutex> guard(g_lock_registry_mutex);
      for (auto& region : g_lock_registry) {
        if (region.ptr == ptr && region.size == size) {
          region.refcount += 1;
          return;
        }
      }
      try {
        g_lock_registry.push_back(LockedRegion{ptr, size, 1});
      } catch (const std::exception&) {
        // Untracked regions are released by free(); munlock is only an optimisation.
      }
    }

    bool UnregisterLock(uint8_t* ptr, std::size_t size) noexcept {
      if (!ptr || size == 0) {
        return false;
      }
      std::lock_guard<std::mutex> guard(g_lock_registry_mutex);
      for (auto it = g_lock_registry.begin(); it != g_lock_registry.end(); ++it) {
        if (it->ptr == ptr && it->size == size) {
          if (it->refcount > 1) {
            it->refcount -= 1;
          } else {
            g_lock_registry.erase(it);
          }
          return true;
        }
      }
      return false;
    }

    void PublishMemoryWarning(const char* event_id, const char* message, int err) noexcept {
      try {
        nl::orchestrator::Event event;
        event.category = nl::orchestrator::EventCategory::kSecurity;
        event.severity = nl::orchestrator::EventSeverity::kWarning;
        event.event_id = event_id;
        event.message = message;
        if (err != 0) {
          event.fields.emplace_back("errno", std::to_string(err),
                                    nl::orchestrator::FieldPrivacy::kPublic, true);
        }
        nl::orchestrator::EventBus::Instance().Publish(event);
      } catch (const std::exception&) {
        // Logging must never turn a best-effort lock into a hard failure.
      }
    }

#if NL_HAS_POSIX_LOCKING
    void AdjustMemlockLimitIfNeeded() noexcept {
      struct rlimit current {};
      if (::getrlimit(RLIMIT_MEMLOCK, &current) != 0) {
        return;
      }

      constexpr rlim_t kDesired = 512U * 1024U * 1024U; // 512 MiB
      if (current.rlim_cur == RLIM_INFINITY || current.rlim_cur >= kDesired) {
        return;
      }

      struct rlimit requested = current;
      if (current.rlim_max == RLIM_INFINITY || current.rlim_max >= kDesired) {
        requested.rlim_cur = kDesired;
      } else {
        requested.rlim_cur = current.rlim_max;
      }
      if (requested.rlim_cur <= current.rlim_cur) {
        return;
      }
      if (::setrlimit(RLIMIT_MEMLOCK, &requested) != 0) {
        PublishMemoryWarning("memlock_limit_unchanged",
                             "Could not raise RLIMIT_MEMLOCK; run with CAP_IPC_LOCK", errno);
      }
    }

    void MaybeEnableProcessWideLocking() noexcept {
      const char* env = std::getenv("NL_USE_MLOCKALL");
      if (!env || env[0] == '\0' || env[0] == '0') {
        return;
      }
#if (defined(__linux__) || defined(__FreeBSD__)) && defined(MCL_CURRENT) && defined(MCL_FUTURE)
      if (::mlockall(MCL_CURRENT | MCL_FUTURE) != 0) {
        PublishMemoryWarning("memory_lock_failure", "Process-wide memory locking failed", errno);
      }
#else
      PublishMemoryWarning("memory_lock_unavailable",
                           "mlockall() not available; NL_USE_MLOCKALL ignored", 0);
#endif
    }

    void EnsurePosixLockingConfigured() noexcept {
      static std::once_flag once;
      std::call_once(once, []() {
        AdjustMemlockLimitIfNeeded();
        MaybeEnableProcessWideLocking();
      });
    }
#endif

  } // namespace

  void Zeroizer::Wipe(std::span<uint8_t> data) noexcept {
    if (data.empty()) {
      return;
    }
    PortableZero(data);
    std::atomic_signal_fence(std::memory_order_seq_cst);
  }

  void Zeroizer::Scrub(std::span<uint8_t> data) noexcept {
    if (data.empty()) {
      return;
    }
    try {
      nl::crypto::SystemRandomBytes(data);
    } catch (const std::exception&) {
      // The zero pass below still clears the contents.
    }
    Wipe(data);
  }

  bool Zeroizer::MemoryLockingSupported() noexcept {
    return NL_HAS_POSIX_LOCKING != 0;
  }

  Zeroizer::LockStatus Zeroizer::TryLockMemory(std::span<uint8_t> data) noexcept {
    if (data.empty()) {
      return LockStatus::Locked;
    }
#if NL_HAS_POSIX_LOCKING
    EnsurePosixLockingConfigured();
    if (::mlock(data.data(), data.size()) == 0) {
      RegisterLock(data.data(), data.size());
      return LockStatus::Locked;
    }
    if (errno == ENOSYS) {
      return LockStatus::Unsupported;
    }
    return LockStatus::BestEffort;
#else
    return LockStatus::Unsupported;
#endif
  }

  void Zeroizer::UnlockMemory(std::span<uint8_t> data) noexcept {
    if (data.empty()) {
      return;
    }
    if (!UnregisterLock(data.data(), data.size())) {
      return;
    }
#if NL_HAS_POSIX_LOCKING
    ::munlock(data.data(), data.size());
#endif
  }

  void Zeroizer::ReportLockShortfall() noexcept {
    static std::atomic<bool> reported{false};
    if (reported.exchange(true)) {
      return;
    }
    PublishMemoryWarning("secure_buffer_unlocked",
                         "Unable to lock all sensitive memory; plaintext may page to disk", 0);
  }

} // namespace nl::security
