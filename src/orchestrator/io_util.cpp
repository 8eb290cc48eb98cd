#include "nl/orchestrator/io_util.h"

#include "nl/common.h"
#include "nl/crypto/random.h"
#include "nl/errors.h"

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <type_traits>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#if defined(__linux__)
#include <sys/statfs.h>
#elif defined(__APPLE__) || defined(__FreeBSD__)
#include <sys/mount.h>
#include <sys/param.h>
#endif

namespace nl::orchestrator {
namespace {

constexpr const char* kAtomicReplaceErrorMessage = "Atomic file replace failed";
constexpr const char* kAtomicUnsupportedMessage = "Filesystem does not support atomic rename";
constexpr size_t kWipeBlockSize = 4096;

class ErrorContext {
 public:
  void Push(std::string context) { context_stack_.push_back(std::move(context)); }
  void Pop() {
    if (!context_stack_.empty()) {
      context_stack_.pop_back();
    }
  }
  [[nodiscard]] std::vector<std::string> Stack() const { return context_stack_; }
  [[nodiscard]] std::string Format(std::string_view message) const {
    std::ostringstream oss;
    oss << message;
    for (auto it = context_stack_.rbegin(); it != context_stack_.rend(); ++it) {
      oss << "\n  while: " << *it;
    }
    return oss.str();
  }

 private:
  std::vector<std::string> context_stack_;
};

class ScopedErrorContext {
 public:
  ScopedErrorContext(ErrorContext& ctx, std::string description) : ctx_(ctx) {
    ctx_.Push(std::move(description));
  }
  ScopedErrorContext(const ScopedErrorContext&) = delete;
  ScopedErrorContext& operator=(const ScopedErrorContext&) = delete;
  ~ScopedErrorContext() { ctx_.Pop(); }

 private:
  ErrorContext& ctx_;
};

nl::Retryability ClassifyNativeError(int native) {
  switch (native) {
    case EINTR:
    case EAGAIN:
#if defined(EWOULDBLOCK) && EWOULDBLOCK != EAGAIN
    case EWOULDBLOCK:
#endif
      return nl::Retryability::kRetryable;
    case EBUSY:
    case ETIMEDOUT:
      return nl::Retryability::kTransient;
    default:
      break;
  }
  return nl::Retryability::kFatal;
}

std::vector<std::string> MergeContext(const std::vector<std::string>& existing,
                                      const ErrorContext& ctx) {
  auto merged = existing;
  auto stack = ctx.Stack();
  merged.insert(merged.end(), stack.begin(), stack.end());
  return merged;
}

[[noreturn]] void ThrowIoError(const ErrorContext& ctx, int code, std::string message,
                               std::optional<int> native = std::nullopt,
                               nl::Retryability retry = nl::Retryability::kFatal) {
  auto stack = ctx.Stack();
  std::optional<int> native_value = native;
  if (!native_value.has_value() && code != 0) {
    native_value = code;
  }
  throw Error{ErrorDomain::IO, code, ctx.Format(std::move(message)), native_value, retry,
              std::move(stack)};
}

[[noreturn]] void ThrowErrno(const ErrorContext& ctx, int saved_errno, std::string message) {
  ThrowIoError(ctx, saved_errno, std::move(message), saved_errno, ClassifyNativeError(saved_errno));
}

Error AugmentError(const Error& err, const ErrorContext& ctx) {
  return Error{err.domain,         err.code,          ctx.Format(err.what()),
               err.native_code,    err.retryability,  MergeContext(err.context, ctx)};
}

template <typename Func>
auto WithContext(ErrorContext& ctx, std::string description, Func&& fn)
    -> std::invoke_result_t<Func&> {
  ScopedErrorContext scoped(ctx, std::move(description));
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Func&>>) {
      fn();
      return;
    } else {
      return fn();
    }
  } catch (const Error& err) {
    if (err.context.empty()) {
      throw AugmentError(err, ctx);
    }
    throw;
  } catch (const std::system_error& sys_err) {
    throw Error{ErrorDomain::IO, sys_err.code().value(), ctx.Format(sys_err.what()),
                sys_err.code().value(), ClassifyNativeError(sys_err.code().value()), ctx.Stack()};
  }
}

bool SupportsAtomicRename(const std::filesystem::path& dir) {
  std::error_code ec;
  auto absolute = std::filesystem::weakly_canonical(dir, ec);
  if (ec) {
    absolute = std::filesystem::absolute(dir, ec);
  }
  if (absolute.empty()) {
    return false;
  }

  struct statfs info {
  };
  if (::statfs(absolute.c_str(), &info) != 0) {
    return false;
  }

#if defined(__linux__)
  switch (info.f_type) {
    case 0x6969:      // NFS_SUPER_MAGIC
    case 0xFF534D42:  // CIFS
    case 0xFE534D42:  // SMB2
    case 0x517B:      // SMB
      return false;
    default:
      return true;
  }
#elif defined(__APPLE__) || defined(__FreeBSD__)
  return (info.f_flags & MNT_LOCAL) != 0;
#else
  return true;
#endif
}

void SyncDirectory(const std::filesystem::path& dir, const ErrorContext& ctx) {
  int dir_fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (dir_fd < 0) {
    ThrowErrno(ctx, errno, std::string(kAtomicReplaceErrorMessage) + ": open directory failed");
  }
  if (::fsync(dir_fd) != 0) {
    const int err = errno;
    ::close(dir_fd);
    ThrowErrno(ctx, err, std::string(kAtomicReplaceErrorMessage) + ": directory flush failed");
  }
  ::close(dir_fd);
}

bool IsTransientFsyncError(int err) {
  return err == EINTR || err == EAGAIN || err == EBUSY;
}

void SyncFileWithRetry(int fd, const ErrorContext& ctx) {
  constexpr int kMaxRetries = 4;
  std::chrono::milliseconds backoff{5};
  for (int attempt = 0;; ++attempt) {
    if (::fsync(fd) == 0) {
      return;
    }
    const int saved_errno = errno;
    if (saved_errno == EINTR) {
      continue;
    }
    if (attempt >= kMaxRetries || !IsTransientFsyncError(saved_errno)) {
      ThrowErrno(ctx, saved_errno, "fsync failed");
    }
    std::this_thread::sleep_for(backoff);
    backoff *= 2;
  }
}

void WriteAll(int fd, std::span<const uint8_t> payload, const ErrorContext& ctx) {
  size_t written = 0;
  while (written < payload.size()) {
    auto chunk = ::write(fd, payload.data() + written, payload.size() - written);
    if (chunk < 0) {
      const int saved_errno = errno;
      if (saved_errno == EINTR) {
        continue;
      }
      ThrowErrno(ctx, saved_errno, "write failed");
    }
    if (chunk == 0) {
      ThrowIoError(ctx, 0, "short write", 0, nl::Retryability::kFatal);
    }
    written += static_cast<size_t>(chunk);
  }
}

class TempFileGuard {
 public:
  explicit TempFileGuard(std::filesystem::path path) noexcept : path_(std::move(path)) {}
  TempFileGuard(const TempFileGuard&) = delete;
  TempFileGuard& operator=(const TempFileGuard&) = delete;
  ~TempFileGuard() noexcept {
    if (!path_.empty()) {
      std::error_code ec;
      if (!std::filesystem::remove(path_, ec) && ec) {
        std::cerr << "TempFileGuard cleanup failed for " << path_ << ": " << ec.message()
                  << '\n';
      }
    }
  }

  void Release() noexcept { path_.clear(); }

 private:
  std::filesystem::path path_;
};

std::filesystem::path MakeTempPath(const std::filesystem::path& dir,
                                   const std::filesystem::path& base) {
  std::array<uint8_t, 16> random{};
  nl::crypto::SystemRandomBytes(std::span<uint8_t>(random.data(), random.size()));
  std::filesystem::path temp_name = base.filename();
  temp_name += ".tmp.";
  temp_name += nl::HexEncode(std::span<const uint8_t>(random.data(), random.size()));
  return dir / temp_name;
}

}  // namespace

void AtomicReplace(const std::filesystem::path& target, std::span<const uint8_t> payload,
                   const AtomicReplaceHooks& hooks) {
  ErrorContext ctx;
  const std::string target_utf8 =
      target.empty() ? std::string("<empty>") : nl::PathToUtf8String(target);
  ScopedErrorContext root(ctx, "atomic replace target=" + target_utf8);

  if (target.empty()) {
    throw Error{ErrorDomain::Validation, 0, ctx.Format("Target path required"), std::nullopt,
                nl::Retryability::kFatal, ctx.Stack()};
  }

  auto dir = target.parent_path();
  if (dir.empty()) {
    dir = WithContext(ctx, "resolving current working directory",
                      [] { return std::filesystem::current_path(); });
  }

  if (!SupportsAtomicRename(dir)) {
    ThrowIoError(ctx, 0, kAtomicUnsupportedMessage, std::nullopt, nl::Retryability::kFatal);
  }

  auto temp_path = MakeTempPath(dir, target);
  TempFileGuard cleanup(temp_path);

  int fd = WithContext(ctx, "opening temporary payload file", [&]() {
    int handle = ::open(temp_path.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0600);
    if (handle < 0) {
      ThrowErrno(ctx, errno, std::string(kAtomicReplaceErrorMessage) + ": open failed");
    }
    return handle;
  });

  try {
    WithContext(ctx, "writing payload", [&] { WriteAll(fd, payload, ctx); });
    WithContext(ctx, "syncing payload", [&] { SyncFileWithRetry(fd, ctx); });
  } catch (...) {
    ::close(fd);
    throw;
  }

  if (::close(fd) != 0) {
    ThrowErrno(ctx, errno, std::string(kAtomicReplaceErrorMessage) + ": close failed");
  }

  if (hooks.before_rename) {
    WithContext(ctx, "executing before_rename hook",
                [&] { hooks.before_rename(temp_path, target); });
  }

  if (::rename(temp_path.c_str(), target.c_str()) != 0) {
    ThrowErrno(ctx, errno, std::string(kAtomicReplaceErrorMessage) + ": rename failed");
  }
  cleanup.Release();

  WithContext(ctx, "syncing directory metadata", [&] { SyncDirectory(dir, ctx); });
}

void SecureWipeFile(const std::filesystem::path& path, int passes) {
  ErrorContext ctx;
  ScopedErrorContext root(ctx, "secure wipe target=" + nl::PathToUtf8String(path));

  int fd = ::open(path.c_str(), O_WRONLY | O_CLOEXEC);
  if (fd < 0) {
    if (errno == ENOENT) {
      return;
    }
    ThrowErrno(ctx, errno, std::string(errors::msg::kSecureWipeFailed) + ": open failed");
  }

  try {
    struct stat info {};
    if (::fstat(fd, &info) != 0) {
      ThrowErrno(ctx, errno, std::string(errors::msg::kSecureWipeFailed) + ": stat failed");
    }
    const auto size = static_cast<uint64_t>(info.st_size);
    std::array<uint8_t, kWipeBlockSize> block{};
    for (int pass = 0; pass < std::max(passes, 1); ++pass) {
      if (::lseek(fd, 0, SEEK_SET) < 0) {
        ThrowErrno(ctx, errno, std::string(errors::msg::kSecureWipeFailed) + ": seek failed");
      }
      uint64_t remaining = size;
      while (remaining > 0) {
        const size_t len = static_cast<size_t>(std::min<uint64_t>(remaining, block.size()));
        nl::crypto::SystemRandomBytes(std::span<uint8_t>(block.data(), len));
        WriteAll(fd, std::span<const uint8_t>(block.data(), len), ctx);
        remaining -= len;
      }
      SyncFileWithRetry(fd, ctx);
    }
  } catch (...) {
    ::close(fd);
    throw;
  }
  ::close(fd);

  if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
    ThrowErrno(ctx, errno, std::string(errors::msg::kSecureWipeFailed) + ": unlink failed");
  }
}

std::vector<uint8_t> ReadFileBytes(const std::filesystem::path& path) {
  ErrorContext ctx;
  ScopedErrorContext root(ctx, "reading " + nl::PathToUtf8String(path));

  int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    ThrowErrno(ctx, errno, "open failed");
  }
  std::vector<uint8_t> out;
  try {
    struct stat info {};
    if (::fstat(fd, &info) != 0) {
      ThrowErrno(ctx, errno, "stat failed");
    }
    out.resize(static_cast<size_t>(info.st_size));
    size_t offset = 0;
    while (offset < out.size()) {
      auto got = ::read(fd, out.data() + offset, out.size() - offset);
      if (got < 0) {
        if (errno == EINTR) {
          continue;
        }
        ThrowErrno(ctx, errno, "read failed");
      }
      if (got == 0) {
        ThrowIoError(ctx, 0, "file truncated during read");
      }
      offset += static_cast<size_t>(got);
    }
  } catch (...) {
    ::close(fd);
    throw;
  }
  ::close(fd);
  return out;
}

}  // namespace nl::orchestrator
