#include "nl/import/import_source.h"

#include <cerrno>
#include <cstring>
#include <string>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "nl/common.h"
#include "nl/error.h"
#include "nl/errors.h"

namespace nl::import {

namespace {

[[noreturn]] void ThrowSourceError(const std::filesystem::path& path, std::string_view action,
                                   int err) {
  throw Error{ErrorDomain::IO, errors::io::kSourceReadFailed,
              std::string(errors::msg::kSourceReadFailed) + ": " + std::string(action) + " " +
                  PathToUtf8String(path) + ": " + std::strerror(err),
              err, Retryability::kRetryable};
}

}  // namespace

FileImportSource::FileImportSource(const std::filesystem::path& path) : path_(path) {
  int flags = O_RDONLY;
#ifdef O_CLOEXEC
  flags |= O_CLOEXEC;
#endif
  fd_ = ::open(path_.c_str(), flags);
  if (fd_ < 0) {
    ThrowSourceError(path_, "open", errno);
  }
  struct stat info {};
  if (::fstat(fd_, &info) != 0) {
    const int err = errno;
    ::close(fd_);
    fd_ = -1;
    ThrowSourceError(path_, "stat", err);
  }
  if (!S_ISREG(info.st_mode)) {
    ::close(fd_);
    fd_ = -1;
    ThrowSourceError(path_, "open", EINVAL);
  }
  size_ = static_cast<uint64_t>(info.st_size);
}

FileImportSource::~FileImportSource() {
  if (fd_ >= 0) {
    ::close(fd_);
  }
}

size_t FileImportSource::ReadAt(uint64_t offset, std::span<uint8_t> dest) {
  size_t total = 0;
  while (total < dest.size()) {
    const ssize_t n = ::pread(fd_, dest.data() + total, dest.size() - total,
                              static_cast<off_t>(offset + total));
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      ThrowSourceError(path_, "read", errno);
    }
    if (n == 0) {
      break;
    }
    total += static_cast<size_t>(n);
  }
  return total;
}

}  // namespace nl::import
