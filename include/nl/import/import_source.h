#pragma once

#include <cstdint>
#include <filesystem>
#include <span>

namespace nl::import {

// Sized random-access byte source being imported.
class ImportSource {
 public:
  virtual ~ImportSource() = default;

  virtual uint64_t Size() const = 0;

  // Reads up to dest.size() bytes at |offset|; fewer only at end of source.
  // Throws Error{IO, kSourceReadFailed}.
  virtual size_t ReadAt(uint64_t offset, std::span<uint8_t> dest) = 0;
};

// Regular file opened read-only for the lifetime of the object.
class FileImportSource final : public ImportSource {
 public:
  explicit FileImportSource(const std::filesystem::path& path);
  ~FileImportSource() override;

  FileImportSource(const FileImportSource&) = delete;
  FileImportSource& operator=(const FileImportSource&) = delete;

  uint64_t Size() const override { return size_; }
  size_t ReadAt(uint64_t offset, std::span<uint8_t> dest) override;

  const std::filesystem::path& path() const noexcept { return path_; }

 private:
  std::filesystem::path path_;
  int fd_{-1};
  uint64_t size_{0};
};

}  // namespace nl::import
