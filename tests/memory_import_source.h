#pragma once

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <cstring>
#include <span>
#include <utility>
#include <vector>

#include "nl/import/import_source.h"

namespace nl::test {

class MemoryImportSource final : public nl::import::ImportSource {
 public:
  explicit MemoryImportSource(std::vector<uint8_t> bytes) : bytes_(std::move(bytes)) {}

  static std::vector<uint8_t> Pattern(size_t size, uint8_t seed) {
    std::vector<uint8_t> out(size);
    for (size_t i = 0; i < size; ++i) {
      out[i] = static_cast<uint8_t>((i * 131U + seed) ^ (i >> 7));
    }
    return out;
  }

  uint64_t Size() const override { return bytes_.size(); }

  size_t ReadAt(uint64_t offset, std::span<uint8_t> dest) override {
    reads_.fetch_add(1);
    if (offset >= bytes_.size()) {
      return 0;
    }
    const size_t count = std::min<size_t>(dest.size(), bytes_.size() - offset);
    if (count > 0) {
      std::memcpy(dest.data(), bytes_.data() + offset, count);
    }
    return count;
  }

  const std::vector<uint8_t>& bytes() const noexcept { return bytes_; }
  int Reads() const noexcept { return reads_.load(); }

 private:
  std::vector<uint8_t> bytes_;
  std::atomic<int> reads_{0};
};

}  // namespace nl::test
