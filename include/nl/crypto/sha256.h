#pragma once
#include <array>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

namespace nl::crypto {
std::array<uint8_t,32> SHA256_Hash(std::span<const uint8_t> data);
std::array<uint8_t,32> SHA256_Hash(const std::vector<uint8_t>& data);

// Incremental SHA-256 for inputs assembled from several pieces.
class SHA256_Stream {
public:
  SHA256_Stream();
  ~SHA256_Stream();
  SHA256_Stream(const SHA256_Stream&) = delete;
  SHA256_Stream& operator=(const SHA256_Stream&) = delete;

  void Update(std::span<const uint8_t> data);
  std::array<uint8_t, 32> Finalize();

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};
} // namespace nl::crypto
