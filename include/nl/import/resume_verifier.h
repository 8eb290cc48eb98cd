#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

#include "nl/import/import_source.h"

namespace nl::import {

inline constexpr size_t kFingerprintSampleBytes = 1024 * 1024;

using Fingerprint = std::array<uint8_t, 32>;

// Sampled source fingerprint used to recognise a resumed import:
// SHA-256(first N bytes || last N bytes when size > 2N || size as LE64).
// Two sources with equal fingerprints are treated as the same source; the
// bytes between the samples are not covered.
class ResumeVerifier {
 public:
  explicit ResumeVerifier(size_t sample_bytes = kFingerprintSampleBytes);

  // |tail| must be empty unless total_size > 2 * sample_bytes.
  Fingerprint Compute(std::span<const uint8_t> head, std::span<const uint8_t> tail,
                      uint64_t total_size) const;

  // Reads the samples from |source| into secure buffers wiped on return.
  Fingerprint FingerprintSource(ImportSource& source) const;

  static bool Matches(const Fingerprint& expected, const Fingerprint& actual) noexcept;

  // Throws Error{Validation, kImportFingerprintMismatch}.
  static void Verify(const Fingerprint& expected, const Fingerprint& actual);

  size_t sample_bytes() const noexcept { return sample_bytes_; }

 private:
  size_t sample_bytes_;
};

}  // namespace nl::import
