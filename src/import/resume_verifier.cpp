#include "nl/import/resume_verifier.h"

#include <algorithm>
#include <string>

#include "nl/common.h"
#include "nl/crypto/ct.h"
#include "nl/crypto/sha256.h"
#include "nl/error.h"
#include "nl/errors.h"
#include "nl/security/secure_buffer.h"

namespace nl::import {

ResumeVerifier::ResumeVerifier(size_t sample_bytes)
    : sample_bytes_(std::max<size_t>(1, sample_bytes)) {}

Fingerprint ResumeVerifier::Compute(std::span<const uint8_t> head, std::span<const uint8_t> tail,
                                    uint64_t total_size) const {
  nl::crypto::SHA256_Stream hasher;
  hasher.Update(head);
  if (!tail.empty()) {
    hasher.Update(tail);
  }
  const uint64_t size_le = ToLittleEndian64(total_size);
  hasher.Update(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(&size_le),
                                         sizeof(size_le)));
  return hasher.Finalize();
}

Fingerprint ResumeVerifier::FingerprintSource(ImportSource& source) const {
  const uint64_t size = source.Size();
  const auto head_len = static_cast<size_t>(std::min<uint64_t>(size, sample_bytes_));
  nl::security::SecureBuffer<uint8_t> head(head_len);
  if (source.ReadAt(0, head.AsSpan()) != head_len) {
    throw Error{ErrorDomain::IO, errors::io::kSourceReadFailed,
                std::string(errors::msg::kSourceReadFailed) + ": short head sample"};
  }
  nl::security::SecureBuffer<uint8_t> tail;
  if (size > 2ULL * sample_bytes_) {
    tail = nl::security::SecureBuffer<uint8_t>(sample_bytes_);
    if (source.ReadAt(size - sample_bytes_, tail.AsSpan()) != sample_bytes_) {
      throw Error{ErrorDomain::IO, errors::io::kSourceReadFailed,
                  std::string(errors::msg::kSourceReadFailed) + ": short tail sample"};
    }
  }
  return Compute(head.AsSpan(), tail.AsSpan(), size);
}

bool ResumeVerifier::Matches(const Fingerprint& expected, const Fingerprint& actual) noexcept {
  return nl::crypto::ct::CompareEqual(expected, actual);
}

void ResumeVerifier::Verify(const Fingerprint& expected, const Fingerprint& actual) {
  if (!Matches(expected, actual)) {
    throw Error{ErrorDomain::Validation, errors::validation::kImportFingerprintMismatch,
                std::string(errors::msg::kImportFingerprintMismatch)};
  }
}

}  // namespace nl::import
