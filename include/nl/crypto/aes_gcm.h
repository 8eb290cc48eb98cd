#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace nl::crypto {

struct AES256_GCM {
  static constexpr size_t KEY_SIZE = 32;
  static constexpr size_t NONCE_SIZE = 12;
  static constexpr size_t TAG_SIZE = 16;

  struct EncryptionResult {
    std::vector<uint8_t> ciphertext;
    std::array<uint8_t, TAG_SIZE> tag;
  };
};

// Encrypts |plaintext| using AES-256-GCM. Throws nl::Error on provider failures.
AES256_GCM::EncryptionResult AES256_GCM_Encrypt(std::span<const uint8_t> plaintext,
                                               std::span<const uint8_t> aad,
                                               std::span<const uint8_t, AES256_GCM::NONCE_SIZE> nonce,
                                               std::span<const uint8_t, AES256_GCM::KEY_SIZE> key);

// Decrypts |ciphertext| directly into |destination|, which must hold at least
// ciphertext.size() bytes. Returns the number of plaintext bytes written.
// Throws AuthenticationFailureError on tag mismatch and nl::Error on other
// provider failures; |destination| is wiped before either is thrown.
size_t AES256_GCM_DecryptInto(std::span<const uint8_t> ciphertext,
                              std::span<const uint8_t> aad,
                              std::span<const uint8_t, AES256_GCM::NONCE_SIZE> nonce,
                              std::span<const uint8_t, AES256_GCM::TAG_SIZE> tag,
                              std::span<const uint8_t, AES256_GCM::KEY_SIZE> key,
                              std::span<uint8_t> destination);

} // namespace nl::crypto
