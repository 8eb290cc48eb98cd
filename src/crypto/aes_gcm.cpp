#include "nl/crypto/aes_gcm.h"

#include "nl/crypto/provider.h"
#include "nl/error.h"
#include "nl/security/zeroizer.h"

namespace nl::crypto {

AES256_GCM::EncryptionResult AES256_GCM_Encrypt(
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> aad,
    std::span<const uint8_t, AES256_GCM::NONCE_SIZE> nonce,
    std::span<const uint8_t, AES256_GCM::KEY_SIZE> key) {
  auto provider = GetCryptoProviderShared();
  return provider->EncryptAES256GCM(plaintext, aad, nonce, key);
}

size_t AES256_GCM_DecryptInto(
    std::span<const uint8_t> ciphertext,
    std::span<const uint8_t> aad,
    std::span<const uint8_t, AES256_GCM::NONCE_SIZE> nonce,
    std::span<const uint8_t, AES256_GCM::TAG_SIZE> tag,
    std::span<const uint8_t, AES256_GCM::KEY_SIZE> key,
    std::span<uint8_t> destination) {
  if (destination.size() < ciphertext.size()) {
    throw nl::Error{nl::ErrorDomain::Validation, 0,
                    "Decrypt destination smaller than ciphertext"};
  }
  auto provider = GetCryptoProviderShared();
  try {
    return provider->DecryptAES256GCM(ciphertext, aad, nonce, tag, key, destination);
  } catch (...) {
    // GCM releases plaintext before the tag is checked.
    nl::security::Zeroizer::Wipe(destination);
    throw;
  }
}

} // namespace nl::crypto
