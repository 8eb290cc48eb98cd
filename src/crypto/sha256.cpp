#include "nl/crypto/sha256.h"

#include <openssl/evp.h>

#include "nl/crypto/provider.h"
#include "nl/error.h"

namespace nl::crypto {

std::array<uint8_t, 32> SHA256_Hash(std::span<const uint8_t> data) {
  auto provider = GetCryptoProviderShared();
  return provider->SHA256(data);
}

std::array<uint8_t, 32> SHA256_Hash(const std::vector<uint8_t>& data) {
  return SHA256_Hash(std::span<const uint8_t>(data.data(), data.size()));
}

struct SHA256_Stream::Impl {
  struct Deleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
  };
  std::unique_ptr<EVP_MD_CTX, Deleter> ctx;
  bool finalized{false};
};

SHA256_Stream::SHA256_Stream() : impl_(std::make_unique<Impl>()) {
  impl_->ctx.reset(EVP_MD_CTX_new());
  if (!impl_->ctx || EVP_DigestInit_ex(impl_->ctx.get(), EVP_sha256(), nullptr) != 1) {
    throw Error(ErrorDomain::Crypto, 0, "EVP_DigestInit_ex(EVP_sha256) failed");
  }
}

SHA256_Stream::~SHA256_Stream() = default;

void SHA256_Stream::Update(std::span<const uint8_t> data) {
  if (impl_->finalized) {
    throw Error(ErrorDomain::Internal, 0, "SHA256_Stream updated after Finalize");
  }
  if (data.empty()) {
    return;
  }
  if (EVP_DigestUpdate(impl_->ctx.get(), data.data(), data.size()) != 1) {
    throw Error(ErrorDomain::Crypto, 0, "EVP_DigestUpdate failed");
  }
}

std::array<uint8_t, 32> SHA256_Stream::Finalize() {
  if (impl_->finalized) {
    throw Error(ErrorDomain::Internal, 0, "SHA256_Stream finalized twice");
  }
  std::array<uint8_t, 32> out{};
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(impl_->ctx.get(), out.data(), &len) != 1 || len != out.size()) {
    throw Error(ErrorDomain::Crypto, 0, "EVP_DigestFinal_ex failed");
  }
  impl_->finalized = true;
  return out;
}

}  // namespace nl::crypto
