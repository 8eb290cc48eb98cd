#include "nl/vault/local_chunk_store.h"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <string>
#include <system_error>
#include <utility>

#include "nl/binary_io.h"
#include "nl/crypto/aes_gcm.h"
#include "nl/crypto/provider.h"
#include "nl/crypto/random.h"
#include "nl/error.h"
#include "nl/errors.h"
#include "nl/orchestrator/io_util.h"
#include "nl/security/zeroizer.h"

namespace nl::vault {

namespace {

using nl::crypto::AES256_GCM;

constexpr std::array<uint8_t, 4> kManifestMagic = {'N', 'L', 'M', 'F'};
constexpr uint8_t kManifestVersion = 1;
constexpr std::array<uint8_t, 4> kChunkAadTag = {'N', 'L', 'C', 'K'};
constexpr const char* kManifestName = "manifest";
constexpr size_t kChunkHeaderSize = AES256_GCM::NONCE_SIZE + AES256_GCM::TAG_SIZE;

std::array<uint8_t, 24> ChunkAad(const ObjectId& binding, uint32_t index) {
  std::array<uint8_t, 24> aad{};
  std::copy(kChunkAadTag.begin(), kChunkAadTag.end(), aad.begin());
  std::copy(binding.begin(), binding.end(), aad.begin() + kChunkAadTag.size());
  const uint32_t index_le = ToLittleEndian32(index);
  std::memcpy(aad.data() + kChunkAadTag.size() + binding.size(), &index_le, sizeof(index_le));
  return aad;
}

Error FileNotFound(const FileId& file) {
  return Error{ErrorDomain::State, errors::state::kFileNotFound,
               std::string(errors::msg::kFileNotFound) + " (" + ToHex(file) + ")"};
}

Error ChunkMissing(uint32_t index, std::string_view detail) {
  return Error{ErrorDomain::IO, errors::io::kChunkFileMissing,
               std::string(errors::msg::kChunkFileMissing) + " (chunk " + std::to_string(index) +
                   "): " + std::string(detail)};
}

void CreateDirectories(const std::filesystem::path& dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    throw Error{ErrorDomain::IO, errors::io::kImportChunkWriteFailed,
                "Cannot create " + PathToUtf8String(dir) + ": " + ec.message(), ec.value(),
                Retryability::kRetryable};
  }
}

}  // namespace

std::vector<uint8_t> SerializeManifest(const StoredFileInfo& info) {
  BinaryWriter writer;
  writer.Bytes(kManifestMagic);
  writer.U8(kManifestVersion);
  writer.Bytes(info.file_id);
  writer.Bytes(info.binding_id);
  writer.U64(info.total_size);
  writer.U32(info.chunk_count);
  writer.U32(info.chunk_size);
  writer.U8(info.metadata.file_type);
  writer.String(info.metadata.file_name);
  writer.String(info.metadata.mime_type);
  return writer.Take();
}

StoredFileInfo ParseManifest(std::span<const uint8_t> bytes) {
  BinaryReader reader(bytes, ErrorDomain::Validation, errors::validation::kManifestInvalid,
                      errors::msg::kManifestInvalid);
  auto magic = reader.Bytes(kManifestMagic.size());
  if (!std::equal(magic.begin(), magic.end(), kManifestMagic.begin())) {
    reader.Fail("bad magic");
  }
  if (reader.U8() != kManifestVersion) {
    reader.Fail("unsupported version");
  }
  StoredFileInfo info;
  reader.Into(info.file_id);
  reader.Into(info.binding_id);
  info.total_size = reader.U64();
  info.chunk_count = reader.U32();
  info.chunk_size = reader.U32();
  info.metadata.file_type = reader.U8();
  info.metadata.file_name = reader.String();
  info.metadata.mime_type = reader.String();
  if (!reader.AtEnd()) {
    reader.Fail("trailing bytes");
  }
  if (info.total_size > 0 && (info.chunk_count == 0 || info.chunk_size == 0)) {
    reader.Fail("empty geometry");
  }
  return info;
}

LocalChunkStore::LocalChunkStore(std::filesystem::path root,
                                 std::span<const uint8_t, kStoreKeySize> key)
    : root_(std::move(root)) {
  std::copy(key.begin(), key.end(), key_.begin());
  nl::crypto::EnsureCryptoProviderInitialized();
  CreateDirectories(root_ / "pending");
  CreateDirectories(root_ / "files");
}

LocalChunkStore::~LocalChunkStore() {
  nl::security::Zeroizer::Wipe(key_);
}

std::string LocalChunkStore::ChunkFileName(uint32_t index) {
  char name[32];
  std::snprintf(name, sizeof(name), "chunk_%08u.enc", index);
  return name;
}

std::filesystem::path LocalChunkStore::PendingDir(const ImportId& import_id) const {
  return root_ / "pending" / ToHex(import_id);
}

std::filesystem::path LocalChunkStore::FileDir(const FileId& file) const {
  return root_ / "files" / ToHex(file);
}

void LocalChunkStore::EncryptChunk(const ImportId& import_id, uint32_t index,
                                   std::span<const uint8_t> plaintext) {
  std::array<uint8_t, AES256_GCM::NONCE_SIZE> nonce{};
  nl::crypto::SystemRandomBytes(nonce);
  const auto aad = ChunkAad(import_id, index);
  auto sealed = nl::crypto::AES256_GCM_Encrypt(plaintext, aad, nonce, key_);

  std::vector<uint8_t> payload;
  payload.reserve(kChunkHeaderSize + sealed.ciphertext.size());
  payload.insert(payload.end(), nonce.begin(), nonce.end());
  payload.insert(payload.end(), sealed.tag.begin(), sealed.tag.end());
  payload.insert(payload.end(), sealed.ciphertext.begin(), sealed.ciphertext.end());

  const auto dir = PendingDir(import_id);
  CreateDirectories(dir);
  nl::orchestrator::AtomicReplace(dir / ChunkFileName(index), payload);
}

void LocalChunkStore::FinalizeImport(const nl::import::ImportState& state) {
  const auto pending = PendingDir(state.import_id);
  std::error_code ec;
  for (uint32_t index = 0; index < state.total_chunks; ++index) {
    if (!std::filesystem::exists(pending / ChunkFileName(index), ec)) {
      throw ChunkMissing(index, "not sealed");
    }
  }
  CreateDirectories(pending);

  StoredFileInfo info;
  info.file_id = state.file_id;
  info.binding_id = state.import_id;
  info.total_size = state.total_size;
  info.chunk_count = state.total_chunks;
  info.chunk_size = state.chunk_size;
  info.metadata = state.metadata;
  nl::orchestrator::AtomicReplace(pending / kManifestName, SerializeManifest(info));

  // The manifest travels with the chunks, so the rename publishes a complete
  // file in one step.
  std::filesystem::rename(pending, FileDir(state.file_id), ec);
  if (ec) {
    throw Error{ErrorDomain::IO, errors::io::kImportChunkWriteFailed,
                "Cannot publish " + ToHex(state.file_id) + ": " + ec.message(), ec.value()};
  }
  std::lock_guard lock(manifests_mutex_);
  manifests_[info.file_id] = std::move(info);
}

void LocalChunkStore::DiscardImport(const ImportId& import_id) {
  const auto dir = PendingDir(import_id);
  std::error_code ec;
  if (!std::filesystem::exists(dir, ec)) {
    return;
  }
  for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    if (it->is_regular_file()) {
      nl::orchestrator::SecureWipeFile(it->path());
    }
  }
  std::filesystem::remove_all(dir, ec);
  if (ec) {
    throw Error{ErrorDomain::IO, errors::io::kSecureWipeFailed,
                std::string(errors::msg::kSecureWipeFailed) + ": " + ec.message(), ec.value()};
  }
}

StoredFileInfo LocalChunkStore::LoadInfo(const FileId& file) {
  {
    std::lock_guard lock(manifests_mutex_);
    if (auto it = manifests_.find(file); it != manifests_.end()) {
      return it->second;
    }
  }
  const auto path = FileDir(file) / kManifestName;
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    throw FileNotFound(file);
  }
  StoredFileInfo info = ParseManifest(nl::orchestrator::ReadFileBytes(path));
  if (info.file_id != file) {
    throw Error{ErrorDomain::Validation, errors::validation::kManifestInvalid,
                std::string(errors::msg::kManifestInvalid) + ": identifier mismatch"};
  }
  std::lock_guard lock(manifests_mutex_);
  return manifests_.emplace(file, std::move(info)).first->second;
}

nl::security::SecureBuffer<uint8_t> LocalChunkStore::DecryptChunk(const FileId& file,
                                                                 uint32_t index) {
  const StoredFileInfo info = LoadInfo(file);
  if (index >= info.chunk_count) {
    throw ChunkMissing(index, "index past end");
  }
  const auto path = FileDir(file) / ChunkFileName(index);
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    throw ChunkMissing(index, "file absent");
  }
  const auto payload = nl::orchestrator::ReadFileBytes(path);
  if (payload.size() < kChunkHeaderSize) {
    throw ChunkMissing(index, "truncated");
  }
  const std::span<const uint8_t> bytes(payload);
  const auto nonce = bytes.subspan<0, AES256_GCM::NONCE_SIZE>();
  const auto tag = bytes.subspan<AES256_GCM::NONCE_SIZE, AES256_GCM::TAG_SIZE>();
  const auto ciphertext = bytes.subspan(kChunkHeaderSize);
  const auto aad = ChunkAad(info.binding_id, index);

  nl::security::SecureBuffer<uint8_t> plaintext(ciphertext.size());
  try {
    const size_t written = nl::crypto::AES256_GCM_DecryptInto(ciphertext, aad, nonce, tag, key_,
                                                              plaintext.AsSpan());
    if (written != plaintext.size()) {
      throw ChunkMissing(index, "short plaintext");
    }
  } catch (const AuthenticationFailureError&) {
    throw Error{ErrorDomain::Crypto, errors::crypto::kChunkAuthenticationFailed,
                std::string(errors::msg::kChunkAuthenticationFailed) + " (chunk " +
                    std::to_string(index) + ")"};
  }
  return plaintext;
}

nl::storage::FileHandle LocalChunkStore::Describe(const FileId& file) {
  const StoredFileInfo info = LoadInfo(file);
  return nl::storage::FileHandle{info.file_id, info.chunk_count, info.total_size};
}

StoredFileInfo LocalChunkStore::Info(const FileId& file) {
  return LoadInfo(file);
}

}  // namespace nl::vault
