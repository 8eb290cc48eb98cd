#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <span>
#include <vector>

#include "nl/common.h"
#include "nl/import/import_journal.h"
#include "nl/import/streaming_import.h"
#include "nl/security/secure_buffer.h"
#include "nl/storage/chunk_source.h"

namespace nl::vault {

inline constexpr size_t kStoreKeySize = 32;

struct StoredFileInfo {
  FileId file_id{};
  ImportId binding_id{};  // import the chunks were sealed under
  uint64_t total_size{0};
  uint32_t chunk_count{0};
  uint32_t chunk_size{0};
  nl::import::ImportMetadata metadata;
};

std::vector<uint8_t> SerializeManifest(const StoredFileInfo& info);
// Throws Error{Validation, kManifestInvalid}.
StoredFileInfo ParseManifest(std::span<const uint8_t> bytes);

// Directory-backed chunk container keyed by one 32-byte store key.
//
//   <root>/pending/<import id>/chunk_%08u.enc   sealed while importing
//   <root>/files/<file id>/chunk_%08u.enc       published on finalize
//   <root>/files/<file id>/manifest
//   <root>/imports/                             import journal
//
// Each chunk file is nonce || tag || AES-256-GCM ciphertext with
// AAD = "NLCK" || binding id || LE32 chunk index.
class LocalChunkStore final : public nl::storage::ChunkSource, public nl::import::ChunkSealer {
 public:
  LocalChunkStore(std::filesystem::path root, std::span<const uint8_t, kStoreKeySize> key);
  ~LocalChunkStore() override;

  LocalChunkStore(const LocalChunkStore&) = delete;
  LocalChunkStore& operator=(const LocalChunkStore&) = delete;

  nl::security::SecureBuffer<uint8_t> DecryptChunk(const FileId& file, uint32_t index) override;

  void EncryptChunk(const ImportId& import_id, uint32_t index,
                    std::span<const uint8_t> plaintext) override;
  void FinalizeImport(const nl::import::ImportState& state) override;
  void DiscardImport(const ImportId& import_id) override;

  // Throws Error{State, kFileNotFound}.
  nl::storage::FileHandle Describe(const FileId& file);
  StoredFileInfo Info(const FileId& file);

  std::filesystem::path JournalRoot() const { return root_ / "imports"; }
  const std::filesystem::path& root() const noexcept { return root_; }

  static std::string ChunkFileName(uint32_t index);

 private:
  std::filesystem::path PendingDir(const ImportId& import_id) const;
  std::filesystem::path FileDir(const FileId& file) const;
  StoredFileInfo LoadInfo(const FileId& file);

  std::filesystem::path root_;
  std::array<uint8_t, kStoreKeySize> key_{};

  std::mutex manifests_mutex_;
  std::map<FileId, StoredFileInfo> manifests_;
};

}  // namespace nl::vault
