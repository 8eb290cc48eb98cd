#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "nl/common.h"
#include "nl/import/resume_verifier.h"

namespace nl::import {

// Target entry the import will become once finished.
struct ImportMetadata {
  std::string file_name;
  std::string mime_type;
  uint8_t file_type{0};
};

// Persisted state of one in-progress import. The source location is never
// stored; a resume is recognised by fingerprint alone.
struct ImportState {
  ImportId import_id{};
  FileId file_id{};
  Fingerprint fingerprint{};
  ImportMetadata metadata;
  uint64_t total_size{0};
  uint32_t chunk_size{0};
  uint32_t total_chunks{0};
  uint32_t committed_chunks{0};
  uint64_t bytes_written{0};
  uint64_t created_at_ms{0};
  uint64_t updated_at_ms{0};

  bool complete() const noexcept { return committed_chunks >= total_chunks; }
};

inline constexpr uint8_t kImportStateVersion = 1;

std::vector<uint8_t> SerializeImportState(const ImportState& state);

// Throws Error{IO, kStateCorrupted} on bad magic, version, truncation or
// inconsistent counters.
ImportState ParseImportState(std::span<const uint8_t> bytes);

// Persistence seam for import sessions.
class ImportJournal {
 public:
  virtual ~ImportJournal() = default;

  // Durable on return. Throws Error{IO, kStatePersistFailed}.
  virtual void Save(const ImportState& state) = 0;
  virtual std::optional<ImportState> Load(const ImportId& import_id) = 0;
  // Unreadable entries are skipped and reported.
  virtual std::vector<ImportState> List() = 0;
  // Missing entries are not an error.
  virtual void Remove(const ImportId& import_id) = 0;
};

// Stores <root>/<hex import id>/.state, replaced atomically on every save.
class FileImportJournal final : public ImportJournal {
 public:
  explicit FileImportJournal(std::filesystem::path root);

  void Save(const ImportState& state) override;
  std::optional<ImportState> Load(const ImportId& import_id) override;
  std::vector<ImportState> List() override;
  void Remove(const ImportId& import_id) override;

  std::filesystem::path StatePath(const ImportId& import_id) const;
  const std::filesystem::path& root() const noexcept { return root_; }

 private:
  std::filesystem::path root_;
};

}  // namespace nl::import
