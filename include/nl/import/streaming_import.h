#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "nl/common.h"
#include "nl/import/import_journal.h"
#include "nl/import/import_source.h"
#include "nl/import/resume_verifier.h"

namespace nl::storage {
class TaskPool;
}

namespace nl::import {

// Encrypt capability provided by the container engine.
class ChunkSealer {
 public:
  virtual ~ChunkSealer() = default;

  // Encrypts and durably stores chunk |index| of |import_id|. Rewriting an
  // index replaces the earlier copy.
  virtual void EncryptChunk(const ImportId& import_id, uint32_t index,
                            std::span<const uint8_t> plaintext) = 0;

  // Publishes every sealed chunk as stored file state.file_id.
  virtual void FinalizeImport(const ImportState& state) = 0;

  // Wipes every sealed chunk of |import_id|. Missing data is not an error.
  virtual void DiscardImport(const ImportId& import_id) = 0;
};

struct ImportPolicy {
  uint32_t chunk_size{4U * 1024U * 1024U};
  uint64_t max_file_bytes{50ULL * 1024ULL * 1024ULL * 1024ULL};
  size_t fingerprint_sample_bytes{kFingerprintSampleBytes};
};

// Overlays NL_IMPORT_CHUNK_BYTES and NL_MAX_FILE_BYTES on |base|.
ImportPolicy ImportPolicyFromEnvironment(ImportPolicy base = {});

struct ImportProgress {
  ImportId import_id{};
  uint64_t bytes_written{0};
  uint64_t total_bytes{0};
  uint32_t chunks_completed{0};
  uint32_t total_chunks{0};
};

struct ImportEvent {
  enum class Kind { kProgress, kComplete, kError };

  Kind kind{Kind::kProgress};
  ImportProgress progress;
  std::optional<FileId> file_id;  // kComplete
  std::exception_ptr error;       // kError
  std::string error_message;      // kError
};

using ImportEventSink = std::function<void(const ImportEvent&)>;

struct StartResult {
  ImportId import_id{};
  uint32_t resume_from_chunk{0};
  bool resumed{false};
};

// Resumable chunked write path. Sessions are independent; each carries its
// own lock, so Abort blocks until a concurrent WriteChunk on the same session
// returns. Every plaintext span handed to WriteChunk is scrubbed before the
// call returns, whatever the outcome.
class StreamingImportPipeline {
 public:
  StreamingImportPipeline(std::shared_ptr<ChunkSealer> sealer,
                          std::shared_ptr<ImportJournal> journal, ImportPolicy policy = {});
  ~StreamingImportPipeline();

  StreamingImportPipeline(const StreamingImportPipeline&) = delete;
  StreamingImportPipeline& operator=(const StreamingImportPipeline&) = delete;

  // Resumes the pending import whose fingerprint and size match, otherwise
  // creates a new one. Throws Error{Validation, kOversizeRejected}.
  StartResult Start(const Fingerprint& fingerprint, const ImportMetadata& metadata,
                    uint64_t total_size);

  // Explicit resume of |import_id|. Returns the committed chunk count.
  // Throws kImportNotFound or kImportFingerprintMismatch.
  uint32_t Resume(const ImportId& import_id, const Fingerprint& fingerprint);

  // |index| must equal the committed count and |plaintext| must be exactly
  // one chunk, or the final remainder.
  ImportProgress WriteChunk(const ImportId& import_id, uint32_t index,
                            std::span<uint8_t> plaintext);

  // Throws Error{State, kFinishBeforeComplete} while chunks are missing; the
  // session stays resumable.
  FileId Finish(const ImportId& import_id);

  // Idempotent.
  void Abort(const ImportId& import_id);

  std::optional<ImportState> GetState(const ImportId& import_id);
  std::vector<ImportState> ListPending();

  // Aborts every pending import not updated within |max_age|; zero aborts
  // all. Returns how many were removed.
  size_t CleanupOlderThan(std::chrono::milliseconds max_age);

  // Drives a whole import from |source|: fingerprints, starts or resumes,
  // skips committed input, reads one chunk ahead while the current one is
  // sealed, and reports through |sink|. With |resume_id| set the named
  // session is verified against the source before anything is written.
  FileId Import(ImportSource& source, const ImportMetadata& metadata,
                const ImportEventSink& sink, std::optional<ImportId> resume_id = std::nullopt);

  const ImportPolicy& policy() const noexcept { return policy_; }

 private:
  struct Session {
    std::mutex mutex;
    ImportState state;
    bool closed{false};
  };

  std::shared_ptr<Session> FindSession(const ImportId& import_id);
  std::shared_ptr<Session> Adopt(ImportState state);
  void Forget(const ImportId& import_id);
  void PersistLocked(Session& session);

  std::shared_ptr<ChunkSealer> sealer_;
  std::shared_ptr<ImportJournal> journal_;
  ImportPolicy policy_;
  ResumeVerifier verifier_;

  std::mutex start_mutex_;
  std::mutex sessions_mutex_;
  std::map<ImportId, std::shared_ptr<Session>> sessions_;

  std::unique_ptr<nl::storage::TaskPool> io_pool_;
};

}  // namespace nl::import
