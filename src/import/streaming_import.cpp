#include "nl/import/streaming_import.h"

#include <algorithm>
#include <future>
#include <string>
#include <utility>

#include "nl/crypto/random.h"
#include "nl/error.h"
#include "nl/errors.h"
#include "nl/orchestrator/event_bus.h"
#include "nl/security/secure_buffer.h"
#include "nl/security/zeroizer.h"
#include "nl/storage/chunk_geometry.h"
#include "nl/storage/reader_policy.h"
#include "nl/storage/task_pool.h"

namespace nl::import {

namespace {

using nl::orchestrator::Event;
using nl::orchestrator::EventBus;
using nl::orchestrator::EventCategory;
using nl::orchestrator::EventSeverity;
using nl::orchestrator::FieldPrivacy;

uint64_t NowMs() {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                   std::chrono::system_clock::now().time_since_epoch())
                                   .count());
}

ObjectId RandomId() {
  ObjectId id{};
  nl::crypto::SystemRandomBytes(id);
  return id;
}

Event ImportEventFor(std::string event_id, EventSeverity severity, std::string message,
                     const ImportId& import_id) {
  Event event;
  event.category = EventCategory::kLifecycle;
  event.severity = severity;
  event.event_id = std::move(event_id);
  event.message = std::move(message);
  event.fields.emplace_back("import_id", ToHex(import_id), FieldPrivacy::kHash);
  return event;
}

void AddNumeric(Event& event, std::string key, uint64_t value) {
  event.fields.emplace_back(std::move(key), std::to_string(value), FieldPrivacy::kPublic, true);
}

Error NotFound() {
  return Error{ErrorDomain::State, errors::state::kImportNotFound,
               std::string(errors::msg::kImportNotFound)};
}

Error Closed() {
  return Error{ErrorDomain::State, errors::state::kImportClosed,
               std::string(errors::msg::kImportClosed)};
}

ImportProgress ProgressOf(const ImportState& state) {
  ImportProgress progress;
  progress.import_id = state.import_id;
  progress.bytes_written = state.bytes_written;
  progress.total_bytes = state.total_size;
  progress.chunks_completed = state.committed_chunks;
  progress.total_chunks = state.total_chunks;
  return progress;
}

}  // namespace

ImportPolicy ImportPolicyFromEnvironment(ImportPolicy base) {
  if (auto v = nl::storage::detail::ReadUnsignedEnvironment("NL_IMPORT_CHUNK_BYTES")) {
    // Readers infer the chunk size from size and count, so only the known
    // layouts are accepted.
    if (*v != nl::storage::kLegacyChunkSize && *v != nl::storage::kStreamingChunkSize) {
      Event event;
      event.category = EventCategory::kDiagnostics;
      event.severity = EventSeverity::kWarning;
      event.event_id = "config_value_ignored";
      event.message = "Ignoring import chunk size that matches no known layout";
      event.fields.emplace_back("variable", "NL_IMPORT_CHUNK_BYTES");
      EventBus::Instance().Publish(event);
    } else {
      base.chunk_size = static_cast<uint32_t>(*v);
    }
  }
  if (auto v = nl::storage::detail::ReadUnsignedEnvironment("NL_MAX_FILE_BYTES")) {
    base.max_file_bytes = *v;
  }
  return base;
}

StreamingImportPipeline::StreamingImportPipeline(std::shared_ptr<ChunkSealer> sealer,
                                                 std::shared_ptr<ImportJournal> journal,
                                                 ImportPolicy policy)
    : sealer_(std::move(sealer)),
      journal_(std::move(journal)),
      policy_(policy),
      verifier_(policy.fingerprint_sample_bytes),
      io_pool_(std::make_unique<nl::storage::TaskPool>(1, 0)) {
  if (policy_.chunk_size == 0) {
    throw Error{ErrorDomain::Config, 0, "Import chunk size must be non-zero"};
  }
}

StreamingImportPipeline::~StreamingImportPipeline() {
  io_pool_->Shutdown();
}

std::shared_ptr<StreamingImportPipeline::Session> StreamingImportPipeline::FindSession(
    const ImportId& import_id) {
  {
    std::lock_guard lock(sessions_mutex_);
    if (auto it = sessions_.find(import_id); it != sessions_.end()) {
      return it->second;
    }
  }
  auto state = journal_->Load(import_id);
  if (!state) {
    return nullptr;
  }
  return Adopt(std::move(*state));
}

std::shared_ptr<StreamingImportPipeline::Session> StreamingImportPipeline::Adopt(
    ImportState state) {
  std::lock_guard lock(sessions_mutex_);
  auto [it, inserted] = sessions_.try_emplace(state.import_id);
  if (inserted) {
    it->second = std::make_shared<Session>();
    it->second->state = std::move(state);
  }
  return it->second;
}

void StreamingImportPipeline::Forget(const ImportId& import_id) {
  std::lock_guard lock(sessions_mutex_);
  sessions_.erase(import_id);
}

void StreamingImportPipeline::PersistLocked(Session& session) {
  try {
    journal_->Save(session.state);
  } catch (const Error& err) {
    // The chunk is sealed; a stale journal only makes a later resume rewrite
    // it.
    Event event = ImportEventFor("import_state_persist_failed", EventSeverity::kWarning,
                                 err.what(), session.state.import_id);
    AddNumeric(event, "committed_chunks", session.state.committed_chunks);
    EventBus::Instance().Publish(event);
  }
}

StartResult StreamingImportPipeline::Start(const Fingerprint& fingerprint,
                                           const ImportMetadata& metadata, uint64_t total_size) {
  if (total_size > policy_.max_file_bytes) {
    throw Error{ErrorDomain::Validation, errors::validation::kOversizeRejected,
                std::string(errors::msg::kOversizeRejected)};
  }
  std::lock_guard start_lock(start_mutex_);

  for (auto& pending : journal_->List()) {
    if (pending.total_size != total_size || !ResumeVerifier::Matches(pending.fingerprint, fingerprint)) {
      continue;
    }
    auto session = Adopt(std::move(pending));
    std::lock_guard lock(session->mutex);
    if (session->closed) {
      continue;
    }
    StartResult result{session->state.import_id, session->state.committed_chunks, true};
    Event event = ImportEventFor("import_resumed", EventSeverity::kInfo,
                                 "Resuming pending import", result.import_id);
    AddNumeric(event, "resume_from_chunk", result.resume_from_chunk);
    AddNumeric(event, "total_chunks", session->state.total_chunks);
    EventBus::Instance().Publish(event);
    return result;
  }

  ImportState state;
  state.import_id = RandomId();
  state.file_id = RandomId();
  state.fingerprint = fingerprint;
  state.metadata = metadata;
  state.total_size = total_size;
  state.chunk_size = policy_.chunk_size;
  const uint64_t chunks = nl::storage::CeilDiv(total_size, policy_.chunk_size);
  if (chunks > UINT32_MAX) {
    throw Error{ErrorDomain::Validation, errors::validation::kOversizeRejected,
                std::string(errors::msg::kOversizeRejected)};
  }
  state.total_chunks = static_cast<uint32_t>(chunks);
  state.created_at_ms = NowMs();
  state.updated_at_ms = state.created_at_ms;
  journal_->Save(state);

  StartResult result{state.import_id, 0, false};
  Event event = ImportEventFor("import_started", EventSeverity::kInfo, "Streaming import started",
                               result.import_id);
  AddNumeric(event, "total_size", state.total_size);
  AddNumeric(event, "total_chunks", state.total_chunks);
  AddNumeric(event, "chunk_size", state.chunk_size);
  Adopt(std::move(state));
  EventBus::Instance().Publish(event);
  return result;
}

uint32_t StreamingImportPipeline::Resume(const ImportId& import_id,
                                         const Fingerprint& fingerprint) {
  auto session = FindSession(import_id);
  if (!session) {
    throw NotFound();
  }
  std::lock_guard lock(session->mutex);
  if (session->closed) {
    throw Closed();
  }
  if (!ResumeVerifier::Matches(session->state.fingerprint, fingerprint)) {
    Event event = ImportEventFor("import_fingerprint_mismatch", EventSeverity::kWarning,
                                 std::string(errors::msg::kImportFingerprintMismatch), import_id);
    event.category = EventCategory::kSecurity;
    EventBus::Instance().Publish(event);
    ResumeVerifier::Verify(session->state.fingerprint, fingerprint);
  }
  Event event = ImportEventFor("import_resumed", EventSeverity::kInfo, "Resuming pending import",
                               import_id);
  AddNumeric(event, "resume_from_chunk", session->state.committed_chunks);
  AddNumeric(event, "total_chunks", session->state.total_chunks);
  EventBus::Instance().Publish(event);
  return session->state.committed_chunks;
}

ImportProgress StreamingImportPipeline::WriteChunk(const ImportId& import_id, uint32_t index,
                                                   std::span<uint8_t> plaintext) {
  nl::security::Zeroizer::ScopeScrubber scrub(plaintext);

  auto session = FindSession(import_id);
  if (!session) {
    throw NotFound();
  }
  std::lock_guard lock(session->mutex);
  if (session->closed) {
    throw Closed();
  }
  ImportState& state = session->state;
  if (index != state.committed_chunks || index >= state.total_chunks) {
    throw Error{ErrorDomain::Validation, errors::validation::kChunkOutOfOrder,
                std::string(errors::msg::kChunkOutOfOrder) + " (expected " +
                    std::to_string(state.committed_chunks) + ", got " + std::to_string(index) +
                    ")"};
  }
  const uint64_t offset = static_cast<uint64_t>(index) * state.chunk_size;
  const uint64_t expected = std::min<uint64_t>(state.chunk_size, state.total_size - offset);
  if (plaintext.size() != expected) {
    throw Error{ErrorDomain::Validation, errors::validation::kChunkLengthMismatch,
                std::string(errors::msg::kChunkLengthMismatch) + " (expected " +
                    std::to_string(expected) + ", got " + std::to_string(plaintext.size()) + ")"};
  }

  try {
    sealer_->EncryptChunk(import_id, index, plaintext);
  } catch (const std::exception& ex) {
    Event event = ImportEventFor("import_chunk_write_failed", EventSeverity::kError, ex.what(),
                                 import_id);
    AddNumeric(event, "chunk_index", index);
    EventBus::Instance().Publish(event);
    std::optional<int> native;
    if (const auto* err = dynamic_cast<const Error*>(&ex)) {
      native = err->native_code;
    }
    throw Error{ErrorDomain::IO, errors::io::kImportChunkWriteFailed,
                std::string(errors::msg::kImportChunkWriteFailed) + ": " + ex.what(), native,
                Retryability::kRetryable, {"chunk " + std::to_string(index)}};
  }

  state.committed_chunks = index + 1;
  state.bytes_written = offset + expected;
  state.updated_at_ms = NowMs();
  PersistLocked(*session);
  return ProgressOf(state);
}

FileId StreamingImportPipeline::Finish(const ImportId& import_id) {
  auto session = FindSession(import_id);
  if (!session) {
    throw NotFound();
  }
  std::lock_guard lock(session->mutex);
  if (session->closed) {
    throw Closed();
  }
  const ImportState& state = session->state;
  if (!state.complete()) {
    Event event = ImportEventFor("import_finish_rejected", EventSeverity::kError,
                                 std::string(errors::msg::kFinishBeforeComplete), import_id);
    AddNumeric(event, "committed_chunks", state.committed_chunks);
    AddNumeric(event, "total_chunks", state.total_chunks);
    EventBus::Instance().Publish(event);
    throw Error{ErrorDomain::State, errors::state::kFinishBeforeComplete,
                std::string(errors::msg::kFinishBeforeComplete) + " (" +
                    std::to_string(state.committed_chunks) + "/" +
                    std::to_string(state.total_chunks) + ")"};
  }
  sealer_->FinalizeImport(state);
  session->closed = true;
  const FileId file_id = state.file_id;
  journal_->Remove(import_id);
  Forget(import_id);

  Event event = ImportEventFor("import_finished", EventSeverity::kInfo, "Streaming import finished",
                               import_id);
  event.fields.emplace_back("file_id", ToHex(file_id), FieldPrivacy::kHash);
  AddNumeric(event, "total_size", state.total_size);
  AddNumeric(event, "total_chunks", state.total_chunks);
  EventBus::Instance().Publish(event);
  return file_id;
}

void StreamingImportPipeline::Abort(const ImportId& import_id) {
  std::shared_ptr<Session> session;
  {
    std::lock_guard lock(sessions_mutex_);
    if (auto it = sessions_.find(import_id); it != sessions_.end()) {
      session = it->second;
    }
  }
  std::unique_lock<std::mutex> session_lock;
  if (session) {
    session_lock = std::unique_lock(session->mutex);
    session->closed = true;
  }
  sealer_->DiscardImport(import_id);
  journal_->Remove(import_id);
  Forget(import_id);

  EventBus::Instance().Publish(
      ImportEventFor("import_aborted", EventSeverity::kInfo, "Streaming import aborted", import_id));
}

std::optional<ImportState> StreamingImportPipeline::GetState(const ImportId& import_id) {
  auto session = FindSession(import_id);
  if (!session) {
    return std::nullopt;
  }
  std::lock_guard lock(session->mutex);
  if (session->closed) {
    return std::nullopt;
  }
  return session->state;
}

std::vector<ImportState> StreamingImportPipeline::ListPending() {
  std::vector<ImportState> pending = journal_->List();
  // In-memory state may be ahead of the journal after a failed save.
  for (auto& state : pending) {
    std::shared_ptr<Session> session;
    {
      std::lock_guard lock(sessions_mutex_);
      if (auto it = sessions_.find(state.import_id); it != sessions_.end()) {
        session = it->second;
      }
    }
    if (session) {
      std::lock_guard lock(session->mutex);
      state = session->state;
    }
  }
  return pending;
}

size_t StreamingImportPipeline::CleanupOlderThan(std::chrono::milliseconds max_age) {
  const uint64_t now = NowMs();
  const auto age_ms = static_cast<uint64_t>(std::max<int64_t>(0, max_age.count()));
  size_t removed = 0;
  for (const auto& state : ListPending()) {
    const uint64_t idle = now > state.updated_at_ms ? now - state.updated_at_ms : 0;
    if (age_ms == 0 || idle >= age_ms) {
      Abort(state.import_id);
      ++removed;
    }
  }
  Event event;
  event.category = EventCategory::kLifecycle;
  event.severity = EventSeverity::kInfo;
  event.event_id = "imports_cleaned";
  event.message = "Stale pending imports removed";
  AddNumeric(event, "removed", removed);
  AddNumeric(event, "max_age_ms", age_ms);
  EventBus::Instance().Publish(event);
  return removed;
}

FileId StreamingImportPipeline::Import(ImportSource& source, const ImportMetadata& metadata,
                                       const ImportEventSink& sink,
                                       std::optional<ImportId> resume_id) {
  auto emit = [&sink](const ImportEvent& event) {
    if (sink) {
      sink(event);
    }
  };
  ImportProgress progress;
  progress.total_bytes = source.Size();

  std::future<nl::security::SecureBuffer<uint8_t>> ahead;
  // A read still queued or running must not outlive this frame.
  struct AwaitReadAhead {
    std::future<nl::security::SecureBuffer<uint8_t>>& future;
    ~AwaitReadAhead() {
      if (future.valid()) {
        future.wait();
      }
    }
  } await_ahead{ahead};

  try {
    const uint64_t total_size = source.Size();
    const Fingerprint fingerprint = verifier_.FingerprintSource(source);
    ImportId import_id{};
    if (resume_id) {
      import_id = *resume_id;
      Resume(import_id, fingerprint);
    } else {
      import_id = Start(fingerprint, metadata, total_size).import_id;
    }
    const auto state = GetState(import_id);
    if (!state) {
      throw NotFound();
    }
    progress = ProgressOf(*state);
    emit(ImportEvent{ImportEvent::Kind::kProgress, progress, std::nullopt, nullptr, {}});

    const uint32_t total_chunks = state->total_chunks;
    const uint64_t chunk_size = state->chunk_size;
    auto read_chunk = [&source, chunk_size, total_size](uint32_t index) {
      const uint64_t offset = static_cast<uint64_t>(index) * chunk_size;
      const auto length = static_cast<size_t>(std::min<uint64_t>(chunk_size, total_size - offset));
      nl::security::SecureBuffer<uint8_t> buffer(length);
      if (source.ReadAt(offset, buffer.AsSpan()) != length) {
        throw Error{ErrorDomain::IO, errors::io::kSourceReadFailed,
                    std::string(errors::msg::kSourceReadFailed) + ": source ended early",
                    std::nullopt, Retryability::kFatal, {"chunk " + std::to_string(index)}};
      }
      return buffer;
    };

    uint32_t next = state->committed_chunks;
    if (next < total_chunks) {
      ahead = io_pool_->SubmitUrgent([read_chunk, next]() { return read_chunk(next); });
    }
    while (next < total_chunks) {
      nl::security::SecureBuffer<uint8_t> current = ahead.get();
      if (next + 1 < total_chunks) {
        ahead = io_pool_->SubmitUrgent(
            [read_chunk, index = next + 1]() { return read_chunk(index); });
      }
      progress = WriteChunk(import_id, next, current.AsSpan());
      emit(ImportEvent{ImportEvent::Kind::kProgress, progress, std::nullopt, nullptr, {}});
      ++next;
    }

    const FileId file_id = Finish(import_id);
    emit(ImportEvent{ImportEvent::Kind::kComplete, progress, file_id, nullptr, {}});
    return file_id;
  } catch (const std::exception& ex) {
    emit(ImportEvent{ImportEvent::Kind::kError, progress, std::nullopt, std::current_exception(),
                     ex.what()});
    throw;
  }
}

}  // namespace nl::import
