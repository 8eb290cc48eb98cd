#include "nl/import/streaming_import.h"

#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

#include "memory_import_source.h"
#include "nl/error.h"
#include "nl/errors.h"
#include "temp_dir.h"

using nl::import::FileImportJournal;
using nl::import::ImportEvent;
using nl::import::ImportMetadata;
using nl::import::ImportPolicy;
using nl::import::StreamingImportPipeline;
using nl::test::MemoryImportSource;

namespace {

constexpr uint32_t kChunk = 1000;

// Keeps sealed chunks in memory, unencrypted, so tests can inspect them.
class MemorySealer final : public nl::import::ChunkSealer {
 public:
  void EncryptChunk(const nl::ImportId& import_id, uint32_t index,
                    std::span<const uint8_t> plaintext) override {
    std::lock_guard lock(mutex_);
    ++writes_;
    if (fail_next_ > 0) {
      --fail_next_;
      throw nl::Error{nl::ErrorDomain::IO, 28, "disk full", 28};
    }
    pending_[import_id][index].assign(plaintext.begin(), plaintext.end());
  }

  void FinalizeImport(const nl::import::ImportState& state) override {
    std::lock_guard lock(mutex_);
    auto& chunks = pending_[state.import_id];
    assert(chunks.size() == state.total_chunks);
    std::vector<uint8_t> content;
    for (auto& [index, bytes] : chunks) {
      content.insert(content.end(), bytes.begin(), bytes.end());
    }
    files_[state.file_id] = std::move(content);
    pending_.erase(state.import_id);
  }

  void DiscardImport(const nl::ImportId& import_id) override {
    std::lock_guard lock(mutex_);
    ++discards_;
    pending_.erase(import_id);
  }

  void FailNext(int times) {
    std::lock_guard lock(mutex_);
    fail_next_ = times;
  }

  int Writes() const {
    std::lock_guard lock(mutex_);
    return writes_;
  }

  int Discards() const {
    std::lock_guard lock(mutex_);
    return discards_;
  }

  size_t PendingChunks(const nl::ImportId& import_id) const {
    std::lock_guard lock(mutex_);
    auto it = pending_.find(import_id);
    return it == pending_.end() ? 0 : it->second.size();
  }

  std::vector<uint8_t> File(const nl::FileId& file_id) const {
    std::lock_guard lock(mutex_);
    auto it = files_.find(file_id);
    assert(it != files_.end());
    return it->second;
  }

 private:
  mutable std::mutex mutex_;
  std::map<nl::ImportId, std::map<uint32_t, std::vector<uint8_t>>> pending_;
  std::map<nl::FileId, std::vector<uint8_t>> files_;
  int writes_{0};
  int discards_{0};
  int fail_next_{0};
};

struct Fixture {
  nl::test::TempDir dir{"nl_streaming_import"};
  std::shared_ptr<MemorySealer> sealer = std::make_shared<MemorySealer>();
  std::shared_ptr<FileImportJournal> journal =
      std::make_shared<FileImportJournal>(dir.path() / "imports");

  static ImportPolicy Policy() {
    ImportPolicy policy;
    policy.chunk_size = kChunk;
    policy.fingerprint_sample_bytes = 64;
    return policy;
  }

  std::unique_ptr<StreamingImportPipeline> Pipeline() {
    return std::make_unique<StreamingImportPipeline>(sealer, journal, Policy());
  }
};

ImportMetadata Meta() {
  ImportMetadata meta;
  meta.file_name = "holiday.mkv";
  meta.mime_type = "video/x-matroska";
  meta.file_type = 2;
  return meta;
}

std::vector<uint8_t> Slice(const std::vector<uint8_t>& data, uint32_t index) {
  const size_t begin = static_cast<size_t>(index) * kChunk;
  const size_t end = std::min(begin + kChunk, data.size());
  return std::vector<uint8_t>(data.begin() + begin, data.begin() + end);
}

template <typename Fn>
nl::Error ExpectError(Fn&& fn) {
  try {
    fn();
  } catch (const nl::Error& err) {
    return err;
  }
  assert(false && "expected nl::Error");
  return nl::Error{nl::ErrorDomain::Internal, 0, "unreachable"};
}

void TestWholeImportReportsProgress() {
  Fixture fx;
  auto pipeline = fx.Pipeline();
  MemoryImportSource source(MemoryImportSource::Pattern(4500, 1));

  std::vector<ImportEvent> events;
  const auto file_id =
      pipeline->Import(source, Meta(), [&](const ImportEvent& e) { events.push_back(e); });

  assert(fx.sealer->File(file_id) == source.bytes());
  assert(events.size() == 7);
  assert(events.front().kind == ImportEvent::Kind::kProgress);
  assert(events.front().progress.chunks_completed == 0);
  for (size_t i = 1; i < 6; ++i) {
    assert(events[i].kind == ImportEvent::Kind::kProgress);
    assert(events[i].progress.chunks_completed == i);
    assert(events[i].progress.total_chunks == 5);
  }
  assert(events[5].progress.bytes_written == 4500);
  assert(events.back().kind == ImportEvent::Kind::kComplete);
  assert(events.back().file_id == file_id);

  assert(pipeline->ListPending().empty());
  assert(fx.journal->List().empty());
}

void TestResumeAfterInterruption() {
  Fixture fx;
  MemoryImportSource source(MemoryImportSource::Pattern(4500, 2));
  nl::ImportId import_id{};
  {
    auto first = fx.Pipeline();
    nl::import::ResumeVerifier verifier(64);
    auto started = first->Start(verifier.FingerprintSource(source), Meta(), source.Size());
    assert(!started.resumed);
    import_id = started.import_id;
    for (uint32_t i = 0; i < 3; ++i) {
      auto chunk = Slice(source.bytes(), i);
      first->WriteChunk(import_id, i, chunk);
    }
    // The pipeline goes away without finishing, as on a crash.
  }
  assert(fx.sealer->Writes() == 3);

  auto second = fx.Pipeline();
  auto pending = second->ListPending();
  assert(pending.size() == 1);
  assert(pending[0].committed_chunks == 3);
  assert(pending[0].metadata.file_name == "holiday.mkv");

  std::vector<ImportEvent> events;
  const auto file_id =
      second->Import(source, Meta(), [&](const ImportEvent& e) { events.push_back(e); });
  assert(events.front().progress.import_id == import_id);
  assert(events.front().progress.chunks_completed == 3);
  assert(fx.sealer->Writes() == 5);
  assert(fx.sealer->File(file_id) == source.bytes());
  assert(second->ListPending().empty());
}

void TestMismatchedSourceRejectedBeforeWrites() {
  Fixture fx;
  auto pipeline = fx.Pipeline();
  MemoryImportSource original(MemoryImportSource::Pattern(3000, 3));
  nl::import::ResumeVerifier verifier(64);
  const auto started =
      pipeline->Start(verifier.FingerprintSource(original), Meta(), original.Size());
  auto chunk = Slice(original.bytes(), 0);
  pipeline->WriteChunk(started.import_id, 0, chunk);

  MemoryImportSource impostor(MemoryImportSource::Pattern(3000, 4));
  std::vector<ImportEvent> events;
  auto err = ExpectError([&]() {
    (void)pipeline->Import(impostor, Meta(), [&](const ImportEvent& e) { events.push_back(e); },
                           started.import_id);
  });
  assert(err.domain == nl::ErrorDomain::Validation);
  assert(err.code == nl::errors::validation::kImportFingerprintMismatch);
  assert(fx.sealer->Writes() == 1);
  assert(events.size() == 1);
  assert(events[0].kind == ImportEvent::Kind::kError);
  assert(events[0].error != nullptr);

  auto state = pipeline->GetState(started.import_id);
  assert(state && state->committed_chunks == 1);

  err = ExpectError([&]() { (void)pipeline->Resume(started.import_id, nl::import::Fingerprint{}); });
  assert(err.code == nl::errors::validation::kImportFingerprintMismatch);
  assert(pipeline->Resume(started.import_id, state->fingerprint) == 1);

  // An impostor without an explicit id just starts a fresh import.
  const auto fresh = pipeline->Import(impostor, Meta(), {});
  assert(fx.sealer->File(fresh) == impostor.bytes());
  assert(pipeline->ListPending().size() == 1);
}

void TestFinishBeforeCompleteKeepsSession() {
  Fixture fx;
  auto pipeline = fx.Pipeline();
  MemoryImportSource source(MemoryImportSource::Pattern(2500, 5));
  nl::import::ResumeVerifier verifier(64);
  const auto id = pipeline->Start(verifier.FingerprintSource(source), Meta(), 2500).import_id;
  auto chunk = Slice(source.bytes(), 0);
  pipeline->WriteChunk(id, 0, chunk);

  auto err = ExpectError([&]() { (void)pipeline->Finish(id); });
  assert(err.domain == nl::ErrorDomain::State);
  assert(err.code == nl::errors::state::kFinishBeforeComplete);
  assert(pipeline->GetState(id)->committed_chunks == 1);

  for (uint32_t i = 1; i < 3; ++i) {
    auto next = Slice(source.bytes(), i);
    pipeline->WriteChunk(id, i, next);
  }
  const auto file_id = pipeline->Finish(id);
  assert(fx.sealer->File(file_id) == source.bytes());
  assert(!pipeline->GetState(id).has_value());

  err = ExpectError([&]() {
    auto late = Slice(source.bytes(), 0);
    (void)pipeline->WriteChunk(id, 0, late);
  });
  assert(err.code == nl::errors::state::kImportNotFound);
}

void TestWriteValidationScrubsInput() {
  Fixture fx;
  auto pipeline = fx.Pipeline();
  MemoryImportSource source(MemoryImportSource::Pattern(2500, 6));
  nl::import::ResumeVerifier verifier(64);
  const auto id = pipeline->Start(verifier.FingerprintSource(source), Meta(), 2500).import_id;

  auto out_of_order = Slice(source.bytes(), 1);
  auto err = ExpectError([&]() { (void)pipeline->WriteChunk(id, 1, out_of_order); });
  assert(err.code == nl::errors::validation::kChunkOutOfOrder);
  assert(std::all_of(out_of_order.begin(), out_of_order.end(), [](uint8_t b) { return b == 0; }));

  std::vector<uint8_t> wrong_length(kChunk - 1, 0x5C);
  err = ExpectError([&]() { (void)pipeline->WriteChunk(id, 0, wrong_length); });
  assert(err.code == nl::errors::validation::kChunkLengthMismatch);
  assert(std::all_of(wrong_length.begin(), wrong_length.end(), [](uint8_t b) { return b == 0; }));

  auto good = Slice(source.bytes(), 0);
  const auto progress = pipeline->WriteChunk(id, 0, good);
  assert(progress.chunks_completed == 1);
  assert(std::all_of(good.begin(), good.end(), [](uint8_t b) { return b == 0; }));
  assert(fx.sealer->Writes() == 1);

  // The final chunk is the remainder.
  auto second = Slice(source.bytes(), 1);
  pipeline->WriteChunk(id, 1, second);
  std::vector<uint8_t> padded(kChunk, 0x01);
  err = ExpectError([&]() { (void)pipeline->WriteChunk(id, 2, padded); });
  assert(err.code == nl::errors::validation::kChunkLengthMismatch);
}

void TestSealerFailureIsRetryable() {
  Fixture fx;
  auto pipeline = fx.Pipeline();
  MemoryImportSource source(MemoryImportSource::Pattern(1500, 7));
  nl::import::ResumeVerifier verifier(64);
  const auto id = pipeline->Start(verifier.FingerprintSource(source), Meta(), 1500).import_id;

  fx.sealer->FailNext(1);
  auto chunk = Slice(source.bytes(), 0);
  auto err = ExpectError([&]() { (void)pipeline->WriteChunk(id, 0, chunk); });
  assert(err.domain == nl::ErrorDomain::IO);
  assert(err.code == nl::errors::io::kImportChunkWriteFailed);
  assert(err.retryability == nl::Retryability::kRetryable);
  assert(err.native_code == 28);
  assert(pipeline->GetState(id)->committed_chunks == 0);
  assert(fx.journal->Load(id)->committed_chunks == 0);

  auto retry = Slice(source.bytes(), 0);
  pipeline->WriteChunk(id, 0, retry);
  assert(fx.journal->Load(id)->committed_chunks == 1);
}

void TestAbortWipesEverything() {
  Fixture fx;
  auto pipeline = fx.Pipeline();
  MemoryImportSource source(MemoryImportSource::Pattern(3500, 8));
  nl::import::ResumeVerifier verifier(64);
  const auto id = pipeline->Start(verifier.FingerprintSource(source), Meta(), 3500).import_id;
  for (uint32_t i = 0; i < 2; ++i) {
    auto chunk = Slice(source.bytes(), i);
    pipeline->WriteChunk(id, i, chunk);
  }
  assert(fx.sealer->PendingChunks(id) == 2);

  pipeline->Abort(id);
  assert(fx.sealer->PendingChunks(id) == 0);
  assert(!fx.journal->Load(id).has_value());
  assert(!pipeline->GetState(id).has_value());
  auto chunk = Slice(source.bytes(), 2);
  auto err = ExpectError([&]() { (void)pipeline->WriteChunk(id, 2, chunk); });
  assert(err.code == nl::errors::state::kImportNotFound);

  pipeline->Abort(id);
  assert(fx.sealer->Discards() == 2);
}

void TestOversizeAndEmptyImports() {
  Fixture fx;
  ImportPolicy policy = Fixture::Policy();
  policy.max_file_bytes = 2000;
  StreamingImportPipeline pipeline(fx.sealer, fx.journal, policy);

  MemoryImportSource big(MemoryImportSource::Pattern(2001, 9));
  auto err = ExpectError([&]() { (void)pipeline.Import(big, Meta(), {}); });
  assert(err.code == nl::errors::validation::kOversizeRejected);
  assert(fx.journal->List().empty());

  MemoryImportSource empty(std::vector<uint8_t>{});
  const auto file_id = pipeline.Import(empty, Meta(), {});
  assert(fx.sealer->File(file_id).empty());
  assert(fx.sealer->Writes() == 0);
}

void TestCleanupRemovesPending() {
  Fixture fx;
  auto pipeline = fx.Pipeline();
  nl::import::ResumeVerifier verifier(64);
  for (uint8_t seed = 10; seed < 13; ++seed) {
    MemoryImportSource source(MemoryImportSource::Pattern(1200, seed));
    pipeline->Start(verifier.FingerprintSource(source), Meta(), source.Size());
  }
  assert(pipeline->ListPending().size() == 3);
  assert(pipeline->CleanupOlderThan(std::chrono::hours(1)) == 0);
  assert(pipeline->CleanupOlderThan(std::chrono::milliseconds(0)) == 3);
  assert(pipeline->ListPending().empty());
  assert(fx.sealer->Discards() == 3);
}

}  // namespace

int main() {
  TestWholeImportReportsProgress();
  TestResumeAfterInterruption();
  TestMismatchedSourceRejectedBeforeWrites();
  TestFinishBeforeCompleteKeepsSession();
  TestWriteValidationScrubsInput();
  TestSealerFailureIsRetryable();
  TestAbortWipesEverything();
  TestOversizeAndEmptyImports();
  TestCleanupRemovesPending();
  std::cout << "streaming import tests ok\n";
  return 0;
}
