#include "nl/vault/local_chunk_store.h"

#include <algorithm>
#include <array>
#include <atomic>
#include <cassert>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <span>
#include <vector>

#include "nl/error.h"
#include "nl/crypto/provider.h"
#include "nl/errors.h"
#include "nl/import/import_journal.h"
#include "nl/import/import_source.h"
#include "nl/import/streaming_import.h"
#include "nl/storage/random_access_reader.h"
#include "nl/storage/single_slot_reader.h"
#include "temp_dir.h"

using nl::vault::LocalChunkStore;

namespace {

constexpr uint32_t kChunk = 4096;
constexpr size_t kFileSize = 3 * kChunk + 2048;

std::array<uint8_t, nl::vault::kStoreKeySize> Key(uint8_t fill) {
  std::array<uint8_t, nl::vault::kStoreKeySize> key{};
  key.fill(fill);
  return key;
}

std::vector<uint8_t> Content() {
  std::vector<uint8_t> data(kFileSize);
  for (size_t i = 0; i < data.size(); ++i) {
    data[i] = static_cast<uint8_t>((i * 29U) ^ (i >> 5));
  }
  return data;
}

nl::storage::ReaderPolicy ReaderPolicyFor(bool windowed) {
  nl::storage::ReaderPolicy policy;
  policy.geometry.legacy_chunk_size = 1024;
  policy.geometry.streaming_chunk_size = kChunk;
  policy.reference_chunk_bytes = kChunk;
  if (windowed) {
    policy.preload_threshold_bytes = 0;
  }
  return policy;
}

struct Vault {
  nl::test::TempDir dir{"nl_local_store"};
  std::shared_ptr<LocalChunkStore> store;
  std::shared_ptr<nl::import::FileImportJournal> journal;
  std::unique_ptr<nl::import::StreamingImportPipeline> pipeline;

  Vault() {
    const auto key = Key(0x42);
    store = std::make_shared<LocalChunkStore>(dir.path(), key);
    journal = std::make_shared<nl::import::FileImportJournal>(store->JournalRoot());
    nl::import::ImportPolicy policy;
    policy.chunk_size = kChunk;
    pipeline = std::make_unique<nl::import::StreamingImportPipeline>(store, journal, policy);
  }

  nl::FileId ImportContent() {
    const auto source_path = dir.path() / "source.bin";
    const auto data = Content();
    {
      std::ofstream out(source_path, std::ios::binary);
      out.write(reinterpret_cast<const char*>(data.data()),
                static_cast<std::streamsize>(data.size()));
    }
    nl::import::FileImportSource source(source_path);
    nl::import::ImportMetadata meta;
    meta.file_name = "source.bin";
    meta.mime_type = "application/octet-stream";
    return pipeline->Import(source, meta, {});
  }

  std::filesystem::path ChunkPath(const nl::FileId& file, uint32_t index) const {
    return dir.path() / "files" / nl::ToHex(file) / LocalChunkStore::ChunkFileName(index);
  }
};

std::vector<uint8_t> ReadAll(nl::storage::RandomAccessReader& reader) {
  std::vector<uint8_t> out(static_cast<size_t>(reader.Size()));
  size_t done = 0;
  while (done < out.size()) {
    std::span<uint8_t> window(out.data() + done, std::min<size_t>(3000, out.size() - done));
    const size_t got = reader.ReadAt(done, window);
    assert(got > 0);
    done += got;
  }
  return out;
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

void TestImportThenRead() {
  Vault vault;
  const auto file_id = vault.ImportContent();

  const auto handle = vault.store->Describe(file_id);
  assert(handle.total_size == kFileSize);
  assert(handle.chunk_count == 4);
  const auto info = vault.store->Info(file_id);
  assert(info.metadata.file_name == "source.bin");
  assert(info.chunk_size == kChunk);

  for (bool windowed : {false, true}) {
    auto reader = nl::storage::OpenReader(vault.store, handle, ReaderPolicyFor(windowed));
    assert((reader->strategy() == nl::storage::ReaderStrategy::kWindowed) == windowed);
    assert(ReadAll(*reader) == Content());
    reader->Close();
  }

  // Nothing is left in the pending area or the journal.
  assert(std::filesystem::is_empty(vault.dir.path() / "pending"));
  assert(vault.journal->List().empty());

  // A fresh store over the same root reads the manifest from disk.
  const auto key = Key(0x42);
  auto reopened = std::make_shared<LocalChunkStore>(vault.dir.path(), key);
  auto reader = nl::storage::OpenSequentialReader(reopened, reopened->Describe(file_id),
                                                  ReaderPolicyFor(false));
  assert(ReadAll(*reader) == Content());
}

void TestTamperedChunkIsRejected() {
  Vault vault;
  const auto file_id = vault.ImportContent();
  {
    std::fstream file(vault.ChunkPath(file_id, 1), std::ios::binary | std::ios::in | std::ios::out);
    file.seekg(40);
    char byte = 0;
    file.read(&byte, 1);
    byte = static_cast<char>(byte ^ 0x01);
    file.seekp(40);
    file.write(&byte, 1);
  }

  auto err = ExpectError([&]() { (void)vault.store->DecryptChunk(file_id, 1); });
  assert(err.domain == nl::ErrorDomain::Crypto);
  assert(err.code == nl::errors::crypto::kChunkAuthenticationFailed);

  // Other chunks are unaffected.
  assert(vault.store->DecryptChunk(file_id, 0).size() == kChunk);

  err = ExpectError([&]() {
    (void)nl::storage::OpenReader(vault.store, vault.store->Describe(file_id),
                                  ReaderPolicyFor(false));
  });
  assert(err.domain == nl::ErrorDomain::IO);
  assert(err.code == nl::errors::io::kChunkLoadFailed);
}

void TestChunksAreBoundToTheirIndex() {
  Vault vault;
  const auto file_id = vault.ImportContent();
  std::filesystem::copy_file(vault.ChunkPath(file_id, 0), vault.ChunkPath(file_id, 1),
                             std::filesystem::copy_options::overwrite_existing);
  auto err = ExpectError([&]() { (void)vault.store->DecryptChunk(file_id, 1); });
  assert(err.code == nl::errors::crypto::kChunkAuthenticationFailed);
}

void TestWrongKeyFails() {
  Vault vault;
  const auto file_id = vault.ImportContent();
  const auto other_key = Key(0x43);
  LocalChunkStore other(vault.dir.path(), other_key);
  auto err = ExpectError([&]() { (void)other.DecryptChunk(file_id, 0); });
  assert(err.code == nl::errors::crypto::kChunkAuthenticationFailed);
}

void TestAbortWipesPendingChunks() {
  Vault vault;
  std::vector<uint8_t> head(kChunk, 0x11);
  nl::import::Fingerprint fingerprint{};
  fingerprint.fill(0x01);
  nl::import::ImportMetadata meta;
  const auto started = vault.pipeline->Start(fingerprint, meta, 2 * kChunk);
  vault.pipeline->WriteChunk(started.import_id, 0, head);

  const auto pending = vault.dir.path() / "pending" / nl::ToHex(started.import_id);
  assert(std::filesystem::exists(pending / LocalChunkStore::ChunkFileName(0)));

  vault.pipeline->Abort(started.import_id);
  assert(!std::filesystem::exists(pending));
  assert(!vault.journal->Load(started.import_id).has_value());
}

void TestFinalizeRequiresEveryChunk() {
  Vault vault;
  nl::import::ImportState state;
  state.import_id.fill(0x21);
  state.file_id.fill(0x22);
  state.total_size = 2 * kChunk;
  state.chunk_size = kChunk;
  state.total_chunks = 2;
  std::vector<uint8_t> first(kChunk, 0x33);
  vault.store->EncryptChunk(state.import_id, 0, first);

  auto err = ExpectError([&]() { vault.store->FinalizeImport(state); });
  assert(err.domain == nl::ErrorDomain::IO);
  assert(err.code == nl::errors::io::kChunkFileMissing);

  err = ExpectError([&]() { (void)vault.store->Describe(state.file_id); });
  assert(err.domain == nl::ErrorDomain::State);
  assert(err.code == nl::errors::state::kFileNotFound);
}

class CountingProvider final : public nl::crypto::CryptoProvider {
 public:
  using AES = nl::crypto::AES256_GCM;

  AES::EncryptionResult EncryptAES256GCM(std::span<const uint8_t> plaintext,
                                         std::span<const uint8_t> aad,
                                         std::span<const uint8_t, AES::NONCE_SIZE> nonce,
                                         std::span<const uint8_t, AES::KEY_SIZE> key) override {
    encrypts.fetch_add(1);
    return inner_.EncryptAES256GCM(plaintext, aad, nonce, key);
  }

  size_t DecryptAES256GCM(std::span<const uint8_t> ciphertext, std::span<const uint8_t> aad,
                          std::span<const uint8_t, AES::NONCE_SIZE> nonce,
                          std::span<const uint8_t, AES::TAG_SIZE> tag,
                          std::span<const uint8_t, AES::KEY_SIZE> key,
                          std::span<uint8_t> destination) override {
    decrypts.fetch_add(1);
    return inner_.DecryptAES256GCM(ciphertext, aad, nonce, tag, key, destination);
  }

  std::array<uint8_t, 32> SHA256(std::span<const uint8_t> data) override {
    return inner_.SHA256(data);
  }

  std::atomic<int> encrypts{0};
  std::atomic<int> decrypts{0};

 private:
  nl::crypto::OpenSSLCryptoProvider inner_;
};

void TestEachChunkGoesThroughTheProviderOnce() {
  auto counting = std::make_shared<CountingProvider>();
  nl::crypto::SetCryptoProvider(counting);
  {
    Vault vault;
    const auto file_id = vault.ImportContent();
    assert(counting->encrypts.load() == 4);

    auto reader = nl::storage::OpenReader(vault.store, vault.store->Describe(file_id),
                                          ReaderPolicyFor(false));
    assert(counting->decrypts.load() == 4);
    assert(ReadAll(*reader) == Content());
    assert(counting->decrypts.load() == 4);
  }
  nl::crypto::SetCryptoProvider(nullptr);
}

void TestManifestValidation() {
  nl::vault::StoredFileInfo info;
  info.file_id.fill(0x01);
  info.binding_id.fill(0x02);
  info.total_size = 5000;
  info.chunk_count = 2;
  info.chunk_size = kChunk;
  info.metadata.file_name = "a";
  auto bytes = nl::vault::SerializeManifest(info);
  const auto parsed = nl::vault::ParseManifest(bytes);
  assert(parsed.binding_id == info.binding_id);
  assert(parsed.chunk_size == kChunk);

  bytes.pop_back();
  auto err = ExpectError([&]() { (void)nl::vault::ParseManifest(bytes); });
  assert(err.domain == nl::ErrorDomain::Validation);
  assert(err.code == nl::errors::validation::kManifestInvalid);
}

}  // namespace

int main() {
  TestImportThenRead();
  TestTamperedChunkIsRejected();
  TestChunksAreBoundToTheirIndex();
  TestWrongKeyFails();
  TestAbortWipesPendingChunks();
  TestFinalizeRequiresEveryChunk();
  TestManifestValidation();
  TestEachChunkGoesThroughTheProviderOnce();
  std::cout << "local chunk store tests ok\n";
  return 0;
}
