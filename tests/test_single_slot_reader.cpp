#include "nl/storage/single_slot_reader.h"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <memory>
#include <vector>

#include "fake_chunk_source.h"
#include "nl/error.h"
#include "nl/errors.h"

using nl::storage::ReaderPolicy;
using nl::storage::ReaderStrategy;
using nl::storage::SingleSlotReader;
using nl::test::FakeChunkSource;

namespace {

constexpr uint64_t kChunk = 1024;

ReaderPolicy SmallChunks() {
  ReaderPolicy policy;
  policy.geometry.legacy_chunk_size = kChunk;
  return policy;
}

bool MatchesPattern(const std::vector<uint8_t>& data, uint64_t position, size_t length) {
  for (size_t i = 0; i < length; ++i) {
    if (data[i] != FakeChunkSource::PatternByte(position + i)) {
      return false;
    }
  }
  return true;
}

void TestSequentialExport() {
  const uint64_t size = 5 * kChunk + 100;
  auto source = std::make_shared<FakeChunkSource>(size, kChunk);
  auto reader = nl::storage::OpenSequentialReader(source, source->Handle(), SmallChunks());
  assert(reader->strategy() == ReaderStrategy::kSingleSlot);
  auto& slot = static_cast<SingleSlotReader&>(*reader);
  assert(!slot.SlotIndex().has_value());

  std::vector<uint8_t> block(300);
  uint64_t position = 0;
  while (true) {
    const size_t got = reader->ReadAt(position, block);
    if (got == 0) {
      break;
    }
    assert(MatchesPattern(block, position, got));
    position += got;
  }
  assert(position == size);
  assert(slot.SlotIndex() == 5u);

  auto stats = reader->Stats();
  assert(stats.decrypts == 6);
  assert(stats.misses == 6);
  assert(stats.hits > 0);
  assert(source->TotalCalls() == 6);

  // Going back costs a fresh decrypt; only one chunk is ever resident.
  assert(reader->ReadAt(10, block) == block.size());
  assert(source->Calls(0) == 2);
  assert(slot.SlotIndex() == 0u);
  reader->Close();
}

void TestFailureLeavesSlotEmpty() {
  auto source = std::make_shared<FakeChunkSource>(4 * kChunk, kChunk);
  auto reader = nl::storage::OpenSequentialReader(source, source->Handle(), SmallChunks());
  auto& slot = static_cast<SingleSlotReader&>(*reader);

  std::vector<uint8_t> block(64);
  assert(reader->ReadAt(kChunk, block) == 64);
  source->FailTimes(2, 1);
  bool threw = false;
  try {
    (void)reader->ReadAt(2 * kChunk, block);
  } catch (const nl::Error& err) {
    threw = true;
    assert(err.code == nl::errors::io::kChunkLoadFailed);
    assert(err.retryability == nl::Retryability::kRetryable);
  }
  assert(threw);
  assert(!slot.SlotIndex().has_value());
  assert(reader->Stats().load_failures == 1);

  // No hidden retry; the caller retries and succeeds.
  assert(reader->ReadAt(2 * kChunk, block) == 64);
  assert(MatchesPattern(block, 2 * kChunk, 64));

  source->ReturnShort(3);
  threw = false;
  try {
    (void)reader->ReadAt(3 * kChunk, block);
  } catch (const nl::Error& err) {
    threw = true;
    assert(err.retryability == nl::Retryability::kFatal);
  }
  assert(threw);
  reader->Close();
}

void TestClosedAndOversize() {
  auto source = std::make_shared<FakeChunkSource>(2 * kChunk, kChunk);
  auto reader = nl::storage::OpenSequentialReader(source, source->Handle(), SmallChunks());
  std::vector<uint8_t> block(16);
  reader->Close();
  bool threw = false;
  try {
    (void)reader->ReadAt(0, block);
  } catch (const nl::Error& err) {
    threw = err.code == nl::errors::state::kReaderClosed;
  }
  assert(threw);

  auto policy = SmallChunks();
  policy.max_file_bytes = kChunk;
  threw = false;
  try {
    (void)nl::storage::OpenSequentialReader(source, source->Handle(), policy);
  } catch (const nl::Error& err) {
    threw = err.code == nl::errors::validation::kOversizeRejected;
  }
  assert(threw);
}

}  // namespace

int main() {
  TestSequentialExport();
  TestFailureLeavesSlotEmpty();
  TestClosedAndOversize();
  std::cout << "single slot reader tests ok\n";
  return 0;
}
