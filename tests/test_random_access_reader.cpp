#include "nl/storage/random_access_reader.h"

#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <random>
#include <thread>
#include <vector>

#include "fake_chunk_source.h"
#include "nl/error.h"
#include "nl/errors.h"

using nl::storage::OpenReader;
using nl::storage::ReaderPolicy;
using nl::storage::ReaderStrategy;
using nl::storage::WindowedReader;
using nl::test::FakeChunkSource;

namespace {

constexpr uint64_t kChunk = 4096;
constexpr uint32_t kChunks = 125;

bool MatchesPattern(const std::vector<uint8_t>& data, uint64_t position, size_t length) {
  for (size_t i = 0; i < length; ++i) {
    if (data[i] != FakeChunkSource::PatternByte(position + i)) {
      return false;
    }
  }
  return true;
}

// Small chunks so a 125-chunk file stays tiny; every file is windowed.
ReaderPolicy WindowedPolicy() {
  ReaderPolicy policy;
  policy.geometry.legacy_chunk_size = 1024;
  policy.geometry.streaming_chunk_size = kChunk;
  policy.reference_chunk_bytes = kChunk;
  policy.cache_chunks_small = 200;
  policy.preload_threshold_bytes = 0;
  policy.prefetch_enabled = false;
  policy.retry_backoff = std::chrono::milliseconds(1);
  return policy;
}

WindowedReader& AsWindowed(nl::storage::RandomAccessReader& reader) {
  assert(reader.strategy() == ReaderStrategy::kWindowed);
  return static_cast<WindowedReader&>(reader);
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

void TestPreloadStrategy() {
  auto source = std::make_shared<FakeChunkSource>(10 * 1024 + 37, 1024);
  auto handle = source->Handle();
  ReaderPolicy policy;
  policy.geometry.legacy_chunk_size = 1024;
  auto reader = OpenReader(source, handle, policy);
  assert(reader->strategy() == ReaderStrategy::kPreload);
  assert(reader->Size() == handle.total_size);
  assert(source->TotalCalls() == 11);
  assert(reader->Stats().decrypts == 11);

  std::vector<uint8_t> buffer(3000);
  assert(reader->ReadAt(900, buffer) == 3000);
  assert(MatchesPattern(buffer, 900, 3000));
  assert(reader->ReadAt(handle.total_size - 5, buffer) == 5);
  assert(MatchesPattern(buffer, handle.total_size - 5, 5));
  assert(reader->ReadAt(handle.total_size, buffer) == 0);
  // Reads never decrypt again.
  assert(source->TotalCalls() == 11);

  reader->Close();
  reader->Close();
  auto err = ExpectError([&]() { (void)reader->ReadAt(0, buffer); });
  assert(err.domain == nl::ErrorDomain::State);
  assert(err.code == nl::errors::state::kReaderClosed);
}

// A decrypt stuck past the preload deadline must not hold up the open.
void TestPreloadTimeout() {
  auto source = std::make_shared<FakeChunkSource>(10 * 1024, 1024);
  ReaderPolicy policy;
  policy.geometry.legacy_chunk_size = 1024;
  policy.preload_timeout = std::chrono::milliseconds(100);
  source->Gate(0);

  const auto started = std::chrono::steady_clock::now();
  auto err = ExpectError([&]() { (void)OpenReader(source, source->Handle(), policy); });
  const auto elapsed = std::chrono::steady_clock::now() - started;
  assert(elapsed < std::chrono::seconds(2));
  assert(err.domain == nl::ErrorDomain::IO);
  assert(err.code == nl::errors::io::kChunkLoadTimeout);
  assert(err.retryability == nl::Retryability::kTransient);

  // The abandoned preload stops after the chunk it was waiting on.
  source->Release(0);
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  assert(source->Calls(0) == 1);
  assert(source->Calls(1) == 0);

  auto reader = OpenReader(source, source->Handle(), policy);
  assert(reader->strategy() == ReaderStrategy::kPreload);
  reader->Close();
}

void TestSequentialThenRepeatedReads() {
  auto source = std::make_shared<FakeChunkSource>(kChunks * kChunk, kChunk);
  auto reader = OpenReader(source, source->Handle(), WindowedPolicy());
  auto& windowed = AsWindowed(*reader);
  assert(windowed.geometry().chunk_size == kChunk);
  assert(windowed.CacheCapacityChunks() == kChunks);

  std::vector<uint8_t> buffer(kChunk);
  for (uint32_t i = 0; i < kChunks; ++i) {
    assert(reader->ReadAt(i * kChunk, buffer) == kChunk);
    assert(MatchesPattern(buffer, i * kChunk, kChunk));
  }
  auto stats = reader->Stats();
  assert(stats.misses == kChunks);
  assert(stats.decrypts == kChunks);
  assert(stats.hits == 0);

  for (uint32_t i = 0; i < kChunks; ++i) {
    assert(reader->ReadAt(i * kChunk, buffer) == kChunk);
  }
  stats = reader->Stats();
  assert(stats.hits == kChunks);
  assert(stats.decrypts == kChunks);
  assert(stats.evictions == 0);
  assert(source->TotalCalls() == static_cast<int>(kChunks));
  assert(windowed.ResidentChunks() <= windowed.CacheCapacityChunks());

  // A read spanning three chunks.
  std::vector<uint8_t> wide(10000);
  assert(reader->ReadAt(4000, wide) == wide.size());
  assert(MatchesPattern(wide, 4000, wide.size()));

  // Short read at the tail, empty read past it.
  assert(reader->ReadAt(kChunks * kChunk - 10, buffer) == 10);
  assert(reader->ReadAt(kChunks * kChunk, buffer) == 0);
  reader->Close();
}

void TestSmallCacheStaysBounded() {
  auto source = std::make_shared<FakeChunkSource>(kChunks * kChunk, kChunk);
  auto policy = WindowedPolicy();
  policy.cache_chunks_small = 8;
  policy.recency_window = std::chrono::milliseconds(0);
  auto reader = OpenReader(source, source->Handle(), policy);
  auto& windowed = AsWindowed(*reader);
  assert(windowed.CacheCapacityChunks() == 8);

  std::mt19937 rng(7);
  std::vector<uint8_t> buffer(1500);
  for (int i = 0; i < 500; ++i) {
    const uint64_t position = rng() % (kChunks * kChunk);
    const size_t got = reader->ReadAt(position, buffer);
    assert(got == std::min<uint64_t>(buffer.size(), kChunks * kChunk - position));
    assert(MatchesPattern(buffer, position, got));
    assert(windowed.ResidentChunks() <= 8);
  }
  assert(reader->Stats().evictions > 0);
  reader->Close();
}

void TestSeekCancelsPrefetchWithoutBlocking() {
  auto source = std::make_shared<FakeChunkSource>(kChunks * kChunk, kChunk);
  auto policy = WindowedPolicy();
  policy.prefetch_enabled = true;
  policy.background_workers = 1;
  for (uint32_t i = 3; i <= 14; ++i) {
    source->Gate(i);
  }
  auto reader = OpenReader(source, source->Handle(), policy);
  auto& windowed = AsWindowed(*reader);

  std::vector<uint8_t> buffer(100);
  assert(reader->ReadAt(2 * kChunk, buffer) == 100);
  assert(windowed.PrefetchInFlight(3));
  assert(windowed.PrefetchInFlight(14));
  assert(source->WaitForStart(3, std::chrono::milliseconds(2000)));

  const auto started = std::chrono::steady_clock::now();
  assert(reader->ReadAt(100 * kChunk, buffer) == 100);
  const auto elapsed = std::chrono::steady_clock::now() - started;
  assert(elapsed < std::chrono::seconds(2));
  assert(MatchesPattern(buffer, 100 * kChunk, 100));
  assert(!windowed.PrefetchInFlight(14));

  auto stats = reader->Stats();
  assert(stats.prefetch_cancelled >= 12);
  for (uint32_t i = 4; i <= 14; ++i) {
    assert(source->Calls(i) == 0);
  }

  source->ReleaseAll();
  reader->Close();
}

void TestStatsDuringClose() {
  auto source = std::make_shared<FakeChunkSource>(kChunks * kChunk, kChunk);
  auto policy = WindowedPolicy();
  policy.prefetch_enabled = true;
  policy.background_workers = 1;
  auto reader = OpenReader(source, source->Handle(), policy);

  std::vector<uint8_t> buffer(kChunk);
  for (uint32_t i = 0; i < 10; ++i) {
    assert(reader->ReadAt(i * kChunk, buffer) == kChunk);
  }
  const auto before = reader->Stats();
  assert(before.prefetch_scheduled > 0);

  std::atomic<bool> done{false};
  std::thread poller([&]() {
    while (!done.load()) {
      const auto stats = reader->Stats();
      assert(stats.prefetch_scheduled == before.prefetch_scheduled);
    }
  });
  reader->Close();
  done.store(true);
  poller.join();

  const auto after = reader->Stats();
  assert(after.prefetch_scheduled == before.prefetch_scheduled);
  assert(after.prefetch_cancelled >= before.prefetch_cancelled);
  assert(after.hits + after.misses == 10);
}

void TestRetriesThenSucceeds() {
  auto source = std::make_shared<FakeChunkSource>(kChunks * kChunk, kChunk);
  auto reader = OpenReader(source, source->Handle(), WindowedPolicy());
  std::vector<uint8_t> buffer(64);

  source->FailTimes(5, 2);
  assert(reader->ReadAt(5 * kChunk, buffer) == 64);
  assert(MatchesPattern(buffer, 5 * kChunk, 64));
  assert(source->Calls(5) == 3);
  assert(reader->Stats().retries == 2);

  source->FailTimes(6, 3);
  auto err = ExpectError([&]() { (void)reader->ReadAt(6 * kChunk, buffer); });
  assert(err.domain == nl::ErrorDomain::IO);
  assert(err.code == nl::errors::io::kChunkLoadFailed);
  assert(err.retryability == nl::Retryability::kRetryable);
  assert(reader->Stats().load_failures == 1);

  // Failures are not sticky: the next read of the chunk goes back to the source.
  assert(reader->ReadAt(6 * kChunk, buffer) == 64);
  assert(MatchesPattern(buffer, 6 * kChunk, 64));
  reader->Close();
}

void TestLoadTimeout() {
  auto source = std::make_shared<FakeChunkSource>(kChunks * kChunk, kChunk);
  auto policy = WindowedPolicy();
  policy.load_timeout = std::chrono::milliseconds(50);
  policy.load_attempts = 2;
  auto reader = OpenReader(source, source->Handle(), policy);
  source->Gate(7);

  std::vector<uint8_t> buffer(64);
  auto err = ExpectError([&]() { (void)reader->ReadAt(7 * kChunk, buffer); });
  assert(err.domain == nl::ErrorDomain::IO);
  assert(err.code == nl::errors::io::kChunkLoadTimeout);
  assert(err.retryability == nl::Retryability::kTransient);
  assert(reader->Stats().load_failures == 1);

  source->Release(7);
  // Another chunk still loads once the stuck decrypt drains.
  assert(reader->ReadAt(8 * kChunk, buffer) == 64);
  reader->Close();
}

void TestShortChunkFailsImmediately() {
  auto source = std::make_shared<FakeChunkSource>(kChunks * kChunk, kChunk);
  auto reader = OpenReader(source, source->Handle(), WindowedPolicy());
  source->ReturnShort(9);
  std::vector<uint8_t> buffer(kChunk);
  auto err = ExpectError([&]() { (void)reader->ReadAt(9 * kChunk, buffer); });
  assert(err.code == nl::errors::io::kChunkLoadFailed);
  assert(err.retryability == nl::Retryability::kFatal);
  assert(source->Calls(9) == 1);
  reader->Close();
}

void TestOversizeRejectedBeforeDecrypt() {
  const uint64_t size = 60ULL * 1024 * 1024 * 1024;
  auto source = std::make_shared<FakeChunkSource>(size, nl::storage::kStreamingChunkSize);
  auto err = ExpectError([&]() { (void)OpenReader(source, source->Handle()); });
  assert(err.domain == nl::ErrorDomain::Validation);
  assert(err.code == nl::errors::validation::kOversizeRejected);
  assert(source->TotalCalls() == 0);
}

void TestEstimatedGeometryReadsCorrectly() {
  auto source = std::make_shared<FakeChunkSource>(1000, 334);
  auto reader = OpenReader(source, source->Handle());
  assert(reader->strategy() == ReaderStrategy::kPreload);
  std::vector<uint8_t> all(1000);
  assert(reader->ReadAt(0, all) == 1000);
  assert(MatchesPattern(all, 0, 1000));
}

void TestCloseDuringConcurrentReads() {
  auto source = std::make_shared<FakeChunkSource>(kChunks * kChunk, kChunk);
  source->SetDelay(std::chrono::milliseconds(1));
  auto policy = WindowedPolicy();
  policy.prefetch_enabled = true;
  policy.cache_chunks_small = 64;
  auto reader = OpenReader(source, source->Handle(), policy);

  std::atomic<int> unexpected{0};
  std::atomic<int> closed_seen{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&, t]() {
      std::mt19937 rng(static_cast<unsigned>(t + 1));
      std::vector<uint8_t> buffer(6000);
      for (;;) {
        const uint64_t position = rng() % (kChunks * kChunk);
        try {
          const size_t got = reader->ReadAt(position, buffer);
          if (!MatchesPattern(buffer, position, got)) {
            ++unexpected;
          }
        } catch (const nl::Error& err) {
          if (err.domain == nl::ErrorDomain::State &&
              err.code == nl::errors::state::kReaderClosed) {
            ++closed_seen;
          } else {
            ++unexpected;
          }
          return;
        }
      }
    });
  }

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  reader->Close();
  for (auto& thread : threads) {
    thread.join();
  }
  assert(unexpected.load() == 0);
  assert(closed_seen.load() == 4);
}

}  // namespace

int main() {
  TestPreloadStrategy();
  TestPreloadTimeout();
  TestSequentialThenRepeatedReads();
  TestSmallCacheStaysBounded();
  TestSeekCancelsPrefetchWithoutBlocking();
  TestStatsDuringClose();
  TestRetriesThenSucceeds();
  TestLoadTimeout();
  TestShortChunkFailsImmediately();
  TestOversizeRejectedBeforeDecrypt();
  TestEstimatedGeometryReadsCorrectly();
  TestCloseDuringConcurrentReads();
  std::cout << "random access reader tests ok\n";
  return 0;
}
