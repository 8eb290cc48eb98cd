#include "nl/storage/chunk_cache.h"

#include <algorithm>
#include <array>
#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include "nl/storage/buffer_pool.h"

using nl::storage::BufferPool;
using nl::storage::DecryptedChunkCache;
using CopyStatus = DecryptedChunkCache::CopyStatus;
using Clock = DecryptedChunkCache::Clock;

namespace {

// Manually advanced clock shared with the cache under test.
struct FakeClock {
  std::shared_ptr<Clock::time_point> now = std::make_shared<Clock::time_point>();

  DecryptedChunkCache::NowFn Fn() const {
    auto shared = now;
    return [shared]() { return *shared; };
  }
  void Advance(std::chrono::milliseconds delta) { *now += delta; }
};

bool Insert(DecryptedChunkCache& cache, BufferPool& pool, uint32_t index, uint8_t fill,
            size_t length) {
  auto buffer = pool.Acquire(length);
  std::fill(buffer.data(), buffer.data() + length, fill);
  return cache.Insert(index, std::move(buffer), length);
}

CopyStatus Touch(DecryptedChunkCache& cache, uint32_t index) {
  uint8_t byte = 0;
  return cache.CopyOut(index, 0, std::span<uint8_t>(&byte, 1));
}

void TestLeastRecentlyUsedOutsideWindow() {
  BufferPool pool(64, 16);
  FakeClock clock;
  DecryptedChunkCache cache(3, std::chrono::milliseconds(2000), pool, clock.Fn());

  assert(Insert(cache, pool, 0, 0x10, 64));
  assert(Insert(cache, pool, 1, 0x11, 64));
  assert(Insert(cache, pool, 2, 0x12, 64));
  assert(Touch(cache, 0) == CopyStatus::kHit);

  clock.Advance(std::chrono::milliseconds(3000));
  assert(Insert(cache, pool, 3, 0x13, 64));
  assert(cache.Size() == 3);
  assert(!cache.Contains(1));
  assert(cache.Contains(0) && cache.Contains(2) && cache.Contains(3));
  assert(cache.Evictions() == 1);
}

void TestRecencyWindowProtectsFreshEntries() {
  BufferPool pool(64, 16);
  FakeClock clock;
  DecryptedChunkCache cache(2, std::chrono::milliseconds(2000), pool, clock.Fn());

  assert(Insert(cache, pool, 0, 0x20, 64));
  clock.Advance(std::chrono::milliseconds(5000));
  assert(Insert(cache, pool, 1, 0x21, 64));
  // 0 is now the most recently used, 1 the least.
  assert(Touch(cache, 0) == CopyStatus::kHit);

  clock.Advance(std::chrono::milliseconds(500));
  assert(Insert(cache, pool, 2, 0x22, 64));
  assert(cache.Contains(1));
  assert(!cache.Contains(0));
  assert(cache.Contains(2));
}

void TestForcedEvictionWhenEverythingIsProtected() {
  BufferPool pool(64, 16);
  FakeClock clock;
  DecryptedChunkCache cache(2, std::chrono::milliseconds(2000), pool, clock.Fn());

  assert(Insert(cache, pool, 0, 0x30, 64));
  assert(Insert(cache, pool, 1, 0x31, 64));
  assert(Touch(cache, 0) == CopyStatus::kHit);
  clock.Advance(std::chrono::milliseconds(100));

  assert(Insert(cache, pool, 2, 0x32, 64));
  assert(cache.Size() == 2);
  assert(!cache.Contains(0));
  assert(cache.Contains(1) && cache.Contains(2));
}

void TestCapacityBound() {
  BufferPool pool(32, 64);
  DecryptedChunkCache cache(5, std::chrono::milliseconds(0), pool);
  for (uint32_t i = 0; i < 200; ++i) {
    Insert(cache, pool, (i * 37) % 23, static_cast<uint8_t>(i), 32);
    assert(cache.Size() <= 5);
  }
  // Evicted buffers flow back to the pool for reuse.
  assert(pool.GetStats().reuses > 0);
}

void TestDuplicateAndShortCopies() {
  BufferPool pool(64, 16);
  DecryptedChunkCache cache(4, std::chrono::milliseconds(0), pool);
  assert(Insert(cache, pool, 7, 0x77, 10));
  const size_t free_before = pool.FreeCount();
  assert(!Insert(cache, pool, 7, 0x78, 10));
  assert(pool.FreeCount() == free_before + 1);

  std::array<uint8_t, 10> dest{};
  assert(cache.CopyOut(7, 5, dest) == CopyStatus::kShort);
  assert(cache.CopyOut(7, 0, dest) == CopyStatus::kHit);
  assert(std::all_of(dest.begin(), dest.end(), [](uint8_t b) { return b == 0x77; }));
  assert(cache.CopyOut(8, 0, dest) == CopyStatus::kMiss);
}

void TestCloseScrubsAndRefuses() {
  BufferPool pool(64, 16);
  DecryptedChunkCache cache(4, std::chrono::milliseconds(0), pool);
  Insert(cache, pool, 0, 0x40, 64);
  Insert(cache, pool, 1, 0x41, 64);
  cache.Close();
  assert(cache.Size() == 0);
  assert(pool.FreeCount() == 2);
  assert(Touch(cache, 0) == CopyStatus::kClosed);
  assert(!Insert(cache, pool, 2, 0x42, 64));

  auto recycled = pool.Acquire(64);
  assert(std::all_of(recycled.data(), recycled.data() + recycled.size(),
                     [](uint8_t b) { return b == 0; }));
}

// A reader racing with eviction must see either a miss or the complete chunk,
// never a buffer that was scrubbed or refilled under it.
void TestNoTornReadsUnderEviction() {
  constexpr size_t kChunk = 64 * 1024;
  BufferPool pool(kChunk, 4);
  DecryptedChunkCache cache(1, std::chrono::milliseconds(0), pool);

  std::atomic<bool> stop{false};
  std::thread writer([&]() {
    while (!stop.load()) {
      Insert(cache, pool, 1, 0xB1, kChunk);
      Insert(cache, pool, 0, 0xA0, kChunk);
    }
  });

  std::vector<uint8_t> dest(kChunk);
  size_t hits = 0;
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(300);
  while (std::chrono::steady_clock::now() < deadline) {
    if (cache.CopyOut(0, 0, dest) == CopyStatus::kHit) {
      ++hits;
      assert(std::all_of(dest.begin(), dest.end(), [](uint8_t b) { return b == 0xA0; }));
    }
  }
  stop.store(true);
  writer.join();
  assert(cache.Size() == 1);
  (void)hits;
}

}  // namespace

int main() {
  TestLeastRecentlyUsedOutsideWindow();
  TestRecencyWindowProtectsFreshEntries();
  TestForcedEvictionWhenEverythingIsProtected();
  TestCapacityBound();
  TestDuplicateAndShortCopies();
  TestCloseScrubsAndRefuses();
  TestNoTornReadsUnderEviction();
  std::cout << "chunk cache tests ok\n";
  return 0;
}
