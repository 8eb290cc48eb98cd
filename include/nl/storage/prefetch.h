#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <unordered_map>

namespace nl::storage {

class DecryptedChunkCache;
class TaskPool;

// Warms the cache ahead of the read cursor on the background lane of a
// TaskPool. An index already resident or already in flight is never
// scheduled twice. CancelAll drops queued work and invalidates running tasks;
// a decrypt that already started is allowed to finish.
class PrefetchScheduler {
 public:
  using Loader = std::function<void(uint32_t)>;

  PrefetchScheduler(TaskPool& pool, DecryptedChunkCache& cache, uint32_t depth,
                    uint32_t chunk_count, Loader loader);
  // Cancels and waits until no task of this scheduler is queued or running.
  ~PrefetchScheduler();

  PrefetchScheduler(const PrefetchScheduler&) = delete;
  PrefetchScheduler& operator=(const PrefetchScheduler&) = delete;

  // Schedules indices current+1 .. current+depth. Returns how many were new.
  size_t ScheduleAfter(uint32_t current);

  void CancelAll();

  bool InFlight(uint32_t index) const;
  size_t InFlightCount() const;
  uint64_t Scheduled() const noexcept { return scheduled_.load(std::memory_order_relaxed); }
  uint64_t Cancelled() const noexcept { return cancelled_.load(std::memory_order_relaxed); }

 private:
  class PendingToken;

  void Run(uint32_t index, uint64_t generation);
  void FinishPending(uint32_t index, uint64_t generation);

  TaskPool& pool_;
  DecryptedChunkCache& cache_;
  const uint32_t depth_;
  const uint32_t chunk_count_;
  Loader loader_;

  mutable std::mutex mutex_;
  std::condition_variable idle_cv_;
  std::unordered_map<uint32_t, uint64_t> in_flight_;  // index -> generation
  size_t pending_{0};
  std::atomic<uint64_t> generation_{0};
  std::atomic<uint64_t> scheduled_{0};
  std::atomic<uint64_t> cancelled_{0};
};

}  // namespace nl::storage
