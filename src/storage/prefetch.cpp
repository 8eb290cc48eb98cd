#include "nl/storage/prefetch.h"

#include <exception>
#include <memory>
#include <string>
#include <utility>

#include "nl/orchestrator/event_bus.h"
#include "nl/storage/chunk_cache.h"
#include "nl/storage/task_pool.h"

namespace nl::storage {

// Destroyed when a queued task has run or was dropped without running. Either
// way its in-flight entry is released and the scheduler stops waiting for it.
class PrefetchScheduler::PendingToken {
 public:
  PendingToken(PrefetchScheduler* owner, uint32_t index, uint64_t generation)
      : owner_(owner), index_(index), generation_(generation) {}
  ~PendingToken() { owner_->FinishPending(index_, generation_); }
  PendingToken(const PendingToken&) = delete;
  PendingToken& operator=(const PendingToken&) = delete;

 private:
  PrefetchScheduler* owner_;
  uint32_t index_;
  uint64_t generation_;
};

PrefetchScheduler::PrefetchScheduler(TaskPool& pool, DecryptedChunkCache& cache, uint32_t depth,
                                     uint32_t chunk_count, Loader loader)
    : pool_(pool),
      cache_(cache),
      depth_(depth),
      chunk_count_(chunk_count),
      loader_(std::move(loader)) {}

PrefetchScheduler::~PrefetchScheduler() {
  CancelAll();
  std::unique_lock lock(mutex_);
  idle_cv_.wait(lock, [this]() { return pending_ == 0; });
}

size_t PrefetchScheduler::ScheduleAfter(uint32_t current) {
  size_t added = 0;
  const uint64_t generation = generation_.load(std::memory_order_acquire);
  for (uint32_t step = 1; step <= depth_; ++step) {
    const uint64_t next = static_cast<uint64_t>(current) + step;
    if (next >= chunk_count_) {
      break;
    }
    const auto index = static_cast<uint32_t>(next);
    if (cache_.Contains(index)) {
      continue;
    }
    {
      std::lock_guard lock(mutex_);
      if (!in_flight_.emplace(index, generation).second) {
        continue;
      }
      ++pending_;
    }
    auto token = std::make_shared<PendingToken>(this, index, generation);
    const bool queued = pool_.SubmitBackground(
        [this, token, index, generation]() { Run(index, generation); });
    if (!queued) {
      break;
    }
    ++added;
  }
  scheduled_.fetch_add(added, std::memory_order_relaxed);
  return added;
}

void PrefetchScheduler::CancelAll() {
  generation_.fetch_add(1, std::memory_order_acq_rel);
  {
    std::lock_guard lock(mutex_);
    cancelled_.fetch_add(in_flight_.size(), std::memory_order_relaxed);
    in_flight_.clear();
  }
  pool_.DropBackground();
}

bool PrefetchScheduler::InFlight(uint32_t index) const {
  std::lock_guard lock(mutex_);
  return in_flight_.find(index) != in_flight_.end();
}

size_t PrefetchScheduler::InFlightCount() const {
  std::lock_guard lock(mutex_);
  return in_flight_.size();
}

void PrefetchScheduler::Run(uint32_t index, uint64_t generation) {
  if (generation_.load(std::memory_order_acquire) == generation && !cache_.Contains(index)) {
    try {
      loader_(index);
    } catch (const std::exception& ex) {
      nl::orchestrator::Event event;
      event.category = nl::orchestrator::EventCategory::kDiagnostics;
      event.severity = nl::orchestrator::EventSeverity::kDebug;
      event.event_id = "prefetch_failed";
      event.message = ex.what();
      event.fields.emplace_back("chunk_index", std::to_string(index),
                                nl::orchestrator::FieldPrivacy::kPublic, true);
      nl::orchestrator::EventBus::Instance().Publish(event);
    }
  }
}

void PrefetchScheduler::FinishPending(uint32_t index, uint64_t generation) {
  // Notify under the lock: the destructor may free *this as soon as it can
  // observe pending_ == 0.
  std::lock_guard lock(mutex_);
  // A task queued with a stale generation after CancelAll cleared the set
  // still owns its entry; a newer entry for the index is left alone.
  if (auto it = in_flight_.find(index); it != in_flight_.end() && it->second == generation) {
    in_flight_.erase(it);
  }
  --pending_;
  idle_cv_.notify_all();
}

}  // namespace nl::storage
