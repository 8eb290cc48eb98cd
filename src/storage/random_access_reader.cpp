#include "nl/storage/random_access_reader.h"

#include <algorithm>
#include <cstring>
#include <exception>
#include <future>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

#include "nl/error.h"
#include "nl/errors.h"
#include "nl/orchestrator/event_bus.h"
#include "nl/security/zeroizer.h"

namespace nl::storage {

namespace {

using nl::orchestrator::Event;
using nl::orchestrator::EventBus;
using nl::orchestrator::EventCategory;
using nl::orchestrator::EventSeverity;
using nl::orchestrator::FieldPrivacy;
using nl::security::Zeroizer;

Error ClosedError() {
  return Error{ErrorDomain::State, errors::state::kReaderClosed,
               std::string(errors::msg::kReaderClosed)};
}

Error LoadFailed(std::string_view detail, Retryability retry = Retryability::kRetryable) {
  std::string message(errors::msg::kChunkLoadFailed);
  if (!detail.empty()) {
    message += ": ";
    message += detail;
  }
  return Error{ErrorDomain::IO, errors::io::kChunkLoadFailed, std::move(message), std::nullopt,
               retry};
}

Error ShortChunk(uint32_t index) {
  return Error{ErrorDomain::IO, errors::io::kChunkLoadFailed,
               std::string(errors::msg::kChunkShorterThanGeometry) + " (chunk " +
                   std::to_string(index) + ")",
               std::nullopt, Retryability::kFatal};
}

bool IsShortChunk(const Error& err) {
  return err.domain == ErrorDomain::IO && err.code == errors::io::kChunkLoadFailed &&
         err.retryability == Retryability::kFatal;
}

void AddNumeric(Event& event, std::string key, uint64_t value) {
  event.fields.emplace_back(std::move(key), std::to_string(value), FieldPrivacy::kPublic, true);
}

void AddFileId(Event& event, const FileId& id) {
  event.fields.emplace_back("file_id", ToHex(id), FieldPrivacy::kHash);
}

}  // namespace

const char* ReaderStrategyName(ReaderStrategy strategy) {
  switch (strategy) {
  case ReaderStrategy::kPreload:
    return "preload";
  case ReaderStrategy::kWindowed:
    return "windowed";
  case ReaderStrategy::kSingleSlot:
    return "single_slot";
  }
  return "unknown";
}

namespace detail {

void RejectOversize(const FileHandle& handle, const ReaderPolicy& policy) {
  if (handle.total_size <= policy.max_file_bytes) {
    return;
  }
  Event event;
  event.category = EventCategory::kSecurity;
  event.severity = EventSeverity::kWarning;
  event.event_id = "reader_oversize_rejected";
  event.message = std::string(errors::msg::kOversizeRejected);
  AddFileId(event, handle.id);
  AddNumeric(event, "total_size", handle.total_size);
  AddNumeric(event, "max_file_bytes", policy.max_file_bytes);
  EventBus::Instance().Publish(event);
  throw Error{ErrorDomain::Validation, errors::validation::kOversizeRejected,
              std::string(errors::msg::kOversizeRejected)};
}

ChunkGeometry ResolveForReader(const FileHandle& handle, const ReaderPolicy& policy) {
  ChunkGeometry geometry =
      ResolveChunkGeometry(handle.total_size, handle.chunk_count, policy.geometry);
  if (!geometry.standard) {
    Event event;
    event.category = EventCategory::kDiagnostics;
    event.severity = EventSeverity::kWarning;
    event.event_id = "chunk_geometry_estimated";
    event.message = "Container chunk size matches no known layout; using estimate";
    AddFileId(event, handle.id);
    AddNumeric(event, "total_size", geometry.total_size);
    AddNumeric(event, "chunk_count", geometry.chunk_count);
    AddNumeric(event, "chunk_size", geometry.chunk_size);
    EventBus::Instance().Publish(event);
  }
  return geometry;
}

void PublishReaderOpened(const FileHandle& handle, const ChunkGeometry& geometry,
                         ReaderStrategy strategy, const ReaderPolicy& policy) {
  Event event;
  event.category = EventCategory::kLifecycle;
  event.severity = EventSeverity::kInfo;
  event.event_id = "reader_opened";
  event.message = "Random-access reader opened";
  AddFileId(event, handle.id);
  event.fields.emplace_back("strategy", ReaderStrategyName(strategy));
  AddNumeric(event, "total_size", geometry.total_size);
  AddNumeric(event, "chunk_count", geometry.chunk_count);
  AddNumeric(event, "chunk_size", geometry.chunk_size);
  if (strategy == ReaderStrategy::kWindowed) {
    AddNumeric(event, "cache_capacity", CacheCapacity(geometry.total_size, geometry, policy));
    AddNumeric(event, "prefetch_depth", policy.prefetch_enabled ? PrefetchDepth(geometry, policy) : 0);
    AddNumeric(event, "pool_size", PoolTargetSize(geometry, policy));
  }
  EventBus::Instance().Publish(event);
}

void PublishReaderClosed(const FileHandle& handle, ReaderStrategy strategy,
                         const ReaderStats& stats) {
  Event event;
  event.category = EventCategory::kTelemetry;
  event.severity = EventSeverity::kInfo;
  event.event_id = "reader_closed";
  event.message = "Random-access reader closed";
  AddFileId(event, handle.id);
  event.fields.emplace_back("strategy", ReaderStrategyName(strategy));
  AddNumeric(event, "hits", stats.hits);
  AddNumeric(event, "misses", stats.misses);
  AddNumeric(event, "decrypts", stats.decrypts);
  AddNumeric(event, "evictions", stats.evictions);
  AddNumeric(event, "retries", stats.retries);
  AddNumeric(event, "load_failures", stats.load_failures);
  AddNumeric(event, "prefetch_scheduled", stats.prefetch_scheduled);
  AddNumeric(event, "prefetch_cancelled", stats.prefetch_cancelled);
  EventBus::Instance().Publish(event);
}

}  // namespace detail

// ---------------------------------------------------------------------------
// PreloadedReader

struct PreloadedReader::PreloadJob {
  nl::security::SecureBuffer<uint8_t> buffer;
  std::atomic<bool> cancelled{false};
  std::atomic<uint64_t> decrypts{0};
};

PreloadedReader::PreloadedReader(std::shared_ptr<ChunkSource> source, FileHandle handle,
                                 ChunkGeometry geometry, const ReaderPolicy& policy)
    : geometry_(geometry) {
  if (geometry_.total_size == 0) {
    return;
  }
  auto job = std::make_shared<PreloadJob>();
  // The worker is detached and holds its own share of the job, so a decrypt
  // that outlives the deadline never blocks the caller. Whatever it finishes
  // afterwards is wiped when the job is released.
  std::packaged_task<void()> task([job, source, handle, geometry = geometry_]() {
    nl::security::SecureBuffer<uint8_t> buffer(static_cast<size_t>(geometry.total_size));
    uint64_t cursor = 0;
    for (uint32_t index = 0; index < geometry.chunk_count; ++index) {
      if (job->cancelled.load(std::memory_order_acquire)) {
        return;
      }
      auto plain = source->DecryptChunk(handle.id, index);
      Zeroizer::ScopeScrubber scrub(plain.AsU8Span());
      job->decrypts.fetch_add(1, std::memory_order_relaxed);
      if (cursor + plain.size() > geometry.total_size) {
        throw LoadFailed(errors::msg::kPreloadSizeMismatch, Retryability::kFatal);
      }
      if (!plain.empty()) {
        std::memcpy(buffer.data() + cursor, plain.data(), plain.size());
      }
      cursor += plain.size();
    }
    if (cursor != geometry.total_size) {
      throw LoadFailed(errors::msg::kPreloadSizeMismatch, Retryability::kFatal);
    }
    job->buffer = std::move(buffer);
  });

  auto future = task.get_future();
  try {
    std::thread(std::move(task)).detach();
  } catch (const std::system_error& ex) {
    throw LoadFailed(ex.what());
  }

  if (future.wait_for(policy.preload_timeout) != std::future_status::ready) {
    job->cancelled.store(true, std::memory_order_release);
    throw Error{ErrorDomain::IO, errors::io::kChunkLoadTimeout,
                std::string(errors::msg::kPreloadTimeout), std::nullopt,
                Retryability::kTransient};
  }
  try {
    future.get();
  } catch (const Error& err) {
    if (err.domain == ErrorDomain::IO &&
        (err.code == errors::io::kChunkLoadFailed || err.code == errors::io::kChunkLoadTimeout)) {
      throw;
    }
    throw LoadFailed(err.what());
  } catch (const std::exception& ex) {
    throw LoadFailed(ex.what());
  }
  data_ = std::move(job->buffer);
  decrypts_ = job->decrypts.load(std::memory_order_relaxed);
}

PreloadedReader::~PreloadedReader() {
  Close();
}

size_t PreloadedReader::ReadAt(uint64_t position, std::span<uint8_t> dest) {
  std::shared_lock lock(mutex_);
  if (closed_) {
    throw ClosedError();
  }
  if (dest.empty() || position >= geometry_.total_size) {
    return 0;
  }
  const size_t count =
      static_cast<size_t>(std::min<uint64_t>(dest.size(), geometry_.total_size - position));
  std::memcpy(dest.data(), data_.data() + position, count);
  return count;
}

void PreloadedReader::Close() {
  std::unique_lock lock(mutex_);
  if (closed_) {
    return;
  }
  closed_ = true;
  Zeroizer::Scrub(data_.AsU8Span());
  data_ = nl::security::SecureBuffer<uint8_t>();
}

ReaderStats PreloadedReader::Stats() const {
  ReaderStats stats;
  stats.decrypts = decrypts_;
  return stats;
}

// ---------------------------------------------------------------------------
// WindowedReader

WindowedReader::WindowedReader(std::shared_ptr<ChunkSource> source, FileHandle handle,
                               ChunkGeometry geometry, const ReaderPolicy& policy)
    : source_(std::move(source)), handle_(handle), geometry_(geometry), policy_(policy) {
  if (geometry_.chunk_size > policy_.max_windowed_chunk_bytes) {
    throw Error{ErrorDomain::Validation, errors::validation::kGeometryInvalid,
                std::string(errors::msg::kGeometryChunkTooLarge)};
  }
  policy_.load_attempts = std::max<uint32_t>(1, policy_.load_attempts);

  pool_ = std::make_unique<BufferPool>(static_cast<size_t>(geometry_.chunk_size),
                                       PoolRetentionLimit(geometry_, policy_));
  cache_ = std::make_unique<DecryptedChunkCache>(
      CacheCapacity(geometry_.total_size, geometry_, policy_), policy_.recency_window, *pool_);
  const size_t background = policy_.prefetch_enabled ? policy_.background_workers : 0;
  tasks_ = std::make_unique<TaskPool>(policy_.urgent_workers, background);
  if (background > 0) {
    prefetch_ = std::make_unique<PrefetchScheduler>(
        *tasks_, *cache_, PrefetchDepth(geometry_, policy_), geometry_.chunk_count,
        [this](uint32_t index) { FillChunk(index); });
  }
}

WindowedReader::~WindowedReader() {
  Close();
}

size_t WindowedReader::ReadAt(uint64_t position, std::span<uint8_t> dest) {
  {
    std::lock_guard lock(state_mutex_);
    ++active_reads_;
  }
  struct ActiveRead {
    WindowedReader* self;
    ~ActiveRead() {
      std::lock_guard lock(self->state_mutex_);
      --self->active_reads_;
      self->state_cv_.notify_all();
    }
  } active{this};

  if (closed_.load(std::memory_order_acquire)) {
    ThrowClosed();
  }
  if (dest.empty() || position >= geometry_.total_size) {
    return 0;
  }
  const size_t total =
      static_cast<size_t>(std::min<uint64_t>(dest.size(), geometry_.total_size - position));
  NoteCursor(position, total);

  size_t copied = 0;
  while (copied < total) {
    const uint64_t absolute = position + copied;
    const uint32_t index = geometry_.IndexOf(absolute);
    const auto range = geometry_.Range(index);
    const uint64_t offset = absolute - range.first;
    const size_t length =
        static_cast<size_t>(std::min<uint64_t>(total - copied, range.second - absolute));
    ReadFromChunk(index, offset, dest.subspan(copied, length));
    copied += length;
  }
  return copied;
}

void WindowedReader::NoteCursor(uint64_t position, size_t length) {
  const uint64_t expected = expected_next_.exchange(position + length, std::memory_order_acq_rel);
  if (!prefetch_ || expected == kNoCursor) {
    return;
  }
  const uint64_t distance = position > expected ? position - expected : expected - position;
  if (distance > geometry_.chunk_size * policy_.seek_cancel_chunks) {
    prefetch_->CancelAll();
    Event event;
    event.category = EventCategory::kDiagnostics;
    event.severity = EventSeverity::kDebug;
    event.event_id = "reader_seek";
    event.message = "Seek beyond prefetch window; cancelled pending prefetch";
    AddNumeric(event, "from", expected);
    AddNumeric(event, "to", position);
    EventBus::Instance().Publish(event);
  }
}

void WindowedReader::ReadFromChunk(uint32_t index, uint64_t offset, std::span<uint8_t> dest) {
  bool counted_miss = false;
  std::optional<Error> last_error;
  for (uint32_t attempt = 0; attempt < policy_.load_attempts; ++attempt) {
    if (closed_.load(std::memory_order_acquire)) {
      ThrowClosed();
    }
    switch (cache_->CopyOut(index, offset, dest)) {
    case DecryptedChunkCache::CopyStatus::kHit:
      if (!counted_miss) {
        hits_.fetch_add(1, std::memory_order_relaxed);
      }
      if (prefetch_) {
        prefetch_->ScheduleAfter(index);
      }
      return;
    case DecryptedChunkCache::CopyStatus::kClosed:
      ThrowClosed();
    case DecryptedChunkCache::CopyStatus::kShort:
      load_failures_.fetch_add(1, std::memory_order_relaxed);
      throw ShortChunk(index);
    case DecryptedChunkCache::CopyStatus::kMiss:
      break;
    }
    if (!counted_miss) {
      misses_.fetch_add(1, std::memory_order_relaxed);
      counted_miss = true;
    }
    if (attempt > 0) {
      retries_.fetch_add(1, std::memory_order_relaxed);
    }

    try {
      LoadUrgent(index);
      const auto status = cache_->CopyOut(index, offset, dest);
      if (status == DecryptedChunkCache::CopyStatus::kHit) {
        if (prefetch_) {
          prefetch_->ScheduleAfter(index);
        }
        return;
      }
      if (status == DecryptedChunkCache::CopyStatus::kClosed) {
        ThrowClosed();
      }
      if (status == DecryptedChunkCache::CopyStatus::kShort) {
        throw ShortChunk(index);
      }
      // Evicted between load and copy; try again.
      last_error = LoadFailed("chunk evicted before copy");
    } catch (const Error& err) {
      if (err.domain == ErrorDomain::State && err.code == errors::state::kReaderClosed) {
        throw;
      }
      if (IsShortChunk(err)) {
        load_failures_.fetch_add(1, std::memory_order_relaxed);
        PublishLoadFailure(index, err);
        throw;
      }
      last_error = err;
    } catch (const std::exception& ex) {
      last_error = LoadFailed(ex.what());
    }

    if (attempt + 1 < policy_.load_attempts) {
      Event event;
      event.category = EventCategory::kDiagnostics;
      event.severity = EventSeverity::kWarning;
      event.event_id = "chunk_load_retry";
      event.message = last_error ? last_error->what() : "chunk load retry";
      AddFileId(event, handle_.id);
      AddNumeric(event, "chunk_index", index);
      AddNumeric(event, "attempt", attempt + 1);
      EventBus::Instance().Publish(event);
      if (!SleepUnlessClosed(policy_.retry_backoff)) {
        ThrowClosed();
      }
    }
  }

  load_failures_.fetch_add(1, std::memory_order_relaxed);
  if (last_error && last_error->domain == ErrorDomain::IO &&
      last_error->code == errors::io::kChunkLoadTimeout) {
    PublishLoadFailure(index, *last_error);
    throw *last_error;
  }
  Error failure = LoadFailed(last_error ? last_error->what() : "");
  failure.context.push_back("chunk " + std::to_string(index));
  PublishLoadFailure(index, failure);
  throw failure;
}

void WindowedReader::LoadUrgent(uint32_t index) {
  std::future<void> future = tasks_->SubmitUrgent([this, index]() { FillChunk(index); });
  if (future.wait_for(policy_.load_timeout) != std::future_status::ready) {
    throw Error{ErrorDomain::IO, errors::io::kChunkLoadTimeout,
                std::string(errors::msg::kChunkLoadTimeout) + " (chunk " +
                    std::to_string(index) + ")",
                std::nullopt, Retryability::kTransient};
  }
  try {
    future.get();
  } catch (const std::future_error&) {
    // The pool shut down before the task ran.
    ThrowClosed();
  }
}

void WindowedReader::FillChunk(uint32_t index) {
  if (closed_.load(std::memory_order_acquire) || cache_->Contains(index)) {
    return;
  }
  auto plain = source_->DecryptChunk(handle_.id, index);
  Zeroizer::ScopeScrubber scrub(plain.AsU8Span());
  decrypts_.fetch_add(1, std::memory_order_relaxed);

  const uint64_t expected = geometry_.ChunkLength(index);
  if (plain.size() < expected) {
    throw ShortChunk(index);
  }
  const auto length = static_cast<size_t>(expected);
  PooledBuffer buffer = pool_->Acquire(length);
  if (length > 0) {
    std::memcpy(buffer.data(), plain.data(), length);
  }
  cache_->Insert(index, std::move(buffer), length);
}

bool WindowedReader::SleepUnlessClosed(std::chrono::milliseconds delay) {
  std::unique_lock lock(state_mutex_);
  return !state_cv_.wait_for(lock, delay,
                             [this]() { return closed_.load(std::memory_order_acquire); });
}

void WindowedReader::ThrowClosed() const {
  throw ClosedError();
}

void WindowedReader::PublishLoadFailure(uint32_t index, const std::exception& cause) {
  Event event;
  event.category = EventCategory::kDiagnostics;
  event.severity = EventSeverity::kError;
  event.event_id = "chunk_load_failed";
  event.message = cause.what();
  AddFileId(event, handle_.id);
  AddNumeric(event, "chunk_index", index);
  AddNumeric(event, "attempts", policy_.load_attempts);
  EventBus::Instance().Publish(event);
}

void WindowedReader::Close() {
  std::lock_guard close_lock(close_mutex_);
  if (closed_.load(std::memory_order_acquire)) {
    return;
  }
  {
    std::lock_guard lock(state_mutex_);
    closed_.store(true, std::memory_order_release);
  }
  state_cv_.notify_all();

  if (prefetch_) {
    prefetch_->CancelAll();
  }
  // Queued loads are dropped; running decrypts finish and insert into the
  // cache, which is scrubbed below.
  tasks_->Shutdown();
  {
    std::unique_lock lock(state_mutex_);
    state_cv_.wait(lock, [this]() { return active_reads_ == 0; });
  }
  {
    std::lock_guard lock(prefetch_mutex_);
    if (prefetch_) {
      final_prefetch_scheduled_ = prefetch_->Scheduled();
      final_prefetch_cancelled_ = prefetch_->Cancelled();
    }
    prefetch_.reset();
  }
  const ReaderStats stats = Stats();
  cache_->Close();
  pool_->Drain();
  detail::PublishReaderClosed(handle_, ReaderStrategy::kWindowed, stats);
}

ReaderStats WindowedReader::Stats() const {
  ReaderStats stats;
  stats.hits = hits_.load(std::memory_order_relaxed);
  stats.misses = misses_.load(std::memory_order_relaxed);
  stats.decrypts = decrypts_.load(std::memory_order_relaxed);
  stats.evictions = cache_->Evictions();
  stats.retries = retries_.load(std::memory_order_relaxed);
  stats.load_failures = load_failures_.load(std::memory_order_relaxed);
  std::lock_guard lock(prefetch_mutex_);
  if (prefetch_) {
    stats.prefetch_scheduled = prefetch_->Scheduled();
    stats.prefetch_cancelled = prefetch_->Cancelled();
  } else {
    stats.prefetch_scheduled = final_prefetch_scheduled_;
    stats.prefetch_cancelled = final_prefetch_cancelled_;
  }
  return stats;
}

bool WindowedReader::PrefetchInFlight(uint32_t index) const {
  std::lock_guard lock(prefetch_mutex_);
  return prefetch_ && prefetch_->InFlight(index);
}

// ---------------------------------------------------------------------------

std::unique_ptr<RandomAccessReader> OpenReader(std::shared_ptr<ChunkSource> source,
                                               const FileHandle& handle,
                                               const ReaderPolicy& policy) {
  detail::RejectOversize(handle, policy);
  const ChunkGeometry geometry = detail::ResolveForReader(handle, policy);
  if (handle.total_size <= policy.preload_threshold_bytes) {
    auto reader = std::make_unique<PreloadedReader>(std::move(source), handle, geometry, policy);
    detail::PublishReaderOpened(handle, geometry, ReaderStrategy::kPreload, policy);
    return reader;
  }
  auto reader = std::make_unique<WindowedReader>(std::move(source), handle, geometry, policy);
  detail::PublishReaderOpened(handle, geometry, ReaderStrategy::kWindowed, policy);
  return reader;
}

}  // namespace nl::storage
