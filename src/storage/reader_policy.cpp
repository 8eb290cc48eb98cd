#include "nl/storage/reader_policy.h"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

#include "nl/orchestrator/event_bus.h"

namespace nl::storage {
namespace {

uint32_t ScaleReferenceChunks(uint32_t reference_chunks, uint32_t minimum,
                              const ChunkGeometry& geometry, const ReaderPolicy& policy) {
  const uint64_t target_bytes =
      static_cast<uint64_t>(reference_chunks) * policy.reference_chunk_bytes;
  const uint64_t chunk = std::max<uint64_t>(1, geometry.chunk_size);
  const uint64_t computed = std::max<uint64_t>(minimum, target_bytes / chunk);
  return static_cast<uint32_t>(std::min<uint64_t>(computed, UINT32_MAX));
}

void WarnMalformed(const char* name, std::string_view value) {
  nl::orchestrator::Event event;
  event.category = nl::orchestrator::EventCategory::kDiagnostics;
  event.severity = nl::orchestrator::EventSeverity::kWarning;
  event.event_id = "config_value_ignored";
  event.message = "Ignoring malformed configuration override";
  event.fields.emplace_back("variable", name);
  event.fields.emplace_back("value", std::string(value), nl::orchestrator::FieldPrivacy::kRedact);
  nl::orchestrator::EventBus::Instance().Publish(event);
}

std::optional<bool> ReadFlag(const char* name) {
  const char* raw = std::getenv(name);
  if (!raw || *raw == '\0') {
    return std::nullopt;
  }
  const std::string_view text(raw);
  if (text == "1" || text == "true" || text == "on") {
    return true;
  }
  if (text == "0" || text == "false" || text == "off") {
    return false;
  }
  WarnMalformed(name, text);
  return std::nullopt;
}

}  // namespace

uint32_t CacheCapacity(uint64_t file_size, const ChunkGeometry& geometry,
                       const ReaderPolicy& policy) {
  const uint32_t base = file_size >= policy.large_file_threshold_bytes ? policy.cache_chunks_large
                                                                       : policy.cache_chunks_small;
  const uint32_t computed = ScaleReferenceChunks(base, policy.cache_chunks_min, geometry, policy);
  return geometry.chunk_count > 0 ? std::min(computed, geometry.chunk_count) : computed;
}

uint32_t PrefetchDepth(const ChunkGeometry& geometry, const ReaderPolicy& policy) {
  const uint32_t computed =
      ScaleReferenceChunks(policy.prefetch_reference_chunks, policy.prefetch_min, geometry, policy);
  return geometry.chunk_count > 0 ? std::min(computed, geometry.chunk_count) : computed;
}

uint32_t PoolTargetSize(const ChunkGeometry& geometry, const ReaderPolicy& policy) {
  const uint32_t computed =
      ScaleReferenceChunks(policy.pool_reference_chunks, policy.pool_min, geometry, policy);
  if (geometry.chunk_count == 0) {
    return computed;
  }
  const uint64_t limit = static_cast<uint64_t>(geometry.chunk_count) + policy.pool_headroom_chunks;
  return static_cast<uint32_t>(std::min<uint64_t>(computed, limit));
}

uint32_t PoolRetentionLimit(const ChunkGeometry& geometry, const ReaderPolicy& policy) {
  const uint64_t limit = static_cast<uint64_t>(PoolTargetSize(geometry, policy)) *
                         std::max<uint32_t>(1, policy.pool_retention_multiple);
  return static_cast<uint32_t>(std::min<uint64_t>(limit, UINT32_MAX));
}

namespace detail {

std::optional<uint64_t> ReadUnsignedEnvironment(const char* name) {
  const char* raw = std::getenv(name);
  if (!raw || *raw == '\0') {
    return std::nullopt;
  }
  const std::string_view text(raw);
  uint64_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    WarnMalformed(name, text);
    return std::nullopt;
  }
  return value;
}

}  // namespace detail

ReaderPolicy ReaderPolicyFromEnvironment(ReaderPolicy base) {
  if (auto v = detail::ReadUnsignedEnvironment("NL_PRELOAD_THRESHOLD_BYTES")) {
    base.preload_threshold_bytes = *v;
  }
  if (auto v = detail::ReadUnsignedEnvironment("NL_MAX_FILE_BYTES")) {
    base.max_file_bytes = *v;
  }
  if (auto v = detail::ReadUnsignedEnvironment("NL_RECENCY_WINDOW_MS")) {
    base.recency_window = std::chrono::milliseconds(*v);
  }
  if (auto v = detail::ReadUnsignedEnvironment("NL_LOAD_TIMEOUT_MS")) {
    base.load_timeout = std::chrono::milliseconds(*v);
  }
  if (auto v = detail::ReadUnsignedEnvironment("NL_LOAD_ATTEMPTS")) {
    if (*v == 0 || *v > 100) {
      WarnMalformed("NL_LOAD_ATTEMPTS", std::to_string(*v));
    } else {
      base.load_attempts = static_cast<uint32_t>(*v);
    }
  }
  if (auto v = detail::ReadUnsignedEnvironment("NL_PRELOAD_TIMEOUT_MS")) {
    base.preload_timeout = std::chrono::milliseconds(*v);
  }
  if (auto v = ReadFlag("NL_PREFETCH_ENABLED")) {
    base.prefetch_enabled = *v;
  }
  return base;
}

}  // namespace nl::storage
