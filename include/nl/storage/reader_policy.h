#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>

#include "nl/storage/chunk_geometry.h"

namespace nl::storage {

// Tunables for random-access readers. Defaults match the shipped behaviour;
// every field may be overridden per deployment.
struct ReaderPolicy {
  GeometryPolicy geometry{};

  uint64_t preload_threshold_bytes{150ULL * 1024ULL * 1024ULL};
  uint64_t max_file_bytes{50ULL * 1024ULL * 1024ULL * 1024ULL};
  uint64_t max_windowed_chunk_bytes{256ULL * 1024ULL * 1024ULL};

  uint64_t reference_chunk_bytes{kLegacyChunkSize};
  uint64_t large_file_threshold_bytes{500ULL * 1024ULL * 1024ULL};
  uint32_t cache_chunks_small{32};
  uint32_t cache_chunks_large{64};
  uint32_t cache_chunks_min{2};

  uint32_t prefetch_reference_chunks{12};
  uint32_t prefetch_min{2};
  bool prefetch_enabled{true};

  uint32_t pool_reference_chunks{80};
  uint32_t pool_min{4};
  uint32_t pool_headroom_chunks{10};
  uint32_t pool_retention_multiple{2};

  std::chrono::milliseconds recency_window{2000};
  uint32_t load_attempts{3};
  std::chrono::milliseconds load_timeout{10000};
  std::chrono::milliseconds retry_backoff{50};
  std::chrono::milliseconds preload_timeout{60000};
  uint32_t seek_cancel_chunks{4};

  size_t urgent_workers{2};
  size_t background_workers{2};
};

// Resident chunk bound: a reference byte budget (32 or 64 reference chunks
// depending on file size) divided by the real chunk size, at least
// cache_chunks_min and at most chunk_count.
uint32_t CacheCapacity(uint64_t file_size, const ChunkGeometry& geometry,
                       const ReaderPolicy& policy);

uint32_t PrefetchDepth(const ChunkGeometry& geometry, const ReaderPolicy& policy);

uint32_t PoolTargetSize(const ChunkGeometry& geometry, const ReaderPolicy& policy);

uint32_t PoolRetentionLimit(const ChunkGeometry& geometry, const ReaderPolicy& policy);

// Overlays NL_* environment variables on |base|. Malformed values are
// reported as warning events and ignored.
ReaderPolicy ReaderPolicyFromEnvironment(ReaderPolicy base = {});

namespace detail {
// Parses an unsigned decimal environment variable; malformed values are
// reported and yield nullopt.
std::optional<uint64_t> ReadUnsignedEnvironment(const char* name);
}  // namespace detail

}  // namespace nl::storage
