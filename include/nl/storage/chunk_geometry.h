#pragma once

#include <cstdint>
#include <utility>

namespace nl::storage {

inline constexpr uint64_t kLegacyChunkSize = 1024ULL * 1024ULL;
inline constexpr uint64_t kStreamingChunkSize = 4ULL * 1024ULL * 1024ULL;

struct GeometryPolicy {
  uint64_t legacy_chunk_size{kLegacyChunkSize};
  uint64_t streaming_chunk_size{kStreamingChunkSize};
};

// Resolved addressing scheme for one stored file. Immutable once built.
struct ChunkGeometry {
  uint64_t total_size{0};
  uint32_t chunk_count{0};
  uint64_t chunk_size{1};
  bool standard{true};  // false when the size was estimated

  // Half-open byte range [first, second) of chunk |index|, clamped to
  // total_size. Indices past the end yield an empty range at total_size.
  std::pair<uint64_t, uint64_t> Range(uint32_t index) const noexcept;

  uint64_t ChunkLength(uint32_t index) const noexcept {
    const auto range = Range(index);
    return range.second - range.first;
  }

  uint32_t IndexOf(uint64_t position) const noexcept {
    return static_cast<uint32_t>(position / chunk_size);
  }
};

inline constexpr uint64_t CeilDiv(uint64_t value, uint64_t divisor) noexcept {
  return divisor == 0 ? 0 : value / divisor + (value % divisor != 0 ? 1 : 0);
}

// Infers the chunk size a container used from its declared size and chunk
// count. Tries the legacy then the streaming size; otherwise estimates
// ceil(size / count) and marks the layout non-standard. Pure: no I/O, no
// logging. Throws Error{Validation, kGeometryInvalid} when a non-empty file
// declares zero chunks.
ChunkGeometry ResolveChunkGeometry(uint64_t total_size, uint32_t chunk_count,
                                   const GeometryPolicy& policy = {});

}  // namespace nl::storage
