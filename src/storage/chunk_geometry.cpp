#include "nl/storage/chunk_geometry.h"

#include <algorithm>
#include <string>

#include "nl/error.h"
#include "nl/errors.h"

namespace nl::storage {

std::pair<uint64_t, uint64_t> ChunkGeometry::Range(uint32_t index) const noexcept {
  const uint64_t start = std::min<uint64_t>(static_cast<uint64_t>(index) * chunk_size, total_size);
  const uint64_t end = std::min<uint64_t>(start + chunk_size, total_size);
  return {start, end};
}

ChunkGeometry ResolveChunkGeometry(uint64_t total_size, uint32_t chunk_count,
                                   const GeometryPolicy& policy) {
  ChunkGeometry geometry;
  geometry.total_size = total_size;
  geometry.chunk_count = chunk_count;

  if (total_size == 0) {
    geometry.chunk_size = policy.legacy_chunk_size;
    return geometry;
  }
  if (chunk_count == 0) {
    throw Error{ErrorDomain::Validation, errors::validation::kGeometryInvalid,
                std::string(errors::msg::kGeometryZeroChunks)};
  }

  for (uint64_t candidate : {policy.legacy_chunk_size, policy.streaming_chunk_size}) {
    if (candidate != 0 && CeilDiv(total_size, candidate) == chunk_count) {
      geometry.chunk_size = candidate;
      return geometry;
    }
  }

  geometry.chunk_size = std::max<uint64_t>(1, CeilDiv(total_size, chunk_count));
  geometry.standard = false;
  return geometry;
}

}  // namespace nl::storage
