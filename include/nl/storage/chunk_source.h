#pragma once

#include <cstdint>

#include "nl/common.h"
#include "nl/security/secure_buffer.h"

namespace nl::storage {

// Identifies a stored file and the geometry its container declares.
struct FileHandle {
  FileId id{};
  uint32_t chunk_count{0};
  uint64_t total_size{0};
};

// Decrypt capability provided by the container engine.
class ChunkSource {
 public:
  virtual ~ChunkSource() = default;

  // Returns the plaintext of chunk |index|. Implementations throw nl::Error on
  // failure and must be safe to call from several threads at once.
  virtual nl::security::SecureBuffer<uint8_t> DecryptChunk(const FileId& file,
                                                           uint32_t index) = 0;
};

}  // namespace nl::storage
