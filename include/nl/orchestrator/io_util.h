#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <span>
#include <string>
#include <vector>

#include "nl/error.h"

namespace nl::orchestrator {

struct AtomicReplaceHooks {
  std::function<void(const std::filesystem::path&, const std::filesystem::path&)> before_rename;
};

// Performs an atomic replace of the target file by writing the payload to a
// temporary file on the same filesystem, syncing it to disk, then renaming it
// into place and syncing the directory.
void AtomicReplace(const std::filesystem::path& target, std::span<const uint8_t> payload,
                   const AtomicReplaceHooks& hooks = {});

// Overwrites the file with random data |passes| times, syncing after each
// pass, then unlinks it. A missing file is not an error.
void SecureWipeFile(const std::filesystem::path& path, int passes = 1);

// Reads the whole file. Throws Error{IO} with errno preserved on failure.
std::vector<uint8_t> ReadFileBytes(const std::filesystem::path& path);

}  // namespace nl::orchestrator
