#pragma once

#include <span>

#include "nl/common.h"

namespace nl::crypto {

// Fills |out| from the operating system CSPRNG. Throws nl::Error on failure.
void SystemRandomBytes(std::span<uint8_t> out);

}  // namespace nl::crypto
