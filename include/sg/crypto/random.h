#pragma once

#include <cstdint>
#include <span>

namespace sg::crypto {

// Fills |out| from the operating system CSPRNG. Throws sg::Error on failure.
void SystemRandomBytes(std::span<uint8_t> out);

}  // namespace sg::crypto
