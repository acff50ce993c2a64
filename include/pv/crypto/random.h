#pragma once

#include <cstdint>
#include <span>

namespace pv::crypto {

// Fills |out| from the operating system CSPRNG. Throws Error{Crypto} when no source is usable.
void SystemRandomBytes(std::span<uint8_t> out);

}  // namespace pv::crypto
