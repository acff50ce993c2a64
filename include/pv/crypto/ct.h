#pragma once
#include <cstdint>
#include <span>

namespace pv::crypto::ct {

// Constant-time equality for digests and tags. Different lengths compare unequal.
inline bool CompareEqual(std::span<const uint8_t> a, std::span<const uint8_t> b) noexcept {
  if (a.size() != b.size()) {
    return false;
  }
  volatile uint8_t diff = 0;
  for (size_t i = 0; i < a.size(); ++i) {
    diff |= static_cast<uint8_t>(a[i] ^ b[i]);
  }
  return diff == 0;
}

} // namespace pv::crypto::ct
