#include "pv/security/zeroizer.h"

#include <openssl/crypto.h>

namespace pv::security {

void Zeroizer::Wipe(std::span<uint8_t> data) noexcept {
  if (data.empty()) {
    return;
  }
  OPENSSL_cleanse(data.data(), data.size());
}

} // namespace pv::security
