#include "pv/core/nonce.h"

#include <algorithm>
#include <limits>
#include <string_view>

#include "pv/common.h"
#include "pv/crypto/kdf.h"
#include "pv/crypto/random.h"
#include "pv/error.h"
#include "pv/security/zeroizer.h"

namespace pv::core {

namespace {
constexpr std::string_view kBlockKeyInfo = "PV-BLOCK-KEY/v1";
} // namespace

std::array<uint8_t, kFileKeySize> DeriveFileKey(std::span<const uint8_t> master_key,
                                                std::span<const uint8_t> salt) {
  if (master_key.empty()) {
    throw Error{ErrorDomain::Config, errors::config::kMissingKey, "encryption key is empty"};
  }
  return crypto::HKDF_SHA256(master_key, salt, AsBytes(kBlockKeyInfo));
}

NonceSequence::NonceSequence(std::span<const uint8_t> master_key) {
  crypto::SystemRandomBytes(std::span<uint8_t>(salt_.data(), salt_.size()));
  key_ = DeriveFileKey(master_key, salt_);
}

NonceSequence::NonceSequence(std::span<const uint8_t> master_key, const Salt& salt)
    : salt_(salt) {
  key_ = DeriveFileKey(master_key, salt_);
}

NonceSequence::~NonceSequence() {
  security::Zeroizer::Wipe(std::span<uint8_t>(key_.data(), key_.size()));
}

uint64_t NonceSequence::Reserve() {
  uint64_t current = next_.load(std::memory_order_relaxed);
  do {
    if (current == std::numeric_limits<uint64_t>::max()) {
      throw Error{ErrorDomain::Crypto, 0, "nonce counter exhausted for file key"};
    }
  } while (!next_.compare_exchange_weak(current, current + 1, std::memory_order_relaxed));
  return current;
}

void NonceSequence::FillNonce(uint64_t counter, std::span<uint8_t> out) {
  if (out.size() < sizeof(uint64_t)) {
    throw Error{ErrorDomain::Internal, 0, "nonce buffer shorter than counter"};
  }
  std::fill(out.begin(), out.end(), uint8_t{0});
  const uint64_t be = ToBigEndian(counter);
  std::memcpy(out.data() + out.size() - sizeof(be), &be, sizeof(be));
}

} // namespace pv::core
