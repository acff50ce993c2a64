#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace pv::crypto {

constexpr size_t kAES256GcmKeySize = 32;
constexpr size_t kAES256GcmNonceSize = 12;
constexpr size_t kAES256GcmTagSize = 16;

constexpr size_t kChaCha20Poly1305KeySize = 32;
constexpr size_t kChaCha20Poly1305NonceSize = 12;
constexpr size_t kChaCha20Poly1305TagSize = 16;

constexpr size_t kAEGIS256KeySize = 32;
constexpr size_t kAEGIS256NonceSize = 32;
constexpr size_t kAEGIS256TagSize = 32;

constexpr size_t kMaxAeadNonceSize = 32;
constexpr size_t kMaxAeadTagSize = 32;

enum class CipherType : uint8_t {
  None = 0,
  AES_256_GCM = 1,
  CHACHA20_POLY1305 = 2,
  AEGIS_256 = 3,
};

const char* CipherTypeName(CipherType cipher);
std::optional<CipherType> ParseCipherType(std::string_view name);
bool CipherAvailable(CipherType cipher);

size_t CipherKeySize(CipherType cipher);
size_t CipherNonceSize(CipherType cipher);
size_t CipherTagSize(CipherType cipher);

struct AEADEncryptResult {
  std::vector<uint8_t> ciphertext;
  std::vector<uint8_t> tag;
  CipherType cipher_used;
};

// Throws Error{Crypto} for an unavailable cipher or bad key/nonce sizes.
AEADEncryptResult AEAD_Encrypt(
    CipherType cipher,
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> associated_data,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> key);

// Throws AuthenticationFailureError when the tag does not verify.
std::vector<uint8_t> AEAD_Decrypt(
    CipherType cipher,
    std::span<const uint8_t> ciphertext,
    std::span<const uint8_t> associated_data,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> tag,
    std::span<const uint8_t> key);

// Runs libsodium initialization once per process when built with it.
void EnsureCryptoRuntimeInitialized();

}  // namespace pv::crypto
