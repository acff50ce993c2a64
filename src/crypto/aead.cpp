#include "pv/crypto/aead.h"

#include <array>
#include <cctype>
#include <memory>
#include <mutex>
#include <string>

#include <openssl/err.h>
#include <openssl/evp.h>

#if PV_HAVE_SODIUM
#include <sodium.h>
#endif

#include "pv/error.h"

namespace pv::crypto {

namespace {

#if defined(PV_HAVE_SODIUM) && PV_HAVE_SODIUM && defined(crypto_aead_aegis256_KEYBYTES)
#define PV_HAS_AEGIS256 1
#else
#define PV_HAS_AEGIS256 0
#endif

struct CipherEntry {
  CipherType cipher;
  const char* name;
  size_t key_size;
  size_t nonce_size;
  size_t tag_size;
};

constexpr std::array<CipherEntry, 4> kCiphers{{
    {CipherType::None, "None", 0, 0, 0},
    {CipherType::AES_256_GCM, "AES256-GCM", kAES256GcmKeySize, kAES256GcmNonceSize,
     kAES256GcmTagSize},
    {CipherType::CHACHA20_POLY1305, "ChaCha20-Poly1305", kChaCha20Poly1305KeySize,
     kChaCha20Poly1305NonceSize, kChaCha20Poly1305TagSize},
    {CipherType::AEGIS_256, "AEGIS-256", kAEGIS256KeySize, kAEGIS256NonceSize, kAEGIS256TagSize},
}};

const CipherEntry& EntryFor(CipherType cipher) {
  for (const auto& entry : kCiphers) {
    if (entry.cipher == cipher) {
      return entry;
    }
  }
  throw Error{ErrorDomain::Config, errors::config::kUnknownAlgorithm, "unknown cipher id"};
}

void ThrowCryptoError(const std::string& message, int code = 0) {
  throw Error{ErrorDomain::Crypto, code, message};
}

std::string BuildOpenSSLErrorMessage(const char* context) {
  unsigned long err = ERR_get_error();
  if (err == 0) {
    return std::string(context) + ": unknown OpenSSL error";
  }

  char buf[256] = {0};
  ERR_error_string_n(err, buf, sizeof(buf));
  std::string message(context);
  message.append(": ");
  message.append(buf);
  return message;
}

class EVPContextDeleter {
public:
  void operator()(EVP_CIPHER_CTX* ctx) const noexcept { EVP_CIPHER_CTX_free(ctx); }
};

using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, EVPContextDeleter>;

const EVP_CIPHER* ResolveEvpCipher(CipherType cipher) {
  switch (cipher) {
  case CipherType::AES_256_GCM:
    return EVP_aes_256_gcm();
  case CipherType::CHACHA20_POLY1305:
    return EVP_chacha20_poly1305();
  default:
    return nullptr;
  }
}

void CheckSizes(const CipherEntry& entry, std::span<const uint8_t> nonce,
                std::span<const uint8_t> key) {
  if (key.size() != entry.key_size) {
    ThrowCryptoError(std::string(entry.name) + ": invalid key size");
  }
  if (nonce.size() != entry.nonce_size) {
    ThrowCryptoError(std::string(entry.name) + ": invalid nonce size");
  }
}

// AES-GCM and ChaCha20-Poly1305 share the EVP AEAD control interface.
AEADEncryptResult EvpEncrypt(const CipherEntry& entry, std::span<const uint8_t> plaintext,
                             std::span<const uint8_t> aad, std::span<const uint8_t> nonce,
                             std::span<const uint8_t> key) {
  CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx) {
    ThrowCryptoError("Failed to allocate AEAD context");
  }
  if (EVP_EncryptInit_ex(ctx.get(), ResolveEvpCipher(entry.cipher), nullptr, nullptr, nullptr) !=
      1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_EncryptInit_ex"));
  }
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(nonce.size()),
                          nullptr) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_CTRL_AEAD_SET_IVLEN"));
  }
  if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_EncryptInit_ex key/iv"));
  }

  int len = 0;
  if (!aad.empty()) {
    if (EVP_EncryptUpdate(ctx.get(), nullptr, &len, aad.data(), static_cast<int>(aad.size())) !=
        1) {
      ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_EncryptUpdate aad"));
    }
  }

  AEADEncryptResult result;
  result.cipher_used = entry.cipher;
  result.ciphertext.resize(plaintext.size() + 16);
  int total = 0;
  if (!plaintext.empty()) {
    if (EVP_EncryptUpdate(ctx.get(), result.ciphertext.data(), &len, plaintext.data(),
                          static_cast<int>(plaintext.size())) != 1) {
      ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_EncryptUpdate plaintext"));
    }
    total = len;
  }

  if (EVP_EncryptFinal_ex(ctx.get(), result.ciphertext.data() + total, &len) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_EncryptFinal_ex"));
  }
  total += len;
  result.ciphertext.resize(static_cast<size_t>(total));

  result.tag.resize(entry.tag_size);
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_GET_TAG, static_cast<int>(entry.tag_size),
                          result.tag.data()) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_CTRL_AEAD_GET_TAG"));
  }
  return result;
}

std::vector<uint8_t> EvpDecrypt(const CipherEntry& entry, std::span<const uint8_t> ciphertext,
                                std::span<const uint8_t> aad, std::span<const uint8_t> nonce,
                                std::span<const uint8_t> tag, std::span<const uint8_t> key) {
  CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx) {
    ThrowCryptoError("Failed to allocate AEAD context");
  }
  if (EVP_DecryptInit_ex(ctx.get(), ResolveEvpCipher(entry.cipher), nullptr, nullptr, nullptr) !=
      1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_DecryptInit_ex"));
  }
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(nonce.size()),
                          nullptr) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_CTRL_AEAD_SET_IVLEN"));
  }
  if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_DecryptInit_ex key/iv"));
  }

  int len = 0;
  if (!aad.empty()) {
    if (EVP_DecryptUpdate(ctx.get(), nullptr, &len, aad.data(), static_cast<int>(aad.size())) !=
        1) {
      ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_DecryptUpdate aad"));
    }
  }

  std::vector<uint8_t> plaintext(ciphertext.size() + 16);
  int total = 0;
  if (!ciphertext.empty()) {
    if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len, ciphertext.data(),
                          static_cast<int>(ciphertext.size())) != 1) {
      ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_DecryptUpdate ciphertext"));
    }
    total = len;
  }

  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_TAG, static_cast<int>(tag.size()),
                          const_cast<uint8_t*>(tag.data())) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_CTRL_AEAD_SET_TAG"));
  }

  int final_len = 0;
  if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + total, &final_len) <= 0) {
    ERR_clear_error();
    throw AuthenticationFailureError(std::string(entry.name) + " authentication failed");
  }
  total += final_len;
  plaintext.resize(static_cast<size_t>(total));
  return plaintext;
}

AEADEncryptResult Aegis256Encrypt(std::span<const uint8_t> plaintext,
                                  std::span<const uint8_t> aad, std::span<const uint8_t> nonce,
                                  std::span<const uint8_t> key) {
#if PV_HAS_AEGIS256
  AEADEncryptResult result;
  result.cipher_used = CipherType::AEGIS_256;
  result.ciphertext.resize(plaintext.size());
  result.tag.resize(crypto_aead_aegis256_ABYTES);
  unsigned long long tag_len = 0;
  int ret = crypto_aead_aegis256_encrypt_detached(
      result.ciphertext.data(), result.tag.data(), &tag_len, plaintext.data(), plaintext.size(),
      aad.data(), aad.size(), nullptr, nonce.data(), key.data());
  if (ret != 0) {
    ThrowCryptoError("AEGIS-256 encryption failed");
  }
  return result;
#else
  (void)plaintext;
  (void)aad;
  (void)nonce;
  (void)key;
  throw Error{ErrorDomain::Config, errors::config::kUnavailableAlgorithm,
              "AEGIS-256 is unavailable. Build with libsodium >= 1.0.19."};
#endif
}

std::vector<uint8_t> Aegis256Decrypt(std::span<const uint8_t> ciphertext,
                                     std::span<const uint8_t> aad,
                                     std::span<const uint8_t> nonce,
                                     std::span<const uint8_t> tag,
                                     std::span<const uint8_t> key) {
#if PV_HAS_AEGIS256
  std::vector<uint8_t> plaintext(ciphertext.size());
  int ret = crypto_aead_aegis256_decrypt_detached(plaintext.data(), nullptr, ciphertext.data(),
                                                  ciphertext.size(), tag.data(), aad.data(),
                                                  aad.size(), nonce.data(), key.data());
  if (ret != 0) {
    throw AuthenticationFailureError("AEGIS-256 authentication failed");
  }
  return plaintext;
#else
  (void)ciphertext;
  (void)aad;
  (void)nonce;
  (void)tag;
  (void)key;
  throw Error{ErrorDomain::Config, errors::config::kUnavailableAlgorithm,
              "AEGIS-256 is unavailable. Build with libsodium >= 1.0.19."};
#endif
}

bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

}  // namespace

void EnsureCryptoRuntimeInitialized() {
  static std::once_flag once;
  std::call_once(once, []() {
#if PV_HAVE_SODIUM
    if (sodium_init() < 0) {
      ThrowCryptoError("sodium_init failed");
    }
#endif
  });
}

const char* CipherTypeName(CipherType cipher) { return EntryFor(cipher).name; }

std::optional<CipherType> ParseCipherType(std::string_view name) {
  for (const auto& entry : kCiphers) {
    if (EqualsIgnoreCase(name, entry.name)) {
      return entry.cipher;
    }
  }
  if (EqualsIgnoreCase(name, "AES-256-GCM") || EqualsIgnoreCase(name, "AES256GCM")) {
    return CipherType::AES_256_GCM;
  }
  if (EqualsIgnoreCase(name, "ChaCha20Poly1305")) {
    return CipherType::CHACHA20_POLY1305;
  }
  return std::nullopt;
}

bool CipherAvailable(CipherType cipher) {
  switch (cipher) {
  case CipherType::None:
  case CipherType::AES_256_GCM:
  case CipherType::CHACHA20_POLY1305:
    return true;
  case CipherType::AEGIS_256:
    return PV_HAS_AEGIS256 != 0;
  }
  return false;
}

size_t CipherKeySize(CipherType cipher) { return EntryFor(cipher).key_size; }
size_t CipherNonceSize(CipherType cipher) { return EntryFor(cipher).nonce_size; }
size_t CipherTagSize(CipherType cipher) { return EntryFor(cipher).tag_size; }

AEADEncryptResult AEAD_Encrypt(CipherType cipher, std::span<const uint8_t> plaintext,
                               std::span<const uint8_t> associated_data,
                               std::span<const uint8_t> nonce, std::span<const uint8_t> key) {
  const auto& entry = EntryFor(cipher);
  if (cipher == CipherType::None) {
    return AEADEncryptResult{std::vector<uint8_t>(plaintext.begin(), plaintext.end()), {},
                             CipherType::None};
  }
  EnsureCryptoRuntimeInitialized();
  CheckSizes(entry, nonce, key);
  if (cipher == CipherType::AEGIS_256) {
    return Aegis256Encrypt(plaintext, associated_data, nonce, key);
  }
  return EvpEncrypt(entry, plaintext, associated_data, nonce, key);
}

std::vector<uint8_t> AEAD_Decrypt(CipherType cipher, std::span<const uint8_t> ciphertext,
                                  std::span<const uint8_t> associated_data,
                                  std::span<const uint8_t> nonce, std::span<const uint8_t> tag,
                                  std::span<const uint8_t> key) {
  const auto& entry = EntryFor(cipher);
  if (cipher == CipherType::None) {
    return std::vector<uint8_t>(ciphertext.begin(), ciphertext.end());
  }
  EnsureCryptoRuntimeInitialized();
  CheckSizes(entry, nonce, key);
  if (tag.size() != entry.tag_size) {
    throw AuthenticationFailureError(std::string(entry.name) + ": invalid tag size");
  }
  if (cipher == CipherType::AEGIS_256) {
    return Aegis256Decrypt(ciphertext, associated_data, nonce, tag, key);
  }
  return EvpDecrypt(entry, ciphertext, associated_data, nonce, tag, key);
}

}  // namespace pv::crypto
