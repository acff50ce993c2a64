#include "pv/common.h"
#include "pv/crypto/aead.h"
#include "pv/crypto/digest.h"
#include "pv/crypto/kdf.h"
#include "pv/crypto/random.h"
#include "pv/error.h"

#include <array>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace {

  void Expect(bool condition, const char* message) {
    if (!condition) {
      std::cerr << message << std::endl;
      std::abort();
    }
  }

  void TestDigestVectors() {
    struct Vector {
      pv::crypto::HashAlgorithm alg;
      std::string_view hex;
    };
    const Vector vectors[] = {
        {pv::crypto::HashAlgorithm::SHA256,
         "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"},
        {pv::crypto::HashAlgorithm::SHA384,
         "cb00753f45a35e8bb5a03d699ac65007272c32ab0eded1631a8b605a43ff5bed8086072ba1e7cc2358baeca1"
         "34c825a7"},
        {pv::crypto::HashAlgorithm::SHA512,
         "ddaf35a193617abacc417349ae20413112e6fa4e89a97ea20a9eeee64b55d39a2192992a274fc1a836ba3c23"
         "a3feebbd454d4423643ce80e2a9ac94fa54ca49f"},
        {pv::crypto::HashAlgorithm::SHA1, "a9993e364706816aba3e25717850c26c9cd0d89d"},
        {pv::crypto::HashAlgorithm::MD5, "900150983cd24fb0d6963f7d28e17f72"},
        {pv::crypto::HashAlgorithm::SHA3_256,
         "3a985da74fe225b2045c172d6bd390bd855f086e3e9d525b46bfe24511431532"},
        {pv::crypto::HashAlgorithm::BLAKE2b_512,
         "ba80a53f981c4d0d6a2797b69f12f6e94c212f14685ac4b74b12bb6fdbffa2d17d87c5392aab792dc252d5de"
         "4533cc9518d38aa8dbf1925ab92386edd4009923"},
    };
    for (const auto& vector : vectors) {
      const auto hex = pv::crypto::HashBytesHex(vector.alg, pv::AsBytes(std::string_view("abc")));
      if (hex != vector.hex) {
        std::cerr << pv::crypto::HashAlgorithmName(vector.alg) << " mismatch: " << hex << std::endl;
        std::abort();
      }
      Expect(hex.size() == pv::crypto::DigestSize(vector.alg) * 2, "digest size table mismatch");
    }
    Expect(pv::crypto::HashBytesHex(pv::crypto::HashAlgorithm::SHA256, {}) ==
               "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855",
           "SHA256 of empty input mismatch");
  }

  void TestStreamingMatchesOneShot() {
    std::vector<uint8_t> data(100000);
    for (size_t i = 0; i < data.size(); ++i) {
      data[i] = static_cast<uint8_t>(i * 31 + 7);
    }
    pv::crypto::ContentHasher hasher(pv::crypto::HashAlgorithm::SHA256);
    size_t offset = 0;
    size_t step = 1;
    while (offset < data.size()) {
      const size_t take = std::min(step, data.size() - offset);
      hasher.Update(std::span<const uint8_t>(data.data() + offset, take));
      offset += take;
      step = step * 3 + 1;
    }
    Expect(hasher.bytes_hashed() == data.size(), "hasher must count bytes");
    Expect(hasher.HexDigest() == pv::crypto::HashBytesHex(pv::crypto::HashAlgorithm::SHA256, data),
           "streaming digest must match one-shot digest");
  }

  void TestAlgorithmNames() {
    Expect(pv::crypto::ParseHashAlgorithm("sha256") == pv::crypto::HashAlgorithm::SHA256,
           "hash names are case-insensitive");
    Expect(pv::crypto::ParseHashAlgorithm("SHA-256") == pv::crypto::HashAlgorithm::SHA256,
           "SHA-256 alias");
    Expect(pv::crypto::ParseHashAlgorithm("blake2b") == pv::crypto::HashAlgorithm::BLAKE2b_512,
           "BLAKE2b name");
    Expect(!pv::crypto::ParseHashAlgorithm("crc32").has_value(), "unknown hash must not parse");
    Expect(pv::crypto::ParseCipherType("aes256-gcm") == pv::crypto::CipherType::AES_256_GCM,
           "cipher names are case-insensitive");
    Expect(pv::crypto::ParseCipherType("ChaCha20-Poly1305") ==
               pv::crypto::CipherType::CHACHA20_POLY1305,
           "ChaCha20 name");
    Expect(!pv::crypto::ParseCipherType("rot13").has_value(), "unknown cipher must not parse");
    for (auto cipher : {pv::crypto::CipherType::None, pv::crypto::CipherType::AES_256_GCM,
                        pv::crypto::CipherType::CHACHA20_POLY1305,
                        pv::crypto::CipherType::AEGIS_256}) {
      Expect(pv::crypto::ParseCipherType(pv::crypto::CipherTypeName(cipher)) == cipher,
             "cipher label table must round trip");
    }
  }

  void TestAesGcmKnownAnswer() {
    const std::array<uint8_t, 32> key{};
    const std::array<uint8_t, 12> nonce{};
    const std::array<uint8_t, 16> plaintext{};
    auto sealed = pv::crypto::AEAD_Encrypt(pv::crypto::CipherType::AES_256_GCM, plaintext, {},
                                           nonce, key);
    Expect(pv::HexEncode(sealed.ciphertext) == "cea7403d4d606b6e074ec5d3baf39d18",
           "AES-256-GCM ciphertext mismatch");
    Expect(pv::HexEncode(sealed.tag) == "d0d1c8a799996bf0265b98b5d48ab919",
           "AES-256-GCM tag mismatch");

    auto empty = pv::crypto::AEAD_Encrypt(pv::crypto::CipherType::AES_256_GCM, {}, {}, nonce, key);
    Expect(empty.ciphertext.empty(), "empty plaintext yields empty ciphertext");
    Expect(pv::HexEncode(empty.tag) == "530f8afbc74536b9a963b4f1c4cb738b",
           "AES-256-GCM empty tag mismatch");
  }

  void TestAeadRoundTripAndTamper() {
    std::array<uint8_t, 32> key{};
    pv::crypto::SystemRandomBytes(key);
    const std::string aad = "header";
    const std::string message = "the quick brown fox jumps over the lazy dog";
    for (auto cipher : {pv::crypto::CipherType::AES_256_GCM,
                        pv::crypto::CipherType::CHACHA20_POLY1305,
                        pv::crypto::CipherType::AEGIS_256}) {
      if (!pv::crypto::CipherAvailable(cipher)) {
        std::cout << "skipping unavailable " << pv::crypto::CipherTypeName(cipher) << "\n";
        continue;
      }
      std::vector<uint8_t> nonce(pv::crypto::CipherNonceSize(cipher), 0x11);
      auto sealed = pv::crypto::AEAD_Encrypt(cipher, pv::AsBytes(message), pv::AsBytes(aad),
                                             nonce, key);
      Expect(sealed.tag.size() == pv::crypto::CipherTagSize(cipher), "tag size mismatch");
      auto opened = pv::crypto::AEAD_Decrypt(cipher, sealed.ciphertext, pv::AsBytes(aad), nonce,
                                             sealed.tag, key);
      Expect(std::string(opened.begin(), opened.end()) == message, "AEAD round trip failed");

      auto tampered = sealed.ciphertext;
      tampered[3] ^= 0x01;
      bool rejected = false;
      try {
        (void)pv::crypto::AEAD_Decrypt(cipher, tampered, pv::AsBytes(aad), nonce, sealed.tag, key);
      } catch (const pv::AuthenticationFailureError&) {
        rejected = true;
      }
      Expect(rejected, "tampered ciphertext must fail authentication");

      rejected = false;
      try {
        (void)pv::crypto::AEAD_Decrypt(cipher, sealed.ciphertext,
                                       pv::AsBytes(std::string_view("other")), nonce, sealed.tag,
                                       key);
      } catch (const pv::IntegrityError& err) {
        rejected = err.code == pv::errors::integrity::kAuthenticationFailed;
      }
      Expect(rejected, "changed associated data must fail authentication");
    }
  }

  void TestKdfVectors() {
    // RFC 5869 test case 1, first 32 bytes of OKM.
    const std::vector<uint8_t> ikm(22, 0x0b);
    std::vector<uint8_t> salt;
    for (uint8_t i = 0; i <= 0x0c; ++i) {
      salt.push_back(i);
    }
    std::vector<uint8_t> info;
    for (uint8_t i = 0xf0; i <= 0xf9; ++i) {
      info.push_back(i);
    }
    const auto okm = pv::crypto::HKDF_SHA256(ikm, salt, info);
    Expect(pv::HexEncode(okm) == "3cb25f25faacd57a90434f64d0362f2a2d2d0a90cf1a5a4c5db02d56ecc4c5bf",
           "HKDF-SHA256 vector mismatch");

    const auto dk1 = pv::crypto::PBKDF2_HMAC_SHA256(pv::AsBytes(std::string_view("password")),
                                                    pv::AsBytes(std::string_view("salt")), 1);
    Expect(pv::HexEncode(dk1) == "120fb6cffcf8b32c43e7225256c4f837a86548c92ccc35480805987cb70be17b",
           "PBKDF2 c=1 vector mismatch");
    const auto dk2 = pv::crypto::PBKDF2_HMAC_SHA256(pv::AsBytes(std::string_view("password")),
                                                    pv::AsBytes(std::string_view("salt")), 2);
    Expect(pv::HexEncode(dk2) == "ae4d0c95af6b46d32d0adff928f06dd02a303f8ef3c251dfd6e2d85a95474c43",
           "PBKDF2 c=2 vector mismatch");
  }

  void TestHexHelpers() {
    auto decoded = pv::HexDecode("00ffA5");
    Expect(decoded && decoded->size() == 3 && (*decoded)[2] == 0xA5, "hex decode failed");
    Expect(!pv::HexDecode("abc").has_value(), "odd-length hex must be rejected");
    Expect(!pv::HexDecode("zz").has_value(), "non-hex characters must be rejected");
  }

} // namespace

int main() {
  pv::crypto::EnsureCryptoRuntimeInitialized();
  TestDigestVectors();
  TestStreamingMatchesOneShot();
  TestAlgorithmNames();
  TestAesGcmKnownAnswer();
  TestAeadRoundTripAndTamper();
  TestKdfVectors();
  TestHexHelpers();
  std::cout << "digest and aead test ok\n";
  return 0;
}
