#include "pv/codec/block_encoder.h"
#include "pv/common.h"
#include "pv/crypto/random.h"
#include "pv/error.h"

#include <array>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <random>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace {

  void Expect(bool condition, const std::string& message) {
    if (!condition) {
      std::cerr << message << std::endl;
      std::abort();
    }
  }

  std::vector<uint8_t> RandomBytes(size_t size, uint64_t seed) {
    std::mt19937_64 rng(seed);
    std::vector<uint8_t> out(size);
    for (auto& byte : out) {
      byte = static_cast<uint8_t>(rng());
    }
    return out;
  }

  std::vector<uint8_t> Compressible(size_t size) {
    const std::string pattern = "PackVault block encoder test pattern. ";
    std::vector<uint8_t> out(size);
    for (size_t i = 0; i < size; ++i) {
      out[i] = static_cast<uint8_t>(pattern[i % pattern.size()]);
    }
    return out;
  }

  std::array<uint8_t, 32> MakeKey() {
    std::array<uint8_t, 32> key{};
    pv::crypto::SystemRandomBytes(key);
    return key;
  }

  std::vector<pv::crypto::CipherType> AvailableCiphers() {
    std::vector<pv::crypto::CipherType> out;
    for (auto cipher : {pv::crypto::CipherType::None, pv::crypto::CipherType::AES_256_GCM,
                        pv::crypto::CipherType::CHACHA20_POLY1305,
                        pv::crypto::CipherType::AEGIS_256}) {
      if (pv::crypto::CipherAvailable(cipher)) {
        out.push_back(cipher);
      }
    }
    return out;
  }

  const std::vector<pv::codec::CompressionType> kCompressions = [] {
    std::vector<pv::codec::CompressionType> out;
    for (auto compression :
         {pv::codec::CompressionType::None, pv::codec::CompressionType::Zlib,
          pv::codec::CompressionType::LZMA, pv::codec::CompressionType::Zstd,
          pv::codec::CompressionType::LZ4}) {
      if (pv::codec::CompressionAvailable(compression)) {
        out.push_back(compression);
      } else {
        std::cout << "skipping unavailable compression "
                  << pv::codec::CompressionTypeName(compression) << "\n";
      }
    }
    return out;
  }();

  std::string Describe(pv::codec::CompressionType compression, pv::crypto::CipherType cipher) {
    return std::string(pv::codec::CompressionTypeName(compression)) + "/" +
           pv::crypto::CipherTypeName(cipher);
  }

  bool DecodeFails(const pv::codec::BlockEncoder& encoder, const std::vector<uint8_t>& bytes,
                   const pv::codec::BlockMetadata& metadata) {
    try {
      (void)encoder.Decode(bytes, metadata);
    } catch (const pv::IntegrityError&) {
      return true;
    }
    return false;
  }

  void TestRoundTripAllPairs() {
    const auto key = MakeKey();
    const std::vector<std::vector<uint8_t>> inputs = {
        {}, {0x42}, Compressible(100 * 1024), RandomBytes(10 * 1024 + 3, 5)};
    for (auto compression : kCompressions) {
      for (auto cipher : AvailableCiphers()) {
        pv::codec::BlockEncoder encoder(pv::codec::CodecOptions{compression, cipher,
                                                                pv::crypto::HashAlgorithm::SHA256},
                                        key);
        auto sequence = encoder.BeginFile();
        Expect((sequence == nullptr) == (cipher == pv::crypto::CipherType::None),
               "nonce sequence only for encrypting ciphers: " + Describe(compression, cipher));
        for (const auto& input : inputs) {
          auto block = encoder.Encode(input, sequence.get());
          Expect(block.metadata.original_size == input.size(), "original size recorded");
          Expect(block.metadata.encoded_size == block.bytes.size(), "encoded size recorded");
          Expect(block.bytes.size() >= sizeof(pv::codec::BlockHeader), "header present");
          auto decoded = encoder.Decode(block.bytes, block.metadata);
          Expect(decoded == input, "round trip failed for " + Describe(compression, cipher) +
                                       " size " + std::to_string(input.size()));
        }
      }
    }
  }

  void TestCompressionShrinksRedundantInput() {
    const auto key = MakeKey();
    const auto input = Compressible(64 * 1024);
    for (auto compression : kCompressions) {
      if (compression == pv::codec::CompressionType::None) {
        continue;
      }
      pv::codec::BlockEncoder encoder(
          pv::codec::CodecOptions{compression, pv::crypto::CipherType::AES_256_GCM,
                                  pv::crypto::HashAlgorithm::SHA256},
          key);
      auto sequence = encoder.BeginFile();
      auto block = encoder.Encode(input, sequence.get());
      Expect(block.bytes.size() < input.size() / 4, "redundant input must compress");
    }
  }

  void TestTamperDetection() {
    const auto key = MakeKey();
    const auto input = RandomBytes(4096, 11);
    for (auto compression : kCompressions) {
      for (auto cipher : AvailableCiphers()) {
        pv::codec::BlockEncoder encoder(pv::codec::CodecOptions{compression, cipher,
                                                                pv::crypto::HashAlgorithm::SHA256},
                                        key);
        auto sequence = encoder.BeginFile();
        const auto block = encoder.Encode(input, sequence.get());
        const std::string label = Describe(compression, cipher);

        std::vector<size_t> positions = {sizeof(pv::codec::BlockHeader) + 100,
                                         8,   // counter
                                         40}; // salt
        if (cipher != pv::crypto::CipherType::None) {
          positions.push_back(block.bytes.size() - 1); // tag
        }
        for (size_t position : positions) {
          auto corrupted = block.bytes;
          corrupted[position] ^= 0x5A;
          Expect(DecodeFails(encoder, corrupted, block.metadata),
                 "corruption at " + std::to_string(position) + " not detected for " + label);
        }

        auto wrong_hash = block.metadata;
        wrong_hash.hash[0] = wrong_hash.hash[0] == '0' ? '1' : '0';
        Expect(DecodeFails(encoder, block.bytes, wrong_hash),
               "recorded hash mismatch not detected for " + label);

        auto truncated = block.bytes;
        truncated.pop_back();
        Expect(DecodeFails(encoder, truncated, block.metadata),
               "truncated block not detected for " + label);
      }
    }
  }

  void TestUnencryptedHeaderChecksum() {
    const auto key = MakeKey();
    for (auto compression : kCompressions) {
      pv::codec::BlockEncoder encoder(
          pv::codec::CodecOptions{compression, pv::crypto::CipherType::None,
                                  pv::crypto::HashAlgorithm::SHA256},
          key);
      const auto block = encoder.Encode(Compressible(3000), nullptr);
      const auto header = pv::codec::ParseBlockHeader(block.bytes);
      Expect(header.counter_le == 0, "unencrypted block must carry a zero counter");
      Expect(header.salt != std::array<uint8_t, pv::core::kFileSaltSize>{},
             "unencrypted block must carry a header checksum");
      for (size_t position = 8; position < sizeof(pv::codec::BlockHeader); ++position) {
        auto corrupted = block.bytes;
        corrupted[position] ^= 0x01;
        Expect(DecodeFails(encoder, corrupted, block.metadata),
               "header byte " + std::to_string(position) + " flip not detected for " +
                   Describe(compression, pv::crypto::CipherType::None));
      }
    }
  }

  void TestWrongKeyFailsAuthentication() {
    const auto key = MakeKey();
    auto other = key;
    other[0] ^= 0xFF;
    const pv::codec::CodecOptions options{pv::codec::CompressionType::Zlib,
                                          pv::crypto::CipherType::AES_256_GCM,
                                          pv::crypto::HashAlgorithm::SHA256};
    pv::codec::BlockEncoder writer(options, key);
    pv::codec::BlockEncoder reader(options, other);
    auto sequence = writer.BeginFile();
    const auto block = writer.Encode(Compressible(1000), sequence.get());
    bool rejected = false;
    try {
      (void)reader.Decode(block.bytes, block.metadata);
    } catch (const pv::AuthenticationFailureError&) {
      rejected = true;
    }
    Expect(rejected, "decoding with the wrong key must fail authentication");
  }

  void TestNonceUniqueness() {
    const auto key = MakeKey();
    pv::codec::BlockEncoder encoder(pv::codec::CodecOptions{}, key);
    auto first = encoder.BeginFile();
    auto second = encoder.BeginFile();
    Expect(first->salt() != second->salt(), "each file must draw a fresh salt");

    std::mutex mutex;
    std::set<uint64_t> counters;
    const auto input = RandomBytes(256, 3);
    std::vector<std::thread> threads;
    constexpr int kThreads = 8;
    constexpr int kPerThread = 200;
    for (int t = 0; t < kThreads; ++t) {
      threads.emplace_back([&]() {
        for (int i = 0; i < kPerThread; ++i) {
          auto block = encoder.Encode(input, first.get());
          auto header = pv::codec::ParseBlockHeader(block.bytes);
          Expect(header.salt == first->salt(), "block must carry its file salt");
          std::lock_guard<std::mutex> lock(mutex);
          counters.insert(pv::FromLittleEndian64(header.counter_le));
        }
      });
    }
    for (auto& thread : threads) {
      thread.join();
    }
    Expect(counters.size() == static_cast<size_t>(kThreads * kPerThread),
           "every block must use a distinct nonce counter");
    Expect(first->issued() == static_cast<uint64_t>(kThreads * kPerThread),
           "sequence must count issued nonces");
  }

  void TestUnavailableCompressionRejected() {
    const auto key = MakeKey();
    for (auto compression : {pv::codec::CompressionType::Zstd, pv::codec::CompressionType::LZ4}) {
      if (pv::codec::CompressionAvailable(compression)) {
        continue;
      }
      bool rejected = false;
      try {
        pv::codec::BlockEncoder encoder(
            pv::codec::CodecOptions{compression, pv::crypto::CipherType::AES_256_GCM,
                                    pv::crypto::HashAlgorithm::SHA256},
            key);
        (void)encoder;
      } catch (const pv::Error& err) {
        rejected = err.domain == pv::ErrorDomain::Config &&
                   err.code == pv::errors::config::kUnavailableAlgorithm;
      }
      Expect(rejected, std::string("encoder must reject unavailable ") +
                           pv::codec::CompressionTypeName(compression));
    }
    Expect(pv::codec::ParseCompressionType("zstd") == pv::codec::CompressionType::Zstd,
           "zstd name parsed");
    Expect(pv::codec::ParseCompressionType("LZ4") == pv::codec::CompressionType::LZ4,
           "lz4 name parsed");
  }

  void TestEncoderRejectsBadKey() {
    const std::array<uint8_t, 16> short_key{};
    bool rejected = false;
    try {
      pv::codec::BlockEncoder encoder(pv::codec::CodecOptions{}, short_key);
      (void)encoder;
    } catch (const pv::Error& err) {
      rejected = err.domain == pv::ErrorDomain::Config;
    }
    Expect(rejected, "an encrypting encoder must reject a short key");
  }

} // namespace

int main() {
  pv::crypto::EnsureCryptoRuntimeInitialized();
  TestRoundTripAllPairs();
  TestCompressionShrinksRedundantInput();
  TestTamperDetection();
  TestUnencryptedHeaderChecksum();
  TestWrongKeyFailsAuthentication();
  TestNonceUniqueness();
  TestEncoderRejectsBadKey();
  TestUnavailableCompressionRejected();
  std::cout << "block encoder test ok\n";
  return 0;
}
