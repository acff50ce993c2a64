#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "pv/chunking/fastcdc.h"
#include "pv/codec/block_encoder.h"
#include "pv/codec/compression.h"
#include "pv/crypto/aead.h"
#include "pv/crypto/digest.h"

namespace pv::config {

inline constexpr size_t kMasterKeySize = 32;
inline constexpr uint32_t kPassphraseIterations = 200000;
inline constexpr size_t kPassphraseSaltSize = 16;

// Everything a job needs to ingest or restore files. Every field is a plain value, so a
// copy is always complete.
struct JobConfig {
  crypto::HashAlgorithm hash{crypto::HashAlgorithm::SHA256};
  crypto::CipherType cipher{crypto::CipherType::AES_256_GCM};
  codec::CompressionType compression{codec::CompressionType::Zlib};
  chunking::FastCdcParams chunking{};
  uint64_t package_ceiling{16ull * 1024 * 1024};
  uint64_t large_file_threshold{256ull * 1024 * 1024};
  uint64_t segment_size{64ull * 1024 * 1024};
  size_t encode_threads{4};
  size_t file_threads{2};
  size_t encode_window{16};
  std::vector<uint8_t> key;

  codec::CodecOptions codec_options() const {
    return codec::CodecOptions{compression, cipher, hash};
  }
};

class JobConfigBuilder {
public:
  JobConfigBuilder() = default;
  explicit JobConfigBuilder(JobConfig base) : config_(std::move(base)) {}
  ~JobConfigBuilder();

  // Name setters throw Error{Config, kUnknownAlgorithm} for names outside the lookup tables.
  JobConfigBuilder& SetHashAlgorithm(std::string_view name);
  JobConfigBuilder& SetCipher(std::string_view name);
  JobConfigBuilder& SetCompression(std::string_view name);

  JobConfigBuilder& SetHashAlgorithm(crypto::HashAlgorithm alg);
  JobConfigBuilder& SetCipher(crypto::CipherType cipher);
  JobConfigBuilder& SetCompression(codec::CompressionType type);

  JobConfigBuilder& SetChunkBounds(uint32_t min_size, uint32_t avg_size, uint32_t max_size);
  JobConfigBuilder& SetPackageCeiling(uint64_t bytes);
  JobConfigBuilder& SetLargeFileThreshold(uint64_t bytes);
  JobConfigBuilder& SetSegmentSize(uint64_t bytes);
  JobConfigBuilder& SetEncodeThreads(size_t threads);
  JobConfigBuilder& SetFileThreads(size_t threads);
  JobConfigBuilder& SetEncodeWindow(size_t blocks);

  JobConfigBuilder& SetKey(std::span<const uint8_t> key);
  // 64 hex characters.
  JobConfigBuilder& SetKeyHex(std::string_view hex);
  // PBKDF2-HMAC-SHA256 over |passphrase|.
  JobConfigBuilder& SetPassphrase(std::string_view passphrase, std::span<const uint8_t> salt,
                                  uint32_t iterations = kPassphraseIterations);

  // Validates the combination and returns the finished value.
  JobConfig Build() const;

  const JobConfig& current() const noexcept { return config_; }

private:
  JobConfig config_;
};

// Applies PV_HASH, PV_CIPHER, PV_COMPRESSION, PV_CHUNK_MIN, PV_CHUNK_AVG, PV_CHUNK_MAX,
// PV_PACKAGE_CEILING and PV_ENCODE_THREADS when set.
void ApplyEnvironmentOverrides(JobConfigBuilder& builder);

// Parses a decimal byte count with an optional K, M or G suffix (binary multiples).
uint64_t ParseByteSize(std::string_view text);

} // namespace pv::config
