#include "pv/config/job_config.h"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <limits>

#include "pv/common.h"
#include "pv/crypto/kdf.h"
#include "pv/error.h"
#include "pv/security/zeroizer.h"

namespace pv::config {

namespace {

[[noreturn]] void ThrowUnknown(std::string_view what, std::string_view name) {
  throw Error{ErrorDomain::Config, errors::config::kUnknownAlgorithm,
              "unknown " + std::string(what) + " algorithm: " + std::string(name)};
}

[[noreturn]] void ThrowInvalid(const std::string& message) {
  throw Error{ErrorDomain::Config, errors::config::kInvalidValue, message};
}

const char* GetEnv(const char* name) {
  const char* value = std::getenv(name);
  return (value != nullptr && *value != '\0') ? value : nullptr;
}

uint32_t NarrowChunkSize(uint64_t value, const char* name) {
  if (value > std::numeric_limits<uint32_t>::max()) {
    ThrowInvalid(std::string(name) + " is out of range");
  }
  return static_cast<uint32_t>(value);
}

} // namespace

JobConfigBuilder::~JobConfigBuilder() {
  security::Zeroizer::WipeVector(config_.key);
}

JobConfigBuilder& JobConfigBuilder::SetHashAlgorithm(std::string_view name) {
  auto alg = crypto::ParseHashAlgorithm(name);
  if (!alg) {
    ThrowUnknown("hash", name);
  }
  config_.hash = *alg;
  return *this;
}

JobConfigBuilder& JobConfigBuilder::SetCipher(std::string_view name) {
  auto cipher = crypto::ParseCipherType(name);
  if (!cipher) {
    ThrowUnknown("encryption", name);
  }
  config_.cipher = *cipher;
  return *this;
}

JobConfigBuilder& JobConfigBuilder::SetCompression(std::string_view name) {
  auto type = codec::ParseCompressionType(name);
  if (!type) {
    ThrowUnknown("compression", name);
  }
  config_.compression = *type;
  return *this;
}

JobConfigBuilder& JobConfigBuilder::SetHashAlgorithm(crypto::HashAlgorithm alg) {
  config_.hash = alg;
  return *this;
}

JobConfigBuilder& JobConfigBuilder::SetCipher(crypto::CipherType cipher) {
  config_.cipher = cipher;
  return *this;
}

JobConfigBuilder& JobConfigBuilder::SetCompression(codec::CompressionType type) {
  config_.compression = type;
  return *this;
}

JobConfigBuilder& JobConfigBuilder::SetChunkBounds(uint32_t min_size, uint32_t avg_size,
                                                   uint32_t max_size) {
  config_.chunking = chunking::FastCdcParams{min_size, avg_size, max_size};
  return *this;
}

JobConfigBuilder& JobConfigBuilder::SetPackageCeiling(uint64_t bytes) {
  config_.package_ceiling = bytes;
  return *this;
}

JobConfigBuilder& JobConfigBuilder::SetLargeFileThreshold(uint64_t bytes) {
  config_.large_file_threshold = bytes;
  return *this;
}

JobConfigBuilder& JobConfigBuilder::SetSegmentSize(uint64_t bytes) {
  config_.segment_size = bytes;
  return *this;
}

JobConfigBuilder& JobConfigBuilder::SetEncodeThreads(size_t threads) {
  config_.encode_threads = threads;
  return *this;
}

JobConfigBuilder& JobConfigBuilder::SetFileThreads(size_t threads) {
  config_.file_threads = threads;
  return *this;
}

JobConfigBuilder& JobConfigBuilder::SetEncodeWindow(size_t blocks) {
  config_.encode_window = blocks;
  return *this;
}

JobConfigBuilder& JobConfigBuilder::SetKey(std::span<const uint8_t> key) {
  security::Zeroizer::WipeVector(config_.key);
  config_.key.assign(key.begin(), key.end());
  return *this;
}

JobConfigBuilder& JobConfigBuilder::SetKeyHex(std::string_view hex) {
  auto decoded = HexDecode(hex);
  if (!decoded || decoded->size() != kMasterKeySize) {
    if (decoded) {
      security::Zeroizer::WipeVector(*decoded);
    }
    throw Error{ErrorDomain::Validation, errors::validation::kInvalidKey,
                "key must be " + std::to_string(kMasterKeySize * 2) + " hex characters"};
  }
  SetKey(*decoded);
  security::Zeroizer::WipeVector(*decoded);
  return *this;
}

JobConfigBuilder& JobConfigBuilder::SetPassphrase(std::string_view passphrase,
                                                  std::span<const uint8_t> salt,
                                                  uint32_t iterations) {
  if (passphrase.empty()) {
    throw Error{ErrorDomain::Validation, errors::validation::kInvalidKey,
                "passphrase must not be empty"};
  }
  auto key = crypto::PBKDF2_HMAC_SHA256(AsBytes(passphrase), salt, iterations);
  security::Zeroizer::ScopeWiper<uint8_t> wiper(std::span<uint8_t>(key.data(), key.size()));
  SetKey(key);
  return *this;
}

JobConfig JobConfigBuilder::Build() const {
  config_.chunking.Validate();
  if (!codec::CompressionAvailable(config_.compression)) {
    throw Error{ErrorDomain::Config, errors::config::kUnavailableAlgorithm,
                std::string("compression not available in this build: ") +
                    codec::CompressionTypeName(config_.compression)};
  }
  if (!crypto::CipherAvailable(config_.cipher)) {
    throw Error{ErrorDomain::Config, errors::config::kUnavailableAlgorithm,
                std::string("cipher not available in this build: ") +
                    crypto::CipherTypeName(config_.cipher)};
  }
  if (config_.cipher != crypto::CipherType::None) {
    if (config_.key.empty()) {
      throw Error{ErrorDomain::Config, errors::config::kMissingKey,
                  "encryption requires key material"};
    }
    if (config_.key.size() != crypto::CipherKeySize(config_.cipher)) {
      throw Error{ErrorDomain::Validation, errors::validation::kInvalidKey,
                  "key must be " + std::to_string(crypto::CipherKeySize(config_.cipher)) +
                      " bytes"};
    }
  }
  if (config_.package_ceiling == 0) {
    ThrowInvalid("package ceiling must be positive");
  }
  if (config_.segment_size < config_.chunking.max_size) {
    ThrowInvalid("segment size must be at least the maximum chunk size");
  }
  if (config_.encode_threads == 0 || config_.file_threads == 0) {
    ThrowInvalid("thread counts must be positive");
  }
  if (config_.encode_window == 0) {
    ThrowInvalid("encode window must be positive");
  }
  return config_;
}

uint64_t ParseByteSize(std::string_view text) {
  uint64_t multiplier = 1;
  if (!text.empty()) {
    switch (std::toupper(static_cast<unsigned char>(text.back()))) {
    case 'K':
      multiplier = 1024;
      break;
    case 'M':
      multiplier = 1024ull * 1024;
      break;
    case 'G':
      multiplier = 1024ull * 1024 * 1024;
      break;
    default:
      break;
    }
    if (multiplier != 1) {
      text.remove_suffix(1);
    }
  }
  uint64_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
    ThrowInvalid("invalid size value: " + std::string(text));
  }
  if (value > std::numeric_limits<uint64_t>::max() / multiplier) {
    ThrowInvalid("size value overflows: " + std::string(text));
  }
  return value * multiplier;
}

void ApplyEnvironmentOverrides(JobConfigBuilder& builder) {
  if (const char* env = GetEnv("PV_HASH")) {
    builder.SetHashAlgorithm(env);
  }
  if (const char* env = GetEnv("PV_CIPHER")) {
    builder.SetCipher(env);
  }
  if (const char* env = GetEnv("PV_COMPRESSION")) {
    builder.SetCompression(env);
  }

  const char* min_env = GetEnv("PV_CHUNK_MIN");
  const char* avg_env = GetEnv("PV_CHUNK_AVG");
  const char* max_env = GetEnv("PV_CHUNK_MAX");
  if (min_env || avg_env || max_env) {
    // Unset bounds keep their current values; the builder validates the combination.
    const chunking::FastCdcParams current = builder.current().chunking;
    builder.SetChunkBounds(
        min_env ? NarrowChunkSize(ParseByteSize(min_env), "PV_CHUNK_MIN") : current.min_size,
        avg_env ? NarrowChunkSize(ParseByteSize(avg_env), "PV_CHUNK_AVG") : current.avg_size,
        max_env ? NarrowChunkSize(ParseByteSize(max_env), "PV_CHUNK_MAX") : current.max_size);
  }
  if (const char* env = GetEnv("PV_PACKAGE_CEILING")) {
    builder.SetPackageCeiling(ParseByteSize(env));
  }
  if (const char* env = GetEnv("PV_ENCODE_THREADS")) {
    const uint64_t threads = ParseByteSize(env);
    if (threads == 0 || threads > 1024) {
      ThrowInvalid("PV_ENCODE_THREADS must be between 1 and 1024");
    }
    builder.SetEncodeThreads(static_cast<size_t>(threads));
  }
}

} // namespace pv::config
