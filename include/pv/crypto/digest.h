#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace pv::crypto {

enum class HashAlgorithm : uint8_t {
  SHA256 = 0,
  SHA384 = 1,
  SHA512 = 2,
  SHA1 = 3,
  MD5 = 4,
  SHA3_256 = 5,
  BLAKE2b_512 = 6,
};

// Label table used for configuration and metadata records.
const char* HashAlgorithmName(HashAlgorithm alg);
std::optional<HashAlgorithm> ParseHashAlgorithm(std::string_view name);
size_t DigestSize(HashAlgorithm alg);

// Streaming digest over OpenSSL EVP. Identical input always yields identical output,
// regardless of how the input is split across Update() calls.
class ContentHasher {
public:
  explicit ContentHasher(HashAlgorithm alg = HashAlgorithm::SHA256);
  ~ContentHasher();
  ContentHasher(ContentHasher&&) noexcept;
  ContentHasher& operator=(ContentHasher&&) noexcept;
  ContentHasher(const ContentHasher&) = delete;
  ContentHasher& operator=(const ContentHasher&) = delete;

  void Update(std::span<const uint8_t> data);
  std::vector<uint8_t> Finalize();
  std::string HexDigest();

  HashAlgorithm algorithm() const noexcept { return alg_; }
  uint64_t bytes_hashed() const noexcept { return bytes_; }

private:
  struct State;
  HashAlgorithm alg_;
  std::unique_ptr<State> state_;
  uint64_t bytes_{0};
  bool finalized_{false};
};

std::vector<uint8_t> HashBytes(HashAlgorithm alg, std::span<const uint8_t> data);
std::string HashBytesHex(HashAlgorithm alg, std::span<const uint8_t> data);

}  // namespace pv::crypto
