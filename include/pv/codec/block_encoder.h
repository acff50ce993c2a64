#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "pv/codec/compression.h"
#include "pv/core/nonce.h"
#include "pv/crypto/aead.h"
#include "pv/crypto/digest.h"

namespace pv::codec {

inline constexpr std::array<uint8_t, 4> kBlockMagic{'P', 'V', 'B', 'K'};
inline constexpr uint8_t kBlockFormatVersion = 1;

#pragma pack(push, 1)
struct BlockHeader {
  std::array<uint8_t, 4> magic{kBlockMagic};
  uint8_t version{kBlockFormatVersion};
  uint8_t cipher_id{0};
  uint8_t compression_id{0};
  uint8_t hash_id{0};
  uint64_t counter_le{0};
  uint64_t original_size_le{0};
  uint64_t payload_size_le{0};
  std::array<uint8_t, core::kFileSaltSize> salt{};
};
#pragma pack(pop)

static_assert(sizeof(BlockHeader) == 64, "BlockHeader layout must stay 64 bytes");

struct CodecOptions {
  CompressionType compression{CompressionType::Zlib};
  crypto::CipherType cipher{crypto::CipherType::AES_256_GCM};
  crypto::HashAlgorithm hash{crypto::HashAlgorithm::SHA256};
};

struct BlockMetadata {
  std::string hash;          // hex digest of the raw chunk
  uint64_t original_size{0}; // raw chunk length
  uint64_t encoded_size{0};  // header + ciphertext + tag
  CompressionType compression{CompressionType::None};
  crypto::CipherType cipher{crypto::CipherType::None};
  crypto::HashAlgorithm hash_algorithm{crypto::HashAlgorithm::SHA256};
};

struct EncodedBlock {
  std::vector<uint8_t> bytes;
  BlockMetadata metadata;
};

// Compress-then-encrypt codec for one chunk. The header is authenticated as AAD, so
// algorithm ids, counter, sizes and salt cannot be altered without detection. With cipher
// None the salt slot holds a SHA-256 checksum of the preceding header fields instead.
class BlockEncoder {
public:
  BlockEncoder(CodecOptions options, std::span<const uint8_t> master_key);
  ~BlockEncoder();

  BlockEncoder(const BlockEncoder&) = delete;
  BlockEncoder& operator=(const BlockEncoder&) = delete;

  // Starts the per-file key schedule. Returns nullptr when the cipher is None.
  std::shared_ptr<core::NonceSequence> BeginFile() const;

  EncodedBlock Encode(std::span<const uint8_t> chunk, core::NonceSequence* sequence) const;

  // Throws IntegrityError when the block is malformed, fails authentication, or the
  // decoded bytes do not match |expected|.
  std::vector<uint8_t> Decode(std::span<const uint8_t> encoded,
                              const BlockMetadata& expected) const;

  const CodecOptions& options() const noexcept { return options_; }

private:
  CodecOptions options_;
  std::vector<uint8_t> master_key_;
};

// Parses and validates the fixed header at the start of |encoded|.
BlockHeader ParseBlockHeader(std::span<const uint8_t> encoded);

} // namespace pv::codec
