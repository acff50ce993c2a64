#include "pv/codec/block_encoder.h"

#include <algorithm>
#include <cstddef>
#include <cstring>

#include "pv/common.h"
#include "pv/crypto/ct.h"
#include "pv/error.h"
#include "pv/security/zeroizer.h"

namespace pv::codec {

namespace {

[[noreturn]] void ThrowMalformed(const std::string& message) {
  throw IntegrityError(errors::integrity::kMalformedBlock, message);
}

std::span<const uint8_t> HeaderBytes(const BlockHeader& header) {
  return AsBytesConst(header);
}

constexpr size_t kHeaderFieldsSize = offsetof(BlockHeader, salt);

// Unencrypted blocks carry SHA-256 of the header fields in the salt slot; the counter is zero.
std::array<uint8_t, core::kFileSaltSize> HeaderChecksum(const BlockHeader& header) {
  const auto digest = crypto::HashBytes(crypto::HashAlgorithm::SHA256,
                                        HeaderBytes(header).first(kHeaderFieldsSize));
  std::array<uint8_t, core::kFileSaltSize> out{};
  std::memcpy(out.data(), digest.data(), std::min(out.size(), digest.size()));
  return out;
}

} // namespace

BlockHeader ParseBlockHeader(std::span<const uint8_t> encoded) {
  if (encoded.size() < sizeof(BlockHeader)) {
    ThrowMalformed("encoded block shorter than header");
  }
  BlockHeader header{};
  std::memcpy(&header, encoded.data(), sizeof(header));
  if (header.magic != kBlockMagic) {
    ThrowMalformed("encoded block has bad magic");
  }
  if (header.version != kBlockFormatVersion) {
    ThrowMalformed("unsupported block format version " + std::to_string(header.version));
  }
  return header;
}

BlockEncoder::BlockEncoder(CodecOptions options, std::span<const uint8_t> master_key)
    : options_(options), master_key_(master_key.begin(), master_key.end()) {
  if (!CompressionAvailable(options_.compression)) {
    throw Error{ErrorDomain::Config, errors::config::kUnavailableAlgorithm,
                std::string("compression not available in this build: ") +
                    CompressionTypeName(options_.compression)};
  }
  if (options_.cipher != crypto::CipherType::None) {
    if (!crypto::CipherAvailable(options_.cipher)) {
      throw Error{ErrorDomain::Config, errors::config::kUnavailableAlgorithm,
                  std::string("cipher not available in this build: ") +
                      crypto::CipherTypeName(options_.cipher)};
    }
    if (master_key_.size() != crypto::CipherKeySize(options_.cipher)) {
      throw Error{ErrorDomain::Config, errors::config::kMissingKey,
                  "encryption key must be " +
                      std::to_string(crypto::CipherKeySize(options_.cipher)) + " bytes"};
    }
  }
}

BlockEncoder::~BlockEncoder() { security::Zeroizer::WipeVector(master_key_); }

std::shared_ptr<core::NonceSequence> BlockEncoder::BeginFile() const {
  if (options_.cipher == crypto::CipherType::None) {
    return nullptr;
  }
  return std::make_shared<core::NonceSequence>(master_key_);
}

EncodedBlock BlockEncoder::Encode(std::span<const uint8_t> chunk,
                                  core::NonceSequence* sequence) const {
  const bool encrypting = options_.cipher != crypto::CipherType::None;
  if (encrypting && sequence == nullptr) {
    throw Error{ErrorDomain::Internal, 0, "encrypting encoder requires a nonce sequence"};
  }

  EncodedBlock result;
  result.metadata.hash = crypto::HashBytesHex(options_.hash, chunk);
  result.metadata.original_size = chunk.size();
  result.metadata.compression = options_.compression;
  result.metadata.cipher = options_.cipher;
  result.metadata.hash_algorithm = options_.hash;

  auto compressed = Compress(options_.compression, chunk);

  BlockHeader header{};
  header.cipher_id = static_cast<uint8_t>(options_.cipher);
  header.compression_id = static_cast<uint8_t>(options_.compression);
  header.hash_id = static_cast<uint8_t>(options_.hash);
  header.original_size_le = ToLittleEndian64(chunk.size());
  header.payload_size_le = ToLittleEndian64(compressed.size());

  std::vector<uint8_t> ciphertext;
  std::vector<uint8_t> tag;
  if (encrypting) {
    const uint64_t counter = sequence->Reserve();
    header.counter_le = ToLittleEndian64(counter);
    header.salt = sequence->salt();
    std::array<uint8_t, crypto::kMaxAeadNonceSize> nonce{};
    std::span<uint8_t> nonce_span(nonce.data(), crypto::CipherNonceSize(options_.cipher));
    core::NonceSequence::FillNonce(counter, nonce_span);
    auto sealed = crypto::AEAD_Encrypt(options_.cipher, compressed, HeaderBytes(header),
                                       nonce_span, sequence->key());
    ciphertext = std::move(sealed.ciphertext);
    tag = std::move(sealed.tag);
  } else {
    header.salt = HeaderChecksum(header);
    ciphertext = std::move(compressed);
  }

  result.bytes.reserve(sizeof(header) + ciphertext.size() + tag.size());
  auto header_bytes = HeaderBytes(header);
  result.bytes.insert(result.bytes.end(), header_bytes.begin(), header_bytes.end());
  result.bytes.insert(result.bytes.end(), ciphertext.begin(), ciphertext.end());
  result.bytes.insert(result.bytes.end(), tag.begin(), tag.end());
  result.metadata.encoded_size = result.bytes.size();
  return result;
}

std::vector<uint8_t> BlockEncoder::Decode(std::span<const uint8_t> encoded,
                                          const BlockMetadata& expected) const {
  const BlockHeader header = ParseBlockHeader(encoded);
  const auto cipher = static_cast<crypto::CipherType>(header.cipher_id);
  const auto compression = static_cast<CompressionType>(header.compression_id);
  const auto hash_alg = static_cast<crypto::HashAlgorithm>(header.hash_id);
  if (cipher != expected.cipher || compression != expected.compression ||
      hash_alg != expected.hash_algorithm) {
    ThrowMalformed("block header algorithms disagree with metadata");
  }
  const uint64_t original_size = FromLittleEndian64(header.original_size_le);
  const uint64_t payload_size = FromLittleEndian64(header.payload_size_le);
  if (original_size != expected.original_size) {
    throw IntegrityError(errors::integrity::kLengthMismatch,
                         "block original size disagrees with metadata");
  }

  const size_t tag_size = crypto::CipherTagSize(cipher);
  const size_t body_size = encoded.size() - sizeof(BlockHeader);
  if (payload_size > body_size || body_size - payload_size != tag_size) {
    ThrowMalformed("encoded block length does not match header");
  }
  auto payload = encoded.subspan(sizeof(BlockHeader), static_cast<size_t>(payload_size));
  auto tag = encoded.subspan(sizeof(BlockHeader) + static_cast<size_t>(payload_size), tag_size);

  std::vector<uint8_t> compressed;
  if (cipher != crypto::CipherType::None) {
    if (master_key_.empty()) {
      throw Error{ErrorDomain::Config, errors::config::kMissingKey,
                  "encrypted block requires an encryption key"};
    }
    auto file_key = core::DeriveFileKey(master_key_, header.salt);
    security::Zeroizer::ScopeWiper<uint8_t> key_guard(
        std::span<uint8_t>(file_key.data(), file_key.size()));
    std::array<uint8_t, crypto::kMaxAeadNonceSize> nonce{};
    std::span<uint8_t> nonce_span(nonce.data(), crypto::CipherNonceSize(cipher));
    core::NonceSequence::FillNonce(FromLittleEndian64(header.counter_le), nonce_span);
    compressed = crypto::AEAD_Decrypt(cipher, payload, encoded.first(sizeof(BlockHeader)),
                                      nonce_span, tag,
                                      std::span<const uint8_t>(file_key.data(), file_key.size()));
  } else {
    const auto checksum = HeaderChecksum(header);
    if (header.counter_le != 0 ||
        !crypto::ct::CompareEqual(std::span<const uint8_t>(header.salt),
                                  std::span<const uint8_t>(checksum))) {
      ThrowMalformed("unencrypted block header failed its checksum");
    }
    compressed.assign(payload.begin(), payload.end());
  }

  auto plain = Decompress(compression, compressed, static_cast<size_t>(original_size));
  const auto actual = crypto::HashBytesHex(hash_alg, plain);
  if (!crypto::ct::CompareEqual(AsBytes(actual), AsBytes(expected.hash))) {
    throw IntegrityError(errors::integrity::kBlockHashMismatch,
                         "decoded block hash does not match recorded chunk hash");
  }
  return plain;
}

} // namespace pv::codec
