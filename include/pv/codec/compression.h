#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace pv::codec {

enum class CompressionType : uint8_t {
  None = 0,
  Zlib = 1,
  LZMA = 2,
  Zstd = 3,
  LZ4 = 4,
};

const char* CompressionTypeName(CompressionType type);
std::optional<CompressionType> ParseCompressionType(std::string_view name);

// Zstd and LZ4 depend on optional libraries; the others are always built in.
bool CompressionAvailable(CompressionType type);

std::vector<uint8_t> Compress(CompressionType type, std::span<const uint8_t> input);

// Decompresses into exactly |expected_size| bytes. Output that is longer, shorter or
// malformed raises IntegrityError.
std::vector<uint8_t> Decompress(CompressionType type, std::span<const uint8_t> input,
                                size_t expected_size);

} // namespace pv::codec
