#include "pv/codec/compression.h"

#include <array>
#include <cctype>
#include <string>

#include <lzma.h>
#include <zlib.h>

#ifndef PV_HAVE_ZSTD
#define PV_HAVE_ZSTD 0
#endif
#ifndef PV_HAVE_LZ4
#define PV_HAVE_LZ4 0
#endif

#if PV_HAVE_ZSTD
#include <zstd.h>
#endif
#if PV_HAVE_LZ4
#include <lz4.h>
#endif

#include "pv/error.h"

namespace pv::codec {

namespace {

struct CompressionEntry {
  CompressionType type;
  const char* name;
};

constexpr std::array<CompressionEntry, 5> kCompressions{{
    {CompressionType::None, "None"},
    {CompressionType::Zlib, "Zlib"},
    {CompressionType::LZMA, "LZMA"},
    {CompressionType::Zstd, "Zstd"},
    {CompressionType::LZ4, "LZ4"},
}};

constexpr int kZlibLevel = 6;
constexpr uint32_t kLzmaPreset = 6;
#if PV_HAVE_ZSTD
constexpr int kZstdLevel = 3;
#endif
constexpr size_t kStreamBufferSize = 64 * 1024;

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

[[noreturn]] void ThrowCorrupt(const std::string& message) {
  throw IntegrityError(errors::integrity::kMalformedBlock, message);
}

std::vector<uint8_t> ZlibCompress(std::span<const uint8_t> input) {
  z_stream zs{};
  if (deflateInit(&zs, kZlibLevel) != Z_OK) {
    throw Error{ErrorDomain::Internal, 0, "deflateInit failed"};
  }
  std::vector<uint8_t> out(deflateBound(&zs, static_cast<uLong>(input.size())));
  zs.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data()));
  zs.avail_in = static_cast<uInt>(input.size());
  zs.next_out = reinterpret_cast<Bytef*>(out.data());
  zs.avail_out = static_cast<uInt>(out.size());
  int rc = deflate(&zs, Z_FINISH);
  if (rc != Z_STREAM_END) {
    deflateEnd(&zs);
    throw Error{ErrorDomain::Internal, rc, "deflate did not finish in one pass"};
  }
  out.resize(zs.total_out);
  deflateEnd(&zs);
  return out;
}

std::vector<uint8_t> ZlibDecompress(std::span<const uint8_t> input, size_t expected_size) {
  z_stream zs{};
  zs.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data()));
  zs.avail_in = static_cast<uInt>(input.size());
  if (inflateInit(&zs) != Z_OK) {
    throw Error{ErrorDomain::Internal, 0, "inflateInit failed"};
  }
  // One spare byte detects output longer than recorded.
  std::vector<uint8_t> out(expected_size + 1);
  zs.next_out = reinterpret_cast<Bytef*>(out.data());
  zs.avail_out = static_cast<uInt>(out.size());
  int rc = inflate(&zs, Z_FINISH);
  const size_t produced = zs.total_out;
  inflateEnd(&zs);
  if (rc != Z_STREAM_END) {
    ThrowCorrupt("zlib stream is malformed or truncated");
  }
  if (produced != expected_size) {
    throw IntegrityError(errors::integrity::kLengthMismatch,
                         "zlib output length does not match recorded size");
  }
  out.resize(produced);
  return out;
}

std::vector<uint8_t> LzmaCompress(std::span<const uint8_t> input) {
  lzma_stream strm = LZMA_STREAM_INIT;
  lzma_ret ret = lzma_easy_encoder(&strm, kLzmaPreset, LZMA_CHECK_CRC64);
  if (ret != LZMA_OK) {
    throw Error{ErrorDomain::Internal, static_cast<int>(ret), "Failed to initialize xz encoder"};
  }
  std::vector<uint8_t> out;
  std::array<uint8_t, kStreamBufferSize> buffer{};
  strm.next_in = input.data();
  strm.avail_in = input.size();
  do {
    strm.next_out = buffer.data();
    strm.avail_out = buffer.size();
    ret = lzma_code(&strm, LZMA_FINISH);
    if (ret != LZMA_OK && ret != LZMA_STREAM_END) {
      lzma_end(&strm);
      throw Error{ErrorDomain::Internal, static_cast<int>(ret), "XZ compression failed"};
    }
    out.insert(out.end(), buffer.begin(), buffer.begin() + (buffer.size() - strm.avail_out));
  } while (ret != LZMA_STREAM_END);
  lzma_end(&strm);
  return out;
}

std::vector<uint8_t> LzmaDecompress(std::span<const uint8_t> input, size_t expected_size) {
  lzma_stream strm = LZMA_STREAM_INIT;
  lzma_ret ret = lzma_stream_decoder(&strm, UINT64_MAX, 0);
  if (ret != LZMA_OK) {
    throw Error{ErrorDomain::Internal, static_cast<int>(ret), "Failed to initialize xz decoder"};
  }
  std::vector<uint8_t> out(expected_size + 1);
  strm.next_in = input.data();
  strm.avail_in = input.size();
  strm.next_out = out.data();
  strm.avail_out = out.size();
  ret = lzma_code(&strm, LZMA_FINISH);
  const size_t produced = static_cast<size_t>(strm.total_out);
  lzma_end(&strm);
  if (ret != LZMA_STREAM_END) {
    ThrowCorrupt("xz stream is malformed or truncated");
  }
  if (produced != expected_size) {
    throw IntegrityError(errors::integrity::kLengthMismatch,
                         "xz output length does not match recorded size");
  }
  out.resize(produced);
  return out;
}

#if PV_HAVE_ZSTD
std::vector<uint8_t> ZstdCompress(std::span<const uint8_t> input) {
  std::vector<uint8_t> out(ZSTD_compressBound(input.size()));
  const size_t written =
      ZSTD_compress(out.data(), out.size(), input.data(), input.size(), kZstdLevel);
  if (ZSTD_isError(written)) {
    throw Error{ErrorDomain::Internal, 0,
                std::string("Zstd compression failed: ") + ZSTD_getErrorName(written)};
  }
  out.resize(written);
  return out;
}

std::vector<uint8_t> ZstdDecompress(std::span<const uint8_t> input, size_t expected_size) {
  const unsigned long long frame_size = ZSTD_getFrameContentSize(input.data(), input.size());
  if (frame_size == ZSTD_CONTENTSIZE_ERROR || frame_size == ZSTD_CONTENTSIZE_UNKNOWN) {
    ThrowCorrupt("zstd frame is malformed or has no content size");
  }
  if (frame_size != expected_size) {
    throw IntegrityError(errors::integrity::kLengthMismatch,
                         "zstd frame size does not match recorded size");
  }
  std::vector<uint8_t> out(expected_size);
  const size_t produced = ZSTD_decompress(out.data(), out.size(), input.data(), input.size());
  if (ZSTD_isError(produced)) {
    ThrowCorrupt(std::string("zstd stream is malformed: ") + ZSTD_getErrorName(produced));
  }
  if (produced != expected_size) {
    throw IntegrityError(errors::integrity::kLengthMismatch,
                         "zstd output length does not match recorded size");
  }
  return out;
}
#endif

#if PV_HAVE_LZ4
std::vector<uint8_t> Lz4Compress(std::span<const uint8_t> input) {
  if (input.size() > static_cast<size_t>(LZ4_MAX_INPUT_SIZE)) {
    throw Error{ErrorDomain::Validation, errors::validation::kInvalidRange,
                "chunk too large for LZ4"};
  }
  const int source_size = static_cast<int>(input.size());
  std::vector<uint8_t> out(static_cast<size_t>(LZ4_compressBound(source_size)));
  const int written = LZ4_compress_default(reinterpret_cast<const char*>(input.data()),
                                           reinterpret_cast<char*>(out.data()), source_size,
                                           static_cast<int>(out.size()));
  if (written <= 0) {
    throw Error{ErrorDomain::Internal, written, "LZ4 compression failed"};
  }
  out.resize(static_cast<size_t>(written));
  return out;
}

std::vector<uint8_t> Lz4Decompress(std::span<const uint8_t> input, size_t expected_size) {
  if (input.size() > static_cast<size_t>(LZ4_MAX_INPUT_SIZE) ||
      expected_size > static_cast<size_t>(LZ4_MAX_INPUT_SIZE)) {
    ThrowCorrupt("LZ4 block exceeds the format limit");
  }
  // One spare byte detects output longer than recorded.
  std::vector<uint8_t> out(expected_size + 1);
  const int produced = LZ4_decompress_safe(reinterpret_cast<const char*>(input.data()),
                                           reinterpret_cast<char*>(out.data()),
                                           static_cast<int>(input.size()),
                                           static_cast<int>(out.size()));
  if (produced < 0) {
    ThrowCorrupt("LZ4 block is malformed or truncated");
  }
  if (static_cast<size_t>(produced) != expected_size) {
    throw IntegrityError(errors::integrity::kLengthMismatch,
                         "LZ4 output length does not match recorded size");
  }
  out.resize(expected_size);
  return out;
}
#endif

[[noreturn]] void ThrowUnavailable(CompressionType type) {
  throw Error{ErrorDomain::Config, errors::config::kUnavailableAlgorithm,
              std::string("compression not available in this build: ") +
                  CompressionTypeName(type)};
}

} // namespace

bool CompressionAvailable(CompressionType type) {
  switch (type) {
  case CompressionType::None:
  case CompressionType::Zlib:
  case CompressionType::LZMA:
    return true;
  case CompressionType::Zstd:
    return PV_HAVE_ZSTD != 0;
  case CompressionType::LZ4:
    return PV_HAVE_LZ4 != 0;
  }
  return false;
}

const char* CompressionTypeName(CompressionType type) {
  for (const auto& entry : kCompressions) {
    if (entry.type == type) {
      return entry.name;
    }
  }
  return "unknown";
}

std::optional<CompressionType> ParseCompressionType(std::string_view name) {
  for (const auto& entry : kCompressions) {
    if (EqualsIgnoreCase(name, entry.name)) {
      return entry.type;
    }
  }
  if (EqualsIgnoreCase(name, "deflate")) {
    return CompressionType::Zlib;
  }
  if (EqualsIgnoreCase(name, "xz")) {
    return CompressionType::LZMA;
  }
  if (EqualsIgnoreCase(name, "zstandard")) {
    return CompressionType::Zstd;
  }
  return std::nullopt;
}

std::vector<uint8_t> Compress(CompressionType type, std::span<const uint8_t> input) {
  switch (type) {
  case CompressionType::None:
    return std::vector<uint8_t>(input.begin(), input.end());
  case CompressionType::Zlib:
    return ZlibCompress(input);
  case CompressionType::LZMA:
    return LzmaCompress(input);
  case CompressionType::Zstd:
#if PV_HAVE_ZSTD
    return ZstdCompress(input);
#else
    ThrowUnavailable(type);
#endif
  case CompressionType::LZ4:
#if PV_HAVE_LZ4
    return Lz4Compress(input);
#else
    ThrowUnavailable(type);
#endif
  }
  throw Error{ErrorDomain::Config, errors::config::kUnknownAlgorithm, "unknown compression id"};
}

std::vector<uint8_t> Decompress(CompressionType type, std::span<const uint8_t> input,
                                size_t expected_size) {
  switch (type) {
  case CompressionType::None:
    if (input.size() != expected_size) {
      throw IntegrityError(errors::integrity::kLengthMismatch,
                           "stored length does not match recorded size");
    }
    return std::vector<uint8_t>(input.begin(), input.end());
  case CompressionType::Zlib:
    return ZlibDecompress(input, expected_size);
  case CompressionType::LZMA:
    return LzmaDecompress(input, expected_size);
  case CompressionType::Zstd:
#if PV_HAVE_ZSTD
    return ZstdDecompress(input, expected_size);
#else
    ThrowUnavailable(type);
#endif
  case CompressionType::LZ4:
#if PV_HAVE_LZ4
    return Lz4Decompress(input, expected_size);
#else
    ThrowUnavailable(type);
#endif
  }
  throw IntegrityError(errors::integrity::kMalformedBlock, "unknown compression id in block");
}

} // namespace pv::codec
