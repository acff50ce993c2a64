#include "pv/chunking/fastcdc.h"

#include <algorithm>
#include <bit>
#include <cstring>
#include <fstream>
#include <future>
#include <string>

#include "pv/common.h"
#include "pv/core/worker_pool.h"
#include "pv/error.h"

namespace pv::chunking {

namespace {

constexpr uint64_t kGearSeed = 0x7076636463676561ULL;
constexpr size_t kMinStreamBuffer = 1u << 20;
// Normalization level: MaskS has log2(avg)+2 bits, MaskL has log2(avg)-2 bits.
constexpr unsigned kNormalLevel = 2;

constexpr uint64_t SplitMix64(uint64_t& state) {
  state += 0x9E3779B97F4A7C15ULL;
  uint64_t z = state;
  z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
  z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
  return z ^ (z >> 31);
}

constexpr std::array<uint64_t, 256> BuildGearTable() {
  std::array<uint64_t, 256> table{};
  uint64_t state = kGearSeed;
  for (auto& entry : table) {
    entry = SplitMix64(state);
  }
  return table;
}

constexpr std::array<uint64_t, 256> kGear = BuildGearTable();

// Places |bits| one bits at the top of the word; the gear hash mixes older bytes into
// higher bits, so the top bits cover the widest window.
constexpr uint64_t HighMask(unsigned bits) {
  if (bits == 0) {
    return 0;
  }
  if (bits >= 64) {
    return ~uint64_t{0};
  }
  return ((uint64_t{1} << bits) - 1) << (64 - bits);
}

std::ifstream OpenSource(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw IoError(errors::io::kSourceOpenFailed,
                  "failed to open source file: " + PathToUtf8String(path));
  }
  return in;
}

} // namespace

void FastCdcParams::Validate() const {
  if (min_size < kMinChunkFloor || min_size > avg_size || avg_size > max_size ||
      max_size > kMaxChunkCeiling) {
    throw Error{ErrorDomain::Validation, errors::validation::kInvalidChunkParams,
                "chunk bounds must satisfy " + std::to_string(kMinChunkFloor) +
                    " <= min <= avg <= max <= " + std::to_string(kMaxChunkCeiling) +
                    " (got " + std::to_string(min_size) + "/" + std::to_string(avg_size) + "/" +
                    std::to_string(max_size) + ")"};
  }
}

const std::array<uint64_t, 256>& GearTable() { return kGear; }

FastCdc::FastCdc(const FastCdcParams& params) : params_(params) {
  params_.Validate();
  const unsigned bits = static_cast<unsigned>(std::bit_width(params_.avg_size)) - 1;
  mask_s_ = HighMask(bits + kNormalLevel);
  mask_l_ = HighMask(bits > kNormalLevel ? bits - kNormalLevel : 1);
}

size_t FastCdc::FindCutPoint(std::span<const uint8_t> data) const noexcept {
  size_t n = data.size();
  if (n <= params_.min_size) {
    return n;
  }
  n = std::min<size_t>(n, params_.max_size);
  const size_t normal = std::min<size_t>(params_.avg_size, n);

  uint64_t fp = 0;
  size_t i = params_.min_size;
  for (; i < normal; ++i) {
    fp = (fp << 1) + kGear[data[i]];
    if ((fp & mask_s_) == 0) {
      return i + 1;
    }
  }
  for (; i < n; ++i) {
    fp = (fp << 1) + kGear[data[i]];
    if ((fp & mask_l_) == 0) {
      return i + 1;
    }
  }
  return n;
}

StreamChunker::StreamChunker(std::istream& in, const FastCdcParams& params,
                             core::CancellationToken cancel, uint64_t base_offset,
                             uint64_t limit)
    : in_(in),
      cdc_(params),
      cancel_(std::move(cancel)),
      buffer_(std::max<size_t>(static_cast<size_t>(params.max_size) * 2, kMinStreamBuffer)),
      next_offset_(base_offset),
      remaining_limit_(limit) {}

void StreamChunker::Refill() {
  const size_t available = end_ - begin_;
  if (eof_ || available >= cdc_.params().max_size) {
    return;
  }
  if (begin_ > 0) {
    std::memmove(buffer_.data(), buffer_.data() + begin_, available);
    begin_ = 0;
    end_ = available;
  }
  while (end_ < buffer_.size() && !eof_) {
    const size_t want =
        static_cast<size_t>(std::min<uint64_t>(buffer_.size() - end_, remaining_limit_));
    if (want == 0) {
      eof_ = true;
      break;
    }
    in_.read(reinterpret_cast<char*>(buffer_.data() + end_), static_cast<std::streamsize>(want));
    const auto got = static_cast<size_t>(in_.gcount());
    if (in_.bad()) {
      throw IoError(errors::io::kSourceReadFailed, "read from source stream failed");
    }
    end_ += got;
    remaining_limit_ -= got;
    if (got < want) {
      eof_ = true;
    }
  }
}

std::optional<Chunk> StreamChunker::Next() {
  cancel_.ThrowIfCancelled("chunking");
  Refill();
  if (begin_ == end_) {
    return std::nullopt;
  }
  const size_t length =
      cdc_.FindCutPoint(std::span<const uint8_t>(buffer_.data() + begin_, end_ - begin_));
  Chunk chunk;
  chunk.offset = next_offset_;
  chunk.data.assign(buffer_.begin() + static_cast<std::ptrdiff_t>(begin_),
                    buffer_.begin() + static_cast<std::ptrdiff_t>(begin_ + length));
  begin_ += length;
  next_offset_ += length;
  emitted_ += length;
  return chunk;
}

std::vector<ChunkDescriptor> ChunkBuffer(std::span<const uint8_t> data,
                                         const FastCdcParams& params) {
  FastCdc cdc(params);
  std::vector<ChunkDescriptor> out;
  size_t offset = 0;
  while (offset < data.size()) {
    const size_t length = cdc.FindCutPoint(data.subspan(offset));
    out.push_back(ChunkDescriptor{offset, length});
    offset += length;
  }
  return out;
}

std::vector<ChunkDescriptor> ChunkFileSegmented(const std::filesystem::path& path,
                                                const FastCdcParams& params,
                                                uint64_t segment_size,
                                                core::WorkerPool* pool,
                                                const core::CancellationToken& cancel) {
  params.Validate();
  if (segment_size < params.max_size) {
    throw Error{ErrorDomain::Validation, errors::validation::kInvalidChunkParams,
                "segment size must be at least the maximum chunk size"};
  }
  std::error_code ec;
  const uint64_t file_size = std::filesystem::file_size(path, ec);
  if (ec) {
    throw IoError(errors::io::kSourceOpenFailed,
                  "failed to stat source file: " + PathToUtf8String(path), ec.value());
  }

  auto chunk_segment = [path, params, cancel](uint64_t offset, uint64_t length) {
    auto in = OpenSource(path);
    in.seekg(static_cast<std::streamoff>(offset));
    if (!in) {
      throw IoError(errors::io::kSourceReadFailed, "failed to seek source segment");
    }
    StreamChunker chunker(in, params, cancel, offset, length);
    std::vector<ChunkDescriptor> out;
    while (auto chunk = chunker.Next()) {
      out.push_back(ChunkDescriptor{chunk->offset, chunk->data.size()});
    }
    if (chunker.bytes_emitted() != length) {
      throw IoError(errors::io::kSourceChanged, "source segment shorter than expected");
    }
    return out;
  };

  std::vector<std::future<std::vector<ChunkDescriptor>>> pending;
  std::vector<ChunkDescriptor> result;
  for (uint64_t offset = 0; offset < file_size; offset += segment_size) {
    const uint64_t length = std::min(segment_size, file_size - offset);
    if (pool != nullptr) {
      pending.push_back(pool->Submit([chunk_segment, offset, length] {
        return chunk_segment(offset, length);
      }));
    } else {
      auto part = chunk_segment(offset, length);
      result.insert(result.end(), part.begin(), part.end());
    }
  }
  // Every future is drained before the first failure is rethrown.
  std::exception_ptr first_error;
  for (auto& future : pending) {
    try {
      auto part = future.get();
      if (!first_error) {
        result.insert(result.end(), part.begin(), part.end());
      }
    } catch (...) {
      if (!first_error) {
        first_error = std::current_exception();
      }
    }
  }
  if (first_error) {
    std::rethrow_exception(first_error);
  }
  return result;
}

} // namespace pv::chunking
