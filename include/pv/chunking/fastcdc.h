#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <limits>
#include <optional>
#include <span>
#include <vector>

#include "pv/core/cancellation.h"

namespace pv::core {
class WorkerPool;
}

namespace pv::chunking {

inline constexpr uint32_t kMinChunkFloor = 64;
inline constexpr uint32_t kMaxChunkCeiling = 256u * 1024 * 1024;

struct FastCdcParams {
  uint32_t min_size{2 * 1024};
  uint32_t avg_size{16 * 1024};
  uint32_t max_size{64 * 1024};

  // Requires kMinChunkFloor <= min <= avg <= max <= kMaxChunkCeiling.
  void Validate() const;
};

struct ChunkDescriptor {
  uint64_t offset{0};
  uint64_t length{0};

  bool operator==(const ChunkDescriptor&) const = default;
};

struct Chunk {
  uint64_t offset{0};
  std::vector<uint8_t> data;
};

// 256-entry gear table, generated at compile time from a fixed SplitMix64 seed.
const std::array<uint64_t, 256>& GearTable();

// FastCDC cut-point search with normalized chunking (level 2).
class FastCdc {
public:
  explicit FastCdc(const FastCdcParams& params);

  // |data| starts at the previous cut. Returns the length of the next chunk; the whole
  // input is returned when it is no longer than min_size.
  size_t FindCutPoint(std::span<const uint8_t> data) const noexcept;

  const FastCdcParams& params() const noexcept { return params_; }
  uint64_t mask_small() const noexcept { return mask_s_; }
  uint64_t mask_large() const noexcept { return mask_l_; }

private:
  FastCdcParams params_;
  uint64_t mask_s_{0};
  uint64_t mask_l_{0};
};

// Lazily chunks a stream. Holds at most a bounded window of bytes in memory.
class StreamChunker {
public:
  StreamChunker(std::istream& in, const FastCdcParams& params,
                core::CancellationToken cancel = {},
                uint64_t base_offset = 0,
                uint64_t limit = std::numeric_limits<uint64_t>::max());

  // Returns nullopt at end of stream. Throws CancellationError once cancelled and IoError on
  // a failed read; chunks already returned stay valid.
  std::optional<Chunk> Next();

  uint64_t bytes_emitted() const noexcept { return emitted_; }

private:
  void Refill();

  std::istream& in_;
  FastCdc cdc_;
  core::CancellationToken cancel_;
  std::vector<uint8_t> buffer_;
  size_t begin_{0};
  size_t end_{0};
  uint64_t next_offset_{0};
  uint64_t remaining_limit_{0};
  uint64_t emitted_{0};
  bool eof_{false};
};

std::vector<ChunkDescriptor> ChunkBuffer(std::span<const uint8_t> data,
                                         const FastCdcParams& params);

// Large-file variant: splits the file into fixed segments of |segment_size| bytes, chunks
// each independently (on |pool| when given) and concatenates descriptors in segment order.
std::vector<ChunkDescriptor> ChunkFileSegmented(const std::filesystem::path& path,
                                                const FastCdcParams& params,
                                                uint64_t segment_size,
                                                core::WorkerPool* pool,
                                                const core::CancellationToken& cancel);

} // namespace pv::chunking
