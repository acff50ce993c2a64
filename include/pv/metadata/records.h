#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "pv/codec/compression.h"
#include "pv/crypto/aead.h"
#include "pv/crypto/digest.h"

namespace pv::metadata {

struct Fileset {
  uint64_t id{0};
  std::string key;        // logical path
  std::string source_key; // origin path
  uint64_t size{0};
  std::string hash;
  crypto::HashAlgorithm hash_algorithm{crypto::HashAlgorithm::SHA256};
  int64_t created_ms{0};
  int64_t updated_ms{0};
  bool is_shadow{false};
  uint64_t canonical_id{0}; // equals id for canonical entries

  bool operator==(const Fileset&) const = default;
};

struct Blockset {
  uint64_t id{0};
  uint64_t fileset_id{0};
  uint32_t index{0};
  std::string hash;          // pre-encode chunk hash
  uint64_t size{0};          // post-encode length
  uint64_t original_size{0}; // pre-encode length
  std::string package_key;
  uint64_t start_index{0};
  uint64_t end_index{0};     // inclusive
  crypto::CipherType encryption{crypto::CipherType::None};
  crypto::HashAlgorithm hash_algorithm{crypto::HashAlgorithm::SHA256};
  codec::CompressionType compression{codec::CompressionType::None};

  bool operator==(const Blockset&) const = default;
};

struct RootPackage {
  uint64_t id{0};
  std::string key;
  std::string category;
  uint64_t index{0};
  uint64_t size{0};
  bool multifile{false};
  bool sealed{false};
  uint64_t generation{0}; // bumped each time the package is compacted

  bool operator==(const RootPackage&) const = default;
};

struct RootFileset {
  uint64_t id{0};
  std::string package_key;
  uint64_t fileset_id{0};
  std::string fileset_hash;
  std::string fileset_source_key;
  uint64_t fileset_size{0};
  int64_t created_ms{0};
  int64_t updated_ms{0};

  bool operator==(const RootFileset&) const = default;
};

// Raises a package's committed size to |committed_end| if it is larger.
struct PackageUpdate {
  std::string key;
  uint64_t committed_end{0};

  bool operator==(const PackageUpdate&) const = default;
};

// One all-or-nothing metadata transaction. Blocksets and RootFilesets with fileset_id 0
// are bound to the Fileset of the same commit once it has an id.
struct FileCommit {
  std::optional<Fileset> fileset;
  std::vector<Blockset> blocksets;
  std::vector<PackageUpdate> packages;
  std::vector<RootFileset> root_filesets;
};

// New location of one live block after its package is compacted.
struct BlockMove {
  uint64_t blockset_id{0};
  uint64_t start_index{0};

  bool operator==(const BlockMove&) const = default;
};

// Rewrites a package as |generation| holding only its live blocks. Every live block of the
// package must have exactly one move.
struct PackageRelocation {
  std::string key;
  uint64_t generation{0};
  uint64_t size{0};
  std::vector<BlockMove> moves;
};

// Outcome of removing a Fileset. When a canonical with shadows is removed, the oldest shadow
// is promoted and takes over the blocks; otherwise the blocks of a canonical are released.
struct FilesetRemoval {
  Fileset removed;
  std::optional<Fileset> promoted;
  std::vector<Blockset> released;
};

// "<category><index mod 256 as two hex digits>/<index>", e.g. "a00/0", "c01/257".
std::string MakePackageKey(const std::string& category, uint64_t index);

} // namespace pv::metadata
