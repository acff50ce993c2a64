#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "pv/codec/block_encoder.h"
#include "pv/metadata/metadata_store.h"
#include "pv/storage/package_store.h"

namespace pv::engine {

// Collects the records produced while one file is stored and commits them as one unit.
// Blocks must be added in stream order; their Index values follow the order of AddBlock().
class FileTransaction {
public:
  explicit FileTransaction(metadata::Fileset draft);

  void AddBlock(const codec::BlockMetadata& block, const storage::BlockLocation& location);

  // Keys of every package that received a block, in first-touch order.
  std::vector<std::string> touched_packages() const;
  const metadata::Fileset& draft() const noexcept { return draft_; }
  size_t block_count() const noexcept { return blocks_.size(); }
  uint64_t bytes_added() const noexcept { return original_bytes_; }

  metadata::FileCommit BuildCommit() const;

private:
  metadata::Fileset draft_;
  std::vector<metadata::Blockset> blocks_;
  std::vector<std::string> package_order_;
  std::map<std::string, uint64_t> high_water_;
  uint64_t original_bytes_{0};
};

class MetadataCoordinator {
public:
  explicit MetadataCoordinator(metadata::MetadataStore& store) : store_(store) {}

  metadata::MetadataStore& store() noexcept { return store_; }

  // Commits Fileset, Blocksets, package growth and RootFilesets atomically.
  metadata::Fileset Commit(const FileTransaction& transaction);

  // Commits a Fileset-only record pointing at |canonical|. No package is touched.
  metadata::Fileset CommitShadow(metadata::Fileset draft, const metadata::Fileset& canonical);

private:
  metadata::MetadataStore& store_;
};

} // namespace pv::engine
