#include "pv/engine/metadata_coordinator.h"

#include <algorithm>
#include <limits>

#include "pv/error.h"

namespace pv::engine {

FileTransaction::FileTransaction(metadata::Fileset draft) : draft_(std::move(draft)) {
  draft_.id = 0;
  draft_.is_shadow = false;
  draft_.canonical_id = 0;
}

void FileTransaction::AddBlock(const codec::BlockMetadata& block,
                               const storage::BlockLocation& location) {
  if (blocks_.size() >= std::numeric_limits<uint32_t>::max()) {
    throw Error{ErrorDomain::Validation, errors::validation::kFileTooLarge,
                "too many blocks for one Fileset"};
  }
  if (location.length() != block.encoded_size) {
    throw Error{ErrorDomain::Internal, 0,
                "block location does not match encoded size in " + location.package_key};
  }
  metadata::Blockset record;
  record.fileset_id = 0;
  record.index = static_cast<uint32_t>(blocks_.size());
  record.hash = block.hash;
  record.size = block.encoded_size;
  record.original_size = block.original_size;
  record.package_key = location.package_key;
  record.start_index = location.start_index;
  record.end_index = location.end_index;
  record.encryption = block.cipher;
  record.hash_algorithm = block.hash_algorithm;
  record.compression = block.compression;
  blocks_.push_back(std::move(record));

  auto [it, inserted] = high_water_.try_emplace(location.package_key, location.end_index + 1);
  if (inserted) {
    package_order_.push_back(location.package_key);
  } else {
    it->second = std::max(it->second, location.end_index + 1);
  }
  original_bytes_ += block.original_size;
}

std::vector<std::string> FileTransaction::touched_packages() const {
  return package_order_;
}

metadata::FileCommit FileTransaction::BuildCommit() const {
  metadata::FileCommit commit;
  commit.fileset = draft_;
  commit.blocksets = blocks_;
  for (const auto& key : package_order_) {
    commit.packages.push_back(metadata::PackageUpdate{key, high_water_.at(key)});

    metadata::RootFileset root;
    root.package_key = key;
    root.fileset_id = 0;
    root.fileset_hash = draft_.hash;
    root.fileset_source_key = draft_.source_key;
    root.fileset_size = draft_.size;
    root.created_ms = draft_.created_ms;
    root.updated_ms = draft_.updated_ms;
    commit.root_filesets.push_back(std::move(root));
  }
  return commit;
}

metadata::Fileset MetadataCoordinator::Commit(const FileTransaction& transaction) {
  if (transaction.bytes_added() != transaction.draft().size) {
    throw IoError(errors::io::kSourceChanged,
                  "stored " + std::to_string(transaction.bytes_added()) + " bytes but file " +
                      transaction.draft().key + " has " +
                      std::to_string(transaction.draft().size));
  }
  auto committed = store_.Commit(transaction.BuildCommit());
  if (!committed) {
    throw Error{ErrorDomain::Internal, 0, "commit returned no Fileset"};
  }
  return *committed;
}

metadata::Fileset MetadataCoordinator::CommitShadow(metadata::Fileset draft,
                                                    const metadata::Fileset& canonical) {
  draft.id = 0;
  draft.is_shadow = true;
  draft.canonical_id = canonical.id;
  draft.hash = canonical.hash;
  draft.hash_algorithm = canonical.hash_algorithm;
  metadata::FileCommit commit;
  commit.fileset = std::move(draft);
  auto committed = store_.Commit(std::move(commit));
  if (!committed) {
    throw Error{ErrorDomain::Internal, 0, "shadow commit returned no Fileset"};
  }
  return *committed;
}

} // namespace pv::engine
