#include "pv/metadata/metadata_store.h"

#include <algorithm>
#include <set>
#include <utility>

#include "pv/error.h"

namespace pv::metadata {

namespace {

[[noreturn]] void ThrowNotFound(const std::string& what) {
  throw Error{ErrorDomain::State, errors::state::kNotFound, what};
}

} // namespace

Fileset InMemoryMetadataStore::InsertFileset(Fileset fileset) {
  FileCommit commit;
  commit.fileset = std::move(fileset);
  return *Commit(std::move(commit));
}

void InMemoryMetadataStore::InsertBlocksets(std::vector<Blockset> blocksets) {
  FileCommit commit;
  commit.blocksets = std::move(blocksets);
  Commit(std::move(commit));
}

void InMemoryMetadataStore::InsertRootFileset(RootFileset root_fileset) {
  FileCommit commit;
  commit.root_filesets.push_back(std::move(root_fileset));
  Commit(std::move(commit));
}

std::optional<Fileset> InMemoryMetadataStore::Commit(FileCommit commit) {
  std::lock_guard<std::mutex> lock(mutex_);
  FileCommit applied = AssignIdsLocked(std::move(commit));
  ValidateCommitLocked(applied);
  PersistCommit(applied);
  ApplyCommitLocked(applied);
  return applied.fileset;
}

FileCommit InMemoryMetadataStore::AssignIdsLocked(FileCommit commit) {
  uint64_t fileset_id = 0;
  if (commit.fileset) {
    fileset_id = next_fileset_id_;
    commit.fileset->id = fileset_id;
    if (!commit.fileset->is_shadow) {
      commit.fileset->canonical_id = fileset_id;
    }
  }
  uint64_t blockset_id = next_blockset_id_;
  for (auto& block : commit.blocksets) {
    block.id = blockset_id++;
    if (block.fileset_id == 0) {
      block.fileset_id = fileset_id;
    }
  }
  uint64_t root_id = next_root_fileset_id_;
  for (auto& root : commit.root_filesets) {
    root.id = root_id++;
    if (root.fileset_id == 0) {
      root.fileset_id = fileset_id;
    }
  }
  return commit;
}

void InMemoryMetadataStore::ValidateCommitLocked(const FileCommit& commit) const {
  if (commit.fileset) {
    const Fileset& fileset = *commit.fileset;
    if (fileset.is_shadow) {
      auto it = filesets_.find(fileset.canonical_id);
      if (it == filesets_.end() || it->second.is_shadow || it->second.hash != fileset.hash) {
        throw Error{ErrorDomain::State, errors::state::kNotFound,
                    "shadow Fileset must reference a canonical Fileset with the same hash"};
      }
      if (!commit.blocksets.empty() || !commit.packages.empty()) {
        throw Error{ErrorDomain::Internal, 0, "shadow Fileset cannot own blocks or grow packages"};
      }
    } else if (canonical_by_hash_.count(fileset.hash) != 0) {
      throw ConcurrencyConflict(errors::conflict::kDuplicateCanonical,
                                "a canonical Fileset already exists for hash " + fileset.hash);
    }
  }

  for (const auto& block : commit.blocksets) {
    if (block.fileset_id == 0) {
      throw Error{ErrorDomain::Internal, 0, "Blockset without owning Fileset"};
    }
    const bool own = commit.fileset && block.fileset_id == commit.fileset->id;
    if (!own && filesets_.count(block.fileset_id) == 0) {
      ThrowNotFound("Blockset references unknown Fileset " + std::to_string(block.fileset_id));
    }
    if (packages_.count(block.package_key) == 0) {
      ThrowNotFound("Blockset references unknown package " + block.package_key);
    }
    if (block.size == 0 || block.end_index != block.start_index + block.size - 1) {
      throw Error{ErrorDomain::Internal, 0, "Blockset byte range does not match its size"};
    }
  }

  if (commit.fileset && !commit.fileset->is_shadow) {
    // Index values of a new Fileset must form 0..N-1 in order and cover its size.
    uint64_t total = 0;
    uint32_t expected_index = 0;
    for (const auto& block : commit.blocksets) {
      if (block.fileset_id != commit.fileset->id) {
        continue;
      }
      if (block.index != expected_index++) {
        throw Error{ErrorDomain::Internal, 0, "Blockset indices are not contiguous"};
      }
      total += block.original_size;
    }
    if (total != commit.fileset->size) {
      throw Error{ErrorDomain::Internal, 0, "Blocksets do not cover the Fileset size"};
    }
  }

  for (const auto& update : commit.packages) {
    if (packages_.count(update.key) == 0) {
      ThrowNotFound("package update for unknown package " + update.key);
    }
  }
  for (const auto& root : commit.root_filesets) {
    if (packages_.count(root.package_key) == 0) {
      ThrowNotFound("RootFileset references unknown package " + root.package_key);
    }
  }
}

void InMemoryMetadataStore::ApplyCommitLocked(const FileCommit& applied) {
  if (applied.fileset) {
    const Fileset& fileset = *applied.fileset;
    filesets_[fileset.id] = fileset;
    if (fileset.is_shadow) {
      shadows_[fileset.canonical_id].insert(fileset.id);
    } else {
      canonical_by_hash_[fileset.hash] = fileset.id;
    }
    ids_by_key_[fileset.key].insert(fileset.id);
    next_fileset_id_ = std::max(next_fileset_id_, fileset.id + 1);
  }
  // Append the whole batch, then restore index order once per touched Fileset.
  std::set<uint64_t> touched;
  for (const auto& block : applied.blocksets) {
    blocksets_[block.fileset_id].push_back(block);
    package_owners_[block.package_key].insert(block.fileset_id);
    touched.insert(block.fileset_id);
    next_blockset_id_ = std::max(next_blockset_id_, block.id + 1);
  }
  for (uint64_t fileset_id : touched) {
    auto& list = blocksets_[fileset_id];
    const auto by_index = [](const Blockset& a, const Blockset& b) { return a.index < b.index; };
    if (!std::is_sorted(list.begin(), list.end(), by_index)) {
      std::stable_sort(list.begin(), list.end(), by_index);
    }
  }
  for (const auto& update : applied.packages) {
    auto& package = packages_.at(update.key);
    package.size = std::max(package.size, update.committed_end);
  }
  for (const auto& root : applied.root_filesets) {
    auto& list = root_filesets_[root.package_key];
    list.push_back(root);
    next_root_fileset_id_ = std::max(next_root_fileset_id_, root.id + 1);
    if (list.front().fileset_id != root.fileset_id) {
      packages_.at(root.package_key).multifile = true;
    }
  }
}

void InMemoryMetadataStore::ApplyOpenPackageLocked(const RootPackage& package) {
  packages_[package.key] = package;
  if (!package.sealed) {
    open_by_category_[package.category] = package.key;
  }
  auto& next_index = next_index_by_category_[package.category];
  next_index = std::max(next_index, package.index + 1);
  next_package_id_ = std::max(next_package_id_, package.id + 1);
}

void InMemoryMetadataStore::ApplySealPackageLocked(const std::string& key) {
  auto& package = packages_.at(key);
  package.sealed = true;
  auto it = open_by_category_.find(package.category);
  if (it != open_by_category_.end() && it->second == key) {
    open_by_category_.erase(it);
  }
}

FilesetRemoval InMemoryMetadataStore::ApplyDeleteLocked(uint64_t id) {
  auto it = filesets_.find(id);
  if (it == filesets_.end()) {
    ThrowNotFound("no Fileset with id " + std::to_string(id));
  }
  FilesetRemoval result;
  result.removed = it->second;
  const Fileset& removed = result.removed;
  filesets_.erase(it);

  auto keyed = ids_by_key_.find(removed.key);
  if (keyed != ids_by_key_.end()) {
    keyed->second.erase(id);
    if (keyed->second.empty()) {
      ids_by_key_.erase(keyed);
    }
  }

  if (removed.is_shadow) {
    auto siblings = shadows_.find(removed.canonical_id);
    if (siblings != shadows_.end()) {
      siblings->second.erase(id);
      if (siblings->second.empty()) {
        shadows_.erase(siblings);
      }
    }
    return result;
  }

  std::vector<Blockset> blocks;
  if (auto owned = blocksets_.find(id); owned != blocksets_.end()) {
    blocks = std::move(owned->second);
    blocksets_.erase(owned);
  }
  std::set<std::string> packages;
  for (const auto& block : blocks) {
    packages.insert(block.package_key);
  }

  auto heirs = shadows_.find(id);
  if (heirs == shadows_.end() || heirs->second.empty()) {
    if (heirs != shadows_.end()) {
      shadows_.erase(heirs);
    }
    auto canonical = canonical_by_hash_.find(removed.hash);
    if (canonical != canonical_by_hash_.end() && canonical->second == id) {
      canonical_by_hash_.erase(canonical);
    }
    for (const auto& key : packages) {
      package_owners_[key].erase(id);
      auto& roots = root_filesets_[key];
      roots.erase(std::remove_if(roots.begin(), roots.end(),
                                 [id](const RootFileset& root) { return root.fileset_id == id; }),
                  roots.end());
    }
    result.released = std::move(blocks);
    return result;
  }

  // The oldest shadow becomes canonical and inherits the blocks and remaining shadows.
  std::set<uint64_t> rest = std::move(heirs->second);
  shadows_.erase(heirs);
  const uint64_t heir_id = *rest.begin();
  rest.erase(rest.begin());
  Fileset& heir = filesets_.at(heir_id);
  heir.is_shadow = false;
  heir.canonical_id = heir_id;
  for (uint64_t other : rest) {
    filesets_.at(other).canonical_id = heir_id;
  }
  if (!rest.empty()) {
    shadows_[heir_id] = std::move(rest);
  }
  canonical_by_hash_[heir.hash] = heir_id;
  for (auto& block : blocks) {
    block.fileset_id = heir_id;
  }
  if (!blocks.empty()) {
    blocksets_[heir_id] = std::move(blocks);
  }
  for (const auto& key : packages) {
    auto& owners = package_owners_[key];
    owners.erase(id);
    owners.insert(heir_id);
    for (auto& root : root_filesets_[key]) {
      if (root.fileset_id == id) {
        root.fileset_id = heir_id;
        root.fileset_source_key = heir.source_key;
        root.created_ms = heir.created_ms;
        root.updated_ms = heir.updated_ms;
      }
    }
  }
  result.promoted = heir;
  return result;
}

std::vector<Blockset> InMemoryMetadataStore::PackageBlocksetsLocked(
    const std::string& package_key) const {
  std::vector<Blockset> out;
  auto owners = package_owners_.find(package_key);
  if (owners == package_owners_.end()) {
    return out;
  }
  for (uint64_t fileset_id : owners->second) {
    auto blocks = blocksets_.find(fileset_id);
    if (blocks == blocksets_.end()) {
      continue;
    }
    for (const auto& block : blocks->second) {
      if (block.package_key == package_key) {
        out.push_back(block);
      }
    }
  }
  std::sort(out.begin(), out.end(), [](const Blockset& a, const Blockset& b) {
    return a.start_index < b.start_index;
  });
  return out;
}

void InMemoryMetadataStore::ValidateRelocationLocked(const PackageRelocation& relocation) const {
  auto package = packages_.find(relocation.key);
  if (package == packages_.end()) {
    ThrowNotFound("relocation for unknown package " + relocation.key);
  }
  if (relocation.generation <= package->second.generation) {
    throw Error{ErrorDomain::Internal, 0,
                "relocation of " + relocation.key + " does not advance its generation"};
  }
  std::unordered_map<uint64_t, uint64_t> sizes;
  for (const auto& block : PackageBlocksetsLocked(relocation.key)) {
    sizes.emplace(block.id, block.size);
  }
  if (sizes.size() != relocation.moves.size()) {
    throw Error{ErrorDomain::Internal, 0,
                "relocation of " + relocation.key + " does not cover every live block"};
  }
  std::vector<std::pair<uint64_t, uint64_t>> ranges;
  ranges.reserve(relocation.moves.size());
  for (const auto& move : relocation.moves) {
    auto size = sizes.find(move.blockset_id);
    if (size == sizes.end()) {
      ThrowNotFound("relocation moves unknown block " + std::to_string(move.blockset_id));
    }
    if (move.start_index + size->second > relocation.size) {
      throw Error{ErrorDomain::Internal, 0, "relocated block lies past the package end"};
    }
    ranges.emplace_back(move.start_index, size->second);
  }
  std::sort(ranges.begin(), ranges.end());
  for (size_t i = 1; i < ranges.size(); ++i) {
    if (ranges[i - 1].first + ranges[i - 1].second > ranges[i].first) {
      throw Error{ErrorDomain::Internal, 0, "relocated blocks overlap"};
    }
  }
}

void InMemoryMetadataStore::ApplyRelocationLocked(const PackageRelocation& relocation) {
  std::unordered_map<uint64_t, uint64_t> starts;
  for (const auto& move : relocation.moves) {
    starts.emplace(move.blockset_id, move.start_index);
  }
  auto owners = package_owners_.find(relocation.key);
  if (owners != package_owners_.end()) {
    for (uint64_t fileset_id : owners->second) {
      for (auto& block : blocksets_[fileset_id]) {
        auto start = starts.find(block.id);
        if (block.package_key != relocation.key || start == starts.end()) {
          continue;
        }
        block.start_index = start->second;
        block.end_index = start->second + block.size - 1;
      }
    }
  }
  auto& package = packages_.at(relocation.key);
  package.size = relocation.size;
  package.generation = relocation.generation;
}

void InMemoryMetadataStore::ReplayCommit(const FileCommit& applied) {
  std::lock_guard<std::mutex> lock(mutex_);
  ApplyCommitLocked(applied);
}

void InMemoryMetadataStore::ReplayOpenPackage(const RootPackage& package) {
  std::lock_guard<std::mutex> lock(mutex_);
  ApplyOpenPackageLocked(package);
}

void InMemoryMetadataStore::ReplaySealPackage(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (packages_.count(key) == 0) {
    ThrowNotFound("seal record for unknown package " + key);
  }
  ApplySealPackageLocked(key);
}

void InMemoryMetadataStore::ReplayDeleteFileset(uint64_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  ApplyDeleteLocked(id);
}

void InMemoryMetadataStore::ReplayRelocatePackage(const PackageRelocation& relocation) {
  std::lock_guard<std::mutex> lock(mutex_);
  ValidateRelocationLocked(relocation);
  ApplyRelocationLocked(relocation);
}

FilesetRemoval InMemoryMetadataStore::DeleteFileset(uint64_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (filesets_.count(id) == 0) {
    ThrowNotFound("no Fileset with id " + std::to_string(id));
  }
  PersistDeleteFileset(id);
  return ApplyDeleteLocked(id);
}

void InMemoryMetadataStore::RelocatePackage(const PackageRelocation& relocation) {
  std::lock_guard<std::mutex> lock(mutex_);
  ValidateRelocationLocked(relocation);
  PersistRelocatePackage(relocation);
  ApplyRelocationLocked(relocation);
}

std::optional<Fileset> InMemoryMetadataStore::FindFilesetByHash(const std::string& hash) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = canonical_by_hash_.find(hash);
  if (it == canonical_by_hash_.end()) {
    return std::nullopt;
  }
  return filesets_.at(it->second);
}

std::optional<Fileset> InMemoryMetadataStore::FindFilesetByKey(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = ids_by_key_.find(key);
  if (it == ids_by_key_.end() || it->second.empty()) {
    return std::nullopt;
  }
  return filesets_.at(*it->second.rbegin());
}

std::optional<Fileset> InMemoryMetadataStore::GetFileset(uint64_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = filesets_.find(id);
  if (it == filesets_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<Fileset> InMemoryMetadataStore::ListFilesets() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Fileset> out;
  out.reserve(filesets_.size());
  for (const auto& [id, fileset] : filesets_) {
    out.push_back(fileset);
  }
  return out;
}

std::vector<Blockset> InMemoryMetadataStore::ListBlocksets(uint64_t fileset_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = blocksets_.find(fileset_id);
  if (it == blocksets_.end()) {
    return {};
  }
  return it->second;
}

std::vector<Blockset> InMemoryMetadataStore::ListPackageBlocksets(
    const std::string& package_key) {
  std::lock_guard<std::mutex> lock(mutex_);
  return PackageBlocksetsLocked(package_key);
}

RootPackage InMemoryMetadataStore::GetOrOpenRootPackage(const std::string& category) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto open = open_by_category_.find(category);
  if (open != open_by_category_.end()) {
    return packages_.at(open->second);
  }
  RootPackage package;
  package.id = next_package_id_;
  package.category = category;
  auto next = next_index_by_category_.find(category);
  package.index = next == next_index_by_category_.end() ? 0 : next->second;
  package.key = MakePackageKey(category, package.index);
  PersistOpenPackage(package);
  ApplyOpenPackageLocked(package);
  return package;
}

void InMemoryMetadataStore::SealRootPackage(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = packages_.find(key);
  if (it == packages_.end()) {
    ThrowNotFound("cannot seal unknown package " + key);
  }
  if (it->second.sealed) {
    return;
  }
  PersistSealPackage(key);
  ApplySealPackageLocked(key);
}

std::optional<RootPackage> InMemoryMetadataStore::GetRootPackage(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = packages_.find(key);
  if (it == packages_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<RootPackage> InMemoryMetadataStore::ListRootPackages() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<RootPackage> out;
  out.reserve(packages_.size());
  for (const auto& [key, package] : packages_) {
    out.push_back(package);
  }
  return out;
}

std::vector<RootFileset> InMemoryMetadataStore::ListRootFilesets(const std::string& package_key) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = root_filesets_.find(package_key);
  if (it == root_filesets_.end()) {
    return {};
  }
  return it->second;
}

} // namespace pv::metadata
