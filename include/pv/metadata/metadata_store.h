#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "pv/metadata/records.h"

namespace pv::metadata {

// Typed store for the four record kinds. Implementations must make Commit() atomic:
// either every record of the FileCommit becomes visible or none does.
class MetadataStore {
public:
  virtual ~MetadataStore() = default;

  virtual Fileset InsertFileset(Fileset fileset) = 0;
  virtual void InsertBlocksets(std::vector<Blockset> blocksets) = 0;
  virtual void InsertRootFileset(RootFileset root_fileset) = 0;
  virtual std::optional<Fileset> Commit(FileCommit commit) = 0;

  // Canonical (non-shadow) Fileset for a content hash.
  virtual std::optional<Fileset> FindFilesetByHash(const std::string& hash) = 0;
  // Most recently committed Fileset for a logical key.
  virtual std::optional<Fileset> FindFilesetByKey(const std::string& key) = 0;
  virtual std::optional<Fileset> GetFileset(uint64_t id) = 0;
  virtual std::vector<Fileset> ListFilesets() = 0;
  virtual std::vector<Blockset> ListBlocksets(uint64_t fileset_id) = 0;
  // Blocks of every Fileset stored in |package_key|, ordered by start offset.
  virtual std::vector<Blockset> ListPackageBlocksets(const std::string& package_key) = 0;

  // Throws State/kNotFound for an unknown id. See FilesetRemoval for shadow promotion.
  virtual FilesetRemoval DeleteFileset(uint64_t id) = 0;
  virtual void RelocatePackage(const PackageRelocation& relocation) = 0;

  virtual RootPackage GetOrOpenRootPackage(const std::string& category) = 0;
  virtual void SealRootPackage(const std::string& key) = 0;
  virtual std::optional<RootPackage> GetRootPackage(const std::string& key) = 0;
  virtual std::vector<RootPackage> ListRootPackages() = 0;
  virtual std::vector<RootFileset> ListRootFilesets(const std::string& package_key) = 0;
};

// Mutex-protected in-memory store. Every mutation is first handed to Persist(); the
// in-memory view is changed only after Persist() returns, so a failed write never
// leaves the view ahead of durable state.
class InMemoryMetadataStore : public MetadataStore {
public:
  InMemoryMetadataStore() = default;
  ~InMemoryMetadataStore() override = default;

  Fileset InsertFileset(Fileset fileset) override;
  void InsertBlocksets(std::vector<Blockset> blocksets) override;
  void InsertRootFileset(RootFileset root_fileset) override;
  std::optional<Fileset> Commit(FileCommit commit) override;

  std::optional<Fileset> FindFilesetByHash(const std::string& hash) override;
  std::optional<Fileset> FindFilesetByKey(const std::string& key) override;
  std::optional<Fileset> GetFileset(uint64_t id) override;
  std::vector<Fileset> ListFilesets() override;
  std::vector<Blockset> ListBlocksets(uint64_t fileset_id) override;
  std::vector<Blockset> ListPackageBlocksets(const std::string& package_key) override;

  FilesetRemoval DeleteFileset(uint64_t id) override;
  void RelocatePackage(const PackageRelocation& relocation) override;

  RootPackage GetOrOpenRootPackage(const std::string& category) override;
  void SealRootPackage(const std::string& key) override;
  std::optional<RootPackage> GetRootPackage(const std::string& key) override;
  std::vector<RootPackage> ListRootPackages() override;
  std::vector<RootFileset> ListRootFilesets(const std::string& package_key) override;

protected:
  enum class MutationKind : uint8_t {
    kCommit = 1,
    kOpenPackage = 2,
    kSealPackage = 3,
    kDeleteFileset = 4,
    kRelocatePackage = 5,
  };

  // Durability hook, called with the store lock held and all ids already assigned.
  virtual void PersistCommit(const FileCommit& applied) { (void)applied; }
  virtual void PersistOpenPackage(const RootPackage& package) { (void)package; }
  virtual void PersistSealPackage(const std::string& key) { (void)key; }
  virtual void PersistDeleteFileset(uint64_t id) { (void)id; }
  virtual void PersistRelocatePackage(const PackageRelocation& relocation) { (void)relocation; }

  // Replay helpers for subclasses that load durable state; they bypass Persist*().
  void ReplayCommit(const FileCommit& applied);
  void ReplayOpenPackage(const RootPackage& package);
  void ReplaySealPackage(const std::string& key);
  void ReplayDeleteFileset(uint64_t id);
  void ReplayRelocatePackage(const PackageRelocation& relocation);

private:
  FileCommit AssignIdsLocked(FileCommit commit);
  void ValidateCommitLocked(const FileCommit& commit) const;
  void ApplyCommitLocked(const FileCommit& applied);
  void ApplyOpenPackageLocked(const RootPackage& package);
  void ApplySealPackageLocked(const std::string& key);
  FilesetRemoval ApplyDeleteLocked(uint64_t id);
  void ValidateRelocationLocked(const PackageRelocation& relocation) const;
  void ApplyRelocationLocked(const PackageRelocation& relocation);
  std::vector<Blockset> PackageBlocksetsLocked(const std::string& package_key) const;

  std::mutex mutex_;
  std::map<uint64_t, Fileset> filesets_;
  std::unordered_map<std::string, uint64_t> canonical_by_hash_;
  // Ids per logical key; the highest id is the most recent commit.
  std::unordered_map<std::string, std::set<uint64_t>> ids_by_key_;
  // Shadow ids per canonical id.
  std::unordered_map<uint64_t, std::set<uint64_t>> shadows_;
  std::unordered_map<uint64_t, std::vector<Blockset>> blocksets_;
  // Ids of the Filesets with blocks in each package.
  std::unordered_map<std::string, std::set<uint64_t>> package_owners_;
  std::map<std::string, RootPackage> packages_;
  std::unordered_map<std::string, std::string> open_by_category_;
  std::unordered_map<std::string, uint64_t> next_index_by_category_;
  std::unordered_map<std::string, std::vector<RootFileset>> root_filesets_;
  uint64_t next_fileset_id_{1};
  uint64_t next_blockset_id_{1};
  uint64_t next_package_id_{1};
  uint64_t next_root_fileset_id_{1};
};

} // namespace pv::metadata
