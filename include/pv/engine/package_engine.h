#pragma once

#include <cstdint>
#include <exception>
#include <filesystem>
#include <optional>
#include <ostream>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "pv/codec/block_encoder.h"
#include "pv/config/job_config.h"
#include "pv/core/cancellation.h"
#include "pv/core/worker_pool.h"
#include "pv/engine/dedup_index.h"
#include "pv/engine/metadata_coordinator.h"
#include "pv/log/event_bus.h"
#include "pv/metadata/metadata_store.h"
#include "pv/storage/blob_store.h"
#include "pv/storage/package_store.h"

namespace pv::engine {

struct ProcessOptions {
  // Logical key for the Fileset; the source path when empty.
  std::string key;
  core::CancellationToken cancel;
};

struct FileResult {
  std::filesystem::path path;
  std::optional<metadata::Fileset> fileset;
  std::exception_ptr error;
  std::string message;

  bool ok() const noexcept { return fileset.has_value(); }
};

// What RestorePackage() does when a destination file already exists.
enum class ConflictPolicy : uint8_t {
  kSkip,
  kOverwrite,
  kRename, // "name (1).ext", "name (2).ext", ...
};

const char* ConflictPolicyName(ConflictPolicy policy);
std::optional<ConflictPolicy> ParseConflictPolicy(std::string_view name);

struct RestoredFile {
  metadata::RootFileset entry;
  std::filesystem::path destination;
  bool skipped{false};
  std::exception_ptr error;
  std::string message;

  bool ok() const noexcept { return !error; }
};

struct DeleteOutcome {
  metadata::FilesetRemoval removal;
  std::vector<storage::CompactionResult> compactions;
};

// Ingest and restore entry points over one blob store and one metadata store. The stores
// and the event bus are owned by the caller and must outlive the engine.
class PackageEngine {
public:
  PackageEngine(config::JobConfig config, storage::BlobStore& blobs,
                metadata::MetadataStore& store, log::EventBus* bus = nullptr);
  ~PackageEngine();

  PackageEngine(const PackageEngine&) = delete;
  PackageEngine& operator=(const PackageEngine&) = delete;

  // Chunks, deduplicates, encodes and packs one file and commits its records as one unit.
  // Content already stored under the same hash yields a shadow Fileset.
  metadata::Fileset ProcessFile(const std::filesystem::path& path,
                                const ProcessOptions& options = {});

  // Processes files concurrently. Each result carries either the Fileset or the error of
  // that file alone.
  std::vector<FileResult> ProcessFiles(const std::vector<std::filesystem::path>& paths,
                                       const core::CancellationToken& cancel = {});

  std::vector<uint8_t> Reconstruct(const std::string& fileset_key);
  // Streams the file to |out|; on failure |out| may hold a prefix of the content.
  void ReconstructTo(const std::string& fileset_key, std::ostream& out);
  std::vector<uint8_t> ReconstructById(uint64_t fileset_id);
  // Runs the restore path without keeping the bytes. Throws IntegrityError on corruption.
  void Verify(const std::string& fileset_key);

  // Restores every file recorded in |package_key| into |directory| under the file name of its
  // source path. Each file is written to "<name>.part", verified, then moved into place
  // according to |policy|. Results are per file, like ProcessFiles().
  std::vector<RestoredFile> RestorePackage(const std::string& package_key,
                                           const std::filesystem::path& directory,
                                           ConflictPolicy policy);

  // Removes the newest Fileset stored under |fileset_key|. Released blocks are dropped from
  // their packages when |compact| is set.
  DeleteOutcome DeleteFileset(const std::string& fileset_key, bool compact = true);
  DeleteOutcome DeleteFilesetById(uint64_t fileset_id, bool compact = true);
  storage::CompactionResult CompactPackage(const std::string& package_key);

  const config::JobConfig& config() const noexcept { return config_; }
  storage::PackageStore& packages() noexcept { return packages_; }
  DedupIndex& dedup() noexcept { return dedup_; }

private:
  metadata::Fileset StoreContent(const std::filesystem::path& path,
                                 const metadata::Fileset& draft, const std::string& category,
                                 const core::CancellationToken& cancel);
  metadata::Fileset ResolveCanonical(const metadata::Fileset& fileset);
  metadata::Fileset RequireByKey(const std::string& fileset_key);
  void RestoreFileset(const metadata::Fileset& requested, std::ostream* out);
  void RestoreEntry(const metadata::RootFileset& entry, const std::filesystem::path& directory,
                    ConflictPolicy policy, RestoredFile& result);
  DeleteOutcome DeleteLocked(uint64_t fileset_id, bool compact);
  void PublishFileEvent(const char* event_id, log::EventSeverity severity,
                        const std::string& message, const metadata::Fileset& fileset);

  config::JobConfig config_;
  storage::BlobStore& blobs_;
  metadata::MetadataStore& store_;
  log::EventBus* bus_;
  codec::BlockEncoder encoder_;
  storage::PackageStore packages_;
  MetadataCoordinator coordinator_;
  DedupIndex dedup_;
  // Shared by ingest and restore; held exclusively while blocks are deleted or moved.
  std::shared_mutex maintenance_mutex_;
  // Declared last so worker threads stop before the members they use are destroyed.
  core::WorkerPool encode_pool_;
  core::WorkerPool file_pool_;
};

} // namespace pv::engine
