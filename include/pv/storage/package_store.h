#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <vector>

#include "pv/log/event_bus.h"
#include "pv/metadata/metadata_store.h"
#include "pv/storage/blob_store.h"
#include "pv/storage/io_retry.h"

namespace pv::storage {

inline constexpr uint64_t kDefaultPackageCeiling = 16ull * 1024 * 1024;

struct PackageOptions {
  uint64_t ceiling{kDefaultPackageCeiling};
  RetryPolicy retry{};
};

struct BlockLocation {
  std::string package_key;
  uint64_t start_index{0};
  uint64_t end_index{0}; // inclusive

  uint64_t length() const noexcept { return end_index - start_index + 1; }
  bool operator==(const BlockLocation&) const = default;
};

// Category letter for a file of |size| bytes. Files above 1 TiB raise a validation error.
std::string CategoryForSize(uint64_t size, uint64_t ceiling = kDefaultPackageCeiling);

// Blob holding a package's bytes: the package key itself for generation 0, and
// "<key>.g<generation>" once compaction has rewritten it.
std::string BlobKeyFor(const std::string& package_key, uint64_t generation);
inline std::string BlobKeyFor(const metadata::RootPackage& package) {
  return BlobKeyFor(package.key, package.generation);
}

struct CompactionResult {
  std::string package_key;
  uint64_t generation{0};
  uint64_t live_blocks{0};
  uint64_t bytes_before{0};
  uint64_t bytes_after{0};

  uint64_t reclaimed() const noexcept { return bytes_before - bytes_after; }
};

// Packs encoded blocks into category-sharded, append-only containers. One open package per
// category; appends and rotation for a category run under that category's mutex.
class PackageStore {
private:
  struct CategoryState;

public:
  // Marks a writer whose appended blocks are not committed yet. While any lease on a category
  // is held, ReclaimOrphans() and Compact() refuse to touch that category.
  class WriteLease {
  public:
    WriteLease() = default;
    WriteLease(WriteLease&& other) noexcept;
    WriteLease& operator=(WriteLease&& other) noexcept;
    ~WriteLease();

    WriteLease(const WriteLease&) = delete;
    WriteLease& operator=(const WriteLease&) = delete;

  private:
    friend class PackageStore;
    explicit WriteLease(CategoryState* state) : state_(state) {}
    void Release() noexcept;

    CategoryState* state_{nullptr};
  };

  PackageStore(BlobStore& blobs, metadata::MetadataStore& store, PackageOptions options = {},
               log::EventBus* bus = nullptr);

  PackageStore(const PackageStore&) = delete;
  PackageStore& operator=(const PackageStore&) = delete;

  WriteLease BeginWrite(const std::string& category);

  BlockLocation Append(const std::string& category, std::span<const uint8_t> encoded);

  // |end| is inclusive. Readers rely on committed metadata for the range.
  std::vector<uint8_t> Read(const std::string& package_key, uint64_t start, uint64_t end);

  // Cuts bytes past the committed size of the category's open package. Returns the number of
  // bytes removed. Runs automatically on the first append to a category. Throws
  // State/kPackageBusy while a WriteLease on the category is held.
  uint64_t ReclaimOrphans(const std::string& category);

  // Rewrites the package with only the blocks committed metadata still references, records
  // the new layout and drops the previous copy. Throws State/kPackageBusy while a WriteLease
  // on the package's category is held.
  CompactionResult Compact(const std::string& package_key);

  // Makes the listed packages durable before their metadata is committed.
  void Flush(const std::vector<std::string>& package_keys);

  const PackageOptions& options() const noexcept { return options_; }

private:
  struct CategoryState {
    std::mutex mutex;
    bool initialized{false};
    std::string open_key;
    std::string open_blob;
    uint64_t physical_size{0};
    int writers{0};
  };

  CategoryState& StateFor(const std::string& category);
  void RequireIdleLocked(const std::string& category, const CategoryState& state) const;
  metadata::RootPackage RequirePackage(const std::string& package_key);
  void EnsureOpenLocked(const std::string& category, CategoryState& state);
  uint64_t ReclaimLocked(const std::string& category, CategoryState& state);
  void RotateLocked(const std::string& category, CategoryState& state);
  void PublishPackageEvent(const char* event_id, const std::string& message,
                           const metadata::RootPackage& package, uint64_t size);

  BlobStore& blobs_;
  metadata::MetadataStore& store_;
  PackageOptions options_;
  log::EventBus* bus_;
  std::mutex states_mutex_;
  std::map<std::string, std::unique_ptr<CategoryState>> states_;
};

} // namespace pv::storage
