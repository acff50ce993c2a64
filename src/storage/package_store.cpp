#include "pv/storage/package_store.h"

#include <algorithm>
#include <array>
#include <string>
#include <utility>

#include "pv/error.h"

namespace pv::storage {

namespace {

constexpr uint64_t kKiB = 1024;
constexpr uint64_t kMiB = 1024 * kKiB;
constexpr uint64_t kGiB = 1024 * kMiB;
constexpr uint64_t kTiB = 1024 * kGiB;

struct CategoryBound {
  uint64_t limit;
  const char* name;
};

} // namespace

std::string CategoryForSize(uint64_t size, uint64_t ceiling) {
  // "f" spans from 10 MiB up to the package ceiling; a small ceiling leaves it empty.
  const uint64_t f_limit = std::max(ceiling, 10 * kMiB);
  const std::array<CategoryBound, 11> bounds{{{kKiB, "a"},
                                              {10 * kKiB, "b"},
                                              {100 * kKiB, "c"},
                                              {kMiB, "d"},
                                              {10 * kMiB, "e"},
                                              {f_limit, "f"},
                                              {100 * kMiB, "g"},
                                              {kGiB, "h"},
                                              {10 * kGiB, "i"},
                                              {100 * kGiB, "j"},
                                              {kTiB, "k"}}};
  for (const auto& bound : bounds) {
    if (size <= bound.limit) {
      return bound.name;
    }
  }
  throw Error{ErrorDomain::Validation, errors::validation::kFileTooLarge,
              "file of " + std::to_string(size) + " bytes exceeds the largest category"};
}

std::string BlobKeyFor(const std::string& package_key, uint64_t generation) {
  if (generation == 0) {
    return package_key;
  }
  return package_key + ".g" + std::to_string(generation);
}

PackageStore::WriteLease::WriteLease(WriteLease&& other) noexcept
    : state_(std::exchange(other.state_, nullptr)) {}

PackageStore::WriteLease& PackageStore::WriteLease::operator=(WriteLease&& other) noexcept {
  if (this != &other) {
    Release();
    state_ = std::exchange(other.state_, nullptr);
  }
  return *this;
}

PackageStore::WriteLease::~WriteLease() { Release(); }

void PackageStore::WriteLease::Release() noexcept {
  if (state_ == nullptr) {
    return;
  }
  std::lock_guard<std::mutex> lock(state_->mutex);
  --state_->writers;
  state_ = nullptr;
}

PackageStore::PackageStore(BlobStore& blobs, metadata::MetadataStore& store,
                           PackageOptions options, log::EventBus* bus)
    : blobs_(blobs), store_(store), options_(options), bus_(bus) {
  if (options_.ceiling == 0) {
    throw Error{ErrorDomain::Config, errors::config::kInvalidValue,
                "package ceiling must be positive"};
  }
}

PackageStore::CategoryState& PackageStore::StateFor(const std::string& category) {
  std::lock_guard<std::mutex> lock(states_mutex_);
  auto& slot = states_[category];
  if (!slot) {
    slot = std::make_unique<CategoryState>();
  }
  return *slot;
}

void PackageStore::EnsureOpenLocked(const std::string& category, CategoryState& state) {
  if (state.initialized) {
    return;
  }
  ReclaimLocked(category, state);
  state.initialized = true;
}

PackageStore::WriteLease PackageStore::BeginWrite(const std::string& category) {
  auto& state = StateFor(category);
  std::lock_guard<std::mutex> lock(state.mutex);
  ++state.writers;
  return WriteLease(&state);
}

void PackageStore::RequireIdleLocked(const std::string& category,
                                     const CategoryState& state) const {
  if (state.writers > 0) {
    throw Error{ErrorDomain::State, errors::state::kPackageBusy,
                "category " + category + " has " + std::to_string(state.writers) +
                    " writer(s) with uncommitted blocks"};
  }
}

uint64_t PackageStore::ReclaimLocked(const std::string& category, CategoryState& state) {
  const metadata::RootPackage package = store_.GetOrOpenRootPackage(category);
  state.open_key = package.key;
  state.open_blob = BlobKeyFor(package);
  const uint64_t physical = RetryTransient(options_.retry, bus_, "size",
                                           [&] { return blobs_.Size(state.open_blob); });
  uint64_t reclaimed = 0;
  if (physical > package.size) {
    RetryTransient(options_.retry, bus_, "truncate",
                   [&] { blobs_.Truncate(state.open_blob, package.size); });
    reclaimed = physical - package.size;
    PublishPackageEvent("orphans_reclaimed", "truncated unreferenced package tail", package,
                        reclaimed);
  }
  state.physical_size = package.size;
  if (state.physical_size >= options_.ceiling) {
    RotateLocked(category, state);
  }
  return reclaimed;
}

uint64_t PackageStore::ReclaimOrphans(const std::string& category) {
  auto& state = StateFor(category);
  std::lock_guard<std::mutex> lock(state.mutex);
  RequireIdleLocked(category, state);
  const uint64_t reclaimed = ReclaimLocked(category, state);
  state.initialized = true;
  return reclaimed;
}

void PackageStore::RotateLocked(const std::string& category, CategoryState& state) {
  store_.SealRootPackage(state.open_key);
  if (auto sealed = store_.GetRootPackage(state.open_key)) {
    PublishPackageEvent("package_sealed", "package reached its size ceiling", *sealed,
                        state.physical_size);
  }
  const metadata::RootPackage next = store_.GetOrOpenRootPackage(category);
  state.open_key = next.key;
  state.open_blob = BlobKeyFor(next);
  state.physical_size = RetryTransient(options_.retry, bus_, "size",
                                       [&] { return blobs_.Size(state.open_blob); });
  PublishPackageEvent("package_opened", "opened next package", next, state.physical_size);
}

BlockLocation PackageStore::Append(const std::string& category,
                                   std::span<const uint8_t> encoded) {
  if (encoded.empty()) {
    throw Error{ErrorDomain::Validation, errors::validation::kInvalidRange,
                "cannot append an empty block"};
  }
  auto& state = StateFor(category);
  std::lock_guard<std::mutex> lock(state.mutex);
  EnsureOpenLocked(category, state);
  if (state.physical_size >= options_.ceiling) {
    RotateLocked(category, state);
  }

  const std::string blob = state.open_blob;
  const uint64_t offset = RetryTransient(options_.retry, bus_, "append",
                                         [&] { return blobs_.Append(blob, encoded); });
  state.physical_size = offset + encoded.size();

  BlockLocation location{state.open_key, offset, offset + encoded.size() - 1};
  if (state.physical_size >= options_.ceiling) {
    RotateLocked(category, state);
  }
  return location;
}

std::vector<uint8_t> PackageStore::Read(const std::string& package_key, uint64_t start,
                                        uint64_t end) {
  if (end < start) {
    throw Error{ErrorDomain::Validation, errors::validation::kInvalidRange,
                "invalid range " + std::to_string(start) + ".." + std::to_string(end) +
                    " in package " + package_key};
  }
  const std::string blob = BlobKeyFor(RequirePackage(package_key));
  return RetryTransient(options_.retry, bus_, "read", [&] {
    return blobs_.Read(blob, start, end - start + 1);
  });
}

void PackageStore::Flush(const std::vector<std::string>& package_keys) {
  for (const auto& key : package_keys) {
    const std::string blob = BlobKeyFor(RequirePackage(key));
    RetryTransient(options_.retry, bus_, "flush", [&] { blobs_.Flush(blob); });
  }
}

metadata::RootPackage PackageStore::RequirePackage(const std::string& package_key) {
  auto package = store_.GetRootPackage(package_key);
  if (!package) {
    throw Error{ErrorDomain::State, errors::state::kNotFound, "unknown package " + package_key};
  }
  return *package;
}

CompactionResult PackageStore::Compact(const std::string& package_key) {
  auto& state = StateFor(RequirePackage(package_key).category);
  std::lock_guard<std::mutex> lock(state.mutex);
  const metadata::RootPackage package = RequirePackage(package_key);
  RequireIdleLocked(package.category, state);

  const auto live = store_.ListPackageBlocksets(package_key);
  CompactionResult result;
  result.package_key = package_key;
  result.generation = package.generation;
  result.live_blocks = live.size();
  result.bytes_before = package.size;
  result.bytes_after = package.size;
  uint64_t live_bytes = 0;
  for (const auto& block : live) {
    live_bytes += block.size;
  }
  if (live_bytes == package.size) {
    return result;
  }

  const std::string old_blob = BlobKeyFor(package);
  metadata::PackageRelocation relocation;
  relocation.key = package_key;
  relocation.generation = package.generation + 1;
  const std::string new_blob = BlobKeyFor(package_key, relocation.generation);
  if (!live.empty()) {
    // Clears whatever an interrupted compaction left under the new generation.
    RetryTransient(options_.retry, bus_, "truncate", [&] { blobs_.Truncate(new_blob, 0); });
    for (const auto& block : live) {
      const auto bytes = RetryTransient(options_.retry, bus_, "read", [&] {
        return blobs_.Read(old_blob, block.start_index, block.size);
      });
      const uint64_t offset = RetryTransient(options_.retry, bus_, "append",
                                             [&] { return blobs_.Append(new_blob, bytes); });
      relocation.moves.push_back(metadata::BlockMove{block.id, offset});
      relocation.size = offset + bytes.size();
    }
    RetryTransient(options_.retry, bus_, "flush", [&] { blobs_.Flush(new_blob); });
  }
  store_.RelocatePackage(relocation);
  if (state.initialized && state.open_key == package_key) {
    state.open_blob = new_blob;
    state.physical_size = relocation.size;
  }
  RetryTransient(options_.retry, bus_, "remove", [&] { blobs_.Remove(old_blob); });

  result.generation = relocation.generation;
  result.bytes_after = relocation.size;
  auto compacted = package;
  compacted.generation = relocation.generation;
  PublishPackageEvent("package_compacted", "rewrote package without released blocks", compacted,
                      result.reclaimed());
  return result;
}

void PackageStore::PublishPackageEvent(const char* event_id, const std::string& message,
                                       const metadata::RootPackage& package, uint64_t size) {
  log::Event event;
  event.category = log::EventCategory::kStorage;
  event.severity = log::EventSeverity::kInfo;
  event.event_id = event_id;
  event.message = message;
  event.fields.emplace_back("package", package.key);
  event.fields.emplace_back("category", package.category);
  event.fields.emplace_back("bytes", std::to_string(size), log::FieldPrivacy::kPublic, true);
  log::Publish(bus_, std::move(event));
}

} // namespace pv::storage
