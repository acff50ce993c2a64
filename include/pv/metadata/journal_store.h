#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

#include "pv/metadata/metadata_store.h"

namespace pv::metadata {

// Largest frame body the journal reads or writes.
inline constexpr size_t kJournalMaxFrameBody = 256u * 1024 * 1024;
inline constexpr size_t kJournalDefaultFrameBody = 16u * 1024 * 1024;

// InMemoryMetadataStore backed by an append-only journal. Each mutation is one framed,
// SHA-256 checksummed record that is fsynced before the in-memory view changes. A mutation
// larger than |max_frame_body| is split into a run of fragment frames written in one append.
// Opening replays the journal. A torn final frame is cut off; damage before the final frame
// raises IntegrityError (kJournalCorrupt) and leaves the file untouched.
class JournalMetadataStore : public InMemoryMetadataStore {
public:
  explicit JournalMetadataStore(std::filesystem::path path,
                                size_t max_frame_body = kJournalDefaultFrameBody);
  ~JournalMetadataStore() override;

  JournalMetadataStore(const JournalMetadataStore&) = delete;
  JournalMetadataStore& operator=(const JournalMetadataStore&) = delete;

  const std::filesystem::path& path() const noexcept { return path_; }
  uint64_t replayed_records() const noexcept { return replayed_records_; }
  uint64_t discarded_tail_bytes() const noexcept { return discarded_tail_bytes_; }

protected:
  void PersistCommit(const FileCommit& applied) override;
  void PersistOpenPackage(const RootPackage& package) override;
  void PersistSealPackage(const std::string& key) override;
  void PersistDeleteFileset(uint64_t id) override;
  void PersistRelocatePackage(const PackageRelocation& relocation) override;

private:
  void Load();
  void ReplayRecord(std::span<const uint8_t> body);
  void AppendRecord(MutationKind kind, const std::vector<uint8_t>& payload);

  std::filesystem::path path_;
  size_t max_frame_body_;
  int fd_{-1};
  uint64_t replayed_records_{0};
  uint64_t discarded_tail_bytes_{0};
};

} // namespace pv::metadata
