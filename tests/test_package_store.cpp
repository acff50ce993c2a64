#include "pv/error.h"
#include "pv/log/event_bus.h"
#include "pv/metadata/metadata_store.h"
#include "pv/storage/blob_store.h"
#include "pv/storage/package_store.h"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace {

  void Expect(bool condition, const std::string& message) {
    if (!condition) {
      std::cerr << message << std::endl;
      std::abort();
    }
  }

  class TempDir {
  public:
    TempDir() {
      std::random_device rd;
      path_ = std::filesystem::temp_directory_path() /
              ("pv_package_" + std::to_string(rd()) + "_" + std::to_string(rd()));
      std::filesystem::create_directories(path_);
    }
    ~TempDir() {
      std::error_code ec;
      std::filesystem::remove_all(path_, ec);
    }
    const std::filesystem::path& path() const { return path_; }

  private:
    std::filesystem::path path_;
  };

  // Fails the first |failures| appends with the given retryability, then delegates.
  class FlakyBlobStore : public pv::storage::BlobStore {
  public:
    FlakyBlobStore(pv::storage::BlobStore& inner, int failures, pv::Retryability retry)
        : inner_(inner), remaining_(failures), retry_(retry) {}

    uint64_t Append(const std::string& key, std::span<const uint8_t> bytes) override {
      ++append_calls;
      if (remaining_ > 0) {
        --remaining_;
        throw pv::IoError(pv::errors::io::kBlobWriteFailed, "simulated append failure", EAGAIN,
                          retry_);
      }
      return inner_.Append(key, bytes);
    }
    std::vector<uint8_t> Read(const std::string& key, uint64_t offset, uint64_t length) override {
      return inner_.Read(key, offset, length);
    }
    uint64_t Size(const std::string& key) override { return inner_.Size(key); }
    bool Exists(const std::string& key) override { return inner_.Exists(key); }
    void Truncate(const std::string& key, uint64_t size) override { inner_.Truncate(key, size); }
    void Flush(const std::string& key) override { inner_.Flush(key); }
    void Remove(const std::string& key) override { inner_.Remove(key); }

    std::atomic<int> append_calls{0};

  private:
    pv::storage::BlobStore& inner_;
    std::atomic<int> remaining_;
    pv::Retryability retry_;
  };

  std::vector<uint8_t> Block(size_t size, uint8_t fill) { return std::vector<uint8_t>(size, fill); }

  // Commits a canonical Fileset whose blocks sit at |locations|; returns its id.
  uint64_t CommitFile(pv::metadata::MetadataStore& store, const std::string& key,
                      const std::vector<pv::storage::BlockLocation>& locations) {
    pv::metadata::FileCommit commit;
    pv::metadata::Fileset fileset;
    fileset.key = key;
    fileset.source_key = "/src/" + key;
    fileset.hash = "hash-" + key;
    uint32_t index = 0;
    for (const auto& location : locations) {
      pv::metadata::Blockset block;
      block.index = index++;
      block.hash = key + std::to_string(block.index);
      block.size = location.length();
      block.original_size = location.length();
      block.package_key = location.package_key;
      block.start_index = location.start_index;
      block.end_index = location.end_index;
      commit.blocksets.push_back(block);
      commit.packages.push_back(
          pv::metadata::PackageUpdate{location.package_key, location.end_index + 1});
      fileset.size += location.length();
    }
    pv::metadata::RootFileset root;
    root.package_key = locations.front().package_key;
    root.fileset_hash = fileset.hash;
    root.fileset_source_key = fileset.source_key;
    root.fileset_size = fileset.size;
    commit.root_filesets.push_back(root);
    commit.fileset = fileset;
    return store.Commit(commit)->id;
  }

  bool IsBusy(const pv::Error& err) {
    return err.domain == pv::ErrorDomain::State && err.code == pv::errors::state::kPackageBusy;
  }

  void TestCategories() {
    constexpr uint64_t kMiB = 1024 * 1024;
    Expect(pv::storage::CategoryForSize(0) == "a", "empty file is category a");
    Expect(pv::storage::CategoryForSize(1024) == "a", "1 KiB is category a");
    Expect(pv::storage::CategoryForSize(1025) == "b", "above 1 KiB is category b");
    Expect(pv::storage::CategoryForSize(100 * 1024 + 1) == "d", "above 100 KiB is category d");
    Expect(pv::storage::CategoryForSize(10 * kMiB) == "e", "10 MiB is category e");
    Expect(pv::storage::CategoryForSize(10 * kMiB + 1) == "f", "above 10 MiB up to ceiling is f");
    Expect(pv::storage::CategoryForSize(16 * kMiB + 1) == "g", "above ceiling is category g");
    Expect(pv::storage::CategoryForSize(1024ull * 1024 * kMiB) == "k", "1 TiB is category k");
    bool rejected = false;
    try {
      (void)pv::storage::CategoryForSize(1024ull * 1024 * kMiB + 1);
    } catch (const pv::Error& err) {
      rejected = err.code == pv::errors::validation::kFileTooLarge;
    }
    Expect(rejected, "files above 1 TiB must be rejected");
  }

  void TestPackageKeys() {
    Expect(pv::metadata::MakePackageKey("a", 0) == "a00/0", "key for index 0");
    Expect(pv::metadata::MakePackageKey("f", 10) == "f0a/10", "key for index 10");
    Expect(pv::metadata::MakePackageKey("c", 257) == "c01/257", "key wraps bucket at 256");
  }

  void TestLocalBlobStore() {
    TempDir dir;
    pv::storage::LocalBlobStore blobs(dir.path());
    Expect(!blobs.Exists("a00/0"), "fresh store has no blobs");
    Expect(blobs.Size("a00/0") == 0, "missing blob has size zero");
    Expect(blobs.Append("a00/0", Block(10, 1)) == 0, "first append at offset 0");
    Expect(blobs.Append("a00/0", Block(5, 2)) == 10, "second append follows the first");
    blobs.Flush("a00/0");
    Expect(blobs.Exists("a00/0") && blobs.Size("a00/0") == 15, "blob grows by appended bytes");
    Expect(std::filesystem::exists(dir.path() / "a00" / "0"), "key maps to a nested path");
    Expect(blobs.Read("a00/0", 10, 5) == Block(5, 2), "read returns appended bytes");
    blobs.Truncate("a00/0", 10);
    Expect(blobs.Size("a00/0") == 10, "truncate shrinks the blob");
    Expect(blobs.Append("a00/0", Block(3, 3)) == 10, "append after truncate starts at new end");

    bool missing = false;
    try {
      (void)blobs.Read("b00/0", 0, 1);
    } catch (const pv::IoError& err) {
      missing = err.code == pv::errors::io::kBlobMissing;
    }
    Expect(missing, "reading an absent blob must report it missing");

    bool short_read = false;
    try {
      (void)blobs.Read("a00/0", 10, 100);
    } catch (const pv::IoError& err) {
      short_read = err.code == pv::errors::io::kBlobReadFailed;
    }
    Expect(short_read, "reading past the end must fail");

    bool invalid = false;
    try {
      (void)blobs.Append("../escape", Block(1, 0));
    } catch (const pv::Error& err) {
      invalid = err.domain == pv::ErrorDomain::Validation;
    }
    Expect(invalid, "keys escaping the root must be rejected");
  }

  void TestSealingAndRotation() {
    TempDir dir;
    pv::storage::LocalBlobStore blobs(dir.path());
    pv::metadata::InMemoryMetadataStore store;
    pv::log::EventBus bus;
    std::vector<std::string> events;
    bus.Subscribe([&](const pv::log::Event& event) { events.push_back(event.event_id); });
    pv::storage::PackageStore packages(blobs, store, pv::storage::PackageOptions{1000, {}}, &bus);

    auto first = packages.Append("a", Block(400, 1));
    auto second = packages.Append("a", Block(400, 2));
    auto third = packages.Append("a", Block(400, 3));
    auto fourth = packages.Append("a", Block(400, 4));

    Expect(first.package_key == "a00/0" && first.start_index == 0 && first.end_index == 399,
           "first block location");
    Expect(second.package_key == "a00/0" && second.start_index == 400, "second block location");
    Expect(third.package_key == "a00/0" && third.start_index == 800 && third.end_index == 1199,
           "a block is never split across packages");
    Expect(fourth.package_key == "a01/1" && fourth.start_index == 0,
           "after the ceiling the next block lands in the next index");

    auto sealed = store.GetRootPackage("a00/0");
    Expect(sealed && sealed->sealed, "full package must be sealed");
    auto open = store.GetRootPackage("a01/1");
    Expect(open && !open->sealed && open->index == 1 && open->category == "a",
           "next package must be open with incremented index");
    Expect(blobs.Size("a00/0") == 1200, "sealed package receives no further bytes");

    Expect(packages.Read(third.package_key, third.start_index, third.end_index) == Block(400, 3),
           "read returns the stored block");

    bool saw_sealed = false;
    bool saw_opened = false;
    for (const auto& id : events) {
      saw_sealed = saw_sealed || id == "package_sealed";
      saw_opened = saw_opened || id == "package_opened";
    }
    Expect(saw_sealed && saw_opened, "rotation must publish package events");

    auto other = packages.Append("b", Block(10, 9));
    Expect(other.package_key == "b00/0", "categories rotate independently");
  }

  void TestOrphanReclaim() {
    TempDir dir;
    pv::storage::LocalBlobStore blobs(dir.path());
    pv::metadata::InMemoryMetadataStore store;
    std::string key;
    {
      pv::storage::PackageStore packages(blobs, store);
      auto committed = packages.Append("c", Block(100, 1));
      key = committed.package_key;
      pv::metadata::FileCommit commit;
      commit.packages.push_back(pv::metadata::PackageUpdate{key, committed.end_index + 1});
      store.Commit(commit);
      (void)packages.Append("c", Block(50, 2)); // never committed
    }
    Expect(blobs.Size(key) == 150, "uncommitted bytes are present before reclaim");

    pv::storage::PackageStore restarted(blobs, store);
    Expect(restarted.ReclaimOrphans("c") == 50, "reclaim removes only uncommitted bytes");
    Expect(blobs.Size(key) == 100, "package is cut back to its committed size");
    auto next = restarted.Append("c", Block(20, 3));
    Expect(next.package_key == key && next.start_index == 100,
           "appends continue after the committed size");

    pv::storage::PackageStore implicit(blobs, store);
    auto after = implicit.Append("c", Block(5, 4));
    Expect(after.start_index == 100, "first append in a process reclaims orphans");
  }

  void TestTransientRetry() {
    TempDir dir;
    pv::storage::LocalBlobStore local(dir.path());
    pv::metadata::InMemoryMetadataStore store;
    pv::log::EventBus bus;
    std::atomic<int> retries{0};
    bus.Subscribe([&](const pv::log::Event& event) {
      if (event.event_id == "io_retry") {
        ++retries;
      }
    });

    FlakyBlobStore flaky(local, 2, pv::Retryability::kTransient);
    pv::storage::PackageStore packages(flaky, store, pv::storage::PackageOptions{}, &bus);
    auto location = packages.Append("a", Block(64, 7));
    Expect(flaky.append_calls == 3, "transient failures must be retried");
    Expect(retries == 2, "each retry must be reported");
    Expect(packages.Read(location.package_key, location.start_index, location.end_index) ==
               Block(64, 7),
           "retried append stores the block once");
    Expect(local.Size(location.package_key) == 64, "failed attempts leave no partial bytes");

    FlakyBlobStore exhausted(local, 10, pv::Retryability::kTransient);
    pv::storage::PackageStore failing(exhausted, store,
                                      pv::storage::PackageOptions{pv::storage::kDefaultPackageCeiling,
                                                                  {2, std::chrono::milliseconds(1)}});
    bool threw = false;
    try {
      (void)failing.Append("a", Block(8, 1));
    } catch (const pv::IoError& err) {
      threw = err.retryability == pv::Retryability::kTransient;
    }
    Expect(threw && exhausted.append_calls == 3, "retries are bounded");

    FlakyBlobStore fatal(local, 1, pv::Retryability::kFatal);
    pv::storage::PackageStore no_retry(fatal, store);
    threw = false;
    try {
      (void)no_retry.Append("a", Block(8, 1));
    } catch (const pv::IoError&) {
      threw = true;
    }
    Expect(threw && fatal.append_calls == 1, "persistent failures are not retried");
  }

  void TestConcurrentAppends() {
    TempDir dir;
    pv::storage::LocalBlobStore blobs(dir.path());
    pv::metadata::InMemoryMetadataStore store;
    pv::storage::PackageStore packages(blobs, store, pv::storage::PackageOptions{64 * 1024, {}});

    std::mutex mutex;
    std::vector<std::pair<pv::storage::BlockLocation, uint8_t>> placed;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
      threads.emplace_back([&, t]() {
        for (int i = 0; i < 50; ++i) {
          const auto fill = static_cast<uint8_t>(t * 50 + i);
          auto location = packages.Append("d", Block(1000 + static_cast<size_t>(t), fill));
          std::lock_guard<std::mutex> lock(mutex);
          placed.emplace_back(location, fill);
        }
      });
    }
    for (auto& thread : threads) {
      thread.join();
    }
    for (const auto& [location, fill] : placed) {
      auto bytes = packages.Read(location.package_key, location.start_index, location.end_index);
      Expect(bytes == Block(static_cast<size_t>(location.length()), fill),
             "concurrent appends must not interleave within a block");
    }
    Expect(store.ListRootPackages().size() >= 3, "concurrent load must rotate packages");
  }

  void TestBlobRemove() {
    TempDir dir;
    pv::storage::LocalBlobStore blobs(dir.path());
    (void)blobs.Append("b00/0", Block(40, 1));
    blobs.Remove("b00/0");
    Expect(!blobs.Exists("b00/0"), "removed blob is gone");
    blobs.Remove("b00/0");
    Expect(blobs.Append("b00/0", Block(8, 2)) == 0, "append after remove starts a new blob");
    Expect(blobs.Read("b00/0", 0, 8) == Block(8, 2), "recreated blob holds only new bytes");
  }

  void TestRollbackFailureReported() {
    {
      std::ofstream device("/dev/full", std::ios::binary);
      if (!device) {
        std::cout << "skipping rollback failure test: /dev/full is not writable\n";
        return;
      }
    }
    TempDir dir;
    pv::log::EventBus bus;
    std::vector<pv::log::Event> events;
    bus.Subscribe([&](const pv::log::Event& event) { events.push_back(event); });
    pv::storage::LocalBlobStore blobs(dir.path(), &bus);
    std::filesystem::create_directories(dir.path() / "a00");
    // Writes to /dev/full fail with ENOSPC and a character device cannot be truncated.
    std::filesystem::create_symlink("/dev/full", dir.path() / "a00" / "0");

    bool failed = false;
    try {
      (void)blobs.Append("a00/0", Block(16, 1));
    } catch (const pv::IoError& err) {
      failed = err.code == pv::errors::io::kBlobWriteFailed;
    }
    Expect(failed, "write failure must surface as IoError");

    bool reported = false;
    for (const auto& event : events) {
      if (event.event_id != "append_rollback_failed") {
        continue;
      }
      for (const auto& field : event.fields) {
        reported = reported || (field.key == "package" && field.value == "a00/0");
      }
      Expect(event.severity == pv::log::EventSeverity::kError, "rollback failure is an error");
    }
    Expect(reported, "failed rollback must be published on the event bus");
  }

  void TestWriteLeaseBlocksReclaim() {
    TempDir dir;
    pv::storage::LocalBlobStore blobs(dir.path());
    pv::metadata::InMemoryMetadataStore store;
    pv::storage::PackageStore packages(blobs, store);
    const auto committed = packages.Append("c", Block(100, 1));
    CommitFile(store, "kept", {committed});

    {
      const auto lease = packages.BeginWrite("c");
      const auto pending = packages.Append("c", Block(50, 2));
      Expect(pending.start_index == 100, "in-flight block follows committed bytes");

      bool busy = false;
      try {
        (void)packages.ReclaimOrphans("c");
      } catch (const pv::Error& err) {
        busy = IsBusy(err);
      }
      Expect(busy, "reclaim must refuse while a writer holds uncommitted blocks");
      busy = false;
      try {
        (void)packages.Compact(committed.package_key);
      } catch (const pv::Error& err) {
        busy = IsBusy(err);
      }
      Expect(busy, "compaction must refuse while a writer is active");
      Expect(blobs.Size(committed.package_key) == 150, "in-flight bytes are left in place");
    }

    Expect(packages.ReclaimOrphans("c") == 50, "reclaim runs once the writer is gone");
    Expect(blobs.Size(committed.package_key) == 100, "uncommitted bytes removed after release");
  }

  void TestCompaction() {
    TempDir dir;
    pv::storage::LocalBlobStore blobs(dir.path());
    pv::metadata::InMemoryMetadataStore store;
    pv::log::EventBus bus;
    std::vector<std::string> events;
    bus.Subscribe([&](const pv::log::Event& event) { events.push_back(event.event_id); });
    pv::storage::PackageStore packages(blobs, store, pv::storage::PackageOptions{}, &bus);

    const auto first = packages.Append("a", Block(100, 1));
    const auto second = packages.Append("a", Block(100, 2));
    const auto third = packages.Append("a", Block(100, 3));
    const auto one = CommitFile(store, "one", {first, third});
    const auto two = CommitFile(store, "two", {second});
    const std::string key = first.package_key;

    auto unchanged = packages.Compact(key);
    Expect(unchanged.generation == 0 && unchanged.reclaimed() == 0,
           "a package without dead blocks is left alone");

    store.DeleteFileset(one);
    const auto result = packages.Compact(key);
    Expect(result.generation == 1 && result.live_blocks == 1 && result.bytes_before == 300 &&
               result.bytes_after == 100 && result.reclaimed() == 200,
           "compaction keeps only live blocks");
    const auto package = store.GetRootPackage(key);
    Expect(package->size == 100 && package->generation == 1, "package records the new layout");
    const auto blocks = store.ListBlocksets(two);
    Expect(blocks.size() == 1 && blocks[0].start_index == 0 && blocks[0].end_index == 99,
           "surviving block moves to the front");
    Expect(packages.Read(key, 0, 99) == Block(100, 2), "surviving block reads back");
    Expect(!blobs.Exists(key), "previous generation is removed");
    Expect(blobs.Size(pv::storage::BlobKeyFor(key, 1)) == 100, "new generation holds live bytes");

    const auto next = packages.Append("a", Block(30, 4));
    Expect(next.package_key == key && next.start_index == 100,
           "appends continue in the compacted package");
    Expect(blobs.Size(pv::storage::BlobKeyFor(key, 1)) == 130, "append lands in the new blob");
    Expect(std::find(events.begin(), events.end(), "package_compacted") != events.end(),
           "compaction is published");

    bool missing = false;
    try {
      (void)packages.Compact("z00/0");
    } catch (const pv::Error& err) {
      missing = err.code == pv::errors::state::kNotFound;
    }
    Expect(missing, "compacting an unknown package is NotFound");
  }

} // namespace

int main() {
  TestCategories();
  TestPackageKeys();
  TestLocalBlobStore();
  TestSealingAndRotation();
  TestOrphanReclaim();
  TestTransientRetry();
  TestConcurrentAppends();
  TestBlobRemove();
  TestRollbackFailureReported();
  TestWriteLeaseBlocksReclaim();
  TestCompaction();
  std::cout << "package store test ok\n";
  return 0;
}
