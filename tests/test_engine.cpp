#include "pv/config/job_config.h"
#include "pv/crypto/digest.h"
#include "pv/engine/package_engine.h"
#include "pv/error.h"
#include "pv/log/event_bus.h"
#include "pv/metadata/journal_store.h"
#include "pv/metadata/metadata_store.h"
#include "pv/storage/blob_store.h"
#include "pv/storage/package_store.h"

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <mutex>
#include <random>
#include <string>
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
              ("pv_engine_" + std::to_string(rd()) + "_" + std::to_string(rd()));
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

  std::vector<uint8_t> RandomBytes(size_t size, uint64_t seed) {
    std::mt19937_64 rng(seed);
    std::vector<uint8_t> out(size);
    for (auto& byte : out) {
      byte = static_cast<uint8_t>(rng());
    }
    return out;
  }

  void WriteFile(const std::filesystem::path& path, const std::vector<uint8_t>& data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    Expect(static_cast<bool>(out), "failed to write fixture " + path.string());
  }

  std::vector<uint8_t> ReadFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in),
                                std::istreambuf_iterator<char>());
  }

  std::string HashOf(const std::vector<uint8_t>& data) {
    pv::crypto::ContentHasher hasher;
    hasher.Update(data);
    return hasher.HexDigest();
  }

  pv::config::JobConfigBuilder SmallChunks() {
    std::vector<uint8_t> key(pv::config::kMasterKeySize, 0x11);
    pv::config::JobConfigBuilder builder;
    builder.SetChunkBounds(1024, 4096, 16384)
        .SetPackageCeiling(1024 * 1024)
        .SetEncodeThreads(4)
        .SetEncodeWindow(8)
        .SetKey(key);
    return builder;
  }

  uint64_t TotalPackageBytes(pv::metadata::MetadataStore& store, pv::storage::BlobStore& blobs) {
    uint64_t total = 0;
    for (const auto& package : store.ListRootPackages()) {
      total += blobs.Size(pv::storage::BlobKeyFor(package));
    }
    return total;
  }

  class EventRecorder {
  public:
    explicit EventRecorder(pv::log::EventBus& bus) {
      bus.Subscribe([this](const pv::log::Event& event) {
        std::lock_guard<std::mutex> lock(mutex_);
        ids_.push_back(event.event_id);
      });
    }
    size_t Count(const std::string& id) {
      std::lock_guard<std::mutex> lock(mutex_);
      return static_cast<size_t>(std::count(ids_.begin(), ids_.end(), id));
    }

  private:
    std::mutex mutex_;
    std::vector<std::string> ids_;
  };

  // Cancels |token| once |cancel_after| appends have landed.
  class CancellingBlobStore : public pv::storage::BlobStore {
  public:
    CancellingBlobStore(pv::storage::BlobStore& inner, pv::core::CancellationToken token,
                        int cancel_after)
        : inner_(inner), token_(std::move(token)), cancel_after_(cancel_after) {}

    uint64_t Append(const std::string& key, std::span<const uint8_t> bytes) override {
      const uint64_t offset = inner_.Append(key, bytes);
      if (++appends_ == cancel_after_) {
        token_.Cancel();
      }
      return offset;
    }
    std::vector<uint8_t> Read(const std::string& key, uint64_t offset, uint64_t length) override {
      return inner_.Read(key, offset, length);
    }
    uint64_t Size(const std::string& key) override { return inner_.Size(key); }
    bool Exists(const std::string& key) override { return inner_.Exists(key); }
    void Truncate(const std::string& key, uint64_t size) override { inner_.Truncate(key, size); }
    void Flush(const std::string& key) override { inner_.Flush(key); }
    void Remove(const std::string& key) override { inner_.Remove(key); }

  private:
    pv::storage::BlobStore& inner_;
    pv::core::CancellationToken token_;
    std::atomic<int> appends_{0};
    int cancel_after_;
  };

  void TestRoundTripSizes() {
    TempDir dir;
    pv::storage::LocalBlobStore blobs(dir.path() / "packages");
    pv::metadata::InMemoryMetadataStore store;
    pv::engine::PackageEngine engine(SmallChunks().Build(), blobs, store);

    const std::vector<size_t> sizes{0, 1, 1000, 4095, 100000, 3 * 1024 * 1024 + 17};
    for (size_t i = 0; i < sizes.size(); ++i) {
      const auto data = RandomBytes(sizes[i], 0x5EED + i);
      const auto path = dir.path() / ("file" + std::to_string(i));
      WriteFile(path, data);
      pv::engine::ProcessOptions options;
      options.key = "docs/file" + std::to_string(i);
      const auto fileset = engine.ProcessFile(path, options);
      Expect(fileset.size == data.size() && fileset.hash == HashOf(data),
             "Fileset records size and hash");
      Expect(!fileset.is_shadow && fileset.source_key == path.string(), "canonical with source");
      Expect(engine.Reconstruct(options.key) == data,
             "round trip of " + std::to_string(sizes[i]) + " bytes");
      const auto blocks = store.ListBlocksets(fileset.id);
      Expect(sizes[i] != 0 || blocks.empty(), "empty file stores no blocks");
      for (const auto& block : blocks) {
        Expect(block.original_size <= 16384, "blocks respect the maximum chunk size");
        Expect(block.encryption == pv::crypto::CipherType::AES_256_GCM &&
                   block.compression == pv::codec::CompressionType::Zlib,
               "blocks record codec settings");
      }
    }
    Expect(TotalPackageBytes(store, blobs) ==
               [&] {
                 uint64_t committed = 0;
                 for (const auto& package : store.ListRootPackages()) {
                   committed += package.size;
                 }
                 return committed;
               }(),
           "package files hold exactly the committed bytes");
  }

  void TestIdenticalFilesDeduplicate() {
    TempDir dir;
    pv::storage::LocalBlobStore blobs(dir.path() / "packages");
    pv::metadata::InMemoryMetadataStore store;
    pv::log::EventBus bus;
    EventRecorder events(bus);
    pv::engine::PackageEngine engine(SmallChunks().Build(), blobs, store, &bus);

    const auto data = RandomBytes(5 * 1024 * 1024, 0xB0B);
    WriteFile(dir.path() / "one.bin", data);
    WriteFile(dir.path() / "two.bin", data);

    const auto first = engine.ProcessFile(dir.path() / "one.bin");
    const uint64_t after_first = TotalPackageBytes(store, blobs);
    const auto second = engine.ProcessFile(dir.path() / "two.bin");
    Expect(first.hash == second.hash, "identical files share a hash");
    Expect(second.is_shadow && second.canonical_id == first.id, "second file is a shadow");
    Expect(TotalPackageBytes(store, blobs) == after_first, "shadow adds no package bytes");
    Expect(store.ListBlocksets(second.id).empty(), "shadow owns no blocks");
    Expect(engine.Reconstruct((dir.path() / "two.bin").string()) == data, "shadow restores");
    Expect(engine.ReconstructById(second.id) == data, "restore by id follows canonical");
    Expect(events.Count("file_stored") == 1 && events.Count("file_deduplicated") == 1,
           "store and dedup events published");
  }

  void TestCorruptionDetected() {
    TempDir dir;
    pv::storage::LocalBlobStore blobs(dir.path() / "packages");
    pv::metadata::InMemoryMetadataStore store;
    pv::log::EventBus bus;
    EventRecorder events(bus);
    pv::engine::PackageEngine engine(SmallChunks().Build(), blobs, store, &bus);

    const auto data = RandomBytes(200000, 0xC0DE);
    WriteFile(dir.path() / "victim.bin", data);
    pv::engine::ProcessOptions options;
    options.key = "victim";
    const auto fileset = engine.ProcessFile(dir.path() / "victim.bin", options);
    engine.Verify("victim");

    const auto blocks = store.ListBlocksets(fileset.id);
    Expect(blocks.size() > 2, "fixture spans several blocks");
    const auto& target = blocks[blocks.size() / 2];
    {
      std::fstream io(blobs.PathFor(target.package_key),
                      std::ios::binary | std::ios::in | std::ios::out);
      const auto offset = static_cast<std::streamoff>(target.start_index + 65);
      io.seekg(offset);
      char byte = 0;
      io.read(&byte, 1);
      byte = static_cast<char>(byte ^ 0x01);
      io.seekp(offset);
      io.write(&byte, 1);
      Expect(static_cast<bool>(io), "failed to corrupt package");
    }

    bool detected = false;
    try {
      engine.Reconstruct("victim");
    } catch (const pv::IntegrityError&) {
      detected = true;
    }
    Expect(detected, "flipped byte must fail restore");
    bool verify_failed = false;
    try {
      engine.Verify("victim");
    } catch (const pv::IntegrityError&) {
      verify_failed = true;
    }
    Expect(verify_failed, "verify must report corruption");
    Expect(events.Count("integrity_failure") == 2, "integrity failures published");
  }

  void TestWrongKeyRejected() {
    TempDir dir;
    pv::storage::LocalBlobStore blobs(dir.path() / "packages");
    pv::metadata::InMemoryMetadataStore store;
    const auto data = RandomBytes(30000, 0x7);
    WriteFile(dir.path() / "secret.bin", data);
    {
      pv::engine::PackageEngine engine(SmallChunks().Build(), blobs, store);
      pv::engine::ProcessOptions options;
      options.key = "secret";
      engine.ProcessFile(dir.path() / "secret.bin", options);
    }
    std::vector<uint8_t> other(pv::config::kMasterKeySize, 0x22);
    auto builder = SmallChunks();
    builder.SetKey(other);
    pv::engine::PackageEngine engine(builder.Build(), blobs, store);
    bool rejected = false;
    try {
      engine.Reconstruct("secret");
    } catch (const pv::IntegrityError& err) {
      rejected = err.code == pv::errors::integrity::kAuthenticationFailed;
    }
    Expect(rejected, "restore with another key must fail authentication");
  }

  void TestCancellation() {
    TempDir dir;
    pv::storage::LocalBlobStore local(dir.path() / "packages");
    pv::metadata::InMemoryMetadataStore store;
    const auto data = RandomBytes(300000, 0xCA);
    WriteFile(dir.path() / "big.bin", data);

    {
      pv::engine::PackageEngine engine(SmallChunks().Build(), local, store);
      pv::engine::ProcessOptions options;
      options.key = "early";
      options.cancel.Cancel();
      bool cancelled = false;
      try {
        engine.ProcessFile(dir.path() / "big.bin", options);
      } catch (const pv::CancellationError&) {
        cancelled = true;
      }
      Expect(cancelled, "pre-cancelled token stops ingest");
      Expect(!store.FindFilesetByKey("early").has_value(), "no Fileset after cancel");
    }

    pv::core::CancellationToken token;
    CancellingBlobStore cancelling(local, token, 3);
    {
      pv::engine::PackageEngine engine(SmallChunks().Build(), cancelling, store);
      pv::engine::ProcessOptions options;
      options.key = "midway";
      options.cancel = token;
      bool cancelled = false;
      try {
        engine.ProcessFile(dir.path() / "big.bin", options);
      } catch (const pv::CancellationError&) {
        cancelled = true;
      }
      Expect(cancelled, "cancel during append stops ingest");
      Expect(!store.FindFilesetByKey("midway").has_value(), "no Fileset after mid-way cancel");
      Expect(!store.FindFilesetByHash(HashOf(data)).has_value(), "no canonical entry left");
      Expect(TotalPackageBytes(store, local) > 0, "orphan bytes remain until reclaimed");
    }

    pv::log::EventBus bus;
    EventRecorder events(bus);
    pv::engine::PackageEngine engine(SmallChunks().Build(), local, store, &bus);
    const auto fileset = engine.ProcessFile(dir.path() / "big.bin");
    Expect(!fileset.is_shadow, "content stored after cancel is canonical");
    Expect(events.Count("orphans_reclaimed") == 1, "orphan bytes reclaimed on next use");
    uint64_t committed = 0;
    for (const auto& package : store.ListRootPackages()) {
      committed += package.size;
    }
    Expect(TotalPackageBytes(store, local) == committed, "no orphan bytes after reclaim");
    Expect(engine.Reconstruct((dir.path() / "big.bin").string()) == data, "restore after cancel");
  }

  void TestProcessFilesIsolation() {
    TempDir dir;
    pv::storage::LocalBlobStore blobs(dir.path() / "packages");
    pv::metadata::InMemoryMetadataStore store;
    pv::engine::PackageEngine engine(SmallChunks().SetFileThreads(3).Build(), blobs, store);

    const auto a = RandomBytes(50000, 1);
    const auto c = RandomBytes(70000, 3);
    WriteFile(dir.path() / "a.bin", a);
    WriteFile(dir.path() / "c.bin", c);
    const std::vector<std::filesystem::path> paths{dir.path() / "a.bin", dir.path() / "missing.bin",
                                                   dir.path() / "c.bin"};
    const auto results = engine.ProcessFiles(paths);
    Expect(results.size() == 3, "one result per input");
    Expect(results[0].ok() && results[2].ok(), "healthy files succeed");
    Expect(!results[1].ok() && results[1].error && !results[1].message.empty(),
           "missing file reports its own error");
    bool io_error = false;
    try {
      std::rethrow_exception(results[1].error);
    } catch (const pv::IoError& err) {
      io_error = err.code == pv::errors::io::kSourceOpenFailed && !err.context.empty();
    }
    Expect(io_error, "missing file surfaces as IoError with context");
    Expect(engine.Reconstruct(paths[0].string()) == a && engine.Reconstruct(paths[2].string()) == c,
           "other files unaffected");
  }

  void TestConcurrentDuplicates() {
    TempDir dir;
    pv::storage::LocalBlobStore blobs(dir.path() / "packages");
    pv::metadata::InMemoryMetadataStore store;
    pv::engine::PackageEngine engine(SmallChunks().SetFileThreads(4).Build(), blobs, store);

    const auto data = RandomBytes(400000, 0xD0);
    std::vector<std::filesystem::path> paths;
    for (int i = 0; i < 6; ++i) {
      paths.push_back(dir.path() / ("copy" + std::to_string(i)));
      WriteFile(paths.back(), data);
    }
    const auto results = engine.ProcessFiles(paths);
    int canonical = 0;
    for (const auto& result : results) {
      Expect(result.ok(), "every copy succeeds: " + result.message);
      if (!result.fileset->is_shadow) {
        ++canonical;
      }
    }
    Expect(canonical == 1, "identical content stored once");
    uint64_t committed = 0;
    for (const auto& package : store.ListRootPackages()) {
      committed += package.size;
    }
    const auto stored = store.FindFilesetByHash(HashOf(data));
    uint64_t encoded = 0;
    for (const auto& block : store.ListBlocksets(stored->id)) {
      encoded += block.size;
    }
    Expect(committed == encoded, "packages hold one copy of the content");
    for (const auto& path : paths) {
      Expect(engine.Reconstruct(path.string()) == data, "each copy restores");
    }
  }

  void TestSegmentedLargeFile() {
    TempDir dir;
    pv::storage::LocalBlobStore blobs(dir.path() / "packages");
    pv::metadata::InMemoryMetadataStore store;
    auto builder = SmallChunks();
    builder.SetLargeFileThreshold(256 * 1024).SetSegmentSize(64 * 1024);
    pv::engine::PackageEngine engine(builder.Build(), blobs, store);

    const auto data = RandomBytes(1024 * 1024 + 77, 0x1A);
    WriteFile(dir.path() / "large.bin", data);
    const auto fileset = engine.ProcessFile(dir.path() / "large.bin");
    const auto blocks = store.ListBlocksets(fileset.id);
    Expect(blocks.size() > 16, "large file is split into many blocks");
    uint64_t total = 0;
    for (const auto& block : blocks) {
      total += block.original_size;
    }
    Expect(total == data.size(), "segmented blocks cover the file");
    Expect(engine.Reconstruct((dir.path() / "large.bin").string()) == data,
           "segmented file round trip");
  }

  void TestMissingKeyLookup() {
    TempDir dir;
    pv::storage::LocalBlobStore blobs(dir.path() / "packages");
    pv::metadata::InMemoryMetadataStore store;
    pv::engine::PackageEngine engine(SmallChunks().Build(), blobs, store);
    bool not_found = false;
    try {
      engine.Reconstruct("nothing/here");
    } catch (const pv::Error& err) {
      not_found = err.domain == pv::ErrorDomain::State &&
                  err.code == pv::errors::state::kNotFound;
    }
    Expect(not_found, "unknown key reports not found");
    bool no_id = false;
    try {
      engine.ReconstructById(424242);
    } catch (const pv::Error& err) {
      no_id = err.code == pv::errors::state::kNotFound;
    }
    Expect(no_id, "unknown id reports not found");
  }

  void TestJournalRestart() {
    TempDir dir;
    const auto journal = dir.path() / "metadata.journal";
    const auto data = RandomBytes(120000, 0x99);
    WriteFile(dir.path() / "kept.bin", data);
    pv::storage::LocalBlobStore blobs(dir.path() / "packages");
    {
      pv::metadata::JournalMetadataStore store(journal);
      pv::engine::PackageEngine engine(SmallChunks().Build(), blobs, store);
      pv::engine::ProcessOptions options;
      options.key = "kept";
      engine.ProcessFile(dir.path() / "kept.bin", options);
    }
    pv::metadata::JournalMetadataStore store(journal);
    Expect(store.replayed_records() > 0, "journal replayed");
    pv::engine::PackageEngine engine(SmallChunks().Build(), blobs, store);
    Expect(engine.Reconstruct("kept") == data, "restore after restart");

    WriteFile(dir.path() / "again.bin", data);
    const auto again = engine.ProcessFile(dir.path() / "again.bin");
    Expect(again.is_shadow, "dedup index survives restart");
  }

  pv::engine::ProcessOptions Keyed(const std::string& key) {
    pv::engine::ProcessOptions options;
    options.key = key;
    return options;
  }

  template <class Fn>
  bool ThrowsNotFound(Fn&& fn) {
    try {
      fn();
    } catch (const pv::Error& err) {
      return err.domain == pv::ErrorDomain::State && err.code == pv::errors::state::kNotFound;
    }
    return false;
  }

  void TestDeletePromotesShadow() {
    TempDir dir;
    pv::storage::LocalBlobStore blobs(dir.path() / "packages");
    pv::metadata::InMemoryMetadataStore store;
    pv::log::EventBus bus;
    EventRecorder events(bus);
    pv::engine::PackageEngine engine(SmallChunks().Build(), blobs, store, &bus);

    const auto data = RandomBytes(200000, 0xDE1);
    WriteFile(dir.path() / "one.bin", data);
    WriteFile(dir.path() / "two.bin", data);
    const auto one = engine.ProcessFile(dir.path() / "one.bin", Keyed("one"));
    const auto two = engine.ProcessFile(dir.path() / "two.bin", Keyed("two"));
    Expect(two.is_shadow, "second copy is a shadow");
    const uint64_t stored = TotalPackageBytes(store, blobs);

    const auto outcome = engine.DeleteFileset("one");
    Expect(outcome.removal.removed.id == one.id, "canonical removed");
    Expect(outcome.removal.promoted && outcome.removal.promoted->id == two.id,
           "shadow promoted to canonical");
    Expect(outcome.removal.released.empty() && outcome.compactions.empty(),
           "promotion keeps every block");
    Expect(TotalPackageBytes(store, blobs) == stored, "no package bytes dropped");
    Expect(engine.Reconstruct("two") == data, "promoted copy restores");
    Expect(ThrowsNotFound([&] { engine.Reconstruct("one"); }), "deleted key is gone");
    Expect(ThrowsNotFound([&] { engine.DeleteFileset("one"); }), "deleting twice is NotFound");
    Expect(events.Count("file_deleted") == 1, "delete is published");

    WriteFile(dir.path() / "three.bin", data);
    const auto three = engine.ProcessFile(dir.path() / "three.bin", Keyed("three"));
    Expect(three.is_shadow && three.canonical_id == two.id, "new copies dedup against the heir");
  }

  void TestDeleteCompactsPackage() {
    TempDir dir;
    pv::storage::LocalBlobStore blobs(dir.path() / "packages");
    pv::metadata::InMemoryMetadataStore store;
    pv::log::EventBus bus;
    EventRecorder events(bus);
    pv::engine::PackageEngine engine(SmallChunks().Build(), blobs, store, &bus);

    const auto a = RandomBytes(30000, 0xA1);
    const auto b = RandomBytes(40000, 0xB2);
    WriteFile(dir.path() / "a.bin", a);
    WriteFile(dir.path() / "b.bin", b);
    const auto first = engine.ProcessFile(dir.path() / "a.bin", Keyed("a"));
    const auto second = engine.ProcessFile(dir.path() / "b.bin", Keyed("b"));
    const std::string key = store.ListBlocksets(first.id).front().package_key;
    Expect(store.ListBlocksets(second.id).front().package_key == key,
           "both files share a package");
    const uint64_t before = store.GetRootPackage(key)->size;

    const auto outcome = engine.DeleteFileset("a");
    Expect(!outcome.removal.promoted && !outcome.removal.released.empty(),
           "last copy releases its blocks");
    Expect(outcome.compactions.size() == 1 && outcome.compactions[0].package_key == key,
           "the package holding the blocks is compacted");
    const auto& compaction = outcome.compactions[0];
    Expect(compaction.generation == 1 && compaction.bytes_before == before &&
               compaction.bytes_after < before,
           "compaction shrinks the package");
    const auto package = store.GetRootPackage(key);
    Expect(package->generation == 1 && package->size == compaction.bytes_after,
           "package records its new generation");
    Expect(blobs.Size(pv::storage::BlobKeyFor(*package)) == package->size,
           "package file holds only live blocks");
    Expect(!blobs.Exists(key), "old generation removed");
    Expect(engine.Reconstruct("b") == b, "neighbouring file survives compaction");
    Expect(events.Count("package_compacted") == 1, "compaction is published");

    const auto again = engine.ProcessFile(dir.path() / "a.bin", Keyed("a"));
    Expect(!again.is_shadow, "deleted content is stored afresh");
    Expect(engine.Reconstruct("a") == a, "re-ingested file restores");
    Expect(engine.CompactPackage(key).reclaimed() == 0, "nothing to reclaim without deletes");

    const auto kept = engine.DeleteFileset("b", false);
    Expect(kept.compactions.empty(), "compaction can be deferred");
    const auto deferred = engine.CompactPackage(key);
    Expect(deferred.generation == 2 && deferred.reclaimed() > 0, "deferred compaction reclaims");
    Expect(engine.Reconstruct("a") == a, "remaining file restores after second compaction");
  }

  void TestRestorePackage() {
    TempDir dir;
    pv::storage::LocalBlobStore blobs(dir.path() / "packages");
    pv::metadata::InMemoryMetadataStore store;
    pv::log::EventBus bus;
    EventRecorder events(bus);
    pv::engine::PackageEngine engine(SmallChunks().Build(), blobs, store, &bus);

    std::filesystem::create_directories(dir.path() / "src");
    const auto report = RandomBytes(30000, 0x71);
    const auto notes = RandomBytes(40000, 0x72);
    WriteFile(dir.path() / "src" / "report.txt", report);
    WriteFile(dir.path() / "src" / "notes.txt", notes);
    const auto stored = engine.ProcessFile(dir.path() / "src" / "report.txt");
    engine.ProcessFile(dir.path() / "src" / "notes.txt");
    const std::string key = store.ListBlocksets(stored.id).front().package_key;

    const auto out = dir.path() / "out";
    auto results = engine.RestorePackage(key, out, pv::engine::ConflictPolicy::kSkip);
    Expect(results.size() == 2, "one result per file in the package");
    for (const auto& result : results) {
      Expect(result.ok() && !result.skipped, "fresh restore writes every file: " + result.message);
    }
    Expect(ReadFile(out / "report.txt") == report && ReadFile(out / "notes.txt") == notes,
           "files restored under their source names");

    const std::vector<uint8_t> edited{'l', 'o', 'c', 'a', 'l'};
    WriteFile(out / "report.txt", edited);
    results = engine.RestorePackage(key, out, pv::engine::ConflictPolicy::kSkip);
    for (const auto& result : results) {
      Expect(result.ok() && result.skipped, "existing files are skipped");
    }
    Expect(ReadFile(out / "report.txt") == edited, "skip leaves the existing file");

    results = engine.RestorePackage(key, out, pv::engine::ConflictPolicy::kOverwrite);
    Expect(ReadFile(out / "report.txt") == report, "overwrite replaces the existing file");

    results = engine.RestorePackage(key, out, pv::engine::ConflictPolicy::kRename);
    bool renamed = false;
    for (const auto& result : results) {
      Expect(result.ok() && !result.skipped, "rename restores every file");
      renamed = renamed || result.destination == out / "report (1).txt";
    }
    Expect(renamed && ReadFile(out / "report (1).txt") == report,
           "rename picks the next free name");
    Expect(ReadFile(out / "report.txt") == report, "rename keeps the existing file");
    engine.RestorePackage(key, out, pv::engine::ConflictPolicy::kRename);
    Expect(std::filesystem::exists(out / "notes (2).txt"), "rename keeps counting");

    for (const auto& entry : std::filesystem::directory_iterator(out)) {
      Expect(entry.path().extension() != ".part", "no partial files left behind");
    }
    Expect(events.Count("package_restored") == 5, "each package restore is published");
    Expect(ThrowsNotFound([&] {
             engine.RestorePackage("z00/0", out, pv::engine::ConflictPolicy::kSkip);
           }),
           "unknown package is NotFound");

    Expect(pv::engine::ParseConflictPolicy("Overwrite") == pv::engine::ConflictPolicy::kOverwrite,
           "policy names are case-insensitive");
    Expect(!pv::engine::ParseConflictPolicy("merge").has_value(), "unknown policy rejected");
  }

} // namespace

int main() {
  TestRoundTripSizes();
  TestIdenticalFilesDeduplicate();
  TestCorruptionDetected();
  TestWrongKeyRejected();
  TestCancellation();
  TestProcessFilesIsolation();
  TestConcurrentDuplicates();
  TestSegmentedLargeFile();
  TestMissingKeyLookup();
  TestJournalRestart();
  TestDeletePromotesShadow();
  TestDeleteCompactsPackage();
  TestRestorePackage();
  std::cout << "engine test ok\n";
  return 0;
}
