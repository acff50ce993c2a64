#include "pv/engine/package_engine.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <deque>
#include <fstream>
#include <future>
#include <mutex>
#include <set>
#include <sstream>
#include <system_error>

#include <sys/stat.h>

#include "pv/chunking/fastcdc.h"
#include "pv/common.h"
#include "pv/crypto/ct.h"
#include "pv/crypto/digest.h"
#include "pv/error.h"

namespace pv::engine {

namespace {

constexpr size_t kHashBufferSize = 1024 * 1024;

struct SourceStat {
  uint64_t size{0};
  int64_t created_ms{0};
  int64_t updated_ms{0};
};

int64_t ToMillis(const struct timespec& ts) {
  return static_cast<int64_t>(ts.tv_sec) * 1000 + static_cast<int64_t>(ts.tv_nsec / 1000000);
}

SourceStat StatSource(const std::filesystem::path& path) {
  struct stat info {};
  if (::stat(path.c_str(), &info) != 0) {
    const int err = errno;
    throw IoError(errors::io::kSourceOpenFailed, "cannot stat " + PathToUtf8String(path), err,
                  ClassifyNativeError(err));
  }
  if (!S_ISREG(info.st_mode)) {
    throw IoError(errors::io::kSourceOpenFailed,
                  "not a regular file: " + PathToUtf8String(path));
  }
  SourceStat stat;
  stat.size = static_cast<uint64_t>(info.st_size);
  stat.created_ms = ToMillis(info.st_ctim);
  stat.updated_ms = ToMillis(info.st_mtim);
  return stat;
}

std::ifstream OpenSource(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw IoError(errors::io::kSourceOpenFailed, "cannot open " + PathToUtf8String(path));
  }
  return in;
}

std::string HashSource(const std::filesystem::path& path, crypto::HashAlgorithm alg,
                       const core::CancellationToken& cancel, uint64_t* bytes) {
  auto in = OpenSource(path);
  crypto::ContentHasher hasher(alg);
  std::vector<uint8_t> buffer(kHashBufferSize);
  while (in) {
    cancel.ThrowIfCancelled("hashing");
    in.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    const auto got = static_cast<size_t>(in.gcount());
    if (got > 0) {
      hasher.Update(std::span<const uint8_t>(buffer.data(), got));
    }
  }
  if (in.bad()) {
    throw IoError(errors::io::kSourceReadFailed, "failed reading " + PathToUtf8String(path));
  }
  *bytes = hasher.bytes_hashed();
  return hasher.HexDigest();
}

codec::BlockMetadata MetadataFor(const metadata::Blockset& block) {
  codec::BlockMetadata md;
  md.hash = block.hash;
  md.original_size = block.original_size;
  md.encoded_size = block.size;
  md.compression = block.compression;
  md.cipher = block.encryption;
  md.hash_algorithm = block.hash_algorithm;
  return md;
}

// Waits for every outstanding encode so no task outlives the file it belongs to.
void DrainQuietly(std::deque<std::future<codec::EncodedBlock>>& window) {
  for (auto& pending : window) {
    if (pending.valid()) {
      pending.wait();
    }
  }
  window.clear();
}

bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) ==
                  std::tolower(static_cast<unsigned char>(y));
         });
}

// First "<stem> (n)<ext>" next to |path| that does not exist yet.
std::filesystem::path FreeSibling(const std::filesystem::path& path) {
  const auto stem = PathToUtf8String(path.stem());
  const auto extension = PathToUtf8String(path.extension());
  std::error_code ec;
  for (uint64_t n = 1;; ++n) {
    auto candidate = path.parent_path() / (stem + " (" + std::to_string(n) + ")" + extension);
    if (!std::filesystem::exists(candidate, ec)) {
      return candidate;
    }
  }
}

void RemoveQuietly(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

} // namespace

const char* ConflictPolicyName(ConflictPolicy policy) {
  switch (policy) {
  case ConflictPolicy::kSkip:
    return "skip";
  case ConflictPolicy::kOverwrite:
    return "overwrite";
  case ConflictPolicy::kRename:
    return "rename";
  }
  return "unknown";
}

std::optional<ConflictPolicy> ParseConflictPolicy(std::string_view name) {
  for (auto policy : {ConflictPolicy::kSkip, ConflictPolicy::kOverwrite, ConflictPolicy::kRename}) {
    if (EqualsIgnoreCase(name, ConflictPolicyName(policy))) {
      return policy;
    }
  }
  return std::nullopt;
}

PackageEngine::PackageEngine(config::JobConfig config, storage::BlobStore& blobs,
                             metadata::MetadataStore& store, log::EventBus* bus)
    : config_(std::move(config)),
      blobs_(blobs),
      store_(store),
      bus_(bus),
      encoder_(config_.codec_options(), config_.key),
      packages_(blobs_, store_, storage::PackageOptions{config_.package_ceiling, {}}, bus_),
      coordinator_(store_),
      dedup_(coordinator_),
      encode_pool_(config_.encode_threads),
      file_pool_(config_.file_threads) {
  config_.chunking.Validate();
}

PackageEngine::~PackageEngine() = default;

metadata::Fileset PackageEngine::ProcessFile(const std::filesystem::path& path,
                                             const ProcessOptions& options) {
  metadata::Fileset draft;
  draft.key = options.key.empty() ? PathToUtf8String(path) : options.key;
  draft.source_key = PathToUtf8String(path);
  draft.hash_algorithm = config_.hash;
  std::shared_lock<std::shared_mutex> maintenance(maintenance_mutex_);
  try {
    options.cancel.ThrowIfCancelled("start");
    const SourceStat stat = StatSource(path);
    draft.size = stat.size;
    draft.created_ms = stat.created_ms;
    draft.updated_ms = stat.updated_ms;
    const std::string category = storage::CategoryForSize(stat.size, config_.package_ceiling);

    uint64_t hashed = 0;
    draft.hash = HashSource(path, config_.hash, options.cancel, &hashed);
    if (hashed != stat.size) {
      throw IoError(errors::io::kSourceChanged,
                    "file size changed while hashing " + PathToUtf8String(path));
    }

    Registration registration =
        dedup_.Register(draft.hash, draft, [&](const metadata::Fileset& request) {
          return StoreContent(path, request, category, options.cancel);
        });
    if (registration.kind == RegistrationKind::kShadow) {
      PublishFileEvent("file_deduplicated", log::EventSeverity::kInfo,
                       "content already stored; recorded shadow", registration.fileset);
    } else {
      PublishFileEvent("file_stored", log::EventSeverity::kInfo, "stored file content",
                       registration.fileset);
    }
    return registration.fileset;
  } catch (const Error& error) {
    PublishFileEvent("file_failed",
                     error.domain == ErrorDomain::Cancelled ? log::EventSeverity::kWarning
                                                            : log::EventSeverity::kError,
                     error.what(), draft);
    RethrowWithContext(error, "ProcessFile " + draft.source_key);
  }
}

metadata::Fileset PackageEngine::StoreContent(const std::filesystem::path& path,
                                              const metadata::Fileset& draft,
                                              const std::string& category,
                                              const core::CancellationToken& cancel) {
  const std::shared_ptr<core::NonceSequence> sequence = encoder_.BeginFile();
  const storage::PackageStore::WriteLease lease = packages_.BeginWrite(category);
  FileTransaction transaction(draft);
  crypto::ContentHasher rehash(config_.hash);
  std::deque<std::future<codec::EncodedBlock>> window;

  auto submit = [&](std::vector<uint8_t> data) {
    rehash.Update(data);
    window.push_back(encode_pool_.Submit([this, sequence, data = std::move(data)]() {
      return encoder_.Encode(data, sequence.get());
    }));
  };
  auto append_front = [&]() {
    codec::EncodedBlock block = window.front().get();
    window.pop_front();
    cancel.ThrowIfCancelled("append");
    const storage::BlockLocation location = packages_.Append(category, block.bytes);
    transaction.AddBlock(block.metadata, location);
  };

  try {
    if (draft.size >= config_.large_file_threshold) {
      const auto descriptors = chunking::ChunkFileSegmented(
          path, config_.chunking, config_.segment_size, &encode_pool_, cancel);
      auto in = OpenSource(path);
      for (const auto& descriptor : descriptors) {
        cancel.ThrowIfCancelled("chunking");
        std::vector<uint8_t> data(static_cast<size_t>(descriptor.length));
        in.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (static_cast<uint64_t>(in.gcount()) != descriptor.length) {
          throw IoError(errors::io::kSourceChanged,
                        "file shrank while storing " + PathToUtf8String(path));
        }
        submit(std::move(data));
        if (window.size() >= config_.encode_window) {
          append_front();
        }
      }
    } else {
      auto in = OpenSource(path);
      chunking::StreamChunker chunker(in, config_.chunking, cancel);
      while (auto chunk = chunker.Next()) {
        submit(std::move(chunk->data));
        if (window.size() >= config_.encode_window) {
          append_front();
        }
      }
    }
    while (!window.empty()) {
      append_front();
    }
  } catch (...) {
    DrainQuietly(window);
    throw;
  }

  const std::string stored_hash = rehash.HexDigest();
  if (!crypto::ct::CompareEqual(AsBytes(stored_hash), AsBytes(draft.hash))) {
    throw IoError(errors::io::kSourceChanged,
                  "file changed while storing " + PathToUtf8String(path));
  }
  packages_.Flush(transaction.touched_packages());
  cancel.ThrowIfCancelled("commit");
  return coordinator_.Commit(transaction);
}

std::vector<FileResult> PackageEngine::ProcessFiles(const std::vector<std::filesystem::path>& paths,
                                                    const core::CancellationToken& cancel) {
  std::vector<std::future<metadata::Fileset>> pending;
  pending.reserve(paths.size());
  for (const auto& path : paths) {
    pending.push_back(file_pool_.Submit([this, path, cancel]() {
      ProcessOptions options;
      options.cancel = cancel;
      return ProcessFile(path, options);
    }));
  }

  std::vector<FileResult> results(paths.size());
  for (size_t i = 0; i < paths.size(); ++i) {
    results[i].path = paths[i];
    try {
      results[i].fileset = pending[i].get();
    } catch (const std::exception& error) {
      results[i].error = std::current_exception();
      results[i].message = error.what();
    }
  }
  return results;
}

metadata::Fileset PackageEngine::ResolveCanonical(const metadata::Fileset& fileset) {
  if (!fileset.is_shadow) {
    return fileset;
  }
  auto canonical = store_.GetFileset(fileset.canonical_id);
  if (!canonical || canonical->is_shadow) {
    throw Error{ErrorDomain::State, errors::state::kNotFound,
                "shadow " + fileset.key + " references missing canonical Fileset " +
                    std::to_string(fileset.canonical_id)};
  }
  if (canonical->hash != fileset.hash) {
    throw IntegrityError(errors::integrity::kFileHashMismatch,
                         "shadow " + fileset.key + " disagrees with its canonical hash");
  }
  return *canonical;
}

metadata::Fileset PackageEngine::RequireByKey(const std::string& fileset_key) {
  auto fileset = store_.FindFilesetByKey(fileset_key);
  if (!fileset) {
    throw Error{ErrorDomain::State, errors::state::kNotFound,
                "no Fileset stored under key " + fileset_key};
  }
  return *fileset;
}

void PackageEngine::RestoreFileset(const metadata::Fileset& requested, std::ostream* out) {
  try {
    const metadata::Fileset canonical = ResolveCanonical(requested);
    const auto blocks = store_.ListBlocksets(canonical.id);
    crypto::ContentHasher hasher(canonical.hash_algorithm);
    uint64_t restored = 0;
    for (size_t i = 0; i < blocks.size(); ++i) {
      const auto& block = blocks[i];
      if (block.index != i) {
        throw IntegrityError(errors::integrity::kBlockSequenceGap,
                             "missing block " + std::to_string(i) + " of Fileset " +
                                 std::to_string(canonical.id));
      }
      const auto encoded = packages_.Read(block.package_key, block.start_index, block.end_index);
      const auto plain = encoder_.Decode(encoded, MetadataFor(block));
      hasher.Update(plain);
      restored += plain.size();
      if (out != nullptr) {
        out->write(reinterpret_cast<const char*>(plain.data()),
                   static_cast<std::streamsize>(plain.size()));
        if (!*out) {
          throw IoError(errors::io::kOutputWriteFailed,
                        "failed writing restored bytes of " + requested.key);
        }
      }
    }
    if (restored != canonical.size) {
      throw IntegrityError(errors::integrity::kLengthMismatch,
                           "restored " + std::to_string(restored) + " bytes, expected " +
                               std::to_string(canonical.size));
    }
    const std::string actual = hasher.HexDigest();
    if (!crypto::ct::CompareEqual(AsBytes(actual), AsBytes(canonical.hash))) {
      throw IntegrityError(errors::integrity::kFileHashMismatch,
                           "restored content hash does not match Fileset hash");
    }
    PublishFileEvent("restore_completed", log::EventSeverity::kInfo, "file restored", requested);
  } catch (const IntegrityError& error) {
    PublishFileEvent("integrity_failure", log::EventSeverity::kCritical, error.what(), requested);
    throw;
  }
}

std::vector<uint8_t> PackageEngine::Reconstruct(const std::string& fileset_key) {
  std::ostringstream out(std::ios::binary);
  ReconstructTo(fileset_key, out);
  const std::string bytes = out.str();
  return std::vector<uint8_t>(bytes.begin(), bytes.end());
}

void PackageEngine::ReconstructTo(const std::string& fileset_key, std::ostream& out) {
  std::shared_lock<std::shared_mutex> maintenance(maintenance_mutex_);
  RestoreFileset(RequireByKey(fileset_key), &out);
}

std::vector<uint8_t> PackageEngine::ReconstructById(uint64_t fileset_id) {
  std::shared_lock<std::shared_mutex> maintenance(maintenance_mutex_);
  auto fileset = store_.GetFileset(fileset_id);
  if (!fileset) {
    throw Error{ErrorDomain::State, errors::state::kNotFound,
                "no Fileset with id " + std::to_string(fileset_id)};
  }
  std::ostringstream out(std::ios::binary);
  RestoreFileset(*fileset, &out);
  const std::string bytes = out.str();
  return std::vector<uint8_t>(bytes.begin(), bytes.end());
}

void PackageEngine::Verify(const std::string& fileset_key) {
  std::shared_lock<std::shared_mutex> maintenance(maintenance_mutex_);
  RestoreFileset(RequireByKey(fileset_key), nullptr);
}

void PackageEngine::RestoreEntry(const metadata::RootFileset& entry,
                                 const std::filesystem::path& directory, ConflictPolicy policy,
                                 RestoredFile& result) {
  result.entry = entry;
  std::filesystem::path name = std::filesystem::path(entry.fileset_source_key).filename();
  if (name.empty()) {
    name = "fileset-" + std::to_string(entry.fileset_id);
  }
  result.destination = directory / name;
  try {
    auto fileset = store_.GetFileset(entry.fileset_id);
    if (!fileset) {
      throw Error{ErrorDomain::State, errors::state::kNotFound,
                  "package entry references missing Fileset " + std::to_string(entry.fileset_id)};
    }
    std::error_code ec;
    if (policy == ConflictPolicy::kSkip && std::filesystem::exists(result.destination, ec)) {
      result.skipped = true;
      return;
    }

    auto part = result.destination;
    part += ".part";
    {
      std::ofstream out(part, std::ios::binary | std::ios::trunc);
      if (!out) {
        throw IoError(errors::io::kOutputWriteFailed, "cannot open " + PathToUtf8String(part));
      }
      try {
        RestoreFileset(*fileset, &out);
        out.flush();
        if (!out) {
          throw IoError(errors::io::kOutputWriteFailed,
                        "failed to flush " + PathToUtf8String(part));
        }
      } catch (const Error&) {
        out.close();
        RemoveQuietly(part);
        throw;
      }
    }

    std::filesystem::path target = result.destination;
    if (std::filesystem::exists(target, ec)) {
      if (policy == ConflictPolicy::kSkip) {
        RemoveQuietly(part);
        result.skipped = true;
        return;
      }
      if (policy == ConflictPolicy::kRename) {
        target = FreeSibling(target);
      }
    }
    std::filesystem::rename(part, target, ec);
    if (ec) {
      RemoveQuietly(part);
      throw IoError(errors::io::kOutputWriteFailed,
                    "cannot move restored file to " + PathToUtf8String(target), ec.value());
    }
    result.destination = target;
  } catch (const std::exception& error) {
    result.error = std::current_exception();
    result.message = error.what();
  }
}

std::vector<RestoredFile> PackageEngine::RestorePackage(const std::string& package_key,
                                                        const std::filesystem::path& directory,
                                                        ConflictPolicy policy) {
  std::shared_lock<std::shared_mutex> maintenance(maintenance_mutex_);
  if (!store_.GetRootPackage(package_key)) {
    throw Error{ErrorDomain::State, errors::state::kNotFound, "unknown package " + package_key};
  }
  std::error_code ec;
  std::filesystem::create_directories(directory, ec);
  if (ec) {
    throw IoError(errors::io::kOutputWriteFailed,
                  "cannot create restore directory " + PathToUtf8String(directory), ec.value());
  }

  const auto entries = store_.ListRootFilesets(package_key);
  std::vector<RestoredFile> results(entries.size());
  size_t restored = 0;
  size_t skipped = 0;
  for (size_t i = 0; i < entries.size(); ++i) {
    RestoreEntry(entries[i], directory, policy, results[i]);
    if (results[i].ok()) {
      ++(results[i].skipped ? skipped : restored);
    }
  }

  log::Event event;
  event.category = log::EventCategory::kLifecycle;
  event.severity = restored + skipped == results.size() ? log::EventSeverity::kInfo
                                                        : log::EventSeverity::kError;
  event.event_id = "package_restored";
  event.message = "restored package contents";
  event.fields.emplace_back("package", package_key);
  event.fields.emplace_back("policy", ConflictPolicyName(policy));
  event.fields.emplace_back("restored", std::to_string(restored), log::FieldPrivacy::kPublic,
                            true);
  event.fields.emplace_back("skipped", std::to_string(skipped), log::FieldPrivacy::kPublic, true);
  event.fields.emplace_back("failed", std::to_string(results.size() - restored - skipped),
                            log::FieldPrivacy::kPublic, true);
  log::Publish(bus_, std::move(event));
  return results;
}

DeleteOutcome PackageEngine::DeleteLocked(uint64_t fileset_id, bool compact) {
  DeleteOutcome outcome;
  outcome.removal = store_.DeleteFileset(fileset_id);
  const auto& removal = outcome.removal;
  PublishFileEvent("file_deleted", log::EventSeverity::kInfo,
                   removal.promoted ? "deleted; oldest shadow promoted to canonical"
                                    : "deleted",
                   removal.removed);
  if (compact) {
    std::set<std::string> keys;
    for (const auto& block : removal.released) {
      keys.insert(block.package_key);
    }
    for (const auto& key : keys) {
      outcome.compactions.push_back(packages_.Compact(key));
    }
  }
  return outcome;
}

DeleteOutcome PackageEngine::DeleteFileset(const std::string& fileset_key, bool compact) {
  std::unique_lock<std::shared_mutex> maintenance(maintenance_mutex_);
  return DeleteLocked(RequireByKey(fileset_key).id, compact);
}

DeleteOutcome PackageEngine::DeleteFilesetById(uint64_t fileset_id, bool compact) {
  std::unique_lock<std::shared_mutex> maintenance(maintenance_mutex_);
  return DeleteLocked(fileset_id, compact);
}

storage::CompactionResult PackageEngine::CompactPackage(const std::string& package_key) {
  std::unique_lock<std::shared_mutex> maintenance(maintenance_mutex_);
  return packages_.Compact(package_key);
}

void PackageEngine::PublishFileEvent(const char* event_id, log::EventSeverity severity,
                                     const std::string& message,
                                     const metadata::Fileset& fileset) {
  log::Event event;
  event.category = std::string_view(event_id) == "integrity_failure"
                       ? log::EventCategory::kIntegrity
                       : log::EventCategory::kLifecycle;
  event.severity = severity;
  event.event_id = event_id;
  event.message = message;
  event.fields.emplace_back("source", fileset.source_key, log::FieldPrivacy::kHash);
  event.fields.emplace_back("size", std::to_string(fileset.size), log::FieldPrivacy::kPublic,
                            true);
  if (!fileset.hash.empty()) {
    event.fields.emplace_back("hash", fileset.hash);
  }
  if (fileset.id != 0) {
    event.fields.emplace_back("fileset_id", std::to_string(fileset.id),
                              log::FieldPrivacy::kPublic, true);
  }
  log::Publish(bus_, std::move(event));
}

} // namespace pv::engine
