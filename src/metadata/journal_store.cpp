#include "pv/metadata/journal_store.h"

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <iterator>
#include <limits>
#include <span>
#include <string>
#include <thread>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "pv/common.h"
#include "pv/crypto/ct.h"
#include "pv/crypto/digest.h"
#include "pv/error.h"

namespace pv::metadata {

namespace {

constexpr std::array<uint8_t, 8> kJournalMagic{'P', 'V', 'J', 'R', 'N', 'L', '0', '1'};
constexpr uint32_t kRecordMagic = 0x524A5650; // "PVJR" little endian
constexpr size_t kChecksumSize = 32;
constexpr size_t kFrameHeaderSize = sizeof(uint32_t) * 2;
// Frame kinds that carry one slice of a mutation too large for a single frame. The body of
// the mutation is replayed once its kFragmentEnd frame has been read.
constexpr uint8_t kFragmentKind = 0x80;
constexpr uint8_t kFragmentEndKind = 0x81;
constexpr size_t kMinFrameBody = 2;

class ByteWriter {
public:
  void PutU8(uint8_t value) { bytes_.push_back(value); }
  void PutU32(uint32_t value) {
    const uint32_t le = ToLittleEndian(value);
    const auto* p = reinterpret_cast<const uint8_t*>(&le);
    bytes_.insert(bytes_.end(), p, p + sizeof(le));
  }
  void PutU64(uint64_t value) {
    const uint64_t le = ToLittleEndian64(value);
    const auto* p = reinterpret_cast<const uint8_t*>(&le);
    bytes_.insert(bytes_.end(), p, p + sizeof(le));
  }
  void PutI64(int64_t value) { PutU64(static_cast<uint64_t>(value)); }
  void PutBool(bool value) { PutU8(value ? 1 : 0); }
  void PutString(const std::string& value) {
    PutU32(static_cast<uint32_t>(value.size()));
    bytes_.insert(bytes_.end(), value.begin(), value.end());
  }
  std::vector<uint8_t>& bytes() { return bytes_; }

private:
  std::vector<uint8_t> bytes_;
};

class ByteReader {
public:
  explicit ByteReader(std::span<const uint8_t> data) : data_(data) {}

  uint8_t GetU8() {
    Need(1);
    return data_[pos_++];
  }
  uint32_t GetU32() {
    Need(sizeof(uint32_t));
    uint32_t le = 0;
    std::memcpy(&le, data_.data() + pos_, sizeof(le));
    pos_ += sizeof(le);
    return FromLittleEndian32(le);
  }
  uint64_t GetU64() {
    Need(sizeof(uint64_t));
    uint64_t le = 0;
    std::memcpy(&le, data_.data() + pos_, sizeof(le));
    pos_ += sizeof(le);
    return FromLittleEndian64(le);
  }
  int64_t GetI64() { return static_cast<int64_t>(GetU64()); }
  bool GetBool() { return GetU8() != 0; }
  std::string GetString() {
    const uint32_t size = GetU32();
    Need(size);
    std::string out(reinterpret_cast<const char*>(data_.data() + pos_), size);
    pos_ += size;
    return out;
  }
  bool AtEnd() const noexcept { return pos_ == data_.size(); }

private:
  void Need(size_t n) const {
    if (data_.size() - pos_ < n) {
      throw IntegrityError(errors::integrity::kJournalCorrupt, "journal record truncated");
    }
  }

  std::span<const uint8_t> data_;
  size_t pos_{0};
};

void WriteFileset(ByteWriter& w, const Fileset& f) {
  w.PutU64(f.id);
  w.PutString(f.key);
  w.PutString(f.source_key);
  w.PutU64(f.size);
  w.PutString(f.hash);
  w.PutU8(static_cast<uint8_t>(f.hash_algorithm));
  w.PutI64(f.created_ms);
  w.PutI64(f.updated_ms);
  w.PutBool(f.is_shadow);
  w.PutU64(f.canonical_id);
}

Fileset ReadFileset(ByteReader& r) {
  Fileset f;
  f.id = r.GetU64();
  f.key = r.GetString();
  f.source_key = r.GetString();
  f.size = r.GetU64();
  f.hash = r.GetString();
  f.hash_algorithm = static_cast<crypto::HashAlgorithm>(r.GetU8());
  f.created_ms = r.GetI64();
  f.updated_ms = r.GetI64();
  f.is_shadow = r.GetBool();
  f.canonical_id = r.GetU64();
  return f;
}

void WriteBlockset(ByteWriter& w, const Blockset& b) {
  w.PutU64(b.id);
  w.PutU64(b.fileset_id);
  w.PutU32(b.index);
  w.PutString(b.hash);
  w.PutU64(b.size);
  w.PutU64(b.original_size);
  w.PutString(b.package_key);
  w.PutU64(b.start_index);
  w.PutU64(b.end_index);
  w.PutU8(static_cast<uint8_t>(b.encryption));
  w.PutU8(static_cast<uint8_t>(b.hash_algorithm));
  w.PutU8(static_cast<uint8_t>(b.compression));
}

Blockset ReadBlockset(ByteReader& r) {
  Blockset b;
  b.id = r.GetU64();
  b.fileset_id = r.GetU64();
  b.index = r.GetU32();
  b.hash = r.GetString();
  b.size = r.GetU64();
  b.original_size = r.GetU64();
  b.package_key = r.GetString();
  b.start_index = r.GetU64();
  b.end_index = r.GetU64();
  b.encryption = static_cast<crypto::CipherType>(r.GetU8());
  b.hash_algorithm = static_cast<crypto::HashAlgorithm>(r.GetU8());
  b.compression = static_cast<codec::CompressionType>(r.GetU8());
  return b;
}

void WriteRootFileset(ByteWriter& w, const RootFileset& rf) {
  w.PutU64(rf.id);
  w.PutString(rf.package_key);
  w.PutU64(rf.fileset_id);
  w.PutString(rf.fileset_hash);
  w.PutString(rf.fileset_source_key);
  w.PutU64(rf.fileset_size);
  w.PutI64(rf.created_ms);
  w.PutI64(rf.updated_ms);
}

RootFileset ReadRootFileset(ByteReader& r) {
  RootFileset rf;
  rf.id = r.GetU64();
  rf.package_key = r.GetString();
  rf.fileset_id = r.GetU64();
  rf.fileset_hash = r.GetString();
  rf.fileset_source_key = r.GetString();
  rf.fileset_size = r.GetU64();
  rf.created_ms = r.GetI64();
  rf.updated_ms = r.GetI64();
  return rf;
}

void WritePackage(ByteWriter& w, const RootPackage& p) {
  w.PutU64(p.id);
  w.PutString(p.key);
  w.PutString(p.category);
  w.PutU64(p.index);
  w.PutU64(p.size);
  w.PutBool(p.multifile);
  w.PutBool(p.sealed);
}

RootPackage ReadPackage(ByteReader& r) {
  RootPackage p;
  p.id = r.GetU64();
  p.key = r.GetString();
  p.category = r.GetString();
  p.index = r.GetU64();
  p.size = r.GetU64();
  p.multifile = r.GetBool();
  p.sealed = r.GetBool();
  return p;
}

std::vector<uint8_t> EncodeCommit(const FileCommit& commit) {
  ByteWriter w;
  w.PutBool(commit.fileset.has_value());
  if (commit.fileset) {
    WriteFileset(w, *commit.fileset);
  }
  w.PutU32(static_cast<uint32_t>(commit.blocksets.size()));
  for (const auto& block : commit.blocksets) {
    WriteBlockset(w, block);
  }
  w.PutU32(static_cast<uint32_t>(commit.packages.size()));
  for (const auto& update : commit.packages) {
    w.PutString(update.key);
    w.PutU64(update.committed_end);
  }
  w.PutU32(static_cast<uint32_t>(commit.root_filesets.size()));
  for (const auto& root : commit.root_filesets) {
    WriteRootFileset(w, root);
  }
  return std::move(w.bytes());
}

FileCommit DecodeCommit(ByteReader& r) {
  FileCommit commit;
  if (r.GetBool()) {
    commit.fileset = ReadFileset(r);
  }
  const uint32_t blocks = r.GetU32();
  for (uint32_t i = 0; i < blocks; ++i) {
    commit.blocksets.push_back(ReadBlockset(r));
  }
  const uint32_t packages = r.GetU32();
  for (uint32_t i = 0; i < packages; ++i) {
    PackageUpdate update;
    update.key = r.GetString();
    update.committed_end = r.GetU64();
    commit.packages.push_back(std::move(update));
  }
  const uint32_t roots = r.GetU32();
  for (uint32_t i = 0; i < roots; ++i) {
    commit.root_filesets.push_back(ReadRootFileset(r));
  }
  return commit;
}

std::array<uint8_t, kChecksumSize> Checksum(std::span<const uint8_t> body) {
  auto digest = crypto::HashBytes(crypto::HashAlgorithm::SHA256, body);
  std::array<uint8_t, kChecksumSize> out{};
  std::memcpy(out.data(), digest.data(), out.size());
  return out;
}

std::vector<uint8_t> EncodeRelocation(const PackageRelocation& relocation) {
  ByteWriter w;
  w.PutString(relocation.key);
  w.PutU64(relocation.generation);
  w.PutU64(relocation.size);
  w.PutU32(static_cast<uint32_t>(relocation.moves.size()));
  for (const auto& move : relocation.moves) {
    w.PutU64(move.blockset_id);
    w.PutU64(move.start_index);
  }
  return std::move(w.bytes());
}

PackageRelocation DecodeRelocation(ByteReader& r) {
  PackageRelocation relocation;
  relocation.key = r.GetString();
  relocation.generation = r.GetU64();
  relocation.size = r.GetU64();
  const uint32_t moves = r.GetU32();
  for (uint32_t i = 0; i < moves; ++i) {
    BlockMove move;
    move.blockset_id = r.GetU64();
    move.start_index = r.GetU64();
    relocation.moves.push_back(move);
  }
  return relocation;
}

[[noreturn]] void ThrowCorrupt(const std::filesystem::path& path, size_t offset,
                               const std::string& what) {
  throw IntegrityError(errors::integrity::kJournalCorrupt,
                       "metadata journal " + PathToUtf8String(path) + " " + what +
                           " at offset " + std::to_string(offset));
}

bool AllZero(std::span<const uint8_t> bytes) {
  return std::all_of(bytes.begin(), bytes.end(), [](uint8_t b) { return b == 0; });
}

void AppendFrame(std::vector<uint8_t>& out, uint8_t kind, std::span<const uint8_t> payload) {
  std::vector<uint8_t> body;
  body.reserve(payload.size() + 1);
  body.push_back(kind);
  body.insert(body.end(), payload.begin(), payload.end());
  const uint32_t magic = ToLittleEndian(kRecordMagic);
  const uint32_t length = ToLittleEndian(static_cast<uint32_t>(body.size()));
  const auto* m = reinterpret_cast<const uint8_t*>(&magic);
  const auto* l = reinterpret_cast<const uint8_t*>(&length);
  out.insert(out.end(), m, m + sizeof(magic));
  out.insert(out.end(), l, l + sizeof(length));
  out.insert(out.end(), body.begin(), body.end());
  const auto checksum = Checksum(body);
  out.insert(out.end(), checksum.begin(), checksum.end());
}

bool ShouldRetryFsync(int err) { return err == EINTR || err == EAGAIN || err == EBUSY; }

void WriteAll(int fd, std::span<const uint8_t> bytes) {
  size_t offset = 0;
  while (offset < bytes.size()) {
    ssize_t written = ::write(fd, bytes.data() + offset, bytes.size() - offset);
    if (written < 0) {
      int err = errno;
      if (err == EINTR) {
        continue;
      }
      throw IoError(errors::io::kJournalWriteFailed, "failed to append metadata journal", err,
                    ClassifyNativeError(err));
    }
    if (written == 0) {
      throw IoError(errors::io::kJournalWriteFailed, "metadata journal short write");
    }
    offset += static_cast<size_t>(written);
  }
}

void SyncFileDescriptor(int fd) {
  constexpr int kMaxRetries = 4;
  std::chrono::milliseconds backoff{5};
  for (int attempt = 0;; ++attempt) {
    if (::fsync(fd) == 0) {
      return;
    }
    int err = errno;
    if (err == EINTR) {
      continue;
    }
    if (attempt >= kMaxRetries || !ShouldRetryFsync(err)) {
      throw IoError(errors::io::kJournalWriteFailed, "failed to fsync metadata journal", err);
    }
    std::this_thread::sleep_for(backoff);
    backoff *= 2;
  }
}

void SyncDirectory(const std::filesystem::path& dir) {
  int dir_fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
  if (dir_fd < 0) {
    return;
  }
  if (::fsync(dir_fd) != 0) {
    int err = errno;
    ::close(dir_fd);
    throw IoError(errors::io::kJournalWriteFailed, "failed to fsync journal directory", err);
  }
  ::close(dir_fd);
}

} // namespace

JournalMetadataStore::JournalMetadataStore(std::filesystem::path path, size_t max_frame_body)
    : path_(std::move(path)), max_frame_body_(max_frame_body) {
  if (max_frame_body_ < kMinFrameBody || max_frame_body_ > kJournalMaxFrameBody) {
    throw Error{ErrorDomain::Config, errors::config::kInvalidValue,
                "journal frame body limit must be between " + std::to_string(kMinFrameBody) +
                    " and " + std::to_string(kJournalMaxFrameBody) + " bytes"};
  }
  auto dir = path_.parent_path();
  if (!dir.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
      throw IoError(errors::io::kJournalWriteFailed,
                    "failed to create journal directory " + PathToUtf8String(dir), ec.value());
    }
  }
  Load();
}

JournalMetadataStore::~JournalMetadataStore() {
  if (fd_ >= 0) {
    ::close(fd_);
  }
}

void JournalMetadataStore::Load() {
  std::vector<uint8_t> contents;
  const bool existed = std::filesystem::exists(path_);
  if (existed) {
    std::ifstream in(path_, std::ios::binary);
    if (!in) {
      throw IoError(errors::io::kJournalWriteFailed,
                    "failed to open metadata journal " + PathToUtf8String(path_));
    }
    contents.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad()) {
      throw IoError(errors::io::kJournalWriteFailed, "failed to read metadata journal");
    }
  }

  // Only the final frame may be incomplete or fail its checksum; that is a torn append and is
  // cut off. Damage anywhere before it is reported without touching the file.
  size_t good_end = 0;
  if (contents.size() >= kJournalMagic.size()) {
    if (!std::equal(kJournalMagic.begin(), kJournalMagic.end(), contents.begin())) {
      throw IntegrityError(errors::integrity::kJournalCorrupt,
                           "metadata journal has bad magic: " + PathToUtf8String(path_));
    }
    good_end = kJournalMagic.size();
    size_t pos = good_end;
    std::vector<uint8_t> fragments;
    while (contents.size() - pos >= kFrameHeaderSize) {
      const size_t remaining = contents.size() - pos;
      uint32_t magic = 0;
      uint32_t length = 0;
      std::memcpy(&magic, contents.data() + pos, sizeof(magic));
      std::memcpy(&length, contents.data() + pos + sizeof(magic), sizeof(length));
      magic = FromLittleEndian32(magic);
      length = FromLittleEndian32(length);
      if (magic != kRecordMagic || length == 0 || length > kJournalMaxFrameBody) {
        if (AllZero(std::span<const uint8_t>(contents).subspan(pos))) {
          break;
        }
        ThrowCorrupt(path_, pos, "has an invalid frame header");
      }
      const size_t frame_size = kFrameHeaderSize + length + kChecksumSize;
      if (remaining < frame_size) {
        break;
      }
      std::span<const uint8_t> body(contents.data() + pos + kFrameHeaderSize, length);
      std::span<const uint8_t> stored(contents.data() + pos + kFrameHeaderSize + length,
                                      kChecksumSize);
      const auto computed = Checksum(body);
      if (!crypto::ct::CompareEqual(stored, computed)) {
        if (remaining == frame_size) {
          break;
        }
        ThrowCorrupt(path_, pos, "has a record that fails its checksum");
      }
      pos += frame_size;

      if (body[0] == kFragmentKind) {
        fragments.insert(fragments.end(), body.begin() + 1, body.end());
        continue;
      }
      if (body[0] == kFragmentEndKind) {
        fragments.insert(fragments.end(), body.begin() + 1, body.end());
        ReplayRecord(fragments);
        fragments.clear();
        fragments.shrink_to_fit();
      } else {
        if (!fragments.empty()) {
          ThrowCorrupt(path_, pos - frame_size, "has an unterminated fragment run");
        }
        ReplayRecord(body);
      }
      ++replayed_records_;
      good_end = pos;
    }
  }
  discarded_tail_bytes_ = contents.size() > good_end ? contents.size() - good_end : 0;

  fd_ = ::open(path_.c_str(), O_WRONLY | O_CREAT, 0600);
  if (fd_ < 0) {
    int err = errno;
    throw IoError(errors::io::kJournalWriteFailed,
                  "failed to open metadata journal for append " + PathToUtf8String(path_), err);
  }
  if (discarded_tail_bytes_ > 0 || good_end == 0) {
    if (::ftruncate(fd_, static_cast<off_t>(good_end)) != 0) {
      int err = errno;
      throw IoError(errors::io::kJournalWriteFailed, "failed to truncate journal tail", err);
    }
  }
  if (::lseek(fd_, 0, SEEK_END) < 0) {
    int err = errno;
    throw IoError(errors::io::kJournalWriteFailed, "failed to seek metadata journal", err);
  }
  if (good_end == 0) {
    WriteAll(fd_, kJournalMagic);
    SyncFileDescriptor(fd_);
    SyncDirectory(path_.parent_path().empty() ? std::filesystem::current_path()
                                              : path_.parent_path());
  }
}

void JournalMetadataStore::ReplayRecord(std::span<const uint8_t> body) {
  ByteReader reader(body);
  const auto kind = static_cast<MutationKind>(reader.GetU8());
  switch (kind) {
  case MutationKind::kCommit:
    ReplayCommit(DecodeCommit(reader));
    break;
  case MutationKind::kOpenPackage:
    ReplayOpenPackage(ReadPackage(reader));
    break;
  case MutationKind::kSealPackage:
    ReplaySealPackage(reader.GetString());
    break;
  case MutationKind::kDeleteFileset:
    ReplayDeleteFileset(reader.GetU64());
    break;
  case MutationKind::kRelocatePackage:
    ReplayRelocatePackage(DecodeRelocation(reader));
    break;
  default:
    throw IntegrityError(errors::integrity::kJournalCorrupt,
                         "unknown journal record kind " + std::to_string(static_cast<int>(kind)));
  }
  if (!reader.AtEnd()) {
    throw IntegrityError(errors::integrity::kJournalCorrupt, "journal record has trailing bytes");
  }
}

void JournalMetadataStore::AppendRecord(MutationKind kind, const std::vector<uint8_t>& payload) {
  std::vector<uint8_t> frame;
  if (payload.size() + 1 <= max_frame_body_) {
    frame.reserve(kFrameHeaderSize + payload.size() + 1 + kChecksumSize);
    AppendFrame(frame, static_cast<uint8_t>(kind), payload);
  } else {
    // All fragments go out in one write and one fsync; a torn run is dropped as a whole.
    std::vector<uint8_t> body;
    body.reserve(payload.size() + 1);
    body.push_back(static_cast<uint8_t>(kind));
    body.insert(body.end(), payload.begin(), payload.end());
    const size_t slice = max_frame_body_ - 1;
    const size_t frames = (body.size() + slice - 1) / slice;
    frame.reserve(body.size() + frames * (kFrameHeaderSize + 1 + kChecksumSize));
    std::span<const uint8_t> rest(body);
    while (!rest.empty()) {
      const size_t take = std::min(slice, rest.size());
      AppendFrame(frame, take == rest.size() ? kFragmentEndKind : kFragmentKind,
                  rest.first(take));
      rest = rest.subspan(take);
    }
  }

  const off_t before = ::lseek(fd_, 0, SEEK_END);
  try {
    WriteAll(fd_, frame);
    SyncFileDescriptor(fd_);
  } catch (const IoError&) {
    // Drop the partial frame so the next record starts on a clean boundary.
    if (before >= 0 && ::ftruncate(fd_, before) == 0) {
      ::lseek(fd_, before, SEEK_SET);
    }
    throw;
  }
}

void JournalMetadataStore::PersistCommit(const FileCommit& applied) {
  AppendRecord(MutationKind::kCommit, EncodeCommit(applied));
}

void JournalMetadataStore::PersistOpenPackage(const RootPackage& package) {
  ByteWriter w;
  WritePackage(w, package);
  AppendRecord(MutationKind::kOpenPackage, w.bytes());
}

void JournalMetadataStore::PersistSealPackage(const std::string& key) {
  ByteWriter w;
  w.PutString(key);
  AppendRecord(MutationKind::kSealPackage, w.bytes());
}

void JournalMetadataStore::PersistDeleteFileset(uint64_t id) {
  ByteWriter w;
  w.PutU64(id);
  AppendRecord(MutationKind::kDeleteFileset, w.bytes());
}

void JournalMetadataStore::PersistRelocatePackage(const PackageRelocation& relocation) {
  AppendRecord(MutationKind::kRelocatePackage, EncodeRelocation(relocation));
}

} // namespace pv::metadata
