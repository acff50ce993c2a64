#include "pv/storage/blob_store.h"

#include <cerrno>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "pv/common.h"
#include "pv/error.h"

namespace pv::storage {

namespace {

[[noreturn]] void ThrowIo(int code, const std::string& message, int err) {
  throw IoError(code, message + ": " + std::system_category().message(err), err,
                ClassifyNativeError(err));
}

// Cuts a file back to its pre-append size unless the append completed. A rollback that fails
// leaves stray bytes past the committed size; it is published so orphan reclamation can be
// traced back to it.
class AppendRollbackGuard {
 public:
  AppendRollbackGuard(int fd, off_t rollback_size, const std::string& key, log::EventBus* bus)
      : fd_(fd), rollback_size_(rollback_size), key_(key), bus_(bus) {}

  AppendRollbackGuard(const AppendRollbackGuard&) = delete;
  AppendRollbackGuard& operator=(const AppendRollbackGuard&) = delete;

  ~AppendRollbackGuard() {
    if (committed_ || ::ftruncate(fd_, rollback_size_) == 0) {
      return;
    }
    const int err = errno;
    log::Event event;
    event.category = log::EventCategory::kStorage;
    event.severity = log::EventSeverity::kError;
    event.event_id = "append_rollback_failed";
    event.message = "append rollback failed: " + std::system_category().message(err);
    event.fields.emplace_back("package", key_);
    event.fields.emplace_back("error_code", std::to_string(err), log::FieldPrivacy::kPublic,
                              true);
    event.fields.emplace_back("rollback_size", std::to_string(rollback_size_),
                              log::FieldPrivacy::kPublic, true);
    log::Publish(bus_, std::move(event));
  }

  void Commit() noexcept { committed_ = true; }

 private:
  int fd_;
  off_t rollback_size_;
  const std::string& key_;
  log::EventBus* bus_;
  bool committed_{false};
};

void ValidateKey(const std::string& key) {
  if (key.empty() || key.front() == '/' || key.find("..") != std::string::npos) {
    throw Error{ErrorDomain::Validation, errors::validation::kInvalidKey,
                "invalid blob key: " + key};
  }
}

} // namespace

LocalBlobStore::LocalBlobStore(std::filesystem::path root, log::EventBus* bus)
    : root_(std::move(root)), bus_(bus) {
  std::error_code ec;
  std::filesystem::create_directories(root_, ec);
  if (ec) {
    throw IoError(errors::io::kBlobOpenFailed,
                  "failed to create blob root " + PathToUtf8String(root_), ec.value());
  }
}

LocalBlobStore::~LocalBlobStore() {
  std::lock_guard<std::mutex> lock(handles_mutex_);
  for (auto& [key, handle] : handles_) {
    if (handle->fd >= 0) {
      ::close(handle->fd);
    }
  }
}

std::filesystem::path LocalBlobStore::PathFor(const std::string& key) const {
  ValidateKey(key);
  return root_ / key;
}

std::shared_ptr<LocalBlobStore::Handle> LocalBlobStore::WriteHandle(const std::string& key) {
  std::lock_guard<std::mutex> lock(handles_mutex_);
  auto it = handles_.find(key);
  if (it != handles_.end()) {
    return it->second;
  }
  const auto path = PathFor(key);
  std::error_code ec;
  std::filesystem::create_directories(path.parent_path(), ec);
  if (ec) {
    throw IoError(errors::io::kBlobOpenFailed,
                  "failed to create package directory " + PathToUtf8String(path.parent_path()),
                  ec.value());
  }
  int fd = ::open(path.c_str(), O_RDWR | O_CREAT, 0600);
  if (fd < 0) {
    ThrowIo(errors::io::kBlobOpenFailed, "failed to open package " + key, errno);
  }
  auto handle = std::make_shared<Handle>();
  handle->fd = fd;
  handles_.emplace(key, handle);
  return handle;
}

uint64_t LocalBlobStore::Append(const std::string& key, std::span<const uint8_t> bytes) {
  auto handle = WriteHandle(key);
  std::lock_guard<std::mutex> lock(handle->mutex);
  const off_t start = ::lseek(handle->fd, 0, SEEK_END);
  if (start < 0) {
    ThrowIo(errors::io::kBlobWriteFailed, "failed to seek package " + key, errno);
  }
  AppendRollbackGuard guard(handle->fd, start, key, bus_);
  size_t offset = 0;
  while (offset < bytes.size()) {
    ssize_t written = ::pwrite(handle->fd, bytes.data() + offset, bytes.size() - offset,
                               start + static_cast<off_t>(offset));
    if (written < 0) {
      if (errno == EINTR) {
        continue;
      }
      ThrowIo(errors::io::kBlobWriteFailed, "failed to append to package " + key, errno);
    }
    if (written == 0) {
      throw IoError(errors::io::kBlobWriteFailed, "short write to package " + key);
    }
    offset += static_cast<size_t>(written);
  }
  guard.Commit();
  return static_cast<uint64_t>(start);
}

std::vector<uint8_t> LocalBlobStore::Read(const std::string& key, uint64_t offset,
                                          uint64_t length) {
  const auto path = PathFor(key);
  int fd = ::open(path.c_str(), O_RDONLY);
  if (fd < 0) {
    const int err = errno;
    if (err == ENOENT) {
      throw IoError(errors::io::kBlobMissing, "package not found: " + key, err);
    }
    ThrowIo(errors::io::kBlobOpenFailed, "failed to open package " + key, err);
  }
  std::vector<uint8_t> out(static_cast<size_t>(length));
  size_t done = 0;
  int read_error = 0;
  while (done < out.size()) {
    ssize_t got = ::pread(fd, out.data() + done, out.size() - done,
                          static_cast<off_t>(offset + done));
    if (got < 0) {
      if (errno == EINTR) {
        continue;
      }
      read_error = errno;
      break;
    }
    if (got == 0) {
      break;
    }
    done += static_cast<size_t>(got);
  }
  ::close(fd);
  if (read_error != 0) {
    ThrowIo(errors::io::kBlobReadFailed, "failed to read package " + key, read_error);
  }
  if (done != out.size()) {
    throw IoError(errors::io::kBlobReadFailed,
                  "package " + key + " ends before requested range " + std::to_string(offset) +
                      "+" + std::to_string(length));
  }
  return out;
}

uint64_t LocalBlobStore::Size(const std::string& key) {
  const auto path = PathFor(key);
  struct stat info {};
  if (::stat(path.c_str(), &info) != 0) {
    const int err = errno;
    if (err == ENOENT) {
      return 0;
    }
    ThrowIo(errors::io::kBlobOpenFailed, "failed to stat package " + key, err);
  }
  return static_cast<uint64_t>(info.st_size);
}

bool LocalBlobStore::Exists(const std::string& key) {
  std::error_code ec;
  return std::filesystem::exists(PathFor(key), ec);
}

void LocalBlobStore::Truncate(const std::string& key, uint64_t size) {
  auto handle = WriteHandle(key);
  std::lock_guard<std::mutex> lock(handle->mutex);
  if (::ftruncate(handle->fd, static_cast<off_t>(size)) != 0) {
    ThrowIo(errors::io::kBlobWriteFailed, "failed to truncate package " + key, errno);
  }
}

void LocalBlobStore::Flush(const std::string& key) {
  auto handle = WriteHandle(key);
  std::lock_guard<std::mutex> lock(handle->mutex);
  for (;;) {
    if (::fsync(handle->fd) == 0) {
      return;
    }
    if (errno != EINTR) {
      ThrowIo(errors::io::kBlobSyncFailed, "failed to fsync package " + key, errno);
    }
  }
}

void LocalBlobStore::Remove(const std::string& key) {
  const auto path = PathFor(key);
  std::shared_ptr<Handle> handle;
  {
    std::lock_guard<std::mutex> lock(handles_mutex_);
    auto it = handles_.find(key);
    if (it != handles_.end()) {
      handle = std::move(it->second);
      handles_.erase(it);
    }
  }
  if (handle) {
    std::lock_guard<std::mutex> lock(handle->mutex);
    ::close(handle->fd);
    handle->fd = -1;
  }
  if (::unlink(path.c_str()) != 0) {
    const int err = errno;
    if (err != ENOENT) {
      ThrowIo(errors::io::kBlobWriteFailed, "failed to remove package " + key, err);
    }
  }
}

} // namespace pv::storage
