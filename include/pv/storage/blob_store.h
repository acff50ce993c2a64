#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

#include "pv/log/event_bus.h"

namespace pv::storage {

// Append-only, byte-addressable container storage keyed by relative path.
class BlobStore {
public:
  virtual ~BlobStore() = default;

  // Appends |bytes| contiguously and returns the offset of the first byte. On failure no
  // partial bytes remain, so the call can be retried.
  virtual uint64_t Append(const std::string& key, std::span<const uint8_t> bytes) = 0;
  virtual std::vector<uint8_t> Read(const std::string& key, uint64_t offset, uint64_t length) = 0;
  virtual uint64_t Size(const std::string& key) = 0;
  virtual bool Exists(const std::string& key) = 0;
  virtual void Truncate(const std::string& key, uint64_t size) = 0;
  // Makes previously appended bytes durable.
  virtual void Flush(const std::string& key) = 0;
  // Deletes the blob. Removing an absent key is not an error.
  virtual void Remove(const std::string& key) = 0;
};

// Blob store over a local directory; each key maps to one file below |root|. Failures that
// cannot be raised to the caller, such as a failed append rollback, are published on |bus|.
class LocalBlobStore : public BlobStore {
public:
  explicit LocalBlobStore(std::filesystem::path root, log::EventBus* bus = nullptr);
  ~LocalBlobStore() override;

  LocalBlobStore(const LocalBlobStore&) = delete;
  LocalBlobStore& operator=(const LocalBlobStore&) = delete;

  uint64_t Append(const std::string& key, std::span<const uint8_t> bytes) override;
  std::vector<uint8_t> Read(const std::string& key, uint64_t offset, uint64_t length) override;
  uint64_t Size(const std::string& key) override;
  bool Exists(const std::string& key) override;
  void Truncate(const std::string& key, uint64_t size) override;
  void Flush(const std::string& key) override;
  void Remove(const std::string& key) override;

  std::filesystem::path PathFor(const std::string& key) const;

private:
  struct Handle {
    int fd{-1};
    std::mutex mutex;
  };

  std::shared_ptr<Handle> WriteHandle(const std::string& key);

  std::filesystem::path root_;
  log::EventBus* bus_;
  std::mutex handles_mutex_;
  std::unordered_map<std::string, std::shared_ptr<Handle>> handles_;
};

} // namespace pv::storage
