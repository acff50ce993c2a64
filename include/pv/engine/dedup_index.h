#pragma once

#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "pv/engine/metadata_coordinator.h"
#include "pv/metadata/records.h"

namespace pv::engine {

enum class RegistrationKind : uint8_t { kCanonical, kShadow };

const char* RegistrationKindName(RegistrationKind kind);

struct Registration {
  metadata::Fileset fileset;
  RegistrationKind kind{RegistrationKind::kCanonical};
};

// Stores the content of a new canonical Fileset and returns it once committed.
using ContentWriter = std::function<metadata::Fileset(const metadata::Fileset& draft)>;

// Whole-file hash -> canonical Fileset. Register() is an atomic check-and-insert per hash:
// one caller owns a hash while its content is written, concurrent callers for the same hash
// wait for it and then register as shadows.
class DedupIndex {
public:
  explicit DedupIndex(MetadataCoordinator& coordinator, int max_attempts = 4);

  std::optional<metadata::Fileset> Lookup(const std::string& hash);

  // |draft| carries key, source key, size, hash and timestamps. |writer| runs only when this
  // call becomes the owner of |hash|.
  Registration Register(const std::string& hash, const metadata::Fileset& draft,
                        const ContentWriter& writer);

private:
  void Release(const std::string& hash, std::promise<void>& claim);

  MetadataCoordinator& coordinator_;
  int max_attempts_;
  std::mutex mutex_;
  std::unordered_map<std::string, std::shared_future<void>> in_flight_;
};

} // namespace pv::engine
