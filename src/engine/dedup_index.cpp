#include "pv/engine/dedup_index.h"

#include "pv/error.h"

namespace pv::engine {

const char* RegistrationKindName(RegistrationKind kind) {
  switch (kind) {
  case RegistrationKind::kCanonical:
    return "canonical";
  case RegistrationKind::kShadow:
    return "shadow";
  }
  return "unknown";
}

DedupIndex::DedupIndex(MetadataCoordinator& coordinator, int max_attempts)
    : coordinator_(coordinator), max_attempts_(max_attempts) {}

std::optional<metadata::Fileset> DedupIndex::Lookup(const std::string& hash) {
  return coordinator_.store().FindFilesetByHash(hash);
}

void DedupIndex::Release(const std::string& hash, std::promise<void>& claim) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    in_flight_.erase(hash);
  }
  claim.set_value();
}

Registration DedupIndex::Register(const std::string& hash, const metadata::Fileset& draft,
                                  const ContentWriter& writer) {
  metadata::Fileset request = draft;
  request.hash = hash;

  for (int attempt = 0; attempt < max_attempts_; ++attempt) {
    std::optional<metadata::Fileset> canonical;
    std::shared_future<void> owner_done;
    std::promise<void> claim;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      canonical = coordinator_.store().FindFilesetByHash(hash);
      if (!canonical) {
        auto it = in_flight_.find(hash);
        if (it != in_flight_.end()) {
          owner_done = it->second;
        } else {
          in_flight_.emplace(hash, claim.get_future().share());
        }
      }
    }

    if (canonical) {
      try {
        return Registration{coordinator_.CommitShadow(request, *canonical),
                            RegistrationKind::kShadow};
      } catch (const Error& error) {
        // The canonical was deleted after the lookup; look the hash up again.
        if (error.domain != ErrorDomain::State || error.code != errors::state::kNotFound) {
          throw;
        }
        continue;
      }
    }
    if (owner_done.valid()) {
      // Another caller is storing this content; re-check once it finishes either way.
      owner_done.wait();
      continue;
    }

    try {
      metadata::Fileset stored = writer(request);
      Release(hash, claim);
      return Registration{std::move(stored), RegistrationKind::kCanonical};
    } catch (const ConcurrencyConflict& conflict) {
      Release(hash, claim);
      if (conflict.code != errors::conflict::kDuplicateCanonical) {
        throw;
      }
    } catch (...) {
      Release(hash, claim);
      throw;
    }
  }
  throw ConcurrencyConflict(errors::conflict::kRegistrationRetriesExhausted,
                            "could not register content " + hash + " after " +
                                std::to_string(max_attempts_) + " attempts");
}

} // namespace pv::engine
