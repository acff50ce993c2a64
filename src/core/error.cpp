#include "pv/error.h"

#include <cerrno>

namespace pv {

const char* ErrorDomainName(ErrorDomain domain) {
  switch (domain) {
  case ErrorDomain::IO:
    return "io";
  case ErrorDomain::Integrity:
    return "integrity";
  case ErrorDomain::Cancelled:
    return "cancelled";
  case ErrorDomain::Conflict:
    return "conflict";
  case ErrorDomain::Crypto:
    return "crypto";
  case ErrorDomain::Validation:
    return "validation";
  case ErrorDomain::Config:
    return "config";
  case ErrorDomain::State:
    return "state";
  case ErrorDomain::Internal:
    return "internal";
  }
  return "internal";
}

Retryability ClassifyNativeError(int native_code) noexcept {
  switch (native_code) {
  case EINTR:
  case EAGAIN:
  case EBUSY:
  case ETIMEDOUT:
    return Retryability::kTransient;
  case ENOSPC:
  case EDQUOT:
    return Retryability::kRetryable;
  default:
    return Retryability::kFatal;
  }
}

void RethrowWithContext(const Error& error, std::string frame) {
  auto ctx = error.context;
  ctx.push_back(std::move(frame));
  switch (error.domain) {
  case ErrorDomain::IO: {
    IoError copy(error.code, error.what(), error.native_code, error.retryability);
    copy.context = std::move(ctx);
    throw copy;
  }
  case ErrorDomain::Integrity: {
    IntegrityError copy(error.code, error.what());
    copy.context = std::move(ctx);
    throw copy;
  }
  case ErrorDomain::Cancelled: {
    CancellationError copy(error.what());
    copy.context = std::move(ctx);
    throw copy;
  }
  case ErrorDomain::Conflict: {
    ConcurrencyConflict copy(error.code, error.what());
    copy.context = std::move(ctx);
    throw copy;
  }
  default:
    throw Error(error.domain, error.code, error.what(), error.native_code, error.retryability,
                std::move(ctx));
  }
}

} // namespace pv
