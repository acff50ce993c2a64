#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace pv {
  enum class ErrorDomain : std::uint16_t {
    IO = 0x01,
    Integrity = 0x02,
    Cancelled = 0x03,
    Conflict = 0x04,
    Crypto = 0x05,
    Validation = 0x06,
    Config = 0x07,
    State = 0x08,
    Internal = 0x7F
  };

  // Each domain reserves a span of codes so propagated errno values never collide with
  // framework codes. Codes inside the reserved range are stable across releases.
  inline constexpr int kErrorDomainSpan = 0x0100;

  inline constexpr int ErrorDomainBase(ErrorDomain domain) {
    return static_cast<int>(domain) * kErrorDomainSpan;
  }

  inline constexpr int ErrorDomainMax(ErrorDomain domain) {
    return ErrorDomainBase(domain) + kErrorDomainSpan - 1;
  }

  inline constexpr bool IsFrameworkErrorCode(ErrorDomain domain, int code) {
    return code >= ErrorDomainBase(domain) && code <= ErrorDomainMax(domain);
  }

  const char* ErrorDomainName(ErrorDomain domain);

  enum class Retryability : std::uint8_t {
    kFatal = 0,
    kTransient,
    kRetryable
  };

  namespace errors {
    inline constexpr int Make(ErrorDomain domain, int offset) {
      return ErrorDomainBase(domain) + offset;
    }

    namespace io {
      inline constexpr int kSourceOpenFailed = Make(ErrorDomain::IO, 0x01);
      inline constexpr int kSourceReadFailed = Make(ErrorDomain::IO, 0x02);
      inline constexpr int kSourceChanged = Make(ErrorDomain::IO, 0x03);
      inline constexpr int kBlobOpenFailed = Make(ErrorDomain::IO, 0x04);
      inline constexpr int kBlobWriteFailed = Make(ErrorDomain::IO, 0x05);
      inline constexpr int kBlobReadFailed = Make(ErrorDomain::IO, 0x06);
      inline constexpr int kBlobSyncFailed = Make(ErrorDomain::IO, 0x07);
      inline constexpr int kBlobMissing = Make(ErrorDomain::IO, 0x08);
      inline constexpr int kJournalWriteFailed = Make(ErrorDomain::IO, 0x09);
      inline constexpr int kOutputWriteFailed = Make(ErrorDomain::IO, 0x0A);
    } // namespace io

    namespace integrity {
      inline constexpr int kBlockHashMismatch = Make(ErrorDomain::Integrity, 0x01);
      inline constexpr int kFileHashMismatch = Make(ErrorDomain::Integrity, 0x02);
      inline constexpr int kAuthenticationFailed = Make(ErrorDomain::Integrity, 0x03);
      inline constexpr int kMalformedBlock = Make(ErrorDomain::Integrity, 0x04);
      inline constexpr int kBlockSequenceGap = Make(ErrorDomain::Integrity, 0x05);
      inline constexpr int kLengthMismatch = Make(ErrorDomain::Integrity, 0x06);
      inline constexpr int kJournalCorrupt = Make(ErrorDomain::Integrity, 0x07);
    } // namespace integrity

    namespace cancelled {
      inline constexpr int kRequested = Make(ErrorDomain::Cancelled, 0x01);
    } // namespace cancelled

    namespace conflict {
      inline constexpr int kDuplicateCanonical = Make(ErrorDomain::Conflict, 0x01);
      inline constexpr int kRegistrationRetriesExhausted = Make(ErrorDomain::Conflict, 0x02);
      inline constexpr int kPackageSealed = Make(ErrorDomain::Conflict, 0x03);
      inline constexpr int kTargetExists = Make(ErrorDomain::Conflict, 0x04);
    } // namespace conflict

    namespace validation {
      inline constexpr int kInvalidChunkParams = Make(ErrorDomain::Validation, 0x01);
      inline constexpr int kFileTooLarge = Make(ErrorDomain::Validation, 0x02);
      inline constexpr int kInvalidRange = Make(ErrorDomain::Validation, 0x03);
      inline constexpr int kInvalidKey = Make(ErrorDomain::Validation, 0x04);
    } // namespace validation

    namespace config {
      inline constexpr int kUnknownAlgorithm = Make(ErrorDomain::Config, 0x01);
      inline constexpr int kUnavailableAlgorithm = Make(ErrorDomain::Config, 0x02);
      inline constexpr int kInvalidValue = Make(ErrorDomain::Config, 0x03);
      inline constexpr int kMissingKey = Make(ErrorDomain::Config, 0x04);
    } // namespace config

    namespace state {
      inline constexpr int kNotFound = Make(ErrorDomain::State, 0x01);
      inline constexpr int kPoolStopped = Make(ErrorDomain::State, 0x02);
      inline constexpr int kPackageBusy = Make(ErrorDomain::State, 0x03);
    } // namespace state

  } // namespace errors

  struct Error : public std::runtime_error {
    ErrorDomain domain;
    int code;
    std::optional<int> native_code;
    Retryability retryability{Retryability::kFatal};
    std::vector<std::string> context;
    explicit Error(ErrorDomain d, int c, std::string msg,
                   std::optional<int> native = std::nullopt,
                   Retryability retry = Retryability::kFatal,
                   std::vector<std::string> ctx = {})
        : std::runtime_error(std::move(msg)),
          domain(d),
          code(c),
          native_code(native),
          retryability(retry),
          context(std::move(ctx)) {}
  };

  struct IoError : public Error {
    explicit IoError(int c, std::string msg, std::optional<int> native = std::nullopt,
                     Retryability retry = Retryability::kFatal)
        : Error(ErrorDomain::IO, c, std::move(msg), native, retry) {}
  };

  struct IntegrityError : public Error {
    explicit IntegrityError(int c, std::string msg)
        : Error(ErrorDomain::Integrity, c, std::move(msg)) {}
  };

  struct AuthenticationFailureError : public IntegrityError {
    explicit AuthenticationFailureError(const std::string& msg)
        : IntegrityError(errors::integrity::kAuthenticationFailed, msg) {}
  };

  struct CancellationError : public Error {
    explicit CancellationError(std::string msg = "operation cancelled")
        : Error(ErrorDomain::Cancelled, errors::cancelled::kRequested, std::move(msg)) {}
  };

  struct ConcurrencyConflict : public Error {
    explicit ConcurrencyConflict(int c, std::string msg)
        : Error(ErrorDomain::Conflict, c, std::move(msg), std::nullopt,
                Retryability::kRetryable) {}
  };

  // Classifies an errno value from a storage call. EINTR/EAGAIN/EBUSY/ETIMEDOUT are transient.
  Retryability ClassifyNativeError(int native_code) noexcept;

  // Appends a frame to the context trail and rethrows the original exception type.
  [[noreturn]] void RethrowWithContext(const Error& error, std::string frame);
} // namespace pv
