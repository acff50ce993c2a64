#include "pv/crypto/digest.h"

#include <array>
#include <cctype>
#include <utility>

#include <openssl/err.h>
#include <openssl/evp.h>

#include "pv/common.h"
#include "pv/error.h"

namespace pv::crypto {

namespace {

struct HashAlgorithmEntry {
  HashAlgorithm alg;
  const char* name;
  size_t digest_size;
};

constexpr std::array<HashAlgorithmEntry, 7> kHashAlgorithms{{
    {HashAlgorithm::SHA256, "SHA256", 32},
    {HashAlgorithm::SHA384, "SHA384", 48},
    {HashAlgorithm::SHA512, "SHA512", 64},
    {HashAlgorithm::SHA1, "SHA1", 20},
    {HashAlgorithm::MD5, "MD5", 16},
    {HashAlgorithm::SHA3_256, "SHA3", 32},
    {HashAlgorithm::BLAKE2b_512, "BLAKE2b", 64},
}};

const HashAlgorithmEntry& EntryFor(HashAlgorithm alg) {
  for (const auto& entry : kHashAlgorithms) {
    if (entry.alg == alg) {
      return entry;
    }
  }
  throw Error{ErrorDomain::Config, errors::config::kUnknownAlgorithm, "unknown hash algorithm id"};
}

const EVP_MD* ResolveDigest(HashAlgorithm alg) {
  switch (alg) {
  case HashAlgorithm::SHA256:
    return EVP_sha256();
  case HashAlgorithm::SHA384:
    return EVP_sha384();
  case HashAlgorithm::SHA512:
    return EVP_sha512();
  case HashAlgorithm::SHA1:
    return EVP_sha1();
  case HashAlgorithm::MD5:
    return EVP_md5();
  case HashAlgorithm::SHA3_256:
    return EVP_sha3_256();
  case HashAlgorithm::BLAKE2b_512:
    return EVP_blake2b512();
  }
  return nullptr;
}

[[noreturn]] void ThrowDigestError(const char* step) {
  unsigned long err = ERR_get_error();
  std::string message = std::string("digest failure: ") + step;
  if (err != 0) {
    char buf[256] = {0};
    ERR_error_string_n(err, buf, sizeof(buf));
    message.append(": ");
    message.append(buf);
  }
  throw Error{ErrorDomain::Crypto, 0, message};
}

bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (size_t i = 0; i < a.size(); ++i) {
    if (std::toupper(static_cast<unsigned char>(a[i])) !=
        std::toupper(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

} // namespace

const char* HashAlgorithmName(HashAlgorithm alg) { return EntryFor(alg).name; }

std::optional<HashAlgorithm> ParseHashAlgorithm(std::string_view name) {
  for (const auto& entry : kHashAlgorithms) {
    if (EqualsIgnoreCase(name, entry.name)) {
      return entry.alg;
    }
  }
  if (EqualsIgnoreCase(name, "SHA-256")) {
    return HashAlgorithm::SHA256;
  }
  if (EqualsIgnoreCase(name, "SHA3-256")) {
    return HashAlgorithm::SHA3_256;
  }
  return std::nullopt;
}

size_t DigestSize(HashAlgorithm alg) { return EntryFor(alg).digest_size; }

struct ContentHasher::State {
  struct Deleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
  };
  std::unique_ptr<EVP_MD_CTX, Deleter> ctx;
};

ContentHasher::ContentHasher(HashAlgorithm alg) : alg_(alg), state_(std::make_unique<State>()) {
  state_->ctx.reset(EVP_MD_CTX_new());
  if (!state_->ctx) {
    ThrowDigestError("EVP_MD_CTX_new");
  }
  const EVP_MD* md = ResolveDigest(alg);
  if (md == nullptr || EVP_DigestInit_ex(state_->ctx.get(), md, nullptr) != 1) {
    ThrowDigestError("EVP_DigestInit_ex");
  }
}

ContentHasher::~ContentHasher() = default;
ContentHasher::ContentHasher(ContentHasher&&) noexcept = default;
ContentHasher& ContentHasher::operator=(ContentHasher&&) noexcept = default;

void ContentHasher::Update(std::span<const uint8_t> data) {
  if (finalized_) {
    throw Error{ErrorDomain::State, 0, "ContentHasher updated after Finalize"};
  }
  if (data.empty()) {
    return;
  }
  if (EVP_DigestUpdate(state_->ctx.get(), data.data(), data.size()) != 1) {
    ThrowDigestError("EVP_DigestUpdate");
  }
  bytes_ += data.size();
}

std::vector<uint8_t> ContentHasher::Finalize() {
  if (finalized_) {
    throw Error{ErrorDomain::State, 0, "ContentHasher finalized twice"};
  }
  std::vector<uint8_t> digest(EVP_MAX_MD_SIZE);
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(state_->ctx.get(), digest.data(), &len) != 1) {
    ThrowDigestError("EVP_DigestFinal_ex");
  }
  finalized_ = true;
  digest.resize(len);
  return digest;
}

std::string ContentHasher::HexDigest() {
  auto digest = Finalize();
  return HexEncode(digest);
}

std::vector<uint8_t> HashBytes(HashAlgorithm alg, std::span<const uint8_t> data) {
  ContentHasher hasher(alg);
  hasher.Update(data);
  return hasher.Finalize();
}

std::string HashBytesHex(HashAlgorithm alg, std::span<const uint8_t> data) {
  return HexEncode(HashBytes(alg, data));
}

}  // namespace pv::crypto
