#include "pv/crypto/random.h"

#include <algorithm>
#include <cerrno>
#include <string>

#if defined(__linux__) || defined(__ANDROID__)
#include <sys/random.h>
#endif

#include <openssl/err.h>
#include <openssl/rand.h>

#include "pv/error.h"

namespace pv::crypto {

namespace {

#if defined(__linux__) || defined(__ANDROID__)
bool FillFromGetrandom(std::span<uint8_t> out) {
  size_t offset = 0;
  while (offset < out.size()) {
    ssize_t got = ::getrandom(out.data() + offset, out.size() - offset, 0);
    if (got < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    offset += static_cast<size_t>(got);
  }
  return true;
}
#endif

} // namespace

void SystemRandomBytes(std::span<uint8_t> out) {
  if (out.empty()) {
    return;
  }
#if defined(__linux__) || defined(__ANDROID__)
  if (FillFromGetrandom(out)) {
    return;
  }
#endif
  // RAND_bytes takes an int length; request in bounded slices.
  constexpr size_t kMaxSlice = 1u << 20;
  size_t offset = 0;
  while (offset < out.size()) {
    size_t slice = std::min(kMaxSlice, out.size() - offset);
    if (RAND_bytes(out.data() + offset, static_cast<int>(slice)) != 1) {
      throw Error{ErrorDomain::Crypto, 0,
                  "RAND_bytes failed: " + std::to_string(ERR_get_error())};
    }
    offset += slice;
  }
}

}  // namespace pv::crypto
