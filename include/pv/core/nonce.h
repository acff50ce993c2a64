#pragma once
#include <array>
#include <atomic>
#include <cstdint>
#include <span>

namespace pv::core {

inline constexpr size_t kFileSaltSize = 32;
inline constexpr size_t kFileKeySize = 32;

// Per-file key schedule for block encryption. A fresh random salt selects a per-file
// subkey (HKDF-SHA256 over the master key) and a monotonic counter supplies the nonce,
// so a (key, nonce) pair can never repeat across blocks or files.
class NonceSequence {
public:
  using Salt = std::array<uint8_t, kFileSaltSize>;

  explicit NonceSequence(std::span<const uint8_t> master_key);
  NonceSequence(std::span<const uint8_t> master_key, const Salt& salt);
  ~NonceSequence();

  NonceSequence(const NonceSequence&) = delete;
  NonceSequence& operator=(const NonceSequence&) = delete;

  // Returns the next unused counter value. Safe to call from several encoder threads.
  uint64_t Reserve();

  const Salt& salt() const noexcept { return salt_; }
  std::span<const uint8_t> key() const noexcept { return {key_.data(), key_.size()}; }
  uint64_t issued() const noexcept { return next_.load(std::memory_order_relaxed); }

  // Big-endian counter in the last eight bytes, zero bytes before it.
  static void FillNonce(uint64_t counter, std::span<uint8_t> out);

private:
  Salt salt_{};
  std::array<uint8_t, kFileKeySize> key_{};
  std::atomic<uint64_t> next_{0};
};

std::array<uint8_t, kFileKeySize> DeriveFileKey(std::span<const uint8_t> master_key,
                                                std::span<const uint8_t> salt);

} // namespace pv::core
