#pragma once
#include <atomic>
#include <memory>
#include <string>

#include "pv/error.h"

namespace pv::core {

// Copyable handle to a shared abort flag. A default-constructed token can still be
// cancelled; copies observe the same flag.
class CancellationToken {
public:
  CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

  void Cancel() noexcept { flag_->store(true, std::memory_order_release); }
  bool IsCancelled() const noexcept { return flag_->load(std::memory_order_acquire); }

  void ThrowIfCancelled(const char* where) const {
    if (IsCancelled()) {
      throw CancellationError(std::string("cancelled during ") + where);
    }
  }

private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace pv::core
