#include "pv/metadata/records.h"

#include <cstdio>

namespace pv::metadata {

std::string MakePackageKey(const std::string& category, uint64_t index) {
  char bucket[3] = {0};
  std::snprintf(bucket, sizeof(bucket), "%02x", static_cast<unsigned>(index % 256));
  return category + bucket + "/" + std::to_string(index);
}

} // namespace pv::metadata
