#include "pointer_cache/size_estimator.hpp"

namespace pointer_cache {

std::size_t map_bucket_count(std::size_t entries) {
  // 6.5 entries per bucket, compared as 13 / 2 to stay in integers.
  std::size_t buckets = 1;
  while (buckets * 13 < entries * 2)
    buckets <<= 1;
  return buckets;
}

bool SizeEstimator::visit(const void *address, std::type_index type) {
  return seen_.emplace(address, type).second;
}

} // namespace pointer_cache
