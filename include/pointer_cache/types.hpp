#pragma once

#include <any>
#include <chrono>
#include <cstddef>
#include <optional>

namespace pointer_cache {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::nanoseconds;

// TTL arguments: zero selects the configured default, any negative value
// (canonically kNoExpiration) stores the entry without a deadline.
inline constexpr Duration kDefaultExpiration{0};
inline constexpr Duration kNoExpiration{-1};

// Per-entry bookkeeping charged on top of key and value.
inline constexpr std::size_t kEntryOverheadBytes = sizeof(void *);

struct Entry {
  std::any value;
  std::optional<TimePoint> ttl_deadline;
  std::size_t size_bytes{0};

  bool expired(TimePoint now) const {
    return ttl_deadline.has_value() && *ttl_deadline <= now;
  }
};

} // namespace pointer_cache
