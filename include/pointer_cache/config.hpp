#pragma once

#include "pointer_cache/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace pointer_cache {

// Largest millisecond count accepted for a TTL or sweep interval: half of
// what Duration can hold, so adding it to a clock reading cannot overflow.
inline constexpr std::int64_t kMaxDurationMs =
    std::chrono::duration_cast<std::chrono::milliseconds>(Duration::max())
        .count() /
    2;

struct CacheConfig {
  // Required; a cache with a zero limit cannot be built.
  std::size_t memory_limit_bytes{0};
  // Maximum number of entries, 0 = unbounded.
  std::size_t capacity{0};
  // Period of the background sweep, 0 = no sweeper.
  std::chrono::milliseconds cleanup_interval{0};
  // TTL applied when an insert passes kDefaultExpiration. Zero or negative
  // means such entries never expire.
  Duration default_expiration{0};
  std::string eviction_policy{"fifo"};
};

bool validate_config(const CacheConfig &cfg, std::string *err = nullptr);

// Reads a flat JSON object. Keys that are absent keep the value already in
// `out`; on failure `out` is left untouched.
bool parse_config_json(const std::string &text, CacheConfig &out,
                       std::string *err = nullptr);
bool load_config_file(const std::string &path, CacheConfig &out,
                      std::string *err = nullptr);

std::string describe_config(const CacheConfig &cfg);

} // namespace pointer_cache
