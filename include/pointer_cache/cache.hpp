#pragma once

#include "pointer_cache/config.hpp"
#include "pointer_cache/policy.hpp"
#include "pointer_cache/size_estimator.hpp"
#include "pointer_cache/sweeper.hpp"
#include "pointer_cache/types.hpp"

#include <any>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace pointer_cache {

struct CacheStats {
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  std::uint64_t evictions{0};
  std::uint64_t expirations{0};
  std::uint64_t removals{0};
};

struct CachedValue {
  std::any value;
  // Empty when the entry never expires.
  std::optional<TimePoint> expires_at;
};

// One entry of the initial contents handed to Cache::create.
struct SeedEntry {
  std::string key;
  std::any value;
  std::size_t value_bytes{0};
  Duration ttl{kDefaultExpiration};
};

template <typename T>
SeedEntry seed_entry(std::string key, T value,
                     Duration ttl = kDefaultExpiration) {
  const std::size_t bytes = estimate_size(value);
  return SeedEntry{std::move(key), std::any(std::move(value)), bytes, ttl};
}

// Thread-safe key/value cache bounded by entry count and estimated bytes.
//
// Every mutation runs under one exclusive lock and keeps three things in
// step: the entry map, the byte counter (sum of entry sizes) and the eviction
// policy's tracked keys (equal to the map's key set). Reads take the lock
// shared. Eviction callbacks run after the lock is released, so they may call
// back into the cache.
//
// Expired entries read as absent but stay resident, and keep counting against
// both limits, until remove(), an overwrite, eviction or erase_expired()
// drops them.
class Cache {
public:
  using EvictionCallback =
      std::function<void(const std::string &key, const std::any &value)>;

  // Builds the policy from cfg.eviction_policy. Returns nullptr and fills
  // `err` if the config is invalid.
  static std::unique_ptr<Cache> create(CacheConfig cfg,
                                       std::string *err = nullptr);
  // Uses a caller-supplied policy; cfg.eviction_policy is ignored.
  static std::unique_ptr<Cache> create(CacheConfig cfg,
                                       std::unique_ptr<IEvictionPolicy> policy,
                                       std::string *err = nullptr);
  // Starts from `seed`, inserted in order with the usual limits and
  // accounting. Fails if any seed entry is rejected.
  static std::unique_ptr<Cache> create(CacheConfig cfg,
                                       std::vector<SeedEntry> seed,
                                       std::string *err = nullptr);

private:
  struct Token {
    explicit Token() = default;
  };

public:
  Cache(Token, CacheConfig cfg, std::unique_ptr<IEvictionPolicy> policy);
  ~Cache();
  Cache(const Cache &) = delete;
  Cache &operator=(const Cache &) = delete;

  // Inserts or overwrites. Capacity and memory limits are enforced by evicting
  // policy victims; if the limits cannot be met the cache is left unchanged
  // and false is returned with a "policy exhausted" reason.
  template <typename T>
  bool set(const std::string &key, T value, Duration ttl = kDefaultExpiration,
           std::string *err = nullptr) {
    const std::size_t bytes = estimate_size(value);
    return set_any(key, std::any(std::move(value)), bytes, ttl, err);
  }
  template <typename T>
  bool set_default(const std::string &key, T value,
                   std::string *err = nullptr) {
    return set(key, std::move(value), kDefaultExpiration, err);
  }
  // Fails with "already exists" if a live entry holds the key.
  template <typename T>
  bool add(const std::string &key, T value, Duration ttl = kDefaultExpiration,
           std::string *err = nullptr) {
    const std::size_t bytes = estimate_size(value);
    return add_any(key, std::any(std::move(value)), bytes, ttl, err);
  }
  // Fails with "not found" unless a live entry holds the key. The key moves
  // to the policy's least vulnerable position.
  template <typename T>
  bool replace(const std::string &key, T value,
               Duration ttl = kDefaultExpiration, std::string *err = nullptr) {
    const std::size_t bytes = estimate_size(value);
    return replace_any(key, std::any(std::move(value)), bytes, ttl, err);
  }

  // Explicit-size variants for payloads the estimator cannot decompose.
  // `value_bytes` covers the payload only; key and entry overhead are added.
  bool set_any(const std::string &key, std::any value, std::size_t value_bytes,
               Duration ttl = kDefaultExpiration, std::string *err = nullptr);
  bool add_any(const std::string &key, std::any value, std::size_t value_bytes,
               Duration ttl = kDefaultExpiration, std::string *err = nullptr);
  bool replace_any(const std::string &key, std::any value,
                   std::size_t value_bytes, Duration ttl = kDefaultExpiration,
                   std::string *err = nullptr);

  std::optional<std::any> get(const std::string &key) const;
  template <typename T> std::optional<T> get_as(const std::string &key) const {
    auto value = get(key);
    if (!value.has_value())
      return std::nullopt;
    if (const T *typed = std::any_cast<T>(&*value))
      return *typed;
    return std::nullopt;
  }
  std::optional<CachedValue> get_with_expiration(const std::string &key) const;

  // Returns whether an entry was removed. Notifies the eviction callback.
  bool remove(const std::string &key);
  // Drops every expired entry and returns how many were dropped.
  std::size_t erase_expired();
  void clear();

  std::size_t size() const;
  std::size_t memory_used() const;
  // Pass an empty function to disable notifications.
  void on_evicted(EvictionCallback callback);

  // Stops the background sweeper. Idempotent; the cache stays usable.
  void close();
  bool sweeper_running() const;

  CacheStats stats() const;
  std::string info() const;
  const CacheConfig &config() const { return cfg_; }
  std::string policy_name() const;

private:
  enum class WriteMode { Upsert, InsertIfAbsent, ReplaceExisting };

  struct Evicted {
    std::string key;
    std::any value;
  };

  Entry make_entry(const std::string &key, std::any value,
                   std::size_t value_bytes, Duration ttl, TimePoint now) const;
  bool write(WriteMode mode, const std::string &key, std::any value,
             std::size_t value_bytes, Duration ttl, std::string *err);
  bool insert_locked(const std::string &key, Entry entry,
                     std::vector<Evicted> &evicted, std::string *err);
  Entry detach_locked(std::unordered_map<std::string, Entry>::iterator it);
  void evict_locked(const std::string &key, std::vector<Evicted> &evicted);
  std::optional<TimePoint> deadline_for(Duration ttl, TimePoint now) const;
  static void notify(const EvictionCallback &callback,
                     const std::vector<Evicted> &evicted);

  CacheConfig cfg_;
  std::unique_ptr<IEvictionPolicy> policy_;
  std::unordered_map<std::string, Entry> entries_;
  std::size_t memory_used_{0};
  EvictionCallback on_evicted_;
  mutable std::shared_mutex mu_;
  std::unique_ptr<Sweeper> sweeper_;

  mutable std::atomic<std::uint64_t> hits_{0};
  mutable std::atomic<std::uint64_t> misses_{0};
  std::atomic<std::uint64_t> evictions_{0};
  std::atomic<std::uint64_t> expirations_{0};
  std::atomic<std::uint64_t> removals_{0};
};

} // namespace pointer_cache
