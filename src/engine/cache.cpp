#include "pointer_cache/cache.hpp"

#include <iterator>
#include <mutex>
#include <sstream>

namespace pointer_cache {
namespace {
void set_err(std::string *err, const std::string &msg) {
  if (err)
    *err = msg;
}
} // namespace

std::unique_ptr<Cache> Cache::create(CacheConfig cfg, std::string *err) {
  if (!validate_config(cfg, err))
    return nullptr;
  auto policy = make_policy_by_name(cfg.eviction_policy);
  return create(std::move(cfg), std::move(policy), err);
}

std::unique_ptr<Cache> Cache::create(CacheConfig cfg,
                                     std::unique_ptr<IEvictionPolicy> policy,
                                     std::string *err) {
  if (!policy) {
    set_err(err, "invalid config: eviction policy is required");
    return nullptr;
  }
  // The selector is not consulted when a policy is supplied.
  CacheConfig checked = cfg;
  checked.eviction_policy.clear();
  if (!validate_config(checked, err))
    return nullptr;
  cfg.eviction_policy = policy->name();
  if (policy->count() != 0) {
    set_err(err, "invalid config: eviction policy must start empty");
    return nullptr;
  }

  auto cache =
      std::make_unique<Cache>(Token{}, std::move(cfg), std::move(policy));
  if (cache->cfg_.cleanup_interval.count() > 0) {
    Cache *raw = cache.get();
    cache->sweeper_ = std::make_unique<Sweeper>(
        cache->cfg_.cleanup_interval, [raw] { raw->erase_expired(); });
    cache->sweeper_->start();
  }
  return cache;
}

std::unique_ptr<Cache> Cache::create(CacheConfig cfg,
                                     std::vector<SeedEntry> seed,
                                     std::string *err) {
  auto cache = create(std::move(cfg), err);
  if (!cache)
    return nullptr;
  // No callback can be registered yet, so seed-time evictions go unreported.
  std::vector<Evicted> evicted;
  std::unique_lock<std::shared_mutex> lock(cache->mu_);
  const auto now = Clock::now();
  for (auto &s : seed) {
    Entry entry = cache->make_entry(s.key, std::move(s.value), s.value_bytes,
                                    s.ttl, now);
    std::string reason;
    if (!cache->insert_locked(s.key, std::move(entry), evicted, &reason)) {
      set_err(err, reason + " (seeding " + s.key + ")");
      return nullptr;
    }
  }
  return cache;
}

Cache::Cache(Token, CacheConfig cfg, std::unique_ptr<IEvictionPolicy> policy)
    : cfg_(std::move(cfg)), policy_(std::move(policy)) {}

Cache::~Cache() { close(); }

bool Cache::set_any(const std::string &key, std::any value,
                    std::size_t value_bytes, Duration ttl, std::string *err) {
  return write(WriteMode::Upsert, key, std::move(value), value_bytes, ttl, err);
}

bool Cache::add_any(const std::string &key, std::any value,
                    std::size_t value_bytes, Duration ttl, std::string *err) {
  return write(WriteMode::InsertIfAbsent, key, std::move(value), value_bytes,
               ttl, err);
}

bool Cache::replace_any(const std::string &key, std::any value,
                        std::size_t value_bytes, Duration ttl,
                        std::string *err) {
  return write(WriteMode::ReplaceExisting, key, std::move(value), value_bytes,
               ttl, err);
}

bool Cache::write(WriteMode mode, const std::string &key, std::any value,
                  std::size_t value_bytes, Duration ttl, std::string *err) {
  const auto now = Clock::now();
  Entry entry = make_entry(key, std::move(value), value_bytes, ttl, now);

  std::vector<Evicted> evicted;
  EvictionCallback callback;
  {
    std::unique_lock<std::shared_mutex> lock(mu_);
    auto it = entries_.find(key);
    const bool live = it != entries_.end() && !it->second.expired(now);
    if (mode == WriteMode::InsertIfAbsent && live) {
      set_err(err, "already exists: " + key);
      return false;
    }
    if (mode == WriteMode::ReplaceExisting && !live) {
      set_err(err, "not found: " + key);
      return false;
    }
    if (!insert_locked(key, std::move(entry), evicted, err))
      return false;
    if (!evicted.empty())
      callback = on_evicted_;
  }
  notify(callback, evicted);
  return true;
}

Entry Cache::make_entry(const std::string &key, std::any value,
                        std::size_t value_bytes, Duration ttl,
                        TimePoint now) const {
  Entry entry;
  entry.value = std::move(value);
  entry.ttl_deadline = deadline_for(ttl, now);
  entry.size_bytes = value_bytes + estimate_size(key) + kEntryOverheadBytes;
  return entry;
}

// Every check that can fail runs before the first mutation. Past that point
// the only way out is success, because the new key is the policy's least
// vulnerable and the entry fits in the limit on its own.
bool Cache::insert_locked(const std::string &key, Entry entry,
                          std::vector<Evicted> &evicted, std::string *err) {
  const std::size_t limit = cfg_.memory_limit_bytes;
  if (limit > 0 && entry.size_bytes > limit) {
    set_err(err, "policy exhausted: entry of " +
                     std::to_string(entry.size_bytes) +
                     " bytes exceeds memory limit of " + std::to_string(limit));
    return false;
  }

  auto existing = entries_.find(key);
  if (existing != entries_.end()) {
    // Tracking a tracked key only asks whether the policy still accepts it.
    if (!policy_->track(key)) {
      set_err(err, "policy exhausted: " + policy_->name() +
                       " rejected key " + key);
      return false;
    }
    // Overwrites are a delete plus insert and are not reported as evictions.
    detach_locked(existing);
    if (!policy_->track(key)) {
      set_err(err, "policy exhausted: " + policy_->name() +
                       " dropped key " + key + " on re-admission");
      return false;
    }
  } else {
    if (!policy_->track(key)) {
      set_err(err, "policy exhausted: " + policy_->name() +
                       " rejected key " + key);
      return false;
    }
    if (cfg_.capacity > 0 && entries_.size() >= cfg_.capacity) {
      auto victim = policy_->peek_victim();
      if (!victim.has_value() || *victim == key) {
        policy_->untrack(key);
        set_err(err, "policy exhausted: no eviction candidate for capacity");
        return false;
      }
      evict_locked(*victim, evicted);
    }
  }

  while (limit > 0 && memory_used_ + entry.size_bytes > limit) {
    auto victim = policy_->peek_victim();
    if (!victim.has_value() || *victim == key) {
      // Unreachable while the policy tracks exactly the cached keys.
      policy_->untrack(key);
      set_err(err, "policy exhausted: no eviction candidate for memory");
      return false;
    }
    evict_locked(*victim, evicted);
  }

  memory_used_ += entry.size_bytes;
  entries_.emplace(key, std::move(entry));
  return true;
}

Entry Cache::detach_locked(
    std::unordered_map<std::string, Entry>::iterator it) {
  Entry entry = std::move(it->second);
  memory_used_ -= entry.size_bytes;
  policy_->untrack(it->first);
  entries_.erase(it);
  return entry;
}

void Cache::evict_locked(const std::string &key,
                         std::vector<Evicted> &evicted) {
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    policy_->untrack(key);
    return;
  }
  Entry entry = detach_locked(it);
  evicted.push_back({key, std::move(entry.value)});
  ++evictions_;
}

std::optional<TimePoint> Cache::deadline_for(Duration ttl,
                                             TimePoint now) const {
  if (ttl == kDefaultExpiration)
    ttl = cfg_.default_expiration;
  if (ttl <= Duration::zero())
    return std::nullopt;
  // A deadline past the end of the clock is never reached.
  if (ttl > TimePoint::max() - now)
    return std::nullopt;
  return now + ttl;
}

void Cache::notify(const EvictionCallback &callback,
                   const std::vector<Evicted> &evicted) {
  if (!callback)
    return;
  for (const auto &e : evicted)
    callback(e.key, e.value);
}

std::optional<std::any> Cache::get(const std::string &key) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  auto it = entries_.find(key);
  if (it == entries_.end() || it->second.expired(Clock::now())) {
    ++misses_;
    return std::nullopt;
  }
  ++hits_;
  return it->second.value;
}

std::optional<CachedValue>
Cache::get_with_expiration(const std::string &key) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  auto it = entries_.find(key);
  if (it == entries_.end() || it->second.expired(Clock::now())) {
    ++misses_;
    return std::nullopt;
  }
  ++hits_;
  return CachedValue{it->second.value, it->second.ttl_deadline};
}

bool Cache::remove(const std::string &key) {
  std::vector<Evicted> removed;
  EvictionCallback callback;
  {
    std::unique_lock<std::shared_mutex> lock(mu_);
    auto it = entries_.find(key);
    if (it == entries_.end())
      return false;
    Entry entry = detach_locked(it);
    removed.push_back({key, std::move(entry.value)});
    ++removals_;
    callback = on_evicted_;
  }
  notify(callback, removed);
  return true;
}

std::size_t Cache::erase_expired() {
  std::vector<Evicted> expired;
  EvictionCallback callback;
  {
    std::unique_lock<std::shared_mutex> lock(mu_);
    const auto now = Clock::now();
    for (auto it = entries_.begin(); it != entries_.end();) {
      if (!it->second.expired(now)) {
        ++it;
        continue;
      }
      auto next = std::next(it);
      std::string key = it->first;
      Entry entry = detach_locked(it);
      expired.push_back({std::move(key), std::move(entry.value)});
      it = next;
    }
    expirations_ += expired.size();
    callback = on_evicted_;
  }
  notify(callback, expired);
  return expired.size();
}

void Cache::clear() {
  std::unique_lock<std::shared_mutex> lock(mu_);
  entries_.clear();
  memory_used_ = 0;
  policy_->clear();
}

std::size_t Cache::size() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return entries_.size();
}

std::size_t Cache::memory_used() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return memory_used_;
}

void Cache::on_evicted(EvictionCallback callback) {
  std::unique_lock<std::shared_mutex> lock(mu_);
  on_evicted_ = std::move(callback);
}

void Cache::close() {
  if (sweeper_)
    sweeper_->stop();
}

bool Cache::sweeper_running() const {
  return sweeper_ != nullptr && sweeper_->running();
}

CacheStats Cache::stats() const {
  CacheStats s;
  s.hits = hits_;
  s.misses = misses_;
  s.evictions = evictions_;
  s.expirations = expirations_;
  s.removals = removals_;
  return s;
}

std::string Cache::policy_name() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return policy_->name();
}

std::string Cache::info() const {
  const auto s = stats();
  std::ostringstream os;
  {
    std::shared_lock<std::shared_mutex> lock(mu_);
    os << "policy_mode:" << policy_->name() << "\n";
    os << "keys:" << entries_.size() << "\n";
    os << "tracked_keys:" << policy_->count() << "\n";
    os << "memory_used_bytes:" << memory_used_ << "\n";
  }
  os << "memory_limit_bytes:" << cfg_.memory_limit_bytes << "\n";
  os << "capacity:" << cfg_.capacity << "\n";
  os << "sweeper_running:" << (sweeper_running() ? 1 : 0) << "\n";
  os << "hits:" << s.hits << "\n";
  os << "misses:" << s.misses << "\n";
  os << "evictions:" << s.evictions << "\n";
  os << "expirations:" << s.expirations << "\n";
  os << "removals:" << s.removals << "\n";
  return os.str();
}

} // namespace pointer_cache
