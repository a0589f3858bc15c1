#pragma once

#include <cstddef>
#include <list>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace pointer_cache {

// Orders the keys held by a cache by eviction priority. The cache keeps the
// tracked set equal to its key set and serializes every call, so
// implementations need no locking of their own.
//
// A key passed to track() must become the least vulnerable key: peek_victim()
// never returns it while any other key is tracked. Tracking an already
// tracked key leaves the order alone and reports whether the key may stay; a
// key accepted that way must be accepted again right after its untrack().
class IEvictionPolicy {
public:
  virtual ~IEvictionPolicy() = default;
  virtual std::string name() const = 0;
  // Returns false when the policy enforces its own bound and is full.
  virtual bool track(const std::string &key) = 0;
  virtual void untrack(const std::string &key) = 0;
  virtual std::optional<std::string> peek_victim() const = 0;
  virtual std::size_t count() const = 0;
  virtual void clear() = 0;
};

// Insertion-ordered queue, oldest key first. A bound of zero means unbounded.
class FifoPolicy final : public IEvictionPolicy {
public:
  explicit FifoPolicy(std::size_t bound = 0) : bound_(bound) {}

  std::string name() const override { return "fifo"; }
  bool track(const std::string &key) override;
  void untrack(const std::string &key) override;
  std::optional<std::string> peek_victim() const override;
  std::size_t count() const override { return order_.size(); }
  void clear() override;

  std::size_t bound() const { return bound_; }
  bool contains(const std::string &key) const { return index_.contains(key); }

private:
  std::size_t bound_;
  std::list<std::string> order_;
  std::unordered_map<std::string, std::list<std::string>::iterator> index_;
};

// Returns nullptr for an unknown selector. "", "fifo" and "queue" select FIFO.
std::unique_ptr<IEvictionPolicy> make_policy_by_name(const std::string &mode,
                                                     std::size_t bound = 0);

} // namespace pointer_cache
