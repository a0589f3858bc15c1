#include "pointer_cache/policy.hpp"

#include <iterator>

namespace pointer_cache {

bool FifoPolicy::track(const std::string &key) {
  if (index_.contains(key))
    return true;
  if (bound_ != 0 && order_.size() >= bound_)
    return false;
  order_.push_back(key);
  index_[key] = std::prev(order_.end());
  return true;
}

void FifoPolicy::untrack(const std::string &key) {
  auto it = index_.find(key);
  if (it == index_.end())
    return;
  order_.erase(it->second);
  index_.erase(it);
}

std::optional<std::string> FifoPolicy::peek_victim() const {
  if (order_.empty())
    return std::nullopt;
  return order_.front();
}

void FifoPolicy::clear() {
  order_.clear();
  index_.clear();
}

std::unique_ptr<IEvictionPolicy> make_policy_by_name(const std::string &mode,
                                                     std::size_t bound) {
  if (mode.empty() || mode == "fifo" || mode == "queue")
    return std::make_unique<FifoPolicy>(bound);
  return nullptr;
}

} // namespace pointer_cache
