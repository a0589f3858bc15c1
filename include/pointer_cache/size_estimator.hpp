#pragma once

#include <array>
#include <cstddef>
#include <deque>
#include <list>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <vector>

namespace pointer_cache {

inline constexpr std::size_t kMapBucketHeaderBytes = 16;
inline constexpr std::size_t kMapSlotsPerBucket = 8;

// Approximate bucket count of a hash map holding `entries` items: the
// smallest power of two covering entries / 6.5, at least one.
std::size_t map_bucket_count(std::size_t entries);

class SizeEstimator;

namespace detail {

template <typename T> struct dependent_false : std::false_type {};

template <typename T> struct is_text : std::false_type {};
template <typename C, typename Tr, typename A>
struct is_text<std::basic_string<C, Tr, A>> : std::true_type {};

template <typename T> struct is_vector : std::false_type {};
template <typename T, typename A>
struct is_vector<std::vector<T, A>> : std::true_type {};

template <typename T> struct is_sequence : std::false_type {};
template <typename T, typename A>
struct is_sequence<std::deque<T, A>> : std::true_type {};
template <typename T, typename A>
struct is_sequence<std::list<T, A>> : std::true_type {};

template <typename T> struct is_array : std::false_type {};
template <typename T, std::size_t N>
struct is_array<std::array<T, N>> : std::true_type {};

template <typename T> struct is_mapping : std::false_type {};
template <typename K, typename V, typename C, typename A>
struct is_mapping<std::map<K, V, C, A>> : std::true_type {};
template <typename K, typename V, typename H, typename E, typename A>
struct is_mapping<std::unordered_map<K, V, H, E, A>> : std::true_type {};

template <typename T> struct is_reference : std::false_type {};
template <typename T> struct is_reference<T *> : std::true_type {};
template <typename T, typename D>
struct is_reference<std::unique_ptr<T, D>> : std::true_type {};
template <typename T>
struct is_reference<std::shared_ptr<T>> : std::true_type {};

template <typename T> struct is_optional : std::false_type {};
template <typename T>
struct is_optional<std::optional<T>> : std::true_type {};

template <typename T> struct is_pair : std::false_type {};
template <typename A, typename B>
struct is_pair<std::pair<A, B>> : std::true_type {};

template <typename T> const T *target_of(const T *p) { return p; }
template <typename T, typename D>
const T *target_of(const std::unique_ptr<T, D> &p) {
  return p.get();
}
template <typename T> const T *target_of(const std::shared_ptr<T> &p) {
  return p.get();
}

template <typename T, typename = void> struct has_fields : std::false_type {};
template <typename T>
struct has_fields<T, std::void_t<decltype(estimate_fields(
                         std::declval<const T &>(),
                         std::declval<SizeEstimator &>()))>> : std::true_type {};

} // namespace detail

// Deep, cycle-safe byte estimate of a value graph. One instance covers one
// estimation: every reference target and record is charged at most once,
// keyed by address and type, so a record and its first member are distinct.
//
// Records opt in by declaring, next to the type,
//
//   std::size_t estimate_fields(const T &value, SizeEstimator &e);
//
// returning the bytes the record owns beyond sizeof(T), usually the sum of
// e.indirect_size(field) over its strings, containers and pointers.
class SizeEstimator {
public:
  template <typename T> std::size_t size_of(const T &value);

  // Bytes reachable from `value` that are not part of its static layout.
  template <typename T> std::size_t indirect_size(const T &value) {
    return size_of(value) - sizeof(T);
  }

  // Returns true the first time an object of type T at `address` is seen.
  template <typename T> bool visit(const T *address) {
    return visit(address, std::type_index(typeid(T)));
  }
  bool visit(const void *address, std::type_index type);
  std::size_t visited() const { return seen_.size(); }

private:
  template <typename M> std::size_t mapping_size(const M &map);

  std::set<std::pair<const void *, std::type_index>> seen_;
};

template <typename T> std::size_t SizeEstimator::size_of(const T &value) {
  using U = std::remove_cv_t<T>;
  if constexpr (std::is_arithmetic_v<U> || std::is_enum_v<U>) {
    return sizeof(U);
  } else if constexpr (detail::is_text<U>::value) {
    return sizeof(U) + value.size() * sizeof(typename U::value_type);
  } else if constexpr (detail::is_reference<U>::value) {
    const auto *target = detail::target_of(value);
    if (target == nullptr || !visit(target))
      return sizeof(U);
    return sizeof(U) + size_of(*target);
  } else if constexpr (detail::is_vector<U>::value) {
    std::size_t total = sizeof(U);
    for (const auto &item : value)
      total += size_of(item);
    total += (value.capacity() - value.size()) * sizeof(typename U::value_type);
    return total;
  } else if constexpr (detail::is_sequence<U>::value) {
    std::size_t total = sizeof(U);
    for (const auto &item : value)
      total += size_of(item);
    return total;
  } else if constexpr (detail::is_array<U>::value) {
    std::size_t total = sizeof(U);
    for (const auto &item : value)
      total += indirect_size(item);
    return total;
  } else if constexpr (detail::is_mapping<U>::value) {
    return mapping_size(value);
  } else if constexpr (detail::is_optional<U>::value) {
    return value.has_value() ? sizeof(U) + indirect_size(*value) : sizeof(U);
  } else if constexpr (detail::is_pair<U>::value) {
    return sizeof(U) + indirect_size(value.first) + indirect_size(value.second);
  } else if constexpr (detail::has_fields<U>::value) {
    visit(&value);
    return sizeof(U) + estimate_fields(value, *this);
  } else if constexpr (std::is_trivially_copyable_v<U>) {
    return sizeof(U);
  } else {
    static_assert(detail::dependent_false<U>::value,
                  "no size estimate for this type: declare estimate_fields() "
                  "or insert it with an explicit size");
    return 0;
  }
}

template <typename M> std::size_t SizeEstimator::mapping_size(const M &map) {
  using K = typename M::key_type;
  using V = typename M::mapped_type;
  const std::size_t buckets = map_bucket_count(map.size());
  std::size_t total = sizeof(M) + kMapBucketHeaderBytes * buckets;
  for (const auto &[k, v] : map) {
    total += size_of(k);
    total += size_of(v);
  }
  total += (kMapSlotsPerBucket * buckets - map.size()) * (sizeof(K) + sizeof(V));
  return total;
}

template <typename T> std::size_t estimate_size(const T &value) {
  SizeEstimator estimator;
  return estimator.size_of(value);
}

} // namespace pointer_cache
