#ifndef ENTRY_HPP
#define ENTRY_HPP

#include <atomic>
#include <cstddef>
#include <memory>
#include <utility>

namespace interner {
namespace detail {

template <typename T> class PoolState;

// The canonical copy of one value plus its reference count
template <typename T> struct Entry {
  Entry(T v, std::size_t h, std::shared_ptr<PoolState<T>> pool)
      : value(std::move(v)), hash(h), owner(std::move(pool)) {}

  Entry(const Entry &) = delete;
  Entry &operator=(const Entry &) = delete;

  const T value;
  const std::size_t hash;
  // Live handles. Only ever reaches zero under the owning shard's lock.
  std::atomic<std::size_t> refcount{1};
  // Guarded by the shard lock. Once set, the index no longer owns the entry
  // and the last handle deletes it.
  bool detached = false;
  std::shared_ptr<PoolState<T>> owner;
};

// Index key that borrows either an entry's value or the caller's probe
template <typename T> struct Key {
  const T *value;
  std::size_t hash;
};

template <typename T> struct KeyHash {
  std::size_t operator()(const Key<T> &key) const noexcept { return key.hash; }
};

template <typename T> struct KeyEqual {
  bool operator()(const Key<T> &a, const Key<T> &b) const {
    return a.value == b.value || (a.hash == b.hash && *a.value == *b.value);
  }
};

} // namespace detail
} // namespace interner

#endif // ENTRY_HPP
