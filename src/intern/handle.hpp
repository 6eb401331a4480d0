#ifndef HANDLE_HPP
#define HANDLE_HPP

#include "intern/entry.hpp"

#include <cstddef>
#include <functional>
#include <ostream>
#include <utility>

namespace interner {

/**
 * @brief Shared reference to the canonical copy of an interned value
 *
 * Handles are only created by Pool::intern. Copying bumps the entry's
 * reference count without locking; destroying the last handle evicts the
 * entry from its pool.
 *
 * Equality, ordering and hashing use the identity of the canonical entry,
 * never the value, so they are O(1) whatever T is. Two handles from the same
 * pool compare equal iff their values are equal.
 */
template <typename T> class Handle {
public:
  using value_type = T;

  Handle() = default;

  Handle(const Handle &other) noexcept : entry_(other.entry_) { acquire(); }

  Handle(Handle &&other) noexcept
      : entry_(std::exchange(other.entry_, nullptr)) {}

  Handle &operator=(const Handle &other) {
    if (entry_ != other.entry_) {
      Handle copy(other);
      swap(copy);
    }
    return *this;
  }

  Handle &operator=(Handle &&other) noexcept {
    if (this != &other) {
      reset();
      entry_ = std::exchange(other.entry_, nullptr);
    }
    return *this;
  }

  ~Handle() { reset(); }

  // Drops this reference now. May throw PoolPoisonedError when it is the
  // last reference into a poisoned shard.
  void reset();

  void swap(Handle &other) noexcept { std::swap(entry_, other.entry_); }

  const T &get() const { return entry_->value; }
  const T &operator*() const { return entry_->value; }
  const T *operator->() const { return &entry_->value; }

  explicit operator bool() const noexcept { return entry_ != nullptr; }

  // Number of live handles sharing this entry, this one included
  std::size_t refcount() const noexcept {
    return entry_ ? entry_->refcount.load(std::memory_order_relaxed) : 0;
  }

  std::size_t hash() const noexcept {
    return std::hash<const void *>{}(entry_);
  }

  // Identity comparisons
  bool operator==(const Handle &other) const noexcept {
    return entry_ == other.entry_;
  }
  bool operator!=(const Handle &other) const noexcept {
    return entry_ != other.entry_;
  }
  bool operator<(const Handle &other) const noexcept {
    return std::less<const detail::Entry<T> *>{}(entry_, other.entry_);
  }
  bool operator>(const Handle &other) const noexcept { return other < *this; }
  bool operator<=(const Handle &other) const noexcept {
    return !(other < *this);
  }
  bool operator>=(const Handle &other) const noexcept {
    return !(*this < other);
  }

  // Structural comparison against a plain value
  bool operator==(const T &value) const {
    return entry_ != nullptr && entry_->value == value;
  }
  bool operator!=(const T &value) const { return !(*this == value); }

  // For use in hash containers
  struct Hash {
    std::size_t operator()(const Handle &handle) const noexcept {
      return handle.hash();
    }
  };

private:
  friend class detail::PoolState<T>;

  // Adopts a reference the pool has already counted
  explicit Handle(detail::Entry<T> *entry) noexcept : entry_(entry) {}

  void acquire() noexcept {
    if (entry_)
      entry_->refcount.fetch_add(1, std::memory_order_relaxed);
  }

  detail::Entry<T> *entry_ = nullptr;
};

template <typename T> void swap(Handle<T> &a, Handle<T> &b) noexcept {
  a.swap(b);
}

// Only offered when T itself can be streamed
template <typename T>
auto operator<<(std::ostream &os, const Handle<T> &handle)
    -> decltype(os << std::declval<const T &>()) {
  return os << handle.get();
}

// Orders handles by their values instead of their identities
struct ValueLess {
  template <typename T>
  bool operator()(const Handle<T> &a, const Handle<T> &b) const {
    return a.get() < b.get();
  }
};

} // namespace interner

namespace std {
template <typename T> struct hash<interner::Handle<T>> {
  std::size_t operator()(const interner::Handle<T> &handle) const noexcept {
    return handle.hash();
  }
};
} // namespace std

// reset() needs the full PoolState, which in turn needs Handle
#include "intern/pool.hpp"

#endif // HANDLE_HPP
