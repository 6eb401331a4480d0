#ifndef POOL_ERROR_HPP
#define POOL_ERROR_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace interner {

// Raised once a shard's index may no longer match its entries. Not
// recoverable: every later intern on that shard, and every final release of
// an entry still in its index, throws it.
class PoolPoisonedError : public std::runtime_error {
public:
  PoolPoisonedError(const std::string &pool_name, std::size_t shard);

  const std::string &pool_name() const noexcept { return pool_name_; }
  std::size_t shard() const noexcept { return shard_; }

private:
  std::string pool_name_;
  std::size_t shard_;
};

} // namespace interner

#endif // POOL_ERROR_HPP
