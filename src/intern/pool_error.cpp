#include "intern/pool_error.hpp"

namespace interner {

PoolPoisonedError::PoolPoisonedError(const std::string &pool_name,
                                     std::size_t shard)
    : std::runtime_error("interner pool '" + pool_name + "' shard " +
                         std::to_string(shard) +
                         " is poisoned: its index was left inconsistent by a "
                         "failed operation"),
      pool_name_(pool_name), shard_(shard) {}

} // namespace interner
