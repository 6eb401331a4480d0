#ifndef GLOBAL_POOL_HPP
#define GLOBAL_POOL_HPP

#include "core/config.hpp"
#include "intern/pool.hpp"
#include "intern/pool_options.hpp"

#include <cstddef>
#include <string>
#include <typeinfo>
#include <utility>

namespace interner {

/**
 * @brief Options used for global pools that have not been created yet
 *
 * Each global pool reads these once, on its first use. The name field is
 * ignored; global pools are named after their value type.
 */
PoolOptions default_pool_options();
void set_default_pool_options(PoolOptions options);

// Configures logging and the defaults for global pools created afterwards
void apply_config(const Config::AppConfig &config);

// "global:<demangled type name>"
std::string global_pool_name(const std::type_info &type);

/**
 * @brief Process-wide pool for T, created on first use
 */
template <typename T> Pool<T> &global_pool() {
  static Pool<T> pool([] {
    PoolOptions options = default_pool_options();
    options.name = global_pool_name(typeid(T));
    return options;
  }());
  return pool;
}

// Intern value in the global pool for its type
template <typename T> Handle<T> intern(T value) {
  return global_pool<T>().intern(std::move(value));
}

// See how many distinct values of type T are interned right now
template <typename T> std::size_t num_objects_interned() {
  return global_pool<T>().size();
}

} // namespace interner

#endif // GLOBAL_POOL_HPP
