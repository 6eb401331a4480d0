#ifndef INTERNER_HPP
#define INTERNER_HPP

// Public surface of the interner: pools, handles and the global per-type
// pools.
#include "intern/global_pool.hpp"
#include "intern/handle.hpp"
#include "intern/pool.hpp"
#include "intern/pool_error.hpp"
#include "intern/pool_options.hpp"
#include "intern/pool_stats.hpp"

#endif // INTERNER_HPP
