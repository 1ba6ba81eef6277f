#ifndef CACHET_CACHING_CONFIG_H
#define CACHET_CACHING_CONFIG_H

#include <memory>

#include <cachet/caching/cache.h>

// This file provides the interface for assembling a complete cache chain from
// a declarative description of it.

namespace cachet {

enum class cache_eviction_policy
{
    // Keep everything (until it's explicitly removed or cleared).
    NONE,
    // Evict the least recently used key.
    LRU,
    // Evict the earliest inserted key.
    FIFO
};

struct cache_config
{
    // the ID of the cache - Leaving this empty produces a cache that can't be
    // compared or hashed.
    string id;

    cache_eviction_policy eviction = cache_eviction_policy::LRU;

    // the number of keys that the eviction policy allows (if there is one) -
    // This defaults to default_eviction_size_limit. If set, it must be at
    // least 1.
    optional<integer> size_limit;

    // If this is set, the cache is cleared at this interval (in
    // milliseconds).
    optional<integer> flush_interval;

    // whether or not to log the hit ratio of the cache
    bool log_hit_ratio = true;

    // whether or not to serialize all access to the cache (which is required
    // for the cache to be used from multiple threads)
    bool exclusive_access = true;

    // whether or not to block concurrent callers that miss on the same key
    // until the first one has supplied the value
    bool blocking = false;

    // how long a blocked caller waits before giving up (in milliseconds) -
    // Omitting this (or setting it to zero) means wait indefinitely.
    optional<integer> lock_timeout;
};

// Create a cache chain according to :config.
//
// The chain is built from the inside out as follows:
// - an unbounded_cache that holds the data
// - the eviction decorator (if any)
// - a scheduled_flush_cache (if there's a flush interval)
// - a hit_ratio_cache (if log_hit_ratio is set)
// - an exclusive_access_cache (if exclusive_access is set)
// - a stampede_guard_cache (if blocking is set)
//
std::unique_ptr<cache_interface>
create_cache(cache_config const& config);

// This is thrown when create_cache() is given an invalid setting.
CACHET_DEFINE_EXCEPTION(invalid_cache_config)
// the name of the offending setting
CACHET_DEFINE_ERROR_INFO(string, config_setting)

} // namespace cachet

#endif
