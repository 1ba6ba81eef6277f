#ifndef CACHET_CACHING_CACHE_H
#define CACHET_CACHING_CACHE_H

#include <cstddef>
#include <functional>

#include <cachet/core/exception.h>
#include <cachet/core/id.h>
#include <cachet/core/type_definitions.h>

// This file defines the interface that every cache implements, whether it
// actually stores data or decorates another cache.
//
// Caches are composed by wrapping. A decorator owns the cache it wraps (its
// delegate), intercepts the operations it cares about and forwards the rest.
// A complete chain is normally assembled once via create_cache() (see
// config.h) and lives as long as the context that owns it.

namespace cachet {

struct cache_interface
{
    virtual ~cache_interface()
    {
    }

    // Get the cache's identifier. This is assigned by whoever creates the
    // chain and is used only for equality, hashing and diagnostics. An empty
    // ID means the cache was never given one.
    virtual string
    id() const = 0;

    // Get the number of entries resident in the chain. Decorators report
    // what their delegate reports.
    virtual size_t
    size() const = 0;

    // Store :value under :key, replacing any existing value.
    virtual void
    put(id_interface const& key, cache_value value) = 0;

    // Look up :key.
    // The result is none iff :key isn't resident.
    virtual optional<cache_value>
    get(id_interface const& key) = 0;

    // Remove :key and return whatever value it had.
    // (Note that stampede_guard_cache redefines this as releasing the lock
    // on :key without touching the data.)
    virtual optional<cache_value>
    remove(id_interface const& key) = 0;

    // Remove all entries and reset any bookkeeping that tracks them.
    virtual void
    clear() = 0;
};

// the size limit that eviction decorators use unless told otherwise
size_t const default_eviction_size_limit = 1024;

// Errors that involve a particular cache carry its ID.
CACHET_DEFINE_ERROR_INFO(string, cache_id)

// This is thrown when equality or hashing is invoked on a cache that has no
// ID. It indicates a chain that was assembled incorrectly.
CACHET_DEFINE_EXCEPTION(cache_missing_id)

// Caches are equal iff their IDs are equal, regardless of their concrete
// types or contents. Both of these throw cache_missing_id if either cache
// lacks an ID.
bool
operator==(cache_interface const& a, cache_interface const& b);
bool
operator!=(cache_interface const& a, cache_interface const& b);

size_t
hash_value(cache_interface const& cache);

// For storing caches by pointer in unordered containers.
struct cache_pointer_hash
{
    size_t
    operator()(cache_interface const* cache) const
    {
        return hash_value(*cache);
    }
};

struct cache_pointer_equality_test
{
    bool
    operator()(cache_interface const* a, cache_interface const* b) const
    {
        return *a == *b;
    }
};

} // namespace cachet

#endif
