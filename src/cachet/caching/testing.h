#ifndef CACHET_CACHING_TESTING_H
#define CACHET_CACHING_TESTING_H

#include <any>
#include <atomic>
#include <memory>

#include <cachet/caching/cache.h>
#include <cachet/caching/unbounded_cache.h>

// This file provides utilities for testing caches and code that uses them.

namespace cachet {

// Get the integer stored in a cache lookup result.
// The result must be present and must hold an int.
inline int
cached_int(optional<cache_value> const& result)
{
    return std::any_cast<int>(*result);
}

// Is :result a hit that holds the integer :expected?
inline bool
is_cached_int(optional<cache_value> const& result, int expected)
{
    if (!result)
        return false;
    auto const* value = std::any_cast<int>(&*result);
    return value && *value == expected;
}

// Put the items with IDs [first, last) into :cache. Each item's key is
// make_id(i) and its value is i * 10.
inline void
fill_cache(cache_interface& cache, int first, int last)
{
    for (int i = first; i != last; ++i)
        cache.put(make_id(i), cache_value(i * 10));
}

// operation counts recorded by a recording_cache
struct cache_operation_counts
{
    std::atomic<int> puts{0};
    std::atomic<int> gets{0};
    std::atomic<int> removes{0};
    std::atomic<int> clears{0};
    // calls to id()
    std::atomic<int> ids{0};
};

// recording_cache is an unbounded_cache that also counts the operations
// performed on it. The counts live outside the cache so that they can still
// be inspected after the cache has been handed off to a decorator.
struct recording_cache : unbounded_cache
{
    recording_cache(string id, std::shared_ptr<cache_operation_counts> counts)
        : unbounded_cache(std::move(id)), counts_(std::move(counts))
    {
    }

    string
    id() const override
    {
        ++counts_->ids;
        return unbounded_cache::id();
    }

    void
    put(id_interface const& key, cache_value value) override
    {
        ++counts_->puts;
        unbounded_cache::put(key, std::move(value));
    }

    optional<cache_value>
    get(id_interface const& key) override
    {
        ++counts_->gets;
        return unbounded_cache::get(key);
    }

    optional<cache_value>
    remove(id_interface const& key) override
    {
        ++counts_->removes;
        return unbounded_cache::remove(key);
    }

    void
    clear() override
    {
        ++counts_->clears;
        unbounded_cache::clear();
    }

 private:
    std::shared_ptr<cache_operation_counts> counts_;
};

} // namespace cachet

#endif
