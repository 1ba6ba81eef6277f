#ifndef CACHET_CACHING_DECORATORS_LRU_EVICTION_H
#define CACHET_CACHING_DECORATORS_LRU_EVICTION_H

#include <iterator>
#include <list>
#include <memory>
#include <unordered_map>

#include <cachet/caching/cache.h>

namespace cachet {

// lru_eviction_cache limits its delegate to a fixed number of keys. When a
// put() pushes the number of tracked keys over the limit, the least recently
// used key is removed from the delegate.
//
// Both get() and put() count as uses. Note that get() refreshes a tracked
// key even when the delegate turns out not to have a value for it, and
// remove() is forwarded without updating the usage order. The set of tracked
// keys is therefore not necessarily the set of keys resident in the
// delegate. (size() always comes from the delegate.)
//
// This is NOT thread-safe on its own. Wrap it in an exclusive_access_cache
// (or synchronize externally) if it's used concurrently.
//
struct lru_eviction_cache : cache_interface, noncopyable
{
    explicit lru_eviction_cache(std::unique_ptr<cache_interface> delegate);

    // the maximum number of keys to track (defaults to 1024)
    size_t
    size_limit() const
    {
        return size_limit_;
    }

    // Change the size limit. This is meant to be called while the chain is
    // being assembled. Nothing is evicted until the next put().
    void
    set_size_limit(size_t limit)
    {
        size_limit_ = limit;
    }

    string
    id() const override;

    size_t
    size() const override;

    void
    put(id_interface const& key, cache_value value) override;

    optional<cache_value>
    get(id_interface const& key) override;

    optional<cache_value>
    remove(id_interface const& key) override;

    void
    clear() override;

 private:
    // Mark :key as the most recently used key, adding it if necessary, and
    // evict the least recently used key if that puts us over the limit.
    void
    record_use(id_interface const& key);

    typedef std::list<captured_id> usage_list;

    std::unique_ptr<cache_interface> delegate_;
    size_t size_limit_ = default_eviction_size_limit;

    // tracked keys, from least to most recently used
    usage_list usage_order_;

    // positions within :usage_order_, keyed by the IDs stored there
    std::unordered_map<
        id_interface const*,
        usage_list::iterator,
        id_interface_pointer_hash,
        id_interface_pointer_equality_test>
        positions_;
};

} // namespace cachet

#endif
