#ifndef CACHET_CACHING_DECORATORS_FIFO_EVICTION_H
#define CACHET_CACHING_DECORATORS_FIFO_EVICTION_H

#include <deque>
#include <memory>

#include <cachet/caching/cache.h>

namespace cachet {

// fifo_eviction_cache limits its delegate to a fixed number of insertions.
// Every put() appends its key to a queue (even if the key is already
// queued), and when the queue grows past the limit, the oldest key in it is
// removed from the delegate. Reads have no effect on the order.
//
// This is NOT thread-safe on its own. Wrap it in an exclusive_access_cache
// (or synchronize externally) if it's used concurrently.
//
struct fifo_eviction_cache : cache_interface, noncopyable
{
    explicit fifo_eviction_cache(std::unique_ptr<cache_interface> delegate);

    // the maximum length of the insertion queue (defaults to 1024)
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
    std::unique_ptr<cache_interface> delegate_;
    size_t size_limit_ = default_eviction_size_limit;
    std::deque<captured_id> insertion_order_;
};

} // namespace cachet

#endif
