#ifndef CACHET_CACHING_DECORATORS_HIT_RATIO_H
#define CACHET_CACHING_DECORATORS_HIT_RATIO_H

#include <atomic>
#include <memory>

#include <cachet/caching/cache.h>

namespace cachet {

// hit_ratio_cache counts lookups and hits and logs the running hit ratio
// (at debug level) after every get(). A hit is any lookup that finds the
// key, including one that finds a stored empty value.
struct hit_ratio_cache : cache_interface, noncopyable
{
    explicit hit_ratio_cache(std::unique_ptr<cache_interface> delegate);

    // the number of get() calls so far
    integer
    request_count() const
    {
        return requests_.load();
    }

    // the number of those that were hits
    integer
    hit_count() const
    {
        return hits_.load();
    }

    // hits / requests, or 0 if there haven't been any requests
    double
    hit_ratio() const;

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
    std::atomic<integer> requests_{0};
    std::atomic<integer> hits_{0};
};

} // namespace cachet

#endif
