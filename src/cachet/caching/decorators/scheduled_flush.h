#ifndef CACHET_CACHING_DECORATORS_SCHEDULED_FLUSH_H
#define CACHET_CACHING_DECORATORS_SCHEDULED_FLUSH_H

#include <chrono>
#include <functional>
#include <memory>

#include <cachet/caching/cache.h>

namespace cachet {

// scheduled_flush_cache clears its delegate whenever the flush interval has
// elapsed since the last clear. There's no timer thread. The check happens
// at the start of size(), put(), get() and remove().
struct scheduled_flush_cache : cache_interface, noncopyable
{
    typedef std::chrono::steady_clock::time_point time_point;

    // :clock supplies the current time. It defaults to the steady clock, but
    // tests can provide their own.
    explicit scheduled_flush_cache(
        std::unique_ptr<cache_interface> delegate,
        std::function<time_point()> clock = nullptr);

    std::chrono::milliseconds
    flush_interval() const
    {
        return flush_interval_;
    }

    // Change the flush interval (one hour by default).
    void
    set_flush_interval(std::chrono::milliseconds interval)
    {
        flush_interval_ = interval;
    }

    string
    id() const override;

    // Like every other operation, this first flushes the delegate if the
    // interval has elapsed, so despite being const, it can clear the cache.
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
    // Clear the delegate if the interval has elapsed.
    // The return value indicates whether or not it was cleared.
    bool
    flush_if_due() const;

    std::unique_ptr<cache_interface> delegate_;
    std::function<time_point()> clock_;
    std::chrono::milliseconds flush_interval_ = std::chrono::hours(1);
    // Flushing from size() is allowed, so this is mutable.
    mutable time_point last_flush_;
};

} // namespace cachet

#endif
