#include <cachet/caching/decorators/scheduled_flush.h>

#include <cachet/utilities/logging.h>

namespace cachet {

scheduled_flush_cache::scheduled_flush_cache(
    std::unique_ptr<cache_interface> delegate,
    std::function<time_point()> clock)
    : delegate_(std::move(delegate)), clock_(std::move(clock))
{
    if (!clock_)
        clock_ = [] { return std::chrono::steady_clock::now(); };
    last_flush_ = clock_();
}

string
scheduled_flush_cache::id() const
{
    return delegate_->id();
}

size_t
scheduled_flush_cache::size() const
{
    flush_if_due();
    return delegate_->size();
}

void
scheduled_flush_cache::put(id_interface const& key, cache_value value)
{
    flush_if_due();
    delegate_->put(key, std::move(value));
}

optional<cache_value>
scheduled_flush_cache::get(id_interface const& key)
{
    if (flush_if_due())
        return none;
    return delegate_->get(key);
}

optional<cache_value>
scheduled_flush_cache::remove(id_interface const& key)
{
    if (flush_if_due())
        return none;
    return delegate_->remove(key);
}

void
scheduled_flush_cache::clear()
{
    last_flush_ = clock_();
    delegate_->clear();
}

bool
scheduled_flush_cache::flush_if_due() const
{
    auto now = clock_();
    if (now - last_flush_ < flush_interval_)
        return false;
    get_logger()->debug("flushing cache {}", delegate_->id());
    last_flush_ = now;
    delegate_->clear();
    return true;
}

} // namespace cachet
