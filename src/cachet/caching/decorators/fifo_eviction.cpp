#include <cachet/caching/decorators/fifo_eviction.h>

namespace cachet {

fifo_eviction_cache::fifo_eviction_cache(
    std::unique_ptr<cache_interface> delegate)
    : delegate_(std::move(delegate))
{
}

string
fifo_eviction_cache::id() const
{
    return delegate_->id();
}

size_t
fifo_eviction_cache::size() const
{
    return delegate_->size();
}

void
fifo_eviction_cache::put(id_interface const& key, cache_value value)
{
    insertion_order_.emplace_back(key);
    if (insertion_order_.size() > size_limit_)
    {
        captured_id oldest = std::move(insertion_order_.front());
        insertion_order_.pop_front();
        delegate_->remove(*oldest);
    }
    delegate_->put(key, std::move(value));
}

optional<cache_value>
fifo_eviction_cache::get(id_interface const& key)
{
    return delegate_->get(key);
}

optional<cache_value>
fifo_eviction_cache::remove(id_interface const& key)
{
    return delegate_->remove(key);
}

void
fifo_eviction_cache::clear()
{
    delegate_->clear();
    insertion_order_.clear();
}

} // namespace cachet
