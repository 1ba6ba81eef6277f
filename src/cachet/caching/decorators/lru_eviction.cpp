#include <cachet/caching/decorators/lru_eviction.h>

namespace cachet {

lru_eviction_cache::lru_eviction_cache(
    std::unique_ptr<cache_interface> delegate)
    : delegate_(std::move(delegate))
{
}

string
lru_eviction_cache::id() const
{
    return delegate_->id();
}

size_t
lru_eviction_cache::size() const
{
    return delegate_->size();
}

void
lru_eviction_cache::put(id_interface const& key, cache_value value)
{
    delegate_->put(key, std::move(value));
    record_use(key);
}

optional<cache_value>
lru_eviction_cache::get(id_interface const& key)
{
    // Touch the key (if it's tracked) before consulting the delegate.
    auto position = positions_.find(&key);
    if (position != positions_.end())
    {
        usage_order_.splice(
            usage_order_.end(), usage_order_, position->second);
    }
    return delegate_->get(key);
}

optional<cache_value>
lru_eviction_cache::remove(id_interface const& key)
{
    return delegate_->remove(key);
}

void
lru_eviction_cache::clear()
{
    delegate_->clear();
    positions_.clear();
    usage_order_.clear();
}

void
lru_eviction_cache::record_use(id_interface const& key)
{
    auto position = positions_.find(&key);
    if (position != positions_.end())
    {
        usage_order_.splice(
            usage_order_.end(), usage_order_, position->second);
        return;
    }

    usage_order_.emplace_back(key);
    auto new_position = std::prev(usage_order_.end());
    positions_.emplace(&**new_position, new_position);

    if (usage_order_.size() > size_limit_)
    {
        // Capture the eldest key before dropping our own copy of it, since
        // the delegate needs it after it's gone from our bookkeeping.
        captured_id eldest = std::move(usage_order_.front());
        positions_.erase(&*eldest);
        usage_order_.pop_front();
        delegate_->remove(*eldest);
    }
}

} // namespace cachet
