#include <cachet/caching/decorators/exclusive_access.h>

namespace cachet {

exclusive_access_cache::exclusive_access_cache(
    std::unique_ptr<cache_interface> delegate)
    : delegate_(std::move(delegate))
{
}

// The ID never changes, so it doesn't need the mutex.
string
exclusive_access_cache::id() const
{
    return delegate_->id();
}

size_t
exclusive_access_cache::size() const
{
    std::scoped_lock<std::mutex> lock(mutex_);
    return delegate_->size();
}

void
exclusive_access_cache::put(id_interface const& key, cache_value value)
{
    std::scoped_lock<std::mutex> lock(mutex_);
    delegate_->put(key, std::move(value));
}

optional<cache_value>
exclusive_access_cache::get(id_interface const& key)
{
    std::scoped_lock<std::mutex> lock(mutex_);
    return delegate_->get(key);
}

optional<cache_value>
exclusive_access_cache::remove(id_interface const& key)
{
    std::scoped_lock<std::mutex> lock(mutex_);
    return delegate_->remove(key);
}

void
exclusive_access_cache::clear()
{
    std::scoped_lock<std::mutex> lock(mutex_);
    delegate_->clear();
}

} // namespace cachet
