#include <cachet/caching/decorators/stampede_guard.h>

#include <system_error>

#include <cachet/utilities/logging.h>

namespace cachet {

stampede_guard_cache::stampede_guard_cache(
    std::unique_ptr<cache_interface> delegate)
    : delegate_(std::move(delegate))
{
}

string
stampede_guard_cache::id() const
{
    return delegate_->id();
}

size_t
stampede_guard_cache::size() const
{
    return delegate_->size();
}

void
stampede_guard_cache::put(id_interface const& key, cache_value value)
{
    try
    {
        delegate_->put(key, std::move(value));
    }
    catch (...)
    {
        release_lock(key);
        throw;
    }
    release_lock(key);
}

optional<cache_value>
stampede_guard_cache::get(id_interface const& key)
{
    acquire_lock(key);
    auto value = delegate_->get(key);
    if (value)
        release_lock(key);
    return value;
}

optional<cache_value>
stampede_guard_cache::remove(id_interface const& key)
{
    release_lock(key);
    return none;
}

void
stampede_guard_cache::clear()
{
    delegate_->clear();
}

key_lock&
stampede_guard_cache::lock_for_key(id_interface const& key)
{
    std::scoped_lock<std::mutex> lock(locks_mutex_);
    auto i = locks_.find(&key);
    if (i != locks_.end())
        return i->second->lock;
    auto entry = std::make_unique<lock_entry>();
    entry->key.capture(key);
    key_lock& new_lock = entry->lock;
    id_interface const* stored_key = &*entry->key;
    locks_.emplace(stored_key, std::move(entry));
    return new_lock;
}

void
stampede_guard_cache::acquire_lock(id_interface const& key)
{
    key_lock& lock = lock_for_key(key);
    bool acquired;
    try
    {
        acquired = wait_for_lock(lock);
    }
    catch (std::system_error& e)
    {
        CACHET_THROW(
            cache_lock_failure()
            << cache_id_info(this->id()) << cache_key_info(to_string(key))
            << internal_error_message_info(e.what()));
    }
    if (!acquired)
    {
        get_logger()->warn(
            "couldn't get a lock in {}ms for the key {} at the cache {}",
            lock_timeout_.count(),
            to_string(key),
            this->id());
        CACHET_THROW(
            cache_lock_failure()
            << cache_id_info(this->id()) << cache_key_info(to_string(key))
            << lock_timeout_info(lock_timeout_.count()));
    }
}

bool
stampede_guard_cache::wait_for_lock(key_lock& lock)
{
    if (lock_timeout_.count() > 0)
        return lock.try_acquire_for(lock_timeout_);
    lock.acquire();
    return true;
}

void
stampede_guard_cache::release_lock(id_interface const& key)
{
    key_lock* lock;
    {
        std::scoped_lock<std::mutex> table_lock(locks_mutex_);
        auto i = locks_.find(&key);
        if (i == locks_.end())
            return;
        lock = &i->second->lock;
    }
    lock->release();
}

} // namespace cachet
