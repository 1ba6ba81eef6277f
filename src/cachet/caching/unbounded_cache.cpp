#include <cachet/caching/unbounded_cache.h>

namespace cachet {

unbounded_cache::unbounded_cache(string id) : id_(std::move(id))
{
}

string
unbounded_cache::id() const
{
    return id_;
}

size_t
unbounded_cache::size() const
{
    return entries_.size();
}

void
unbounded_cache::put(id_interface const& key, cache_value value)
{
    auto existing = entries_.find(&key);
    if (existing != entries_.end())
    {
        existing->second->value = std::move(value);
        return;
    }
    auto new_entry = std::make_unique<entry>();
    new_entry->key.capture(key);
    new_entry->value = std::move(value);
    id_interface const* stored_key = &*new_entry->key;
    entries_.emplace(stored_key, std::move(new_entry));
}

optional<cache_value>
unbounded_cache::get(id_interface const& key)
{
    auto i = entries_.find(&key);
    if (i == entries_.end())
        return none;
    return some(i->second->value);
}

optional<cache_value>
unbounded_cache::remove(id_interface const& key)
{
    auto i = entries_.find(&key);
    if (i == entries_.end())
        return none;
    optional<cache_value> removed = some(std::move(i->second->value));
    entries_.erase(i);
    return removed;
}

void
unbounded_cache::clear()
{
    entries_.clear();
}

} // namespace cachet
