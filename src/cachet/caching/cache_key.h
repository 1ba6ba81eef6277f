#ifndef CACHET_CACHING_CACHE_KEY_H
#define CACHET_CACHING_CACHE_KEY_H

#include <ostream>
#include <vector>

#include <cachet/core/id.h>

namespace cachet {

// cache_key is a composite key that's built up from a sequence of
// components (e.g., a statement ID, its parameters and the bounds of the
// requested page). It keeps a running hash and checksum of the components
// so that most unequal keys can be distinguished without comparing the
// components themselves.
//
// Wrap a cache_key with make_id() to use it with a cache.
//
struct cache_key
{
    cache_key();

    // Append a component. :Value must satisfy the requirements of
    // simple_id<Value>.
    template<class Value>
    void
    update(Value const& value)
    {
        update_id(make_id(value));
    }

    // Append a component that's already an ID.
    void
    update_id(id_interface const& component);

    // Append a null component.
    void
    update_null();

    size_t
    component_count() const
    {
        return count_;
    }

    size_t
    hash() const
    {
        return hash_code_;
    }

 private:
    void
    mix_in(size_t component_hash);

    friend bool
    operator==(cache_key const& a, cache_key const& b);
    friend std::ostream&
    operator<<(std::ostream& o, cache_key const& key);

    size_t hash_code_;
    size_t checksum_;
    size_t count_;
    // Null components are stored as uninitialized IDs.
    std::vector<captured_id> components_;
};

bool
operator==(cache_key const& a, cache_key const& b);
bool
operator!=(cache_key const& a, cache_key const& b);

// This is written as :hash::checksum followed by each component (separated
// by colons), with null components written as "null".
std::ostream&
operator<<(std::ostream& o, cache_key const& key);

inline size_t
hash_value(cache_key const& key)
{
    return key.hash();
}

} // namespace cachet

#endif
