#include <cachet/caching/cache_key.h>

namespace cachet {

namespace {

size_t const hash_multiplier = 37;
size_t const initial_hash = 17;

// the contribution of a null component to the hash
size_t const null_component_hash = 1;

} // namespace

cache_key::cache_key() : hash_code_(initial_hash), checksum_(0), count_(0)
{
}

void
cache_key::update_id(id_interface const& component)
{
    mix_in(component.hash());
    components_.emplace_back(component);
}

void
cache_key::update_null()
{
    mix_in(null_component_hash);
    components_.emplace_back();
}

void
cache_key::mix_in(size_t component_hash)
{
    ++count_;
    checksum_ += component_hash;
    component_hash *= count_;
    hash_code_ = hash_multiplier * hash_code_ + component_hash;
}

bool
operator==(cache_key const& a, cache_key const& b)
{
    if (&a == &b)
        return true;
    return a.hash_code_ == b.hash_code_ && a.checksum_ == b.checksum_
           && a.count_ == b.count_ && a.components_ == b.components_;
}

bool
operator!=(cache_key const& a, cache_key const& b)
{
    return !(a == b);
}

std::ostream&
operator<<(std::ostream& o, cache_key const& key)
{
    o << key.hash_code_ << ":" << key.checksum_;
    for (auto const& component : key.components_)
    {
        o << ":";
        if (component.is_initialized())
            o << *component;
        else
            o << "null";
    }
    return o;
}

} // namespace cachet
