#include <cachet/caching/cache.h>

#include <cachet/core/hash.h>

namespace cachet {

namespace {

string
require_id(cache_interface const& cache)
{
    auto id = cache.id();
    if (id.empty())
        CACHET_THROW(cache_missing_id());
    return id;
}

} // namespace

bool
operator==(cache_interface const& a, cache_interface const& b)
{
    auto a_id = require_id(a);
    if (&a == &b)
        return true;
    return a_id == require_id(b);
}

bool
operator!=(cache_interface const& a, cache_interface const& b)
{
    return !(a == b);
}

size_t
hash_value(cache_interface const& cache)
{
    return invoke_hash(require_id(cache));
}

} // namespace cachet
