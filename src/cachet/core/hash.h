#ifndef CACHET_CORE_HASH_H
#define CACHET_CORE_HASH_H

#include <functional>

#include <boost/functional/hash.hpp>

namespace cachet {

template<class T>
std::size_t
invoke_hash(T const& x)
{
    return boost::hash<T>()(x);
}

} // namespace cachet

#endif
