#ifndef CACHET_CORE_TYPE_DEFINITIONS_H
#define CACHET_CORE_TYPE_DEFINITIONS_H

#include <any>
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

#include <boost/core/noncopyable.hpp>

namespace cachet {

using boost::noncopyable;

using std::string;

using std::optional;
inline constexpr std::nullopt_t none(std::nullopt);

// some(x) creates an optional of the proper type with the value of :x.
template<class T>
auto
some(T&& x)
{
    return optional<std::remove_reference_t<T>>(std::forward<T>(x));
}

typedef int64_t integer;

// cache_value is the type of everything stored in a cache. The cache never
// inspects or copies the contents of a value beyond what std::any itself
// does. An empty cache_value is a legitimate value to store. It represents
// the known absence of a result and is distinct from a missing entry.
typedef std::any cache_value;

} // namespace cachet

#endif
