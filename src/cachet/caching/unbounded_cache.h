#ifndef CACHET_CACHING_UNBOUNDED_CACHE_H
#define CACHET_CACHING_UNBOUNDED_CACHE_H

#include <memory>
#include <unordered_map>

#include <cachet/caching/cache.h>

namespace cachet {

// unbounded_cache is the cache that actually holds data. It's a plain hash
// table: there's no size limit and nothing is ever evicted except by an
// explicit remove() or clear().
//
// This is NOT thread-safe. Concurrent use requires either an outer
// exclusive_access_cache or external synchronization.
//
struct unbounded_cache : cache_interface, noncopyable
{
    explicit unbounded_cache(string id);

    string
    id() const override;

    size_t
    size() const override;

    void
    put(id_interface const& key, cache_value value) override;

    optional<cache_value>
    get(id_interface const& key) override;

    optional<cache_value>
    remove(id_interface const& key) override;

    void
    clear() override;

 private:
    struct entry
    {
        captured_id key;
        cache_value value;
    };

    // The map is keyed by pointers to the IDs stored in the entries
    // themselves, so lookups don't need to capture the key.
    typedef std::unordered_map<
        id_interface const*,
        std::unique_ptr<entry>,
        id_interface_pointer_hash,
        id_interface_pointer_equality_test>
        entry_map;

    string id_;
    entry_map entries_;
};

} // namespace cachet

#endif
