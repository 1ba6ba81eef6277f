#ifndef CACHET_CACHING_DECORATORS_EXCLUSIVE_ACCESS_H
#define CACHET_CACHING_DECORATORS_EXCLUSIVE_ACCESS_H

#include <memory>
#include <mutex>

#include <cachet/caching/cache.h>

namespace cachet {

// exclusive_access_cache serializes all access to its delegate through a
// single mutex, which makes any chain beneath it safe to use from multiple
// threads.
struct exclusive_access_cache : cache_interface, noncopyable
{
    explicit exclusive_access_cache(
        std::unique_ptr<cache_interface> delegate);

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
    std::unique_ptr<cache_interface> delegate_;
    mutable std::mutex mutex_;
};

} // namespace cachet

#endif
