#include <cachet/caching/config.h>

#include <chrono>
#include <vector>

#include <boost/algorithm/string/join.hpp>

#include <cachet/caching/decorators/exclusive_access.h>
#include <cachet/caching/decorators/fifo_eviction.h>
#include <cachet/caching/decorators/hit_ratio.h>
#include <cachet/caching/decorators/lru_eviction.h>
#include <cachet/caching/decorators/scheduled_flush.h>
#include <cachet/caching/decorators/stampede_guard.h>
#include <cachet/caching/unbounded_cache.h>
#include <cachet/utilities/logging.h>

namespace cachet {

namespace {

void
check_at_least(
    char const* setting, optional<integer> const& value, integer minimum)
{
    if (value && *value < minimum)
        CACHET_THROW(invalid_cache_config() << config_setting_info(setting));
}

template<class EvictionCache>
std::unique_ptr<cache_interface>
add_eviction(
    std::unique_ptr<cache_interface> cache, optional<integer> const& limit)
{
    auto evicting = std::make_unique<EvictionCache>(std::move(cache));
    if (limit)
        evicting->set_size_limit(size_t(*limit));
    return evicting;
}

} // namespace

std::unique_ptr<cache_interface>
create_cache(cache_config const& config)
{
    // A zero size limit would make FIFO eviction unbounded and LRU eviction
    // store nothing, so the eviction decorators only get positive limits.
    check_at_least("size_limit", config.size_limit, 1);
    check_at_least("flush_interval", config.flush_interval, 0);
    check_at_least("lock_timeout", config.lock_timeout, 0);

    std::vector<string> layers;

    std::unique_ptr<cache_interface> cache
        = std::make_unique<unbounded_cache>(config.id);
    layers.push_back("unbounded");

    switch (config.eviction)
    {
        case cache_eviction_policy::NONE:
            break;
        case cache_eviction_policy::LRU:
            cache = add_eviction<lru_eviction_cache>(
                std::move(cache), config.size_limit);
            layers.push_back("lru");
            break;
        case cache_eviction_policy::FIFO:
            cache = add_eviction<fifo_eviction_cache>(
                std::move(cache), config.size_limit);
            layers.push_back("fifo");
            break;
    }

    if (config.flush_interval)
    {
        auto flushing
            = std::make_unique<scheduled_flush_cache>(std::move(cache));
        flushing->set_flush_interval(
            std::chrono::milliseconds(*config.flush_interval));
        cache = std::move(flushing);
        layers.push_back("scheduled_flush");
    }

    if (config.log_hit_ratio)
    {
        cache = std::make_unique<hit_ratio_cache>(std::move(cache));
        layers.push_back("hit_ratio");
    }

    if (config.exclusive_access)
    {
        cache = std::make_unique<exclusive_access_cache>(std::move(cache));
        layers.push_back("exclusive_access");
    }

    if (config.blocking)
    {
        auto guard = std::make_unique<stampede_guard_cache>(std::move(cache));
        if (config.lock_timeout)
        {
            guard->set_lock_timeout(
                std::chrono::milliseconds(*config.lock_timeout));
        }
        cache = std::move(guard);
        layers.push_back("stampede_guard");
    }

    get_logger()->info(
        "created cache {}: {}",
        config.id,
        boost::algorithm::join(layers, " < "));

    return cache;
}

} // namespace cachet
