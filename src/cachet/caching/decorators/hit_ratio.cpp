#include <cachet/caching/decorators/hit_ratio.h>

#include <cachet/utilities/logging.h>

namespace cachet {

hit_ratio_cache::hit_ratio_cache(std::unique_ptr<cache_interface> delegate)
    : delegate_(std::move(delegate))
{
}

double
hit_ratio_cache::hit_ratio() const
{
    auto requests = requests_.load();
    if (requests == 0)
        return 0;
    return double(hits_.load()) / double(requests);
}

string
hit_ratio_cache::id() const
{
    return delegate_->id();
}

size_t
hit_ratio_cache::size() const
{
    return delegate_->size();
}

void
hit_ratio_cache::put(id_interface const& key, cache_value value)
{
    delegate_->put(key, std::move(value));
}

optional<cache_value>
hit_ratio_cache::get(id_interface const& key)
{
    ++requests_;
    auto value = delegate_->get(key);
    if (value)
        ++hits_;
    auto const& logger = get_logger();
    if (logger->should_log(spdlog::level::debug))
        logger->debug("Cache Hit Ratio [{}]: {}", this->id(), hit_ratio());
    return value;
}

optional<cache_value>
hit_ratio_cache::remove(id_interface const& key)
{
    return delegate_->remove(key);
}

void
hit_ratio_cache::clear()
{
    delegate_->clear();
}

} // namespace cachet
