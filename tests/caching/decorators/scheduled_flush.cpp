#include <cachet/caching/decorators/scheduled_flush.h>

#include <cachet/caching/testing.h>
#include <cachet/utilities/testing.h>

using namespace cachet;

namespace {

struct fake_clock
{
    scheduled_flush_cache::time_point now;

    void
    advance(std::chrono::milliseconds amount)
    {
        now += amount;
    }
};

} // namespace

TEST_CASE("scheduled flushing", "[scheduled_flush]")
{
    fake_clock clock;
    auto counts = std::make_shared<cache_operation_counts>();
    scheduled_flush_cache cache(
        std::make_unique<recording_cache>("flushing", counts),
        [&] { return clock.now; });
    REQUIRE(cache.flush_interval() == std::chrono::hours(1));
    cache.set_flush_interval(std::chrono::milliseconds(100));
    REQUIRE(cache.id() == "flushing");

    fill_cache(cache, 0, 3);
    clock.advance(std::chrono::milliseconds(99));
    REQUIRE(cache.size() == 3);
    REQUIRE(is_cached_int(cache.get(make_id(0)), 0));

    {
        INFO("Once the interval elapses, the next access clears the cache.");
        clock.advance(std::chrono::milliseconds(1));
        REQUIRE(!cache.get(make_id(0)));
        REQUIRE(counts->clears.load() == 1);
        REQUIRE(cache.size() == 0);
    }

    {
        INFO("The interval restarts after a flush.");
        fill_cache(cache, 0, 2);
        clock.advance(std::chrono::milliseconds(50));
        REQUIRE(cache.size() == 2);
        clock.advance(std::chrono::milliseconds(50));
        REQUIRE(cache.size() == 0);
        REQUIRE(counts->clears.load() == 2);
    }

    {
        INFO("An explicit clear also restarts the interval.");
        clock.advance(std::chrono::milliseconds(60));
        cache.put(make_id(1), cache_value(1));
        REQUIRE(counts->clears.load() == 2);
        cache.clear();
        REQUIRE(counts->clears.load() == 3);
        cache.put(make_id(1), cache_value(1));
        clock.advance(std::chrono::milliseconds(60));
        REQUIRE(is_cached_int(cache.remove(make_id(1)), 1));
        REQUIRE(counts->clears.load() == 3);
    }
}
