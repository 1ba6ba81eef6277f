#include <cachet/caching/decorators/stampede_guard.h>

#include <atomic>
#include <chrono>
#include <system_error>
#include <thread>
#include <vector>

#include <cachet/caching/decorators/exclusive_access.h>
#include <cachet/caching/decorators/lru_eviction.h>
#include <cachet/caching/testing.h>
#include <cachet/utilities/testing.h>

using namespace cachet;

namespace {

// This follows the protocol that callers of a stampede_guard_cache are
// expected to follow: on a miss, compute the value and put it.
int
get_or_compute(
    cache_interface& cache,
    id_interface const& key,
    std::atomic<int>& computations,
    int value)
{
    auto cached = cache.get(key);
    if (cached)
        return cached_int(cached);
    ++computations;
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    cache.put(key, cache_value(value));
    return value;
}

// a stampede_guard_cache whose next :failures lock waits fail the way an
// interrupted wait on a condition variable does
struct failing_wait_cache : stampede_guard_cache
{
    failing_wait_cache(std::unique_ptr<cache_interface> delegate, int failures)
        : stampede_guard_cache(std::move(delegate)), failures_(failures)
    {
    }

 protected:
    bool
    wait_for_lock(key_lock& lock) override
    {
        if (failures_ > 0)
        {
            --failures_;
            throw std::system_error(
                std::make_error_code(std::errc::interrupted), "wait failed");
        }
        return stampede_guard_cache::wait_for_lock(lock);
    }

 private:
    int failures_;
};

} // namespace

TEST_CASE("stampede guard basics", "[stampede]")
{
    stampede_guard_cache cache(std::make_unique<unbounded_cache>("guarded"));
    REQUIRE(cache.id() == "guarded");
    REQUIRE(cache.lock_timeout() == std::chrono::milliseconds(0));

    REQUIRE(!cache.get(make_id(1)));
    cache.put(make_id(1), cache_value(10));
    REQUIRE(is_cached_int(cache.get(make_id(1)), 10));
    REQUIRE(cache.size() == 1);
}

TEST_CASE("stampede guard hands off to waiters on put", "[stampede]")
{
    stampede_guard_cache cache(std::make_unique<unbounded_cache>("handoff"));
    auto key = make_id("k");

    // This thread misses and so holds the lock on the key.
    REQUIRE(!cache.get(key));

    std::atomic<bool> done = false;
    optional<cache_value> waiter_result;
    std::thread waiter([&] {
        waiter_result = cache.get(key);
        done = true;
    });

    {
        INFO("The waiter blocks while the value is being computed.");
        REQUIRE(holds_for([&] { return !done; }));
    }

    cache.put(key, cache_value(42));

    {
        INFO("Once the value is stored, the waiter sees it.");
        REQUIRE(occurs_soon([&]() -> bool { return done; }));
        waiter.join();
        REQUIRE(is_cached_int(waiter_result, 42));
    }

    INFO("A hit doesn't leave the key locked.");
    std::atomic<bool> second_done = false;
    std::thread second([&] {
        cache.get(key);
        second_done = true;
    });
    REQUIRE(occurs_soon([&]() -> bool { return second_done; }));
    second.join();
}

TEST_CASE("stampede guard hands off to waiters on remove", "[stampede]")
{
    auto counts = std::make_shared<cache_operation_counts>();
    stampede_guard_cache cache(
        std::make_unique<recording_cache>("abort", counts));
    auto key = make_id("k");

    REQUIRE(!cache.get(key));

    std::atomic<bool> got_result = false;
    std::atomic<bool> waiter_missed = false;
    std::atomic<bool> allowed_to_finish = false;
    std::thread waiter([&] {
        auto result = cache.get(key);
        waiter_missed = !result;
        got_result = true;
        // The waiter now holds the lock, so it's responsible for the value.
        while (!allowed_to_finish)
            std::this_thread::yield();
        cache.put(key, cache_value(7));
    });

    REQUIRE(holds_for([&] { return !got_result; }));

    // The computation failed, so abandon it.
    REQUIRE(!cache.remove(key));

    {
        INFO("The waiter then misses and takes over the computation.");
        REQUIRE(occurs_soon([&]() -> bool { return got_result; }));
        REQUIRE(waiter_missed.load());
    }

    {
        INFO("remove() didn't touch the underlying data.");
        REQUIRE(counts->removes.load() == 0);
    }

    allowed_to_finish = true;
    waiter.join();
    REQUIRE(is_cached_int(cache.get(key), 7));
}

TEST_CASE("stampede guard computes missing values once", "[stampede]")
{
    stampede_guard_cache cache(std::make_unique<exclusive_access_cache>(
        std::make_unique<lru_eviction_cache>(
            std::make_unique<unbounded_cache>("herd"))));
    auto key = make_id(string("expensive"));

    int const thread_count = 8;
    std::atomic<int> computations = 0;
    std::vector<int> results(thread_count, 0);
    std::vector<std::thread> threads;
    for (int i = 0; i != thread_count; ++i)
    {
        threads.emplace_back([&, i] {
            results[i] = get_or_compute(cache, key, computations, 99);
        });
    }
    for (auto& thread : threads)
        thread.join();

    REQUIRE(computations.load() == 1);
    for (int result : results)
        REQUIRE(result == 99);
}

TEST_CASE("stampede guard only serializes per key", "[stampede]")
{
    stampede_guard_cache cache(std::make_unique<exclusive_access_cache>(
        std::make_unique<unbounded_cache>("per_key")));

    // This thread holds the lock on key 1.
    REQUIRE(!cache.get(make_id(1)));

    std::atomic<bool> done = false;
    std::thread other([&] {
        // A different key isn't blocked.
        if (!cache.get(make_id(2)))
            cache.put(make_id(2), cache_value(20));
        done = true;
    });
    REQUIRE(occurs_soon([&]() -> bool { return done; }));
    other.join();

    cache.put(make_id(1), cache_value(10));
    REQUIRE(cache.size() == 2);
}

TEST_CASE("stampede guard lock timeouts", "[stampede]")
{
    stampede_guard_cache cache(std::make_unique<unbounded_cache>("timeouts"));
    cache.set_lock_timeout(std::chrono::milliseconds(50));
    REQUIRE(cache.lock_timeout() == std::chrono::milliseconds(50));

    // Hold the lock and never release it while the other thread waits.
    REQUIRE(!cache.get(make_id("slow")));

    bool failed = false;
    string failure_cache_id, failure_key;
    integer failure_timeout = 0;
    std::chrono::steady_clock::duration elapsed{};
    std::thread waiter([&] {
        auto start = std::chrono::steady_clock::now();
        try
        {
            cache.get(make_id("slow"));
        }
        catch (cache_lock_failure& e)
        {
            failed = true;
            failure_cache_id = get_required_error_info<cache_id_info>(e);
            failure_key = get_required_error_info<cache_key_info>(e);
            failure_timeout = get_required_error_info<lock_timeout_info>(e);
        }
        elapsed = std::chrono::steady_clock::now() - start;
    });
    waiter.join();

    REQUIRE(failed);
    REQUIRE(failure_cache_id == "timeouts");
    REQUIRE(failure_key == "slow");
    REQUIRE(failure_timeout == 50);
    INFO("The waiter gave up after about the timeout.");
    REQUIRE(elapsed >= std::chrono::milliseconds(45));
    REQUIRE(elapsed < std::chrono::seconds(5));

    INFO("Once the lock is released, the key is available again.");
    cache.put(make_id("slow"), cache_value(1));
    bool hit = false;
    std::thread reader(
        [&] { hit = is_cached_int(cache.get(make_id("slow")), 1); });
    reader.join();
    REQUIRE(hit);
}

TEST_CASE("stampede guard releases are idempotent", "[stampede]")
{
    auto counts = std::make_shared<cache_operation_counts>();
    stampede_guard_cache cache(
        std::make_unique<recording_cache>("idempotent", counts));
    cache.put(make_id(1), cache_value(10));
    REQUIRE(counts->puts.load() == 1);

    {
        INFO("Removing a key that was never locked is harmless.");
        REQUIRE_NOTHROW(cache.remove(make_id(2)));
        REQUIRE(!cache.remove(make_id(2)));
    }

    {
        INFO("Removing a stored key doesn't remove its data.");
        REQUIRE(!cache.remove(make_id(1)));
        REQUIRE(counts->removes.load() == 0);
        REQUIRE(is_cached_int(cache.get(make_id(1)), 10));
    }

    {
        INFO("Repeated releases don't disturb anything.");
        REQUIRE(!cache.get(make_id(3)));
        cache.remove(make_id(3));
        cache.remove(make_id(3));
        cache.put(make_id(3), cache_value(30));
        REQUIRE(is_cached_int(cache.get(make_id(3)), 30));
    }

    INFO("Another thread's releases don't affect this thread's locks.");
    REQUIRE(!cache.get(make_id(4)));
    std::atomic<bool> other_done = false;
    std::thread other([&] {
        cache.remove(make_id(4));
        cache.put(make_id(5), cache_value(50));
        other_done = true;
    });
    other.join();
    REQUIRE(other_done.load());

    std::atomic<bool> waiter_done = false;
    std::thread waiter([&] {
        cache.get(make_id(4));
        waiter_done = true;
    });
    REQUIRE(holds_for([&] { return !waiter_done; }));
    cache.put(make_id(4), cache_value(40));
    REQUIRE(occurs_soon([&]() -> bool { return waiter_done; }));
    waiter.join();
}

TEST_CASE("stampede guard clear leaves locks alone", "[stampede]")
{
    stampede_guard_cache cache(std::make_unique<unbounded_cache>("clear"));
    cache.put(make_id(1), cache_value(10));

    // Start computing key 2.
    REQUIRE(!cache.get(make_id(2)));
    cache.clear();
    REQUIRE(cache.size() == 0);

    std::atomic<bool> done = false;
    optional<cache_value> result;
    std::thread waiter([&] {
        result = cache.get(make_id(2));
        done = true;
    });

    INFO("Waiters still wait for the computation in progress.");
    REQUIRE(holds_for([&] { return !done; }));
    cache.put(make_id(2), cache_value(20));
    REQUIRE(occurs_soon([&]() -> bool { return done; }));
    waiter.join();
    REQUIRE(is_cached_int(result, 20));
}

TEST_CASE("stampede guard reports failed lock waits", "[stampede]")
{
    failing_wait_cache cache(std::make_unique<unbounded_cache>("failing"), 1);

    try
    {
        cache.get(make_id("k"));
        FAIL("no exception thrown");
    }
    catch (cache_lock_failure& e)
    {
        REQUIRE(get_required_error_info<cache_id_info>(e) == "failing");
        REQUIRE(get_required_error_info<cache_key_info>(e) == "k");
        auto message = get_required_error_info<internal_error_message_info>(e);
        REQUIRE(message.find("wait failed") != string::npos);
        INFO("A failed wait isn't reported as a timeout.");
        REQUIRE_THROWS_AS(
            get_required_error_info<lock_timeout_info>(e), missing_error_info);
    }

    INFO("The failed wait didn't take the lock, so the key is usable.");
    REQUIRE(!cache.get(make_id("k")));
    cache.put(make_id("k"), cache_value(1));
    std::atomic<bool> hit = false;
    std::thread reader(
        [&] { hit = is_cached_int(cache.get(make_id("k")), 1); });
    reader.join();
    REQUIRE(hit);
}
