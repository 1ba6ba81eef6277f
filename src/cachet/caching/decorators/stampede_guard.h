#ifndef CACHET_CACHING_DECORATORS_STAMPEDE_GUARD_H
#define CACHET_CACHING_DECORATORS_STAMPEDE_GUARD_H

#include <chrono>
#include <memory>
#include <mutex>
#include <unordered_map>

#include <cachet/caching/cache.h>
#include <cachet/caching/key_lock.h>
#include <cachet/utilities/errors.h>

namespace cachet {

// stampede_guard_cache keeps concurrent callers that miss on the same key
// from all computing the missing value.
//
// get() locks the key before consulting the delegate. On a hit, the lock is
// released right away. On a miss, get() returns none and the caller KEEPS
// the lock. The caller is then expected to compute the value and put() it,
// which releases the lock. Meanwhile, other callers that get() the same key
// wait, and once the lock is released, they see the stored value.
//
// If the computation fails, the caller must call remove() on the key. Here,
// remove() does NOT remove anything from the delegate. It only releases the
// lock so that the next waiter can try. Calling put() or remove() for a key
// whose lock the calling thread doesn't hold is harmless.
//
// clear() clears the delegate but leaves the locks alone, since callers in
// the middle of computing values still expect to hold them.
//
// Locks are created on first use of a key and are never destroyed, so the
// lock table grows with the number of distinct keys seen over the lifetime
// of the cache. Removing them would race with waiters that are about to
// acquire them.
//
// Note that this serializes access per key only. It doesn't make the
// delegate safe for concurrent use across different keys. (See
// exclusive_access_cache for that.)
//
struct stampede_guard_cache : cache_interface, noncopyable
{
    explicit stampede_guard_cache(std::unique_ptr<cache_interface> delegate);

    // the maximum time that get() waits for a key's lock - Zero (the
    // default) means wait indefinitely.
    std::chrono::milliseconds
    lock_timeout() const
    {
        return lock_timeout_;
    }

    // Change the lock timeout. This is meant to be called while the chain is
    // being assembled.
    void
    set_lock_timeout(std::chrono::milliseconds timeout)
    {
        lock_timeout_ = timeout;
    }

    string
    id() const override;

    size_t
    size() const override;

    void
    put(id_interface const& key, cache_value value) override;

    optional<cache_value>
    get(id_interface const& key) override;

    // Release the calling thread's lock on :key without storing anything.
    // This always returns none and never touches the delegate.
    optional<cache_value>
    remove(id_interface const& key) override;

    void
    clear() override;

 protected:
    // Wait for :lock, honoring the lock timeout.
    // The return value indicates whether or not it was acquired. A
    // std::system_error from the wait is reported as a cache_lock_failure.
    virtual bool
    wait_for_lock(key_lock& lock);

 private:
    key_lock&
    lock_for_key(id_interface const& key);

    void
    acquire_lock(id_interface const& key);

    void
    release_lock(id_interface const& key);

    struct lock_entry
    {
        captured_id key;
        key_lock lock;
    };

    std::unique_ptr<cache_interface> delegate_;
    std::chrono::milliseconds lock_timeout_{0};

    // :locks_mutex_ protects the table itself, not the locks in it.
    std::mutex locks_mutex_;
    std::unordered_map<
        id_interface const*,
        std::unique_ptr<lock_entry>,
        id_interface_pointer_hash,
        id_interface_pointer_equality_test>
        locks_;
};

// This is thrown when stampede_guard_cache can't get the lock for a key,
// either because the lock timeout expired or because the wait itself failed.
// It carries cache_id_info and cache_key_info. If the timeout expired, it
// also carries lock_timeout_info. If the wait failed, it carries
// internal_error_message_info.
CACHET_DEFINE_EXCEPTION(cache_lock_failure)
CACHET_DEFINE_ERROR_INFO(string, cache_key)
// the configured timeout, in milliseconds
CACHET_DEFINE_ERROR_INFO(integer, lock_timeout)

} // namespace cachet

#endif
