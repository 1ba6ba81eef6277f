#ifndef CACHET_CACHING_KEY_LOCK_H
#define CACHET_CACHING_KEY_LOCK_H

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

#include <cachet/core/type_definitions.h>

namespace cachet {

// key_lock is an exclusive lock that knows which thread holds it.
//
// It's reentrant: the owning thread may acquire it again, and it's only
// released once it's been released as many times as it was acquired.
// Releasing from a thread that doesn't hold it does nothing. (Callers of
// stampede_guard_cache rely on this, since they release on every put() or
// remove() without knowing whether they still hold the lock.)
//
struct key_lock : noncopyable
{
    // Acquire the lock, waiting as long as necessary.
    void
    acquire();

    // Acquire the lock, waiting at most :timeout.
    // The return value indicates whether or not the lock was acquired.
    bool
    try_acquire_for(std::chrono::milliseconds timeout);

    // If the calling thread holds the lock, release one level of it.
    // Otherwise, do nothing.
    void
    release();

    // Does the calling thread hold the lock?
    bool
    is_held_by_current_thread() const;

 private:
    // Take ownership for the calling thread. :mutex_ must be locked and the
    // lock must be available to the caller.
    void
    take(std::thread::id self);

    bool
    is_available_to(std::thread::id self) const
    {
        return hold_count_ == 0 || owner_ == self;
    }

    mutable std::mutex mutex_;
    std::condition_variable released_;
    std::thread::id owner_;
    unsigned hold_count_ = 0;
};

} // namespace cachet

#endif
