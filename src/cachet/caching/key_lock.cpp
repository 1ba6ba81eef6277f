#include <cachet/caching/key_lock.h>

namespace cachet {

void
key_lock::acquire()
{
    auto self = std::this_thread::get_id();
    std::unique_lock<std::mutex> lock(mutex_);
    released_.wait(lock, [&] { return is_available_to(self); });
    take(self);
}

bool
key_lock::try_acquire_for(std::chrono::milliseconds timeout)
{
    auto self = std::this_thread::get_id();
    std::unique_lock<std::mutex> lock(mutex_);
    if (!released_.wait_for(
            lock, timeout, [&] { return is_available_to(self); }))
    {
        return false;
    }
    take(self);
    return true;
}

void
key_lock::release()
{
    {
        std::scoped_lock<std::mutex> lock(mutex_);
        if (hold_count_ == 0 || owner_ != std::this_thread::get_id())
            return;
        if (--hold_count_ != 0)
            return;
        owner_ = std::thread::id();
    }
    released_.notify_one();
}

bool
key_lock::is_held_by_current_thread() const
{
    std::scoped_lock<std::mutex> lock(mutex_);
    return hold_count_ != 0 && owner_ == std::this_thread::get_id();
}

void
key_lock::take(std::thread::id self)
{
    owner_ = self;
    ++hold_count_;
}

} // namespace cachet
