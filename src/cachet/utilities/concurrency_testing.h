#ifndef CACHET_UTILITIES_CONCURRENCY_TESTING_H
#define CACHET_UTILITIES_CONCURRENCY_TESTING_H

#include <chrono>
#include <thread>
#include <utility>

namespace cachet {

// Wait up to a second to see if a condition occurs (i.e., returns true).
// Check once per millisecond to see if it occurs.
// Return whether or not it occurs.
// A second argument can be supplied to change the time to wait.
template<class Condition>
bool
occurs_soon(Condition&& condition, int wait_time_in_ms = 1000)
{
    int n = 0;
    while (true)
    {
        if (std::forward<Condition>(condition)())
            return true;
        if (++n > wait_time_in_ms)
            return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
}

// Check that a condition holds for the whole of a short period. This is the
// counterpart of occurs_soon() for asserting that something (e.g., a blocked
// thread finishing) does NOT happen.
template<class Condition>
bool
holds_for(Condition&& condition, int wait_time_in_ms = 50)
{
    for (int n = 0; n <= wait_time_in_ms; ++n)
    {
        if (!std::forward<Condition>(condition)())
            return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

} // namespace cachet

#endif
