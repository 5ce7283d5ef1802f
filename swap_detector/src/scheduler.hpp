#pragma once

#include <chrono>
#include <functional>
#include <cstdint>

// Timer source for the connection lifecycle. Swapped for a manual clock in tests.
class Scheduler {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using TimerId = uint64_t;
    using Task = std::function<void()>;

    virtual ~Scheduler() = default;

    virtual TimePoint now() const = 0;
    virtual TimerId schedule_after(std::chrono::milliseconds delay, Task task) = 0;
    virtual TimerId schedule_every(std::chrono::milliseconds interval, Task task) = 0;

    // Unknown or already-fired ids are ignored
    virtual void cancel(TimerId id) = 0;
};
