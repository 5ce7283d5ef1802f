#pragma once

#include "scheduler.hpp"
#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>

// Wall-clock Scheduler backed by a single timer thread. Tasks run on that
// thread, one at a time, outside the scheduler lock.
class ThreadScheduler : public Scheduler {
public:
    ThreadScheduler();
    ~ThreadScheduler() override;

    TimePoint now() const override;
    TimerId schedule_after(std::chrono::milliseconds delay, Task task) override;
    TimerId schedule_every(std::chrono::milliseconds interval, Task task) override;
    void cancel(TimerId id) override;

    void stop();

private:
    struct Timer {
        TimePoint due;
        std::chrono::milliseconds interval{0};  // zero for one-shot
        Task task;
    };

    void run();
    TimerId add(TimePoint due, std::chrono::milliseconds interval, Task task);

    std::mutex mutex_;
    std::condition_variable cv_;
    std::map<TimerId, Timer> timers_;
    TimerId next_id_ = 1;
    std::atomic<bool> running_{true};
    std::thread thread_;
};
