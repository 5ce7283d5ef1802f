#include "thread_scheduler.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

ThreadScheduler::ThreadScheduler()
    : thread_(&ThreadScheduler::run, this) {}

ThreadScheduler::~ThreadScheduler() {
    stop();
}

void ThreadScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        running_ = false;
        timers_.clear();
    }
    cv_.notify_all();
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

Scheduler::TimePoint ThreadScheduler::now() const {
    return Clock::now();
}

Scheduler::TimerId ThreadScheduler::add(TimePoint due, std::chrono::milliseconds interval, Task task) {
    TimerId id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_id_++;
        timers_[id] = Timer{due, interval, std::move(task)};
    }
    cv_.notify_all();
    return id;
}

Scheduler::TimerId ThreadScheduler::schedule_after(std::chrono::milliseconds delay, Task task) {
    return add(now() + delay, std::chrono::milliseconds(0), std::move(task));
}

Scheduler::TimerId ThreadScheduler::schedule_every(std::chrono::milliseconds interval, Task task) {
    if (interval.count() <= 0) {
        throw std::invalid_argument("schedule_every needs a positive interval");
    }
    return add(now() + interval, interval, std::move(task));
}

void ThreadScheduler::cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    timers_.erase(id);
}

void ThreadScheduler::run() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (running_) {
        if (timers_.empty()) {
            cv_.wait(lock);
            continue;
        }

        auto next = std::min_element(timers_.begin(), timers_.end(),
            [](const auto& a, const auto& b) { return a.second.due < b.second.due; });

        if (next->second.due > Clock::now()) {
            cv_.wait_until(lock, next->second.due);
            continue;
        }

        Task task = next->second.task;
        if (next->second.interval.count() > 0) {
            next->second.due += next->second.interval;
        } else {
            timers_.erase(next);
        }

        lock.unlock();
        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("Scheduled task failed: {}", e.what());
        }
        lock.lock();
    }
}
