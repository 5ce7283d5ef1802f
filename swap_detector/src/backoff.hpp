#pragma once
#include <chrono>
#include <mutex>
#include <optional>

// Exponential reconnect schedule: min(base * 2^attempt, max), bounded by a
// maximum number of attempts.
class ReconnectBackoff {
public:
    ReconnectBackoff(std::chrono::milliseconds base_delay,
                     std::chrono::milliseconds max_delay,
                     int max_attempts);

    // Delay for the next attempt, or nullopt once the attempt budget is spent.
    // Each call consumes one attempt.
    std::optional<std::chrono::milliseconds> next_delay();

    // Call after a successful subscribe
    void reset();

    int attempts() const;
    bool exhausted() const;

private:
    std::chrono::milliseconds calculate_delay(int attempt) const;

    mutable std::mutex mutex_;
    std::chrono::milliseconds base_delay_;
    std::chrono::milliseconds max_delay_;
    int max_attempts_;
    int attempts_ = 0;
};
