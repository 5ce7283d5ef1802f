#include "backoff.hpp"
#include <algorithm>

ReconnectBackoff::ReconnectBackoff(std::chrono::milliseconds base_delay,
                                   std::chrono::milliseconds max_delay,
                                   int max_attempts)
    : base_delay_(base_delay),
      max_delay_(max_delay),
      max_attempts_(max_attempts) {
}

std::optional<std::chrono::milliseconds> ReconnectBackoff::next_delay() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (attempts_ >= max_attempts_) {
        return std::nullopt;
    }

    auto delay = calculate_delay(attempts_);
    attempts_++;
    return delay;
}

void ReconnectBackoff::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    attempts_ = 0;
}

int ReconnectBackoff::attempts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return attempts_;
}

bool ReconnectBackoff::exhausted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return attempts_ >= max_attempts_;
}

std::chrono::milliseconds ReconnectBackoff::calculate_delay(int attempt) const {
    // Stop doubling once past the cap
    int64_t delay_ms = base_delay_.count();
    for (int i = 0; i < attempt && delay_ms < max_delay_.count(); ++i) {
        delay_ms *= 2;
    }
    return std::min(std::chrono::milliseconds(delay_ms), max_delay_);
}
