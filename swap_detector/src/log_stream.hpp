#pragma once

#include "types.hpp"
#include <functional>
#include <string>
#include <cstdint>

// Server-side filtered log subscription (logsSubscribe with a "mentions" filter).
class LogStream {
public:
    using Handle = uint64_t;
    using LogCallback = std::function<void(const LogNotification&)>;
    // Fired at most once per handle when the subscription dies underneath us
    using ErrorCallback = std::function<void(const std::string&)>;

    virtual ~LogStream() = default;

    // Blocks until the node confirms the subscription. Throws SubscriptionError.
    virtual Handle subscribe_logs(const std::string& address,
                                  const std::string& commitment,
                                  LogCallback on_log,
                                  ErrorCallback on_error) = 0;

    // Best effort; never throws. No callbacks fire for the handle afterwards.
    virtual void unsubscribe(Handle handle) = 0;
};
