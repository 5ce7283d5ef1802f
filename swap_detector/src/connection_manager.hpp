#pragma once

#include "backoff.hpp"
#include "event_emitter.hpp"
#include "log_stream.hpp"
#include "scheduler.hpp"
#include "settings.hpp"
#include "types.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

// Owns the log subscription for the monitored pool.
//
//   Disconnected -> Subscribing -> Subscribed -> (Reconnecting | Failed)
//
// While Subscribed a periodic health check compares time since the last log
// against max_inactivity; on breach it emits connection_stale and forces a
// reconnect. Subscribe failures, dropped streams and forced reconnects all go
// through the same exponential backoff. Every subscribe/teardown bumps a
// generation counter so callbacks and timers from an older subscription are
// ignored.
//
// No lock is held while calling into the LogStream.
class ConnectionManager {
public:
    using LogHandler = std::function<void(const LogNotification&)>;

    ConnectionManager(std::shared_ptr<LogStream> stream,
                      std::shared_ptr<Scheduler> scheduler,
                      std::shared_ptr<TradeEventEmitter> events,
                      ConnectionSettings settings = {});
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    void set_log_handler(LogHandler handler);

    // No-op if already monitoring this pool; replaces any other pool.
    void start(const PoolRecord& pool);
    void stop();

    ConnectionState state() const;
    bool is_subscribed() const;
    std::optional<PoolRecord> monitored_pool() const;
    int reconnect_attempts() const;
    std::optional<std::chrono::milliseconds> time_since_activity() const;

private:
    void attempt_subscribe(uint64_t generation);
    void schedule_reconnect(uint64_t generation, const std::string& reason);
    void on_log(uint64_t generation, const LogNotification& notification);
    void on_stream_error(uint64_t generation, const std::string& error);
    void check_health(uint64_t generation);
    void release(std::optional<LogStream::Handle> handle);
    void cancel_timers_locked();

    std::shared_ptr<LogStream> stream_;
    std::shared_ptr<Scheduler> scheduler_;
    std::shared_ptr<TradeEventEmitter> events_;
    ConnectionSettings settings_;
    ReconnectBackoff backoff_;

    mutable std::mutex mutex_;
    ConnectionState state_ = ConnectionState::Disconnected;
    std::optional<PoolRecord> pool_;
    std::optional<LogStream::Handle> handle_;
    std::optional<Scheduler::TimerId> health_timer_;
    std::optional<Scheduler::TimerId> reconnect_timer_;
    Scheduler::TimePoint last_activity_;
    uint64_t generation_ = 0;
    LogHandler log_handler_;
};
