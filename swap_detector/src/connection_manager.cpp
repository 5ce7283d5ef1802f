#include "connection_manager.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

ConnectionManager::ConnectionManager(std::shared_ptr<LogStream> stream,
                                     std::shared_ptr<Scheduler> scheduler,
                                     std::shared_ptr<TradeEventEmitter> events,
                                     ConnectionSettings settings)
    : stream_(stream)
    , scheduler_(scheduler)
    , events_(events)
    , settings_(settings)
    , backoff_(settings.reconnect_base, settings.reconnect_max, settings.max_reconnect_attempts)
{}

ConnectionManager::~ConnectionManager() {
    stop();
}

void ConnectionManager::set_log_handler(LogHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    log_handler_ = std::move(handler);
}

void ConnectionManager::cancel_timers_locked() {
    if (health_timer_) {
        scheduler_->cancel(*health_timer_);
        health_timer_.reset();
    }
    if (reconnect_timer_) {
        scheduler_->cancel(*reconnect_timer_);
        reconnect_timer_.reset();
    }
}

void ConnectionManager::release(std::optional<LogStream::Handle> handle) {
    if (!handle) return;
    try {
        stream_->unsubscribe(*handle);
    } catch (const std::exception& e) {
        spdlog::warn("Unsubscribe failed: {}", e.what());
    }
}

void ConnectionManager::start(const PoolRecord& pool) {
    std::optional<LogStream::Handle> old_handle;
    std::optional<PoolRecord> old_pool;
    uint64_t generation;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (pool_ && pool_->pool_address == pool.pool_address &&
            state_ != ConnectionState::Failed && state_ != ConnectionState::Disconnected) {
            spdlog::debug("Already monitoring pool {}", util::short_addr(pool.pool_address));
            return;
        }

        if (pool_) {
            old_pool = pool_;
            old_handle = handle_;
            handle_.reset();
            cancel_timers_locked();
        }

        pool_ = pool;
        backoff_.reset();
        state_ = ConnectionState::Subscribing;
        generation = ++generation_;
    }

    if (old_pool && old_pool->pool_address != pool.pool_address) {
        spdlog::info("Switching from {} to {}", util::short_addr(old_pool->token_mint),
                     util::short_addr(pool.token_mint));
    }
    if (old_handle) {
        release(old_handle);
        events_->publish(DisconnectedEvent{old_pool->pool_address});
    }

    attempt_subscribe(generation);
}

void ConnectionManager::stop() {
    std::optional<LogStream::Handle> handle;
    std::optional<PoolRecord> pool;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancel_timers_locked();
        handle = handle_;
        handle_.reset();
        pool = pool_;
        pool_.reset();
        state_ = ConnectionState::Disconnected;
        backoff_.reset();
        ++generation_;
    }

    release(handle);

    if (pool) {
        spdlog::info("Stopped monitoring {}", util::short_addr(pool->token_mint));
        events_->publish(DisconnectedEvent{pool->pool_address});
    }
}

void ConnectionManager::attempt_subscribe(uint64_t generation) {
    PoolRecord pool;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_ || !pool_) return;
        reconnect_timer_.reset();
        pool = *pool_;
        state_ = ConnectionState::Subscribing;
    }

    LogStream::Handle handle;
    try {
        handle = stream_->subscribe_logs(
            pool.pool_address, settings_.subscribe_commitment,
            [this, generation](const LogNotification& n) { on_log(generation, n); },
            [this, generation](const std::string& error) { on_stream_error(generation, error); });
    } catch (const std::exception& e) {
        spdlog::error("Subscription to {} failed: {}", util::short_addr(pool.pool_address), e.what());
        events_->publish(ErrorEvent{e.what()});
        schedule_reconnect(generation, e.what());
        return;
    }

    bool superseded = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) {
            superseded = true;
        } else {
            handle_ = handle;
            state_ = ConnectionState::Subscribed;
            last_activity_ = scheduler_->now();
            backoff_.reset();
            health_timer_ = scheduler_->schedule_every(
                settings_.health_check_interval,
                [this, generation]() { check_health(generation); });
        }
    }

    if (superseded) {
        // stop() or start() ran while we were connecting
        release(handle);
        return;
    }

    spdlog::info("Subscribed to pool {} for {}", util::short_addr(pool.pool_address),
                 util::short_addr(pool.token_mint));
    events_->publish(ConnectedEvent{pool.pool_address, pool.token_mint});
}

void ConnectionManager::schedule_reconnect(uint64_t generation, const std::string& reason) {
    int attempts = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) return;

        auto delay = backoff_.next_delay();
        if (!delay) {
            state_ = ConnectionState::Failed;
            attempts = backoff_.attempts();
        } else {
            state_ = ConnectionState::Reconnecting;
            reconnect_timer_ = scheduler_->schedule_after(
                *delay, [this, generation]() { attempt_subscribe(generation); });
            spdlog::warn("Reconnecting in {}ms (attempt {}/{}): {}", delay->count(),
                         backoff_.attempts(), settings_.max_reconnect_attempts, reason);
            return;
        }
    }

    spdlog::error("Giving up after {} reconnect attempts", attempts);
    events_->publish(MaxReconnectAttemptsEvent{attempts});
}

void ConnectionManager::on_log(uint64_t generation, const LogNotification& notification) {
    LogHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) return;
        last_activity_ = scheduler_->now();
        handler = log_handler_;
    }
    if (handler) {
        handler(notification);
    }
}

void ConnectionManager::on_stream_error(uint64_t generation, const std::string& error) {
    std::optional<LogStream::Handle> handle;
    std::string pool_address;
    uint64_t next_generation;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_ || !pool_) return;
        handle = handle_;
        handle_.reset();
        cancel_timers_locked();
        pool_address = pool_->pool_address;
        state_ = ConnectionState::Reconnecting;
        next_generation = ++generation_;
    }

    release(handle);
    events_->publish(ErrorEvent{"Log stream dropped: " + error});
    events_->publish(DisconnectedEvent{pool_address});
    schedule_reconnect(next_generation, error);
}

void ConnectionManager::check_health(uint64_t generation) {
    ConnectionStaleEvent stale;
    std::optional<LogStream::Handle> handle;
    std::string pool_address;
    uint64_t next_generation;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_ || state_ != ConnectionState::Subscribed || !pool_) return;

        auto idle = scheduler_->now() - last_activity_;
        if (idle < settings_.max_inactivity) return;

        stale.seconds_since_activity = std::chrono::duration_cast<std::chrono::seconds>(idle).count();
        stale.monitored_tokens = {pool_->token_mint};
        pool_address = pool_->pool_address;

        handle = handle_;
        handle_.reset();
        cancel_timers_locked();
        state_ = ConnectionState::Reconnecting;
        next_generation = ++generation_;
    }

    spdlog::warn("No logs for {}s on {}, forcing reconnect", stale.seconds_since_activity,
                 util::short_addr(pool_address));
    events_->publish(stale);

    release(handle);
    events_->publish(DisconnectedEvent{pool_address});
    schedule_reconnect(next_generation, "connection stale");
}

ConnectionState ConnectionManager::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool ConnectionManager::is_subscribed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == ConnectionState::Subscribed && handle_.has_value();
}

std::optional<PoolRecord> ConnectionManager::monitored_pool() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pool_;
}

int ConnectionManager::reconnect_attempts() const {
    return backoff_.attempts();
}

std::optional<std::chrono::milliseconds> ConnectionManager::time_since_activity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != ConnectionState::Subscribed) return std::nullopt;
    return std::chrono::duration_cast<std::chrono::milliseconds>(scheduler_->now() - last_activity_);
}
