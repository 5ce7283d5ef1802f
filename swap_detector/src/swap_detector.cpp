#include "swap_detector.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

SwapDetector::SwapDetector(std::shared_ptr<PoolLocator> locator,
                           std::shared_ptr<RpcClient> rpc,
                           std::shared_ptr<LogStream> stream,
                           std::shared_ptr<Scheduler> scheduler,
                           Executor executor,
                           ClassifierSettings classifier_settings,
                           ConnectionSettings connection_settings,
                           PipelineSettings pipeline_settings)
    : locator_(locator)
    , rpc_(rpc)
    , scheduler_(scheduler)
    , executor_(std::move(executor))
    , pipeline_settings_(pipeline_settings)
    , events_(std::make_shared<TradeEventEmitter>())
    , filter_(pipeline_settings.extra_log_patterns)
    , classifier_(classifier_settings)
{
    connection_ = std::make_unique<ConnectionManager>(stream, scheduler_, events_, connection_settings);
    connection_->set_log_handler([this](const LogNotification& n) { on_log(n); });

    std::lock_guard<std::mutex> lock(state_mutex_);
    new_session_locked(std::nullopt);
}

SwapDetector::~SwapDetector() {
    stop();
}

void SwapDetector::new_session_locked(std::optional<PoolRecord> pool) {
    pool_ = std::move(pool);
    ++session_;
    fetcher_ = std::make_shared<TransactionFetcher>(
        rpc_, pipeline_settings_.dedup_capacity, pipeline_settings_.fetch_commitment);
}

PoolRecord SwapDetector::start(const std::string& token_mint) {
    auto current = connection_->monitored_pool();
    if (current && current->token_mint == token_mint &&
        connection_->state() != ConnectionState::Failed) {
        spdlog::debug("Already monitoring {}", util::short_addr(token_mint));
        return *current;
    }

    auto pool = locator_->resolve(token_mint);
    start(pool);
    return pool;
}

void SwapDetector::start(const PoolRecord& pool) {
    {
        std::lock_guard<std::recursive_mutex> gate(emit_mutex_);
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!pool_ || pool_->pool_address != pool.pool_address) {
            new_session_locked(pool);
        } else {
            pool_ = pool;
        }
    }

    spdlog::info("Monitoring {} via pool {} ({})", util::short_addr(pool.token_mint),
                 util::short_addr(pool.pool_address), pool.source.empty() ? "caller" : pool.source);
    connection_->start(pool);
}

void SwapDetector::stop_token(const std::string& token_mint) {
    if (!is_monitoring_token(token_mint)) {
        spdlog::debug("stop_token: {} is not monitored", util::short_addr(token_mint));
        return;
    }
    // One pool per engine, so nothing is left to monitor
    stop();
}

void SwapDetector::stop() {
    connection_->stop();

    std::lock_guard<std::recursive_mutex> gate(emit_mutex_);
    std::lock_guard<std::mutex> lock(state_mutex_);
    new_session_locked(std::nullopt);
}

bool SwapDetector::is_active() const {
    return connection_->is_subscribed();
}

bool SwapDetector::is_monitoring_token(const std::string& address) const {
    auto pool = connection_->monitored_pool();
    return pool && util::iequals(pool->token_mint, address);
}

std::vector<std::string> SwapDetector::get_monitored_tokens() const {
    std::vector<std::string> tokens;
    auto pool = connection_->monitored_pool();
    if (pool) tokens.push_back(pool->token_mint);
    return tokens;
}

ConnectionState SwapDetector::connection_state() const {
    return connection_->state();
}

std::optional<std::chrono::milliseconds> SwapDetector::time_since_activity() const {
    return connection_->time_since_activity();
}

int SwapDetector::reconnect_attempts() const {
    return connection_->reconnect_attempts();
}

void SwapDetector::on_log(const LogNotification& notification) {
    if (!filter_.is_candidate(notification)) {
        return;
    }

    PoolRecord pool;
    uint64_t session;
    std::shared_ptr<TransactionFetcher> fetcher;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!pool_) return;
        pool = *pool_;
        session = session_;
        fetcher = fetcher_;
    }

    executor_([this, notification, session, pool, fetcher]() {
        run_pipeline(notification, session, pool, fetcher);
    });
}

void SwapDetector::run_pipeline(const LogNotification& notification, uint64_t session,
                                const PoolRecord& pool, std::shared_ptr<TransactionFetcher> fetcher) {
    try {
        if (session != session_) return;

        auto fetched = fetcher->fetch(notification.signature);
        if (fetched.status != FetchStatus::Fetched) {
            if (fetched.status != FetchStatus::Duplicate) {
                spdlog::debug("{}: {}", util::short_addr(notification.signature), to_string(fetched.status));
            }
            return;
        }

        auto observed_at = util::current_timestamp_ms() / 1000;
        auto result = classifier_.classify(*fetched.tx, pool, observed_at);

        std::lock_guard<std::recursive_mutex> gate(emit_mutex_);
        if (session != session_) {
            spdlog::debug("Discarding result for {} from a stopped session",
                          util::short_addr(notification.signature));
            return;
        }

        if (!result.is_trade()) {
            emit_rejection(notification.signature, pool, result.reason);
            return;
        }

        const auto& trade = *result.trade;
        ++trades_emitted_;
        spdlog::info("{} {:.2f} tokens for {:.6f} SOL (price {:.10f}) by {} [{}]",
                     to_string(trade.side), trade.token_amount, trade.sol_amount, trade.price,
                     util::short_addr(trade.user), util::short_addr(trade.signature));
        events_->publish(trade);

    } catch (const std::exception& e) {
        spdlog::error("Pipeline failed for {}: {}", util::short_addr(notification.signature), e.what());
    }
}

void SwapDetector::emit_rejection(const std::string& signature, const PoolRecord& pool,
                                  RejectReason reason) {
    spdlog::debug("{} rejected: {}", util::short_addr(signature), to_string(reason));

    HeartbeatEvent heartbeat;
    heartbeat.signature = signature;
    heartbeat.expected_mint = pool.token_mint;

    switch (reason) {
        case RejectReason::TokenNotInTransaction:
            heartbeat.reason = HeartbeatReason::TokenNotInTransaction;
            break;
        case RejectReason::TokenMismatch:
            heartbeat.reason = HeartbeatReason::TokenMismatch;
            break;
        case RejectReason::NoTokenDelta:
            heartbeat.reason = HeartbeatReason::NoTokenFound;
            break;
        default:
            return;
    }

    events_->publish(heartbeat);
}
