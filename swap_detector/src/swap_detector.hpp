#pragma once

#include "connection_manager.hpp"
#include "event_emitter.hpp"
#include "log_filter.hpp"
#include "log_stream.hpp"
#include "pool_locator.hpp"
#include "rpc_client.hpp"
#include "scheduler.hpp"
#include "settings.hpp"
#include "swap_classifier.hpp"
#include "transaction_fetcher.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Engine facade: resolves a token to its pool, keeps a log subscription on
// it, and turns each matching log delivery into a trade or heartbeat event.
//
// Log deliveries are screened by LogFilter on the stream thread; survivors
// are handed to the executor, which runs fetch + classify + emit. Results
// from a run that finishes after stop() (or after switching tokens) are
// dropped.
class SwapDetector {
public:
    using Task = std::function<void()>;
    using Executor = std::function<void(Task)>;

    SwapDetector(std::shared_ptr<PoolLocator> locator,
                 std::shared_ptr<RpcClient> rpc,
                 std::shared_ptr<LogStream> stream,
                 std::shared_ptr<Scheduler> scheduler,
                 Executor executor,
                 ClassifierSettings classifier_settings = {},
                 ConnectionSettings connection_settings = {},
                 PipelineSettings pipeline_settings = {});
    ~SwapDetector();

    SwapDetector(const SwapDetector&) = delete;
    SwapDetector& operator=(const SwapDetector&) = delete;

    // Throws PoolNotFoundError when no tier knows the token.
    PoolRecord start(const std::string& token_mint);
    void start(const PoolRecord& pool);

    void stop_token(const std::string& token_mint);
    void stop();

    bool is_active() const;
    bool is_monitoring_token(const std::string& address) const;
    std::vector<std::string> get_monitored_tokens() const;

    TradeEventEmitter& events() { return *events_; }
    std::shared_ptr<TradeEventEmitter> event_bus() const { return events_; }

    ConnectionState connection_state() const;
    std::optional<std::chrono::milliseconds> time_since_activity() const;
    int reconnect_attempts() const;
    uint64_t trades_emitted() const { return trades_emitted_; }

private:
    void on_log(const LogNotification& notification);
    void run_pipeline(const LogNotification& notification, uint64_t session,
                      const PoolRecord& pool, std::shared_ptr<TransactionFetcher> fetcher);
    void emit_rejection(const std::string& signature, const PoolRecord& pool, RejectReason reason);
    void new_session_locked(std::optional<PoolRecord> pool);

    std::shared_ptr<PoolLocator> locator_;
    std::shared_ptr<RpcClient> rpc_;
    std::shared_ptr<Scheduler> scheduler_;
    Executor executor_;
    PipelineSettings pipeline_settings_;

    std::shared_ptr<TradeEventEmitter> events_;
    LogFilter filter_;
    SwapClassifier classifier_;
    std::unique_ptr<ConnectionManager> connection_;

    // Held across publish so stop() waits out an in-progress emission.
    // Recursive: a subscriber may call stop() from its handler.
    std::recursive_mutex emit_mutex_;

    // Pool, session and fetcher change together under state_mutex_
    mutable std::mutex state_mutex_;
    std::optional<PoolRecord> pool_;
    std::atomic<uint64_t> session_{0};
    std::shared_ptr<TransactionFetcher> fetcher_;

    std::atomic<uint64_t> trades_emitted_{0};
};
