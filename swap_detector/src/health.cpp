#include "health.hpp"

HealthCheck::HealthCheck(std::vector<std::shared_ptr<SwapDetector>> detectors,
                         std::shared_ptr<RedisBus> redis,
                         std::shared_ptr<RpcClient> rpc)
    : detectors_(std::move(detectors)), redis_(redis), rpc_(rpc) {}

std::vector<std::string> HealthCheck::monitored_tokens() const {
    std::vector<std::string> tokens;
    for (const auto& detector : detectors_) {
        for (const auto& token : detector->get_monitored_tokens()) {
            tokens.push_back(token);
        }
    }
    return tokens;
}

nlohmann::json HealthCheck::get_status() {
    bool redis_ok = redis_->ping();
    bool rpc_ok = rpc_->is_healthy();

    // An idle engine is fine; one that gave up reconnecting is not
    bool streams_ok = true;
    uint64_t trades = 0;
    nlohmann::json engines = nlohmann::json::array();

    for (const auto& detector : detectors_) {
        auto state = detector->connection_state();
        if (state == ConnectionState::Failed) streams_ok = false;
        trades += detector->trades_emitted();

        nlohmann::json idle = nullptr;
        if (auto since = detector->time_since_activity()) {
            idle = since->count() / 1000;
        }

        engines.push_back(nlohmann::json{
            {"tokens", detector->get_monitored_tokens()},
            {"connection", to_string(state)},
            {"active", detector->is_active()},
            {"seconds_since_activity", idle},
            {"reconnect_attempts", detector->reconnect_attempts()},
            {"trades_emitted", detector->trades_emitted()}
        });
    }

    nlohmann::json status = {
        {"ok", redis_ok && rpc_ok && streams_ok},
        {"redis", redis_ok},
        {"rpc", rpc_ok},
        {"trades_emitted", trades},
        {"engines", engines}
    };

    return status;
}
