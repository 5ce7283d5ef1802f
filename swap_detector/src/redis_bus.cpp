#include "redis_bus.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <unordered_map>

RedisBus::RedisBus(const std::string& redis_url,
                   const std::string& stream_trades,
                   const std::string& stream_diagnostics)
    : stream_trades_(stream_trades)
    , stream_diagnostics_(stream_diagnostics)
{
    try {
        redis_ = std::make_shared<sw::redis::Redis>(redis_url);
        spdlog::info("Connected to Redis: {}", redis_url);
    } catch (const std::exception& e) {
        spdlog::error("Failed to connect to Redis: {}", e.what());
        throw;
    }
}

namespace {

struct EventToJson {
    nlohmann::json operator()(const ConnectedEvent& e) const {
        return {{"pool", e.pool_address}, {"token_mint", e.token_mint}};
    }
    nlohmann::json operator()(const DisconnectedEvent& e) const {
        return {{"pool", e.pool_address}};
    }
    nlohmann::json operator()(const TradeEvent& t) const {
        return {
            {"pool", t.pool_address},
            {"token_mint", t.token_mint},
            {"side", to_string(t.side)},
            {"sol_amount", t.sol_amount},
            {"token_amount", t.token_amount},
            {"price", t.price},
            {"user", t.user},
            {"signature", t.signature},
            {"timestamp", t.timestamp},
            {"vault_fallback", t.used_vault_fallback},
            {"signals_disagreed", t.signals_disagreed}
        };
    }
    nlohmann::json operator()(const ErrorEvent& e) const {
        return {{"message", e.message}};
    }
    nlohmann::json operator()(const ConnectionStaleEvent& e) const {
        return {{"seconds_since_activity", e.seconds_since_activity},
                {"monitored_tokens", e.monitored_tokens}};
    }
    nlohmann::json operator()(const HeartbeatEvent& e) const {
        return {{"signature", e.signature},
                {"processed", true},
                {"matched", false},
                {"reason", to_string(e.reason)},
                {"expected", e.expected_mint}};
    }
    nlohmann::json operator()(const MaxReconnectAttemptsEvent& e) const {
        return {{"attempts", e.attempts}};
    }
};

} // namespace

nlohmann::json RedisBus::to_json(const EngineEvent& event) {
    nlohmann::json j = std::visit(EventToJson{}, event);
    j["event"] = event_name(event);
    j["ts"] = util::current_iso8601();
    return j;
}

void RedisBus::publish_event(const EngineEvent& event) {
    const auto& stream = std::holds_alternative<TradeEvent>(event) ? stream_trades_ : stream_diagnostics_;
    publish(stream, to_json(event));
}

void RedisBus::publish(const std::string& stream, const nlohmann::json& data) {
    try {
        std::unordered_map<std::string, std::string> fields;
        fields["data"] = data.dump();

        redis_->xadd(stream, "*", fields.begin(), fields.end());

    } catch (const std::exception& e) {
        spdlog::error("Failed to publish to {}: {}", stream, e.what());
    }
}

bool RedisBus::ping() {
    try {
        redis_->ping();
        return true;
    } catch (const std::exception& e) {
        spdlog::debug("Redis ping failed: {}", e.what());
        return false;
    }
}
